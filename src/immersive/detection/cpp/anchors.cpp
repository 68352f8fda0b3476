// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/detection/anchors.hpp"

#include <oxr_utils/pose_conversions.hpp>

#include <algorithm>

namespace immersive
{

namespace
{

constexpr const char* kSessionEnded = "session ended";

bool same_pose(const Pose& a, const Pose& b)
{
    return a.position().x() == b.position().x() && a.position().y() == b.position().y() &&
           a.position().z() == b.position().z() && a.orientation().x() == b.orientation().x() &&
           a.orientation().y() == b.orientation().y() && a.orientation().z() == b.orientation().z() &&
           a.orientation().w() == b.orientation().w();
}

} // namespace

// ============================================================================
// Anchor
// ============================================================================

Anchor::Anchor(uint64_t id, DeviceId device_id, Anchors* owner) : device_id_(device_id), owner_(owner)
{
    state_.id = id;
}

std::optional<Pose> Anchor::pose() const
{
    if (!state_.is_pose_valid || !state_.pose)
    {
        return std::nullopt;
    }
    return *state_.pose;
}

bool Anchor::update(const AnchorRecord& record)
{
    const bool was_valid = state_.is_pose_valid;
    state_.is_pose_valid = record.pose.has_value();
    if (!record.pose)
    {
        return was_valid;
    }

    const Pose pose = to_pose(*record.pose);
    const bool moved = !was_valid || !state_.pose || !same_pose(*state_.pose, pose);
    state_.pose = std::make_unique<Pose>(pose);
    return moved;
}

void Anchor::destroy()
{
    if (owner_)
    {
        owner_->destroy_anchor(*this);
    }
}

void Anchor::persist(UuidCallback on_success, FailureCallback on_failure)
{
    if (!owner_)
    {
        on_failure("Anchor is no longer tracked");
        return;
    }
    if (!state_.uuid.empty())
    {
        on_success(state_.uuid);
        return;
    }

    persist_requests_.push_back({ std::move(on_success), std::move(on_failure) });
    if (persist_requests_.size() == 1)
    {
        owner_->persist_anchor(*this);
    }
}

void Anchor::forget(DoneCallback on_success, FailureCallback on_failure)
{
    if (!owner_)
    {
        on_failure("Anchor is no longer tracked");
        return;
    }
    if (state_.uuid.empty())
    {
        on_failure("Anchor is not persisted");
        return;
    }
    owner_->forget(state_.uuid, std::move(on_success), std::move(on_failure));
}

// ============================================================================
// Anchors
// ============================================================================

void Anchors::create(const XrPosef& pose, AnchorCallback on_success, FailureCallback on_failure)
{
    if (!available_)
    {
        on_failure("Anchors API is not available");
        return;
    }
    creation_queue_.push_back({ pose, { std::move(on_success), std::move(on_failure) } });
}

bool Anchors::persistence() const
{
    return available_ && session_ && session_->supports_anchor_persistence();
}

void Anchors::restore(const std::string& uuid, AnchorCallback on_success, FailureCallback on_failure)
{
    if (!persistence())
    {
        on_failure("Persistent Anchors are not supported");
        return;
    }
    if (auto anchor = find_by_uuid(uuid))
    {
        on_success(anchor);
        return;
    }

    std::weak_ptr<IDeviceSession> requested_for = session_;
    std::weak_ptr<bool> alive = alive_;
    auto callbacks = std::make_shared<Callbacks>(Callbacks{ std::move(on_success), std::move(on_failure) });
    session_->restore_anchor(
        uuid,
        [this, alive, requested_for, callbacks, uuid](DeviceId id)
        {
            if (alive.expired() || requested_for.lock() != session_ || !session_)
            {
                callbacks->on_failure(kSessionEnded);
                return;
            }
            restored_uuids_[id] = uuid;
            if (auto anchor = find(id))
            {
                anchor->state_.uuid = uuid;
            }
            await_anchor(id, std::move(*callbacks));
        },
        [callbacks](const std::string& message) { callbacks->on_failure(message); });
}

void Anchors::forget(const std::string& uuid, DoneCallback on_success, FailureCallback on_failure)
{
    if (!persistence())
    {
        on_failure("Persistent Anchors are not supported");
        return;
    }

    std::weak_ptr<bool> alive = alive_;
    session_->forget_anchor(
        uuid,
        [this, alive, uuid, on_success]()
        {
            if (!alive.expired())
            {
                notify_forgotten(uuid);
            }
            on_success();
        },
        std::move(on_failure));
}

std::vector<std::string> Anchors::uuids() const
{
    if (!persistence())
    {
        return {};
    }
    return session_->persistent_anchor_uuids();
}

std::shared_ptr<Anchor> Anchors::find_by_uuid(const std::string& uuid) const
{
    for (const auto& anchor : list())
    {
        if (anchor->uuid() == uuid)
        {
            return anchor;
        }
    }
    return nullptr;
}

bool Anchors::update(const IFrame& frame)
{
    if (!supported_ || !available_)
    {
        return true;
    }

    // Submit everything queued since the last frame
    while (!creation_queue_.empty())
    {
        CreationRequest request = std::move(creation_queue_.front());
        creation_queue_.pop_front();

        const uint64_t request_id = ++last_request_id_;
        in_flight_.emplace(request_id, std::move(request.callbacks));

        std::weak_ptr<IDeviceSession> requested_for = session_;
        std::weak_ptr<bool> alive = alive_;
        try
        {
            frame.create_anchor(
                request.pose,
                [this, alive, request_id, requested_for](DeviceId id)
                {
                    if (alive.expired())
                    {
                        return;
                    }
                    auto it = in_flight_.find(request_id);
                    if (it == in_flight_.end())
                    {
                        return;
                    }
                    Callbacks callbacks = std::move(it->second);
                    in_flight_.erase(it);
                    if (requested_for.lock() != session_ || !session_)
                    {
                        callbacks.on_failure(kSessionEnded);
                        return;
                    }
                    await_anchor(id, std::move(callbacks));
                },
                [this, alive, request_id](const std::string& message)
                {
                    if (alive.expired())
                    {
                        return;
                    }
                    auto it = in_flight_.find(request_id);
                    if (it == in_flight_.end())
                    {
                        return;
                    }
                    Callbacks callbacks = std::move(it->second);
                    in_flight_.erase(it);
                    callbacks.on_failure(message);
                });
        }
        catch (const std::exception& e)
        {
            auto it = in_flight_.find(request_id);
            if (it != in_flight_.end())
            {
                Callbacks callbacks = std::move(it->second);
                in_flight_.erase(it);
                callbacks.on_failure(e.what());
            }
        }
    }

    return ReconcilingSubsystem::update(frame);
}

void Anchors::on_session_end()
{
    std::vector<Callbacks> rejected;
    for (auto& request : creation_queue_)
    {
        rejected.push_back(std::move(request.callbacks));
    }
    creation_queue_.clear();
    for (auto& [request_id, callbacks] : in_flight_)
    {
        rejected.push_back(std::move(callbacks));
    }
    in_flight_.clear();
    for (auto& [id, waiting] : awaiting_)
    {
        for (auto& callbacks : waiting)
        {
            rejected.push_back(std::move(callbacks));
        }
    }
    awaiting_.clear();
    restored_uuids_.clear();

    for (auto& callbacks : rejected)
    {
        callbacks.on_failure(kSessionEnded);
    }

    ReconcilingSubsystem::on_session_end();
}

std::vector<AnchorRecord> Anchors::collect(const IFrame& frame)
{
    auto records = frame.tracked_anchors();
    // An anchor without a space cannot be located yet; it is picked up once it has one
    records.erase(std::remove_if(records.begin(), records.end(), [](const AnchorRecord& r) { return !r.has_space; }),
                  records.end());
    return records;
}

Anchors::EntityPtr Anchors::create_entity(const AnchorRecord& record)
{
    auto anchor = std::make_shared<Anchor>(next_local_id(), record.id, this);
    auto restored = restored_uuids_.find(record.id);
    if (restored != restored_uuids_.end())
    {
        anchor->state_.uuid = restored->second;
        restored_uuids_.erase(restored);
    }
    return anchor;
}

bool Anchors::update_entity(Anchor& anchor, const AnchorRecord& record)
{
    return anchor.update(record);
}

void Anchors::teardown_entity(Anchor& anchor)
{
    anchor.owner_ = nullptr;
    anchor.state_.is_pose_valid = false;
}

void Anchors::on_entity_added(const EntityPtr& anchor)
{
    auto it = awaiting_.find(anchor->device_id());
    if (it != awaiting_.end())
    {
        auto waiting = std::move(it->second);
        awaiting_.erase(it);
        for (auto& callbacks : waiting)
        {
            callbacks.on_success(anchor);
        }
    }
    emitter_.emit(EntityAdded<Anchor>{ anchor });
}

void Anchors::await_anchor(DeviceId id, Callbacks callbacks)
{
    if (auto anchor = find(id))
    {
        callbacks.on_success(anchor);
        return;
    }
    awaiting_[id].push_back(std::move(callbacks));
}

void Anchors::destroy_anchor(Anchor& anchor)
{
    if (session_)
    {
        session_->delete_anchor(anchor.device_id());
    }
}

void Anchors::persist_anchor(Anchor& anchor)
{
    auto self = anchor.shared_from_this();
    auto fail_all = [self](const std::string& message)
    {
        auto requests = std::move(self->persist_requests_);
        self->persist_requests_.clear();
        for (auto& request : requests)
        {
            request.on_failure(message);
        }
    };

    if (!persistence())
    {
        fail_all("Persistent Anchors are not supported");
        return;
    }

    std::weak_ptr<bool> alive = alive_;
    session_->persist_anchor(
        anchor.device_id(),
        [this, alive, self](const std::string& uuid)
        {
            self->state_.uuid = uuid;
            auto requests = std::move(self->persist_requests_);
            self->persist_requests_.clear();
            for (auto& request : requests)
            {
                request.on_success(uuid);
            }
            if (!alive.expired())
            {
                emitter_.emit(AnchorPersisted{ self, uuid });
            }
        },
        fail_all);
}

void Anchors::notify_forgotten(const std::string& uuid)
{
    auto anchor = find_by_uuid(uuid);
    if (anchor)
    {
        anchor->state_.uuid.clear();
    }
    emitter_.emit(AnchorForgotten{ uuid, anchor });
}

void Anchors::serialize(flatbuffers::FlatBufferBuilder& builder, const Timestamp& timestamp) const
{
    std::vector<flatbuffers::Offset<AnchorState>> anchors;
    for (const auto& anchor : list())
    {
        anchors.push_back(AnchorState::Pack(builder, &anchor->state()));
    }
    auto anchors_offset = builder.CreateVector(anchors);

    AnchorsRecordBuilder record_builder(builder);
    record_builder.add_anchors(anchors_offset);
    record_builder.add_timestamp(&timestamp);
    builder.Finish(record_builder.Finish());
}

} // namespace immersive
