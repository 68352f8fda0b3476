// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/detection/hit_test.hpp"

#include <oxr_utils/pose_conversions.hpp>

namespace immersive
{

HitTestSource::HitTestSource(uint64_t id, DeviceId device_id, bool transient, HitTest* owner)
    : device_id_(device_id), owner_(owner)
{
    state_.id = id;
    state_.transient = transient;
}

void HitTestSource::remove()
{
    if (owner_)
    {
        owner_->cancel(*this);
    }
}

void HitTest::start(const HitTestOptions& options, HitTestSourceCallback on_success, FailureCallback on_failure)
{
    if (!supported_)
    {
        on_failure("XR HitTest is not supported");
        return;
    }
    if (!available_ || !session_)
    {
        on_failure("XR HitTest is not available");
        return;
    }

    const bool transient = options.profile.has_value();
    std::weak_ptr<IDeviceSession> requested_for = session_;
    std::weak_ptr<bool> alive = alive_;
    auto callbacks = std::make_shared<std::pair<HitTestSourceCallback, FailureCallback>>(std::move(on_success),
                                                                                        std::move(on_failure));
    session_->request_hit_test_source(
        options,
        [this, alive, requested_for, callbacks, transient](DeviceId id)
        {
            if (alive.expired() || requested_for.lock() != session_ || !session_)
            {
                callbacks->second("session ended");
                return;
            }
            if (auto source = find(id))
            {
                callbacks->first(source);
                return;
            }
            Pending& pending = pending_[id];
            pending.transient = transient;
            pending.callbacks.push_back(std::move(*callbacks));
        },
        [callbacks](const std::string& message) { callbacks->second(message); });
}

void HitTest::on_session_end()
{
    auto pending = std::move(pending_);
    pending_.clear();
    for (auto& [id, entry] : pending)
    {
        for (auto& callbacks : entry.callbacks)
        {
            callbacks.second("session ended");
        }
    }

    ReconcilingSubsystem::on_session_end();
}

HitTest::EntityPtr HitTest::create_entity(const HitTestResultsRecord& record)
{
    auto it = pending_.find(record.source);
    const bool transient = it != pending_.end() && it->second.transient;
    return std::make_shared<HitTestSource>(next_local_id(), record.source, transient, this);
}

bool HitTest::update_entity(HitTestSource& source, const HitTestResultsRecord& record)
{
    source.state_.results.clear();
    source.state_.results.reserve(record.results.size());
    for (const auto& pose : record.results)
    {
        source.state_.results.push_back(to_pose(pose));
    }
    return false;
}

void HitTest::teardown_entity(HitTestSource& source)
{
    source.owner_ = nullptr;
    source.state_.results.clear();
}

void HitTest::on_entity_added(const EntityPtr& source)
{
    auto it = pending_.find(source->device_id());
    if (it != pending_.end())
    {
        auto callbacks = std::move(it->second.callbacks);
        pending_.erase(it);
        for (auto& entry : callbacks)
        {
            entry.first(source);
        }
    }
    emitter_.emit(EntityAdded<HitTestSource>{ source });
}

void HitTest::after_reconcile(const IFrame& /*frame*/)
{
    for (const auto& source : list())
    {
        if (!source->results().empty())
        {
            emitter_.emit(HitTestResultEvent{ source, source->results() });
        }
    }
}

void HitTest::cancel(HitTestSource& source)
{
    if (session_)
    {
        session_->cancel_hit_test_source(source.device_id());
    }
}

void HitTest::serialize(flatbuffers::FlatBufferBuilder& builder, const Timestamp& timestamp) const
{
    std::vector<flatbuffers::Offset<HitTestSourceState>> sources;
    for (const auto& source : list())
    {
        sources.push_back(HitTestSourceState::Pack(builder, &source->state()));
    }
    auto sources_offset = builder.CreateVector(sources);

    HitTestRecordBuilder record_builder(builder);
    record_builder.add_sources(sources_offset);
    record_builder.add_timestamp(&timestamp);
    builder.Finish(record_builder.Finish());
}

} // namespace immersive
