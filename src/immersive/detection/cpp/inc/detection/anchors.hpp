// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "detection_subsystem.hpp"

#include <schema/anchor_bfbs_generated.h>
#include <schema/anchor_generated.h>

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace immersive
{

// Forward declarations
class Anchor;
class Anchors;

using AnchorCallback = std::function<void(const std::shared_ptr<Anchor>&)>;
using UuidCallback = std::function<void(const std::string& uuid)>;

// A pose the device keeps fixed relative to the real world
class Anchor : public std::enable_shared_from_this<Anchor>
{
public:
    Anchor(uint64_t id, DeviceId device_id, Anchors* owner);

    uint64_t id() const
    {
        return state_.id;
    }
    DeviceId device_id() const
    {
        return device_id_;
    }
    std::optional<Pose> pose() const;

    // Empty unless the anchor was persisted (or restored)
    const std::string& uuid() const
    {
        return state_.uuid;
    }
    bool persistent() const
    {
        return !state_.uuid.empty();
    }
    bool tracked() const
    {
        return owner_ != nullptr;
    }

    // Deletes the anchor on the device; it disappears from the subsystem on the next frame
    void destroy();

    // Persists the anchor across sessions. Concurrent calls share one device request.
    void persist(UuidCallback on_success, FailureCallback on_failure);

    // Removes the persisted copy; the anchor itself stays alive for this session
    void forget(DoneCallback on_success, FailureCallback on_failure);

    const AnchorStateT& state() const
    {
        return state_;
    }

private:
    friend class Anchors;

    // Returns true if the pose moved
    bool update(const AnchorRecord& record);

    DeviceId device_id_;
    Anchors* owner_;
    AnchorStateT state_;

    struct PersistRequest
    {
        UuidCallback on_success;
        FailureCallback on_failure;
    };
    std::vector<PersistRequest> persist_requests_;
};

struct AnchorPersisted
{
    std::shared_ptr<Anchor> anchor;
    std::string uuid;
};

struct AnchorForgotten
{
    std::string uuid;
    // Null when the uuid did not belong to an anchor of this session
    std::shared_ptr<Anchor> anchor;
};

/**
 * @brief World anchors: creation queue, tracking and persistence.
 *
 * Creation requests are submitted on the next frame; their callbacks fire
 * when the anchor first shows up in the device enumeration.
 */
class Anchors : public ReconcilingSubsystem<Anchor, AnchorRecord, DeviceId, AnchorPersisted, AnchorForgotten>
{
public:
    explicit Anchors(bool supported) : ReconcilingSubsystem(supported)
    {
    }

    std::string_view get_name() const override
    {
        return "Anchors";
    }

    Feature get_feature() const override
    {
        return Feature::Anchors;
    }

    // Queues an anchor creation at `pose` in the session reference space
    void create(const XrPosef& pose, AnchorCallback on_success, FailureCallback on_failure);

    // True when the running session can persist anchors
    bool persistence() const;

    void restore(const std::string& uuid, AnchorCallback on_success, FailureCallback on_failure);
    void forget(const std::string& uuid, DoneCallback on_success, FailureCallback on_failure);

    // Uuids of the anchors persisted on the device, empty without persistence
    std::vector<std::string> uuids() const;

    std::shared_ptr<Anchor> find_by_uuid(const std::string& uuid) const;

    bool update(const IFrame& frame) override;
    void on_session_end() override;

    std::string_view get_schema_name() const override
    {
        return "immersive.AnchorsRecord";
    }

    std::string_view get_schema_text() const override
    {
        return std::string_view(reinterpret_cast<const char*>(AnchorsRecordBinarySchema::data()),
                                AnchorsRecordBinarySchema::size());
    }

    std::string_view get_record_channel() const override
    {
        return "anchors";
    }

    void serialize(flatbuffers::FlatBufferBuilder& builder, const Timestamp& timestamp) const override;

private:
    friend class Anchor;

    struct Callbacks
    {
        AnchorCallback on_success;
        FailureCallback on_failure;
    };

    struct CreationRequest
    {
        XrPosef pose;
        Callbacks callbacks;
    };

    std::vector<AnchorRecord> collect(const IFrame& frame) override;
    DeviceId key_of(const AnchorRecord& record) const override
    {
        return record.id;
    }
    EntityPtr create_entity(const AnchorRecord& record) override;
    bool update_entity(Anchor& anchor, const AnchorRecord& record) override;
    void teardown_entity(Anchor& anchor) override;
    void on_entity_added(const EntityPtr& anchor) override;

    // Completes callbacks waiting for `id`, or parks them until the anchor is reported
    void await_anchor(DeviceId id, Callbacks callbacks);

    void destroy_anchor(Anchor& anchor);
    void persist_anchor(Anchor& anchor);
    void notify_forgotten(const std::string& uuid);

    std::deque<CreationRequest> creation_queue_;
    // Submitted to the device, no anchor id yet
    std::map<uint64_t, Callbacks> in_flight_;
    uint64_t last_request_id_ = 0;
    // Anchor id known, waiting for the anchor to be reported
    std::map<DeviceId, std::vector<Callbacks>> awaiting_;
    std::map<DeviceId, std::string> restored_uuids_;
};

} // namespace immersive
