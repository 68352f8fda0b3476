// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "entity_reconciler.hpp"
#include "events.hpp"

#include <device/device_api.hpp>
#include <events/event_emitter.hpp>
#include <flatbuffers/flatbuffers.h>
#include <schema/timestamp_generated.h>

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace immersive
{

// What a subsystem gets to see of a session that just reached the running state
struct SessionContext
{
    std::shared_ptr<IDeviceSession> session;
    SessionType type = SessionType::AR;
    std::shared_ptr<IReferenceSpace> reference_space;
};

/**
 * @brief Base interface of the per-feature detection subsystems.
 *
 * supported() reflects platform capability presence, available() whether the
 * running session negotiated the feature. The session manager drives the
 * lifecycle calls and dispatches update() once per frame in a fixed order;
 * implementations catch and report their own errors and never throw from update().
 */
class DetectionSubsystem
{
public:
    virtual ~DetectionSubsystem() = default;

    virtual std::string_view get_name() const = 0;
    virtual Feature get_feature() const = 0;

    bool supported() const
    {
        return supported_;
    }

    bool available() const
    {
        return available_;
    }

    virtual void on_session_start(const SessionContext& context) = 0;

    // Must leave the subsystem empty and unavailable
    virtual void on_session_end() = 0;

    // Returns false if the frame could not be processed; the error has been reported already
    virtual bool update(const IFrame& frame) = 0;

    /**
     * @brief FlatBuffer root type name for MCAP recording (e.g. "immersive.PlaneDetectionRecord").
     */
    virtual std::string_view get_schema_name() const = 0;

    /**
     * @brief Binary FlatBuffer schema for MCAP recording.
     */
    virtual std::string_view get_schema_text() const = 0;

    virtual std::string_view get_record_channel() const = 0;

    // Serialize the current state as one finished record buffer
    virtual void serialize(flatbuffers::FlatBufferBuilder& builder, const Timestamp& timestamp) const = 0;

protected:
    explicit DetectionSubsystem(bool supported) : supported_(supported)
    {
    }

    bool supported_;
    bool available_ = false;

    // Device callbacks hold a weak reference and drop out once the subsystem is destroyed
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

/**
 * @brief Detection subsystem whose entities are reconciled against a per-frame device enumeration.
 *
 * Derived classes describe how to read their records from a frame and how to
 * build and refresh an entity; this class owns the index and raises the
 * add / remove / change events.
 */
template <typename Entity, typename Record, typename Key, typename... ExtraEvents>
class ReconcilingSubsystem : public DetectionSubsystem
{
public:
    using EntityPtr = std::shared_ptr<Entity>;
    using Event = std::variant<SubsystemAvailable,
                               SubsystemUnavailable,
                               EntityAdded<Entity>,
                               EntityRemoved<Entity>,
                               EntityChanged<Entity>,
                               SubsystemError,
                               ExtraEvents...>;

    EventSource<Event>& events()
    {
        return emitter_;
    }

    // Current entities in the order they were first reported
    std::vector<EntityPtr> list() const
    {
        return reconciler_.list();
    }

    size_t size() const
    {
        return reconciler_.size();
    }

    void on_session_start(const SessionContext& context) override
    {
        session_ = context.session;
        session_type_ = context.type;
        if (!supported_ || !session_ || !session_->has_feature(get_feature()))
        {
            return;
        }
        available_ = true;
        emitter_.emit(SubsystemAvailable{});
    }

    void on_session_end() override
    {
        reconciler_.clear();
        session_.reset();
        if (available_)
        {
            available_ = false;
            emitter_.emit(SubsystemUnavailable{});
        }
    }

    bool update(const IFrame& frame) override
    {
        if (!supported_ || !available_)
        {
            return true;
        }

        try
        {
            reconciler_.reconcile(collect(frame));
            after_reconcile(frame);
        }
        catch (const std::exception& e)
        {
            report_error(e.what());
            return false;
        }
        return true;
    }

protected:
    explicit ReconcilingSubsystem(bool supported)
        : DetectionSubsystem(supported),
          reconciler_({ .key_of = [this](const Record& record) { return key_of(record); },
                        .create = [this](const Record& record) { return create_entity(record); },
                        .update =
                            [this](const EntityPtr& entity, const Record& record, bool is_new)
                        {
                            if (update_entity(*entity, record) && !is_new)
                            {
                                emitter_.emit(EntityChanged<Entity>{ entity });
                            }
                        },
                        .teardown = [this](const EntityPtr& entity) { teardown_entity(*entity); },
                        .on_add = [this](const EntityPtr& entity) { on_entity_added(entity); },
                        .on_remove = [this](const EntityPtr& entity) { emitter_.emit(EntityRemoved<Entity>{ entity }); } })
    {
    }

    // Records of the live entities in this frame
    virtual std::vector<Record> collect(const IFrame& frame) = 0;
    virtual Key key_of(const Record& record) const = 0;
    virtual EntityPtr create_entity(const Record& record) = 0;
    // Returns true if the device reported a change worth an EntityChanged event
    virtual bool update_entity(Entity& entity, const Record& record) = 0;

    virtual void teardown_entity(Entity& /*entity*/)
    {
    }

    virtual void on_entity_added(const EntityPtr& entity)
    {
        emitter_.emit(EntityAdded<Entity>{ entity });
    }

    virtual void after_reconcile(const IFrame& /*frame*/)
    {
    }

    void report_error(const std::string& message)
    {
        std::cerr << get_name() << ": " << message << std::endl;
        emitter_.emit(SubsystemError{ message });
    }

    EntityPtr find(const Key& key) const
    {
        return reconciler_.find(key);
    }

    uint64_t next_local_id()
    {
        return ++last_local_id_;
    }

    std::shared_ptr<IDeviceSession> session_;
    SessionType session_type_ = SessionType::AR;
    EventEmitter<Event> emitter_;

private:
    EntityReconciler<Entity, Record, Key> reconciler_;
    uint64_t last_local_id_ = 0;
};

} // namespace immersive
