// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace immersive
{

/**
 * @brief Keeps a local index of entities in step with the set a device reports each frame.
 *
 * Every reconcile() call, in this order:
 *   1. each local entity whose key is absent from the records is erased from the
 *      index and the list, torn down, and reported through on_remove;
 *   2. each record with an unknown key creates an entity which is inserted,
 *      populated from the record (is_new == true) and reported through on_add;
 *      a record with a known key refreshes its entity in place (is_new == false).
 *
 * A key that reappears after removal gets a freshly created entity. Repeated
 * keys within one enumeration update the same entity. The list keeps insertion
 * order and always holds exactly the entities of the index.
 *
 * Usage:
 *   EntityReconciler<Plane, PlaneRecord, DeviceId> planes({
 *       .key_of = [](const PlaneRecord& r) { return r.id; },
 *       .create = [](const PlaneRecord& r) { return std::make_shared<Plane>(r.id); },
 *       .update = [](const std::shared_ptr<Plane>& p, const PlaneRecord& r, bool is_new) { p->update(r); },
 *       .teardown = [](const std::shared_ptr<Plane>& p) { p->invalidate(); },
 *       .on_add = ..., .on_remove = ...,
 *   });
 *   planes.reconcile(frame.detected_planes());
 */
template <typename Entity, typename Record, typename Key>
class EntityReconciler
{
public:
    using EntityPtr = std::shared_ptr<Entity>;

    struct Callbacks
    {
        std::function<Key(const Record&)> key_of;
        std::function<EntityPtr(const Record&)> create;
        std::function<void(const EntityPtr&, const Record&, bool is_new)> update;
        std::function<void(const EntityPtr&)> teardown;
        std::function<void(const EntityPtr&)> on_add;
        std::function<void(const EntityPtr&)> on_remove;
    };

    explicit EntityReconciler(Callbacks callbacks) : callbacks_(std::move(callbacks))
    {
    }

    void reconcile(const std::vector<Record>& records)
    {
        std::unordered_set<Key> live;
        live.reserve(records.size());
        for (const auto& record : records)
        {
            live.insert(callbacks_.key_of(record));
        }

        // Removals first so a key the device recycles within one frame is re-added cleanly
        for (size_t i = 0; i < entries_.size();)
        {
            if (live.count(entries_[i].key) == 0)
            {
                remove_at(i);
            }
            else
            {
                ++i;
            }
        }

        for (const auto& record : records)
        {
            Key key = callbacks_.key_of(record);
            auto it = index_.find(key);
            if (it != index_.end())
            {
                if (callbacks_.update)
                {
                    callbacks_.update(it->second, record, false);
                }
                continue;
            }

            EntityPtr entity = callbacks_.create(record);
            if (!entity)
            {
                continue;
            }
            // Populated before it is indexed so a throwing update leaves the key unknown
            if (callbacks_.update)
            {
                callbacks_.update(entity, record, true);
            }
            index_.emplace(key, entity);
            entries_.push_back({ key, entity });
            if (callbacks_.on_add)
            {
                callbacks_.on_add(entity);
            }
        }
    }

    // Removes every entity, each reported through on_remove
    void clear()
    {
        while (!entries_.empty())
        {
            remove_at(0);
        }
    }

    EntityPtr find(const Key& key) const
    {
        auto it = index_.find(key);
        return it != index_.end() ? it->second : nullptr;
    }

    std::vector<EntityPtr> list() const
    {
        std::vector<EntityPtr> result;
        result.reserve(entries_.size());
        for (const auto& entry : entries_)
        {
            result.push_back(entry.entity);
        }
        return result;
    }

    size_t size() const
    {
        return entries_.size();
    }

    bool empty() const
    {
        return entries_.empty();
    }

private:
    struct Entry
    {
        Key key;
        EntityPtr entity;
    };

    void remove_at(size_t i)
    {
        Entry entry = std::move(entries_[i]);
        index_.erase(entry.key);
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(i));

        if (callbacks_.teardown)
        {
            callbacks_.teardown(entry.entity);
        }
        if (callbacks_.on_remove)
        {
            callbacks_.on_remove(entry.entity);
        }
    }

    Callbacks callbacks_;
    std::unordered_map<Key, EntityPtr> index_;
    std::vector<Entry> entries_;
};

} // namespace immersive
