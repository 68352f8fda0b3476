// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace immersive
{

using SubscriptionId = uint64_t;

/**
 * @brief Listener side of an event channel.
 *
 * Event is normally a std::variant over the event kinds a component can
 * raise; handlers dispatch on it with std::visit or std::get_if.
 *
 * Usage:
 *   auto id = manager.events().subscribe([](const SessionManager::Event& event) {
 *       if (std::holds_alternative<SessionStarted>(event)) { ... }
 *   });
 *   manager.events().unsubscribe(id);
 */
template <typename Event>
class EventSource
{
public:
    using Handler = std::function<void(const Event&)>;

    EventSource() = default;
    EventSource(const EventSource&) = delete;
    EventSource& operator=(const EventSource&) = delete;

    // Handlers added during an emission are first called on the next emission
    SubscriptionId subscribe(Handler handler)
    {
        const SubscriptionId id = ++next_id_;
        handlers_.push_back({ id, std::make_shared<Handler>(std::move(handler)) });
        return id;
    }

    // Returns false if the id is unknown. A handler removed during an emission
    // still receives the event being emitted.
    bool unsubscribe(SubscriptionId id)
    {
        auto it = std::find_if(handlers_.begin(), handlers_.end(), [id](const Entry& e) { return e.id == id; });
        if (it == handlers_.end())
        {
            return false;
        }
        handlers_.erase(it);
        return true;
    }

    size_t subscriber_count() const
    {
        return handlers_.size();
    }

protected:
    ~EventSource() = default;

    struct Entry
    {
        SubscriptionId id;
        std::shared_ptr<Handler> handler;
    };

    std::vector<Entry> handlers_;
    SubscriptionId next_id_ = 0;
};

/**
 * @brief Owner side of an event channel.
 *
 * Components keep an EventEmitter as a member and hand out the EventSource
 * base so only the owner can emit.
 */
template <typename Event>
class EventEmitter : public EventSource<Event>
{
public:
    void emit(const Event& event) const
    {
        // Iterate over a snapshot so handlers may (un)subscribe re-entrantly
        const auto snapshot = this->handlers_;
        for (const auto& entry : snapshot)
        {
            (*entry.handler)(event);
        }
    }
};

} // namespace immersive
