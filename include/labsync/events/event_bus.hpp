/**
 * @file event_bus.hpp
 * @brief Type-keyed publish/subscribe channel for engine notifications
 *
 * The scanner, the upload workers and the verification poller publish what
 * they did without knowing who listens; the CLI, the logger and the metrics
 * counters subscribe without knowing which thread publishes.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<FolderDiscoveredEvent>([](const FolderDiscoveredEvent& e) { ... });
 * bus.emit(FolderDiscoveredEvent(record));
 * bus.unsubscribe<FolderDiscoveredEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace labsync::events {

/**
 * @brief Synchronous, thread-safe event bus
 *
 * THREAD SAFETY:
 * - emit() may run on many upload workers at once
 * - subscribe() and unsubscribe() may race with emit(); a handler removed
 *   during an emit can still see that one event
 * - Handlers run on the emitting thread, outside the bus lock, so a handler
 *   may itself subscribe, unsubscribe or emit
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// Returns the id to pass to unsubscribe().
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<Handler>(
            [fn = std::move(handler)](const void* event) {
                fn(*static_cast<const EventType*>(event));
            });
        std::unique_lock lock(mutex_);
        const size_t id = next_id_++;
        channels_[std::type_index(typeid(EventType))].push_back(Slot{id, std::move(erased)});
        return id;
    }

    template<typename EventType>
    void unsubscribe(size_t id) {
        std::unique_lock lock(mutex_);
        auto channel = channels_.find(std::type_index(typeid(EventType)));
        if (channel == channels_.end()) {
            return;
        }
        auto& slots = channel->second;
        slots.erase(std::remove_if(slots.begin(), slots.end(),
                                   [id](const Slot& slot) { return slot.id == id; }),
                    slots.end());
    }

    /**
     * @brief Deliver `event` to every current subscriber of its type
     *
     * A handler that throws std::exception is logged and skipped. Any other
     * exception reaches the emitter.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        const auto receivers = handlers_for(std::type_index(typeid(EventType)));
        for (const auto& handler : receivers) {
            try {
                (*handler)(&event);
            } catch (const std::exception& e) {
                spdlog::error("Subscriber to {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto channel = channels_.find(std::type_index(typeid(EventType)));
        return channel == channels_.end() ? 0 : channel->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        channels_.clear();
    }

private:
    using Handler = std::function<void(const void*)>;

    struct Slot {
        size_t id;
        std::shared_ptr<Handler> handler;
    };

    std::vector<std::shared_ptr<Handler>> handlers_for(std::type_index type) const {
        std::vector<std::shared_ptr<Handler>> receivers;
        std::shared_lock lock(mutex_);
        auto channel = channels_.find(type);
        if (channel != channels_.end()) {
            receivers.reserve(channel->second.size());
            for (const auto& slot : channel->second) {
                receivers.push_back(slot.handler);
            }
        }
        return receivers;
    }

    std::unordered_map<std::type_index, std::vector<Slot>> channels_;
    mutable std::shared_mutex mutex_;
    size_t next_id_ = 0;
};

} // namespace labsync::events
