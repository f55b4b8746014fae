/**
 * @file event_bus.hpp
 * @brief Type-safe event bus used as the progress-reporting collaborator
 *
 * WHY THIS FILE EXISTS:
 * The relay client, the handshake and the transfer protocol report what
 * happens (roster changes, per-file progress, aborts) without knowing who
 * renders it. Front-ends, the logger and metrics subscribe here.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<FileProgressEvent>([](const FileProgressEvent& e) { ... });
 * bus.emit(FileProgressEvent{...});
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

namespace lanbeam::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - The relay thread and session threads emit concurrently
 * - Handlers run synchronously on the emitting thread
 * - A handler may subscribe or unsubscribe while being called; the change
 *   applies from the next emit
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register `handler` for every later emit of EventType
     *
     * RETURNS: id for unsubscribe<EventType>()
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        Subscription subscription;
        subscription.call = [handler = std::move(handler)](const void* event) {
            handler(*static_cast<const EventType*>(event));
        };

        std::unique_lock lock(mutex_);
        const std::size_t id = next_id_++;
        subscription.id = id;
        auto& slot = handlers_[std::type_index(typeid(EventType))];
        auto updated = slot ? std::make_shared<SubscriptionList>(*slot) : std::make_shared<SubscriptionList>();
        updated->push_back(std::move(subscription));
        slot = std::move(updated);
        return id;
    }

    template<typename EventType>
    void unsubscribe(std::size_t id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end() || !it->second) {
            return;
        }
        auto updated = std::make_shared<SubscriptionList>(*it->second);
        updated->erase(std::remove_if(updated->begin(), updated->end(),
                                      [id](const Subscription& s) { return s.id == id; }),
                       updated->end());
        it->second = std::move(updated);
    }

    /**
     * @brief Deliver `event` to the handlers registered when emit() started
     *
     * A throwing handler is logged and skipped; protocol code never sees
     * handler failures.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::shared_ptr<const SubscriptionList> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            snapshot = it->second;
        }
        if (!snapshot) {
            return;
        }

        for (const auto& subscription : *snapshot) {
            try {
                subscription.call(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler {} for {} threw: {}", subscription.id, typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    [[nodiscard]] std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return (it != handlers_.end() && it->second) ? it->second->size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct Subscription {
        std::size_t id = 0;
        std::function<void(const void*)> call;
    };
    using SubscriptionList = std::vector<Subscription>;

    // Lists are replaced, never mutated, so emit() iterates a stable snapshot
    std::unordered_map<std::type_index, std::shared_ptr<const SubscriptionList>> handlers_;
    mutable std::shared_mutex mutex_;
    std::size_t next_id_ = 0;
};

} // namespace lanbeam::events
