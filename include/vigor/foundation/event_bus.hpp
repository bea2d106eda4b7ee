#pragma once

/// @file event_bus.hpp
/// @brief Type-safe event bus carrying combat notifications to the outer game.
///
/// Combat start/end, action descriptions and skill-usage notices leave the
/// combat core only through this bus; room broadcast, sound propagation and
/// skill progression subscribe to it.

#include <algorithm>
#include <any>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "vigor/foundation/game_logger.hpp"

namespace vigor::foundation {

/// Unique identifier for an event subscription.
using SubscriptionId = uint64_t;

/// Event bus supporting synchronous and deferred delivery.
///
/// Handlers run in priority order (lower value first), then subscription
/// order. A handler that throws is logged and skipped; the publisher and
/// the remaining handlers are unaffected.
///
/// Usage:
/// @code
///   EventBus bus;
///   auto id = bus.Subscribe<CombatEnded>([](const CombatEnded& e) {
///       announce(e.roomId, e.reason);
///   });
///   bus.Publish(CombatEnded{...});
///   bus.Unsubscribe(id);
/// @endcode
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // -- Subscribe ------------------------------------------------------------

    /// Subscribe a handler for events of type E.
    /// @return A subscription ID for later Unsubscribe().
    template <typename E>
    SubscriptionId Subscribe(std::function<void(const E&)> handler,
                             int32_t priority = 0) {
        std::lock_guard lock(mutex_);

        auto id = nextId_++;
        auto typeIdx = std::type_index(typeid(E));

        HandlerEntry entry;
        entry.id = id;
        entry.priority = priority;
        entry.handler = [fn = std::move(handler)](const std::any& event) {
            fn(std::any_cast<const E&>(event));
        };

        auto& handlers = handlers_[typeIdx];
        handlers.push_back(std::move(entry));
        std::stable_sort(handlers.begin(), handlers.end(),
                         [](const HandlerEntry& a, const HandlerEntry& b) {
                             return a.priority < b.priority;
                         });

        subscriptionTypes_.insert_or_assign(id, typeIdx);
        return id;
    }

    // -- Unsubscribe ----------------------------------------------------------

    /// Remove a subscription by ID. Unknown IDs are ignored.
    void Unsubscribe(SubscriptionId id) {
        std::lock_guard lock(mutex_);
        auto typeIt = subscriptionTypes_.find(id);
        if (typeIt == subscriptionTypes_.end()) {
            return;
        }

        auto handlersIt = handlers_.find(typeIt->second);
        if (handlersIt != handlers_.end()) {
            auto& vec = handlersIt->second;
            std::erase_if(vec, [id](const HandlerEntry& e) { return e.id == id; });
            if (vec.empty()) {
                handlers_.erase(handlersIt);
            }
        }
        subscriptionTypes_.erase(typeIt);
    }

    // -- Publish --------------------------------------------------------------

    /// Publish an event synchronously on the calling thread.
    template <typename E>
    void Publish(const E& event) {
        std::vector<HandlerEntry> snapshot;
        {
            std::lock_guard lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(E)));
            if (it == handlers_.end()) {
                return;
            }
            snapshot = it->second;
        }

        std::any wrapped = event;
        for (const auto& entry : snapshot) {
            try {
                entry.handler(wrapped);
            } catch (const std::exception& e) {
                VIGOR_LOG_ERROR(LogCategory::Core,
                                std::string("event handler ") + std::to_string(entry.id) +
                                " threw: " + e.what());
            }
        }
    }

    /// Queue an event until the next ProcessDeferred().
    template <typename E>
    void PublishDeferred(E event) {
        std::lock_guard lock(mutex_);
        deferredQueue_.push_back([this, evt = std::move(event)]() {
            Publish(evt);
        });
    }

    /// Dispatch queued events in FIFO order. Events queued while
    /// dispatching wait for the next call.
    void ProcessDeferred() {
        std::vector<std::function<void()>> queue;
        {
            std::lock_guard lock(mutex_);
            queue.swap(deferredQueue_);
        }
        for (auto& fn : queue) {
            fn();
        }
    }

    // -- Queries --------------------------------------------------------------

    template <typename E>
    [[nodiscard]] std::size_t HandlerCountFor() const {
        std::lock_guard lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(E)));
        return it == handlers_.end() ? 0 : it->second.size();
    }

    [[nodiscard]] std::size_t DeferredCount() const {
        std::lock_guard lock(mutex_);
        return deferredQueue_.size();
    }

private:
    struct HandlerEntry {
        SubscriptionId id = 0;
        int32_t priority = 0;
        std::function<void(const std::any&)> handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    std::unordered_map<SubscriptionId, std::type_index> subscriptionTypes_;
    std::vector<std::function<void()>> deferredQueue_;
    SubscriptionId nextId_ = 1;
};

} // namespace vigor::foundation
