/**
 * @file event_bus.hpp
 * @brief Synchronous publish/subscribe channel for upload notifications
 *
 * WHY THIS FILE EXISTS:
 * The upload loop reports progress, status changes and outcomes without
 * knowing who listens: a progress bar, LoggerComponent, MetricsComponent
 * or a test recording the event order.
 *
 * DELIVERY RULES:
 * - Handlers run synchronously on the emitting thread, in subscription order
 * - emit() returns after every handler for the event type has run
 * - A handler may subscribe, unsubscribe, or call UploadController::pause()
 *   while it is being invoked; changes apply from the next emit()
 * - A handler that throws is logged and skipped; the rest still run
 *
 * EXAMPLE:
 * EventBus bus;
 * auto progress = bus.subscribe_scoped<UploadProgressEvent>(
 *     [](const UploadProgressEvent& e) { draw_bar(e.percent); });
 * // progress unsubscribes when it goes out of scope
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace vidup::events {

/**
 * @brief Move-only handle that unsubscribes on destruction
 *
 * The bus must outlive the handle.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) {
        other.cancel_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            cancel_ = std::move(other.cancel_);
            other.cancel_ = nullptr;
        }
        return *this;
    }

    void reset() {
        if (cancel_) {
            auto cancel = std::move(cancel_);
            cancel_ = nullptr;
            cancel();
        }
    }

    bool active() const noexcept { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

/**
 * @brief Type-indexed event bus
 *
 * Each event struct is its own channel; subscribing to UploadProgressEvent
 * never delivers UploadStartedEvent.
 *
 * THREAD SAFETY:
 * The handler table is guarded by a shared_mutex. emit() copies the
 * handler list under a shared lock and invokes the copy unlocked, so
 * handlers never run while the bus is locked.
 */
class EventBus {
public:
    using HandlerId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for EventType
     *
     * @return Id to pass to unsubscribe<EventType>()
     */
    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<Handler>(
            [fn = std::move(handler)](const void* event) {
                fn(*static_cast<const EventType*>(event));
            });

        std::unique_lock lock(mutex_);
        const HandlerId id = next_id_++;
        channels_[std::type_index(typeid(EventType))].push_back({id, std::move(erased)});
        return id;
    }

    /// subscribe() whose registration ends with the returned handle
    template<typename EventType>
    [[nodiscard]] Subscription subscribe_scoped(std::function<void(const EventType&)> handler) {
        const HandlerId id = subscribe<EventType>(std::move(handler));
        return Subscription([this, id] { unsubscribe<EventType>(id); });
    }

    /// Unknown ids are ignored
    template<typename EventType>
    void unsubscribe(HandlerId id) {
        std::unique_lock lock(mutex_);
        auto it = channels_.find(std::type_index(typeid(EventType)));
        if (it == channels_.end()) {
            return;
        }
        auto& entries = it->second;
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [id](const Entry& entry) { return entry.id == id; }),
                      entries.end());
    }

    /**
     * @brief Deliver an event to every current subscriber of its type
     *
     * EXCEPTION SAFETY:
     * Exceptions derived from std::exception are logged and do not reach
     * the emitter, so a faulty observer cannot abort an upload.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<Handler>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = channels_.find(std::type_index(typeid(EventType)));
            if (it == channels_.end()) {
                return;
            }
            snapshot.reserve(it->second.size());
            for (const auto& entry : it->second) {
                snapshot.push_back(entry.handler);
            }
        }

        for (const auto& handler : snapshot) {
            try {
                (*handler)(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = channels_.find(std::type_index(typeid(EventType)));
        return it != channels_.end() ? it->second.size() : 0;
    }

    /// Drop every handler of every type
    void clear() {
        std::unique_lock lock(mutex_);
        channels_.clear();
    }

private:
    // Handler with the event type erased; the pointer is always an EventType
    // of the channel it is stored under
    using Handler = std::function<void(const void*)>;

    struct Entry {
        HandlerId id;
        std::shared_ptr<Handler> handler;
    };

    std::unordered_map<std::type_index, std::vector<Entry>> channels_;
    mutable std::shared_mutex mutex_;
    HandlerId next_id_ = 0;
};

} // namespace vidup::events
