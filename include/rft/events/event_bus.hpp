/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe channel between the transfer engine and observers
 *
 * The orchestrator publishes what happens during an upload (phases, skipped
 * items, written chunks). LoggerComponent, MetricsComponent and callers
 * subscribe per event type.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<ChunkWrittenEvent>([](const ChunkWrittenEvent& e) {
 *     spdlog::info("{} / {}", e.bytes_so_far, e.total_bytes);
 * });
 * bus.unsubscribe<ChunkWrittenEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace rft::events {

/**
 * @brief One channel per event type, keyed by std::type_index
 *
 * Subscribing and emitting may happen from different threads. Handlers run
 * on the emitting thread, after the bus lock has been released, so a
 * handler may itself subscribe or emit.
 */
class EventBus {
public:
    using SubscriptionId = std::size_t;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        channel_for<EventType>().slots.push_back(
            {id, std::make_shared<const std::function<void(const EventType&)>>(std::move(handler))});
        return id;
    }

    /// Unknown ids are ignored.
    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        if (auto* channel = find_channel<EventType>()) {
            channel->remove(id);
        }
    }

    /**
     * Delivers event to every current subscriber of EventType in
     * subscription order. A handler throwing std::exception is logged and
     * the remaining handlers still run.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<const std::function<void(const EventType&)>>> targets;
        {
            std::shared_lock lock(mutex_);
            const auto* channel = find_channel<EventType>();
            if (channel == nullptr) {
                return;
            }
            targets.reserve(channel->slots.size());
            for (const auto& slot : channel->slots) {
                targets.push_back(slot.handler);
            }
        }

        for (const auto& target : targets) {
            try {
                (*target)(event);
            } catch (const std::exception& e) {
                spdlog::error("Subscriber of {} failed: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        const auto* channel = find_channel<EventType>();
        return channel != nullptr ? channel->size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        channels_.clear();
    }

private:
    struct ChannelBase {
        virtual ~ChannelBase() = default;
        virtual void remove(SubscriptionId id) = 0;
        virtual std::size_t size() const = 0;
    };

    template<typename EventType>
    struct Channel : ChannelBase {
        struct Slot {
            SubscriptionId id;
            std::shared_ptr<const std::function<void(const EventType&)>> handler;
        };

        void remove(SubscriptionId id) override {
            for (auto it = slots.begin(); it != slots.end(); ++it) {
                if (it->id == id) {
                    slots.erase(it);
                    return;
                }
            }
        }

        std::size_t size() const override { return slots.size(); }

        std::vector<Slot> slots;
    };

    // Caller holds the unique lock
    template<typename EventType>
    Channel<EventType>& channel_for() {
        auto& channel = channels_[std::type_index(typeid(EventType))];
        if (!channel) {
            channel = std::make_unique<Channel<EventType>>();
        }
        return static_cast<Channel<EventType>&>(*channel);
    }

    template<typename EventType>
    Channel<EventType>* find_channel() const {
        const auto it = channels_.find(std::type_index(typeid(EventType)));
        if (it == channels_.end()) {
            return nullptr;
        }
        return static_cast<Channel<EventType>*>(it->second.get());
    }

    std::unordered_map<std::type_index, std::unique_ptr<ChannelBase>> channels_;
    mutable std::shared_mutex mutex_;
    SubscriptionId next_id_ = 0;
};

} // namespace rft::events
