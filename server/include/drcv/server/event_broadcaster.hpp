#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "drcv/protocol.hpp"

namespace drcv::server
{

    enum class EventType : std::uint8_t
    {
        UploadCreated,
        UploadProgress,
        UploadCompleted,
        UploadDisconnected,
        UploadPruned,
        ClientConnected,
        ClientDisconnected,
        TunnelStatus
    };

    std::string_view to_string(EventType type) noexcept;

    struct Event
    {
        EventType type{};
        nlohmann::json payload{nlohmann::json::object()};
        protocol::Timestamp at{};
    };

    void to_json(nlohmann::json &json, const Event &event);

    // Bounded per-subscriber queue. Pushing never blocks; a full queue drops the event.
    class EventSubscription
    {
    public:
        explicit EventSubscription(std::size_t capacity);

        bool push(const Event &event);

        std::vector<Event> drain();

        std::optional<Event> wait_pop(std::chrono::milliseconds timeout);

        // Invoked (outside the queue lock) when an event lands in an empty queue or the queue closes.
        void set_notifier(std::function<void()> notifier);

        void close();
        bool closed() const;

        std::uint64_t dropped() const;

    private:
        const std::size_t capacity_;
        mutable std::mutex mutex_;
        std::condition_variable ready_;
        std::deque<Event> queue_;
        std::function<void()> notifier_;
        bool closed_{false};
        std::uint64_t dropped_{0};
    };

    class EventBroadcaster
    {
    public:
        explicit EventBroadcaster(std::size_t queue_capacity);

        std::shared_ptr<EventSubscription> subscribe();
        void unsubscribe(const EventSubscription *subscription);

        // Returns the number of subscribers that accepted the event.
        std::size_t publish(Event event);
        std::size_t publish(EventType type, nlohmann::json payload);

        void close_all();

        std::size_t subscriber_count() const;
        std::uint64_t dropped_total() const noexcept { return dropped_total_.load(); }

    private:
        std::vector<std::shared_ptr<EventSubscription>> live_subscribers();

        const std::size_t queue_capacity_;
        mutable std::mutex mutex_;
        std::vector<std::weak_ptr<EventSubscription>> subscribers_;
        std::atomic<std::uint64_t> dropped_total_{0};
    };

} // namespace drcv::server
