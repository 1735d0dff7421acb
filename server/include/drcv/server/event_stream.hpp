#pragma once

#include <array>
#include <chrono>
#include <deque>
#include <memory>
#include <string>

#include <asio/any_io_executor.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include "drcv/server/event_broadcaster.hpp"

namespace drcv::server
{

    // "event: <type>\ndata: <json>\n\n"
    std::string format_sse(const Event &event);

    /**
     * Long-lived text/event-stream writer for one admin subscriber. All socket work runs on a
     * strand; producers only wake it through the subscription's notifier.
     */
    class EventStreamSession : public std::enable_shared_from_this<EventStreamSession>
    {
    public:
        EventStreamSession(asio::ip::tcp::socket socket, EventBroadcaster &events,
                           std::shared_ptr<EventSubscription> subscription, std::chrono::seconds keepalive);

        void start();

    private:
        void pump();
        void write_next();
        void watch_disconnect();
        void schedule_keepalive();
        void close();

        asio::ip::tcp::socket socket_;
        asio::strand<asio::any_io_executor> strand_;
        asio::steady_timer keepalive_timer_;
        std::chrono::seconds keepalive_;
        EventBroadcaster &events_;
        std::shared_ptr<EventSubscription> subscription_;
        std::deque<std::string> outbox_;
        std::array<char, 256> discard_{};
        bool writing_{false};
        bool closed_{false};
    };

} // namespace drcv::server
