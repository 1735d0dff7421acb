#pragma once

#include <chrono>
#include <cstddef>

#include "drcv/http.hpp"
#include "drcv/server/http_server.hpp"

namespace drcv::server
{

    class Store;
    class EventBroadcaster;
    class TunnelService;
    class UploadEngine;

    /**
     * Routes of the loopback-only admin listener:
     *   GET /data?page=&q=   upload history, newest first
     *   GET /clients         client roster
     *   GET /tunnel          public hostname and tunnel health
     *   GET /events          text/event-stream of state changes
     *   GET /stats           counters
     */
    class AdminApp
    {
    public:
        AdminApp(Store &store, EventBroadcaster &events, TunnelService &tunnel, UploadEngine &engine,
                 std::size_t page_size, std::chrono::seconds keepalive = std::chrono::seconds(15));

        HttpReply handle(const http::Request &request);

    private:
        http::Response data(const http::Request &request);
        http::Response clients();
        http::Response tunnel();
        http::Response stats();
        HttpReply events();

        Store &store_;
        EventBroadcaster &events_;
        TunnelService &tunnel_;
        UploadEngine &engine_;
        std::size_t page_size_;
        std::chrono::seconds keepalive_;
    };

} // namespace drcv::server
