#pragma once

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "drcv/server/admin_app.hpp"
#include "drcv/server/config.hpp"
#include "drcv/server/event_broadcaster.hpp"
#include "drcv/server/filesystem.hpp"
#include "drcv/server/http_server.hpp"
#include "drcv/server/liveness.hpp"
#include "drcv/server/store.hpp"
#include "drcv/server/tunnel.hpp"
#include "drcv/server/upload_app.hpp"
#include "drcv/server/upload_engine.hpp"

namespace drcv::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);
        ~Server();

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        // Blocks until a shutdown signal or stop().
        void run();

        // Safe to call from any thread.
        void stop();

        std::uint16_t upload_port() const;
        std::uint16_t admin_port() const;

    private:
        std::unique_ptr<TunnelProvider> make_provider();
        void shutdown();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::signal_set signals_;

        Store store_;
        Filesystem filesystem_;
        EventBroadcaster events_;
        UploadEngine engine_;
        LivenessTracker liveness_;
        UploadApp upload_app_;

        std::unique_ptr<HttpListener> upload_listener_;
        std::unique_ptr<TunnelService> tunnel_;
        std::unique_ptr<AdminApp> admin_app_;
        std::unique_ptr<HttpListener> admin_listener_;

        std::vector<std::thread> workers_;
    };

} // namespace drcv::server
