#include "drcv/server/server.hpp"

#include <asio/post.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "drcv/server/process.hpp"

namespace drcv::server
{

    namespace
    {

        // Room for the multipart framing around one chunk.
        constexpr std::size_t kUploadBodyOverhead = 1024 * 1024;
        constexpr std::size_t kAdminBodyLimit = 64 * 1024;

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          signals_(io_context_),
          store_(config_.database_path),
          filesystem_(config_.upload_dir),
          events_(config_.event_queue_capacity),
          engine_(store_, filesystem_, events_,
                  UploadLimits{.chunk_size = config_.chunk_size, .max_file_size = config_.max_file_size}),
          liveness_(store_, engine_, filesystem_, events_,
                    LivenessSettings{
                        .client_stale_timeout = config_.client_stale_timeout,
                        .upload_stale_timeout = config_.upload_stale_timeout,
                        .sweep_interval = config_.sweep_interval,
                        .retention = config_.retention,
                    }),
          upload_app_(engine_, liveness_, config_.trust_proxy_headers)
    {
        upload_listener_ = std::make_unique<HttpListener>(
            io_context_,
            ListenerOptions{
                .name = "Upload",
                .address = config_.upload_address,
                .port = config_.upload_port,
                .body_limit = static_cast<std::size_t>(config_.chunk_size) + kUploadBodyOverhead,
            },
            [this](const http::Request &request)
            { return upload_app_.handle(request); });

        // The tunnel forwards to whatever port the upload listener actually got.
        config_.tunnel.local_port = upload_listener_->port();
        tunnel_ = std::make_unique<TunnelService>(config_.tunnel, store_, events_, make_provider());

        admin_app_ = std::make_unique<AdminApp>(store_, events_, *tunnel_, engine_, config_.page_size);
        admin_listener_ = std::make_unique<HttpListener>(
            io_context_,
            ListenerOptions{
                .name = "Admin",
                .address = config_.admin_address,
                .port = config_.admin_port,
                .body_limit = kAdminBodyLimit,
            },
            [this](const http::Request &request)
            { return admin_app_->handle(request); });

        spdlog::info("Receiving into {} (database {})", filesystem_.root().string(), config_.database_path.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int signal)
                            {
        if (!ec) {
            spdlog::info("Signal {} received, shutting down", signal);
            shutdown();
        } });
    }

    Server::~Server()
    {
        if (tunnel_)
        {
            tunnel_->stop();
        }
    }

    std::unique_ptr<TunnelProvider> Server::make_provider()
    {
        if (config_.tunnel.provider.empty())
        {
            spdlog::info("No tunnel provider configured, running local-only");
            return nullptr;
        }
        try
        {
            return make_tunnel_provider(config_.tunnel.provider, make_posix_launcher());
        }
        catch (const TunnelFailure &ex)
        {
            spdlog::error("{}; running local-only", ex.what());
            return nullptr;
        }
    }

    void Server::run()
    {
        upload_listener_->start();
        admin_listener_->start();
        liveness_.start(io_context_);
        tunnel_->start();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();

        // Joins establishment and terminates the tunnel process off the event loop.
        tunnel_->stop();
        spdlog::info("Server stopped");
    }

    void Server::stop()
    {
        asio::post(io_context_, [this]
                   { shutdown(); });
    }

    std::uint16_t Server::upload_port() const
    {
        return upload_listener_->port();
    }

    std::uint16_t Server::admin_port() const
    {
        return admin_listener_->port();
    }

    void Server::shutdown()
    {
        std::error_code ec;
        signals_.cancel(ec);
        upload_listener_->stop();
        admin_listener_->stop();
        liveness_.stop();
        events_.close_all();
        io_context_.stop();
    }

} // namespace drcv::server
