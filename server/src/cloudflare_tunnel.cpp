#include "drcv/server/cloudflare_tunnel.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <vector>

#include <spdlog/spdlog.h>

#include "drcv/crypto.hpp"
#include "drcv/http.hpp"
#include "drcv/server/process.hpp"
#include "drcv/server/store.hpp"

namespace drcv::server
{

    namespace
    {

        constexpr auto kProviderName = "cloudflare";
        constexpr auto kTunnelPrefix = "drcv-";
        constexpr std::chrono::seconds kVersionTimeout{15};
        constexpr std::chrono::seconds kCommandTimeout{60};

        constexpr auto kInstallGuide =
            "cloudflared is not installed or not on PATH. Install it "
            "(https://developers.cloudflare.com/cloudflare-one/connections/connect-networks/downloads/), "
            "then authenticate once with `cloudflared tunnel login`";
        constexpr auto kLoginGuide =
            "Not authenticated with Cloudflare. Run `cloudflared tunnel login`, finish the browser flow, then restart";

        bool mentions_login(const CommandResult &result)
        {
            const auto err = http::to_lower(result.err);
            return err.find("not authenticated") != std::string::npos || err.find("login") != std::string::npos;
        }

        [[noreturn]] void command_failed(const CommandResult &result, const std::string &what)
        {
            if (result.exit_code == 127)
            {
                throw TunnelFailure(drcv::ErrorCode::DependencyMissing, kInstallGuide);
            }
            if (mentions_login(result))
            {
                throw TunnelFailure(drcv::ErrorCode::TunnelError, kLoginGuide);
            }
            if (result.timed_out)
            {
                throw TunnelFailure(drcv::ErrorCode::TunnelError, what + " timed out");
            }
            throw TunnelFailure(drcv::ErrorCode::TunnelError,
                                what + " failed: " + std::string(http::trim(result.err)));
        }

        std::optional<std::string> find_tunnel_uuid(const std::string &listing, const std::string &tunnel_name)
        {
            static const std::regex kUuid(
                "[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}");
            std::istringstream lines(listing);
            std::string line;
            while (std::getline(lines, line))
            {
                // Match the name as a whole column so drcv-abc does not match drcv-abcdef.
                std::istringstream columns(line);
                std::string column;
                bool named = false;
                while (columns >> column)
                {
                    if (column == tunnel_name)
                    {
                        named = true;
                        break;
                    }
                }
                std::smatch match;
                if (named && std::regex_search(line, match, kUuid))
                {
                    return match.str();
                }
            }
            return std::nullopt;
        }

        std::filesystem::path resolve_config_dir(const TunnelConfig &config)
        {
            if (config.config_dir)
            {
                return *config.config_dir;
            }
            const char *home = std::getenv("HOME");
            if (home == nullptr || *home == '\0')
            {
                throw TunnelFailure(drcv::ErrorCode::TunnelError, "Cannot resolve the home directory for ~/.cloudflared");
            }
            return std::filesystem::path(home) / ".cloudflared";
        }

        std::filesystem::path write_ingress_config(const std::filesystem::path &dir, const std::string &uuid,
                                                   const std::string &hostname, std::uint16_t port)
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec)
            {
                throw TunnelFailure(drcv::ErrorCode::TunnelError,
                                    "Cannot create " + dir.string() + ": " + ec.message());
            }
            const auto path = dir / ("config-" + hostname + ".yml");
            const auto credentials = dir / (uuid + ".json");
            std::ofstream out(path, std::ios::trunc);
            out << "tunnel: " << uuid << "\n"
                << "credentials-file: " << credentials.string() << "\n\n"
                << "ingress:\n"
                << "  - hostname: " << hostname << "\n"
                << "    service: http://localhost:" << port << "\n"
                << "  - service: http_status:404\n";
            out.close();
            if (!out)
            {
                throw TunnelFailure(drcv::ErrorCode::TunnelError, "Cannot write " + path.string());
            }
            return path;
        }

        class CloudflareTunnel : public TunnelManager
        {
        public:
            CloudflareTunnel(std::shared_ptr<ProcessLauncher> launcher, TunnelConfig config, std::string hostname,
                             std::filesystem::path config_path)
                : launcher_(std::move(launcher)),
                  config_(std::move(config)),
                  hostname_(std::move(hostname)),
                  config_path_(std::move(config_path)) {}

            ~CloudflareTunnel() override
            {
                stop();
            }

            const std::string &hostname() const noexcept override { return hostname_; }

            void start(TunnelListener listener) override
            {
                TunnelStatus snapshot;
                {
                    std::lock_guard lock(mutex_);
                    if (supervisor_.joinable())
                    {
                        return;
                    }
                    listener_ = std::move(listener);
                    stopping_ = false;
                    restarts_ = 0;
                    launch_locked();
                    snapshot = status_locked();
                    supervisor_ = std::thread([this]
                                              { supervise(); });
                }
                notify(snapshot);
            }

            void stop() override
            {
                Process *process = nullptr;
                {
                    std::lock_guard lock(mutex_);
                    if (stopping_ && !supervisor_.joinable())
                    {
                        return;
                    }
                    stopping_ = true;
                    process = process_.get();
                }
                stop_cv_.notify_all();
                if (process != nullptr)
                {
                    process->terminate(config_.shutdown_grace);
                }
                if (supervisor_.joinable())
                {
                    supervisor_.join();
                }
                std::lock_guard lock(mutex_);
                process_.reset();
                state_ = TunnelState::Unavailable;
                detail_ = "tunnel stopped";
            }

            TunnelStatus status() const override
            {
                std::lock_guard lock(mutex_);
                return status_locked();
            }

        private:
            std::vector<std::string> run_arguments() const
            {
                return {config_.binary, "--loglevel", "error", "--transport-loglevel", "error",
                        "tunnel", "--config", config_path_.string(), "run"};
            }

            void launch_locked()
            {
                try
                {
                    process_ = launcher_->spawn(run_arguments(), [](const std::string &line)
                                                { spdlog::warn("cloudflared: {}", line); });
                    state_ = TunnelState::Running;
                    detail_ = "cloudflared running";
                    spdlog::info("Tunnel process started for {}", hostname_);
                }
                catch (const std::exception &ex)
                {
                    process_.reset();
                    state_ = TunnelState::Unavailable;
                    detail_ = std::string("failed to start cloudflared: ") + ex.what();
                    spdlog::error("Tunnel {}: {}", hostname_, detail_);
                }
            }

            TunnelStatus status_locked() const
            {
                TunnelStatus status{};
                status.state = state_;
                status.provider = kProviderName;
                status.healthy = state_ == TunnelState::Running;
                if (status.healthy)
                {
                    status.hostname = hostname_;
                }
                status.detail = detail_;
                return status;
            }

            void notify(const TunnelStatus &status)
            {
                if (listener_)
                {
                    listener_(status);
                }
            }

            void supervise()
            {
                for (;;)
                {
                    Process *process = nullptr;
                    {
                        std::lock_guard lock(mutex_);
                        process = process_.get();
                    }
                    if (process != nullptr)
                    {
                        const int code = process->wait();
                        TunnelStatus snapshot;
                        {
                            std::lock_guard lock(mutex_);
                            if (stopping_)
                            {
                                return;
                            }
                            state_ = TunnelState::Unavailable;
                            detail_ = "cloudflared exited with code " + std::to_string(code);
                            snapshot = status_locked();
                        }
                        spdlog::warn("Tunnel {} went down: {}", hostname_, snapshot.detail);
                        notify(snapshot);
                    }

                    TunnelStatus snapshot;
                    {
                        std::unique_lock lock(mutex_);
                        if (restarts_ >= config_.max_restarts)
                        {
                            spdlog::error("Tunnel {} gave up after {} restarts", hostname_, restarts_);
                            return;
                        }
                        ++restarts_;
                        if (stop_cv_.wait_for(lock, config_.restart_backoff, [this]
                                              { return stopping_; }))
                        {
                            return;
                        }
                        spdlog::info("Restarting tunnel {} (attempt {}/{})", hostname_, restarts_, config_.max_restarts);
                        launch_locked();
                        snapshot = status_locked();
                    }
                    notify(snapshot);
                }
            }

            std::shared_ptr<ProcessLauncher> launcher_;
            TunnelConfig config_;
            std::string hostname_;
            std::filesystem::path config_path_;

            mutable std::mutex mutex_;
            std::condition_variable stop_cv_;
            std::unique_ptr<Process> process_;
            TunnelListener listener_;
            TunnelState state_{TunnelState::Starting};
            std::string detail_{"starting"};
            unsigned restarts_{0};
            bool stopping_{false};
            std::thread supervisor_;
        };

    } // namespace

    bool is_valid_tunnel_identifier(std::string_view value) noexcept
    {
        if (value.size() != kCloudflareIdentifierLength)
        {
            return false;
        }
        for (const auto ch : value)
        {
            if (!((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')))
            {
                return false;
            }
        }
        return true;
    }

    CloudflareProvider::CloudflareProvider(std::shared_ptr<ProcessLauncher> launcher) : launcher_(std::move(launcher))
    {
        if (!launcher_)
        {
            throw std::invalid_argument("CloudflareProvider needs a process launcher");
        }
    }

    std::unique_ptr<TunnelManager> CloudflareProvider::ensure(Store &store, const TunnelConfig &config)
    {
        const auto version = launcher_->run({config.binary, "--version"}, kVersionTimeout);
        if (!version.success())
        {
            throw TunnelFailure(drcv::ErrorCode::DependencyMissing, kInstallGuide);
        }
        spdlog::debug("Using {}", http::trim(version.out));

        const std::string fact_key(kCloudflareHostnameFact);
        auto identifier = store.get_fact(fact_key);
        const bool reused = identifier && is_valid_tunnel_identifier(*identifier);
        if (identifier && !reused)
        {
            spdlog::warn("Ignoring malformed tunnel identifier '{}'", *identifier);
        }
        if (!reused)
        {
            identifier = crypto::random_identifier(kCloudflareIdentifierLength);
        }
        const auto hostname = *identifier + "." + config.domain_root;
        const auto tunnel_name = kTunnelPrefix + *identifier;

        const auto list_tunnels = [&]
        {
            const auto listing = launcher_->run({config.binary, "tunnel", "list"}, kCommandTimeout);
            if (!listing.success())
            {
                command_failed(listing, "cloudflared tunnel list");
            }
            return find_tunnel_uuid(listing.out, tunnel_name);
        };

        auto uuid = list_tunnels();
        if (!uuid)
        {
            spdlog::info("Creating tunnel {}", tunnel_name);
            const auto created = launcher_->run({config.binary, "tunnel", "create", tunnel_name}, kCommandTimeout);
            if (!created.success())
            {
                command_failed(created, "cloudflared tunnel create");
            }
            uuid = list_tunnels();
            if (!uuid)
            {
                throw TunnelFailure(drcv::ErrorCode::TunnelError, "Failed to obtain the UUID of tunnel " + tunnel_name);
            }
        }

        const auto routed =
            launcher_->run({config.binary, "tunnel", "route", "dns", tunnel_name, hostname}, kCommandTimeout);
        if (!routed.success())
        {
            const auto err = http::to_lower(routed.err);
            if (mentions_login(routed) || err.find("already exists") == std::string::npos)
            {
                command_failed(routed, "cloudflared tunnel route dns");
            }
        }

        const auto config_path = write_ingress_config(resolve_config_dir(config), *uuid, hostname, config.local_port);

        if (!reused)
        {
            store.set_fact(fact_key, *identifier);
        }
        spdlog::info("Tunnel {} ({}) routes {} to port {}", tunnel_name, *uuid, hostname, config.local_port);
        return std::make_unique<CloudflareTunnel>(launcher_, config, hostname, config_path);
    }

} // namespace drcv::server
