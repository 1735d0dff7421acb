#include "drcv/server/tunnel.hpp"

#include <array>

#include <spdlog/spdlog.h>

#include "drcv/http.hpp"
#include "drcv/server/cloudflare_tunnel.hpp"
#include "drcv/server/event_broadcaster.hpp"
#include "drcv/server/store.hpp"

namespace drcv::server
{

    TunnelFailure::TunnelFailure(drcv::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {
        struct TunnelStateMapping
        {
            TunnelState state;
            std::string_view label;
        };

        constexpr std::array<TunnelStateMapping, 3> kTunnelStates{{
            {TunnelState::Starting, "starting"},
            {TunnelState::Running, "running"},
            {TunnelState::Unavailable, "unavailable"},
        }};
    } // namespace

    std::string_view to_string(TunnelState state) noexcept
    {
        for (const auto &mapping : kTunnelStates)
        {
            if (mapping.state == state)
            {
                return mapping.label;
            }
        }
        return "unavailable";
    }

    void to_json(nlohmann::json &json, const TunnelStatus &status)
    {
        json = nlohmann::json{
            {"state", std::string(to_string(status.state))},
            {"provider", status.provider.empty() ? nlohmann::json(nullptr) : nlohmann::json(status.provider)},
            {"healthy", status.healthy},
            {"detail", status.detail},
        };
        if (status.healthy && status.hostname)
        {
            json["hostname"] = *status.hostname;
            json["url"] = "https://" + *status.hostname;
        }
        else
        {
            json["hostname"] = nullptr;
            json["url"] = nullptr;
        }
    }

    std::unique_ptr<TunnelProvider> make_tunnel_provider(const std::string &name,
                                                         std::shared_ptr<ProcessLauncher> launcher)
    {
        const auto normalized = http::to_lower(name);
        if (normalized == "cloudflare")
        {
            return std::make_unique<CloudflareProvider>(std::move(launcher));
        }
        throw TunnelFailure(drcv::ErrorCode::TunnelError, "Unknown tunnel provider: " + name);
    }

    TunnelService::TunnelService(TunnelConfig config, Store &store, EventBroadcaster &events,
                                 std::unique_ptr<TunnelProvider> provider)
        : config_(std::move(config)), store_(store), events_(events), provider_(std::move(provider)) {}

    TunnelService::~TunnelService()
    {
        stop();
    }

    void TunnelService::start()
    {
        if (!provider_)
        {
            spdlog::info("No tunnel configured; serving on the local network only");
            return;
        }
        {
            std::lock_guard lock(mutex_);
            if (establishing_ || manager_ || worker_.joinable())
            {
                return;
            }
            establishing_ = true;
            stopping_ = false;
            failure_.clear();
        }
        announce(status());
        spdlog::info("Establishing {} tunnel for port {}", provider_->name(), config_.local_port);
        worker_ = std::thread([this]
                              { establish(); });
    }

    void TunnelService::establish()
    {
        try
        {
            auto manager = provider_->ensure(store_, config_);
            {
                std::lock_guard lock(mutex_);
                if (stopping_)
                {
                    establishing_ = false;
                    return;
                }
            }
            spdlog::info("Tunnel ready: https://{}", manager->hostname());
            manager->start([this](const TunnelStatus &status)
                           { announce(status); });
            std::lock_guard lock(mutex_);
            manager_ = std::move(manager);
            establishing_ = false;
        }
        catch (const TunnelFailure &ex)
        {
            fail(ex.code(), ex.what());
        }
        catch (const StoreError &ex)
        {
            fail(ex.code(), ex.what());
        }
        catch (const std::exception &ex)
        {
            fail(drcv::ErrorCode::TunnelError, ex.what());
        }
    }

    void TunnelService::fail(drcv::ErrorCode code, const std::string &message)
    {
        spdlog::error("Tunnel unavailable ({}): {}", drcv::to_string(code), message);
        spdlog::warn("Continuing in local-only mode");
        {
            std::lock_guard lock(mutex_);
            establishing_ = false;
            failure_ = message;
        }
        announce(status());
    }

    void TunnelService::announce(const TunnelStatus &status)
    {
        events_.publish(EventType::TunnelStatus, status);
    }

    void TunnelService::wait_established()
    {
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    void TunnelService::stop()
    {
        {
            std::lock_guard lock(mutex_);
            stopping_ = true;
        }
        wait_established();
        std::unique_ptr<TunnelManager> manager;
        {
            std::lock_guard lock(mutex_);
            manager = std::move(manager_);
        }
        if (manager)
        {
            spdlog::info("Stopping tunnel {}", manager->hostname());
            manager->stop();
        }
    }

    TunnelStatus TunnelService::status() const
    {
        std::lock_guard lock(mutex_);
        if (manager_)
        {
            return manager_->status();
        }
        TunnelStatus status{};
        status.provider = config_.provider;
        if (establishing_)
        {
            status.state = TunnelState::Starting;
            status.detail = "establishing tunnel";
        }
        else if (!provider_)
        {
            status.detail = "tunnel disabled";
        }
        else
        {
            status.detail = failure_.empty() ? "tunnel stopped" : failure_;
        }
        return status;
    }

} // namespace drcv::server
