#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

#include <nlohmann/json.hpp>

#include "drcv/error_codes.hpp"
#include "drcv/server/config.hpp"

namespace drcv::server
{

    class Store;
    class EventBroadcaster;
    class ProcessLauncher;

    class TunnelFailure : public std::runtime_error
    {
    public:
        TunnelFailure(drcv::ErrorCode code, std::string message);

        drcv::ErrorCode code() const noexcept { return code_; }

    private:
        drcv::ErrorCode code_;
    };

    enum class TunnelState : std::uint8_t
    {
        Starting,
        Running,
        Unavailable
    };

    std::string_view to_string(TunnelState state) noexcept;

    struct TunnelStatus
    {
        TunnelState state{TunnelState::Unavailable};
        std::string provider;
        // Only set while the tunnel is healthy.
        std::optional<std::string> hostname;
        bool healthy{false};
        std::string detail;
    };

    void to_json(nlohmann::json &json, const TunnelStatus &status);

    using TunnelListener = std::function<void(const TunnelStatus &)>;

    // A registered tunnel whose external process can be started and supervised.
    class TunnelManager
    {
    public:
        virtual ~TunnelManager() = default;

        virtual const std::string &hostname() const noexcept = 0;

        // Launches the tunnel process. `listener` is told about every health transition.
        virtual void start(TunnelListener listener) = 0;

        virtual void stop() = 0;

        virtual TunnelStatus status() const = 0;
    };

    class TunnelProvider
    {
    public:
        virtual ~TunnelProvider() = default;

        virtual std::string_view name() const noexcept = 0;

        // Reuses or registers the public hostname. Throws TunnelFailure.
        virtual std::unique_ptr<TunnelManager> ensure(Store &store, const TunnelConfig &config) = 0;
    };

    // Throws TunnelFailure(TunnelError) for unknown names.
    std::unique_ptr<TunnelProvider> make_tunnel_provider(const std::string &name,
                                                         std::shared_ptr<ProcessLauncher> launcher);

    /**
     * Process-wide tunnel handle. Establishment runs on its own thread so a slow or failing
     * provider never delays the listeners; a failure leaves the service reporting "unavailable".
     */
    class TunnelService
    {
    public:
        // `provider` may be null for local-only operation.
        TunnelService(TunnelConfig config, Store &store, EventBroadcaster &events,
                      std::unique_ptr<TunnelProvider> provider);
        ~TunnelService();

        TunnelService(const TunnelService &) = delete;
        TunnelService &operator=(const TunnelService &) = delete;

        void start();
        void stop();

        // Blocks until establishment has finished. Used by tests and shutdown.
        void wait_established();

        TunnelStatus status() const;

        bool enabled() const noexcept { return provider_ != nullptr; }

    private:
        void establish();
        void fail(drcv::ErrorCode code, const std::string &message);
        void announce(const TunnelStatus &status);

        TunnelConfig config_;
        Store &store_;
        EventBroadcaster &events_;
        std::unique_ptr<TunnelProvider> provider_;

        mutable std::mutex mutex_;
        std::unique_ptr<TunnelManager> manager_;
        bool establishing_{false};
        bool stopping_{false};
        std::string failure_;
        std::thread worker_;
    };

} // namespace drcv::server
