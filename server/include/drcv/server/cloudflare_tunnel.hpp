#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "drcv/server/tunnel.hpp"

namespace drcv::server
{

    // Fact holding the short identifier that names the tunnel and its public hostname.
    inline constexpr std::string_view kCloudflareHostnameFact = "tunnel:hostname:cloudflare";
    inline constexpr std::size_t kCloudflareIdentifierLength = 6;

    /**
     * Publishes the upload listener through a named Cloudflare tunnel driven by the
     * `cloudflared` CLI. The identifier is persisted so restarts come back under the same
     * hostname.
     */
    class CloudflareProvider : public TunnelProvider
    {
    public:
        explicit CloudflareProvider(std::shared_ptr<ProcessLauncher> launcher);

        std::string_view name() const noexcept override { return "cloudflare"; }

        std::unique_ptr<TunnelManager> ensure(Store &store, const TunnelConfig &config) override;

    private:
        std::shared_ptr<ProcessLauncher> launcher_;
    };

    bool is_valid_tunnel_identifier(std::string_view value) noexcept;

} // namespace drcv::server
