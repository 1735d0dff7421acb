#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace drcv::server
{

    struct TunnelConfig
    {
        // Empty provider means local-only operation.
        std::string provider;
        std::string domain_root{"drcv.app"};
        std::uint16_t local_port{8080};
        std::string binary{"cloudflared"};
        std::optional<std::filesystem::path> config_dir;
        unsigned max_restarts{3};
        std::chrono::milliseconds restart_backoff{std::chrono::seconds{2}};
        std::chrono::milliseconds shutdown_grace{std::chrono::seconds{3}};
    };

    struct ServerConfig
    {
        std::string upload_address{"0.0.0.0"};
        std::uint16_t upload_port{8080};
        std::string admin_address{"127.0.0.1"};
        std::uint16_t admin_port{8081};
        std::filesystem::path upload_dir{"./uploads"};
        std::filesystem::path database_path{"./drcv.db"};
        std::uint64_t chunk_size{4ULL * 1024 * 1024};
        std::uint64_t max_file_size{100ULL * 1024 * 1024 * 1024};
        std::size_t worker_threads{0};
        std::chrono::seconds client_stale_timeout{120};
        std::chrono::seconds upload_stale_timeout{60};
        std::chrono::seconds sweep_interval{10};
        std::chrono::seconds retention{0};
        std::size_t page_size{100};
        std::size_t event_queue_capacity{256};
        bool trust_proxy_headers{true};
        TunnelConfig tunnel;
        std::optional<std::filesystem::path> log_file;
        spdlog::level::level_enum log_level{spdlog::level::info};
    };

    // Accepts "1048576", "512KB", "4MiB", "100GiB"; throws std::invalid_argument otherwise.
    std::uint64_t parse_byte_size(std::string_view text);

    std::string usage(std::string_view program_name);

    struct ParsedArguments
    {
        ServerConfig config;
        bool show_help{false};
    };

    // Throws std::runtime_error with a readable message on bad input.
    ParsedArguments parse_arguments(int argc, char *argv[]);

} // namespace drcv::server
