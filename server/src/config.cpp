#include "drcv/server/config.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include "drcv/http.hpp"

namespace drcv::server
{

    namespace
    {

        struct UnitMultiplier
        {
            std::string_view suffix;
            std::uint64_t multiplier;
        };

        constexpr std::array<UnitMultiplier, 13> kUnits{{
            {"", 1ULL},
            {"b", 1ULL},
            {"k", 1000ULL},
            {"kb", 1000ULL},
            {"mb", 1000ULL * 1000},
            {"gb", 1000ULL * 1000 * 1000},
            {"tb", 1000ULL * 1000 * 1000 * 1000},
            {"kib", 1ULL << 10},
            {"mib", 1ULL << 20},
            {"gib", 1ULL << 30},
            {"tib", 1ULL << 40},
            {"m", 1000ULL * 1000},
            {"g", 1000ULL * 1000 * 1000},
        }};

        std::string require_value(int &index, int argc, char *argv[], std::string_view option)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error("Missing value for " + std::string(option));
            }
            ++index;
            return std::string(argv[index]);
        }

        std::uint64_t parse_unsigned(const std::string &value, std::string_view option)
        {
            std::size_t consumed = 0;
            unsigned long long parsed = 0;
            try
            {
                parsed = std::stoull(value, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::runtime_error("Invalid value for " + std::string(option) + ": " + value);
            }
            if (consumed != value.size() || value.front() == '-')
            {
                throw std::runtime_error("Invalid value for " + std::string(option) + ": " + value);
            }
            return parsed;
        }

        std::uint16_t parse_port(const std::string &value, std::string_view option)
        {
            const auto port = parse_unsigned(value, option);
            if (port == 0 || port > std::numeric_limits<std::uint16_t>::max())
            {
                throw std::runtime_error("Port out of range for " + std::string(option) + ": " + value);
            }
            return static_cast<std::uint16_t>(port);
        }

        std::chrono::seconds parse_seconds(const std::string &value, std::string_view option)
        {
            return std::chrono::seconds(static_cast<std::int64_t>(parse_unsigned(value, option)));
        }

        std::uint64_t parse_size_option(const std::string &value, std::string_view option)
        {
            try
            {
                return parse_byte_size(value);
            }
            catch (const std::invalid_argument &ex)
            {
                throw std::runtime_error("Invalid value for " + std::string(option) + ": " + ex.what());
            }
        }

    } // namespace

    std::uint64_t parse_byte_size(std::string_view text)
    {
        const auto trimmed = http::trim(text);
        std::size_t split = 0;
        while (split < trimmed.size() &&
               (std::isdigit(static_cast<unsigned char>(trimmed[split])) || trimmed[split] == '.'))
        {
            ++split;
        }
        const auto number = std::string(trimmed.substr(0, split));
        const auto unit = http::to_lower(http::trim(trimmed.substr(split)));
        if (number.empty() || number.front() == '.')
        {
            throw std::invalid_argument("expected a size such as 4MiB, got '" + std::string(text) + "'");
        }

        const UnitMultiplier *match = nullptr;
        for (const auto &entry : kUnits)
        {
            if (entry.suffix == unit)
            {
                match = &entry;
                break;
            }
        }
        if (match == nullptr)
        {
            throw std::invalid_argument("unknown size unit '" + unit + "'");
        }

        long double value = 0;
        std::istringstream stream(number);
        stream >> value;
        if (!stream || !stream.eof())
        {
            throw std::invalid_argument("malformed size '" + std::string(text) + "'");
        }
        const long double bytes = std::floor(value * static_cast<long double>(match->multiplier));
        if (bytes < 1 || bytes > static_cast<long double>(std::numeric_limits<std::uint64_t>::max()))
        {
            throw std::invalid_argument("size out of range '" + std::string(text) + "'");
        }
        return static_cast<std::uint64_t>(bytes);
    }

    std::string usage(std::string_view program_name)
    {
        std::ostringstream oss;
        oss << "Usage: " << program_name
            << " [--upload-address <ADDR>] [--upload-port <PORT>] [--admin-port <PORT>]\n"
               "       [--upload-dir <DIR>] [--database <FILE>] [--chunk-size <SIZE>] [--max-file-size <SIZE>]\n"
               "       [--threads <N>] [--client-timeout <sec>] [--upload-timeout <sec>] [--sweep-interval <sec>]\n"
               "       [--retention <sec>] [--page-size <N>] [--event-queue <N>]\n"
               "       [--tunnel <provider>] [--cf-domain <DOMAIN>] [--tunnel-restarts <N>]\n"
               "       [--trust-proxy | --no-trust-proxy] [--log <FILE>] [--log-level <LEVEL>]\n";
        return oss.str();
    }

    ParsedArguments parse_arguments(int argc, char *argv[])
    {
        ParsedArguments parsed;
        auto &config = parsed.config;

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--upload-address")
            {
                config.upload_address = require_value(i, argc, argv, arg);
            }
            else if (arg == "--upload-port")
            {
                config.upload_port = parse_port(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--admin-port")
            {
                config.admin_port = parse_port(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--upload-dir")
            {
                config.upload_dir = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--database")
            {
                config.database_path = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = parse_size_option(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--max-file-size")
            {
                config.max_file_size = parse_size_option(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(parse_unsigned(require_value(i, argc, argv, arg), arg));
            }
            else if (arg == "--client-timeout")
            {
                config.client_stale_timeout = parse_seconds(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--upload-timeout")
            {
                config.upload_stale_timeout = parse_seconds(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--sweep-interval")
            {
                config.sweep_interval = parse_seconds(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--retention")
            {
                config.retention = parse_seconds(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--page-size")
            {
                config.page_size = static_cast<std::size_t>(parse_unsigned(require_value(i, argc, argv, arg), arg));
            }
            else if (arg == "--event-queue")
            {
                config.event_queue_capacity =
                    static_cast<std::size_t>(parse_unsigned(require_value(i, argc, argv, arg), arg));
            }
            else if (arg == "--tunnel")
            {
                config.tunnel.provider = http::to_lower(require_value(i, argc, argv, arg));
            }
            else if (arg == "--cf-domain")
            {
                config.tunnel.domain_root = require_value(i, argc, argv, arg);
            }
            else if (arg == "--tunnel-restarts")
            {
                config.tunnel.max_restarts =
                    static_cast<unsigned>(parse_unsigned(require_value(i, argc, argv, arg), arg));
            }
            else if (arg == "--trust-proxy")
            {
                config.trust_proxy_headers = true;
            }
            else if (arg == "--no-trust-proxy")
            {
                config.trust_proxy_headers = false;
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--log-level")
            {
                const auto value = require_value(i, argc, argv, arg);
                const auto level = spdlog::level::from_str(value);
                if (level == spdlog::level::off && value != "off")
                {
                    throw std::runtime_error("Unknown log level: " + value);
                }
                config.log_level = level;
            }
            else if (arg == "--help" || arg == "-h")
            {
                parsed.show_help = true;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (config.sweep_interval.count() == 0)
        {
            throw std::runtime_error("--sweep-interval must be at least one second");
        }
        if (config.page_size == 0)
        {
            throw std::runtime_error("--page-size must be positive");
        }
        if (config.event_queue_capacity == 0)
        {
            throw std::runtime_error("--event-queue must be positive");
        }
        if (config.chunk_size > config.max_file_size)
        {
            throw std::runtime_error("--chunk-size cannot exceed --max-file-size");
        }
        config.tunnel.local_port = config.upload_port;
        return parsed;
    }

} // namespace drcv::server
