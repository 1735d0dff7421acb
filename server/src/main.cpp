#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>

#include "drcv/server/config.hpp"
#include "drcv/server/server.hpp"
#include "drcv/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "drcv receiver " << drcv::version() << "\n"
                  << drcv::server::usage(program_name);
    }

    void configure_logging(const drcv::server::ServerConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), false));
        }
        auto logger = std::make_shared<spdlog::logger>("drcv", sinks.begin(), sinks.end());
        logger->set_level(config.log_level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::warn);
    }

} // namespace

int main(int argc, char *argv[])
{
    drcv::server::ParsedArguments parsed;
    try
    {
        parsed = drcv::server::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (parsed.show_help)
    {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try
    {
        configure_logging(parsed.config);
        spdlog::info("Starting drcv receiver {} on {}:{} (admin {}:{})", drcv::version(),
                     parsed.config.upload_address, parsed.config.upload_port, parsed.config.admin_address,
                     parsed.config.admin_port);

        drcv::server::Server server(std::move(parsed.config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
