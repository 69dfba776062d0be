#include "server.hpp"
#include "config.hpp"
#include "logger.hpp"

#include <print>
#include <cstdlib>
#include <optional>
#include <thread>
#include <vector>

int main(int argc, char** argv)
{
    std::optional<uint16_t> cli_port;
    if (argc > 1)
    {
        cli_port = Config::parse_port(argv[1]);
    }
    else if (const char* env_port = std::getenv("PORT"))
    {
        cli_port = Config::parse_port(env_port);
    }

    auto loaded = Config::load("bridge_config.json", cli_port);
    auto config = loaded ? std::move(*loaded) : Config::load_defaults(cli_port);

    auto log_cfg = config.logging();
    if (auto result = Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, log_cfg.enable_console);
        !result)
    {
        std::println(stderr, "Failed to initialize logger: {}", result.error());
        return 1;
    }
    if (!loaded)
    {
        LOG_WARN("{}; using defaults", loaded.error());
    }

    try
    {
        net::io_context ic;
        Server svr(ic, config);

        LOG_INFO("{} {} listening on {}:{}", library_name, library_version,
                 config.server().bind_address, svr.local_port());

        svr.start();

        size_t thread_count = config.io_thread_count();
        std::vector<std::jthread> threads;
        threads.reserve(thread_count - 1);

        for (size_t i = 1; i < thread_count; ++i)
        {
            threads.emplace_back([&ic] { ic.run(); });
        }

        ic.run();
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Fatal: {}", e.what());
        Logger::shutdown();
        return 1;
    }

    LOG_INFO("Server exiting...");
    Logger::shutdown();
    return 0;
}
