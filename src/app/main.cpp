/**
 * @file main.cpp
 * @brief chunkwave CLI: load the YAML run config, upload, print the summary uwu
 *
 * usage: `chunkwave [--log-level <debug|info|warn|error>] <config.yaml>`
 *
 * SIGINT / SIGTERM flip an atomic flag; a watcher thread turns that into a
 * stop request so workers wind down between requests instead of being torn
 * down mid-flight.
 */
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

#include "ckw/app/summary_printer.hpp"
#include "ckw/collect/introspect.hpp"
#include "ckw/common/log.hpp"
#include "ckw/common/timing.hpp"
#include "ckw/config/config.hpp"
#include "ckw/net/http_chunk_server.hpp"
#include "ckw/upload/pipeline.hpp"

namespace
{

constexpr std::string_view kComponent = "main";

std::atomic<bool> g_interrupted{false};

void on_signal(int /*signal*/)
{
    g_interrupted.store(true);
}

void install_signal_handlers()
{
    struct sigaction action = {};
    action.sa_handler       = on_signal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

struct CliOptions
{
    std::filesystem::path          config_path;
    std::optional<ckw::log::Level> log_level;
};

void print_usage(std::ostream &out)
{
    out << "usage: chunkwave [--log-level <debug|info|warn|error>] <config.yaml>\n";
}

[[nodiscard]] auto parse_args(int argc, char **argv) -> std::optional<CliOptions>
{
    CliOptions options{};
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        if (arg == "--log-level")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "--log-level needs a value\n";
                return std::nullopt;
            }
            options.log_level = ckw::log::parse_level(argv[++i]);
            if (!options.log_level)
            {
                std::cerr << "unknown log level '" << argv[i] << "'\n";
                return std::nullopt;
            }
        }
        else if (arg.starts_with("-"))
        {
            std::cerr << "unknown option '" << arg << "'\n";
            return std::nullopt;
        }
        else if (options.config_path.empty())
        {
            options.config_path = arg;
        }
        else
        {
            std::cerr << "only one config file is accepted\n";
            return std::nullopt;
        }
    }
    if (options.config_path.empty())
    {
        return std::nullopt;
    }
    return options;
}

} // namespace

int main(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        if (arg == "--help" || arg == "-h")
        {
            print_usage(std::cout);
            return EXIT_SUCCESS;
        }
    }

    const auto options = parse_args(argc, argv);
    if (!options)
    {
        print_usage(std::cerr);
        return ckw::app::kExitRunError;
    }

    const auto config = ckw::config::load_config_from_file(options->config_path);
    if (!config)
    {
        std::cerr << "config error: " << ckw::describe(config.error()) << '\n';
        return ckw::app::kExitRunError;
    }
    ckw::log::set_level(options->log_level.value_or(config->logging.level));

    install_signal_handlers();
    std::stop_source run_stop;
    std::jthread     watcher{[&run_stop](std::stop_token own)
                         {
                             while (!own.stop_requested())
                             {
                                 if (g_interrupted.load())
                                 {
                                     ckw::log::warn(kComponent, "interrupted, finishing in-flight requests");
                                     run_stop.request_stop();
                                     return;
                                 }
                                 std::this_thread::sleep_for(std::chrono::milliseconds{50});
                             }
                         }};

    ckw::net::HttpChunkServer server{ckw::net::HttpSettings::from_config(config->server)};
    const auto outcome = ckw::upload::run_upload(*config, server, ckw::collect::builtin_introspector(),
                                                 ckw::Timing::system(), run_stop.get_token());

    watcher.request_stop();
    watcher.join();

    if (!outcome)
    {
        std::cerr << "upload aborted: " << ckw::describe(outcome.error()) << '\n';
    }
    else
    {
        ckw::app::print_summary(*outcome, std::cout);
    }
    return ckw::app::exit_code(outcome, config->assembly.timeouts_are_failures);
}
