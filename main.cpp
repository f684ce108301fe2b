#include <exception>
#include <iostream>
#include <thread>
#include <utility>

#include <signal.h>

#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "misc.hpp"
#include "recursord_daemon.hpp"

std::shared_ptr<spdlog::logger>   g_log;
std::unique_ptr<recursord_daemon> g_daemon;

static spdlog::level::level_enum
log_level_from_string(const std::string &p_level)
{
    const spdlog::level::level_enum l_level = spdlog::level::from_str(p_level);

    // from_str maps anything unknown to off
    if (l_level == spdlog::level::off && p_level != "off") {
        throw std::runtime_error("unknown log level " + p_level);
    }

    return l_level;
}

int
main(const int p_argc, const char** p_argv)
{
    g_log = spdlog::stdout_color_mt("console");
    g_log->set_level(spdlog::level::info);

    try {
        boost::program_options::options_description
            l_description("recursord allowed options");

        l_description.add_options()
            ( "help,h",    "produce help message" )
            ( "version,v", "print version"        )
            (
                "config",
                boost::program_options::value<std::string>(),
                "json configuration file"
            )
            (
                "listen-address",
                boost::program_options::value<std::string>(),
                "address to answer queries on"
            )
            (
                "port",
                boost::program_options::value<uint16_t>(),
                "port to answer queries on"
            )
            (
                "root-hints",
                boost::program_options::value<std::string>(),
                "json file listing the root servers"
            )
            (
                "log-level",
                boost::program_options::value<std::string>(),
                "trace, debug, info, warn, error, critical or off"
            )
            (
                "workers",
                boost::program_options::value<size_t>(),
                "number of resolver threads"
            );

        boost::program_options::variables_map l_map;

        boost::program_options::store(
            boost::program_options::parse_command_line(
                p_argc,
                p_argv,
                l_description
            ),
            l_map
        );

        boost::program_options::notify(l_map);

        if (l_map.count("help")) {
            std::cout << l_description;

            return 0;
        }

        if (l_map.count("version")) {
            std::cout << "0.1.0" << std::endl;

            return 0;
        }

        recursord_config_t l_config = l_map.count("config")
            ? load_config(l_map["config"].as<std::string>())
            : recursord_config_t();

        if (l_map.count("listen-address")) {
            l_config.m_listen_address = address_from_string(
                l_map["listen-address"].as<std::string>(),
                "listen"
            );
        }

        if (l_map.count("port")) {
            l_config.m_port = l_map["port"].as<uint16_t>();
        }

        if (l_map.count("root-hints")) {
            l_config.m_root_hints_path = l_map["root-hints"].as<std::string>();
        }

        if (l_map.count("log-level")) {
            l_config.m_log_level = l_map["log-level"].as<std::string>();
        }

        if (l_map.count("workers")) {
            l_config.m_workers = l_map["workers"].as<size_t>();

            if (l_config.m_workers == 0) {
                throw std::runtime_error("workers must be positive");
            }
        }

        g_log->set_level(log_level_from_string(l_config.m_log_level));

        std::vector<root_hint_t> l_root_hints =
            load_root_hints(l_config.m_root_hints_path);

        g_log->info(
            "loaded {} root hints from {}",
            l_root_hints.size(),
            l_config.m_root_hints_path.value_or("built in table")
        );

        signal(SIGPIPE, SIG_IGN);

        g_daemon = std::make_unique<recursord_daemon>(
            g_log,
            l_config,
            std::move(l_root_hints)
        );

        boost::asio::io_service l_signal_service;
        boost::asio::signal_set l_signals(l_signal_service, SIGINT, SIGTERM);

        l_signals.async_wait(
            [](const boost::system::error_code p_error, const int p_signal) {
                if (p_error) {
                    return;
                }

                g_log->info("signal_stop {}", p_signal);

                g_daemon->shutdown();
            }
        );

        std::thread l_signal_thread([&l_signal_service]() {
            l_signal_service.run();
        });

        g_daemon->await_shutdown();

        l_signal_service.stop();
        l_signal_thread.join();

        g_daemon.reset();
    } catch (const std::exception &p_error) {
        g_log->error("main() exception: {}", p_error.what());

        return 1;
    }

    return 0;
}
