// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/config.hpp"
#include "server/game/game_manager.hpp"
#include "server/net/listener.hpp"
#include "server/net/metrics_http.hpp"
#include "server/session/broadcast_hub.hpp"
#include "server/session/sink_registry.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#ifndef BLOB_VERSION
#define BLOB_VERSION "dev"
#endif

namespace blob {
std::atomic_bool g_shutdown{false};

struct CliOptions
{
    std::string config_path{"config/server.yaml"};
    int port{-1};
    int tick_ms{-1};
    int duration_sec{0}; // 0 means run until signal
};

// Throws std::invalid_argument on an unknown flag or a bad number.
static CliOptions parse_cli(int argc, char **argv)
{
    CliOptions cli;
    auto number = [&](int &i, const std::string &flag) {
        if (i + 1 >= argc)
            throw std::invalid_argument(flag + " requires a value");
        int v = std::stoi(argv[++i]);
        if (v < 0)
            throw std::invalid_argument(flag + " must not be negative");
        return v;
    };
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port") {
            cli.port = number(i, a);
            if (cli.port > 65535)
                throw std::invalid_argument("--port out of range");
        } else if (a == "--tick-ms") {
            cli.tick_ms = number(i, a);
        } else if (a == "--duration") {
            cli.duration_sec = number(i, a);
        } else if (!a.empty() && a[0] != '-') {
            cli.config_path = a;
        } else {
            throw std::invalid_argument("unknown option " + a);
        }
    }
    return cli;
}
} // namespace blob

static void handle_signal(int)
{
    blob::g_shutdown.store(true);
}

int main(int argc, char **argv)
{
    blob::ServerConfig cfg;
    blob::CliOptions cli;
    try {
        cli = blob::parse_cli(argc, argv);
        cfg = blob::load_config(cli.config_path);
        if (cli.port >= 0)
            cfg.listen_port = static_cast<uint16_t>(cli.port);
        if (cli.tick_ms >= 0)
            cfg.tick_interval_ms = static_cast<uint32_t>(cli.tick_ms);
        blob::validate(cfg);
    } catch (const std::exception &ex) {
        blob::log::error("Failed to load config: {}", ex.what());
        blob::log::shutdown();
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // An explicit environment setting wins over the file.
    if (!cfg.log_level.empty() && std::getenv("BLOB_LOG_LEVEL") == nullptr)
        setenv("BLOB_LOG_LEVEL", cfg.log_level.c_str(), 1);
    if (cfg.log_json && std::getenv("BLOB_LOG_JSON") == nullptr)
        setenv("BLOB_LOG_JSON", "1", 1);
    blob::log::init();
    blob::log::info("blob server starting (version: {})", BLOB_VERSION);
    blob::log::info(
        "Config: port={} tick={}ms arena={}x{} food_floor={} seed={}",
        cfg.listen_port,
        cfg.tick_interval_ms,
        cfg.arena_width,
        cfg.arena_height,
        cfg.food_floor,
        cfg.fixed_seed);
    if (cli.duration_sec > 0)
        blob::log::info("CLI override: auto-shutdown after {} seconds", cli.duration_sec);

    auto scheduler = coro::default_executor::io_executor();
    auto sinks = std::make_shared<blob::session::SinkRegistry>();
    auto hub = std::make_shared<blob::session::BroadcastHub>(cfg.broadcast_backlog);
    auto manager = std::make_shared<blob::game::GameManager>(blob::world_config(cfg), sinks, hub);

    scheduler->spawn(manager->run(scheduler));
    scheduler->spawn(manager->run_ticker(scheduler, std::chrono::milliseconds(cfg.tick_interval_ms)));
    scheduler->spawn(blob::net::run_listener(
        scheduler,
        blob::net::ServerContext{.manager = manager, .sinks = sinks, .hub = hub},
        blob::net::ListenerOptions{
            .port = cfg.listen_port, .poll_timeout = std::chrono::milliseconds(cfg.connection_poll_ms)}));
    if (cfg.metrics_port != 0)
        scheduler->spawn(blob::net::run_metrics_endpoint(scheduler, cfg.metrics_port));

    auto run_start = std::chrono::steady_clock::now();
    auto last_metrics = run_start;
    while (!blob::g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (manager->stopped()) {
            blob::log::error("Simulation stopped; shutting down");
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (cli.duration_sec > 0 && now - run_start >= std::chrono::seconds(cli.duration_sec)) {
            blob::log::info("Duration reached ({}s); initiating shutdown", cli.duration_sec);
            break;
        }
        if (cfg.metrics_log_interval_sec > 0 && now - last_metrics >= std::chrono::seconds(cfg.metrics_log_interval_sec)) {
            last_metrics = now;
            blob::log::info("{}", blob::metrics::runtime_json("runtime"));
        }
    }
    if (blob::g_shutdown.load())
        blob::log::info("Signal received, shutting down...");
    manager->close();
    blob::log::info("{}", blob::metrics::runtime_json("runtime_final"));
    blob::log::info("Shutdown complete.");
    blob::log::shutdown();
    return 0;
}
