#include "broker_service.hpp"
#include "config.hpp"
#include "nats_connect.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <asio/detached.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>
#include <thread>

int main(int argc, char* argv[]) {
    cxxopts::Options options("pubsub_broker",
        "Topic-based publish/subscribe broker over NATS");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("a,address", "NATS server address (overrides config)", cxxopts::value<std::string>())
        ("p,port", "NATS server port (overrides config)", cxxopts::value<uint16_t>())
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    // Logger
    auto console = spdlog::stdout_color_mt("broker");

    // Load config; without a file every setting has its default
    pubsub::config cfg;
    if (result.count("config")) {
        try {
            cfg = pubsub::load_config(result["config"].as<std::string>());
        } catch (const std::exception& e) {
            console->error("Failed to load config: {}", e.what());
            return 1;
        }
    }

    // CLI overrides
    if (result.count("address")) cfg.nats_address = result["address"].as<std::string>();
    if (result.count("port"))    cfg.nats_port = result["port"].as<uint16_t>();
    if (result.count("verbose")) cfg.log_level = "debug";

    spdlog::set_level(pubsub::log_level_of(cfg.log_level));

    unsigned int effective_workers = cfg.worker_threads > 0
        ? cfg.worker_threads
        : std::thread::hardware_concurrency();
    if (effective_workers == 0) effective_workers = 1;

    console->info("pubsub_broker starting");
    console->info("  server: {}:{}", cfg.nats_address, cfg.nats_port);
    console->info("  subjects: subscribe={} unsubscribe={} publish={}",
                 cfg.subscribe_subject, cfg.unsubscribe_subject, cfg.publish_subject);
    console->info("  worker threads: {}", effective_workers);
    if (cfg.lease_bucket.empty()) {
        console->info("  lease bucket: (disabled)");
    } else {
        console->info("  lease bucket: {} (TTL={}s, client refresh={}s)",
                     cfg.lease_bucket, cfg.lease_ttl_seconds, cfg.lease_refresh_seconds);
    }

    // Single-threaded io_context (NATS I/O + reply coroutines)
    asio::io_context ioc(1);

    // Graceful shutdown
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) {
        console->info("Shutting down...");
        ioc.stop();
    });

    auto service = std::make_shared<pubsub::broker_service>(ioc, cfg, console);

    auto conn = pubsub::start_connection(ioc, cfg, console);

    // Start the service once connected
    asio::co_spawn(ioc,
        [service, c = conn]() mutable -> asio::awaitable<void> {
            asio::steady_timer timer(co_await asio::this_coro::executor);
            while (!c->is_connected()) {
                timer.expires_after(std::chrono::milliseconds(100));
                co_await timer.async_wait(asio::use_awaitable);
            }
            co_await service->start(c);
        },
        asio::detached
    );

    ioc.run();

    // Shutdown ordering:
    // 1. Stop workers and close every subscription
    service->stop();

    // 2. Flush replies and end-of-stream frames queued by the shutdown
    ioc.restart();
    ioc.run_for(std::chrono::seconds(1));

    console->info("pubsub_broker stopped");
    return 0;
}
