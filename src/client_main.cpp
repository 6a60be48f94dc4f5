#include "client.hpp"
#include "config.hpp"
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop = true;
}

int run_publish(const pubsub::config& cfg, const std::string& topic, const std::string& payload,
                std::shared_ptr<spdlog::logger> log) {
    pubsub::publisher pub(cfg, log);
    if (!pub.connect()) return 1;

    bool ok = pub.publish(topic, std::span<const char>(payload.data(), payload.size()));
    std::cout << (ok ? "delivered" : "delivery failed") << std::endl;
    pub.close();
    return ok ? 0 : 2;
}

int run_subscribe(const pubsub::config& cfg, const std::vector<std::string>& topics,
                  std::size_t count, std::shared_ptr<spdlog::logger> log) {
    pubsub::consumer con(cfg, log);
    if (!con.connect()) return 1;

    for (const auto& topic : topics) {
        if (!con.subscribe(topic)) {
            log->error("Failed to subscribe to '{}'", topic);
            return 1;
        }
    }
    log->info("Subscriber {} listening on {} topic(s)", con.id(), topics.size());

    std::size_t printed = 0;
    while (!g_stop && (count == 0 || printed < count)) {
        con.wait_for_messages(printed + 1, std::chrono::milliseconds(200));

        auto received = con.messages();
        for (; printed < received.size() && (count == 0 || printed < count); ++printed) {
            const auto& msg = received[printed];
            std::cout << msg.topic << ": "
                      << std::string(msg.payload.begin(), msg.payload.end()) << std::endl;
        }
    }

    con.close();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("pubsub_client",
        "Publish to or subscribe on a pubsub_broker");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("a,address", "NATS server address (overrides config)", cxxopts::value<std::string>())
        ("p,port", "NATS server port (overrides config)", cxxopts::value<uint16_t>())
        ("n,count", "Exit after this many messages (subscribe, 0 = run until signalled)",
            cxxopts::value<std::size_t>()->default_value("0"))
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help")
        ("command", "publish | subscribe", cxxopts::value<std::string>())
        ("args", "publish: <topic> <payload>; subscribe: <topic>...",
            cxxopts::value<std::vector<std::string>>());

    options.parse_positional({"command", "args"});
    options.positional_help("<publish|subscribe> <args>...");

    auto result = options.parse(argc, argv);

    if (result.count("help") || !result.count("command")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    auto console = spdlog::stdout_color_mt("client");

    pubsub::config cfg;
    if (result.count("config")) {
        try {
            cfg = pubsub::load_config(result["config"].as<std::string>());
        } catch (const std::exception& e) {
            console->error("Failed to load config: {}", e.what());
            return 1;
        }
    }

    if (result.count("address")) cfg.nats_address = result["address"].as<std::string>();
    if (result.count("port"))    cfg.nats_port = result["port"].as<uint16_t>();
    // Quiet by default so received messages stay readable
    if (result.count("verbose"))     spdlog::set_level(spdlog::level::debug);
    else if (result.count("config")) spdlog::set_level(pubsub::log_level_of(cfg.log_level));
    else                             spdlog::set_level(spdlog::level::warn);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    auto command = result["command"].as<std::string>();
    std::vector<std::string> args;
    if (result.count("args")) args = result["args"].as<std::vector<std::string>>();

    if (command == "publish") {
        if (args.size() != 2) {
            console->error("usage: pubsub_client publish <topic> <payload>");
            return 1;
        }
        return run_publish(cfg, args[0], args[1], console);
    }

    if (command == "subscribe") {
        if (args.empty()) {
            console->error("usage: pubsub_client subscribe <topic>...");
            return 1;
        }
        return run_subscribe(cfg, args, result["count"].as<std::size_t>(), console);
    }

    console->error("Unknown command '{}'", command);
    return 1;
}
