#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace pubsub {

static bool valid_log_level(const std::string& level) {
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}

config parse_config(const YAML::Node& root) {
    config cfg;

    // An empty document is a valid all-defaults config
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("config: top level must be a map");

    // NATS connection
    if (auto n = root["nats_address"]) cfg.nats_address = n.as<std::string>();
    if (auto n = root["nats_port"])    cfg.nats_port = n.as<uint16_t>();
    if (auto n = root["tls_cert"])     cfg.tls_cert = n.as<std::string>();
    if (auto n = root["tls_key"])      cfg.tls_key  = n.as<std::string>();
    if (auto n = root["tls_ca"])       cfg.tls_ca   = n.as<std::string>();

    // Subjects
    if (auto n = root["subscribe_subject"])   cfg.subscribe_subject   = n.as<std::string>();
    if (auto n = root["unsubscribe_subject"]) cfg.unsubscribe_subject = n.as<std::string>();
    if (auto n = root["publish_subject"])     cfg.publish_subject     = n.as<std::string>();
    if (auto n = root["deliver_prefix"])      cfg.deliver_prefix      = n.as<std::string>();

    if (cfg.subscribe_subject.empty() || cfg.unsubscribe_subject.empty() ||
        cfg.publish_subject.empty() || cfg.deliver_prefix.empty()) {
        throw std::runtime_error("config: subjects must not be empty");
    }

    // Leases
    if (auto n = root["lease_bucket"])          cfg.lease_bucket = n.as<std::string>();
    if (auto n = root["lease_refresh_seconds"]) cfg.lease_refresh_seconds = n.as<uint32_t>();
    if (auto n = root["lease_ttl_seconds"])     cfg.lease_ttl_seconds = n.as<uint32_t>();

    if (!cfg.lease_bucket.empty() && cfg.lease_refresh_seconds > 0 &&
        cfg.lease_ttl_seconds <= cfg.lease_refresh_seconds) {
        throw std::runtime_error("config: 'lease_ttl_seconds' must exceed 'lease_refresh_seconds'");
    }

    // Timeouts
    if (auto n = root["delivery_timeout_ms"]) cfg.delivery_timeout_ms = n.as<uint32_t>();
    if (auto n = root["request_timeout_ms"])  cfg.request_timeout_ms = n.as<uint32_t>();

    if (cfg.delivery_timeout_ms == 0 || cfg.request_timeout_ms == 0) {
        throw std::runtime_error("config: timeouts must be positive");
    }

    // Operational
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (auto n = root["log_level"])              cfg.log_level = n.as<std::string>();
    if (auto n = root["worker_threads"])         cfg.worker_threads = n.as<unsigned int>();

    if (cfg.stats_interval_seconds <= 0) {
        throw std::runtime_error("config: 'stats_interval_seconds' must be positive");
    }
    if (!valid_log_level(cfg.log_level)) {
        throw std::runtime_error("config: invalid 'log_level': " + cfg.log_level);
    }

    return cfg;
}

spdlog::level::level_enum log_level_of(const std::string& level) {
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn")  return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}

config load_config(const std::string& path) {
    return parse_config(YAML::LoadFile(path));
}

} // namespace pubsub
