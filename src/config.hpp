#pragma once

#include <spdlog/common.h>
#include <string>
#include <cstdint>

namespace YAML { class Node; }

namespace pubsub {

struct config {
    // NATS connection
    std::string nats_address = "127.0.0.1";
    uint16_t nats_port = 4222;
    std::string tls_cert;
    std::string tls_key;
    std::string tls_ca;

    // RPC surface - one subject per operation, request/reply
    std::string subscribe_subject = "pubsub.subscribe";
    std::string unsubscribe_subject = "pubsub.unsubscribe";
    std::string publish_subject = "pubsub.publish";

    // Clients listen for message frames on <deliver_prefix>.<subscriber>.<n>
    std::string deliver_prefix = "pubsub.deliver";

    // Subscriber liveness via NATS KV; empty bucket disables it
    std::string lease_bucket = "pubsub-leases";
    uint32_t lease_refresh_seconds = 10;
    // max_age of the KV bucket; set when the bucket is created. A lease
    // outlives one missed refresh only if this exceeds lease_refresh_seconds.
    uint32_t lease_ttl_seconds = 30;

    // Transport bound on one stream write; the core sets no timeout
    uint32_t delivery_timeout_ms = 5000;

    // Client request/reply timeout
    uint32_t request_timeout_ms = 5000;

    // Operational
    int stats_interval_seconds = 10;
    std::string log_level = "info";

    // Worker threads for control requests (0 = hardware_concurrency)
    unsigned int worker_threads = 0;
};

// spdlog level for a validated `log_level` value.
spdlog::level::level_enum log_level_of(const std::string& level);

// Parse config from YAML file. Throws on error.
config load_config(const std::string& path);

// Parse config from an already loaded YAML document. Throws on error.
config parse_config(const YAML::Node& root);

} // namespace pubsub
