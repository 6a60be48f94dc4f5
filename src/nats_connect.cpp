#include "nats_connect.hpp"
#include <string_view>

namespace pubsub {

nats_asio::connect_config make_connect_config(const config& cfg) {
    nats_asio::connect_config nats_cfg;
    nats_cfg.address = cfg.nats_address;
    nats_cfg.port = cfg.nats_port;
    return nats_cfg;
}

std::optional<nats_asio::ssl_config> make_ssl_config(const config& cfg) {
    if (cfg.tls_cert.empty()) return std::nullopt;

    nats_asio::ssl_config sc;
    sc.cert = cfg.tls_cert;
    sc.key  = cfg.tls_key;
    sc.ca   = cfg.tls_ca;
    sc.verify = true;
    return sc;
}

nats_asio::iconnection_sptr start_connection(asio::io_context& ioc, const config& cfg,
                                             std::shared_ptr<spdlog::logger> log) {
    auto on_connected = [log](nats_asio::iconnection& /*c*/) -> asio::awaitable<void> {
        log->info("Connected to NATS");
        co_return;
    };

    auto on_disconnected = [log](nats_asio::iconnection& /*c*/) -> asio::awaitable<void> {
        log->warn("Disconnected from NATS");
        co_return;
    };

    auto on_error = [log](nats_asio::iconnection& /*c*/, std::string_view err) -> asio::awaitable<void> {
        log->error("NATS connection error: {}", err);
        co_return;
    };

    auto conn = nats_asio::create_connection(
        ioc, on_connected, on_disconnected, on_error, make_ssl_config(cfg));

    conn->start(make_connect_config(cfg));
    return conn;
}

} // namespace pubsub
