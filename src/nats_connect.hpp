#pragma once

#include "config.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/io_context.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>

namespace pubsub {

nats_asio::connect_config make_connect_config(const config& cfg);

// nullopt unless a client certificate is configured.
std::optional<nats_asio::ssl_config> make_ssl_config(const config& cfg);

// Create and start a connection whose state changes are logged to `log`.
// The connection becomes usable once is_connected() reports true.
nats_asio::iconnection_sptr start_connection(asio::io_context& ioc, const config& cfg,
                                             std::shared_ptr<spdlog::logger> log);

} // namespace pubsub
