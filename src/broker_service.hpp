#pragma once

#include "broker.hpp"
#include "config.hpp"
#include "lease_manager.hpp"
#include "worker_pool.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pubsub {

// Binds the broker's RPC surface onto NATS request/reply subjects.
//
// NATS callbacks run on the single I/O thread and only enqueue work;
// every broker call runs on the worker pool, because a fan-out holds the
// coarse lock while waiting for the I/O thread to complete stream writes.
class broker_service {
public:
    broker_service(asio::io_context& ioc, const config& cfg,
                   std::shared_ptr<spdlog::logger> log);

    // Called once the NATS connection is established.
    // Starts workers, subscribes the control subjects and the lease watcher.
    asio::awaitable<void> start(nats_asio::iconnection_sptr conn);

    // Close every subscription and stop the workers. Called during
    // shutdown before the final ioc flush.
    void stop();

private:
    asio::awaitable<bool> listen(const std::string& subject, request_kind kind);

    // Callback: control request on one of the RPC subjects
    asio::awaitable<void> on_request(
        request_kind kind,
        std::optional<std::string_view> reply_to,
        std::span<const char> payload);

    // Worker thread entry point
    bool handle(request_job& job);

    bool handle_subscribe(const request_job& job);
    bool handle_unsubscribe(const request_job& job);
    bool handle_publish(const request_job& job);

    // Fire-and-forget reply, safe from any thread.
    void reply(const std::string& reply_to, std::vector<char> bytes);

    // Periodic stats logging
    asio::awaitable<void> stats_loop();

    asio::io_context& m_ioc;
    config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;

    nats_asio::iconnection_sptr m_conn;
    broker m_broker;
    worker_pool m_worker_pool;
    std::unique_ptr<lease_manager> m_lease_mgr;
};

} // namespace pubsub
