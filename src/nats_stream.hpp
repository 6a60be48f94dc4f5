#pragma once

#include "subscriber_stream.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/io_context.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <future>
#include <memory>
#include <string>

namespace pubsub {

enum class io_wait_result { ready, io_stopped, timed_out };

// Wait for a result the I/O thread produces. Gives up early once the
// I/O context is stopped, since nothing will complete the future then.
template <typename T>
io_wait_result wait_on_io(std::future<T>& done, const asio::io_context& ioc,
                          std::chrono::milliseconds timeout,
                          std::chrono::milliseconds poll = std::chrono::milliseconds(50)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (done.wait_for(poll) != std::future_status::ready) {
        if (ioc.stopped()) return io_wait_result::io_stopped;
        if (std::chrono::steady_clock::now() >= deadline) return io_wait_result::timed_out;
    }
    return io_wait_result::ready;
}

// Subscriber stream over a NATS deliver subject.
//
// write() is called from worker threads: it hands the publish to the I/O
// thread and blocks until the connection reports a status. Never call it
// on the I/O thread itself.
class nats_subscriber_stream : public subscriber_stream {
public:
    nats_subscriber_stream(asio::io_context& ioc,
                           nats_asio::iconnection_sptr conn,
                           std::string deliver_subject,
                           std::chrono::milliseconds write_timeout,
                           std::shared_ptr<spdlog::logger> log);

    bool write(const message& msg) override;
    bool is_active() const override;

    // Tell the client the subscription is over. Fire-and-forget,
    // safe from any thread.
    void end_stream(const std::string& topic);

    const std::string& deliver_subject() const { return m_deliver_subject; }

private:
    asio::io_context& m_ioc;
    nats_asio::iconnection_sptr m_conn;
    std::string m_deliver_subject;
    std::chrono::milliseconds m_write_timeout;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace pubsub
