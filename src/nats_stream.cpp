#include "nats_stream.hpp"
#include "codec.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_future.hpp>
#include <optional>
#include <span>

namespace pubsub {

nats_subscriber_stream::nats_subscriber_stream(asio::io_context& ioc,
                                               nats_asio::iconnection_sptr conn,
                                               std::string deliver_subject,
                                               std::chrono::milliseconds write_timeout,
                                               std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_conn(std::move(conn)),
      m_deliver_subject(std::move(deliver_subject)),
      m_write_timeout(write_timeout), m_log(std::move(log))
{}

bool nats_subscriber_stream::write(const message& msg) {
    // A stopped I/O loop never completes the publish
    if (m_ioc.stopped() || !is_active()) return false;

    auto frame = encode(msg);

    auto done = asio::co_spawn(m_ioc,
        [conn = m_conn, subject = m_deliver_subject,
         frame = std::move(frame)]() -> asio::awaitable<nats_asio::status> {
            co_return co_await conn->publish(
                subject, std::span<const char>(frame.data(), frame.size()), std::nullopt);
        },
        asio::use_future);

    switch (wait_on_io(done, m_ioc, m_write_timeout)) {
    case io_wait_result::ready:
        break;
    case io_wait_result::io_stopped:
        m_log->debug("Write to '{}' abandoned, I/O loop stopped", m_deliver_subject);
        return false;
    case io_wait_result::timed_out:
        m_log->warn("Write to '{}' timed out after {}ms", m_deliver_subject,
                   m_write_timeout.count());
        return false;
    }

    auto s = done.get();
    if (s.failed()) {
        m_log->warn("Write to '{}' failed: {}", m_deliver_subject, s.error());
        return false;
    }
    return true;
}

bool nats_subscriber_stream::is_active() const {
    return m_conn && m_conn->is_connected();
}

void nats_subscriber_stream::end_stream(const std::string& topic) {
    if (!is_active()) return;

    asio::co_spawn(m_ioc,
        [conn = m_conn, subject = m_deliver_subject, log = m_log,
         frame = encode_end_of_stream(topic)]() -> asio::awaitable<void> {
            auto s = co_await conn->publish(
                subject, std::span<const char>(frame.data(), frame.size()), std::nullopt);
            if (s.failed()) {
                log->debug("Failed to send end of stream to '{}': {}", subject, s.error());
            }
        },
        asio::detached);
}

} // namespace pubsub
