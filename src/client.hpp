#pragma once

#include "config.hpp"
#include "message.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/awaitable.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace pubsub {

// Wait for the reply to one request. nullopt when it does not arrive in
// time or when the connection dropped the request while closing.
std::optional<std::vector<char>> take_reply(std::future<std::vector<char>>& reply,
                                            std::chrono::milliseconds timeout,
                                            const std::string& subject,
                                            spdlog::logger& log);

// A NATS connection with its own I/O thread and a private reply inbox,
// exposing blocking calls to application threads. Must not be used
// from inside its own handlers.
class client_connection {
public:
    using message_handler = std::function<void(std::span<const char>)>;

    client_connection(const config& cfg, std::shared_ptr<spdlog::logger> log);
    ~client_connection();

    client_connection(const client_connection&) = delete;
    client_connection& operator=(const client_connection&) = delete;

    // Start the I/O thread, wait for the server and open the reply inbox.
    bool connect(std::chrono::milliseconds timeout);

    bool connected() const;

    // Publish and wait for the connection's status.
    bool publish(const std::string& subject, std::span<const char> payload);

    // Publish with the inbox as reply subject and wait for one reply.
    // nullopt on transport failure or after request_timeout_ms.
    std::optional<std::vector<char>> request(const std::string& subject,
                                             std::span<const char> payload);

    // Handler runs on the I/O thread. Returns nullptr on failure.
    nats_asio::isubscription_sptr subscribe(const std::string& subject, message_handler fn);

    bool unsubscribe(const nats_asio::isubscription_sptr& sub);

    // Stop the I/O thread and drop the connection. Idempotent.
    void close();

    asio::io_context& io() { return m_ioc; }
    const nats_asio::iconnection_sptr& connection() const { return m_conn; }

private:
    void on_reply(std::string_view subject, std::span<const char> payload);

    // Run `op` on the I/O thread and wait up to the request timeout.
    template <typename T, typename Op>
    std::optional<T> run(Op&& op);

    config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;
    std::chrono::milliseconds m_timeout;

    asio::io_context m_ioc;
    asio::executor_work_guard<asio::io_context::executor_type> m_work;
    std::thread m_thread;
    nats_asio::iconnection_sptr m_conn;

    // Reply subjects are <m_inbox>.<token>
    std::string m_inbox;
    std::mutex m_pending_mutex;
    uint64_t m_next_token = 1;
    std::unordered_map<std::string, std::promise<std::vector<char>>> m_pending;
};

// Subscribes to topics and buffers every message it receives.
class consumer {
public:
    // Picks a random subscriber id.
    consumer(const config& cfg, std::shared_ptr<spdlog::logger> log);
    consumer(const config& cfg, subscriber_id id, std::shared_ptr<spdlog::logger> log);
    ~consumer();

    bool connect(std::chrono::milliseconds timeout = std::chrono::seconds(5));

    subscriber_id id() const { return m_id; }

    // Idempotent: true without a new request if the topic's stream is
    // still open. False if the broker rejected or did not answer.
    bool subscribe(const std::string& topic);

    // Cancel the local stream, then ask the broker to drop the entry.
    // Returns the broker's answer (false if it was not registered).
    bool unsubscribe(const std::string& topic);

    // Unsubscribe everything and release the connection.
    void close();

    // Copy of everything received so far, in arrival order.
    std::vector<message> messages() const;

    bool wait_for_messages(std::size_t count, std::chrono::milliseconds timeout) const;

    std::vector<std::string> subscribed_topics() const;

private:
    struct subscription {
        std::string deliver_subject;
        nats_asio::isubscription_sptr stream;
        // Set once the receive handler must stop appending
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Receive handler for one topic, on the I/O thread.
    void receive(const std::shared_ptr<std::atomic<bool>>& done, std::span<const char> frame);

    void start_lease_refresh();
    asio::awaitable<void> lease_loop();

    config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;
    subscriber_id m_id;
    client_connection m_conn;

    // Held across broker round trips; never taken on the I/O thread.
    mutable std::mutex m_subs_mutex;
    std::unordered_map<std::string, subscription> m_subscriptions;
    uint64_t m_next_stream = 1;
    bool m_lease_started = false;

    mutable std::mutex m_messages_mutex;
    mutable std::condition_variable m_messages_cv;
    std::vector<message> m_messages;
};

class publisher {
public:
    publisher(const config& cfg, std::shared_ptr<spdlog::logger> log);
    ~publisher();

    bool connect(std::chrono::milliseconds timeout = std::chrono::seconds(5));

    // True if the broker delivered to every subscriber of the topic.
    // False on any delivery failure, or if no reply arrived in time.
    bool publish(const std::string& topic, std::span<const char> payload);

    void close();

private:
    std::shared_ptr<spdlog::logger> m_log;
    config m_cfg;
    client_connection m_conn;
};

} // namespace pubsub
