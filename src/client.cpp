#include "client.hpp"
#include "codec.hpp"
#include "lease_manager.hpp"
#include "nats_connect.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>
#include <exception>
#include <random>
#include <sstream>

namespace pubsub {

namespace {

uint64_t random_u64() {
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
    uint64_t v = 0;
    while (v == 0) v = gen();
    return v;
}

std::string make_inbox() {
    std::ostringstream os;
    os << "_INBOX.pubsub." << std::hex << random_u64();
    return os.str();
}

} // namespace

// --- client_connection ---

client_connection::client_connection(const config& cfg, std::shared_ptr<spdlog::logger> log)
    : m_cfg(cfg), m_log(std::move(log)),
      m_timeout(cfg.request_timeout_ms),
      m_work(asio::make_work_guard(m_ioc)),
      m_inbox(make_inbox())
{}

client_connection::~client_connection() {
    close();
}

std::optional<std::vector<char>> take_reply(std::future<std::vector<char>>& reply,
                                            std::chrono::milliseconds timeout,
                                            const std::string& subject,
                                            spdlog::logger& log) {
    if (reply.wait_for(timeout) != std::future_status::ready) {
        log.warn("No reply to request on '{}' within {}ms", subject, timeout.count());
        return std::nullopt;
    }

    try {
        return reply.get();
    } catch (const std::future_error& e) {
        log.warn("Request on '{}' abandoned: {}", subject, e.what());
        return std::nullopt;
    }
}

template <typename T, typename Op>
std::optional<T> client_connection::run(Op&& op) {
    if (!m_conn || !m_thread.joinable()) return std::nullopt;

    auto done = asio::co_spawn(m_ioc, std::forward<Op>(op), asio::use_future);
    if (done.wait_for(m_timeout) != std::future_status::ready) {
        m_log->warn("NATS operation timed out after {}ms", m_timeout.count());
        return std::nullopt;
    }

    try {
        return done.get();
    } catch (const std::exception& e) {
        m_log->warn("NATS operation failed: {}", e.what());
        return std::nullopt;
    }
}

bool client_connection::connect(std::chrono::milliseconds timeout) {
    if (m_conn) return connected();

    m_conn = start_connection(m_ioc, m_cfg, m_log);
    m_thread = std::thread([this] { m_ioc.run(); });

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!m_conn->is_connected()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            m_log->error("Timed out connecting to NATS at {}:{}", m_cfg.nats_address, m_cfg.nats_port);
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    auto inbox = run<bool>(
        [this]() -> asio::awaitable<bool> {
            auto [sub, status] = co_await m_conn->subscribe(
                m_inbox + ".*",
                [this](auto subject, auto /*reply_to*/, auto payload) -> asio::awaitable<void> {
                    on_reply(subject, payload);
                    co_return;
                });
            if (status.failed()) {
                m_log->error("Failed to open reply inbox '{}': {}", m_inbox, status.error());
                co_return false;
            }
            co_return true;
        });

    return inbox.value_or(false);
}

bool client_connection::connected() const {
    return m_conn && m_conn->is_connected();
}

void client_connection::on_reply(std::string_view subject, std::span<const char> payload) {
    auto dot = subject.rfind('.');
    if (dot == std::string_view::npos) return;
    std::string token(subject.substr(dot + 1));

    std::lock_guard<std::mutex> lock(m_pending_mutex);
    auto it = m_pending.find(token);
    if (it == m_pending.end()) {
        m_log->debug("Late or unknown reply on '{}'", subject);
        return;
    }
    it->second.set_value(std::vector<char>(payload.begin(), payload.end()));
    m_pending.erase(it);
}

bool client_connection::publish(const std::string& subject, std::span<const char> payload) {
    auto sent = run<bool>(
        [conn = m_conn, log = m_log, subject,
         bytes = std::vector<char>(payload.begin(), payload.end())]() -> asio::awaitable<bool> {
            auto s = co_await conn->publish(
                subject, std::span<const char>(bytes.data(), bytes.size()), std::nullopt);
            if (s.failed()) {
                log->warn("Failed to publish to '{}': {}", subject, s.error());
                co_return false;
            }
            co_return true;
        });
    return sent.value_or(false);
}

std::optional<std::vector<char>> client_connection::request(const std::string& subject,
                                                            std::span<const char> payload) {
    std::string token;
    std::future<std::vector<char>> reply;
    {
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        token = std::to_string(m_next_token++);
        reply = m_pending[token].get_future();
    }

    auto sent = run<bool>(
        [conn = m_conn, log = m_log, subject, reply_to = m_inbox + "." + token,
         bytes = std::vector<char>(payload.begin(), payload.end())]() -> asio::awaitable<bool> {
            auto s = co_await conn->publish(
                subject, std::span<const char>(bytes.data(), bytes.size()),
                std::optional<std::string_view>(reply_to));
            if (s.failed()) {
                log->warn("Failed to send request to '{}': {}", subject, s.error());
                co_return false;
            }
            co_return true;
        });

    std::optional<std::vector<char>> result;
    if (sent.value_or(false)) {
        result = take_reply(reply, m_timeout, subject, *m_log);
    }

    std::lock_guard<std::mutex> lock(m_pending_mutex);
    m_pending.erase(token);
    return result;
}

nats_asio::isubscription_sptr client_connection::subscribe(const std::string& subject,
                                                           message_handler fn) {
    auto sub = run<nats_asio::isubscription_sptr>(
        [conn = m_conn, log = m_log, subject,
         fn = std::move(fn)]() -> asio::awaitable<nats_asio::isubscription_sptr> {
            auto [s, status] = co_await conn->subscribe(
                subject,
                [fn](auto /*subject*/, auto /*reply_to*/, auto payload) -> asio::awaitable<void> {
                    fn(payload);
                    co_return;
                });
            if (status.failed()) {
                log->error("Failed to subscribe to '{}': {}", subject, status.error());
                co_return nullptr;
            }
            co_return s;
        });
    return sub.value_or(nullptr);
}

bool client_connection::unsubscribe(const nats_asio::isubscription_sptr& sub) {
    if (!sub) return false;

    auto done = run<bool>(
        [conn = m_conn, log = m_log, sub]() -> asio::awaitable<bool> {
            auto s = co_await conn->unsubscribe(sub);
            if (s.failed()) {
                log->warn("Failed to unsubscribe: {}", s.error());
                co_return false;
            }
            co_return true;
        });
    return done.value_or(false);
}

void client_connection::close() {
    if (!m_thread.joinable()) return;

    m_work.reset();
    m_ioc.stop();
    m_thread.join();
    m_conn.reset();

    // Outstanding requests see a broken promise and report no reply
    std::lock_guard<std::mutex> lock(m_pending_mutex);
    m_pending.clear();
}

// --- consumer ---

consumer::consumer(const config& cfg, std::shared_ptr<spdlog::logger> log)
    : consumer(cfg, random_u64(), std::move(log))
{}

consumer::consumer(const config& cfg, subscriber_id id, std::shared_ptr<spdlog::logger> log)
    : m_cfg(cfg), m_log(std::move(log)), m_id(id), m_conn(cfg, m_log)
{}

consumer::~consumer() {
    close();
}

bool consumer::connect(std::chrono::milliseconds timeout) {
    return m_conn.connect(timeout);
}

bool consumer::subscribe(const std::string& topic) {
    std::lock_guard<std::mutex> lock(m_subs_mutex);

    auto it = m_subscriptions.find(topic);
    if (it != m_subscriptions.end()) {
        if (!it->second.done->load()) return true;

        // The broker ended this stream; open a new one
        m_conn.unsubscribe(it->second.stream);
        m_subscriptions.erase(it);
    }

    subscription sub;
    sub.deliver_subject = m_cfg.deliver_prefix + "." + std::to_string(m_id) + "." +
                          std::to_string(m_next_stream++);
    sub.done = std::make_shared<std::atomic<bool>>(false);

    // Listen before asking the broker, so no frame is missed
    sub.stream = m_conn.subscribe(sub.deliver_subject,
        [this, done = sub.done](std::span<const char> frame) { receive(done, frame); });
    if (!sub.stream) return false;

    bool ok = false;
    auto reply = m_conn.request(m_cfg.subscribe_subject,
                                encode(subscribe_request{topic, m_id, sub.deliver_subject}));
    if (reply) {
        try {
            auto resp = decode_subscribe_response(*reply);
            ok = resp.success;
            if (!ok) m_log->warn("Broker rejected subscription to '{}': {}", topic, resp.error);
        } catch (const codec_error& e) {
            m_log->warn("Bad subscribe reply: {}", e.what());
        }
    }

    if (!ok) {
        sub.done->store(true);
        m_conn.unsubscribe(sub.stream);
        return false;
    }

    m_log->info("Consumer {} subscribed to '{}'", m_id, topic);
    m_subscriptions.emplace(topic, std::move(sub));
    start_lease_refresh();
    return true;
}

bool consumer::unsubscribe(const std::string& topic) {
    std::lock_guard<std::mutex> lock(m_subs_mutex);

    auto it = m_subscriptions.find(topic);
    if (it == m_subscriptions.end()) return false;

    it->second.done->store(true);
    m_conn.unsubscribe(it->second.stream);
    m_subscriptions.erase(it);

    auto reply = m_conn.request(m_cfg.unsubscribe_subject,
                                encode(unsubscribe_request{topic, m_id}));
    if (!reply) return false;

    try {
        return decode_unsubscribe_response(*reply).success;
    } catch (const codec_error& e) {
        m_log->warn("Bad unsubscribe reply: {}", e.what());
        return false;
    }
}

void consumer::close() {
    for (const auto& topic : subscribed_topics()) {
        unsubscribe(topic);
    }
    m_conn.close();
}

void consumer::receive(const std::shared_ptr<std::atomic<bool>>& done,
                       std::span<const char> frame) {
    if (done->load()) return;

    std::optional<message> msg;
    try {
        msg = decode_frame(frame);
    } catch (const codec_error& e) {
        m_log->debug("Stream dropped: {}", e.what());
        done->store(true);
        return;
    }

    if (!msg) {
        m_log->debug("Broker ended stream for consumer {}", m_id);
        done->store(true);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_messages_mutex);
        m_messages.push_back(std::move(*msg));
    }
    m_messages_cv.notify_all();
}

std::vector<message> consumer::messages() const {
    std::lock_guard<std::mutex> lock(m_messages_mutex);
    return m_messages;
}

bool consumer::wait_for_messages(std::size_t count, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_messages_mutex);
    return m_messages_cv.wait_for(lock, timeout, [&] { return m_messages.size() >= count; });
}

std::vector<std::string> consumer::subscribed_topics() const {
    std::lock_guard<std::mutex> lock(m_subs_mutex);
    std::vector<std::string> topics;
    topics.reserve(m_subscriptions.size());
    for (const auto& [topic, sub] : m_subscriptions) topics.push_back(topic);
    return topics;
}

void consumer::start_lease_refresh() {
    if (m_lease_started || m_cfg.lease_bucket.empty() || m_cfg.lease_refresh_seconds == 0) return;
    m_lease_started = true;
    asio::co_spawn(m_conn.io(), lease_loop(), asio::detached);
}

asio::awaitable<void> consumer::lease_loop() {
    asio::steady_timer timer(co_await asio::this_coro::executor);
    const auto subject = lease_manager::lease_subject(m_cfg.lease_bucket, m_id);
    const std::string value = "alive";

    while (true) {
        auto s = co_await m_conn.connection()->publish(
            subject, std::span<const char>(value.data(), value.size()), std::nullopt);
        if (s.failed()) {
            m_log->warn("Failed to refresh lease '{}': {}", subject, s.error());
        }

        timer.expires_after(std::chrono::seconds(m_cfg.lease_refresh_seconds));
        co_await timer.async_wait(asio::use_awaitable);
    }
}

// --- publisher ---

publisher::publisher(const config& cfg, std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log)), m_cfg(cfg), m_conn(cfg, m_log)
{}

publisher::~publisher() {
    close();
}

bool publisher::connect(std::chrono::milliseconds timeout) {
    return m_conn.connect(timeout);
}

bool publisher::publish(const std::string& topic, std::span<const char> payload) {
    auto reply = m_conn.request(
        m_cfg.publish_subject,
        encode(publish_request{topic, std::vector<char>(payload.begin(), payload.end())}));
    if (!reply) return false;

    try {
        return decode_publish_response(*reply).success;
    } catch (const codec_error& e) {
        m_log->warn("Bad publish reply: {}", e.what());
        return false;
    }
}

void publisher::close() {
    m_conn.close();
}

} // namespace pubsub
