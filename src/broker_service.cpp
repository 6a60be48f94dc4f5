#include "broker_service.hpp"
#include "codec.hpp"
#include "nats_stream.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <chrono>

namespace pubsub {

broker_service::broker_service(asio::io_context& ioc, const config& cfg,
                               std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_cfg(cfg), m_log(std::move(log)),
      m_broker(m_log),
      m_worker_pool(cfg.worker_threads,
                    [this](request_job& job) { return handle(job); },
                    m_log)
{}

asio::awaitable<void> broker_service::start(nats_asio::iconnection_sptr conn) {
    m_conn = std::move(conn);

    // Workers first: requests may arrive as soon as a subject is subscribed
    m_worker_pool.start();

    if (!co_await listen(m_cfg.subscribe_subject, request_kind::subscribe) ||
        !co_await listen(m_cfg.unsubscribe_subject, request_kind::unsubscribe) ||
        !co_await listen(m_cfg.publish_subject, request_kind::publish)) {
        m_ioc.stop();
        co_return;
    }

    if (!m_cfg.lease_bucket.empty()) {
        m_lease_mgr = std::make_unique<lease_manager>(
            m_conn, m_cfg.lease_bucket,
            [this](subscriber_id id) {
                request_job job;
                job.kind = request_kind::disconnect;
                job.subscriber = id;
                m_worker_pool.enqueue(std::move(job));
            },
            m_log);

        bool lease_ok = co_await m_lease_mgr->start();
        if (!lease_ok) {
            m_log->warn("Lease manager failed to start - subscriber liveness disabled");
        }
    }

    asio::co_spawn(m_ioc, stats_loop(), asio::detached);

    m_log->info("Broker service started ({} workers)", m_worker_pool.thread_count());
}

asio::awaitable<bool> broker_service::listen(const std::string& subject, request_kind kind) {
    auto [sub, status] = co_await m_conn->subscribe(
        subject,
        [this, kind](auto /*subject*/, auto reply_to, auto payload) {
            return on_request(kind, reply_to, payload);
        }
    );

    if (status.failed()) {
        m_log->error("Failed to subscribe to control subject '{}': {}",
                    subject, status.error());
        co_return false;
    }
    m_log->info("Listening for requests on '{}'", subject);
    co_return true;
}

void broker_service::stop() {
    // Close sessions first so queued publishes find nothing to write to
    m_broker.shutdown();
    m_worker_pool.stop();
    // Sessions opened by subscribe jobs that were still queued
    m_broker.shutdown();
}

asio::awaitable<void> broker_service::on_request(
    request_kind kind,
    std::optional<std::string_view> reply_to,
    std::span<const char> payload)
{
    request_job job;
    job.kind = kind;
    job.payload.assign(payload.begin(), payload.end());
    if (reply_to) job.reply_to = std::string(*reply_to);

    m_worker_pool.enqueue(std::move(job));
    co_return;
}

bool broker_service::handle(request_job& job) {
    switch (job.kind) {
        case request_kind::subscribe:   return handle_subscribe(job);
        case request_kind::unsubscribe: return handle_unsubscribe(job);
        case request_kind::publish:     return handle_publish(job);
        case request_kind::disconnect:
            m_broker.disconnect(job.subscriber);
            return true;
        case request_kind::stop:
            break;
    }
    return false;
}

bool broker_service::handle_subscribe(const request_job& job) {
    subscribe_request req;
    try {
        req = decode_subscribe_request(job.payload);
    } catch (const codec_error& e) {
        m_log->warn("Bad subscribe request: {}", e.what());
        reply(job.reply_to, encode(subscribe_response{false, e.what()}));
        return false;
    }

    auto stream = std::make_shared<nats_subscriber_stream>(
        m_ioc, m_conn, req.deliver_subject,
        std::chrono::milliseconds(m_cfg.delivery_timeout_ms), m_log);

    auto session = m_broker.open_session(req.topic, req.subscriber, stream);

    // The subscribe call lasts until the session closes; then the client
    // gets an end-of-stream frame.
    session->on_close([stream, topic = req.topic, id = req.subscriber, log = m_log] {
        log->debug("Session of subscriber {} on topic '{}' ended", id, topic);
        stream->end_stream(topic);
    });

    reply(job.reply_to, encode(subscribe_response{true, {}}));
    return true;
}

bool broker_service::handle_unsubscribe(const request_job& job) {
    unsubscribe_request req;
    try {
        req = decode_unsubscribe_request(job.payload);
    } catch (const codec_error& e) {
        m_log->warn("Bad unsubscribe request: {}", e.what());
        reply(job.reply_to, encode(unsubscribe_response{false}));
        return false;
    }

    bool removed = m_broker.unsubscribe(req.topic, req.subscriber);
    reply(job.reply_to, encode(unsubscribe_response{removed}));
    return true;
}

bool broker_service::handle_publish(const request_job& job) {
    publish_request req;
    try {
        req = decode_publish_request(job.payload);
    } catch (const codec_error& e) {
        m_log->warn("Bad publish request: {}", e.what());
        reply(job.reply_to, encode(publish_response{false}));
        return false;
    }

    bool ok = m_broker.publish(req.topic, std::move(req.payload));
    reply(job.reply_to, encode(publish_response{ok}));
    return true;
}

void broker_service::reply(const std::string& reply_to, std::vector<char> bytes) {
    if (reply_to.empty()) return;

    asio::co_spawn(m_ioc,
        [conn = m_conn, log = m_log, subject = reply_to,
         bytes = std::move(bytes)]() -> asio::awaitable<void> {
            auto s = co_await conn->publish(
                subject, std::span<const char>(bytes.data(), bytes.size()), std::nullopt);
            if (s.failed()) {
                log->error("Failed to reply on '{}': {}", subject, s.error());
            }
        },
        asio::detached);
}

asio::awaitable<void> broker_service::stats_loop() {
    asio::steady_timer timer(co_await asio::this_coro::executor);

    while (true) {
        timer.expires_after(std::chrono::seconds(m_cfg.stats_interval_seconds));
        co_await timer.async_wait(asio::use_awaitable);

        auto bs = m_broker.get_stats();
        auto ws = m_worker_pool.get_stats();

        m_log->info("stats: publishes={} delivered={} failures={} evicted={} subscriptions={} requests={} bad_requests={} queue_depth={}",
                   bs.publishes,
                   bs.delivered,
                   bs.delivery_failures,
                   bs.evicted,
                   bs.subscriptions,
                   ws.processed,
                   ws.failures,
                   ws.queue_depth);
    }
}

} // namespace pubsub
