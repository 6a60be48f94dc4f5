#include "broker.hpp"
#include <exception>

namespace pubsub {

broker::broker(std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log)),
      m_registry(m_log)
{}

broker::~broker() {
    shutdown();
}

subscriber_session_sptr broker::open_session(const std::string& topic, subscriber_id id,
                                             subscriber_stream_sptr stream) {
    auto session = std::make_shared<subscriber_session>(topic, id, std::move(stream));

    auto replaced = m_registry.register_subscriber(session);
    if (replaced) {
        replaced->close();
    }

    m_log->info("Subscriber {} subscribed to topic '{}'", id, topic);
    return session;
}

void broker::subscribe(const std::string& topic, subscriber_id id,
                       subscriber_stream_sptr stream) {
    auto session = open_session(topic, id, std::move(stream));
    session->wait();
    m_log->debug("Subscribe call for subscriber {} on topic '{}' finished", id, topic);
}

bool broker::unsubscribe(const std::string& topic, subscriber_id id) {
    auto session = m_registry.deregister(topic, id);
    if (!session) {
        m_log->debug("Unsubscribe: subscriber {} not found on topic '{}'", id, topic);
        return false;
    }

    session->close();
    m_log->info("Subscriber {} unsubscribed from topic '{}'", id, topic);
    return true;
}

bool broker::publish(const std::string& topic, std::vector<char> payload) {
    m_publishes.fetch_add(1, std::memory_order_relaxed);

    const message msg{topic, std::move(payload)};
    std::vector<subscription_key> broken;
    std::vector<subscriber_session_sptr> evicted;

    {
        auto held = m_registry.lock();

        for (const auto& sub : m_registry.snapshot_subscribers(held, topic)) {
            bool ok = false;
            {
                std::lock_guard<std::mutex> delivery(*sub.delivery_lock);
                try {
                    ok = sub.session->deliver(msg);
                } catch (const std::exception& e) {
                    m_log->warn("Error sending message to subscriber {} on topic '{}': {}",
                               sub.id, topic, e.what());
                }
            }

            if (ok) {
                m_delivered.fetch_add(1, std::memory_order_relaxed);
            } else {
                m_log->warn("Delivery to subscriber {} on topic '{}' failed", sub.id, topic);
                m_delivery_failures.fetch_add(1, std::memory_order_relaxed);
                broken.push_back({topic, sub.id});
            }
        }

        evicted = m_registry.evict_broken(held, broken);
    }

    // Outside the coarse lock: close callbacks may call into the transport
    for (auto& session : evicted) {
        session->close();
    }
    m_evicted.fetch_add(evicted.size(), std::memory_order_relaxed);

    return broken.empty();
}

std::size_t broker::disconnect(subscriber_id id) {
    auto sessions = m_registry.sessions_of(id);
    for (auto& session : sessions) {
        session->close();
    }
    if (!sessions.empty()) {
        m_log->info("Subscriber {} disconnected, closed {} session(s)", id, sessions.size());
    }
    return sessions.size();
}

void broker::shutdown() {
    auto sessions = m_registry.drain();
    for (auto& session : sessions) {
        session->close();
    }
    if (!sessions.empty()) {
        m_log->info("Broker shut down, closed {} session(s)", sessions.size());
    }
}

broker::stats broker::get_stats() const {
    return {
        m_publishes.load(std::memory_order_relaxed),
        m_delivered.load(std::memory_order_relaxed),
        m_delivery_failures.load(std::memory_order_relaxed),
        m_evicted.load(std::memory_order_relaxed),
        m_registry.size()
    };
}

} // namespace pubsub
