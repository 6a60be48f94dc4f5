#include "subscription_registry.hpp"
#include <stdexcept>

namespace pubsub {

subscription_registry::subscription_registry(std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log))
{}

subscription_registry::guard subscription_registry::lock() {
    return guard(m_mutex);
}

void subscription_registry::check_held(const guard& held) const {
    if (!held.owns_lock() || held.mutex() != &m_mutex) {
        throw std::logic_error("subscription_registry: coarse lock not held");
    }
}

subscriber_session_sptr subscription_registry::register_subscriber(subscriber_session_sptr session) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto& subscribers = m_topics[session->topic()];
    auto [it, inserted] = subscribers.try_emplace(session->id());

    subscriber_session_sptr replaced;
    if (!inserted) {
        // No delivery lock can be held here: they are only taken under m_mutex.
        replaced = std::move(it->second.session);
        m_log->info("Replacing subscription of subscriber {} on topic '{}'",
                   session->id(), session->topic());
    }

    it->second.session = std::move(session);
    it->second.delivery_lock = std::make_unique<std::mutex>();
    return replaced;
}

subscriber_session_sptr subscription_registry::erase_locked(const std::string& topic,
                                                            subscriber_id id) {
    auto topic_it = m_topics.find(topic);
    if (topic_it == m_topics.end()) return nullptr;

    auto it = topic_it->second.find(id);
    if (it == topic_it->second.end()) return nullptr;

    auto session = std::move(it->second.session);
    topic_it->second.erase(it);
    if (topic_it->second.empty()) {
        m_topics.erase(topic_it);
    }
    return session;
}

subscriber_session_sptr subscription_registry::deregister(const std::string& topic,
                                                          subscriber_id id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return erase_locked(topic, id);
}

std::vector<subscription_registry::subscriber_ref>
subscription_registry::snapshot_subscribers(const guard& held, const std::string& topic) const {
    check_held(held);

    std::vector<subscriber_ref> refs;
    auto topic_it = m_topics.find(topic);
    if (topic_it == m_topics.end()) return refs;

    refs.reserve(topic_it->second.size());
    for (const auto& [id, e] : topic_it->second) {
        refs.push_back({id, e.session, e.delivery_lock.get()});
    }
    return refs;
}

std::vector<subscriber_session_sptr> subscription_registry::evict_broken(
    const guard& held, const std::vector<subscription_key>& keys)
{
    check_held(held);

    std::vector<subscriber_session_sptr> evicted;
    for (const auto& key : keys) {
        // Already gone if an explicit unsubscribe raced ahead
        if (auto session = erase_locked(key.topic, key.subscriber)) {
            m_log->info("Evicted broken subscriber {} from topic '{}'",
                       key.subscriber, key.topic);
            evicted.push_back(std::move(session));
        }
    }
    return evicted;
}

std::vector<subscriber_session_sptr> subscription_registry::evict_broken(
    const std::vector<subscription_key>& keys)
{
    auto held = lock();
    return evict_broken(held, keys);
}

std::vector<subscriber_session_sptr> subscription_registry::sessions_of(subscriber_id id) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<subscriber_session_sptr> sessions;
    for (const auto& [topic, subscribers] : m_topics) {
        auto it = subscribers.find(id);
        if (it != subscribers.end()) sessions.push_back(it->second.session);
    }
    return sessions;
}

std::vector<subscriber_session_sptr> subscription_registry::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<subscriber_session_sptr> sessions;
    for (auto& [topic, subscribers] : m_topics) {
        for (auto& [id, e] : subscribers) {
            sessions.push_back(std::move(e.session));
        }
    }
    m_topics.clear();
    return sessions;
}

bool subscription_registry::contains(const std::string& topic, subscriber_id id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto topic_it = m_topics.find(topic);
    return topic_it != m_topics.end() && topic_it->second.count(id) > 0;
}

std::size_t subscription_registry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t n = 0;
    for (const auto& [topic, subscribers] : m_topics) n += subscribers.size();
    return n;
}

std::size_t subscription_registry::topic_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_topics.size();
}

std::size_t subscription_registry::delivery_lock_count() const {
    return get_counts().delivery_locks;
}

subscription_registry::counts subscription_registry::get_counts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    counts c{0, 0};
    for (const auto& [topic, subscribers] : m_topics) {
        c.entries += subscribers.size();
        for (const auto& [id, e] : subscribers) {
            if (e.delivery_lock) ++c.delivery_locks;
        }
    }
    return c;
}

} // namespace pubsub
