#pragma once

#include "message.hpp"
#include "subscriber_session.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pubsub {

// topic -> subscriber id -> {session, delivery lock}.
//
// One coarse mutex guards all structure. Each entry owns its delivery
// lock, so an entry and its lock are created and destroyed together.
// Delivery locks are only taken inside a coarse-lock critical section,
// which means none can be held while a structural change runs.
class subscription_registry {
public:
    using guard = std::unique_lock<std::mutex>;

    // One element of a fan-out snapshot. `delivery_lock` is valid only
    // while the coarse lock that produced the snapshot is held.
    struct subscriber_ref {
        subscriber_id id;
        subscriber_session_sptr session;
        std::mutex* delivery_lock;
    };

    explicit subscription_registry(std::shared_ptr<spdlog::logger> log);

    subscription_registry(const subscription_registry&) = delete;
    subscription_registry& operator=(const subscription_registry&) = delete;

    // Acquire the coarse lock for a fan-out pass.
    guard lock();

    // Insert or replace the entry for (session->topic(), session->id())
    // with a fresh delivery lock. Returns the replaced session, if any.
    subscriber_session_sptr register_subscriber(subscriber_session_sptr session);

    // Remove an entry and its lock. Returns the removed session, or
    // nullptr if the pair was not registered.
    subscriber_session_sptr deregister(const std::string& topic, subscriber_id id);

    // Point-in-time view of a topic's subscribers. Empty for an unknown topic.
    std::vector<subscriber_ref> snapshot_subscribers(const guard& held,
                                                     const std::string& topic) const;

    // Remove the listed entries if still present. Returns the sessions
    // actually removed.
    std::vector<subscriber_session_sptr> evict_broken(
        const guard& held, const std::vector<subscription_key>& keys);

    // Same as above, acquiring the coarse lock itself.
    std::vector<subscriber_session_sptr> evict_broken(const std::vector<subscription_key>& keys);

    // Every session registered under a subscriber id, across topics.
    std::vector<subscriber_session_sptr> sessions_of(subscriber_id id) const;

    // Remove every entry. Returns the removed sessions.
    std::vector<subscriber_session_sptr> drain();

    bool contains(const std::string& topic, subscriber_id id) const;
    std::size_t size() const;
    std::size_t topic_count() const;
    std::size_t delivery_lock_count() const;

    struct counts {
        std::size_t entries;
        std::size_t delivery_locks;
    };

    // Entry and delivery lock totals read under one acquisition of the
    // coarse lock, so the pair is always from the same registry state.
    counts get_counts() const;

private:
    struct entry {
        subscriber_session_sptr session;
        std::unique_ptr<std::mutex> delivery_lock;
    };

    using topic_entries = std::unordered_map<subscriber_id, entry>;

    // Throws std::logic_error unless `held` owns m_mutex.
    void check_held(const guard& held) const;

    // Caller holds m_mutex.
    subscriber_session_sptr erase_locked(const std::string& topic, subscriber_id id);

    std::shared_ptr<spdlog::logger> m_log;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, topic_entries> m_topics;
};

} // namespace pubsub
