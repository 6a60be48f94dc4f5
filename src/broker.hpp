#pragma once

#include "message.hpp"
#include "subscriber_session.hpp"
#include "subscriber_stream.hpp"
#include "subscription_registry.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pubsub {

// Owns the subscription registry and runs the publish fan-out.
// Every method is safe to call concurrently from transport threads.
class broker {
public:
    struct stats {
        uint64_t publishes = 0;
        uint64_t delivered = 0;
        uint64_t delivery_failures = 0;
        uint64_t evicted = 0;
        std::size_t subscriptions = 0;
    };

    explicit broker(std::shared_ptr<spdlog::logger> log);
    ~broker();

    broker(const broker&) = delete;
    broker& operator=(const broker&) = delete;

    // Register a session around `stream` and return it without blocking.
    // A previous subscription of the same (topic, id) is replaced and closed.
    subscriber_session_sptr open_session(const std::string& topic, subscriber_id id,
                                         subscriber_stream_sptr stream);

    // Register, then block until the session is closed (unsubscribe,
    // eviction, re-subscribe, disconnect or shutdown).
    void subscribe(const std::string& topic, subscriber_id id, subscriber_stream_sptr stream);

    // Returns false if (topic, id) was not registered.
    bool unsubscribe(const std::string& topic, subscriber_id id);

    // Deliver to every subscriber of `topic`. Returns false if any
    // delivery failed; the failed subscribers are evicted before returning.
    // Holds the coarse lock for the whole pass, so publishes are serialized.
    bool publish(const std::string& topic, std::vector<char> payload);

    // Transport liveness signal: close (but keep registered) every session
    // of this subscriber. Entries are evicted by the next publish.
    // Returns the number of sessions closed.
    std::size_t disconnect(subscriber_id id);

    // Remove all subscriptions and close their sessions.
    void shutdown();

    stats get_stats() const;

    const subscription_registry& registry() const { return m_registry; }

private:
    std::shared_ptr<spdlog::logger> m_log;
    subscription_registry m_registry;

    std::atomic<uint64_t> m_publishes{0};
    std::atomic<uint64_t> m_delivered{0};
    std::atomic<uint64_t> m_delivery_failures{0};
    std::atomic<uint64_t> m_evicted{0};
};

} // namespace pubsub
