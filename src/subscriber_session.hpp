#pragma once

#include "message.hpp"
#include "subscriber_stream.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pubsub {

// Broker-side handle for one subscribe call: the subscriber's stream plus
// its liveness state. The transport (or the broker) closes the session;
// whoever waits on it is woken and close callbacks run exactly once.
class subscriber_session {
public:
    subscriber_session(std::string topic, subscriber_id id, subscriber_stream_sptr stream);

    subscriber_session(const subscriber_session&) = delete;
    subscriber_session& operator=(const subscriber_session&) = delete;

    const std::string& topic() const { return m_topic; }
    subscriber_id id() const { return m_id; }
    subscription_key key() const { return {m_topic, m_id}; }

    // Write one message to the stream. Fails without touching the stream
    // once the session is closed.
    bool deliver(const message& msg);

    // Idempotent. Wakes every waiter and runs the close callbacks.
    void close();

    bool closed() const;

    // Open and the transport still reports the stream alive.
    bool is_active() const;

    // Block until the session is closed.
    void wait();

    // Returns true if the session closed within the timeout.
    bool wait_for(std::chrono::milliseconds timeout);

    // Runs `cb` once when the session closes, or immediately if it
    // already has. Callbacks run on the closing thread.
    void on_close(std::function<void()> cb);

private:
    std::string m_topic;
    subscriber_id m_id;
    subscriber_stream_sptr m_stream;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_closed = false;
    std::vector<std::function<void()>> m_close_callbacks;
};

using subscriber_session_sptr = std::shared_ptr<subscriber_session>;

} // namespace pubsub
