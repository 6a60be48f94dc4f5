#include "subscriber_session.hpp"

namespace pubsub {

subscriber_session::subscriber_session(std::string topic, subscriber_id id,
                                       subscriber_stream_sptr stream)
    : m_topic(std::move(topic)), m_id(id), m_stream(std::move(stream))
{}

bool subscriber_session::deliver(const message& msg) {
    if (closed() || !m_stream) return false;
    return m_stream->write(msg);
}

void subscriber_session::close() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) return;
        m_closed = true;
        callbacks.swap(m_close_callbacks);
    }
    m_cv.notify_all();

    for (auto& cb : callbacks) {
        cb();
    }
}

bool subscriber_session::closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

bool subscriber_session::is_active() const {
    if (closed() || !m_stream) return false;
    return m_stream->is_active();
}

void subscriber_session::wait() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return m_closed; });
}

bool subscriber_session::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this] { return m_closed; });
}

void subscriber_session::on_close(std::function<void()> cb) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_closed) {
            m_close_callbacks.push_back(std::move(cb));
            return;
        }
    }
    cb();
}

} // namespace pubsub
