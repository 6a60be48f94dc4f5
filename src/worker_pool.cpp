#include "worker_pool.hpp"
#include <chrono>
#include <exception>

namespace pubsub {

worker_pool::worker_pool(unsigned int thread_count, handler fn,
                         std::shared_ptr<spdlog::logger> log)
    : m_handler(std::move(fn)), m_log(std::move(log)),
      m_thread_count(thread_count > 0 ? thread_count
                                      : std::thread::hardware_concurrency())
{
    if (m_thread_count == 0) m_thread_count = 1;
}

worker_pool::~worker_pool() {
    stop();
}

void worker_pool::start() {
    if (m_running.exchange(true)) return; // already started

    m_threads.reserve(m_thread_count);
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_threads.emplace_back(&worker_pool::worker_loop, this, i);
    }
    m_log->info("Worker pool started with {} threads", m_thread_count);
}

void worker_pool::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    // One poison pill per thread, queued behind any pending requests
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_queue.enqueue(request_job{});
    }

    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();
    m_log->info("Worker pool stopped");
}

void worker_pool::enqueue(request_job job) {
    m_queue.enqueue(std::move(job));
}

std::size_t worker_pool::queue_depth() const {
    return m_queue.size_approx();
}

worker_pool::stats worker_pool::get_stats() const {
    return {
        m_processed.load(std::memory_order_relaxed),
        m_failures.load(std::memory_order_relaxed),
        m_queue.size_approx()
    };
}

void worker_pool::worker_loop(unsigned int worker_id) {
    m_log->debug("Worker {} started", worker_id);

    request_job job;
    while (true) {
        // Block with timeout so a missed pill cannot hang shutdown
        bool got = m_queue.wait_dequeue_timed(job, std::chrono::milliseconds(100));
        if (!got) {
            if (!m_running.load(std::memory_order_relaxed)) break;
            continue;
        }

        if (job.kind == request_kind::stop) break;

        bool ok = false;
        try {
            ok = m_handler(job);
        } catch (const std::exception& e) {
            m_log->error("Worker {}: request failed: {}", worker_id, e.what());
        }

        m_processed.fetch_add(1, std::memory_order_relaxed);
        if (!ok) m_failures.fetch_add(1, std::memory_order_relaxed);
    }

    m_log->debug("Worker {} stopped", worker_id);
}

} // namespace pubsub
