#pragma once

#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace pubsub {

enum class request_kind {
    stop,  // poison pill
    subscribe,
    unsubscribe,
    publish,
    disconnect  // lease expired; `subscriber` is set, no payload
};

// One control request received on the I/O thread.
struct request_job {
    request_kind kind = request_kind::stop;
    std::vector<char> payload;
    std::string reply_to;  // empty = no reply expected
    uint64_t subscriber = 0;
};

// Runs control requests on dedicated threads so that blocking work
// (coarse lock, stream writes) never stalls the NATS I/O thread.
class worker_pool {
public:
    struct stats {
        uint64_t processed = 0;
        uint64_t failures = 0;
        std::size_t queue_depth = 0;
    };

    // Returns false if the request failed (bad payload, handler error).
    using handler = std::function<bool(request_job&)>;

    worker_pool(unsigned int thread_count, handler fn,
                std::shared_ptr<spdlog::logger> log);
    ~worker_pool();

    // Spawn N worker threads. Must be called once.
    void start();

    // Signal workers to stop, drain the queue, and join threads.
    void stop();

    void enqueue(request_job job);

    // Approximate queue depth.
    std::size_t queue_depth() const;

    stats get_stats() const;

    unsigned int thread_count() const { return m_thread_count; }

private:
    void worker_loop(unsigned int worker_id);

    handler m_handler;
    std::shared_ptr<spdlog::logger> m_log;

    unsigned int m_thread_count;
    std::atomic<bool> m_running{false};

    moodycamel::BlockingConcurrentQueue<request_job> m_queue;
    std::vector<std::thread> m_threads;

    std::atomic<uint64_t> m_processed{0};
    std::atomic<uint64_t> m_failures{0};
};

} // namespace pubsub
