#include "lease_manager.hpp"
#include <charconv>

namespace pubsub {

lease_manager::lease_manager(nats_asio::iconnection_sptr conn,
                             const std::string& bucket,
                             expiry_handler on_expired,
                             std::shared_ptr<spdlog::logger> log)
    : m_conn(std::move(conn)), m_bucket(bucket),
      m_on_expired(std::move(on_expired)), m_log(std::move(log))
{}

std::string lease_manager::make_lease_key(subscriber_id id) {
    return std::to_string(id);
}

bool lease_manager::parse_lease_key(const std::string& key, subscriber_id& id) {
    if (key.empty()) return false;

    auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), id);
    return ec == std::errc{} && ptr == key.data() + key.size();
}

std::string lease_manager::lease_subject(const std::string& bucket, subscriber_id id) {
    return "$KV." + bucket + "." + make_lease_key(id);
}

bool lease_manager::dispatch_entry(const nats_asio::kv_entry& entry,
                                   const expiry_handler& on_expired,
                                   spdlog::logger& log) {
    // We only care about deletions (TTL expiry or explicit delete)
    if (entry.op == nats_asio::kv_entry::operation::put) {
        log.debug("lease_manager: KV put for key '{}'", entry.key);
        return false;
    }

    subscriber_id id;
    if (!parse_lease_key(entry.key, id)) {
        log.warn("lease_manager: failed to parse lease key '{}'", entry.key);
        return false;
    }

    log.info("lease_manager: lease expired for subscriber {}", id);
    on_expired(id);
    return true;
}

void lease_manager::on_kv_entry(const nats_asio::kv_entry& entry) {
    dispatch_entry(entry, m_on_expired, *m_log);
}

asio::awaitable<bool> lease_manager::start() {
    auto [watcher, status] = co_await m_conn->kv_watch(
        m_bucket,
        [this](const nats_asio::kv_entry& entry) -> asio::awaitable<void> {
            on_kv_entry(entry);
            co_return;
        },
        ">"  // watch all keys in the bucket
    );

    if (status.failed()) {
        m_log->error("lease_manager: failed to watch KV bucket '{}': {}",
                    m_bucket, status.error());
        co_return false;
    }

    m_watcher = watcher;
    m_log->info("lease_manager: watching KV bucket '{}'", m_bucket);
    co_return true;
}

} // namespace pubsub
