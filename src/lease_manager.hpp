#pragma once

#include "message.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/awaitable.hpp>
#include <spdlog/spdlog.h>
#include <functional>
#include <memory>
#include <string>

namespace pubsub {

// Lease key format: <subscriber-id> (decimal).
// Value: anything (presence = alive). TTL enforced by NATS KV.
//
// The lease_manager watches the KV bucket for deletions/purges (TTL expiry)
// and reports the subscriber as gone. This is the transport's liveness
// signal; registry entries are still evicted lazily.

class lease_manager {
public:
    // Invoked on the I/O thread; must not block.
    using expiry_handler = std::function<void(subscriber_id)>;

    lease_manager(nats_asio::iconnection_sptr conn,
                  const std::string& bucket,
                  expiry_handler on_expired,
                  std::shared_ptr<spdlog::logger> log);

    // Start watching the KV bucket for lease changes.
    // Must be called after NATS connection is established.
    asio::awaitable<bool> start();

    static std::string make_lease_key(subscriber_id id);

    // Returns false if the key format is invalid.
    static bool parse_lease_key(const std::string& key, subscriber_id& id);

    // Subject a client publishes to in order to refresh its lease.
    static std::string lease_subject(const std::string& bucket, subscriber_id id);

    // Routes one KV change: deletes and purges of a well-formed key call
    // `on_expired` with the subscriber id. Returns true if it was called.
    static bool dispatch_entry(const nats_asio::kv_entry& entry,
                               const expiry_handler& on_expired,
                               spdlog::logger& log);

private:
    // KV watcher callback - invoked on entry changes
    void on_kv_entry(const nats_asio::kv_entry& entry);

    nats_asio::iconnection_sptr m_conn;
    std::string m_bucket;
    expiry_handler m_on_expired;
    std::shared_ptr<spdlog::logger> m_log;
    nats_asio::ikv_watcher_sptr m_watcher;
};

} // namespace pubsub
