#include "lease_manager.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

TEST(lease_manager, make_and_parse_lease_key) {
    auto key = pubsub::lease_manager::make_lease_key(42);
    EXPECT_EQ(key, "42");

    pubsub::subscriber_id id = 0;
    EXPECT_TRUE(pubsub::lease_manager::parse_lease_key(key, id));
    EXPECT_EQ(id, 42u);
}

TEST(lease_manager, parse_max_id) {
    pubsub::subscriber_id id = 0;
    EXPECT_TRUE(pubsub::lease_manager::parse_lease_key("18446744073709551615", id));
    EXPECT_EQ(id, UINT64_MAX);
}

TEST(lease_manager, parse_invalid_keys) {
    pubsub::subscriber_id id;
    EXPECT_FALSE(pubsub::lease_manager::parse_lease_key("", id));
    EXPECT_FALSE(pubsub::lease_manager::parse_lease_key("abc", id));
    EXPECT_FALSE(pubsub::lease_manager::parse_lease_key("12abc", id));
    EXPECT_FALSE(pubsub::lease_manager::parse_lease_key("12.client", id));
    EXPECT_FALSE(pubsub::lease_manager::parse_lease_key("-5", id));
    EXPECT_FALSE(pubsub::lease_manager::parse_lease_key("18446744073709551616", id));
}

TEST(lease_manager, lease_subject) {
    EXPECT_EQ(pubsub::lease_manager::lease_subject("pubsub-leases", 7), "$KV.pubsub-leases.7");
}

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

nats_asio::kv_entry entry_of(const std::string& key, nats_asio::kv_entry::operation op) {
    nats_asio::kv_entry entry;
    entry.key = key;
    entry.op = op;
    return entry;
}

} // namespace

TEST(lease_manager, put_does_not_expire) {
    auto log = make_log();
    std::vector<pubsub::subscriber_id> expired;
    auto handler = [&](pubsub::subscriber_id id) { expired.push_back(id); };

    EXPECT_FALSE(pubsub::lease_manager::dispatch_entry(
        entry_of("42", nats_asio::kv_entry::operation::put), handler, *log));
    EXPECT_TRUE(expired.empty());
}

TEST(lease_manager, delete_and_purge_expire_the_subscriber) {
    auto log = make_log();
    std::vector<pubsub::subscriber_id> expired;
    auto handler = [&](pubsub::subscriber_id id) { expired.push_back(id); };

    EXPECT_TRUE(pubsub::lease_manager::dispatch_entry(
        entry_of("42", nats_asio::kv_entry::operation::del), handler, *log));
    EXPECT_TRUE(pubsub::lease_manager::dispatch_entry(
        entry_of("7", nats_asio::kv_entry::operation::purge), handler, *log));

    EXPECT_EQ(expired, (std::vector<pubsub::subscriber_id>{42, 7}));
}

TEST(lease_manager, malformed_key_is_ignored) {
    auto log = make_log();
    std::vector<pubsub::subscriber_id> expired;
    auto handler = [&](pubsub::subscriber_id id) { expired.push_back(id); };

    EXPECT_FALSE(pubsub::lease_manager::dispatch_entry(
        entry_of("client-a", nats_asio::kv_entry::operation::del), handler, *log));
    EXPECT_TRUE(expired.empty());
}
