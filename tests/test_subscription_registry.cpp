#include "subscription_registry.hpp"
#include "fake_stream.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <stdexcept>

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

pubsub::subscriber_session_sptr make_session(const std::string& topic, pubsub::subscriber_id id) {
    return std::make_shared<pubsub::subscriber_session>(
        topic, id, std::make_shared<pubsub::testing::recording_stream>());
}

} // namespace

TEST(subscription_registry, register_creates_entry_and_lock) {
    pubsub::subscription_registry reg(make_log());

    auto replaced = reg.register_subscriber(make_session("news", 1));
    EXPECT_EQ(replaced, nullptr);
    EXPECT_TRUE(reg.contains("news", 1));
    EXPECT_EQ(reg.size(), 1u);
    EXPECT_EQ(reg.delivery_lock_count(), 1u);
    EXPECT_EQ(reg.topic_count(), 1u);
}

TEST(subscription_registry, register_same_key_replaces) {
    pubsub::subscription_registry reg(make_log());

    auto first = make_session("news", 1);
    auto second = make_session("news", 1);
    reg.register_subscriber(first);

    auto replaced = reg.register_subscriber(second);
    EXPECT_EQ(replaced, first);
    EXPECT_EQ(reg.size(), 1u);
    EXPECT_EQ(reg.delivery_lock_count(), 1u);

    auto held = reg.lock();
    auto snap = reg.snapshot_subscribers(held, "news");
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap[0].session, second);
}

TEST(subscription_registry, counts_track_entries_and_locks_together) {
    pubsub::subscription_registry reg(make_log());
    reg.register_subscriber(make_session("news", 1));
    reg.register_subscriber(make_session("news", 2));
    reg.register_subscriber(make_session("sport", 1));

    auto c = reg.get_counts();
    EXPECT_EQ(c.entries, 3u);
    EXPECT_EQ(c.delivery_locks, 3u);

    reg.deregister("news", 2);
    c = reg.get_counts();
    EXPECT_EQ(c.entries, 2u);
    EXPECT_EQ(c.delivery_locks, 2u);
}

TEST(subscription_registry, deregister_unknown_reports_not_found) {
    pubsub::subscription_registry reg(make_log());
    reg.register_subscriber(make_session("news", 1));

    EXPECT_EQ(reg.deregister("news", 2), nullptr);
    EXPECT_EQ(reg.deregister("sports", 1), nullptr);
    EXPECT_EQ(reg.size(), 1u);
}

TEST(subscription_registry, deregister_removes_entry_lock_and_empty_topic) {
    pubsub::subscription_registry reg(make_log());
    auto session = make_session("news", 1);
    reg.register_subscriber(session);

    EXPECT_EQ(reg.deregister("news", 1), session);
    EXPECT_FALSE(reg.contains("news", 1));
    EXPECT_EQ(reg.size(), 0u);
    EXPECT_EQ(reg.delivery_lock_count(), 0u);
    EXPECT_EQ(reg.topic_count(), 0u);
}

TEST(subscription_registry, snapshot_of_unknown_topic_is_empty) {
    pubsub::subscription_registry reg(make_log());
    reg.register_subscriber(make_session("news", 1));

    auto held = reg.lock();
    EXPECT_TRUE(reg.snapshot_subscribers(held, "weather").empty());
}

TEST(subscription_registry, snapshot_lists_only_the_topic) {
    pubsub::subscription_registry reg(make_log());
    reg.register_subscriber(make_session("news", 1));
    reg.register_subscriber(make_session("news", 2));
    reg.register_subscriber(make_session("sports", 3));

    auto held = reg.lock();
    auto snap = reg.snapshot_subscribers(held, "news");
    ASSERT_EQ(snap.size(), 2u);
    for (const auto& ref : snap) {
        EXPECT_TRUE(ref.id == 1 || ref.id == 2);
        EXPECT_NE(ref.delivery_lock, nullptr);
        EXPECT_EQ(ref.session->topic(), "news");
    }
}

TEST(subscription_registry, snapshot_requires_coarse_lock) {
    pubsub::subscription_registry reg(make_log());
    pubsub::subscription_registry other(make_log());

    pubsub::subscription_registry::guard unlocked;
    EXPECT_THROW(reg.snapshot_subscribers(unlocked, "news"), std::logic_error);

    auto foreign = other.lock();
    EXPECT_THROW(reg.snapshot_subscribers(foreign, "news"), std::logic_error);
}

TEST(subscription_registry, evict_broken_tolerates_missing_entries) {
    pubsub::subscription_registry reg(make_log());
    auto s1 = make_session("t", 1);
    reg.register_subscriber(s1);
    reg.register_subscriber(make_session("t", 2));

    // id 9 was never registered, id 1 listed twice
    auto evicted = reg.evict_broken({{"t", 1}, {"t", 9}, {"t", 1}, {"other", 1}});
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], s1);
    EXPECT_FALSE(reg.contains("t", 1));
    EXPECT_TRUE(reg.contains("t", 2));
    EXPECT_EQ(reg.delivery_lock_count(), reg.size());
}

TEST(subscription_registry, sessions_of_spans_topics) {
    pubsub::subscription_registry reg(make_log());
    reg.register_subscriber(make_session("a", 7));
    reg.register_subscriber(make_session("b", 7));
    reg.register_subscriber(make_session("b", 8));

    EXPECT_EQ(reg.sessions_of(7).size(), 2u);
    EXPECT_EQ(reg.sessions_of(8).size(), 1u);
    EXPECT_TRUE(reg.sessions_of(9).empty());
}

TEST(subscription_registry, drain_empties_everything) {
    pubsub::subscription_registry reg(make_log());
    reg.register_subscriber(make_session("a", 1));
    reg.register_subscriber(make_session("b", 2));

    EXPECT_EQ(reg.drain().size(), 2u);
    EXPECT_EQ(reg.size(), 0u);
    EXPECT_EQ(reg.topic_count(), 0u);
    EXPECT_EQ(reg.delivery_lock_count(), 0u);
}
