#include "broker.hpp"
#include "fake_stream.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using pubsub::testing::bytes;
using pubsub::testing::recording_stream;

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace

TEST(broker, publish_delivers_to_single_subscriber) {
    pubsub::broker brk(make_log());
    auto stream = std::make_shared<recording_stream>();
    brk.open_session("news", 1, stream);

    EXPECT_TRUE(brk.publish("news", bytes("hi")));

    auto got = stream->received();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], (pubsub::message{"news", bytes("hi")}));
}

TEST(broker, publish_without_subscribers_succeeds) {
    pubsub::broker brk(make_log());

    EXPECT_TRUE(brk.publish("nobody", bytes("x")));
    EXPECT_EQ(brk.registry().size(), 0u);
    EXPECT_EQ(brk.registry().topic_count(), 0u);
}

TEST(broker, publish_reaches_every_subscriber) {
    pubsub::broker brk(make_log());

    std::vector<std::shared_ptr<recording_stream>> streams;
    for (pubsub::subscriber_id id = 1; id <= 50; ++id) {
        streams.push_back(std::make_shared<recording_stream>());
        brk.open_session("fan", id, streams.back());
    }

    EXPECT_TRUE(brk.publish("fan", bytes("m")));

    for (const auto& s : streams) {
        ASSERT_EQ(s->count(), 1u);
        EXPECT_EQ(s->received()[0].payload, bytes("m"));
    }
    EXPECT_EQ(brk.get_stats().delivered, 50u);
}

TEST(broker, broken_subscriber_is_isolated_and_evicted) {
    pubsub::broker brk(make_log());
    auto s1 = std::make_shared<recording_stream>();
    auto s2 = std::make_shared<recording_stream>();
    auto s3 = std::make_shared<recording_stream>();
    auto session1 = brk.open_session("t", 1, s1);
    brk.open_session("t", 2, s2);
    brk.open_session("t", 3, s3);

    s1->sever();

    EXPECT_FALSE(brk.publish("t", bytes("x")));

    EXPECT_EQ(s2->count(), 1u);
    EXPECT_EQ(s3->count(), 1u);
    EXPECT_FALSE(brk.registry().contains("t", 1));
    EXPECT_TRUE(brk.registry().contains("t", 2));
    EXPECT_TRUE(session1->closed());

    // Already evicted
    EXPECT_FALSE(brk.unsubscribe("t", 1));

    auto stats = brk.get_stats();
    EXPECT_EQ(stats.delivery_failures, 1u);
    EXPECT_EQ(stats.evicted, 1u);
}

TEST(broker, throwing_stream_counts_as_delivery_failure) {
    pubsub::broker brk(make_log());
    auto bad = std::make_shared<recording_stream>();
    auto good = std::make_shared<recording_stream>();
    brk.open_session("t", 1, bad);
    brk.open_session("t", 2, good);

    bad->break_with_exception();

    EXPECT_FALSE(brk.publish("t", bytes("x")));
    EXPECT_EQ(good->count(), 1u);
    EXPECT_FALSE(brk.registry().contains("t", 1));
}

TEST(broker, publish_after_eviction_succeeds_again) {
    pubsub::broker brk(make_log());
    auto dead = std::make_shared<recording_stream>();
    auto live = std::make_shared<recording_stream>();
    brk.open_session("t", 1, dead);
    brk.open_session("t", 2, live);
    dead->sever();

    EXPECT_FALSE(brk.publish("t", bytes("a")));
    EXPECT_TRUE(brk.publish("t", bytes("b")));
    EXPECT_EQ(live->count(), 2u);
}

TEST(broker, unsubscribe_twice) {
    pubsub::broker brk(make_log());
    auto stream = std::make_shared<recording_stream>();
    auto session = brk.open_session("t", 5, stream);

    EXPECT_TRUE(brk.unsubscribe("t", 5));
    EXPECT_TRUE(session->closed());
    EXPECT_FALSE(brk.unsubscribe("t", 5));
}

TEST(broker, unsubscribe_never_subscribed) {
    pubsub::broker brk(make_log());
    EXPECT_FALSE(brk.unsubscribe("t", 99));
}

TEST(broker, unsubscribed_subscriber_receives_nothing) {
    pubsub::broker brk(make_log());
    auto stream = std::make_shared<recording_stream>();
    brk.open_session("t", 1, stream);
    brk.unsubscribe("t", 1);

    EXPECT_TRUE(brk.publish("t", bytes("x")));
    EXPECT_EQ(stream->count(), 0u);
}

TEST(broker, no_cross_topic_delivery) {
    pubsub::broker brk(make_log());
    auto on_t1 = std::make_shared<recording_stream>();
    auto on_t2 = std::make_shared<recording_stream>();
    brk.open_session("t1", 1, on_t1);
    brk.open_session("t2", 2, on_t2);

    EXPECT_TRUE(brk.publish("t1", bytes("only t1")));

    EXPECT_EQ(on_t1->count(), 1u);
    EXPECT_EQ(on_t2->count(), 0u);
}

TEST(broker, same_id_on_two_topics_is_two_subscriptions) {
    pubsub::broker brk(make_log());
    auto a = std::make_shared<recording_stream>();
    auto b = std::make_shared<recording_stream>();
    brk.open_session("a", 1, a);
    brk.open_session("b", 1, b);

    brk.publish("a", bytes("1"));
    brk.publish("b", bytes("2"));

    ASSERT_EQ(a->count(), 1u);
    ASSERT_EQ(b->count(), 1u);
    EXPECT_EQ(a->received()[0].topic, "a");
    EXPECT_EQ(b->received()[0].topic, "b");
}

TEST(broker, resubscribe_replaces_stream_and_closes_old_session) {
    pubsub::broker brk(make_log());
    auto old_stream = std::make_shared<recording_stream>();
    auto new_stream = std::make_shared<recording_stream>();

    auto old_session = brk.open_session("t", 1, old_stream);
    auto new_session = brk.open_session("t", 1, new_stream);

    EXPECT_TRUE(old_session->closed());
    EXPECT_FALSE(new_session->closed());
    EXPECT_EQ(brk.registry().size(), 1u);

    EXPECT_TRUE(brk.publish("t", bytes("x")));
    EXPECT_EQ(old_stream->count(), 0u);
    EXPECT_EQ(new_stream->count(), 1u);
}

TEST(broker, blocking_subscribe_returns_on_unsubscribe) {
    pubsub::broker brk(make_log());
    auto stream = std::make_shared<recording_stream>();

    std::atomic<bool> returned{false};
    std::thread subscriber([&] {
        brk.subscribe("t", 1, stream);
        returned = true;
    });

    while (!brk.registry().contains("t", 1)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    EXPECT_TRUE(brk.publish("t", bytes("x")));
    EXPECT_EQ(stream->count(), 1u);
    EXPECT_FALSE(returned.load());

    EXPECT_TRUE(brk.unsubscribe("t", 1));
    subscriber.join();
    EXPECT_TRUE(returned.load());
}

TEST(broker, blocking_subscribe_returns_on_eviction) {
    pubsub::broker brk(make_log());
    auto stream = std::make_shared<recording_stream>();

    std::thread subscriber([&] { brk.subscribe("t", 1, stream); });
    while (!brk.registry().contains("t", 1)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    stream->sever();
    EXPECT_FALSE(brk.publish("t", bytes("x")));
    subscriber.join();
    EXPECT_FALSE(brk.registry().contains("t", 1));
}

TEST(broker, disconnect_closes_sessions_and_next_publish_evicts) {
    pubsub::broker brk(make_log());
    auto a = std::make_shared<recording_stream>();
    auto b = std::make_shared<recording_stream>();
    auto other = std::make_shared<recording_stream>();
    auto sa = brk.open_session("a", 7, a);
    auto sb = brk.open_session("b", 7, b);
    brk.open_session("a", 8, other);

    EXPECT_EQ(brk.disconnect(7), 2u);
    EXPECT_TRUE(sa->closed());
    EXPECT_TRUE(sb->closed());

    // Eviction stays lazy
    EXPECT_TRUE(brk.registry().contains("a", 7));
    EXPECT_TRUE(brk.registry().contains("b", 7));

    EXPECT_FALSE(brk.publish("a", bytes("x")));
    EXPECT_FALSE(brk.registry().contains("a", 7));
    EXPECT_TRUE(brk.registry().contains("b", 7));
    EXPECT_EQ(a->count(), 0u);
    EXPECT_EQ(other->count(), 1u);
}

TEST(broker, shutdown_releases_blocked_subscribers) {
    pubsub::broker brk(make_log());

    std::vector<std::thread> subscribers;
    for (pubsub::subscriber_id id = 1; id <= 4; ++id) {
        subscribers.emplace_back([&brk, id] {
            brk.subscribe("t", id, std::make_shared<recording_stream>());
        });
    }
    while (brk.registry().size() < 4) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    brk.shutdown();
    for (auto& t : subscribers) t.join();
    EXPECT_EQ(brk.registry().size(), 0u);
}

TEST(broker, concurrent_publishes_never_interleave_writes_to_one_stream) {
    pubsub::broker brk(make_log());
    auto stream = std::make_shared<recording_stream>();
    stream->set_write_delay(std::chrono::milliseconds(1));
    brk.open_session("t", 1, stream);

    constexpr int kThreads = 4;
    constexpr int kPerThread = 20;

    std::vector<std::thread> publishers;
    for (int i = 0; i < kThreads; ++i) {
        publishers.emplace_back([&brk] {
            for (int j = 0; j < kPerThread; ++j) {
                brk.publish("t", bytes("m"));
            }
        });
    }
    for (auto& t : publishers) t.join();

    EXPECT_EQ(stream->count(), static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_FALSE(stream->overlapped());
}

TEST(broker, publishes_from_one_thread_arrive_in_order) {
    pubsub::broker brk(make_log());
    auto stream = std::make_shared<recording_stream>();
    brk.open_session("t", 1, stream);

    for (int i = 0; i < 100; ++i) {
        brk.publish("t", bytes(std::to_string(i)));
    }

    auto got = stream->received();
    ASSERT_EQ(got.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(got[i].payload, bytes(std::to_string(i)));
    }
}

TEST(broker, registry_stays_consistent_under_concurrent_churn) {
    pubsub::broker brk(make_log());
    std::atomic<bool> stop{false};

    std::vector<std::thread> threads;

    // Subscribers churn on two topics
    for (int t = 0; t < 3; ++t) {
        threads.emplace_back([&brk, &stop, t] {
            pubsub::subscriber_id base = static_cast<pubsub::subscriber_id>(t) * 100;
            int n = 0;
            while (!stop) {
                auto id = base + (n % 10);
                auto topic = (n % 2) ? "even" : "odd";
                auto stream = std::make_shared<recording_stream>();
                if (n % 7 == 0) stream->sever();
                brk.open_session(topic, id, stream);
                if (n % 3 == 0) brk.unsubscribe(topic, id);
                ++n;
            }
        });
    }

    // Publishers on both topics
    for (int t = 0; t < 2; ++t) {
        threads.emplace_back([&brk, &stop, t] {
            while (!stop) {
                brk.publish(t ? "even" : "odd", bytes("p"));
            }
        });
    }

    // Observer checks the lock set matches the entry set
    for (int i = 0; i < 2000; ++i) {
        auto c = brk.registry().get_counts();
        EXPECT_EQ(c.delivery_locks, c.entries);
        if (i % 10 == 0) std::this_thread::sleep_for(std::chrono::microseconds(200));
    }

    stop = true;
    for (auto& t : threads) t.join();

    auto c = brk.registry().get_counts();
    EXPECT_EQ(c.delivery_locks, c.entries);

    // Every severed stream left behind is evicted by one more pass
    brk.publish("even", bytes("final"));
    brk.publish("odd", bytes("final"));
    EXPECT_TRUE(brk.publish("even", bytes("final")));
    EXPECT_TRUE(brk.publish("odd", bytes("final")));
}

TEST(broker, stats_track_publishes_and_subscriptions) {
    pubsub::broker brk(make_log());
    auto s = std::make_shared<recording_stream>();
    brk.open_session("t", 1, s);
    brk.open_session("u", 2, std::make_shared<recording_stream>());

    brk.publish("t", bytes("a"));
    brk.publish("none", bytes("b"));

    auto stats = brk.get_stats();
    EXPECT_EQ(stats.publishes, 2u);
    EXPECT_EQ(stats.delivered, 1u);
    EXPECT_EQ(stats.delivery_failures, 0u);
    EXPECT_EQ(stats.subscriptions, 2u);
}
