#include <gtest/gtest.h>
#include "transport/redis_pubsub.hpp"
#include "namesys_config.hpp"
#include "event_logger.hpp"
#include "errors.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <mutex>

using namespace namesys;

TEST(RedisEnvelopeTest, EncodeDecode) {
    PubSubMessage msg;
    msg.topic = "/record/abc";
    msg.from = "QmSender";
    msg.key = Bytes{1, 2, 3};
    msg.seqno = 17;
    msg.data = std::string("{\"binary\":\0\"}", 13);

    PubSubMessage out;
    ASSERT_TRUE(RedisPubSub::decode_envelope("/record/abc", RedisPubSub::encode_envelope(msg), out));
    EXPECT_EQ(out.topic, msg.topic);
    EXPECT_EQ(out.from, msg.from);
    EXPECT_EQ(out.key, msg.key);
    EXPECT_EQ(out.seqno, 17u);
    EXPECT_EQ(out.data, msg.data);
}

TEST(RedisEnvelopeTest, RejectsMalformedEnvelopes) {
    PubSubMessage out;
    EXPECT_FALSE(RedisPubSub::decode_envelope("t", "", out));
    EXPECT_FALSE(RedisPubSub::decode_envelope("t", "[]", out));
    EXPECT_FALSE(RedisPubSub::decode_envelope("t", "{\"from\":\"a\",\"key\":\"\",\"seqno\":1}", out));
    EXPECT_FALSE(RedisPubSub::decode_envelope("t", "{\"from\":\"a\",\"key\":\"\",\"seqno\":-1,\"data\":\"\"}", out));
    EXPECT_FALSE(RedisPubSub::decode_envelope("t", "{\"from\":\"a\",\"key\":\"!!\",\"seqno\":1,\"data\":\"\"}", out));
    EXPECT_FALSE(RedisPubSub::decode_envelope("t", "{\"from\":1,\"key\":\"\",\"seqno\":1,\"data\":\"\"}", out));
}

class RedisPubSubTest : public ::testing::Test {
protected:
    void SetUp() override {
        EventLogger::set_min_level(EventLogger::Level::CRITICAL);
        config.redis_url = "tcp://127.0.0.1:6379?socket_timeout=100ms";
        topic = "/record/test-" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count());
        a = std::make_unique<RedisPubSub>(config, "peerA", Bytes{1});
        b = std::make_unique<RedisPubSub>(config, "peerB", Bytes{2});
    }

    NameSysConfig config;
    std::string topic;
    std::unique_ptr<RedisPubSub> a;
    std::unique_ptr<RedisPubSub> b;
};

TEST_F(RedisPubSubTest, ConnectionStatus) {
    if (!a->is_connected()) {
        GTEST_SKIP() << "Redis not available at 127.0.0.1:6379";
    }
    EXPECT_TRUE(b->is_connected());
    EXPECT_EQ(a->local_peer_id(), "peerA");
}

namespace {

// Polls until the peer shows up in the topic's presence set.
bool await_presence(RedisPubSub& observer, const std::string& topic, const std::string& peer) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (std::chrono::steady_clock::now() < deadline) {
        auto peers = observer.list_subscribers(topic);
        if (std::find(peers.begin(), peers.end(), peer) != peers.end()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

}

TEST_F(RedisPubSubTest, PresenceListsRemotePeers) {
    if (!a->is_connected()) GTEST_SKIP();

    b->subscribe(topic, [](const PubSubMessage&) {});
    a->subscribe(topic, [](const PubSubMessage&) {});

    ASSERT_TRUE(await_presence(*a, topic, "peerB"));
    EXPECT_EQ(a->list_subscribers(topic), std::vector<std::string>{"peerB"});
    b->unsubscribe(topic);
    EXPECT_TRUE(a->list_subscribers(topic).empty());
}

TEST_F(RedisPubSubTest, AdvertisedSubscriberReceivesFirstPublish) {
    if (!a->is_connected()) GTEST_SKIP();

    std::atomic<int> at_b{0};
    b->subscribe(topic, [&](const PubSubMessage&) { ++at_b; });
    ASSERT_TRUE(await_presence(*a, topic, "peerB"));

    // Presence implies the channel subscription is live: one publish suffices
    a->publish(topic, "record-bytes");
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (at_b == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(at_b.load(), 1);
}

TEST_F(RedisPubSubTest, UnsubscribeWaitsForRunningHandler) {
    if (!a->is_connected()) GTEST_SKIP();

    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    b->subscribe(topic, [&](const PubSubMessage&) {
        started = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        finished = true;
    });
    ASSERT_TRUE(await_presence(*a, topic, "peerB"));

    a->publish(topic, "slow");
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!started && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(started.load());

    b->unsubscribe(topic);
    EXPECT_TRUE(finished.load());
}

TEST_F(RedisPubSubTest, PublishReachesOtherNodeOnly) {
    if (!a->is_connected()) GTEST_SKIP();

    std::atomic<int> at_a{0};
    std::atomic<int> at_b{0};
    std::string received;
    std::mutex received_mutex;
    a->subscribe(topic, [&](const PubSubMessage&) { ++at_a; });
    b->subscribe(topic, [&](const PubSubMessage& m) {
        std::lock_guard<std::mutex> lock(received_mutex);
        received = m.data;
        ++at_b;
    });

    // The SUBSCRIBE is issued asynchronously by the subscriber thread
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (at_b == 0 && std::chrono::steady_clock::now() < deadline) {
        a->publish(topic, "record-bytes");
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    ASSERT_GT(at_b.load(), 0);
    EXPECT_EQ(at_a.load(), 0);
    std::lock_guard<std::mutex> lock(received_mutex);
    EXPECT_EQ(received, "record-bytes");
}

TEST(RedisPubSubOfflineTest, PublishFailsWithoutServer) {
    EventLogger::set_min_level(EventLogger::Level::CRITICAL);
    NameSysConfig config;
    config.redis_url = "tcp://127.0.0.1:1?socket_timeout=100ms&connect_timeout=100ms";
    RedisPubSub transport(config, "peerX", Bytes{});

    EXPECT_FALSE(transport.is_connected());
    EXPECT_THROW(transport.publish("t", "x"), TransportError);
    EXPECT_TRUE(transport.list_subscribers("t").empty());
}
