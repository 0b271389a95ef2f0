#include <gtest/gtest.h>
#include "transport/loopback_pubsub.hpp"
#include "errors.hpp"

using namespace namesys;

class LoopbackPubSubTest : public ::testing::Test {
protected:
    std::shared_ptr<LoopbackHub> hub = LoopbackHub::create();
    std::unique_ptr<LoopbackPubSub> a = hub->connect("peerA", Bytes{1});
    std::unique_ptr<LoopbackPubSub> b = hub->connect("peerB", Bytes{2});
};

TEST_F(LoopbackPubSubTest, DeliversToOtherSubscribersOnly) {
    std::vector<PubSubMessage> at_a, at_b;
    a->subscribe("t", [&](const PubSubMessage& m) { at_a.push_back(m); });
    b->subscribe("t", [&](const PubSubMessage& m) { at_b.push_back(m); });

    a->publish("t", "hello");
    ASSERT_EQ(at_b.size(), 1u);
    EXPECT_TRUE(at_a.empty());
    EXPECT_EQ(at_b[0].from, "peerA");
    EXPECT_EQ(at_b[0].key, Bytes{1});
    EXPECT_EQ(at_b[0].data, "hello");
    EXPECT_EQ(at_b[0].seqno, 1u);

    b->unsubscribe("t");
    a->publish("t", "again");
    EXPECT_EQ(at_b.size(), 1u);
}

TEST_F(LoopbackPubSubTest, ListsRemoteSubscribers) {
    EXPECT_TRUE(a->list_subscribers("t").empty());
    a->subscribe("t", [](const PubSubMessage&) {});
    b->subscribe("t", [](const PubSubMessage&) {});

    EXPECT_EQ(a->list_subscribers("t"), std::vector<std::string>{"peerB"});
    EXPECT_EQ(b->list_subscribers("t"), std::vector<std::string>{"peerA"});
}

TEST_F(LoopbackPubSubTest, OfflineEndpointFailsPublish) {
    a->set_offline(true);
    EXPECT_THROW(a->publish("t", "x"), TransportError);
    a->set_offline(false);
    EXPECT_NO_THROW(a->publish("t", "x"));
}

TEST_F(LoopbackPubSubTest, EndpointsDetachOnDestruction) {
    EXPECT_EQ(hub->endpoint_count(), 2u);
    b.reset();
    EXPECT_EQ(hub->endpoint_count(), 1u);
}
