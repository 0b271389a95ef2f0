#include <gtest/gtest.h>
#include "republisher.hpp"
#include "name_system.hpp"
#include "transport/loopback_pubsub.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"

using namespace namesys;
using namespace std::chrono_literals;

class RepublisherTest : public ::testing::Test {
protected:
    void SetUp() override {
        EventLogger::set_min_level(EventLogger::Level::CRITICAL);
        MetricsRegistry::instance().reset();

        config.republish_initial_delay_sec = 0;
        config.republish_interval_sec = 1;
        key_info = keys.generate(config.self_key_name);
        transport = hub->connect(key_info.id.to_string(), keys.public_key_of(config.self_key_name));
        observer = hub->connect("observer", Bytes{});
        observer->subscribe(NameSystem::topic_for(key_info.id.to_string()), [this](const PubSubMessage& msg) {
            seen.push_back(RecordCodec::unmarshal(msg.data).sequence);
        });
        names = std::make_unique<NameSystem>(config, *transport, keys);
    }

    std::shared_ptr<LoopbackHub> hub = LoopbackHub::create();
    NameSysConfig config;
    MemoryKeyStore keys;
    KeyInfo key_info;
    std::unique_ptr<LoopbackPubSub> transport;
    std::vector<uint64_t> seen;
    std::unique_ptr<LoopbackPubSub> observer;
    std::unique_ptr<NameSystem> names;
};

TEST_F(RepublisherTest, RepublishesOnlyKeysWithRecords) {
    net::io_context ioc;
    Republisher republisher(ioc, config, keys, names->publisher());
    names->initialize_keyspace();
    keys.generate("unused");

    EXPECT_EQ(republisher.republish_now(), 1u);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], 1u);
    EXPECT_EQ(names->resolve(key_info.id.to_string()), NameSystem::EMPTY_DIRECTORY_PATH);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("republished_total"), 1.0);
}

TEST_F(RepublisherTest, RepublishKeepsValueAndAdvancesSequence) {
    PublishOptions options;
    options.resolve = false;
    names->publish("/ipfs/QmValue", options);

    auto result = names->publisher().republish(config.self_key_name);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, "/ipfs/QmValue");
    EXPECT_EQ(result->sequence, 1u);
    EXPECT_EQ(seen, (std::vector<uint64_t>{0, 1}));
}

TEST_F(RepublisherTest, TransportFailureIsContained) {
    net::io_context ioc;
    Republisher republisher(ioc, config, keys, names->publisher());
    names->initialize_keyspace();
    transport->set_offline(true);

    EXPECT_EQ(republisher.republish_now(), 0u);
    EXPECT_TRUE(seen.empty());
}

TEST_F(RepublisherTest, TimerDrivesRounds) {
    net::io_context ioc;
    Republisher republisher(ioc, config, keys, names->publisher());
    names->initialize_keyspace();

    republisher.start();
    ioc.run_for(1500ms);
    republisher.stop();

    EXPECT_GE(republisher.rounds(), 1u);
    EXPECT_GE(seen.size(), 1u);
    for (size_t i = 1; i < seen.size(); ++i) {
        EXPECT_GT(seen[i], seen[i - 1]);
    }
}
