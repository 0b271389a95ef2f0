#include <gtest/gtest.h>
#include "name_cache.hpp"
#include <algorithm>
#include <random>
#include <thread>
#include <vector>

using namespace namesys;
using namespace std::chrono_literals;

class NameCacheTest : public ::testing::Test {
protected:
    Ed25519Key key = Ed25519Key::generate();
    PeerId id = PeerId::from_public_key(key.public_bytes());
    NameCache::Clock::time_point now = NameCache::Clock::now();
    NameCache cache;

    NameRecord make(uint64_t seq, std::chrono::seconds lifetime = 3600s) {
        return RecordCodec::build(key, "/ipfs/v" + std::to_string(seq), seq, now + lifetime, 60s);
    }
};

TEST_F(NameCacheTest, EmptyCache) {
    EXPECT_FALSE(cache.get(id, now).has_value());
    EXPECT_FALSE(cache.last_sequence(id).has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(NameCacheTest, SequenceOnlyAdvances) {
    EXPECT_EQ(cache.offer(id, make(1), NameCache::Origin::NETWORK, now), NameCache::OfferResult::ADVANCED);
    EXPECT_EQ(cache.offer(id, make(5), NameCache::Origin::NETWORK, now), NameCache::OfferResult::ADVANCED);
    EXPECT_EQ(cache.offer(id, make(3), NameCache::Origin::NETWORK, now), NameCache::OfferResult::IGNORED);
    EXPECT_EQ(cache.offer(id, make(5), NameCache::Origin::NETWORK, now), NameCache::OfferResult::CONFIRMED);

    auto entry = cache.get(id, now);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->record.sequence, 5u);
    EXPECT_EQ(entry->record.value_string(), "/ipfs/v5");
    EXPECT_EQ(cache.last_sequence(id), std::optional<uint64_t>(5));
}

TEST_F(NameCacheTest, DuplicateRefreshesConfirmation) {
    auto record = make(2);
    cache.offer(id, record, NameCache::Origin::NETWORK, now);
    EXPECT_EQ(cache.offer(id, record, NameCache::Origin::NETWORK, now + 10s), NameCache::OfferResult::CONFIRMED);

    auto entry = cache.get(id, now + 10s);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->recorded_at, now);
    EXPECT_EQ(entry->confirmed_at, now + 10s);
}

TEST_F(NameCacheTest, ExpiredRecordsNeverStored) {
    EXPECT_EQ(cache.offer(id, make(1, 1s), NameCache::Origin::NETWORK, now + 2s), NameCache::OfferResult::IGNORED);
    EXPECT_FALSE(cache.get(id, now + 2s).has_value());
}

TEST_F(NameCacheTest, ExpiredEntryCanBeReplacedByLowerSequence) {
    cache.offer(id, make(9, 1s), NameCache::Origin::NETWORK, now);
    EXPECT_FALSE(cache.get(id, now + 2s).has_value());
    EXPECT_EQ(cache.last_sequence(id), std::optional<uint64_t>(9));

    EXPECT_EQ(cache.offer(id, make(4), NameCache::Origin::NETWORK, now + 2s), NameCache::OfferResult::ADVANCED);
    EXPECT_EQ(cache.get(id, now + 2s)->record.sequence, 4u);
}

TEST_F(NameCacheTest, ArrivalOrderDoesNotMatter) {
    std::vector<NameRecord> records;
    for (uint64_t seq = 0; seq < 20; ++seq) records.push_back(make(seq));
    std::mt19937 rng(7);
    std::shuffle(records.begin(), records.end(), rng);

    for (const auto& r : records) cache.offer(id, r, NameCache::Origin::NETWORK, now);
    EXPECT_EQ(cache.get(id, now)->record.sequence, 19u);
}

TEST_F(NameCacheTest, ConcurrentOffersKeepHighest) {
    std::vector<NameRecord> records;
    for (uint64_t seq = 0; seq < 64; ++seq) records.push_back(make(seq));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            for (size_t i = t; i < records.size(); i += 4) {
                cache.offer(id, records[records.size() - 1 - i], NameCache::Origin::NETWORK, now);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(cache.get(id, now)->record.sequence, 63u);
}

TEST_F(NameCacheTest, EvictExpired) {
    auto other_key = Ed25519Key::generate();
    PeerId other = PeerId::from_public_key(other_key.public_bytes());

    cache.offer(id, make(1, 1s), NameCache::Origin::NETWORK, now);
    cache.offer(other, RecordCodec::build(other_key, "/ipfs/x", 0, now + 1h, 60s),
                NameCache::Origin::LOCAL, now);
    EXPECT_EQ(cache.size(), 2u);

    EXPECT_EQ(cache.evict_expired(now + 2s), 1u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_FALSE(cache.last_sequence(id).has_value());
    EXPECT_EQ(cache.get(other, now + 2s)->origin, NameCache::Origin::LOCAL);
}
