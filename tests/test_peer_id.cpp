#include <gtest/gtest.h>
#include "peer_id.hpp"
#include "ed25519_key.hpp"
#include "errors.hpp"
#include <unordered_set>

using namespace namesys;

TEST(PeerIdTest, DerivedFromPublicKey) {
    auto key = Ed25519Key::generate();
    PeerId id = PeerId::from_public_key(key.public_bytes());

    ASSERT_EQ(id.bytes().size(), PeerId::SIZE);
    EXPECT_EQ(id.bytes()[0], 0x12);
    EXPECT_EQ(id.bytes()[1], 0x20);
    EXPECT_EQ(id.to_string().substr(0, 2), "Qm");
    EXPECT_EQ(id, PeerId::from_public_key(key.public_bytes()));
}

TEST(PeerIdTest, ParseAcceptsBothForms) {
    auto key = Ed25519Key::generate();
    PeerId id = PeerId::from_public_key(key.public_bytes());

    EXPECT_EQ(PeerId::parse(id.to_string()), id);
    EXPECT_EQ(PeerId::parse("/ipns/" + id.to_string()), id);
}

TEST(PeerIdTest, ParseRejectsMalformed) {
    EXPECT_THROW(PeerId::parse(""), MalformedNameError);
    EXPECT_THROW(PeerId::parse("/ipns/"), MalformedNameError);
    EXPECT_THROW(PeerId::parse("not-base58-0OIl"), MalformedNameError);
    // Valid base58 but not a sha2-256 multihash
    EXPECT_THROW(PeerId::parse("StV1DL6CwTryKyV"), MalformedNameError);
}

TEST(PeerIdTest, DistinctKeysDistinctIds) {
    std::unordered_set<PeerId> ids;
    for (int i = 0; i < 8; ++i) {
        ids.insert(PeerId::from_public_key(Ed25519Key::generate().public_bytes()));
    }
    EXPECT_EQ(ids.size(), 8u);
}
