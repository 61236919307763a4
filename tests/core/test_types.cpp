// MINTGUARD - Core Types Tests
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#include <gtest/gtest.h>
#include "mintguard/core/types.h"

#include <set>
#include <unordered_set>

namespace mintguard {
namespace test {

// ============================================================================
// Identity Tests
// ============================================================================

TEST(IdentityTest, DefaultIsNull) {
    Identity id;
    EXPECT_TRUE(id.IsNull());
    EXPECT_EQ(Identity::SIZE, 20u);
    EXPECT_EQ(id.size(), 20u);
}

TEST(IdentityTest, MakeIdentityFillsEveryByte) {
    Identity id = MakeIdentity(0xab);
    EXPECT_FALSE(id.IsNull());
    for (size_t i = 0; i < Identity::SIZE; ++i) {
        EXPECT_EQ(id[i], 0xab);
    }
}

TEST(IdentityTest, SetNull) {
    Identity id = MakeIdentity(0x01);
    id.SetNull();
    EXPECT_TRUE(id.IsNull());
}

TEST(IdentityTest, EqualityAndOrdering) {
    Identity a = MakeIdentity(0x01);
    Identity b = MakeIdentity(0x02);
    EXPECT_EQ(a, MakeIdentity(0x01));
    EXPECT_NE(a, b);
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_FALSE(a < a);
}

TEST(IdentityTest, ConstructFromShortBuffer) {
    const Byte raw[] = {0x01, 0x02, 0x03};
    Identity id(raw, sizeof(raw));
    EXPECT_EQ(id[0], 0x01);
    EXPECT_EQ(id[2], 0x03);
    EXPECT_EQ(id[3], 0x00);
}

// ============================================================================
// Hex Tests
// ============================================================================

TEST(IdentityHexTest, ToHexIsReversed) {
    std::array<Byte, 20> data{};
    data[0] = 0x01;
    data[19] = 0xfe;
    Identity id(data);
    EXPECT_EQ(id.ToHex(), "fe" + std::string(36, '0') + "01");
}

TEST(IdentityHexTest, FromHexRoundTrip) {
    const std::string hex = "6d696e7467756172642d636f6e74726f6c6c6572";
    Identity id = Identity::FromHex(hex);
    EXPECT_EQ(id.ToHex(), hex);
}

TEST(IdentityHexTest, FromHexAcceptsPrefixAndUppercase) {
    Identity lower = Identity::FromHex(std::string(40, 'a'));
    Identity prefixed = Identity::FromHex("0x" + std::string(40, 'A'));
    EXPECT_EQ(lower, prefixed);
    EXPECT_EQ(lower, MakeIdentity(0xaa));
}

TEST(IdentityHexTest, FromHexRejectsBadLength) {
    EXPECT_THROW(Identity::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Identity::FromHex(std::string(42, '1')), std::invalid_argument);
    EXPECT_THROW(Identity::FromHex(""), std::invalid_argument);
}

TEST(IdentityHexTest, FromHexRejectsBadCharacters) {
    EXPECT_THROW(Identity::FromHex(std::string(39, '0') + "g"), std::invalid_argument);
}

// ============================================================================
// Hasher Tests
// ============================================================================

TEST(IdentityHasherTest, UsableInUnorderedSet) {
    std::unordered_set<Identity, IdentityHasher> set;
    for (int i = 0; i < 50; ++i) {
        set.insert(MakeIdentity(static_cast<Byte>(i)));
    }
    set.insert(MakeIdentity(7));
    EXPECT_EQ(set.size(), 50u);
    EXPECT_EQ(set.count(MakeIdentity(7)), 1u);
    EXPECT_EQ(set.count(MakeIdentity(200)), 0u);
}

TEST(IdentityHasherTest, EqualIdentitiesHashEqual) {
    IdentityHasher hasher;
    Identity parsed = Identity::FromHex("4242424242424242424242424242424242424242");
    EXPECT_EQ(hasher(MakeIdentity(0x42)), hasher(parsed));
}

// ============================================================================
// Amount Tests
// ============================================================================

TEST(AmountTest, SupplyRange) {
    EXPECT_TRUE(SupplyRange(0));
    EXPECT_TRUE(SupplyRange(MAX_SUPPLY));
    EXPECT_FALSE(SupplyRange(-1));
    EXPECT_FALSE(SupplyRange(MAX_SUPPLY + 1));
}

TEST(AmountTest, FormatAmount) {
    EXPECT_EQ(FormatAmount(0), "0.00000000");
    EXPECT_EQ(FormatAmount(COIN), "1.00000000");
    EXPECT_EQ(FormatAmount(COIN + 5), "1.00000005");
    EXPECT_EQ(FormatAmount(-COIN / 2), "-0.50000000");
    EXPECT_EQ(FormatAmount(1000000 * COIN), "1000000.00000000");
}

} // namespace test
} // namespace mintguard
