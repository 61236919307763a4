// MINTGUARD - Mint Factor Calculator Tests
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#include <gtest/gtest.h>
#include <mintguard/issuance/mintfactor.h>

#include <algorithm>
#include <cstdint>
#include <random>

namespace mintguard {
namespace issuance {
namespace {

// ============================================================================
// Test Fixture
// ============================================================================

class MintFactorTest : public ::testing::Test {
protected:
    IssuerRecord MakeRecord(Amount totalMinted, uint64_t mintCount,
                            Amount totalBurned = 0, uint64_t burnCount = 0) {
        IssuerRecord r;
        r.totalMinted = totalMinted;
        r.mintCount = mintCount;
        r.totalBurned = totalBurned;
        r.burnCount = burnCount;
        return r;
    }

    IssuanceParams params_ = IssuanceParams::Main();
};

// ============================================================================
// Formula Tests
// ============================================================================

TEST_F(MintFactorTest, BootstrapReturnsBase) {
    auto b = ComputeMintFactorBreakdown(MakeRecord(500, 3), 0, params_);
    EXPECT_TRUE(b.bootstrap);
    EXPECT_EQ(b.factor, params_.nBaseMintFactor);
    EXPECT_EQ(ComputeMaxMintable(MakeRecord(500, 3), 0, params_), params_.nSupplyFloor);
}

TEST_F(MintFactorTest, FreshIssuerIsCappedAtBase) {
    // All three bonus conditions hold for an empty record: 100 + 30 -> 100
    auto b = ComputeMintFactorBreakdown(MakeRecord(0, 0), 1000, params_);
    EXPECT_FALSE(b.bootstrap);
    EXPECT_EQ(b.avgMint, 0);
    EXPECT_EQ(b.avgPercentMint, 0);
    EXPECT_EQ(b.adjustedBase, 100);
    EXPECT_TRUE(b.burnedAtLeastMinted);
    EXPECT_TRUE(b.avgBurnAtLeastAvgMint);
    EXPECT_TRUE(b.lowMintRate);
    EXPECT_EQ(b.burnOffset, 30);
    EXPECT_EQ(b.factor, 100);
}

TEST_F(MintFactorTest, HeavyMinterGetsZero) {
    // avgPercentMint = 1000 * 10000 / 10000 = 1000 >= base
    auto b = ComputeMintFactorBreakdown(MakeRecord(1000, 1), 10000, params_);
    EXPECT_EQ(b.avgPercentMint, 1000);
    EXPECT_EQ(b.adjustedBase, 0);
    EXPECT_FALSE(b.burnedAtLeastMinted);
    EXPECT_FALSE(b.avgBurnAtLeastAvgMint);
    EXPECT_FALSE(b.lowMintRate);
    EXPECT_EQ(b.factor, 0);
    EXPECT_EQ(ComputeMaxMintable(MakeRecord(1000, 1), 10000, params_), 0);
}

TEST_F(MintFactorTest, LowMintRateBonus) {
    // avgPercentMint 50 -> adjusted 50, only the low-rate bonus applies
    auto b = ComputeMintFactorBreakdown(MakeRecord(50, 1), 10000, params_);
    EXPECT_EQ(b.avgPercentMint, 50);
    EXPECT_EQ(b.adjustedBase, 50);
    EXPECT_EQ(b.burnOffset, 10);
    EXPECT_EQ(b.factor, 60);
    EXPECT_EQ(ComputeMaxMintable(MakeRecord(50, 1), 10000, params_), 60);
}

TEST_F(MintFactorTest, BurnBonuses) {
    // Burned 60 vs minted 50: every condition holds -> 50 + 30
    auto b = ComputeMintFactorBreakdown(MakeRecord(50, 1, 60, 1), 10000, params_);
    EXPECT_EQ(b.avgBurn, 60);
    EXPECT_TRUE(b.burnedAtLeastMinted);
    EXPECT_TRUE(b.avgBurnAtLeastAvgMint);
    EXPECT_EQ(b.factor, 80);
}

TEST_F(MintFactorTest, AveragesTruncate) {
    // avgMint = 100 / 3 = 33, avgBurn = 100 / 4 = 25
    auto b = ComputeMintFactorBreakdown(MakeRecord(100, 3, 100, 4), 100000, params_);
    EXPECT_EQ(b.avgMint, 33);
    EXPECT_EQ(b.avgBurn, 25);
    EXPECT_EQ(b.avgPercentMint, 3);   // 33 * 10000 / 100000
    EXPECT_TRUE(b.burnedAtLeastMinted);
    EXPECT_FALSE(b.avgBurnAtLeastAvgMint);
    EXPECT_EQ(b.factor, std::min<int64_t>(100, 97 + 20));
}

TEST_F(MintFactorTest, HugeAveragesDoNotOverflow) {
    auto b = ComputeMintFactorBreakdown(MakeRecord(MAX_SUPPLY, 1), 1, params_);
    EXPECT_EQ(b.avgPercentMint, INT64_MAX);
    EXPECT_EQ(b.factor, 0);

    // supply * factor exceeds 64 bits before division
    Amount max = ComputeMaxMintable(MakeRecord(0, 0), MAX_SUPPLY, params_);
    EXPECT_EQ(max, MAX_SUPPLY / 100);
}

TEST_F(MintFactorTest, CustomScale) {
    IssuanceParams p = params_;
    p.nMintFactorScale = 1000;
    p.nBaseMintFactor = 50;
    p.nBurnBonusUnit = 0;
    EXPECT_EQ(ComputeMintFactor(MakeRecord(0, 0), 5000, p), 50);
    EXPECT_EQ(ComputeMaxMintable(MakeRecord(0, 0), 5000, p), 250);
}

// ============================================================================
// Bound Tests
// ============================================================================

TEST_F(MintFactorTest, FactorAlwaysWithinZeroAndBase) {
    std::mt19937_64 rng(20240601);
    std::uniform_int_distribution<Amount> amount(0, 1000000 * COIN);
    std::uniform_int_distribution<uint64_t> count(0, 50);
    std::uniform_int_distribution<Amount> supply(1, 10000000 * COIN);

    for (int i = 0; i < 2000; ++i) {
        uint64_t mints = count(rng);
        uint64_t burns = count(rng);
        IssuerRecord r = MakeRecord(mints ? amount(rng) : 0, mints, burns ? amount(rng) : 0, burns);
        Amount s = supply(rng);

        int64_t factor = ComputeMintFactor(r, s, params_);
        ASSERT_GE(factor, 0);
        ASSERT_LE(factor, params_.nBaseMintFactor);

        Amount max = ComputeMaxMintable(r, s, params_);
        ASSERT_GE(max, 0);
        ASSERT_LE(max, s / 100);
    }
}

TEST_F(MintFactorTest, Deterministic) {
    IssuerRecord r = MakeRecord(12345, 7, 678, 2);
    EXPECT_EQ(ComputeMintFactor(r, 99999, params_), ComputeMintFactor(r, 99999, params_));
}

} // namespace
} // namespace issuance
} // namespace mintguard
