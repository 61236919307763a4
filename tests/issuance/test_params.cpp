// MINTGUARD - Issuance Parameters, Errors and Notification Tests
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#include <gtest/gtest.h>
#include <mintguard/issuance/errors.h>
#include <mintguard/issuance/events.h>
#include <mintguard/issuance/params.h>
#include <mintguard/util/config.h>

#include <stdexcept>

namespace mintguard {
namespace issuance {
namespace {

// ============================================================================
// Preset Tests
// ============================================================================

TEST(IssuanceParamsTest, MainPreset) {
    IssuanceParams p = IssuanceParams::Main();
    EXPECT_EQ(p.strNetworkID, "main");
    EXPECT_EQ(p.nMaxIssuers, 10u);
    EXPECT_EQ(p.nIssuerTermLength, 201600);
    EXPECT_EQ(p.nEarlyExitThresholdBps, 9500);
    EXPECT_EQ(p.nMintFactorScale, 10000);
    EXPECT_EQ(p.nBaseMintFactor, 100);
    EXPECT_EQ(p.nBurnBonusUnit, 10);
    EXPECT_EQ(p.nLowMintThreshold, 200);
    EXPECT_EQ(p.nSupplyFloor, 1000000 * COIN);
    EXPECT_FALSE(p.controllerIdentity.IsNull());
    EXPECT_EQ(p.Validate(), "");
}

TEST(IssuanceParamsTest, RegTestPreset) {
    IssuanceParams p = IssuanceParams::RegTest();
    EXPECT_EQ(p.strNetworkID, "regtest");
    EXPECT_EQ(p.controllerIdentity, MakeIdentity(0xcc));
    EXPECT_EQ(p.nMaxIssuers, 3u);
    EXPECT_EQ(p.nIssuerTermLength, 100);
    EXPECT_EQ(p.nSupplyFloor, 1000 * COIN);
    EXPECT_EQ(p.nBaseMintFactor, IssuanceParams::Main().nBaseMintFactor);
    EXPECT_EQ(p.Validate(), "");
}

TEST(IssuanceParamsTest, EarlyExitThreshold) {
    IssuanceParams main = IssuanceParams::Main();
    // 95% of 201600 is 191520
    EXPECT_TRUE(main.IsEarlyExit(0));
    EXPECT_TRUE(main.IsEarlyExit(191519));
    EXPECT_FALSE(main.IsEarlyExit(191520));
    EXPECT_FALSE(main.IsEarlyExit(201600));

    IssuanceParams reg = IssuanceParams::RegTest();
    EXPECT_TRUE(reg.IsEarlyExit(94));
    EXPECT_FALSE(reg.IsEarlyExit(95));
}

TEST(IssuanceParamsTest, FullThresholdMeansAnyExitBeforeExpiryIsEarly) {
    IssuanceParams p = IssuanceParams::RegTest();
    p.nEarlyExitThresholdBps = BPS_DENOMINATOR;
    EXPECT_TRUE(p.IsEarlyExit(99));
    EXPECT_FALSE(p.IsEarlyExit(100));
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST(IssuanceParamsTest, ValidateRejectsBadValues) {
    auto check = [](void (*mutate)(IssuanceParams&)) {
        IssuanceParams p = IssuanceParams::RegTest();
        mutate(p);
        return p.Validate();
    };

    EXPECT_NE(check([](IssuanceParams& p) { p.nMaxIssuers = 0; }), "");
    EXPECT_NE(check([](IssuanceParams& p) { p.nIssuerTermLength = 0; }), "");
    EXPECT_NE(check([](IssuanceParams& p) { p.nMintFactorScale = 0; }), "");
    EXPECT_NE(check([](IssuanceParams& p) { p.nBaseMintFactor = -1; }), "");
    EXPECT_NE(check([](IssuanceParams& p) { p.nBaseMintFactor = p.nMintFactorScale + 1; }), "");
    EXPECT_NE(check([](IssuanceParams& p) { p.nBurnBonusUnit = -1; }), "");
    EXPECT_NE(check([](IssuanceParams& p) { p.nLowMintThreshold = -1; }), "");
    EXPECT_NE(check([](IssuanceParams& p) { p.nEarlyExitThresholdBps = 0; }), "");
    EXPECT_NE(check([](IssuanceParams& p) { p.nEarlyExitThresholdBps = 10001; }), "");
    EXPECT_NE(check([](IssuanceParams& p) { p.nSupplyFloor = -1; }), "");
    EXPECT_NE(check([](IssuanceParams& p) { p.nSupplyFloor = MAX_SUPPLY + 1; }), "");

    EXPECT_EQ(check([](IssuanceParams& p) { p.nSupplyFloor = 0; }), "");
    EXPECT_EQ(check([](IssuanceParams& p) { p.nBaseMintFactor = p.nMintFactorScale; }), "");
}

// ============================================================================
// Configuration Tests
// ============================================================================

TEST(IssuanceParamsTest, FromEmptyConfigIsMain) {
    util::ConfigManager config;
    IssuanceParams p = IssuanceParams::FromConfig(config);
    EXPECT_EQ(p.strNetworkID, "main");
    EXPECT_EQ(p.nMaxIssuers, 10u);
}

TEST(IssuanceParamsTest, FromConfigRegTestWithOverrides) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString(R"(
regtest=1
maxissuers=5
termlength=999

[regtest]
termlength=40
supplyfloor=0

[main]
maxissuers=7
)").success);

    IssuanceParams p = IssuanceParams::FromConfig(config);
    EXPECT_EQ(p.strNetworkID, "regtest");
    EXPECT_EQ(p.nMaxIssuers, 5u);          // global key, [main] ignored
    EXPECT_EQ(p.nIssuerTermLength, 40);    // section beats global
    EXPECT_EQ(p.nSupplyFloor, 0);
    EXPECT_EQ(p.controllerIdentity, MakeIdentity(0xcc));
}

TEST(IssuanceParamsTest, FromConfigController) {
    util::ConfigManager config;
    config.Set(util::ConfigKeys::CONTROLLER, "0x" + std::string(40, 'e'));
    IssuanceParams p = IssuanceParams::FromConfig(config);
    EXPECT_EQ(p.controllerIdentity, MakeIdentity(0xee));
}

TEST(IssuanceParamsTest, FromConfigRejectsMalformedValues) {
    util::ConfigManager config;
    config.Set(util::ConfigKeys::TERMLENGTH, "ten");
    EXPECT_THROW(IssuanceParams::FromConfig(config), std::invalid_argument);

    util::ConfigManager negative;
    negative.Set(util::ConfigKeys::MAXISSUERS, "-1");
    EXPECT_THROW(IssuanceParams::FromConfig(negative), std::invalid_argument);

    util::ConfigManager badHex;
    badHex.Set(util::ConfigKeys::CONTROLLER, "xyz");
    EXPECT_THROW(IssuanceParams::FromConfig(badHex), std::invalid_argument);
}

// ============================================================================
// Error Tests
// ============================================================================

TEST(IssuanceErrorTest, NamesRoundTrip) {
    for (int i = 0; i < static_cast<int>(IssuanceError::ERROR_COUNT); ++i) {
        auto err = static_cast<IssuanceError>(i);
        auto parsed = IssuanceErrorFromName(IssuanceErrorName(err));
        ASSERT_TRUE(parsed.has_value()) << IssuanceErrorName(err);
        EXPECT_EQ(*parsed, err);
        EXPECT_FALSE(IssuanceErrorString(err).empty());
    }
    EXPECT_FALSE(IssuanceErrorFromName("NoSuchError").has_value());
}

TEST(IssuanceErrorTest, ResultFactories) {
    auto ok = IssuanceResult::Success(5 * COIN);
    EXPECT_TRUE(ok.IsOk());
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_EQ(ok.amount, 5 * COIN);

    auto fail = IssuanceResult::Failure(IssuanceError::CapReached);
    EXPECT_FALSE(fail.IsOk());
    EXPECT_EQ(fail.error, IssuanceError::CapReached);
    EXPECT_EQ(fail.message, IssuanceErrorString(IssuanceError::CapReached));

    auto detailed = IssuanceResult::Failure(IssuanceError::ExceedsMaxSupply, "ledger refused");
    EXPECT_EQ(detailed.message,
              IssuanceErrorString(IssuanceError::ExceedsMaxSupply) + ": ledger refused");
}

// ============================================================================
// Notification Tests
// ============================================================================

TEST(IssuanceEventTest, Names) {
    EXPECT_STREQ(EventName(IssuerAuthorizedEvent{}), "IssuerAuthorized");
    EXPECT_STREQ(EventName(IssuerDeauthorizedEvent{}), "IssuerDeauthorized");
    EXPECT_STREQ(EventName(IssuerAuthorizationTransferredEvent{}),
                 "IssuerAuthorizationTransferred");
    EXPECT_STREQ(EventName(IssuerActivityEvent{}), "IssuerActivity");
}

TEST(IssuanceEventTest, Format) {
    IssuerAuthorizedEvent authorized{MakeIdentity(0x01), 110};
    EXPECT_EQ(FormatEvent(authorized),
              "IssuerAuthorized issuer=" + std::string(40, '1') + " expiration=110");

    IssuerActivityEvent activity;
    activity.issuer = MakeIdentity(0x02);
    activity.minted = COIN;
    activity.totalMinted = COIN;
    activity.mintCount = 1;
    std::string text = FormatEvent(activity);
    EXPECT_EQ(text.rfind("IssuerActivity issuer=", 0), 0u);
    EXPECT_NE(text.find("minted=1.00000000"), std::string::npos);
    EXPECT_NE(text.find("mintCount=1"), std::string::npos);
    EXPECT_NE(text.find("burnCount=0"), std::string::npos);
}

TEST(EventJournalTest, AppendSinceAndListener) {
    EventJournal journal;
    std::vector<BlockHeight> heard;
    journal.SetListener([&heard](const EventJournal::Entry& e) { heard.push_back(e.height); });

    EXPECT_TRUE(journal.Empty());
    journal.Append(5, IssuerAuthorizedEvent{MakeIdentity(1), 105});
    journal.Append(6, IssuerDeauthorizedEvent{MakeIdentity(1), MakeIdentity(1)});
    journal.Append(7, IssuerAuthorizedEvent{MakeIdentity(2), 107});

    EXPECT_EQ(journal.Size(), 3u);
    EXPECT_EQ(journal.Back().height, 7);
    EXPECT_EQ(heard, (std::vector<BlockHeight>{5, 6, 7}));

    auto tail = journal.Since(1);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<IssuerDeauthorizedEvent>(tail[0].event));
    EXPECT_TRUE(journal.Since(3).empty());
    EXPECT_TRUE(journal.Since(10).empty());
}

} // namespace
} // namespace issuance
} // namespace mintguard
