// MINTGUARD - Issuer Registry and Cooldown Tests
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#include <gtest/gtest.h>
#include <mintguard/issuance/cooldown.h>
#include <mintguard/issuance/registry.h>

#include <memory>
#include <vector>

namespace mintguard {
namespace issuance {
namespace {

// ============================================================================
// Test Fixture
// ============================================================================

/// RegTest: cap 3, term 100, early exit below 95 served blocks
class RegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        params_ = IssuanceParams::RegTest();
        registry_ = std::make_unique<IssuerRegistry>(params_, journal_);
        A = MakeIdentity(0x0a);
        B = MakeIdentity(0x0b);
        C = MakeIdentity(0x0c);
        D = MakeIdentity(0x0d);
    }

    void ExpectConsistent() {
        EXPECT_EQ(registry_->CheckInvariants(), "");
    }

    IssuanceParams params_;
    EventJournal journal_;
    std::unique_ptr<IssuerRegistry> registry_;
    Identity A, B, C, D;
};

// ============================================================================
// Authorization Tests
// ============================================================================

TEST_F(RegistryTest, AuthorizeCreatesRecord) {
    auto result = registry_->Authorize(A, 10);
    ASSERT_TRUE(result.IsOk());

    EXPECT_TRUE(registry_->IsIssuer(A));
    EXPECT_TRUE(registry_->IsActiveIssuer(A, 10));
    EXPECT_EQ(registry_->Count(), 1u);
    EXPECT_EQ(registry_->SlotsAvailable(), 2u);

    auto record = registry_->GetRecord(A);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->position, 0u);
    EXPECT_EQ(record->startBlock, 10);
    EXPECT_EQ(record->expirationBlock, 110);
    EXPECT_EQ(record->totalMinted, 0);
    EXPECT_EQ(record->mintCount, 0u);

    ASSERT_EQ(journal_.Size(), 1u);
    const auto* ev = std::get_if<IssuerAuthorizedEvent>(&journal_.Back().event);
    ASSERT_NE(ev, nullptr);
    EXPECT_EQ(ev->issuer, A);
    EXPECT_EQ(ev->expirationBlock, 110);
    EXPECT_EQ(journal_.Back().height, 10);
    ExpectConsistent();
}

TEST_F(RegistryTest, AuthorizeTwiceFails) {
    ASSERT_TRUE(registry_->Authorize(A, 0).IsOk());
    auto result = registry_->Authorize(A, 5);
    EXPECT_EQ(result.error, IssuanceError::AlreadyAuthorized);
    EXPECT_EQ(registry_->GetRecord(A)->startBlock, 0);
    EXPECT_EQ(journal_.Size(), 1u);
}

TEST_F(RegistryTest, AuthorizeRespectsCap) {
    ASSERT_TRUE(registry_->Authorize(A, 0).IsOk());
    ASSERT_TRUE(registry_->Authorize(B, 0).IsOk());
    ASSERT_TRUE(registry_->Authorize(C, 0).IsOk());
    EXPECT_EQ(registry_->SlotsAvailable(), 0u);

    EXPECT_EQ(registry_->Authorize(D, 0).error, IssuanceError::CapReached);
    EXPECT_FALSE(registry_->IsIssuer(D));
    EXPECT_EQ(registry_->Count(), 3u);
    ExpectConsistent();
}

TEST_F(RegistryTest, AuthorizeRejectsReservedIdentities) {
    EXPECT_EQ(registry_->Authorize(Identity(), 0).error, IssuanceError::InvalidTarget);
    EXPECT_EQ(registry_->Authorize(params_.controllerIdentity, 0).error,
              IssuanceError::InvalidTarget);
    EXPECT_EQ(registry_->Count(), 0u);
    EXPECT_TRUE(journal_.Empty());
}

TEST_F(RegistryTest, AuthorizeGuardOrder) {
    ASSERT_TRUE(registry_->Authorize(A, 0).IsOk());
    ASSERT_TRUE(registry_->Authorize(B, 0).IsOk());

    // D leaves early and cools down until 100
    ASSERT_TRUE(registry_->Authorize(D, 0).IsOk());
    ASSERT_TRUE(registry_->Deauthorize(D, D, 10).IsOk());
    ASSERT_TRUE(registry_->Authorize(C, 10).IsOk());

    // Membership is checked before the cap
    EXPECT_EQ(registry_->Authorize(A, 20).error, IssuanceError::AlreadyAuthorized);
    // The cap is checked before the cooldown
    EXPECT_EQ(registry_->Authorize(D, 20).error, IssuanceError::CapReached);
    // The cap is checked before the target
    EXPECT_EQ(registry_->Authorize(Identity(), 20).error, IssuanceError::CapReached);

    ASSERT_TRUE(registry_->Deauthorize(C, C, 20).IsOk());
    EXPECT_EQ(registry_->Authorize(D, 20).error, IssuanceError::CooldownActive);
}

// ============================================================================
// Deauthorization and Cooldown Tests
// ============================================================================

TEST_F(RegistryTest, EarlySelfExitStartsCooldown) {
    ASSERT_TRUE(registry_->Authorize(A, 10).IsOk());
    EXPECT_EQ(registry_->RecordMint(A, 5 * COIN).mintCount, 1u);

    // Served 50 of 100 blocks
    ASSERT_TRUE(registry_->Deauthorize(A, A, 60).IsOk());
    EXPECT_FALSE(registry_->IsIssuer(A));
    EXPECT_FALSE(registry_->GetRecord(A).has_value());
    EXPECT_EQ(registry_->Cooldowns().GetCooldown(A), 110);

    EXPECT_EQ(registry_->Authorize(A, 109).error, IssuanceError::CooldownActive);
    auto again = registry_->Authorize(A, 110);
    ASSERT_TRUE(again.IsOk());

    // The new record starts from scratch
    auto record = registry_->GetRecord(A);
    EXPECT_EQ(record->startBlock, 110);
    EXPECT_EQ(record->expirationBlock, 210);
    EXPECT_EQ(record->totalMinted, 0);
    EXPECT_EQ(record->mintCount, 0u);
}

TEST_F(RegistryTest, LateSelfExitHasNoCooldown) {
    ASSERT_TRUE(registry_->Authorize(A, 10).IsOk());
    ASSERT_TRUE(registry_->Deauthorize(A, A, 105).IsOk());   // served 95
    EXPECT_EQ(registry_->Cooldowns().GetCooldown(A), 0);
    EXPECT_TRUE(registry_->Authorize(A, 105).IsOk());
}

TEST_F(RegistryTest, ThirdPartyNeedsExpiry) {
    ASSERT_TRUE(registry_->Authorize(A, 0).IsOk());

    EXPECT_EQ(registry_->Deauthorize(A, B, 99).error, IssuanceError::TermNotExpired);
    EXPECT_TRUE(registry_->IsIssuer(A));

    auto result = registry_->Deauthorize(A, B, 100);
    ASSERT_TRUE(result.IsOk());
    EXPECT_FALSE(registry_->IsIssuer(A));
    EXPECT_EQ(registry_->Cooldowns().GetCooldown(A), 0);

    const auto* ev = std::get_if<IssuerDeauthorizedEvent>(&journal_.Back().event);
    ASSERT_NE(ev, nullptr);
    EXPECT_EQ(ev->issuer, A);
    EXPECT_EQ(ev->caller, B);
}

TEST_F(RegistryTest, DeauthorizeNonMember) {
    EXPECT_EQ(registry_->Deauthorize(A, A, 0).error, IssuanceError::NotAuthorized);
    EXPECT_TRUE(journal_.Empty());
}

TEST_F(RegistryTest, SwapRemoveKeepsIndexDense) {
    ASSERT_TRUE(registry_->Authorize(A, 0).IsOk());
    ASSERT_TRUE(registry_->Authorize(B, 0).IsOk());
    ASSERT_TRUE(registry_->Authorize(C, 0).IsOk());

    ASSERT_TRUE(registry_->Deauthorize(A, A, 100).IsOk());

    EXPECT_EQ(registry_->GetIssuers(), (std::vector<Identity>{C, B}));
    EXPECT_EQ(registry_->GetRecord(C)->position, 0u);
    EXPECT_EQ(registry_->GetRecord(B)->position, 1u);
    ExpectConsistent();

    ASSERT_TRUE(registry_->Deauthorize(B, B, 100).IsOk());
    EXPECT_EQ(registry_->GetIssuers(), (std::vector<Identity>{C}));
    ExpectConsistent();
}

// ============================================================================
// Sweep Tests
// ============================================================================

TEST_F(RegistryTest, SweepRemovesAllExpired) {
    ASSERT_TRUE(registry_->Authorize(A, 0).IsOk());    // expires 100
    ASSERT_TRUE(registry_->Authorize(B, 50).IsOk());   // expires 150
    ASSERT_TRUE(registry_->Authorize(C, 0).IsOk());    // expires 100

    EXPECT_EQ(registry_->GetExpiredIssuers(100), (std::vector<Identity>{A, C}));

    const size_t before = journal_.Size();
    auto removed = registry_->DeauthorizeAllExpired(D, 100);

    // Scanned from the back: C first, then A (B is swapped into slot 0)
    EXPECT_EQ(removed, (std::vector<Identity>{C, A}));
    EXPECT_EQ(registry_->GetIssuers(), (std::vector<Identity>{B}));
    EXPECT_EQ(registry_->GetRecord(B)->position, 0u);
    EXPECT_EQ(journal_.Size(), before + 2);
    EXPECT_TRUE(registry_->GetExpiredIssuers(100).empty());
    ExpectConsistent();
}

TEST_F(RegistryTest, SweepAdjacentExpired) {
    ASSERT_TRUE(registry_->Authorize(A, 50).IsOk());   // expires 150
    ASSERT_TRUE(registry_->Authorize(B, 0).IsOk());
    ASSERT_TRUE(registry_->Authorize(C, 0).IsOk());

    auto removed = registry_->DeauthorizeAllExpired(D, 100);
    EXPECT_EQ(removed.size(), 2u);
    EXPECT_EQ(registry_->GetIssuers(), (std::vector<Identity>{A}));
    ExpectConsistent();
}

TEST_F(RegistryTest, SweepWithNothingExpired) {
    ASSERT_TRUE(registry_->Authorize(A, 0).IsOk());
    const size_t before = journal_.Size();
    EXPECT_TRUE(registry_->DeauthorizeAllExpired(D, 99).empty());
    EXPECT_EQ(journal_.Size(), before);
    EXPECT_TRUE(registry_->DeauthorizeAllExpired(D, 99).empty());
}

TEST_F(RegistryTest, SweepOfFullTermSetsNoCooldown) {
    ASSERT_TRUE(registry_->Authorize(A, 0).IsOk());
    registry_->DeauthorizeAllExpired(D, 500);
    EXPECT_EQ(registry_->Cooldowns().GetCooldown(A), 0);
}

// ============================================================================
// Transfer Tests
// ============================================================================

TEST_F(RegistryTest, TransferMovesSlotAndHistory) {
    ASSERT_TRUE(registry_->Authorize(B, 0).IsOk());
    ASSERT_TRUE(registry_->Authorize(A, 5).IsOk());
    registry_->RecordMint(A, 40 * COIN);
    registry_->RecordBurn(A, 3 * COIN);
    const IssuerRecord before = *registry_->GetRecord(A);

    auto result = registry_->TransferAuthorization(A, D, 25);
    ASSERT_TRUE(result.IsOk());

    EXPECT_FALSE(registry_->IsIssuer(A));
    EXPECT_TRUE(registry_->IsIssuer(D));
    EXPECT_EQ(registry_->GetIssuers(), (std::vector<Identity>{B, D}));
    EXPECT_EQ(*registry_->GetRecord(D), before);

    // A served 20 blocks and cools down until the end of its term
    EXPECT_EQ(registry_->Cooldowns().GetCooldown(A), 105);

    const auto* ev = std::get_if<IssuerAuthorizationTransferredEvent>(&journal_.Back().event);
    ASSERT_NE(ev, nullptr);
    EXPECT_EQ(ev->from, A);
    EXPECT_EQ(ev->to, D);
    EXPECT_EQ(ev->position, 1u);
    ExpectConsistent();
}

TEST_F(RegistryTest, TransferGuards) {
    ASSERT_TRUE(registry_->Authorize(A, 0).IsOk());
    ASSERT_TRUE(registry_->Authorize(B, 0).IsOk());

    EXPECT_EQ(registry_->TransferAuthorization(C, D, 10).error, IssuanceError::NotAuthorized);
    EXPECT_EQ(registry_->TransferAuthorization(A, B, 10).error, IssuanceError::AlreadyAuthorized);
    EXPECT_EQ(registry_->TransferAuthorization(A, Identity(), 10).error,
              IssuanceError::InvalidTarget);
    EXPECT_EQ(registry_->TransferAuthorization(A, params_.controllerIdentity, 10).error,
              IssuanceError::InvalidTarget);
    EXPECT_EQ(registry_->TransferAuthorization(A, D, 100).error, IssuanceError::TermExpired);

    // C cools down after an early exit
    ASSERT_TRUE(registry_->Authorize(C, 0).IsOk());
    ASSERT_TRUE(registry_->Deauthorize(C, C, 10).IsOk());
    EXPECT_EQ(registry_->TransferAuthorization(A, C, 20).error, IssuanceError::CooldownActive);

    EXPECT_EQ(registry_->GetIssuers(), (std::vector<Identity>{A, B}));
    ExpectConsistent();
}

TEST_F(RegistryTest, TransferBackIsBlockedByCooldown) {
    ASSERT_TRUE(registry_->Authorize(A, 0).IsOk());
    ASSERT_TRUE(registry_->TransferAuthorization(A, D, 10).IsOk());
    EXPECT_EQ(registry_->TransferAuthorization(D, A, 11).error, IssuanceError::CooldownActive);
}

// ============================================================================
// Accounting Tests
// ============================================================================

TEST_F(RegistryTest, RecordMintAndBurn) {
    ASSERT_TRUE(registry_->Authorize(A, 0).IsOk());
    registry_->RecordMint(A, 10);
    registry_->RecordMint(A, 5);
    const IssuerRecord& rec = registry_->RecordBurn(A, 7);

    EXPECT_EQ(rec.totalMinted, 15);
    EXPECT_EQ(rec.mintCount, 2u);
    EXPECT_EQ(rec.totalBurned, 7);
    EXPECT_EQ(rec.burnCount, 1u);
}

TEST_F(RegistryTest, ExpiredIssuerStaysMember) {
    ASSERT_TRUE(registry_->Authorize(A, 0).IsOk());
    EXPECT_TRUE(registry_->IsIssuer(A));
    EXPECT_FALSE(registry_->IsActiveIssuer(A, 100));
    EXPECT_EQ(registry_->CheckActiveIssuer(A, 100), IssuanceError::TermExpired);
    EXPECT_EQ(registry_->CheckActiveIssuer(B, 0), IssuanceError::NotAuthorized);
}

// ============================================================================
// Restore Tests
// ============================================================================

TEST_F(RegistryTest, RestoreReplacesState) {
    ASSERT_TRUE(registry_->Authorize(D, 0).IsOk());

    IssuerRecord ra;
    ra.position = 0;
    ra.startBlock = 7;
    ra.expirationBlock = 107;
    IssuerRecord rb = ra;
    rb.position = 1;
    rb.totalMinted = 9;
    rb.mintCount = 1;

    CooldownTracker::Map cooldowns{{C, 300}};
    std::string error;
    ASSERT_TRUE(registry_->Restore({{A, ra}, {B, rb}}, cooldowns, error)) << error;

    EXPECT_EQ(registry_->GetIssuers(), (std::vector<Identity>{A, B}));
    EXPECT_FALSE(registry_->IsIssuer(D));
    EXPECT_EQ(*registry_->GetRecord(B), rb);
    EXPECT_EQ(registry_->Cooldowns().GetCooldown(C), 300);
    ExpectConsistent();
}

TEST_F(RegistryTest, RestoreRejectsBadData) {
    ASSERT_TRUE(registry_->Authorize(D, 0).IsOk());
    std::string error;

    IssuerRecord wrongPos;
    wrongPos.position = 1;
    EXPECT_FALSE(registry_->Restore({{A, wrongPos}}, {}, error));
    EXPECT_FALSE(error.empty());

    IssuerRecord r0;
    IssuerRecord r1;
    r1.position = 1;
    EXPECT_FALSE(registry_->Restore({{A, r0}, {A, r1}}, {}, error));

    IssuerRecord negative;
    negative.totalBurned = -1;
    EXPECT_FALSE(registry_->Restore({{A, negative}}, {}, error));

    std::vector<std::pair<Identity, IssuerRecord>> tooMany;
    for (uint32_t i = 0; i < 4; ++i) {
        IssuerRecord r;
        r.position = i;
        tooMany.emplace_back(MakeIdentity(static_cast<Byte>(0x40 + i)), r);
    }
    EXPECT_FALSE(registry_->Restore(tooMany, {}, error));

    // Unchanged after every failure
    EXPECT_EQ(registry_->GetIssuers(), (std::vector<Identity>{D}));
    ExpectConsistent();
}

// ============================================================================
// Cooldown Tracker Tests
// ============================================================================

TEST(CooldownTrackerTest, Basics) {
    CooldownTracker tracker;
    Identity id = MakeIdentity(0x01);

    EXPECT_FALSE(tracker.IsCoolingDown(id, 0));
    EXPECT_EQ(tracker.GetCooldown(id), 0);

    tracker.SetCooldown(id, 50);
    EXPECT_TRUE(tracker.IsCoolingDown(id, 49));
    EXPECT_FALSE(tracker.IsCoolingDown(id, 50));

    // Past entries are kept but inert
    EXPECT_EQ(tracker.GetCooldown(id), 50);
    EXPECT_EQ(tracker.Entries().size(), 1u);

    tracker.SetCooldown(id, 0);
    EXPECT_TRUE(tracker.Entries().empty());
}

TEST(CooldownTrackerTest, ApplyEarlyExit) {
    IssuanceParams params = IssuanceParams::RegTest();
    CooldownTracker tracker;
    Identity id = MakeIdentity(0x02);

    IssuerRecord record;
    record.startBlock = 200;
    record.expirationBlock = 300;

    EXPECT_TRUE(tracker.ApplyEarlyExit(id, record, 294, params));
    EXPECT_EQ(tracker.GetCooldown(id), 300);

    tracker.Clear();
    EXPECT_FALSE(tracker.ApplyEarlyExit(id, record, 295, params));
    EXPECT_EQ(tracker.GetCooldown(id), 0);
}

} // namespace
} // namespace issuance
} // namespace mintguard
