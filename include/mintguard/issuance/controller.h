// MINTGUARD - Issuance Controller
// Copyright (c) 2024 MINTGUARD Developers
// MIT License
//
// Entry point for every public operation. The controller owns the registry
// and the notification journal, sizes mint requests with the mint factor
// calculator and drives the external ledger.

#ifndef MINTGUARD_ISSUANCE_CONTROLLER_H
#define MINTGUARD_ISSUANCE_CONTROLLER_H

#include "mintguard/core/types.h"
#include "mintguard/issuance/errors.h"
#include "mintguard/issuance/events.h"
#include "mintguard/issuance/issuer.h"
#include "mintguard/issuance/ledger.h"
#include "mintguard/issuance/mintfactor.h"
#include "mintguard/issuance/params.h"
#include "mintguard/issuance/registry.h"

#include <optional>
#include <vector>

namespace mintguard {
namespace issuance {

/// Who is calling and at which block. Supplied once per operation.
struct CallContext {
    Identity caller;
    BlockHeight height{0};
};

/**
 * Autonomous issuance-rights controller.
 *
 * Operations are all-or-nothing: every guard, including the ledger's
 * balance, allowance and supply-cap preconditions, is evaluated before the
 * first mutation. Notifications are appended only after success.
 */
class IssuanceController {
public:
    IssuanceController(const IssuanceParams& params, Ledger& ledger);

    // Prevent copies; registry_ reports into journal_
    IssuanceController(const IssuanceController&) = delete;
    IssuanceController& operator=(const IssuanceController&) = delete;

    // ========================================================================
    // Membership
    // ========================================================================

    /// Grant issuer rights for one term. The null identity and the
    /// controller itself are rejected with InvalidTarget.
    IssuanceResult AuthorizeIssuer(const Identity& identity, const CallContext& ctx);

    IssuanceResult DeauthorizeIssuer(const Identity& identity, const CallContext& ctx);

    /// Remove every expired issuer; never fails
    std::vector<Identity> DeauthorizeAllExpiredIssuers(const CallContext& ctx);

    /// Hand the caller's issuer rights and history to `newIdentity`
    IssuanceResult TransferIssuerAuthorization(const Identity& newIdentity,
                                               const CallContext& ctx);

    // ========================================================================
    // Mint / Burn
    // ========================================================================

    /**
     * Mint to `to` on behalf of the calling issuer.
     *
     * With zero supply the request is ignored and exactly the supply floor
     * is minted. Otherwise the request must be positive and within the
     * issuer's mint factor; if supply is below the floor the shortfall is
     * minted on top. result.amount is the amount credited.
     */
    IssuanceResult Mint(const Identity& to, Amount requested, const CallContext& ctx);

    /// Burn from the caller's own balance
    IssuanceResult Burn(Amount amount, const CallContext& ctx);

    /// Burn from `account`, spending the caller's allowance over it
    IssuanceResult BurnFrom(const Identity& account, Amount amount, const CallContext& ctx);

    // ========================================================================
    // Queries
    // ========================================================================

    std::vector<Identity> GetIssuers() const { return registry_.GetIssuers(); }

    std::vector<Identity> GetExpiredIssuers(BlockHeight now) const {
        return registry_.GetExpiredIssuers(now);
    }

    /// Current mint factor of an issuer; empty for non-issuers
    std::optional<int64_t> GetIssuerMintFactor(const Identity& identity) const;

    /// Largest single mint request the issuer may make; empty for non-issuers
    std::optional<Amount> GetIssuerMaxMintable(const Identity& identity) const;

    /// Factor with intermediate terms; empty for non-issuers
    std::optional<MintFactorBreakdown> GetIssuerMintFactorBreakdown(const Identity& identity) const;

    std::optional<IssuerRecord> GetIssuerRecord(const Identity& identity) const {
        return registry_.GetRecord(identity);
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    const IssuanceParams& Params() const { return params_; }
    const IssuerRegistry& Registry() const { return registry_; }
    IssuerRegistry& Registry() { return registry_; }
    const EventJournal& Events() const { return journal_; }
    EventJournal& Events() { return journal_; }

private:
    /// Validate and size a mint request; `amount` receives the credit
    IssuanceError CheckMint(const Identity& to, Amount requested, const CallContext& ctx,
                            Amount& amount) const;

    /// Common burn guards; `spendAllowance` adds the allowance check of BurnFrom
    IssuanceError CheckBurn(const Identity& account, Amount amount, const CallContext& ctx,
                            bool spendAllowance) const;

    /// Record a burn on the issuer and emit the activity notification
    void FinishBurn(Amount amount, const CallContext& ctx);

    const IssuanceParams params_;
    Ledger& ledger_;
    EventJournal journal_;
    IssuerRegistry registry_;
};

} // namespace issuance
} // namespace mintguard

#endif // MINTGUARD_ISSUANCE_CONTROLLER_H
