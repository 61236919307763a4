// MINTGUARD - Issuer Registry
// Copyright (c) 2024 MINTGUARD Developers
// MIT License
//
// The bounded set of authorized issuers. Membership is a dense list plus a
// reverse index (record.position), so any member can be removed in O(1) by
// swap-and-truncate.

#ifndef MINTGUARD_ISSUANCE_REGISTRY_H
#define MINTGUARD_ISSUANCE_REGISTRY_H

#include "mintguard/core/types.h"
#include "mintguard/issuance/cooldown.h"
#include "mintguard/issuance/errors.h"
#include "mintguard/issuance/events.h"
#include "mintguard/issuance/issuer.h"
#include "mintguard/issuance/params.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace mintguard {
namespace issuance {

/**
 * Owns issuer membership, per-issuer records and cooldowns.
 *
 * Invariants after every operation:
 * - issuerList_.size() == membership_.size() == records_.size()
 * - records_[issuerList_[i]].position == i for every i
 * - a record exists iff its identity is a member
 * - the member count never exceeds params.nMaxIssuers
 *
 * Every mutating call checks all of its guards first; a rejected call
 * leaves the registry untouched and emits nothing.
 */
class IssuerRegistry {
public:
    IssuerRegistry(const IssuanceParams& params, EventJournal& journal);

    // Prevent copies; journal_ belongs to the owner
    IssuerRegistry(const IssuerRegistry&) = delete;
    IssuerRegistry& operator=(const IssuerRegistry&) = delete;

    // ========================================================================
    // Membership Operations
    // ========================================================================

    /**
     * Grant issuer rights to `identity` for one term starting at `now`.
     *
     * Guards, in order: AlreadyAuthorized for a current member, CapReached
     * when every slot is taken, CooldownActive while a reactivation
     * cooldown runs, then InvalidTarget for the null identity or the
     * controller's own identity.
     */
    IssuanceResult Authorize(const Identity& identity, BlockHeight now);

    /// Remove `identity`. Third parties may only remove an expired issuer.
    IssuanceResult Deauthorize(const Identity& identity, const Identity& caller,
                               BlockHeight now);

    /**
     * Remove every issuer whose term has ended at `now`.
     *
     * The list is scanned from the back so that a swap-removal never moves
     * an unvisited element into an already-visited slot.
     *
     * @return the removed identities, in removal order
     */
    std::vector<Identity> DeauthorizeAllExpired(const Identity& caller, BlockHeight now);

    /// Move `from`'s rights and history to `to`; `to` takes over `from`'s slot
    IssuanceResult TransferAuthorization(const Identity& from, const Identity& to,
                                         BlockHeight now);

    // ========================================================================
    // Guards
    // ========================================================================

    IssuanceError CheckAuthorize(const Identity& identity, BlockHeight now) const;
    IssuanceError CheckDeauthorize(const Identity& identity, const Identity& caller,
                                   BlockHeight now) const;
    IssuanceError CheckTransfer(const Identity& from, const Identity& to,
                                BlockHeight now) const;

    /// NotAuthorized if not a member, TermExpired if the term has ended
    IssuanceError CheckActiveIssuer(const Identity& identity, BlockHeight now) const;

    // ========================================================================
    // Activity Accounting
    // ========================================================================

    /// Add a mint to the issuer's counters. The issuer must be a member.
    const IssuerRecord& RecordMint(const Identity& identity, Amount amount);

    /// Add a burn to the issuer's counters. The issuer must be a member.
    const IssuerRecord& RecordBurn(const Identity& identity, Amount amount);

    // ========================================================================
    // Queries
    // ========================================================================

    /// Snapshot of the issuer list in slot order
    std::vector<Identity> GetIssuers() const { return issuerList_; }

    /// Snapshot of members whose term has ended at `now`, in slot order
    std::vector<Identity> GetExpiredIssuers(BlockHeight now) const;

    bool IsIssuer(const Identity& identity) const;
    bool IsActiveIssuer(const Identity& identity, BlockHeight now) const;

    std::optional<IssuerRecord> GetRecord(const Identity& identity) const;

    size_t Count() const { return issuerList_.size(); }
    size_t SlotsAvailable() const;

    const CooldownTracker& Cooldowns() const { return cooldowns_; }
    const IssuanceParams& Params() const { return params_; }

    /// Verify the structural invariants. Returns an empty string if they
    /// hold, otherwise a description of the first violation.
    std::string CheckInvariants() const;

    // ========================================================================
    // Persistence
    // ========================================================================

    /**
     * Replace the whole state with previously persisted data.
     *
     * `issuers` must be in slot order. On failure the registry is left
     * unchanged and `error` describes the problem.
     */
    bool Restore(std::vector<std::pair<Identity, IssuerRecord>> issuers,
                 CooldownTracker::Map cooldowns, std::string& error);

private:
    /// True for the null identity and the controller's own identity
    bool IsReservedIdentity(const Identity& identity) const;

    /// Swap-and-truncate removal; the identity must be a member
    void RemoveIssuer(const Identity& identity);

    /// Apply the early-exit rule, remove, and notify
    void Retire(const Identity& identity, const Identity& caller, BlockHeight now);

    const IssuanceParams params_;
    EventJournal& journal_;

    std::vector<Identity> issuerList_;
    std::unordered_set<Identity, IdentityHasher> membership_;
    std::unordered_map<Identity, IssuerRecord, IdentityHasher> records_;
    CooldownTracker cooldowns_;
};

} // namespace issuance
} // namespace mintguard

#endif // MINTGUARD_ISSUANCE_REGISTRY_H
