// MINTGUARD - Cooldown Tracker
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#ifndef MINTGUARD_ISSUANCE_COOLDOWN_H
#define MINTGUARD_ISSUANCE_COOLDOWN_H

#include "mintguard/core/types.h"
#include "mintguard/issuance/issuer.h"
#include "mintguard/issuance/params.h"

#include <unordered_map>

namespace mintguard {
namespace issuance {

/**
 * Reactivation delays for identities that left their term early.
 *
 * An identity is cooling down while `now < until`. Absent, zero and past
 * entries all mean "no cooldown"; past entries are not pruned.
 */
class CooldownTracker {
public:
    using Map = std::unordered_map<Identity, BlockHeight, IdentityHasher>;

    /// True if (re)authorization of `id` is refused at `now`
    bool IsCoolingDown(const Identity& id, BlockHeight now) const;

    /// Block before which `id` may not be authorized (0 if none)
    BlockHeight GetCooldown(const Identity& id) const;

    /// Set the cooldown of `id`; zero clears it
    void SetCooldown(const Identity& id, BlockHeight until);

    /**
     * Apply the early-exit rule to an issuer leaving at `now`.
     *
     * If fewer than the threshold fraction of the term has elapsed since
     * record.startBlock, the identity cools down until the record's
     * expiration block.
     *
     * @return true if a cooldown was set
     */
    bool ApplyEarlyExit(const Identity& id, const IssuerRecord& record,
                        BlockHeight now, const IssuanceParams& params);

    /// All stored entries (for persistence)
    const Map& Entries() const { return cooldownUntil_; }

    void Clear() { cooldownUntil_.clear(); }

private:
    Map cooldownUntil_;
};

} // namespace issuance
} // namespace mintguard

#endif // MINTGUARD_ISSUANCE_COOLDOWN_H
