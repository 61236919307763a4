// MINTGUARD - Cooldown Tracker Implementation
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#include "mintguard/issuance/cooldown.h"
#include "mintguard/util/logging.h"

namespace mintguard {
namespace issuance {

bool CooldownTracker::IsCoolingDown(const Identity& id, BlockHeight now) const {
    BlockHeight until = GetCooldown(id);
    return until != 0 && now < until;
}

BlockHeight CooldownTracker::GetCooldown(const Identity& id) const {
    auto it = cooldownUntil_.find(id);
    if (it == cooldownUntil_.end()) {
        return 0;
    }
    return it->second;
}

void CooldownTracker::SetCooldown(const Identity& id, BlockHeight until) {
    if (until == 0) {
        cooldownUntil_.erase(id);
        return;
    }
    cooldownUntil_[id] = until;
}

bool CooldownTracker::ApplyEarlyExit(const Identity& id, const IssuerRecord& record,
                                     BlockHeight now, const IssuanceParams& params) {
    if (!params.IsEarlyExit(now - record.startBlock)) {
        return false;
    }

    SetCooldown(id, record.expirationBlock);
    LOG_INFO(util::LogCategory::REGISTRY) << "Early exit by " << id.ToHex()
        << ", cooling down until block " << record.expirationBlock;
    return true;
}

} // namespace issuance
} // namespace mintguard
