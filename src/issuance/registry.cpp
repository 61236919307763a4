// MINTGUARD - Issuer Registry Implementation
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#include "mintguard/issuance/registry.h"
#include "mintguard/util/logging.h"

#include <sstream>

namespace mintguard {
namespace issuance {

IssuerRegistry::IssuerRegistry(const IssuanceParams& params, EventJournal& journal)
    : params_(params), journal_(journal) {
    issuerList_.reserve(params_.nMaxIssuers);
}

bool IssuerRegistry::IsReservedIdentity(const Identity& identity) const {
    return identity.IsNull() || identity == params_.controllerIdentity;
}

// ============================================================================
// Guards
// ============================================================================

IssuanceError IssuerRegistry::CheckAuthorize(const Identity& identity, BlockHeight now) const {
    if (IsIssuer(identity)) {
        return IssuanceError::AlreadyAuthorized;
    }
    if (issuerList_.size() >= params_.nMaxIssuers) {
        return IssuanceError::CapReached;
    }
    if (cooldowns_.IsCoolingDown(identity, now)) {
        return IssuanceError::CooldownActive;
    }
    if (IsReservedIdentity(identity)) {
        return IssuanceError::InvalidTarget;
    }
    return IssuanceError::OK;
}

IssuanceError IssuerRegistry::CheckDeauthorize(const Identity& identity, const Identity& caller,
                                               BlockHeight now) const {
    auto it = records_.find(identity);
    if (it == records_.end()) {
        return IssuanceError::NotAuthorized;
    }
    if (caller != identity && !it->second.IsExpired(now)) {
        return IssuanceError::TermNotExpired;
    }
    return IssuanceError::OK;
}

IssuanceError IssuerRegistry::CheckTransfer(const Identity& from, const Identity& to,
                                            BlockHeight now) const {
    IssuanceError err = CheckActiveIssuer(from, now);
    if (err != IssuanceError::OK) {
        return err;
    }
    if (IsIssuer(to)) {
        return IssuanceError::AlreadyAuthorized;
    }
    if (IsReservedIdentity(to)) {
        return IssuanceError::InvalidTarget;
    }
    if (cooldowns_.IsCoolingDown(to, now)) {
        return IssuanceError::CooldownActive;
    }
    return IssuanceError::OK;
}

IssuanceError IssuerRegistry::CheckActiveIssuer(const Identity& identity, BlockHeight now) const {
    auto it = records_.find(identity);
    if (it == records_.end()) {
        return IssuanceError::NotAuthorized;
    }
    if (it->second.IsExpired(now)) {
        return IssuanceError::TermExpired;
    }
    return IssuanceError::OK;
}

// ============================================================================
// Membership Operations
// ============================================================================

IssuanceResult IssuerRegistry::Authorize(const Identity& identity, BlockHeight now) {
    IssuanceError err = CheckAuthorize(identity, now);
    if (err != IssuanceError::OK) {
        LOG_DEBUG(util::LogCategory::REGISTRY) << "Authorize " << identity.ToHex()
            << " rejected: " << IssuanceErrorName(err);
        return IssuanceResult::Failure(err);
    }

    IssuerRecord record;
    record.position = static_cast<uint32_t>(issuerList_.size());
    record.startBlock = now;
    record.expirationBlock = now + params_.nIssuerTermLength;

    issuerList_.push_back(identity);
    membership_.insert(identity);
    records_.emplace(identity, record);

    LOG_INFO(util::LogCategory::REGISTRY) << "Authorized issuer " << identity.ToHex()
        << " at slot " << record.position << ", expires at " << record.expirationBlock;

    journal_.Append(now, IssuerAuthorizedEvent{identity, record.expirationBlock});
    return IssuanceResult::Success();
}

IssuanceResult IssuerRegistry::Deauthorize(const Identity& identity, const Identity& caller,
                                           BlockHeight now) {
    IssuanceError err = CheckDeauthorize(identity, caller, now);
    if (err != IssuanceError::OK) {
        LOG_DEBUG(util::LogCategory::REGISTRY) << "Deauthorize " << identity.ToHex()
            << " by " << caller.ToHex() << " rejected: " << IssuanceErrorName(err);
        return IssuanceResult::Failure(err);
    }

    Retire(identity, caller, now);
    return IssuanceResult::Success();
}

std::vector<Identity> IssuerRegistry::DeauthorizeAllExpired(const Identity& caller,
                                                            BlockHeight now) {
    std::vector<Identity> removed;

    for (size_t i = issuerList_.size(); i-- > 0;) {
        Identity identity = issuerList_[i];
        if (!records_.at(identity).IsExpired(now)) {
            continue;
        }
        Retire(identity, caller, now);
        removed.push_back(identity);
    }

    if (!removed.empty()) {
        LOG_INFO(util::LogCategory::REGISTRY) << "Expiry sweep removed " << removed.size()
            << " issuer(s), " << issuerList_.size() << " remaining";
    }
    return removed;
}

IssuanceResult IssuerRegistry::TransferAuthorization(const Identity& from, const Identity& to,
                                                     BlockHeight now) {
    IssuanceError err = CheckTransfer(from, to, now);
    if (err != IssuanceError::OK) {
        LOG_DEBUG(util::LogCategory::REGISTRY) << "Transfer " << from.ToHex()
            << " -> " << to.ToHex() << " rejected: " << IssuanceErrorName(err);
        return IssuanceResult::Failure(err);
    }

    IssuerRecord record = records_.at(from);

    cooldowns_.ApplyEarlyExit(from, record, now, params_);
    membership_.erase(from);
    records_.erase(from);

    issuerList_[record.position] = to;
    membership_.insert(to);
    records_.emplace(to, record);

    LOG_INFO(util::LogCategory::REGISTRY) << "Transferred issuer slot " << record.position
        << " from " << from.ToHex() << " to " << to.ToHex();

    journal_.Append(now, IssuerAuthorizationTransferredEvent{from, to, record.position});
    return IssuanceResult::Success();
}

void IssuerRegistry::Retire(const Identity& identity, const Identity& caller, BlockHeight now) {
    cooldowns_.ApplyEarlyExit(identity, records_.at(identity), now, params_);
    RemoveIssuer(identity);

    LOG_INFO(util::LogCategory::REGISTRY) << "Deauthorized issuer " << identity.ToHex()
        << " (caller " << caller.ToHex() << ")";

    journal_.Append(now, IssuerDeauthorizedEvent{identity, caller});
}

void IssuerRegistry::RemoveIssuer(const Identity& identity) {
    uint32_t idx = records_.at(identity).position;
    size_t last = issuerList_.size() - 1;

    if (idx != last) {
        const Identity moved = issuerList_[last];
        issuerList_[idx] = moved;
        records_.at(moved).position = idx;
    }
    issuerList_.pop_back();

    membership_.erase(identity);
    records_.erase(identity);
}

// ============================================================================
// Activity Accounting
// ============================================================================

const IssuerRecord& IssuerRegistry::RecordMint(const Identity& identity, Amount amount) {
    IssuerRecord& record = records_.at(identity);
    record.totalMinted += amount;
    record.mintCount += 1;
    return record;
}

const IssuerRecord& IssuerRegistry::RecordBurn(const Identity& identity, Amount amount) {
    IssuerRecord& record = records_.at(identity);
    record.totalBurned += amount;
    record.burnCount += 1;
    return record;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<Identity> IssuerRegistry::GetExpiredIssuers(BlockHeight now) const {
    size_t count = 0;
    for (const auto& identity : issuerList_) {
        if (records_.at(identity).IsExpired(now)) {
            ++count;
        }
    }

    std::vector<Identity> expired;
    expired.reserve(count);
    for (const auto& identity : issuerList_) {
        if (records_.at(identity).IsExpired(now)) {
            expired.push_back(identity);
        }
    }
    return expired;
}

bool IssuerRegistry::IsIssuer(const Identity& identity) const {
    return membership_.count(identity) > 0;
}

bool IssuerRegistry::IsActiveIssuer(const Identity& identity, BlockHeight now) const {
    return CheckActiveIssuer(identity, now) == IssuanceError::OK;
}

std::optional<IssuerRecord> IssuerRegistry::GetRecord(const Identity& identity) const {
    auto it = records_.find(identity);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t IssuerRegistry::SlotsAvailable() const {
    if (issuerList_.size() >= params_.nMaxIssuers) {
        return 0;
    }
    return params_.nMaxIssuers - issuerList_.size();
}

std::string IssuerRegistry::CheckInvariants() const {
    std::ostringstream err;

    if (issuerList_.size() != membership_.size() || issuerList_.size() != records_.size()) {
        err << "size mismatch: list=" << issuerList_.size()
            << " members=" << membership_.size() << " records=" << records_.size();
        return err.str();
    }
    if (issuerList_.size() > params_.nMaxIssuers) {
        err << "issuer count " << issuerList_.size() << " exceeds cap " << params_.nMaxIssuers;
        return err.str();
    }

    for (size_t i = 0; i < issuerList_.size(); ++i) {
        const Identity& identity = issuerList_[i];
        if (membership_.count(identity) == 0) {
            err << "slot " << i << " holds non-member " << identity.ToHex();
            return err.str();
        }
        auto it = records_.find(identity);
        if (it == records_.end()) {
            err << "member " << identity.ToHex() << " has no record";
            return err.str();
        }
        if (it->second.position != i) {
            err << "member " << identity.ToHex() << " at slot " << i
                << " records position " << it->second.position;
            return err.str();
        }
    }

    return "";
}

// ============================================================================
// Persistence
// ============================================================================

bool IssuerRegistry::Restore(std::vector<std::pair<Identity, IssuerRecord>> issuers,
                             CooldownTracker::Map cooldowns, std::string& error) {
    if (issuers.size() > params_.nMaxIssuers) {
        error = "stored issuer count exceeds cap";
        return false;
    }

    std::vector<Identity> list;
    std::unordered_set<Identity, IdentityHasher> members;
    std::unordered_map<Identity, IssuerRecord, IdentityHasher> records;
    list.reserve(params_.nMaxIssuers);

    for (size_t i = 0; i < issuers.size(); ++i) {
        const Identity& identity = issuers[i].first;
        const IssuerRecord& record = issuers[i].second;

        if (record.position != i) {
            error = "issuer " + identity.ToHex() + " stored at slot " + std::to_string(i) +
                    " but records position " + std::to_string(record.position);
            return false;
        }
        if (!members.insert(identity).second) {
            error = "issuer " + identity.ToHex() + " stored twice";
            return false;
        }
        if (record.totalMinted < 0 || record.totalBurned < 0) {
            error = "issuer " + identity.ToHex() + " has negative counters";
            return false;
        }
        list.push_back(identity);
        records.emplace(identity, record);
    }

    issuerList_ = std::move(list);
    membership_ = std::move(members);
    records_ = std::move(records);

    cooldowns_.Clear();
    for (const auto& entry : cooldowns) {
        cooldowns_.SetCooldown(entry.first, entry.second);
    }

    LOG_DEBUG(util::LogCategory::REGISTRY) << "Restored " << issuerList_.size()
        << " issuer(s) and " << cooldowns_.Entries().size() << " cooldown(s)";
    return true;
}

} // namespace issuance
} // namespace mintguard
