// MINTGUARD - Issuance Controller Implementation
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#include "mintguard/issuance/controller.h"
#include "mintguard/util/logging.h"

#include <limits>

namespace mintguard {
namespace issuance {

IssuanceController::IssuanceController(const IssuanceParams& params, Ledger& ledger)
    : params_(params)
    , ledger_(ledger)
    , registry_(params_, journal_) {}

// ============================================================================
// Membership
// ============================================================================

IssuanceResult IssuanceController::AuthorizeIssuer(const Identity& identity,
                                                   const CallContext& ctx) {
    util::ScopedBlockContext scope(ctx.height);
    return registry_.Authorize(identity, ctx.height);
}

IssuanceResult IssuanceController::DeauthorizeIssuer(const Identity& identity,
                                                     const CallContext& ctx) {
    util::ScopedBlockContext scope(ctx.height);
    return registry_.Deauthorize(identity, ctx.caller, ctx.height);
}

std::vector<Identity> IssuanceController::DeauthorizeAllExpiredIssuers(const CallContext& ctx) {
    util::ScopedBlockContext scope(ctx.height);
    return registry_.DeauthorizeAllExpired(ctx.caller, ctx.height);
}

IssuanceResult IssuanceController::TransferIssuerAuthorization(const Identity& newIdentity,
                                                               const CallContext& ctx) {
    util::ScopedBlockContext scope(ctx.height);
    return registry_.TransferAuthorization(ctx.caller, newIdentity, ctx.height);
}

// ============================================================================
// Mint
// ============================================================================

IssuanceError IssuanceController::CheckMint(const Identity& to, Amount requested,
                                            const CallContext& ctx, Amount& amount) const {
    IssuanceError err = registry_.CheckActiveIssuer(ctx.caller, ctx.height);
    if (err != IssuanceError::OK) {
        return err;
    }
    if (to.IsNull() || to == params_.controllerIdentity) {
        return IssuanceError::InvalidReceiver;
    }

    const Amount supply = ledger_.TotalSupply();
    const IssuerRecord record = *registry_.GetRecord(ctx.caller);

    if (supply == 0) {
        // Bootstrap: the requested amount is ignored
        amount = params_.nSupplyFloor;
        if (amount <= 0) {
            return IssuanceError::NonPositiveAmount;
        }
    } else {
        if (requested <= 0) {
            return IssuanceError::NonPositiveAmount;
        }

        const int64_t factor = ComputeMintFactor(record, supply, params_);
        if (static_cast<__int128>(requested) * params_.nMintFactorScale >
            static_cast<__int128>(supply) * factor) {
            return IssuanceError::ExceedsMintFactor;
        }

        amount = requested;
        if (supply < params_.nSupplyFloor) {
            amount += params_.nSupplyFloor - supply;
        }
    }

    if (amount > MAX_SUPPLY - supply) {
        return IssuanceError::ExceedsMaxSupply;
    }
    if (amount > std::numeric_limits<Amount>::max() - record.totalMinted) {
        return IssuanceError::CounterOverflow;
    }
    return IssuanceError::OK;
}

IssuanceResult IssuanceController::Mint(const Identity& to, Amount requested,
                                        const CallContext& ctx) {
    util::ScopedBlockContext scope(ctx.height);

    Amount amount = 0;
    IssuanceError err = CheckMint(to, requested, ctx, amount);
    if (err != IssuanceError::OK) {
        LOG_DEBUG(util::LogCategory::ISSUANCE) << "Mint of " << FormatAmount(requested)
            << " by " << ctx.caller.ToHex() << " rejected: " << IssuanceErrorName(err);
        return IssuanceResult::Failure(err);
    }

    if (!ledger_.Mint(to, amount)) {
        LOG_ERROR(util::LogCategory::ISSUANCE) << "Ledger refused a validated mint of "
            << FormatAmount(amount) << " to " << to.ToHex();
        return IssuanceResult::Failure(IssuanceError::ExceedsMaxSupply, "ledger refused mint");
    }

    const IssuerRecord& record = registry_.RecordMint(ctx.caller, amount);

    LOG_INFO(util::LogCategory::ISSUANCE) << "Issuer " << ctx.caller.ToHex() << " minted "
        << FormatAmount(amount) << " to " << to.ToHex() << " (requested "
        << FormatAmount(requested) << ", supply now " << FormatAmount(ledger_.TotalSupply())
        << ")";

    IssuerActivityEvent event;
    event.issuer = ctx.caller;
    event.minted = amount;
    event.totalMinted = record.totalMinted;
    event.mintCount = record.mintCount;
    event.totalBurned = record.totalBurned;
    event.burnCount = record.burnCount;
    journal_.Append(ctx.height, event);

    return IssuanceResult::Success(amount);
}

// ============================================================================
// Burn
// ============================================================================

IssuanceError IssuanceController::CheckBurn(const Identity& account, Amount amount,
                                            const CallContext& ctx, bool spendAllowance) const {
    IssuanceError err = registry_.CheckActiveIssuer(ctx.caller, ctx.height);
    if (err != IssuanceError::OK) {
        return err;
    }
    if (amount <= 0) {
        return IssuanceError::NonPositiveAmount;
    }
    if (spendAllowance && ledger_.Allowance(account, ctx.caller) < amount) {
        return IssuanceError::InsufficientAllowance;
    }
    if (ledger_.BalanceOf(account) < amount) {
        return IssuanceError::InsufficientBalance;
    }
    const Amount burned = registry_.GetRecord(ctx.caller)->totalBurned;
    if (amount > std::numeric_limits<Amount>::max() - burned) {
        return IssuanceError::CounterOverflow;
    }
    return IssuanceError::OK;
}

void IssuanceController::FinishBurn(Amount amount, const CallContext& ctx) {
    const IssuerRecord& record = registry_.RecordBurn(ctx.caller, amount);

    IssuerActivityEvent event;
    event.issuer = ctx.caller;
    event.burned = amount;
    event.totalMinted = record.totalMinted;
    event.mintCount = record.mintCount;
    event.totalBurned = record.totalBurned;
    event.burnCount = record.burnCount;
    journal_.Append(ctx.height, event);
}

IssuanceResult IssuanceController::Burn(Amount amount, const CallContext& ctx) {
    util::ScopedBlockContext scope(ctx.height);

    IssuanceError err = CheckBurn(ctx.caller, amount, ctx, false);
    if (err != IssuanceError::OK) {
        LOG_DEBUG(util::LogCategory::ISSUANCE) << "Burn of " << FormatAmount(amount)
            << " by " << ctx.caller.ToHex() << " rejected: " << IssuanceErrorName(err);
        return IssuanceResult::Failure(err);
    }

    if (!ledger_.Burn(ctx.caller, amount)) {
        LOG_ERROR(util::LogCategory::ISSUANCE) << "Ledger refused a validated burn of "
            << FormatAmount(amount) << " by " << ctx.caller.ToHex();
        return IssuanceResult::Failure(IssuanceError::InsufficientBalance, "ledger refused burn");
    }

    FinishBurn(amount, ctx);

    LOG_INFO(util::LogCategory::ISSUANCE) << "Issuer " << ctx.caller.ToHex() << " burned "
        << FormatAmount(amount);
    return IssuanceResult::Success(amount);
}

IssuanceResult IssuanceController::BurnFrom(const Identity& account, Amount amount,
                                            const CallContext& ctx) {
    util::ScopedBlockContext scope(ctx.height);

    IssuanceError err = CheckBurn(account, amount, ctx, true);
    if (err != IssuanceError::OK) {
        LOG_DEBUG(util::LogCategory::ISSUANCE) << "Burn of " << FormatAmount(amount)
            << " from " << account.ToHex() << " by " << ctx.caller.ToHex()
            << " rejected: " << IssuanceErrorName(err);
        return IssuanceResult::Failure(err);
    }

    // Burn first: a refused burn then leaves the allowance untouched
    if (!ledger_.Burn(account, amount)) {
        LOG_ERROR(util::LogCategory::ISSUANCE) << "Ledger refused a validated burn of "
            << FormatAmount(amount) << " from " << account.ToHex();
        return IssuanceResult::Failure(IssuanceError::InsufficientBalance, "ledger refused burn");
    }
    if (!ledger_.SpendAllowance(account, ctx.caller, amount)) {
        LOG_ERROR(util::LogCategory::ISSUANCE) << "Ledger refused a validated allowance spend of "
            << FormatAmount(amount) << " over " << account.ToHex();
        return IssuanceResult::Failure(IssuanceError::InsufficientAllowance,
                                       "ledger refused allowance spend");
    }

    FinishBurn(amount, ctx);

    LOG_INFO(util::LogCategory::ISSUANCE) << "Issuer " << ctx.caller.ToHex() << " burned "
        << FormatAmount(amount) << " from " << account.ToHex();
    return IssuanceResult::Success(amount);
}

// ============================================================================
// Queries
// ============================================================================

std::optional<int64_t> IssuanceController::GetIssuerMintFactor(const Identity& identity) const {
    auto record = registry_.GetRecord(identity);
    if (!record) {
        return std::nullopt;
    }
    return ComputeMintFactor(*record, ledger_.TotalSupply(), params_);
}

std::optional<Amount> IssuanceController::GetIssuerMaxMintable(const Identity& identity) const {
    auto record = registry_.GetRecord(identity);
    if (!record) {
        return std::nullopt;
    }
    return ComputeMaxMintable(*record, ledger_.TotalSupply(), params_);
}

std::optional<MintFactorBreakdown>
IssuanceController::GetIssuerMintFactorBreakdown(const Identity& identity) const {
    auto record = registry_.GetRecord(identity);
    if (!record) {
        return std::nullopt;
    }
    return ComputeMintFactorBreakdown(*record, ledger_.TotalSupply(), params_);
}

} // namespace issuance
} // namespace mintguard
