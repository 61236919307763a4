// MINTGUARD - Fungible Ledger
// Copyright (c) 2024 MINTGUARD Developers
// MIT License
//
// The controller drives an external fungible-value ledger through the
// Ledger interface. TokenLedger is the in-process implementation used by
// the executor and the tests.

#ifndef MINTGUARD_ISSUANCE_LEDGER_H
#define MINTGUARD_ISSUANCE_LEDGER_H

#include "mintguard/core/types.h"

#include <functional>
#include <map>
#include <unordered_map>
#include <utility>

namespace mintguard {
namespace issuance {

// ============================================================================
// Ledger Interface
// ============================================================================

/**
 * Abstract view of a fungible-value ledger.
 *
 * The mutating calls return false (and change nothing) when the request
 * cannot be honored.
 */
class Ledger {
public:
    virtual ~Ledger() = default;

    /// Total units in circulation
    virtual Amount TotalSupply() const = 0;

    /// Balance of an account
    virtual Amount BalanceOf(const Identity& account) const = 0;

    /// Amount `spender` may still move on behalf of `owner`
    virtual Amount Allowance(const Identity& owner, const Identity& spender) const = 0;

    /// Credit newly created units to `account`
    virtual bool Mint(const Identity& account, Amount amount) = 0;

    /// Destroy units held by `account`
    virtual bool Burn(const Identity& account, Amount amount) = 0;

    /// Reduce the allowance of `spender` over `owner`'s funds
    virtual bool SpendAllowance(const Identity& owner, const Identity& spender,
                                Amount amount) = 0;
};

// ============================================================================
// Token Ledger
// ============================================================================

/// Kind of balance change reported by TokenLedger
enum class LedgerChangeType {
    MINT,
    BURN,
    TRANSFER,
    APPROVAL,
};

/// A balance or allowance change
struct LedgerChange {
    LedgerChangeType type;
    Identity from;    // null for MINT
    Identity to;      // null for BURN; spender for APPROVAL
    Amount amount{0};
};

const char* LedgerChangeTypeString(LedgerChangeType type);

/**
 * In-memory ledger with balances and allowances.
 *
 * Zero balances and zero allowances are not stored.
 */
class TokenLedger : public Ledger {
public:
    using BalanceMap = std::unordered_map<Identity, Amount, IdentityHasher>;
    using AllowanceMap = std::map<std::pair<Identity, Identity>, Amount>;
    using ChangeCallback = std::function<void(const LedgerChange&)>;

    TokenLedger() = default;

    Amount TotalSupply() const override { return totalSupply_; }
    Amount BalanceOf(const Identity& account) const override;
    Amount Allowance(const Identity& owner, const Identity& spender) const override;

    bool Mint(const Identity& account, Amount amount) override;
    bool Burn(const Identity& account, Amount amount) override;
    bool SpendAllowance(const Identity& owner, const Identity& spender,
                        Amount amount) override;

    /// Move units between accounts
    bool Transfer(const Identity& from, const Identity& to, Amount amount);

    /// Set (not add to) the allowance of `spender` over `owner`'s funds
    bool Approve(const Identity& owner, const Identity& spender, Amount amount);

    /// Register a callback fired after every successful change
    void SetChangeCallback(ChangeCallback callback) { onChange_ = std::move(callback); }

    const BalanceMap& Balances() const { return balances_; }
    const AllowanceMap& Allowances() const { return allowances_; }

    /**
     * Replace the state with persisted data. Fails if a value is negative
     * or the balances do not add up to `totalSupply`.
     */
    bool Restore(BalanceMap balances, AllowanceMap allowances, Amount totalSupply);

private:
    void Notify(LedgerChangeType type, const Identity& from, const Identity& to,
                Amount amount);

    BalanceMap balances_;
    AllowanceMap allowances_;
    Amount totalSupply_{0};
    ChangeCallback onChange_;
};

} // namespace issuance
} // namespace mintguard

#endif // MINTGUARD_ISSUANCE_LEDGER_H
