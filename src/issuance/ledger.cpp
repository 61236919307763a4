// MINTGUARD - Fungible Ledger Implementation
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#include "mintguard/issuance/ledger.h"
#include "mintguard/util/logging.h"

namespace mintguard {
namespace issuance {

const char* LedgerChangeTypeString(LedgerChangeType type) {
    switch (type) {
        case LedgerChangeType::MINT: return "mint";
        case LedgerChangeType::BURN: return "burn";
        case LedgerChangeType::TRANSFER: return "transfer";
        case LedgerChangeType::APPROVAL: return "approval";
        default: return "unknown";
    }
}

Amount TokenLedger::BalanceOf(const Identity& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

Amount TokenLedger::Allowance(const Identity& owner, const Identity& spender) const {
    auto it = allowances_.find({owner, spender});
    return it == allowances_.end() ? 0 : it->second;
}

bool TokenLedger::Mint(const Identity& account, Amount amount) {
    if (amount <= 0 || account.IsNull()) {
        return false;
    }
    if (amount > MAX_SUPPLY - totalSupply_) {
        return false;
    }

    balances_[account] += amount;
    totalSupply_ += amount;
    Notify(LedgerChangeType::MINT, Identity(), account, amount);
    return true;
}

bool TokenLedger::Burn(const Identity& account, Amount amount) {
    if (amount <= 0) {
        return false;
    }
    auto it = balances_.find(account);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }

    it->second -= amount;
    if (it->second == 0) {
        balances_.erase(it);
    }
    totalSupply_ -= amount;
    Notify(LedgerChangeType::BURN, account, Identity(), amount);
    return true;
}

bool TokenLedger::SpendAllowance(const Identity& owner, const Identity& spender,
                                 Amount amount) {
    if (amount < 0) {
        return false;
    }
    auto it = allowances_.find({owner, spender});
    Amount current = it == allowances_.end() ? 0 : it->second;
    if (current < amount) {
        return false;
    }
    if (amount == 0) {
        return true;
    }

    it->second -= amount;
    if (it->second == 0) {
        allowances_.erase(it);
    }
    return true;
}

bool TokenLedger::Transfer(const Identity& from, const Identity& to, Amount amount) {
    if (amount <= 0 || to.IsNull()) {
        return false;
    }
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }

    it->second -= amount;
    if (it->second == 0) {
        balances_.erase(it);
    }
    balances_[to] += amount;
    Notify(LedgerChangeType::TRANSFER, from, to, amount);
    return true;
}

bool TokenLedger::Approve(const Identity& owner, const Identity& spender, Amount amount) {
    if (amount < 0 || spender.IsNull()) {
        return false;
    }

    if (amount == 0) {
        allowances_.erase({owner, spender});
    } else {
        allowances_[{owner, spender}] = amount;
    }
    Notify(LedgerChangeType::APPROVAL, owner, spender, amount);
    return true;
}

bool TokenLedger::Restore(BalanceMap balances, AllowanceMap allowances, Amount totalSupply) {
    if (!SupplyRange(totalSupply)) {
        return false;
    }

    Amount sum = 0;
    for (const auto& entry : balances) {
        if (entry.second < 0 || entry.second > MAX_SUPPLY - sum) {
            return false;
        }
        sum += entry.second;
    }
    if (sum != totalSupply) {
        return false;
    }
    for (const auto& entry : allowances) {
        if (entry.second < 0) {
            return false;
        }
    }

    balances_ = std::move(balances);
    allowances_ = std::move(allowances);
    totalSupply_ = totalSupply;
    return true;
}

void TokenLedger::Notify(LedgerChangeType type, const Identity& from, const Identity& to,
                         Amount amount) {
    LOG_TRACE(util::LogCategory::LEDGER) << LedgerChangeTypeString(type)
        << " " << FormatAmount(amount) << " " << from.ToHex() << " -> " << to.ToHex();

    if (onChange_) {
        onChange_(LedgerChange{type, from, to, amount});
    }
}

} // namespace issuance
} // namespace mintguard
