// MINTGUARD - Issuance Errors Implementation
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#include "mintguard/issuance/errors.h"

namespace mintguard {
namespace issuance {

std::string IssuanceErrorString(IssuanceError err) {
    switch (err) {
        case IssuanceError::OK: return "No error";
        case IssuanceError::NotAuthorized: return "Caller is not an authorized issuer";
        case IssuanceError::TermExpired: return "Issuer term has expired";
        case IssuanceError::AlreadyAuthorized: return "Identity is already an authorized issuer";
        case IssuanceError::CapReached: return "Maximum number of issuers reached";
        case IssuanceError::CooldownActive: return "Identity is in its reactivation cooldown";
        case IssuanceError::InvalidTarget: return "Target must not be the null identity or the controller";
        case IssuanceError::InvalidReceiver: return "Receiver must not be the null identity or the controller";
        case IssuanceError::ExceedsMintFactor: return "Requested amount exceeds the issuer's mint factor";
        case IssuanceError::NonPositiveAmount: return "Amount must be positive";
        case IssuanceError::ExceedsMaxSupply: return "Mint would exceed the maximum supply";
        case IssuanceError::InsufficientBalance: return "Insufficient balance";
        case IssuanceError::InsufficientAllowance: return "Insufficient allowance";
        case IssuanceError::CounterOverflow: return "Issuer lifetime counter would overflow";
        case IssuanceError::TermNotExpired: return "Issuer term has not expired";
        case IssuanceError::StaleBlockHeight: return "Block height is lower than the last executed height";
        default: return "Unknown error";
    }
}

const char* IssuanceErrorName(IssuanceError err) {
    switch (err) {
        case IssuanceError::OK: return "OK";
        case IssuanceError::NotAuthorized: return "NotAuthorized";
        case IssuanceError::TermExpired: return "TermExpired";
        case IssuanceError::AlreadyAuthorized: return "AlreadyAuthorized";
        case IssuanceError::CapReached: return "CapReached";
        case IssuanceError::CooldownActive: return "CooldownActive";
        case IssuanceError::InvalidTarget: return "InvalidTarget";
        case IssuanceError::InvalidReceiver: return "InvalidReceiver";
        case IssuanceError::ExceedsMintFactor: return "ExceedsMintFactor";
        case IssuanceError::NonPositiveAmount: return "NonPositiveAmount";
        case IssuanceError::ExceedsMaxSupply: return "ExceedsMaxSupply";
        case IssuanceError::InsufficientBalance: return "InsufficientBalance";
        case IssuanceError::InsufficientAllowance: return "InsufficientAllowance";
        case IssuanceError::CounterOverflow: return "CounterOverflow";
        case IssuanceError::TermNotExpired: return "TermNotExpired";
        case IssuanceError::StaleBlockHeight: return "StaleBlockHeight";
        default: return "Unknown";
    }
}

std::optional<IssuanceError> IssuanceErrorFromName(const std::string& name) {
    for (int i = 0; i < static_cast<int>(IssuanceError::ERROR_COUNT); ++i) {
        auto err = static_cast<IssuanceError>(i);
        if (name == IssuanceErrorName(err)) {
            return err;
        }
    }
    return std::nullopt;
}

} // namespace issuance
} // namespace mintguard
