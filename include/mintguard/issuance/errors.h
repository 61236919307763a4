// MINTGUARD - Issuance Errors
// Copyright (c) 2024 MINTGUARD Developers
// MIT License
//
// Named failure taxonomy shared by the registry and the controller. Every
// rejected request is an ordinary outcome reported through IssuanceResult;
// nothing here is a fatal process error.

#ifndef MINTGUARD_ISSUANCE_ERRORS_H
#define MINTGUARD_ISSUANCE_ERRORS_H

#include "mintguard/core/types.h"

#include <optional>
#include <string>

namespace mintguard {
namespace issuance {

// ============================================================================
// Error Codes
// ============================================================================

enum class IssuanceError {
    OK = 0,

    // Eligibility
    NotAuthorized,
    TermExpired,
    AlreadyAuthorized,
    CapReached,
    CooldownActive,

    // Target validity
    InvalidTarget,
    InvalidReceiver,

    // Economic bound
    ExceedsMintFactor,
    NonPositiveAmount,
    ExceedsMaxSupply,
    InsufficientBalance,
    InsufficientAllowance,
    CounterOverflow,

    // Timing
    TermNotExpired,
    StaleBlockHeight,

    ERROR_COUNT
};

/// Human-readable description of an error
std::string IssuanceErrorString(IssuanceError err);

/// Stable identifier of an error ("CapReached"), used in executor output
const char* IssuanceErrorName(IssuanceError err);

/// Reverse of IssuanceErrorName
std::optional<IssuanceError> IssuanceErrorFromName(const std::string& name);

// ============================================================================
// Operation Result
// ============================================================================

/**
 * Outcome of one state-mutating operation.
 *
 * For mint and burn operations `amount` is the amount actually moved on the
 * ledger (a bootstrap or floor top-up mint credits more than requested).
 */
struct IssuanceResult {
    IssuanceError error{IssuanceError::OK};
    std::string message;
    Amount amount{0};

    static IssuanceResult Success(Amount moved = 0) {
        IssuanceResult r;
        r.amount = moved;
        return r;
    }

    static IssuanceResult Failure(IssuanceError err) {
        IssuanceResult r;
        r.error = err;
        r.message = IssuanceErrorString(err);
        return r;
    }

    static IssuanceResult Failure(IssuanceError err, const std::string& detail) {
        IssuanceResult r;
        r.error = err;
        r.message = IssuanceErrorString(err) + ": " + detail;
        return r;
    }

    bool IsOk() const { return error == IssuanceError::OK; }
    explicit operator bool() const { return IsOk(); }
};

} // namespace issuance
} // namespace mintguard

#endif // MINTGUARD_ISSUANCE_ERRORS_H
