// MINTGUARD - Issuance Parameters Header
// Copyright (c) 2024 MINTGUARD Developers
// MIT License
//
// Deployment constants of the issuance controller. They are fixed when the
// controller is constructed and never change afterwards.

#ifndef MINTGUARD_ISSUANCE_PARAMS_H
#define MINTGUARD_ISSUANCE_PARAMS_H

#include "mintguard/core/serialize.h"
#include "mintguard/core/types.h"

#include <cstdint>
#include <string>

namespace mintguard {

namespace util {
class ConfigManager;
}

namespace issuance {

/// Basis-point denominator used for the early-exit threshold
constexpr int64_t BPS_DENOMINATOR = 10000;

// ============================================================================
// Issuance Parameters
// ============================================================================

/// Parameters that govern issuer membership and mint sizing
struct IssuanceParams {
    // ========================================================================
    // Identification
    // ========================================================================

    /// Preset name (main, regtest)
    std::string strNetworkID;

    /// The controller's own identity; never a valid mint receiver or
    /// transfer target
    Identity controllerIdentity;

    // ========================================================================
    // Membership
    // ========================================================================

    /// Maximum number of simultaneously authorized issuers
    uint32_t nMaxIssuers;

    /// Issuer term in blocks
    BlockHeight nIssuerTermLength;

    /// Fraction of the term (in basis points) an issuer must serve before a
    /// voluntary exit is free of cooldown (9500 = 95%)
    int64_t nEarlyExitThresholdBps;

    // ========================================================================
    // Mint Factor (integer numerators over nMintFactorScale)
    // ========================================================================

    /// Scale S of every factor (10000 = parts per ten thousand)
    int64_t nMintFactorScale;

    /// Base mint factor (100 = 1% of supply per action)
    int64_t nBaseMintFactor;

    /// Bonus granted per satisfied burn condition
    int64_t nBurnBonusUnit;

    /// Average-percent-mint below which an issuer earns a bonus (200 = 2%)
    int64_t nLowMintThreshold;

    // ========================================================================
    // Supply
    // ========================================================================

    /// Minimum total supply enforced on mint calls
    Amount nSupplyFloor;

    // ========================================================================
    // Helper Methods
    // ========================================================================

    /// True if leaving after `served` blocks counts as an early exit
    bool IsEarlyExit(BlockHeight served) const {
        return static_cast<__int128>(served) * BPS_DENOMINATOR <
               static_cast<__int128>(nIssuerTermLength) * nEarlyExitThresholdBps;
    }

    /// Check parameter consistency. Returns an empty string when valid,
    /// otherwise a description of the first problem found.
    std::string Validate() const;

    /// True if every rule-bearing field matches. The preset name is a label
    /// and is ignored.
    bool SameRules(const IssuanceParams& other) const;

    // ========================================================================
    // Presets
    // ========================================================================

    /// Production parameters (two-week terms at 6s blocks)
    static IssuanceParams Main();

    /// Short terms and a small floor for local testing
    static IssuanceParams RegTest();

    /**
     * Build parameters from configuration.
     *
     * Starts from RegTest() when `regtest` is set, Main() otherwise, then
     * overlays the issuance keys. Keys in the preset's section ([main] or
     * [regtest]) take priority over global ones.
     *
     * @throws std::invalid_argument on a malformed value
     */
    static IssuanceParams FromConfig(const util::ConfigManager& config);
};

/// Rule-bearing fields only; strNetworkID is not stored
template<typename Stream>
void Serialize(Stream& s, const IssuanceParams& p) {
    Serialize(s, p.controllerIdentity);
    Serialize(s, p.nMaxIssuers);
    Serialize(s, p.nIssuerTermLength);
    Serialize(s, p.nEarlyExitThresholdBps);
    Serialize(s, p.nMintFactorScale);
    Serialize(s, p.nBaseMintFactor);
    Serialize(s, p.nBurnBonusUnit);
    Serialize(s, p.nLowMintThreshold);
    Serialize(s, p.nSupplyFloor);
}

template<typename Stream>
void Unserialize(Stream& s, IssuanceParams& p) {
    Unserialize(s, p.controllerIdentity);
    Unserialize(s, p.nMaxIssuers);
    Unserialize(s, p.nIssuerTermLength);
    Unserialize(s, p.nEarlyExitThresholdBps);
    Unserialize(s, p.nMintFactorScale);
    Unserialize(s, p.nBaseMintFactor);
    Unserialize(s, p.nBurnBonusUnit);
    Unserialize(s, p.nLowMintThreshold);
    Unserialize(s, p.nSupplyFloor);
}

} // namespace issuance
} // namespace mintguard

#endif // MINTGUARD_ISSUANCE_PARAMS_H
