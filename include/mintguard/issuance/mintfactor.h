// MINTGUARD - Mint Factor Calculator
// Copyright (c) 2024 MINTGUARD Developers
// MIT License
//
// Pure functions deriving an issuer's per-action mint ceiling from its
// record and the current total supply. All arithmetic is integer with
// truncating division; factors are numerators over params.nMintFactorScale.

#ifndef MINTGUARD_ISSUANCE_MINTFACTOR_H
#define MINTGUARD_ISSUANCE_MINTFACTOR_H

#include "mintguard/core/types.h"
#include "mintguard/issuance/issuer.h"
#include "mintguard/issuance/params.h"

#include <cstdint>

namespace mintguard {
namespace issuance {

/// Intermediate terms of a mint factor computation
struct MintFactorBreakdown {
    Amount avgMint{0};
    Amount avgBurn{0};
    int64_t avgPercentMint{0};
    int64_t adjustedBase{0};
    int64_t burnOffset{0};

    bool burnedAtLeastMinted{false};
    bool avgBurnAtLeastAvgMint{false};
    bool lowMintRate{false};

    /// min(base, adjustedBase + burnOffset)
    int64_t factor{0};

    /// True when supply was zero and the base factor was returned unchanged
    bool bootstrap{false};
};

/// Compute the factor together with its intermediate terms
MintFactorBreakdown ComputeMintFactorBreakdown(const IssuerRecord& record,
                                               Amount currentSupply,
                                               const IssuanceParams& params);

/// Compute the mint factor; always within [0, params.nBaseMintFactor]
int64_t ComputeMintFactor(const IssuerRecord& record, Amount currentSupply,
                          const IssuanceParams& params);

/**
 * Largest single-mint request the issuer may make right now:
 * floor(currentSupply * factor / S), or the supply floor when supply is
 * zero (the bootstrap mint ignores the requested amount).
 */
Amount ComputeMaxMintable(const IssuerRecord& record, Amount currentSupply,
                          const IssuanceParams& params);

} // namespace issuance
} // namespace mintguard

#endif // MINTGUARD_ISSUANCE_MINTFACTOR_H
