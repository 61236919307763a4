// MINTGUARD - Mint Factor Calculator Implementation
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#include "mintguard/issuance/mintfactor.h"

#include <algorithm>
#include <cstdint>

namespace mintguard {
namespace issuance {

MintFactorBreakdown ComputeMintFactorBreakdown(const IssuerRecord& record,
                                               Amount currentSupply,
                                               const IssuanceParams& params) {
    MintFactorBreakdown b;
    const int64_t base = params.nBaseMintFactor;

    if (currentSupply <= 0) {
        b.bootstrap = true;
        b.factor = base;
        return b;
    }

    b.avgMint = record.mintCount > 0
        ? record.totalMinted / static_cast<Amount>(record.mintCount) : 0;
    b.avgBurn = record.burnCount > 0
        ? record.totalBurned / static_cast<Amount>(record.burnCount) : 0;

    // avgMint * S can exceed 64 bits for large supplies
    __int128 scaled = static_cast<__int128>(b.avgMint) * params.nMintFactorScale;
    __int128 percent = scaled / currentSupply;
    b.avgPercentMint = percent > INT64_MAX ? INT64_MAX : static_cast<int64_t>(percent);

    b.adjustedBase = b.avgPercentMint >= base ? 0 : base - b.avgPercentMint;

    b.burnedAtLeastMinted = record.totalBurned >= record.totalMinted;
    b.avgBurnAtLeastAvgMint = b.avgBurn >= b.avgMint;
    b.lowMintRate = b.avgPercentMint < params.nLowMintThreshold;

    if (b.burnedAtLeastMinted) b.burnOffset += params.nBurnBonusUnit;
    if (b.avgBurnAtLeastAvgMint) b.burnOffset += params.nBurnBonusUnit;
    if (b.lowMintRate) b.burnOffset += params.nBurnBonusUnit;

    b.factor = std::min(base, b.adjustedBase + b.burnOffset);
    return b;
}

int64_t ComputeMintFactor(const IssuerRecord& record, Amount currentSupply,
                          const IssuanceParams& params) {
    return ComputeMintFactorBreakdown(record, currentSupply, params).factor;
}

Amount ComputeMaxMintable(const IssuerRecord& record, Amount currentSupply,
                          const IssuanceParams& params) {
    if (currentSupply <= 0) {
        return params.nSupplyFloor;
    }

    int64_t factor = ComputeMintFactor(record, currentSupply, params);
    __int128 product = static_cast<__int128>(currentSupply) * factor;
    return static_cast<Amount>(product / params.nMintFactorScale);
}

} // namespace issuance
} // namespace mintguard
