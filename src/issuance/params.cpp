// MINTGUARD - Issuance Parameters Implementation
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#include "mintguard/issuance/params.h"
#include "mintguard/util/config.h"

#include <stdexcept>

namespace mintguard {
namespace issuance {

// ============================================================================
// Presets
// ============================================================================

IssuanceParams IssuanceParams::Main() {
    IssuanceParams p;
    p.strNetworkID = "main";
    p.controllerIdentity = Identity::FromHex("6d696e7467756172642d636f6e74726f6c6c6572");

    p.nMaxIssuers = 10;
    p.nIssuerTermLength = 201600;
    p.nEarlyExitThresholdBps = 9500;

    p.nMintFactorScale = 10000;
    p.nBaseMintFactor = 100;
    p.nBurnBonusUnit = 10;
    p.nLowMintThreshold = 200;

    p.nSupplyFloor = 1000000 * COIN;
    return p;
}

IssuanceParams IssuanceParams::RegTest() {
    IssuanceParams p = Main();
    p.strNetworkID = "regtest";
    p.controllerIdentity = MakeIdentity(0xcc);

    p.nMaxIssuers = 3;
    p.nIssuerTermLength = 100;

    p.nSupplyFloor = 1000 * COIN;
    return p;
}

// ============================================================================
// Validation
// ============================================================================

std::string IssuanceParams::Validate() const {
    if (nMaxIssuers == 0) {
        return "issuer cap must be positive";
    }
    if (nIssuerTermLength <= 0) {
        return "issuer term length must be positive";
    }
    if (nMintFactorScale <= 0) {
        return "mint factor scale must be positive";
    }
    if (nBaseMintFactor < 0 || nBaseMintFactor > nMintFactorScale) {
        return "base mint factor must be within [0, scale]";
    }
    if (nBurnBonusUnit < 0) {
        return "burn bonus must not be negative";
    }
    if (nLowMintThreshold < 0) {
        return "low-mint threshold must not be negative";
    }
    if (nEarlyExitThresholdBps <= 0 || nEarlyExitThresholdBps > BPS_DENOMINATOR) {
        return "early-exit threshold must be within (0, 10000]";
    }
    if (!SupplyRange(nSupplyFloor)) {
        return "supply floor must be within [0, MAX_SUPPLY]";
    }
    return "";
}

bool IssuanceParams::SameRules(const IssuanceParams& other) const {
    return controllerIdentity == other.controllerIdentity &&
           nMaxIssuers == other.nMaxIssuers &&
           nIssuerTermLength == other.nIssuerTermLength &&
           nEarlyExitThresholdBps == other.nEarlyExitThresholdBps &&
           nMintFactorScale == other.nMintFactorScale &&
           nBaseMintFactor == other.nBaseMintFactor &&
           nBurnBonusUnit == other.nBurnBonusUnit &&
           nLowMintThreshold == other.nLowMintThreshold &&
           nSupplyFloor == other.nSupplyFloor;
}

// ============================================================================
// Configuration Overlay
// ============================================================================

namespace {

int64_t ReadInt(const util::ConfigManager& config, const char* key,
                const std::string& section, int64_t current) {
    auto raw = config.TryGetString(key, section);
    if (!raw) {
        raw = config.TryGetString(key);
    }
    if (!raw) {
        return current;
    }
    auto value = util::ConfigManager::ParseInt(*raw);
    if (!value) {
        throw std::invalid_argument(std::string("invalid integer for ") + key + ": " + *raw);
    }
    return *value;
}

} // namespace

IssuanceParams IssuanceParams::FromConfig(const util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    bool regtest = config.GetBool(REGTEST, false);
    IssuanceParams p = regtest ? RegTest() : Main();
    const std::string& section = p.strNetworkID;

    int64_t maxIssuers = ReadInt(config, MAXISSUERS, section, p.nMaxIssuers);
    if (maxIssuers < 0 || maxIssuers > UINT32_MAX) {
        throw std::invalid_argument("maxissuers out of range");
    }
    p.nMaxIssuers = static_cast<uint32_t>(maxIssuers);

    p.nIssuerTermLength = ReadInt(config, TERMLENGTH, section, p.nIssuerTermLength);
    p.nBaseMintFactor = ReadInt(config, BASEMINTFACTOR, section, p.nBaseMintFactor);
    p.nMintFactorScale = ReadInt(config, MINTFACTORSCALE, section, p.nMintFactorScale);
    p.nBurnBonusUnit = ReadInt(config, BURNBONUS, section, p.nBurnBonusUnit);
    p.nLowMintThreshold = ReadInt(config, LOWMINTTHRESHOLD, section, p.nLowMintThreshold);
    p.nSupplyFloor = ReadInt(config, SUPPLYFLOOR, section, p.nSupplyFloor);
    p.nEarlyExitThresholdBps = ReadInt(config, EARLYEXITBPS, section, p.nEarlyExitThresholdBps);

    auto controller = config.TryGetString(CONTROLLER, section);
    if (!controller) {
        controller = config.TryGetString(CONTROLLER);
    }
    if (controller) {
        p.controllerIdentity = Identity::FromHex(*controller);
    }

    return p;
}

} // namespace issuance
} // namespace mintguard
