// MINTGUARD - Issuer Record
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#ifndef MINTGUARD_ISSUANCE_ISSUER_H
#define MINTGUARD_ISSUANCE_ISSUER_H

#include "mintguard/core/serialize.h"
#include "mintguard/core/types.h"

#include <cstdint>

namespace mintguard {
namespace issuance {

/**
 * Per-issuer state. Exists exactly while the identity is authorized.
 *
 * The lifetime counters only grow while the record exists; they return to
 * zero only when the record is deleted and a fresh one is created.
 */
struct IssuerRecord {
    /// Index of the identity in the dense issuer list
    uint32_t position{0};

    /// Validity window: [startBlock, expirationBlock)
    BlockHeight startBlock{0};
    BlockHeight expirationBlock{0};

    Amount totalMinted{0};
    uint64_t mintCount{0};
    Amount totalBurned{0};
    uint64_t burnCount{0};

    bool IsExpired(BlockHeight now) const { return now >= expirationBlock; }

    bool operator==(const IssuerRecord& other) const {
        return position == other.position &&
               startBlock == other.startBlock &&
               expirationBlock == other.expirationBlock &&
               totalMinted == other.totalMinted &&
               mintCount == other.mintCount &&
               totalBurned == other.totalBurned &&
               burnCount == other.burnCount;
    }

    bool operator!=(const IssuerRecord& other) const { return !(*this == other); }
};

template<typename Stream>
void Serialize(Stream& s, const IssuerRecord& rec) {
    Serialize(s, rec.position);
    Serialize(s, rec.startBlock);
    Serialize(s, rec.expirationBlock);
    Serialize(s, rec.totalMinted);
    Serialize(s, rec.mintCount);
    Serialize(s, rec.totalBurned);
    Serialize(s, rec.burnCount);
}

template<typename Stream>
void Unserialize(Stream& s, IssuerRecord& rec) {
    Unserialize(s, rec.position);
    Unserialize(s, rec.startBlock);
    Unserialize(s, rec.expirationBlock);
    Unserialize(s, rec.totalMinted);
    Unserialize(s, rec.mintCount);
    Unserialize(s, rec.totalBurned);
    Unserialize(s, rec.burnCount);
}

} // namespace issuance
} // namespace mintguard

#endif // MINTGUARD_ISSUANCE_ISSUER_H
