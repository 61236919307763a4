// MINTGUARD - Core Types Header
// Copyright (c) 2024 MINTGUARD Developers
// MIT License
//
// This file defines fundamental types used throughout MINTGUARD.

#ifndef MINTGUARD_CORE_TYPES_H
#define MINTGUARD_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace mintguard {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest ledger units
using Amount = int64_t;

/// Block counter supplied by the host environment
using BlockHeight = int64_t;

/// Constants
constexpr Amount COIN = 100000000LL;  // 1 unit = 100 million base units
constexpr Amount MAX_SUPPLY = 21000000000LL * COIN;  // 21 billion units max

/// Check if amount is in valid range
inline bool SupplyRange(Amount value) {
    return value >= 0 && value <= MAX_SUPPLY;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic fixed-width hash template
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set hash to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    /// Size in bytes
    constexpr size_t size() const noexcept { return SIZE; }

    /// Element access
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    /// Raw data access
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    /// Iterators
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    /// Comparison operators
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        // Compare in reverse order (most significant byte last in storage)
        for (int i = SIZE - 1; i >= 0; --i) {
            if (data_[i] < other.data_[i]) return true;
            if (data_[i] > other.data_[i]) return false;
        }
        return false;
    }

    /// Convert to hex string (displayed in reverse byte order)
    std::string ToHex() const;

    /// Create from hex string
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Identity
// ============================================================================

/// 160-bit hash (20 bytes) - for addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    explicit Hash160(const BaseHash<160>& base) : BaseHash<160>(base) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

/// An account or issuer identity. The all-zero value is the null identity.
using Identity = Hash160;

/// Build an identity whose bytes are all `fill` (test and preset helper)
Identity MakeIdentity(Byte fill);

/// Hash function for Identity keys in unordered containers
struct IdentityHasher {
    size_t operator()(const Identity& id) const {
        size_t seed = 0;
        for (size_t i = 0; i < 8; ++i) {
            seed ^= static_cast<size_t>(id[i]) << (i * 8);
        }
        return seed;
    }
};

// ============================================================================
// Amount Formatting
// ============================================================================

/// Format an amount as "<units>.<8 decimals>"
std::string FormatAmount(Amount amount);

} // namespace mintguard

#endif // MINTGUARD_CORE_TYPES_H
