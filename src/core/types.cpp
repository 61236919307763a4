// MINTGUARD - Core Types Implementation
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#include "mintguard/core/types.h"

#include <iomanip>
#include <sstream>

namespace mintguard {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    // Display in reverse byte order (big-endian display for hashes)
    std::string result;
    result.reserve(SIZE * 2);

    static const char hexChars[] = "0123456789abcdef";

    for (int i = SIZE - 1; i >= 0; --i) {
        result.push_back(hexChars[data_[i] >> 4]);
        result.push_back(hexChars[data_[i] & 0x0F]);
    }

    return result;
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }

    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }

    BaseHash result;

    auto hexCharToNibble = [](char c) -> Byte {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument("Invalid hex character");
    };

    // Parse in reverse order (hex string is big-endian display)
    for (size_t i = 0; i < SIZE; ++i) {
        size_t hexIdx = (SIZE - 1 - i) * 2;
        Byte high = hexCharToNibble(digits[hexIdx]);
        Byte low = hexCharToNibble(digits[hexIdx + 1]);
        result.data_[i] = (high << 4) | low;
    }

    return result;
}

// Explicit template instantiations
template class BaseHash<160>;

// ============================================================================
// Identity Helpers
// ============================================================================

Identity MakeIdentity(Byte fill) {
    std::array<Byte, Identity::SIZE> data;
    data.fill(fill);
    return Identity(data);
}

// ============================================================================
// Amount Formatting
// ============================================================================

std::string FormatAmount(Amount amount) {
    bool negative = amount < 0;
    if (negative) {
        amount = -amount;
    }

    std::ostringstream ss;
    if (negative) {
        ss << "-";
    }
    ss << amount / COIN << "."
       << std::setfill('0') << std::setw(8) << amount % COIN;
    return ss.str();
}

} // namespace mintguard
