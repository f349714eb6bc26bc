// MINTGATE - Core Types Header
// Copyright (c) 2024 MINTGATE Developers
// MIT License
//
// This file defines fundamental types used throughout MINTGATE.

#ifndef MINTGATE_CORE_TYPES_H
#define MINTGATE_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace mintgate {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in base currency units
using Amount = uint64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = uint64_t;

/// Sequential token identifier
using TokenId = uint64_t;

/// Fractional digits used when amounts are written as decimal text
constexpr int AMOUNT_DECIMALS = 9;

/// One whole currency unit in base units
constexpr Amount UNIT = 1000000000ULL;

/// Largest representable timestamp
constexpr Timestamp MAX_TIMESTAMP = std::numeric_limits<Timestamp>::max();

// ============================================================================
// Checked Arithmetic
// ============================================================================

/// a + b, or nullopt on overflow
inline std::optional<uint64_t> CheckedAdd(uint64_t a, uint64_t b) {
    if (a > std::numeric_limits<uint64_t>::max() - b) {
        return std::nullopt;
    }
    return a + b;
}

/// a * b, or nullopt on overflow
inline std::optional<uint64_t> CheckedMul(uint64_t a, uint64_t b) {
    if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
        return std::nullopt;
    }
    return a * b;
}

/// a + b clamped to the maximum value
inline uint64_t SaturatingAdd(uint64_t a, uint64_t b) {
    auto sum = CheckedAdd(a, b);
    return sum ? *sum : std::numeric_limits<uint64_t>::max();
}

// ============================================================================
// Fixed-size Byte Strings
// ============================================================================

/// Fixed-size byte string stored and displayed in natural (big-endian) order
template<size_t BITS>
class BaseBlob {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - all zeros
    BaseBlob() noexcept {
        data_.fill(0);
    }

    explicit BaseBlob(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero-padded on the right)
    BaseBlob(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseBlob& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseBlob& other) const noexcept {
        return !(*this == other);
    }

    /// Lexicographic byte order (matches unsigned big-endian integer order)
    bool operator<(const BaseBlob& other) const noexcept {
        return std::memcmp(data_.data(), other.data_.data(), SIZE) < 0;
    }

    /// Lowercase hex without prefix
    std::string ToHex() const;

    /// "0x" + ToHex()
    std::string ToString() const { return "0x" + ToHex(); }

    /// Parse hex, with or without "0x" prefix.
    /// @throws std::invalid_argument on bad length or characters
    static BaseBlob FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseBlob<256> {
public:
    using BaseBlob<256>::BaseBlob;
    Hash256() = default;
    Hash256(const BaseBlob<256>& b) : BaseBlob<256>(b) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseBlob<256>::FromHex(hex));
    }
};

/// 160-bit participant identity (20 bytes)
class Address : public BaseBlob<160> {
public:
    using BaseBlob<160>::BaseBlob;
    Address() = default;
    Address(const BaseBlob<160>& b) : BaseBlob<160>(b) {}

    static Address FromHex(const std::string& hex) {
        return Address(BaseBlob<160>::FromHex(hex));
    }
};

/// Parse an address, returning nullopt instead of throwing
std::optional<Address> ParseAddress(const std::string& str);

/// Parse a 32-byte hash, returning nullopt instead of throwing
std::optional<Hash256> ParseHash256(const std::string& str);

// ============================================================================
// Amount Formatting
// ============================================================================

/// Format base units as decimal text ("0.025")
std::string FormatAmount(Amount amount);

/// Parse decimal text into base units; nullopt on bad syntax, too many
/// fractional digits, or overflow
std::optional<Amount> ParseAmount(const std::string& str);

} // namespace mintgate

#endif // MINTGATE_CORE_TYPES_H
