// VOTELOCK - Core Types
// Copyright (c) 2024 VOTELOCK Developers
// MIT License
//
// Scalar aliases, fixed-point constants and the account address type shared
// by every module.

#ifndef VOTELOCK_CORE_TYPES_H
#define VOTELOCK_CORE_TYPES_H

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace votelock {

// ============================================================================
// Scalars
// ============================================================================

using Byte = uint8_t;

/// Unix epoch seconds
using Timestamp = int64_t;

/// Signed 256-bit value scaled by SCALE. Balances, slopes and biases use it.
/// Arithmetic that leaves the 256-bit range throws std::overflow_error.
using FixedPoint = boost::multiprecision::checked_int256_t;

using PoolId = uint64_t;

/// Allocated from one engine-wide counter; never reused
using LockId = uint64_t;

/// 1.0 in fixed point
const FixedPoint SCALE{1000000000000000000LL};

/// Epoch length. Every unlock time is a multiple of it.
constexpr Timestamp WEEK = 7 * 24 * 60 * 60;

// ============================================================================
// Address
// ============================================================================

/// 160-bit account identifier for lock owners and callers. Bytes are stored
/// little-endian and shown big-endian in hex, so ordering follows the hex form.
class Address {
public:
    static constexpr size_t SIZE = 20;

    Address() noexcept { bytes_.fill(0); }

    /// Copies up to SIZE bytes; shorter input is zero-padded.
    Address(const Byte* src, size_t len) noexcept;

    bool IsNull() const noexcept;
    void SetNull() noexcept { bytes_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t i) { return bytes_[i]; }
    const Byte& operator[](size_t i) const { return bytes_[i]; }

    Byte* data() noexcept { return bytes_.data(); }
    const Byte* data() const noexcept { return bytes_.data(); }

    const Byte* begin() const noexcept { return bytes_.data(); }
    const Byte* end() const noexcept { return bytes_.data() + SIZE; }

    bool operator==(const Address& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const Address& other) const noexcept { return bytes_ != other.bytes_; }
    bool operator<(const Address& other) const noexcept;

    /// 40 lowercase hex digits, most significant byte first
    std::string ToHex() const;

    /// Accepts an optional 0x prefix and either case.
    /// @throws std::invalid_argument on bad length or digits
    static Address FromHex(const std::string& hex);

private:
    std::array<Byte, SIZE> bytes_;
};

} // namespace votelock

#endif // VOTELOCK_CORE_TYPES_H
