// VOTELOCK - Fixed-Point Arithmetic
// Copyright (c) 2024 VOTELOCK Developers
// MIT License
//
// SCALE-fixed decimal arithmetic over signed 256-bit integers.
// Every operation truncates toward zero; nothing rounds up.

#ifndef VOTELOCK_CORE_FIXED_POINT_H
#define VOTELOCK_CORE_FIXED_POINT_H

#include <votelock/core/types.h>

#include <optional>
#include <string>

namespace votelock {

/// Number of fractional decimal digits carried by SCALE
constexpr int FIXED_POINT_DECIMALS = 18;

/// a * b / SCALE, truncated
FixedPoint MulDown(const FixedPoint& a, const FixedPoint& b);

/// a * SCALE / b, truncated. Throws std::invalid_argument if b is zero.
FixedPoint DivDown(const FixedPoint& a, const FixedPoint& b);

/// max(0, value)
inline FixedPoint ClampNonNegative(const FixedPoint& value) {
    return value < 0 ? FixedPoint(0) : value;
}

/**
 * max(0, bias - slope * elapsed) for non-negative slope and elapsed.
 * Never forms a product larger than bias, so it cannot overflow.
 */
FixedPoint LinearDecay(const FixedPoint& bias, const FixedPoint& slope,
                       const FixedPoint& elapsed);

/// Convert a whole-unit count to fixed point (n * SCALE)
inline FixedPoint ToFixedPoint(int64_t units) {
    return FixedPoint(units) * SCALE;
}

/**
 * Parse a decimal string ("1", "1.25", "-0.5") into fixed point.
 * Returns nullopt on malformed input or more than 18 fractional digits.
 */
std::optional<FixedPoint> ParseFixedPoint(const std::string& str);

/// Format as a decimal string with trailing fractional zeros removed
std::string FormatFixedPoint(const FixedPoint& value);

/// Raw integer representation as a decimal string
std::string FixedPointToRawString(const FixedPoint& value);

} // namespace votelock

#endif // VOTELOCK_CORE_FIXED_POINT_H
