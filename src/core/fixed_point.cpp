// VOTELOCK - Fixed-Point Arithmetic Implementation
// Copyright (c) 2024 VOTELOCK Developers
// MIT License

#include <votelock/core/fixed_point.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace votelock {

FixedPoint MulDown(const FixedPoint& a, const FixedPoint& b) {
    return (a * b) / SCALE;
}

FixedPoint DivDown(const FixedPoint& a, const FixedPoint& b) {
    if (b == 0) {
        throw std::invalid_argument("Fixed-point division by zero");
    }
    return (a * SCALE) / b;
}

FixedPoint LinearDecay(const FixedPoint& bias, const FixedPoint& slope,
                       const FixedPoint& elapsed) {
    if (bias <= 0) {
        return 0;
    }
    if (slope <= 0 || elapsed <= 0) {
        return bias;
    }
    // Past bias / slope the product exceeds bias
    if (elapsed > bias / slope) {
        return 0;
    }
    return bias - slope * elapsed;
}

std::optional<FixedPoint> ParseFixedPoint(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    size_t pos = 0;
    bool negative = false;
    if (str[0] == '-' || str[0] == '+') {
        negative = str[0] == '-';
        pos = 1;
    }

    std::string whole;
    std::string frac;
    bool seenDot = false;

    for (; pos < str.size(); ++pos) {
        char c = str[pos];
        if (c == '.') {
            if (seenDot) return std::nullopt;
            seenDot = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        (seenDot ? frac : whole).push_back(c);
    }

    if (whole.empty() && frac.empty()) {
        return std::nullopt;
    }
    if (frac.size() > static_cast<size_t>(FIXED_POINT_DECIMALS)) {
        return std::nullopt;
    }
    // 2^255 is about 5.7e76; keep well inside that
    if (whole.size() > 50) {
        return std::nullopt;
    }

    frac.append(FIXED_POINT_DECIMALS - frac.size(), '0');
    // A leading zero would make the parser read octal
    std::string digits = whole + frac;
    digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size()));
    if (digits.empty()) {
        return FixedPoint(0);
    }

    FixedPoint result(digits.c_str());
    return negative ? FixedPoint(-result) : result;
}

std::string FormatFixedPoint(const FixedPoint& value) {
    FixedPoint magnitude = value < 0 ? FixedPoint(-value) : value;
    FixedPoint whole = magnitude / SCALE;
    FixedPoint frac = magnitude % SCALE;

    std::ostringstream ss;
    if (value < 0) ss << "-";
    ss << whole.str();

    if (frac != 0) {
        std::string fracStr = frac.str();
        fracStr.insert(0, FIXED_POINT_DECIMALS - fracStr.size(), '0');
        fracStr.erase(fracStr.find_last_not_of('0') + 1);
        ss << "." << fracStr;
    }
    return ss.str();
}

std::string FixedPointToRawString(const FixedPoint& value) {
    return value.str();
}

} // namespace votelock
