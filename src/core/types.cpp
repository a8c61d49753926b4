// VOTELOCK - Core Types
// Copyright (c) 2024 VOTELOCK Developers
// MIT License

#include "votelock/core/types.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace votelock {

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Address::Address(const Byte* src, size_t len) noexcept {
    bytes_.fill(0);
    if (src != nullptr) {
        std::memcpy(bytes_.data(), src, std::min(len, SIZE));
    }
}

bool Address::IsNull() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(), [](Byte b) { return b == 0; });
}

bool Address::operator<(const Address& other) const noexcept {
    return std::lexicographical_compare(bytes_.rbegin(), bytes_.rend(),
                                        other.bytes_.rbegin(), other.bytes_.rend());
}

std::string Address::ToHex() const {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(SIZE * 2);
    for (auto it = bytes_.rbegin(); it != bytes_.rend(); ++it) {
        out.push_back(kDigits[*it >> 4]);
        out.push_back(kDigits[*it & 0x0F]);
    }
    return out;
}

Address Address::FromHex(const std::string& hex) {
    size_t offset = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        offset = 2;
    }
    if (hex.size() - offset != SIZE * 2) {
        throw std::invalid_argument("Address::FromHex: expected 40 hex digits");
    }

    Address addr;
    for (size_t i = 0; i < SIZE; ++i) {
        const int hi = HexValue(hex[offset + 2 * i]);
        const int lo = HexValue(hex[offset + 2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Address::FromHex: invalid hex digit");
        }
        addr.bytes_[SIZE - 1 - i] = static_cast<Byte>((hi << 4) | lo);
    }
    return addr;
}

} // namespace votelock
