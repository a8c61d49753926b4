// VOTELOCK - Serialization
// Copyright (c) 2024 VOTELOCK Developers
// MIT License
//
// Byte-level encoding for engine snapshots. Integers are little-endian,
// lengths use the CompactSize varint, and every decode error is reported as
// std::ios_base::failure.

#ifndef VOTELOCK_CORE_SERIALIZE_H
#define VOTELOCK_CORE_SERIALIZE_H

#include "votelock/core/types.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace votelock {

// ============================================================================
// Limits
// ============================================================================

/// Largest length prefix accepted when decoding (32 MiB)
static constexpr uint64_t MAX_SIZE = 0x02000000;

/// Upper bound on bytes reserved ahead of decoding a vector
static constexpr size_t MAX_VECTOR_RESERVE = 5000000;

/// A FixedPoint is a sign byte followed by this many magnitude bytes
static constexpr size_t FIXED_POINT_BYTES = 32;

// ============================================================================
// DataStream
// ============================================================================

/// Growable byte buffer with a read cursor. Writes append; reads consume
/// from the cursor and throw once the buffer runs out.
class DataStream {
public:
    DataStream() = default;
    explicit DataStream(std::vector<uint8_t> bytes) : buf_(std::move(bytes)) {}
    DataStream(const uint8_t* bytes, size_t len) : buf_(bytes, bytes + len) {}

    /// Unread bytes
    size_t size() const noexcept { return buf_.size() - cursor_; }
    bool empty() const noexcept { return cursor_ == buf_.size(); }

    void clear() {
        buf_.clear();
        cursor_ = 0;
    }

    /// Everything written so far, read or not
    const std::vector<uint8_t>& Data() const noexcept { return buf_; }

    void Write(const void* src, size_t len) {
        const auto* p = static_cast<const uint8_t*>(src);
        buf_.insert(buf_.end(), p, p + len);
    }

    void Read(void* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream: read past end of buffer");
        }
        std::memcpy(dst, buf_.data() + cursor_, len);
        cursor_ += len;
    }

    void Rewind() { cursor_ = 0; }

    template<typename T>
    DataStream& operator<<(const T& value);

    template<typename T>
    DataStream& operator>>(T& value);

private:
    std::vector<uint8_t> buf_;
    size_t cursor_{0};
};

// ============================================================================
// Fixed-width integers
// ============================================================================

template<typename Stream, typename UInt>
void WriteLE(Stream& s, UInt value) {
    static_assert(std::is_unsigned<UInt>::value, "WriteLE takes unsigned integers");
    uint8_t bytes[sizeof(UInt)];
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        bytes[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    s.Write(bytes, sizeof(bytes));
}

template<typename UInt, typename Stream>
UInt ReadLE(Stream& s) {
    static_assert(std::is_unsigned<UInt>::value, "ReadLE yields unsigned integers");
    uint8_t bytes[sizeof(UInt)];
    s.Read(bytes, sizeof(bytes));
    UInt value = 0;
    for (size_t i = sizeof(UInt); i > 0; --i) {
        value = static_cast<UInt>((value << 8) | bytes[i - 1]);
    }
    return value;
}

// ============================================================================
// CompactSize
// ============================================================================
// One byte below 0xFD. Otherwise a marker byte (0xFD, 0xFE, 0xFF) followed by
// a 2, 4 or 8 byte value. Decoding insists on the shortest form.

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t n) {
    if (n < 0xFD) {
        WriteLE<Stream, uint8_t>(s, static_cast<uint8_t>(n));
    } else if (n <= 0xFFFF) {
        WriteLE<Stream, uint8_t>(s, 0xFD);
        WriteLE<Stream, uint16_t>(s, static_cast<uint16_t>(n));
    } else if (n <= 0xFFFFFFFFULL) {
        WriteLE<Stream, uint8_t>(s, 0xFE);
        WriteLE<Stream, uint32_t>(s, static_cast<uint32_t>(n));
    } else {
        WriteLE<Stream, uint8_t>(s, 0xFF);
        WriteLE<Stream, uint64_t>(s, n);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s, bool enforceLimit = true) {
    const uint8_t marker = ReadLE<uint8_t>(s);
    uint64_t n = marker;
    uint64_t smallest = 0;

    switch (marker) {
        case 0xFD: n = ReadLE<uint16_t>(s); smallest = 0xFD; break;
        case 0xFE: n = ReadLE<uint32_t>(s); smallest = 0x10000; break;
        case 0xFF: n = ReadLE<uint64_t>(s); smallest = 0x100000000ULL; break;
        default: break;
    }

    if (n < smallest) {
        throw std::ios_base::failure("ReadCompactSize: non-canonical encoding");
    }
    if (enforceLimit && n > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize: length exceeds MAX_SIZE");
    }
    return n;
}

// ============================================================================
// Scalars
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, uint8_t v) { WriteLE(s, v); }
template<typename Stream>
void Unserialize(Stream& s, uint8_t& v) { v = ReadLE<uint8_t>(s); }

template<typename Stream>
void Serialize(Stream& s, uint32_t v) { WriteLE(s, v); }
template<typename Stream>
void Unserialize(Stream& s, uint32_t& v) { v = ReadLE<uint32_t>(s); }

template<typename Stream>
void Serialize(Stream& s, uint64_t v) { WriteLE(s, v); }
template<typename Stream>
void Unserialize(Stream& s, uint64_t& v) { v = ReadLE<uint64_t>(s); }

/// Two's complement bit pattern
template<typename Stream>
void Serialize(Stream& s, int64_t v) { WriteLE(s, static_cast<uint64_t>(v)); }
template<typename Stream>
void Unserialize(Stream& s, int64_t& v) { v = static_cast<int64_t>(ReadLE<uint64_t>(s)); }

template<typename Stream>
void Serialize(Stream& s, bool v) { WriteLE<Stream, uint8_t>(s, v ? 1 : 0); }
template<typename Stream>
void Unserialize(Stream& s, bool& v) { v = ReadLE<uint8_t>(s) != 0; }

// ============================================================================
// FixedPoint
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const FixedPoint& value) {
    const bool negative = value < 0;
    FixedPoint rest = negative ? FixedPoint(-value) : value;

    uint8_t out[1 + FIXED_POINT_BYTES];
    out[0] = negative ? 1 : 0;
    for (size_t i = 1; i <= FIXED_POINT_BYTES; ++i) {
        out[i] = static_cast<uint8_t>((rest & 0xFF).convert_to<unsigned int>());
        rest >>= 8;
    }
    s.Write(out, sizeof(out));
}

template<typename Stream>
void Unserialize(Stream& s, FixedPoint& value) {
    uint8_t in[1 + FIXED_POINT_BYTES];
    s.Read(in, sizeof(in));
    if (in[0] > 1) {
        throw std::ios_base::failure("Unserialize(FixedPoint): sign byte must be 0 or 1");
    }

    FixedPoint magnitude = 0;
    for (size_t i = FIXED_POINT_BYTES; i >= 1; --i) {
        magnitude = (magnitude << 8) | in[i];
    }
    value = in[0] ? FixedPoint(-magnitude) : magnitude;
}

// ============================================================================
// Strings and addresses
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    s.Write(str.data(), str.size());
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    const uint64_t len = ReadCompactSize(s);
    str.assign(len, '\0');
    if (len > 0) {
        s.Read(&str[0], len);
    }
}

template<typename Stream>
void Serialize(Stream& s, const Address& addr) { s.Write(addr.data(), Address::SIZE); }
template<typename Stream>
void Unserialize(Stream& s, Address& addr) { s.Read(addr.data(), Address::SIZE); }

// ============================================================================
// Containers
// ============================================================================

template<typename Stream, typename A, typename B>
void Serialize(Stream& s, const std::pair<A, B>& p) {
    Serialize(s, p.first);
    Serialize(s, p.second);
}

template<typename Stream, typename A, typename B>
void Unserialize(Stream& s, std::pair<A, B>& p) {
    Unserialize(s, p.first);
    Unserialize(s, p.second);
}

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& items) {
    WriteCompactSize(s, items.size());
    for (const T& item : items) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& items) {
    const uint64_t count = ReadCompactSize(s);
    items.clear();
    items.reserve(static_cast<size_t>(
        std::min<uint64_t>(count, MAX_VECTOR_RESERVE / sizeof(T))));
    for (uint64_t i = 0; i < count; ++i) {
        items.emplace_back();
        Unserialize(s, items.back());
    }
}

template<typename Stream, typename K, typename V>
void Serialize(Stream& s, const std::map<K, V>& entries) {
    WriteCompactSize(s, entries.size());
    for (const auto& kv : entries) {
        Serialize(s, kv.first);
        Serialize(s, kv.second);
    }
}

/// Rejects a repeated key.
template<typename Stream, typename K, typename V>
void Unserialize(Stream& s, std::map<K, V>& entries) {
    const uint64_t count = ReadCompactSize(s);
    entries.clear();
    for (uint64_t i = 0; i < count; ++i) {
        std::pair<K, V> kv;
        Unserialize(s, kv.first);
        Unserialize(s, kv.second);
        if (!entries.insert(std::move(kv)).second) {
            throw std::ios_base::failure("Unserialize(map): repeated key");
        }
    }
}

// ============================================================================
// DataStream operators
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& value) {
    Serialize(*this, value);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& value) {
    Unserialize(*this, value);
    return *this;
}

} // namespace votelock

#endif // VOTELOCK_CORE_SERIALIZE_H
