// VOTELOCK - Core Types Tests
// Copyright (c) 2024 VOTELOCK Developers
// MIT License

#include <gtest/gtest.h>
#include "votelock/core/types.h"

#include <map>
#include <stdexcept>

namespace votelock {
namespace test {

// ============================================================================
// Constants
// ============================================================================

TEST(ConstantsTest, ScaleIsOneE18) {
    EXPECT_EQ(SCALE, FixedPoint(1000000000000000000LL));
    EXPECT_EQ(WEEK, 604800);
}

TEST(ConstantsTest, FixedPointHoldsLargeProducts) {
    // 1e30 balance times a 1e18 multiplier times a year in seconds
    FixedPoint balance = FixedPoint(1000000000000LL) * SCALE;
    FixedPoint product = balance * SCALE * FixedPoint(31449600);
    EXPECT_GT(product, 0);
    EXPECT_EQ(product / SCALE / FixedPoint(31449600), balance);
}

TEST(ConstantsTest, FixedPointOverflowThrows) {
    FixedPoint big = 1;
    big <<= 254;
    EXPECT_NO_THROW(big + (big - 1));
    EXPECT_THROW(big * 4, std::overflow_error);
    EXPECT_THROW(-big * 4, std::overflow_error);
}

// ============================================================================
// Address Tests
// ============================================================================

TEST(AddressTest, DefaultIsNull) {
    Address a;
    EXPECT_TRUE(a.IsNull());
    EXPECT_EQ(Address::SIZE, 20u);
    EXPECT_EQ(a.size(), 20u);
}

TEST(AddressTest, ConstructFromBytes) {
    Byte raw[20];
    for (size_t i = 0; i < 20; ++i) {
        raw[i] = static_cast<Byte>(i + 1);
    }
    Address a(raw, sizeof(raw));
    EXPECT_FALSE(a.IsNull());
    EXPECT_EQ(a[0], 1);
    EXPECT_EQ(a[19], 20);
}

TEST(AddressTest, ShortInputIsZeroPadded) {
    Byte raw[2] = {0xAB, 0xCD};
    Address a(raw, sizeof(raw));
    EXPECT_EQ(a[0], 0xAB);
    EXPECT_EQ(a[1], 0xCD);
    EXPECT_EQ(a[2], 0);
}

TEST(AddressTest, HexRoundTrip) {
    const std::string hex = "00112233445566778899aabbccddeeff01234567";
    Address a = Address::FromHex(hex);
    EXPECT_EQ(a.ToHex(), hex);
    // Displayed big-endian, stored little-endian
    EXPECT_EQ(a[19], 0x00);
    EXPECT_EQ(a[0], 0x67);
}

TEST(AddressTest, HexAcceptsPrefixAndUppercase) {
    Address a = Address::FromHex("0x00112233445566778899AABBCCDDEEFF01234567");
    EXPECT_EQ(a.ToHex(), "00112233445566778899aabbccddeeff01234567");
}

TEST(AddressTest, HexRejectsBadInput) {
    EXPECT_THROW(Address::FromHex("1234"), std::invalid_argument);
    EXPECT_THROW(Address::FromHex("zz112233445566778899aabbccddeeff01234567"),
                 std::invalid_argument);
}

TEST(AddressTest, ComparisonAndMapKey) {
    Byte r1[1] = {1};
    Byte r2[1] = {2};
    Address a(r1, 1);
    Address b(r2, 1);

    EXPECT_NE(a, b);
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);

    std::map<Address, int> m;
    m[b] = 2;
    m[a] = 1;
    EXPECT_EQ(m.begin()->second, 1);
}

TEST(AddressTest, SetNull) {
    Byte raw[1] = {9};
    Address a(raw, 1);
    a.SetNull();
    EXPECT_TRUE(a.IsNull());
}

} // namespace test
} // namespace votelock
