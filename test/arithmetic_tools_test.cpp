//
//  www.blinkenlight.net
//
//  Copyright 2015 Udo Klein
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with this program. If not, see http://www.gnu.org/licenses/

#include <gtest/gtest.h>

#include "simpledcf77.h"

using namespace Arithmetic_Tools;

TEST(BCD, DecodesEveryDigitPair) {
    for (uint8_t tens = 0; tens <= 9; ++tens) {
        for (uint8_t units = 0; units <= 9; ++units) {
            BCD::bcd_t value;
            value.digit.hi = tens;
            value.digit.lo = units;
            EXPECT_EQ(10*tens + units, BCD::bcd_to_int(value));
        }
    }
}

TEST(BCD, KeepsDigitsAboveNine) {
    BCD::bcd_t value;

    value.val = 0xA5;
    EXPECT_EQ(105, BCD::bcd_to_int(value));

    value.val = 0x1F;
    EXPECT_EQ(25, BCD::bcd_to_int(value));

    value.val = 0xFF;
    EXPECT_EQ(165, BCD::bcd_to_int(value));
}

TEST(BCD, EncodesIntegers) {
    EXPECT_EQ(0x00, BCD::int_to_bcd(0).val);
    EXPECT_EQ(0x47, BCD::int_to_bcd(47).val);
    EXPECT_EQ(0x99, BCD::int_to_bcd(99).val);
}

TEST(ArithmeticTools, BoundedIncrementSaturates) {
    uint8_t value = 253;
    bounded_increment<1>(value);
    EXPECT_EQ(254, value);
    bounded_increment<1>(value);
    EXPECT_EQ(255, value);
    bounded_increment<1>(value);
    EXPECT_EQ(255, value);
}

TEST(ArithmeticTools, ByteParity) {
    EXPECT_EQ(0, parity((uint8_t)0x00));
    EXPECT_EQ(1, parity((uint8_t)0x01));
    EXPECT_EQ(1, parity((uint8_t)0x07));
    EXPECT_EQ(0, parity((uint8_t)0xFF));
}

TEST(ArithmeticTools, RangeParity) {
    const uint64_t data = (uint64_t)0x34 << 21;

    EXPECT_TRUE(parity(data, 21, 27));
    EXPECT_FALSE(parity(data, 24, 27));
    EXPECT_TRUE(parity(data, 23, 23));
    EXPECT_FALSE(parity(data, 0, 20));
    EXPECT_TRUE(parity((uint64_t)1 << 63, 63, 63));
}

TEST(ArithmeticTools, RangeParityAgreesAfterReencoding) {
    const uint64_t data = 0x05A3C96E1F0B7D42ULL;

    for (uint8_t first = 0; first < 64; first += 7) {
        for (uint8_t last = first; last < 64; last += 5) {
            const uint64_t field = get_bits(data, first, last);
            EXPECT_EQ(parity(data, first, last), parity(field << first, first, last));
            EXPECT_EQ(parity(data, first, last), parity(field, 0, last - first));
        }
    }
}

TEST(ArithmeticTools, GetBits) {
    EXPECT_EQ(0xBCu, get_bits(0xABCD, 4, 11));
    EXPECT_EQ(0x1u, get_bits(0xABCD, 0, 0));
    EXPECT_EQ(0xFEDCBA9876543210ULL, get_bits(0xFEDCBA9876543210ULL, 0, 63));
    EXPECT_EQ(0xFu, get_bits(0xFEDCBA9876543210ULL, 60, 63));
}

TEST(ArithmeticTools, SetBit) {
    uint64_t data = 0;

    data = set_bit(data, 58, true);
    EXPECT_EQ((uint64_t)1 << 58, data);
    EXPECT_TRUE(get_bit(data, 58));

    data = set_bit(data, 0, true);
    data = set_bit(data, 58, false);
    EXPECT_EQ(1u, data);
    EXPECT_FALSE(get_bit(data, 58));
}
