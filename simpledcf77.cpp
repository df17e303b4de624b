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

#include "simpledcf77.h"

namespace BCD {
    bcd_t int_to_bcd(const uint8_t value) {
        const uint8_t hi = value / 10;

        bcd_t result;
        result.digit.hi = hi;
        result.digit.lo = value-10*hi;

        return result;
    }

    uint8_t bcd_to_int(const bcd_t value) {
        return value.digit.lo + 10*value.digit.hi;
    }
}

namespace Arithmetic_Tools {
    bool parity(const uint64_t data, const uint8_t first, const uint8_t last) {
        bool result = false;
        uint64_t mask = (uint64_t)1 << first;
        for (uint8_t bit = first; bit <= last; ++bit) {
            result ^= (data & mask) != 0;
            mask <<= 1;
        }
        return result;
    }

    uint64_t get_bits(const uint64_t data, const uint8_t first, const uint8_t last) {
        const uint8_t length = last - first + 1;
        // a full 64 bit mask can not be built by shifting
        const uint64_t mask = length >= 64? ~(uint64_t)0: ((uint64_t)1 << length) - 1;
        return (data >> first) & mask;
    }

    uint64_t set_bit(const uint64_t data, const uint8_t number, const bool value) {
        return value? data|((uint64_t)1<<number): data&~((uint64_t)1<<number);
    }
}
