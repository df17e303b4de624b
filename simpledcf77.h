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

#define GCC_VERSION (__GNUC__ * 10000 \
    + __GNUC_MINOR__ * 100 \
    + __GNUC_PATCHLEVEL__)

#define ERROR_MESSAGE(major, minor, patchlevel) compiler_version__GCC_ ## major ## _ ## minor ## _ ## patchlevel ## __ ;
#define OUTDATED_COMPILER_ERROR(major, minor, patchlevel) ERROR_MESSAGE(major, minor, patchlevel)

#if defined(__AVR__) && GCC_VERSION < 40801
// Arduino 1.0.0 - 1.0.6 come with an outdated version of avr-gcc.
// The sampler and the timeframe decoder rely on 64 bit shifts and
// C++11, both need avr-gcc 4.8.1 or above.
//
// You may find out your compiler version by executing 'avr-gcc --version'
#error Outdated compiler version < 4.8.1
#error Arduino 1.0.0 - 1.0.6 ship with outdated compilers.
#error Arduino 1.5.8 (avr-gcc 4.8.1) and above are required.

OUTDATED_COMPILER_ERROR(__GNUC__, __GNUC_MINOR__, __GNUC_PATCHLEVEL__)
#endif

#ifndef simpledcf77_h
#define simpledcf77_h

#include <stdint.h>

// Arduino's output stream interface, only needed by the debug functions.
class Print;

namespace BCD {
    typedef union {
        struct {
            uint8_t lo:4;
            uint8_t hi:4;
        } digit;

        struct {
            uint8_t b0:1;
            uint8_t b1:1;
            uint8_t b2:1;
            uint8_t b3:1;
            uint8_t b4:1;
            uint8_t b5:1;
            uint8_t b6:1;
            uint8_t b7:1;
        } bit;

        uint8_t val;
    } bcd_t;

    void print(Print &out, const bcd_t value);

    bcd_t int_to_bcd(const uint8_t value);

    // No range check, digits above 9 are taken at face value.
    // 0xA5 --> 105, 0x1F --> 25
    uint8_t bcd_to_int(const bcd_t value);
}

namespace Arithmetic_Tools {
    template <uint8_t N> inline void bounded_increment(uint8_t &value) __attribute__((always_inline));
    template <uint8_t N>
    void bounded_increment(uint8_t &value) {
        if (value >= 255 - N) { value = 255; } else { value += N; }
    }

    inline uint8_t parity(const uint8_t value) __attribute__((always_inline));
    inline uint8_t parity(const uint8_t value) {
        uint8_t tmp = value;

        tmp = (tmp & 0xf) ^ (tmp >> 4);
        tmp = (tmp & 0x3) ^ (tmp >> 2);
        tmp = (tmp & 0x1) ^ (tmp >> 1);

        return tmp;
    }

    // even parity of bits first..last (inclusive) of data
    bool parity(const uint64_t data, const uint8_t first, const uint8_t last);

    // bits first..last (inclusive) of data shifted down to bit 0
    uint64_t get_bits(const uint64_t data, const uint8_t first, const uint8_t last);

    inline bool get_bit(const uint64_t data, const uint8_t number) __attribute__((always_inline));
    inline bool get_bit(const uint64_t data, const uint8_t number) {
        return (data >> number) & 1;
    }

    uint64_t set_bit(const uint64_t data, const uint8_t number, const bool value);
}

namespace Debug {
    void debug_helper(Print &out, const char data);
    void bcddigit(Print &out, const uint8_t data);
    void bcddigits(Print &out, const uint8_t data);
}

namespace SimpleDCF77 {
    typedef struct {
        uint16_t year;     // 2000..2099
        uint8_t month;     // 1..12
        uint8_t day;       // 1..31
        uint8_t weekday;   // Mo = 1, So = 7
    } date_t;

    typedef struct {
        uint16_t year;     // 2000..2099
        uint8_t month;     // 1..12
        uint8_t day;       // 1..31
        uint8_t weekday;   // Mo = 1, So = 7
        uint8_t hour;      // 0..23
        uint8_t minute;    // 0..59
    } time_info_t;

    const uint8_t seconds_per_minute = 60;
    const uint16_t century = 2000;
}
#endif
