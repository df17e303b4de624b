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

#ifndef frames_h
#define frames_h

#include <initializer_list>

#include "dcf77.h"

namespace Frames {
    inline uint64_t with_bits(std::initializer_list<uint8_t> bits) {
        uint64_t data = 0;
        for (uint8_t bit : bits) {
            data |= (uint64_t)1 << bit;
        }
        return data;
    }

    // 2024-06-15, weekday 3, 12:34 MESZ
    //
    //   17       summertime
    //   20       start of time information
    //   23 25 26 minutes 0x34, odd  --> parity bit 28 set
    //   30 33    hours   0x12, even --> parity bit 35 clear
    //   36 38 40 day     0x15
    //   42 43    weekday 3
    //   46 47    month   0x06
    //   52 55    year    0x24
    //   58       9 date bits set, odd --> parity bit set
    inline uint64_t reference_frame() {
        return with_bits({17, 20, 23, 25, 26, 28, 30, 33, 36, 38, 40, 42, 43, 46, 47, 52, 55, 58});
    }

    inline DCF77::time_data_t reference_time() {
        DCF77::time_data_t now;
        now.year    = 2024;
        now.month   = 6;
        now.day     = 15;
        now.weekday = 3;
        now.hour    = 12;
        now.minute  = 34;
        now.uses_summertime                = true;
        now.abnormal_transmitter_operation = false;
        now.timezone_change_scheduled      = false;
        return now;
    }

    inline uint64_t flip(const uint64_t data, const uint8_t bit) {
        return data ^ ((uint64_t)1 << bit);
    }
}
#endif
