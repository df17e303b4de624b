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

#include <Arduino.h>
#include "dcf77.h"

namespace BCD {
    void print(Print &out, const bcd_t value) {
        out.print(value.val >> 4 & 0xF, HEX);
        out.print(value.val >> 0 & 0xF, HEX);
    }
}

namespace Debug {
    void debug_helper(Print &out, const char data) { out.print(data == 0? 'S': data == 1? '?': (char)(data - 2 + '0')); }

    void bcddigit(Print &out, const uint8_t data) {
        if (data <= 0x09) {
            out.print(data, HEX);
        } else {
            out.print('?');
        }
    }

    void bcddigits(Print &out, const uint8_t data) {
        bcddigit(out, data >>  4);
        bcddigit(out, data & 0xf);
    }
}

namespace DCF77_Timeframe {
    using namespace DCF77;

    void print_field(Print &out, const bool valid, const uint8_t value) {
        if (valid) {
            BCD::print(out, BCD::int_to_bcd(value));
        } else {
            out.print(F("??"));
        }
    }

    void debug(Print &out, const timeframe_t &frame) {
        out.println(F("M ?????????????? RAZZA S mmmmMMMP hhhhHHP ddddDD www mmmmM yyyyYYYYP"));
        for (uint8_t second = 0; second < bits_per_minute; ++second) {
            switch (second) {
                case  1: case 15: case 20: case 21: case 29:
                case 36: case 42: case 45: case 50: out.print(' ');
            }
            out.print(Arithmetic_Tools::get_bit(frame.data, second)? '1': '0');
        }
        out.println();

        SimpleDCF77::date_t today = { 0, 0, 0, 0 };
        const bool date_valid = date(frame, today);

        out.print(F("  "));
        print_field(out, date_valid, today.year % 100);
        out.print('.');
        print_field(out, date_valid, today.month);
        out.print('.');
        print_field(out, date_valid, today.day);
        out.print('(');
        if (date_valid) {
            Debug::bcddigit(out, today.weekday);
        } else {
            out.print('?');
        }
        out.print(')');

        uint8_t hour = 0;
        uint8_t minute = 0;
        print_field(out, hours(frame, hour), hour);
        out.print(':');
        print_field(out, minutes(frame, minute), minute);

        bool uses_summertime;
        if (!cest(frame, uses_summertime)) {
            out.print(F(" ???? "));
        } else if (uses_summertime) {
            out.print(F(" MESZ "));
        } else {
            out.print(F(" MEZ "));
        }

        if (!validate_start(frame) || !validate_time_start(frame)) {
            out.print(F("bad start bits "));
        }
        if (timezone_change_scheduled_unchecked(frame)) {
            out.print(F("time zone change scheduled"));
        }
        out.println();
    }
}

namespace DCF77_Sampler {
    void debug(Print &out, const sampler_t &sampler) {
        out.print(F("Sampler state: "));
        switch (sampler.state) {
            case waiting_for_phase: out.print(F("waiting for phase")); break;
            case phase_found:       out.print(F("phase found"));       break;
            case bit_received:      out.print(F("bit received"));      break;
            case faulty_bit:        out.print(F("faulty bit"));        break;
            case end_of_minute:     out.print(F("end of minute"));     break;
            case idle:              out.print(F("idle"));              break;
        }

        out.print(F(" Second: "));
        out.print(get_second(sampler), DEC);
        out.print(F(" Latest bit: "));
        Debug::debug_helper(out, latest_bit(sampler));
        out.print(F(" Counts (0,1,noise): "));
        out.print(sampler.zero_bit_count, DEC);
        out.print(',');
        out.print(sampler.one_bit_count, DEC);
        out.print(',');
        out.print(sampler.non_idle_count, DEC);
        out.print(F(" Received bits: "));
        out.println(get_received_bits(sampler), DEC);
    }
}
