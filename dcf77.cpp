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

#include "dcf77.h"

namespace DCF77_Encoder {
    using namespace DCF77;
    using namespace Arithmetic_Tools;

    uint64_t set_bcd(const uint64_t data, const uint8_t value, const uint8_t first, const uint8_t last) {
        // values out of range are truncated to the field width,
        // they must never spill into the neighbouring fields
        const uint64_t field = get_bits(BCD::int_to_bcd(value).val, 0, last - first);
        const uint64_t mask = get_bits(~(uint64_t)0, 0, last - first) << first;

        return (data & ~mask) | (field << first);
    }

    uint8_t weekday(const DCF77::time_data_t &now) {  // monday == 1, sunday == 7
        if (now.day >= 1 && now.day <= 31 && now.month >= 1 && now.month <= 12 &&
            now.year > SimpleDCF77::century && now.year < SimpleDCF77::century + 100) {
            // This will compute the weekday for each year in 2001-2099.
            // If you really plan to use my code beyond 2099 take care of this
            // on your own. My assumption is that it is even unclear if DCF77
            // will still exist then.

            // http://de.wikipedia.org/wiki/Gau%C3%9Fsche_Wochentagsformel
            const uint8_t  d = now.day;
            const uint16_t m = now.month <= 2? now.month + 10: now.month - 2;
            const uint8_t  y = (now.year - SimpleDCF77::century) - (now.month <= 2);
            // m must be of type uint16_t otherwise this will compute crap
            uint8_t day_mod_7 = d + (26*m - 2)/10 + y + y/4;
            // We exploit 8 mod 7 = 1
            while (day_mod_7 >= 7) {
                day_mod_7 -= 7;
                day_mod_7 = (day_mod_7 >> 3) + (day_mod_7 & 7);
            }

            return day_mod_7 == 0? 7: day_mod_7;
        } else {
            return 0;
        }
    }

    void autoset_weekday(DCF77::time_data_t &now) {
        now.weekday = weekday(now);
    }

    uint64_t encode(const DCF77::time_data_t &now) {
        uint64_t data = 0;

        // bit 0 is always 0, bit 1-14 carry third party data
        data = set_bit(data, abnormal_transmitter_operation_bit, now.abnormal_transmitter_operation);
        data = set_bit(data, timezone_change_scheduled_bit, now.timezone_change_scheduled);
        data = set_bit(data, summertime_bit, now.uses_summertime);
        data = set_bit(data, wintertime_bit, !now.uses_summertime);
        data = set_bit(data, start_of_time_bit, 1);

        data = set_bcd(data, now.minute, minute_first_bit, minute_last_bit);
        data = set_bit(data, minute_parity_bit, parity(data, minute_first_bit, minute_last_bit));

        data = set_bcd(data, now.hour, hour_first_bit, hour_last_bit);
        data = set_bit(data, hour_parity_bit, parity(data, hour_first_bit, hour_last_bit));

        data = set_bcd(data, now.day,     day_first_bit,     day_last_bit);
        data = set_bcd(data, now.weekday, weekday_first_bit, weekday_last_bit);
        data = set_bcd(data, now.month,   month_first_bit,   month_last_bit);
        data = set_bcd(data, now.year % 100, year_first_bit, year_last_bit);
        data = set_bit(data, date_parity_bit, parity(data, day_first_bit, year_last_bit));

        return data;
    }

    DCF77::tick_t get_current_signal(const uint64_t data, const uint8_t second) {
        if (second < bits_per_minute) {
            return get_bit(data, second)? long_tick: short_tick;
        }
        if (second == bits_per_minute) {
            return sync_mark;
        }
        return undefined;
    }

    bool get_sample(const uint64_t data, const uint8_t second, const uint8_t tick) {
        switch (get_current_signal(data, second)) {
            case long_tick:  return tick < 2*samples_per_100ms;
            case short_tick: return tick < samples_per_100ms;
            default:         return false;
        }
    }
}

namespace DCF77_Timeframe {
    using namespace DCF77;
    using namespace Arithmetic_Tools;

    timeframe_t make(const uint64_t data) {
        const timeframe_t frame = { data };
        return frame;
    }

    uint8_t bcd_digits(const timeframe_t &frame, const uint8_t first, const uint8_t last) {
        BCD::bcd_t value;
        value.val = get_bits(frame.data, first, last);
        return BCD::bcd_to_int(value);
    }

    bool parity_matches(const timeframe_t &frame, const uint8_t first, const uint8_t last, const uint8_t parity_bit) {
        return parity(frame.data, first, last) == get_bit(frame.data, parity_bit);
    }

    bool validate_start(const timeframe_t &frame) {
        return !get_bit(frame.data, start_of_minute_bit);
    }

    bool validate_time_start(const timeframe_t &frame) {
        return get_bit(frame.data, start_of_time_bit);
    }

    bool abnormal_transmitter_operation_unchecked(const timeframe_t &frame) {
        return get_bit(frame.data, abnormal_transmitter_operation_bit);
    }

    bool timezone_change_scheduled_unchecked(const timeframe_t &frame) {
        return get_bit(frame.data, timezone_change_scheduled_bit);
    }

    bool cest_unchecked(const timeframe_t &frame) {
        return get_bit(frame.data, summertime_bit);
    }

    bool cest(const timeframe_t &frame, bool &uses_summertime) {
        const bool summertime = cest_unchecked(frame);
        if (get_bit(frame.data, wintertime_bit) == summertime) {
            return false;
        }
        uses_summertime = summertime;
        return true;
    }

    uint8_t minutes_unchecked(const timeframe_t &frame) {
        return bcd_digits(frame, minute_first_bit, minute_last_bit);
    }

    bool minutes(const timeframe_t &frame, uint8_t &minutes) {
        const uint8_t value = minutes_unchecked(frame);
        if (!parity_matches(frame, minute_first_bit, minute_last_bit, minute_parity_bit) || value > 59) {
            return false;
        }
        minutes = value;
        return true;
    }

    uint8_t hours_unchecked(const timeframe_t &frame) {
        return bcd_digits(frame, hour_first_bit, hour_last_bit);
    }

    bool hours(const timeframe_t &frame, uint8_t &hours) {
        const uint8_t value = hours_unchecked(frame);
        if (!parity_matches(frame, hour_first_bit, hour_last_bit, hour_parity_bit) || value > 23) {
            return false;
        }
        hours = value;
        return true;
    }

    uint8_t day_unchecked(const timeframe_t &frame) {
        return bcd_digits(frame, day_first_bit, day_last_bit);
    }

    bool day(const timeframe_t &frame, uint8_t &day) {
        const uint8_t value = day_unchecked(frame);
        if (value > 31) {
            return false;
        }
        day = value;
        return true;
    }

    uint8_t weekday_unchecked(const timeframe_t &frame) {
        return bcd_digits(frame, weekday_first_bit, weekday_last_bit);
    }

    bool weekday(const timeframe_t &frame, uint8_t &weekday) {
        const uint8_t value = weekday_unchecked(frame);
        if (value > 7) {
            return false;
        }
        weekday = value;
        return true;
    }

    uint8_t month_unchecked(const timeframe_t &frame) {
        return bcd_digits(frame, month_first_bit, month_last_bit);
    }

    bool month(const timeframe_t &frame, uint8_t &month) {
        const uint8_t value = month_unchecked(frame);
        if (value > 12) {
            return false;
        }
        month = value;
        return true;
    }

    uint16_t year_unchecked(const timeframe_t &frame) {
        return SimpleDCF77::century + bcd_digits(frame, year_first_bit, year_last_bit);
    }

    bool year(const timeframe_t &frame, uint16_t &year) {
        const uint16_t value = year_unchecked(frame);
        if (value > 2100) {
            return false;
        }
        year = value;
        return true;
    }

    bool date(const timeframe_t &frame, SimpleDCF77::date_t &date) {
        if (!parity_matches(frame, day_first_bit, year_last_bit, date_parity_bit)) {
            return false;
        }

        SimpleDCF77::date_t decoded;
        if (!year(frame, decoded.year)   ||
            !month(frame, decoded.month) ||
            !day(frame, decoded.day)     ||
            !weekday(frame, decoded.weekday)) {
            return false;
        }

        date = decoded;
        return true;
    }

    bool decode(const timeframe_t &frame, DCF77::time_data_t &now) {
        if (!validate_start(frame) || !validate_time_start(frame)) {
            return false;
        }

        bool uses_summertime;
        uint8_t minute;
        uint8_t hour;
        SimpleDCF77::date_t today;
        if (!cest(frame, uses_summertime) ||
            !minutes(frame, minute)       ||
            !hours(frame, hour)           ||
            !date(frame, today)) {
            return false;
        }

        now.year    = today.year;
        now.month   = today.month;
        now.day     = today.day;
        now.weekday = today.weekday;
        now.hour    = hour;
        now.minute  = minute;
        now.uses_summertime                = uses_summertime;
        now.abnormal_transmitter_operation = abnormal_transmitter_operation_unchecked(frame);
        now.timezone_change_scheduled      = timezone_change_scheduled_unchecked(frame);

        return true;
    }
}

namespace DCF77_Sampler {
    using namespace DCF77;
    using namespace Arithmetic_Tools;

    const config_t default_config = {
        samples_per_100ms,      // samples_per_window: 100 ms
        3,                      // window_threshold: more than 3 of 10 samples
        9*samples_per_100ms,    // settle_end_samples: 900 ms
        10,                     // max_noise_samples: less than 10 of the remaining 70
        18*samples_per_100ms    // sync_mark_samples: 1800 ms
    };

    void setup(sampler_t &sampler) {
        setup(sampler, default_config);
    }

    void setup(sampler_t &sampler, const config_t &config) {
        sampler.config = config;

        sampler.sample_count = 0;
        sampler.zero_bit_count = 0;
        sampler.one_bit_count = 0;
        sampler.non_idle_count = 0;

        sampler.state = waiting_for_phase;

        sampler.data = 0;
        sampler.data_pos = 0;
        sampler.received_bits = 0;
    }

    // wait for the first phase change 0->1 or declare the end of the
    // minute if no phase change is detected within 1800 ms
    state_t wait_for_phase(sampler_t &sampler, const bool sampled_data) {
        if (sampled_data) {
            sampler.zero_bit_count = 1;
            sampler.one_bit_count = 0;
            sampler.non_idle_count = 0;
            sampler.sample_count = 0;
            return phase_found;
        }

        if (sampler.sample_count > sampler.config.sync_mark_samples) {
            sampler.received_bits = sampler.data_pos;
            sampler.data_pos = 0;
            sampler.sample_count = 0;
            return end_of_minute;
        }

        return waiting_for_phase;
    }

    // count the high samples in the first and the second 100 ms to
    // determine if a 0 or 1 was transmitted
    state_t decode_bit(sampler_t &sampler, const bool sampled_data) {
        const uint8_t window = sampler.config.samples_per_window;

        if (sampler.sample_count < 2*window) {
            if (sampled_data) {
                if (sampler.sample_count < window) {
                    bounded_increment<1>(sampler.zero_bit_count);
                } else {
                    bounded_increment<1>(sampler.one_bit_count);
                }
            }
            return phase_found;
        }

        bool bit;
        if (sampler.one_bit_count > sampler.config.window_threshold) {
            bit = 1;
        } else if (sampler.zero_bit_count > sampler.config.window_threshold) {
            bit = 0;
        } else {
            // bad signal, start over
            sampler.data_pos = 0;
            return faulty_bit;
        }

        if (sampler.data_pos >= bits_per_minute) {
            // missed the minute mark, the register is full
            sampler.data_pos = 0;
            return faulty_bit;
        }

        sampler.data = set_bit(sampler.data, sampler.data_pos, bit);
        ++sampler.data_pos;
        return bit_received;
    }

    // wait until the 900 ms of the bit are over, the signal must
    // stay low for all but a few samples
    state_t settle(sampler_t &sampler, const bool sampled_data) {
        if (sampled_data) {
            bounded_increment<1>(sampler.non_idle_count);
        }

        if (sampler.sample_count >= sampler.config.settle_end_samples) {
            if (sampler.non_idle_count < sampler.config.max_noise_samples) {
                return waiting_for_phase;
            }

            // bad signal, start over
            sampler.data_pos = 0;
            return faulty_bit;
        }

        return idle;
    }

    void submit_sample(sampler_t &sampler, const bool sampled_data) {
        switch (sampler.state) {
            case waiting_for_phase:
            case faulty_bit:
            case end_of_minute:
                sampler.state = wait_for_phase(sampler, sampled_data);
                break;

            case phase_found:
                sampler.state = decode_bit(sampler, sampled_data);
                break;

            case bit_received:
            case idle:
                sampler.state = settle(sampler, sampled_data);
                break;
        }

        bounded_increment<1>(sampler.sample_count);
    }

    bool bit_complete(const sampler_t &sampler) {
        return sampler.state == bit_received;
    }

    bool bit_faulty(const sampler_t &sampler) {
        return sampler.state == faulty_bit;
    }

    bool end_of_cycle(const sampler_t &sampler) {
        return sampler.state == end_of_minute;
    }

    bool minute_complete(const sampler_t &sampler) {
        return sampler.state == end_of_minute && sampler.received_bits == bits_per_minute;
    }

    DCF77::tick_t latest_bit(const sampler_t &sampler) {
        if (sampler.data_pos == 0) {
            return undefined;
        }
        return get_bit(sampler.data, sampler.data_pos - 1)? long_tick: short_tick;
    }

    uint8_t get_second(const sampler_t &sampler) {
        return sampler.data_pos;
    }

    uint8_t get_received_bits(const sampler_t &sampler) {
        return sampler.received_bits;
    }

    uint64_t get_raw_data(const sampler_t &sampler) {
        return sampler.data;
    }
}
