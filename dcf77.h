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

#ifndef dcf77_h
#define dcf77_h

#include "simpledcf77.h"

namespace DCF77 {
    typedef enum {
        long_tick  = 3,
        short_tick = 2,
        undefined  = 1,
        sync_mark  = 0
    } tick_t;

    typedef struct DCF77_time_data_t : SimpleDCF77::time_info_t {
        bool uses_summertime;                 // false -> wintertime, true, summertime
        bool abnormal_transmitter_operation;  // typically false
        bool timezone_change_scheduled;
    } time_data_t;

    // one bit per second, the 60th second carries no pulse
    const uint8_t bits_per_minute = 59;

    // the receiver output is sampled every 10 ms
    const uint8_t samples_per_second = 100;
    const uint8_t samples_per_100ms  = samples_per_second / 10;

    // Bit      Bezeichnung     Wert    Pegel   Bedeutung
    // 0        M                       0       Minutenanfang
    const uint8_t start_of_minute_bit = 0;

    // 1..14    n/a                             reserviert

    // 15       R                               Reserveantenne aktiv (0 inaktiv, 1 aktiv)
    const uint8_t abnormal_transmitter_operation_bit = 15;
    // 16       A1                              Ankündigung Zeitzonenwechsel (1 Stunde vor dem Wechsel für 1 Stunde, d.h ab Minute 1)
    const uint8_t timezone_change_scheduled_bit = 16;
    // 17       Z1               2              Zeitzonenbit Sommerzeit (MEZ = 0, MESZ = 1); also Zeitzone = UTC + 2*Z1 + Z2
    const uint8_t summertime_bit = 17;
    // 18       Z2               1              Zeitzonenbit Winterzeit (MEZ = 1, MESZ = 0); also Zeitzone = UTC + 2*Z1 + Z2
    const uint8_t wintertime_bit = 18;
    // 19       A2                              Ankündigung einer Schaltsekunde (not evaluated)

    // 20       S                       1       Startbit für Zeitinformation
    const uint8_t start_of_time_bit = 20;

    // 21..27                    1..40          Minuten, BCD
    // 28       P1                              Prüfbit 1 (gerade Parität)
    const uint8_t minute_first_bit  = 21;
    const uint8_t minute_last_bit   = 27;
    const uint8_t minute_parity_bit = 28;

    // 29..34                    1..20          Stunden, BCD
    // 35       P2                              Prüfbit 2 (gerade Parität)
    const uint8_t hour_first_bit  = 29;
    const uint8_t hour_last_bit   = 34;
    const uint8_t hour_parity_bit = 35;

    // 36..41                    1..20          Tag, BCD
    const uint8_t day_first_bit = 36;
    const uint8_t day_last_bit  = 41;

    // 42..44                    1..4           Wochentag (Mo = 1, ..., So = 7)
    const uint8_t weekday_first_bit = 42;
    const uint8_t weekday_last_bit  = 44;

    // 45..49                    1..10          Monat, BCD
    const uint8_t month_first_bit = 45;
    const uint8_t month_last_bit  = 49;

    // 50..57                    1..80          Jahr, BCD
    const uint8_t year_first_bit = 50;
    const uint8_t year_last_bit  = 57;

    // 58       P3                              Prüftbit 3 (gerade Parität über 36..57)
    const uint8_t date_parity_bit = 58;

    // 59       sync                            Sync Marke, kein Impuls (übliches Minutenende)
}

namespace DCF77_Encoder {
    // What *** exactly *** is the semantics of the "Encoder"?
    // It only *** encodes *** whatever time is set
    // It does never attempt to verify the data

    uint64_t encode(const DCF77::time_data_t &now);

    uint8_t weekday(const DCF77::time_data_t &now);  // monday == 1, sunday == 7, 0 if undefined

    // This will set the weekday by evaluating the date.
    void autoset_weekday(DCF77::time_data_t &now);

    DCF77::tick_t get_current_signal(const uint64_t data, const uint8_t second);

    // Expected output level of the receiver during the given 10 ms
    // slot (0..99) of the given second.
    bool get_sample(const uint64_t data, const uint8_t second, const uint8_t tick);
}

namespace DCF77_Timeframe {
    typedef struct {
        const uint64_t data;
    } timeframe_t;

    timeframe_t make(const uint64_t data);

    // bit 0 must be 0
    bool validate_start(const timeframe_t &frame);
    // bit 20 must be 1
    bool validate_time_start(const timeframe_t &frame);

    bool abnormal_transmitter_operation_unchecked(const timeframe_t &frame);
    bool timezone_change_scheduled_unchecked(const timeframe_t &frame);

    bool cest_unchecked(const timeframe_t &frame);
    // fails unless the summertime and wintertime bits disagree
    bool cest(const timeframe_t &frame, bool &uses_summertime);

    uint8_t minutes_unchecked(const timeframe_t &frame);
    bool minutes(const timeframe_t &frame, uint8_t &minutes);

    uint8_t hours_unchecked(const timeframe_t &frame);
    bool hours(const timeframe_t &frame, uint8_t &hours);

    // Day, weekday, month and year share the date parity bit. The
    // checked accessors below only verify the range, use date() to
    // verify the parity as well.
    uint8_t day_unchecked(const timeframe_t &frame);
    bool day(const timeframe_t &frame, uint8_t &day);

    uint8_t weekday_unchecked(const timeframe_t &frame);
    bool weekday(const timeframe_t &frame, uint8_t &weekday);

    uint8_t month_unchecked(const timeframe_t &frame);
    bool month(const timeframe_t &frame, uint8_t &month);

    uint16_t year_unchecked(const timeframe_t &frame);
    bool year(const timeframe_t &frame, uint16_t &year);

    bool date(const timeframe_t &frame, SimpleDCF77::date_t &date);

    // All or nothing, now is left untouched unless every check passes.
    bool decode(const timeframe_t &frame, DCF77::time_data_t &now);

    void debug(Print &out, const timeframe_t &frame);
}

namespace DCF77_Sampler {
    typedef enum {
        waiting_for_phase,
        phase_found,
        bit_received,
        faulty_bit,
        end_of_minute,
        idle
    } state_t;

    // All durations are given in samples, that is in units of 10 ms.
    typedef struct {
        uint8_t samples_per_window;  // length of the 0 and 1 windows after the rising edge
        uint8_t window_threshold;    // a window must see more high samples than this
        uint8_t settle_end_samples;  // end of the low phase that follows each bit
        uint8_t max_noise_samples;   // high samples tolerated during the low phase are less than this
        uint8_t sync_mark_samples;   // more samples since the last rising edge mark a new minute
    } config_t;

    extern const config_t default_config;

    typedef struct {
        config_t config;

        // samples since the last phase change
        uint8_t sample_count;
        // high samples during the first 100 ms
        uint8_t zero_bit_count;
        // high samples during the second 100 ms
        uint8_t one_bit_count;
        // high samples after the bit was decided
        uint8_t non_idle_count;

        state_t state;

        uint64_t data;
        uint8_t data_pos;
        // data_pos at the last end of cycle
        uint8_t received_bits;
    } sampler_t;

    void setup(sampler_t &sampler);
    void setup(sampler_t &sampler, const config_t &config);

    // Must be called every 10 ms, sampled_data is true while the
    // receiver signals reduced carrier amplitude.
    void submit_sample(sampler_t &sampler, const bool sampled_data);

    bool bit_complete(const sampler_t &sampler);
    bool bit_faulty(const sampler_t &sampler);
    bool end_of_cycle(const sampler_t &sampler);

    // True at the end of a cycle which received all 59 bits.
    bool minute_complete(const sampler_t &sampler);

    // long_tick --> 1, short_tick --> 0,
    // undefined --> no bit since the last end of cycle or faulty bit
    DCF77::tick_t latest_bit(const sampler_t &sampler);

    // After the first end of cycle this is the current second.
    uint8_t get_second(const sampler_t &sampler);

    uint8_t get_received_bits(const sampler_t &sampler);

    uint64_t get_raw_data(const sampler_t &sampler);

    void debug(Print &out, const sampler_t &sampler);
}
#endif
