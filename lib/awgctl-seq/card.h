/*************************************************************************
 *   Copyright (c) 2026 - 2026 Yichao Yu <yyc1992@gmail.com>             *
 *                                                                       *
 *   This library is free software; you can redistribute it and/or       *
 *   modify it under the terms of the GNU Lesser General Public          *
 *   License as published by the Free Software Foundation; either        *
 *   version 3.0 of the License, or (at your option) any later version.  *
 *                                                                       *
 *   This library is distributed in the hope that it will be useful,     *
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of      *
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU    *
 *   Lesser General Public License for more details.                     *
 *                                                                       *
 *   You should have received a copy of the GNU Lesser General Public    *
 *   License along with this library. If not,                            *
 *   see <http://www.gnu.org/licenses/>.                                 *
 *************************************************************************/

#ifndef __AWGCTL_SEQ_CARD_H__
#define __AWGCTL_SEQ_CARD_H__

#include "pipeline.h"

#include <memory>
#include <string>

namespace AwgCtl::Seq {

enum class CardType : uint8_t {
    AnalogOut,
};

enum class CardMode : uint8_t {
    Sequence,
};

enum class StopLevel : uint8_t {
    Zero,
    Low,
    High,
    HoldLast,
};

enum class TriggerMode : uint8_t {
    None,
    Pos,
    Neg,
};

enum class Coupling : uint8_t {
    DC,
    AC,
};

enum class ClockMode : uint8_t {
    IntPLL,
    ExtRef,
};

// Trigger OR mask bits.
enum TrigMask : uint32_t {
    TrigNone = 0,
    TrigSoftware = 1 << 0,
    TrigExt0 = 1 << 1,
    TrigExt1 = 1 << 2,
};

// Card command bits, combined for `start` and `stop`.
enum Cmd : uint32_t {
    CardStart = 1 << 0,
    CardStop = 1 << 1,
    EnableTrigger = 1 << 2,
    ForceTrigger = 1 << 3,
    DisableTrigger = 1 << 4,
    StopDMA = 1 << 5,
};

/**
 * Register level access to one sequence mode AWG card.
 *
 * Every method throws `HardwareError` on failure.
 * The vendor protocol lives behind this interface.
 */
class AWGCTL_EXPORT() Card {
public:
    virtual ~Card();

    virtual std::string product_name() = 0;
    virtual std::string status() = 0;

    virtual void card_mode(CardMode mode) = 0;
    virtual void enable_channels(uint32_t mask) = 0;
    virtual void channel_output(uint32_t chn, bool enable) = 0;
    virtual void output_load(uint32_t chn, double ohm) = 0;
    virtual void amplitude(uint32_t chn, int32_t mv) = 0;
    virtual void stop_level(uint32_t chn, StopLevel level) = 0;

    virtual void trigger_or_mask(uint32_t mask) = 0;
    virtual void trigger_ext0_mode(TriggerMode mode) = 0;
    virtual void trigger_ext0_level0(int32_t mv) = 0;
    virtual void trigger_ext0_coupling(Coupling coupling) = 0;
    // `true` for 50 Ohm termination
    virtual void trigger_termination(bool term) = 0;
    // In samples.
    virtual void trigger_delay(uint64_t delay) = 0;

    virtual void clock_mode(ClockMode mode) = 0;
    virtual void set_sample_rate(int64_t hz) = 0;
    virtual int64_t get_sample_rate() = 0;
    virtual void clock_output(bool enable) = 0;
    // The largest magnitude of a sample code.
    virtual int32_t max_sample_value() = 0;

    // In milliseconds, `0` to disable.
    virtual void timeout(uint32_t ms) = 0;
    virtual void start(uint32_t cmd) = 0;
    virtual void stop(uint32_t cmd) = 0;
    virtual uint32_t current_step() = 0;

    // Sequence memory. `nsegments` must be a power of 2.
    virtual void max_segments(uint32_t nsegments) = 0;
    // `samples` is interleaved by channel.
    virtual void write_segment(uint32_t idx, const int16_t *samples, size_t nsamples) = 0;
    virtual void write_step(uint32_t idx, const Step &step, bool last) = 0;
    virtual void start_step(uint32_t idx) = 0;
};

/**
 * Opens a card by serial number. Throws `HardwareError` on failure.
 */
class AWGCTL_EXPORT() CardOpener {
public:
    virtual ~CardOpener();
    virtual std::unique_ptr<Card> open(int64_t serial, CardType type) = 0;
};

}

#endif
