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

#ifndef __AWGCTL_SEQ_DUMMY_CARD_H__
#define __AWGCTL_SEQ_DUMMY_CARD_H__

#include "card.h"

#include <map>
#include <vector>

namespace AwgCtl::Seq {

/**
 * A card that only keeps its registers and sequence memory in memory.
 *
 * Used by the tests in place of a vendor driver.
 * The state is public for inspection.
 */
class AWGCTL_EXPORT() DummyCard : public Card {
public:
    struct ChannelState {
        bool output = false;
        double load_ohm = 0;
        int32_t amplitude_mv = 0;
        StopLevel stop_level = StopLevel::Zero;
    };

    DummyCard(int64_t serial=0);
    ~DummyCard() override;

    std::string product_name() override;
    std::string status() override;

    void card_mode(CardMode mode) override;
    void enable_channels(uint32_t mask) override;
    void channel_output(uint32_t chn, bool enable) override;
    void output_load(uint32_t chn, double ohm) override;
    void amplitude(uint32_t chn, int32_t mv) override;
    void stop_level(uint32_t chn, StopLevel level) override;

    void trigger_or_mask(uint32_t mask) override;
    void trigger_ext0_mode(TriggerMode mode) override;
    void trigger_ext0_level0(int32_t mv) override;
    void trigger_ext0_coupling(Coupling coupling) override;
    void trigger_termination(bool term) override;
    void trigger_delay(uint64_t delay) override;

    void clock_mode(ClockMode mode) override;
    void set_sample_rate(int64_t hz) override;
    int64_t get_sample_rate() override;
    void clock_output(bool enable) override;
    int32_t max_sample_value() override;

    void timeout(uint32_t ms) override;
    void start(uint32_t cmd) override;
    void stop(uint32_t cmd) override;
    uint32_t current_step() override;

    void max_segments(uint32_t nsegments) override;
    void write_segment(uint32_t idx, const int16_t *samples, size_t nsamples) override;
    void write_step(uint32_t idx, const Step &step, bool last) override;
    void start_step(uint32_t idx) override;

    int64_t serial;
    std::string product = "DummyAWG";
    CardMode mode = CardMode::Sequence;
    uint32_t channel_mask = 0;
    std::map<uint32_t,ChannelState> channels;
    uint32_t trig_mask = TrigNone;
    TriggerMode ext0_mode = TriggerMode::None;
    int32_t ext0_level_mv = 0;
    Coupling ext0_coupling = Coupling::DC;
    bool trig_term = false;
    uint64_t trig_delay = 0;
    ClockMode clock = ClockMode::IntPLL;
    int64_t sample_rate = 0;
    bool clock_out = false;
    int32_t max_sample = 32768;
    uint32_t timeout_ms = 10000;

    bool running = false;
    bool dma_running = false;
    uint32_t step = 0;
    uint32_t nsegments = 0;
    std::vector<std::vector<int16_t>> segments;
    std::map<uint32_t,Step> steps;
    // Index of the step flagged as the end of the sequence, `-1` if none.
    int64_t last_step = -1;
    uint32_t entry_step = 0;

    // Number of register writes done by the setup calls.
    uint32_t nconfig = 0;
    uint32_t nsegment_writes = 0;
    uint32_t nstep_writes = 0;
    uint32_t nstarts = 0;
    uint32_t nstops = 0;
};

}

#endif
