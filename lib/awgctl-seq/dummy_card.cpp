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

#include "dummy_card.h"
#include "error.h"

#include <string.h>

namespace AwgCtl::Seq {

DummyCard::DummyCard(int64_t serial)
    : serial(serial)
{
}

DummyCard::~DummyCard()
{
}

std::string DummyCard::product_name()
{
    return product;
}

std::string DummyCard::status()
{
    if (running)
        return "running, step " + std::to_string(step);
    return "stopped";
}

void DummyCard::card_mode(CardMode _mode)
{
    mode = _mode;
    nconfig++;
}

void DummyCard::enable_channels(uint32_t mask)
{
    channel_mask = mask;
    nconfig++;
}

void DummyCard::channel_output(uint32_t chn, bool enable)
{
    if (!(channel_mask >> chn & 1))
        throw HardwareError(Error::Hardware::Config,
                            "Channel " + std::to_string(chn) + " not enabled.");
    channels[chn].output = enable;
    nconfig++;
}

void DummyCard::output_load(uint32_t chn, double ohm)
{
    channels[chn].load_ohm = ohm;
    nconfig++;
}

void DummyCard::amplitude(uint32_t chn, int32_t mv)
{
    channels[chn].amplitude_mv = mv;
    nconfig++;
}

void DummyCard::stop_level(uint32_t chn, StopLevel level)
{
    channels[chn].stop_level = level;
    nconfig++;
}

void DummyCard::trigger_or_mask(uint32_t mask)
{
    trig_mask = mask;
    nconfig++;
}

void DummyCard::trigger_ext0_mode(TriggerMode _mode)
{
    ext0_mode = _mode;
    nconfig++;
}

void DummyCard::trigger_ext0_level0(int32_t mv)
{
    ext0_level_mv = mv;
    nconfig++;
}

void DummyCard::trigger_ext0_coupling(Coupling coupling)
{
    ext0_coupling = coupling;
    nconfig++;
}

void DummyCard::trigger_termination(bool term)
{
    trig_term = term;
    nconfig++;
}

void DummyCard::trigger_delay(uint64_t delay)
{
    trig_delay = delay;
    nconfig++;
}

void DummyCard::clock_mode(ClockMode _mode)
{
    clock = _mode;
    nconfig++;
}

void DummyCard::set_sample_rate(int64_t hz)
{
    if (hz <= 0)
        throw HardwareError(Error::Hardware::Config,
                            "Invalid sample rate " + std::to_string(hz) + ".");
    sample_rate = hz;
    nconfig++;
}

int64_t DummyCard::get_sample_rate()
{
    return sample_rate;
}

void DummyCard::clock_output(bool enable)
{
    clock_out = enable;
    nconfig++;
}

int32_t DummyCard::max_sample_value()
{
    return max_sample;
}

void DummyCard::timeout(uint32_t ms)
{
    timeout_ms = ms;
}

void DummyCard::start(uint32_t cmd)
{
    nstarts++;
    if (cmd & CardStart) {
        if (last_step < 0)
            throw HardwareError(Error::Hardware::Command, "No sequence loaded.");
        running = true;
        dma_running = true;
        step = entry_step;
    }
}

void DummyCard::stop(uint32_t cmd)
{
    nstops++;
    if (cmd & StopDMA)
        dma_running = false;
    if (cmd & (CardStop | StopDMA)) {
        running = false;
    }
}

uint32_t DummyCard::current_step()
{
    return step;
}

void DummyCard::max_segments(uint32_t n)
{
    if (n == 0 || (n & (n - 1)) != 0)
        throw HardwareError(Error::Hardware::Config,
                            "Segment count " + std::to_string(n) + " not a power of 2.");
    nsegments = n;
    segments.clear();
    segments.resize(n);
    steps.clear();
    last_step = -1;
}

void DummyCard::write_segment(uint32_t idx, const int16_t *samples, size_t nsamples)
{
    if (idx >= nsegments)
        throw HardwareError(Error::Hardware::Transfer,
                            "Segment " + std::to_string(idx) + " out of range.");
    auto &seg = segments[idx];
    seg.resize(nsamples);
    memcpy(seg.data(), samples, nsamples * sizeof(int16_t));
    nsegment_writes++;
}

void DummyCard::write_step(uint32_t idx, const Step &_step, bool last)
{
    if (_step.segment >= nsegments)
        throw HardwareError(Error::Hardware::Transfer,
                            "Step " + std::to_string(idx) + " uses invalid segment " +
                            std::to_string(_step.segment) + ".");
    steps[idx] = _step;
    if (last)
        last_step = idx;
    nstep_writes++;
}

void DummyCard::start_step(uint32_t idx)
{
    entry_step = idx;
}

}
