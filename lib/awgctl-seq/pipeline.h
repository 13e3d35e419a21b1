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

#ifndef __AWGCTL_SEQ_PIPELINE_H__
#define __AWGCTL_SEQ_PIPELINE_H__

#include "intent.h"
#include "physical_setup.h"

#include <memory>
#include <string>
#include <vector>

namespace AwgCtl::Seq {

// Time resolved form of an intent program.
class AWGCTL_EXPORT() ResolvedProgram {
public:
    virtual ~ResolvedProgram();
    virtual double sample_rate() const = 0;
};

struct QuantInfo {
    std::string name;
    uint64_t original_samples;
    uint64_t quantized_samples;
    SegmentMode mode;
    uint32_t loop;
    bool loopable;
};

// Quantized form of an intent program.
// The segment order and names are the same as the intent program's
// and stay the same when a single segment is patched.
class AWGCTL_EXPORT() QuantizedProgram {
public:
    virtual ~QuantizedProgram();
    virtual double sample_rate() const = 0;
    virtual const std::vector<std::string> &segment_names() const = 0;
    // Rounding granularity of segment length and the step size within it.
    virtual uint64_t quantum_samples() const = 0;
    virtual uint64_t step_samples() const = 0;
    virtual std::vector<QuantInfo> quantization() const = 0;
};

struct CompiledSegment {
    std::string name;
    uint32_t nchannels = 0;
    // Interleaved by channel (`nsamples() * nchannels` entries).
    std::vector<int16_t> samples;
    uint64_t quantum_samples = 0;
    // Phase of each tone at the end of the segment.
    // Seeds the synthesis of the following segment or of a replacement of this one.
    std::vector<double> end_phases;

    uint64_t nsamples() const
    {
        return nchannels ? samples.size() / nchannels : 0;
    }
};

// One node of the sequencer step graph.
struct Step {
    uint32_t segment;
    uint32_t next;
    uint32_t loops;
    // Wait for a trigger event before moving on to `next`.
    bool on_trig;
    bool operator==(const Step &other) const
    {
        return (segment == other.segment && next == other.next &&
                loops == other.loops && on_trig == other.on_trig);
    }
};

struct CompiledProgram {
    double sample_rate = 0;
    double full_scale_mv = 0;
    int32_t full_scale = 0;
    // Indexed by the segment index of the quantized program.
    // Unchanged segments are shared with the program this was derived from.
    std::vector<std::shared_ptr<const CompiledSegment>> segments;
    std::vector<Step> steps;
    uint32_t entry_step = 0;
};

/**
 * The resolve -> quantize -> synthesize chain.
 *
 * All methods are required. They may throw any exception derived from `std::exception`.
 */
class AWGCTL_EXPORT() Pipeline {
public:
    virtual ~Pipeline();
    virtual std::shared_ptr<const ResolvedProgram> resolve(const IntentProgram &prog,
                                                           double sample_rate) = 0;
    virtual std::shared_ptr<const QuantizedProgram> quantize(const ResolvedProgram &prog,
                                                             double quantum_s) = 0;
    // Synthesize int16 sample buffers scaled so that `full_scale_mv` maps to `full_scale`.
    // If `only` is not null, only the listed segment indices are synthesized and
    // the other entries of the result may be null.
    // If `seed` is not null, the oscillator phases continue from it.
    virtual std::shared_ptr<const CompiledProgram> compile(
        const QuantizedProgram &prog, const PhysicalSetup &setup,
        double full_scale_mv, int32_t full_scale,
        const std::vector<uint32_t> *only, const CompiledProgram *seed) = 0;
};

// `"<n> samples (<t> us)"`
std::string format_samples_time(uint64_t nsamples, double sample_rate);

}

#endif
