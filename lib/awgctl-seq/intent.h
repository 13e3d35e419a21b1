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

#ifndef __AWGCTL_SEQ_INTENT_H__
#define __AWGCTL_SEQ_INTENT_H__

#include "../awgctl-utils/utils.h"

#include <ostream>
#include <string>
#include <vector>

namespace AwgCtl::Seq {

enum class SegmentMode : uint8_t {
    Once,
    Loop,
    WaitTrig,
};

const char *mode_name(SegmentMode mode);

// A named set of tones on one logical channel.
struct ToneDef {
    std::string name;
    std::string logical_channel;
    std::vector<double> freqs;
    std::vector<double> amps;
    // Empty for automatically assigned phases.
    std::vector<double> phases;

    size_t ntones() const
    {
        return freqs.size();
    }
};

struct AWGCTL_EXPORT() Operation {
    enum class Kind : uint8_t {
        Hold,
        UseDef,
        Move,
        RampAmp,
        RemapFromDef,
    };

    static Operation hold(double time_s);
    static Operation use_def(std::string chn, std::string def);
    static Operation move(std::string chn, double df, double time_s,
                          std::vector<int32_t> idxs, std::string interp="linear");
    static Operation ramp_amp(std::string chn, double amp, double time_s,
                              std::vector<int32_t> idxs, std::string interp="linear");
    static Operation remap_from_def(std::string chn, std::string def,
                                    std::vector<int32_t> src, std::vector<int32_t> dst,
                                    double time_s, std::string interp="min_jerk");

    Kind kind = Kind::Hold;
    // Empty for `Hold`, which applies to all channels.
    std::string logical_channel;
    double time_s = 0;
    // `UseDef` and `RemapFromDef`
    std::string def;
    // Tone indices affected by `Move` and `RampAmp`
    std::vector<int32_t> idxs;
    // Frequency step for `Move`, final amplitude for `RampAmp`
    double value = 0;
    std::string interp;
    // `RemapFromDef`: tone `src[i]` of `def` is moved to slot `dst[i]`.
    // The length is fixed when the program is defined.
    std::vector<int32_t> src;
    std::vector<int32_t> dst;
};

const char *kind_name(Operation::Kind kind);

struct Segment {
    std::string name;
    SegmentMode mode = SegmentMode::Once;
    uint32_t loop = 1;
    std::vector<Operation> ops;
};

/**
 * Declarative description of the waveform program for one card.
 *
 * The value is immutable and validated on construction.
 * The content digest is computed from the full structure once.
 * Patching (`with_remap_src`) creates a new program.
 */
class AWGCTL_EXPORT() IntentProgram {
public:
    IntentProgram(std::vector<std::string> logical_channels,
                  std::vector<ToneDef> defs, std::vector<Segment> segments);

    const std::vector<std::string> &logical_channels() const
    {
        return m_channels;
    }
    const std::vector<ToneDef> &definitions() const
    {
        return m_defs;
    }
    const std::vector<Segment> &segments() const
    {
        return m_segments;
    }
    uint64_t digest() const
    {
        return m_digest;
    }

    // Return `-1` if not found.
    int find_segment(const std::string &name) const;
    const ToneDef *find_def(const std::string &name) const;
    bool has_channel(const std::string &name) const;

    // Return a copy of this program with the source indices of the remap operation
    // on `chn` in `segment` replaced by `src`.
    // Throws `LookupError` if the segment, channel or the operation doesn't exist
    // and `ShapeMismatchError` if the length of `src` is different.
    IntentProgram with_remap_src(const std::string &segment, const std::string &chn,
                                 std::vector<int32_t> src) const;

    void serialize(std::vector<uint8_t> &out) const;
    void print(std::ostream &stm) const;

private:
    void verify() const;

    std::vector<std::string> m_channels;
    std::vector<ToneDef> m_defs;
    std::vector<Segment> m_segments;
    uint64_t m_digest;
};

static inline std::ostream &operator<<(std::ostream &stm, const IntentProgram &prog)
{
    prog.print(stm);
    return stm;
}

}

#endif
