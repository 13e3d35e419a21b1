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

#include "intent.h"
#include "error.h"

#include "../awgctl-utils/digest.h"

#include <algorithm>
#include <set>

namespace AwgCtl::Seq {

AWGCTL_EXPORT() const char *mode_name(SegmentMode mode)
{
    switch (mode) {
    case SegmentMode::Once:
        return "once";
    case SegmentMode::Loop:
        return "loop";
    case SegmentMode::WaitTrig:
        return "wait_trig";
    }
    return "unknown";
}

AWGCTL_EXPORT() const char *kind_name(Operation::Kind kind)
{
    switch (kind) {
    case Operation::Kind::Hold:
        return "hold";
    case Operation::Kind::UseDef:
        return "use_def";
    case Operation::Kind::Move:
        return "move";
    case Operation::Kind::RampAmp:
        return "ramp_amp";
    case Operation::Kind::RemapFromDef:
        return "remap_from_def";
    }
    return "unknown";
}

Operation Operation::hold(double time_s)
{
    Operation op;
    op.kind = Kind::Hold;
    op.time_s = time_s;
    return op;
}

Operation Operation::use_def(std::string chn, std::string def)
{
    Operation op;
    op.kind = Kind::UseDef;
    op.logical_channel = std::move(chn);
    op.def = std::move(def);
    return op;
}

Operation Operation::move(std::string chn, double df, double time_s,
                          std::vector<int32_t> idxs, std::string interp)
{
    Operation op;
    op.kind = Kind::Move;
    op.logical_channel = std::move(chn);
    op.value = df;
    op.time_s = time_s;
    op.idxs = std::move(idxs);
    op.interp = std::move(interp);
    return op;
}

Operation Operation::ramp_amp(std::string chn, double amp, double time_s,
                              std::vector<int32_t> idxs, std::string interp)
{
    Operation op;
    op.kind = Kind::RampAmp;
    op.logical_channel = std::move(chn);
    op.value = amp;
    op.time_s = time_s;
    op.idxs = std::move(idxs);
    op.interp = std::move(interp);
    return op;
}

Operation Operation::remap_from_def(std::string chn, std::string def,
                                    std::vector<int32_t> src, std::vector<int32_t> dst,
                                    double time_s, std::string interp)
{
    Operation op;
    op.kind = Kind::RemapFromDef;
    op.logical_channel = std::move(chn);
    op.def = std::move(def);
    op.src = std::move(src);
    op.dst = std::move(dst);
    op.time_s = time_s;
    op.interp = std::move(interp);
    return op;
}

IntentProgram::IntentProgram(std::vector<std::string> logical_channels,
                             std::vector<ToneDef> defs, std::vector<Segment> segments)
    : m_channels(std::move(logical_channels)),
      m_defs(std::move(defs)),
      m_segments(std::move(segments))
{
    verify();
    std::vector<uint8_t> buff;
    serialize(buff);
    m_digest = Digest::compute(buff.data(), buff.size());
}

static inline AWGCTL_NORETURN void invalid_program(const std::string &msg)
{
    throw ConfigurationError(Error::Configuration::InvalidProgram, msg);
}

void IntentProgram::verify() const
{
    if (m_channels.empty())
        invalid_program("Program has no logical channel.");
    std::set<std::string> names;
    for (auto &chn: m_channels) {
        if (chn.empty())
            invalid_program("Empty logical channel name.");
        if (!names.insert(chn).second) {
            invalid_program("Duplicated logical channel " + chn + ".");
        }
    }
    names.clear();
    for (auto &def: m_defs) {
        if (!names.insert(def.name).second)
            invalid_program("Duplicated definition " + def.name + ".");
        if (!has_channel(def.logical_channel))
            invalid_program("Definition " + def.name + " uses unknown logical channel " +
                            def.logical_channel + ".");
        if (def.amps.size() != def.freqs.size())
            invalid_program("Definition " + def.name +
                            ": amplitude and frequency count mismatch.");
        if (!def.phases.empty() && def.phases.size() != def.freqs.size()) {
            invalid_program("Definition " + def.name + ": phase and frequency count mismatch.");
        }
    }
    if (m_segments.empty())
        invalid_program("Program has no segment.");
    names.clear();
    for (auto &seg: m_segments) {
        if (seg.name.empty())
            invalid_program("Empty segment name.");
        if (!names.insert(seg.name).second)
            invalid_program("Duplicated segment " + seg.name + ".");
        if (seg.loop == 0)
            invalid_program("Segment " + seg.name + " has a zero loop count.");
        for (auto &op: seg.ops) {
            auto prefix = "Segment " + seg.name + ": " + kind_name(op.kind);
            if (op.time_s < 0)
                invalid_program(prefix + " with negative time.");
            if (op.kind == Operation::Kind::Hold)
                continue;
            if (!has_channel(op.logical_channel))
                invalid_program(prefix + " on unknown logical channel " +
                                op.logical_channel + ".");
            if (op.kind == Operation::Kind::Move || op.kind == Operation::Kind::RampAmp) {
                for (auto idx: op.idxs) {
                    if (idx < 0) {
                        invalid_program(prefix + " with negative tone index.");
                    }
                }
                continue;
            }
            auto def = find_def(op.def);
            if (!def)
                invalid_program(prefix + " uses unknown definition " + op.def + ".");
            if (def->logical_channel != op.logical_channel)
                invalid_program(prefix + " uses definition " + op.def +
                                " of a different logical channel.");
            if (op.kind != Operation::Kind::RemapFromDef)
                continue;
            if (op.src.empty())
                invalid_program(prefix + " with no source tone.");
            if (!op.dst.empty() && op.dst.size() != op.src.size())
                invalid_program(prefix + ": source and destination count mismatch.");
            for (auto idx: op.src) {
                if (idx < 0 || size_t(idx) >= def->ntones()) {
                    invalid_program(prefix + ": source tone " + std::to_string(idx) +
                                    " out of range.");
                }
            }
        }
    }
}

int IntentProgram::find_segment(const std::string &name) const
{
    for (size_t i = 0; i < m_segments.size(); i++) {
        if (m_segments[i].name == name) {
            return int(i);
        }
    }
    return -1;
}

const ToneDef *IntentProgram::find_def(const std::string &name) const
{
    for (auto &def: m_defs) {
        if (def.name == name) {
            return &def;
        }
    }
    return nullptr;
}

bool IntentProgram::has_channel(const std::string &name) const
{
    return std::find(m_channels.begin(), m_channels.end(), name) != m_channels.end();
}

IntentProgram IntentProgram::with_remap_src(const std::string &segment, const std::string &chn,
                                            std::vector<int32_t> src) const
{
    auto seg_idx = find_segment(segment);
    if (seg_idx < 0)
        throw LookupError(Error::Lookup::Segment, "Segment " + segment + " not found.");
    if (!has_channel(chn))
        throw LookupError(Error::Lookup::Channel, "Logical channel " + chn + " not found.");
    auto &seg = m_segments[seg_idx];
    auto it = std::find_if(seg.ops.begin(), seg.ops.end(), [&] (auto &op) {
        return op.kind == Operation::Kind::RemapFromDef && op.logical_channel == chn;
    });
    if (it == seg.ops.end())
        throw LookupError(Error::Lookup::Operation, "No remap_from_def on logical channel " +
                          chn + " in segment " + segment + ".");
    if (it->src.size() != src.size())
        throw ShapeMismatchError(it->src.size(), src.size(),
                                 "Remap source length mismatch: expected " +
                                 std::to_string(it->src.size()) + ", got " +
                                 std::to_string(src.size()) + ".");
    auto ntones = find_def(it->def)->ntones();
    for (auto idx: src) {
        if (idx < 0 || size_t(idx) >= ntones) {
            throw LookupError(Error::Lookup::Definition, "Source tone " + std::to_string(idx) +
                              " out of range for definition " + it->def + ".");
        }
    }
    auto segments = m_segments;
    segments[seg_idx].ops[it - seg.ops.begin()].src = std::move(src);
    return IntentProgram(m_channels, m_defs, std::move(segments));
}

namespace {

template<typename T>
void write_vec(std::vector<uint8_t> &out, const std::vector<T> &vec)
{
    write_bits(out, uint32_t(vec.size()));
    write_bytes(out, vec.data(), vec.size() * sizeof(T));
}

void write_str(std::vector<uint8_t> &out, const std::string &str)
{
    write_bits(out, uint32_t(str.size()));
    write_bytes(out, str.data(), str.size());
}

}

// [version <0>: 1B]
// [nchns: 4B][[name] x nchns]
// [ndefs: 4B][[name][chn][freqs][amps][phases] x ndefs]
// [nsegs: 4B][[name][mode: 1B][loop: 4B][nops: 4B][[Operation] x nops] x nsegs]
// Strings and arrays are prefixed with their 4B length.
void IntentProgram::serialize(std::vector<uint8_t> &out) const
{
    write_bits(out, uint8_t(0));
    write_bits(out, uint32_t(m_channels.size()));
    for (auto &chn: m_channels)
        write_str(out, chn);
    write_bits(out, uint32_t(m_defs.size()));
    for (auto &def: m_defs) {
        write_str(out, def.name);
        write_str(out, def.logical_channel);
        write_vec(out, def.freqs);
        write_vec(out, def.amps);
        write_vec(out, def.phases);
    }
    write_bits(out, uint32_t(m_segments.size()));
    for (auto &seg: m_segments) {
        write_str(out, seg.name);
        write_bits(out, seg.mode);
        write_bits(out, seg.loop);
        write_bits(out, uint32_t(seg.ops.size()));
        for (auto &op: seg.ops) {
            write_bits(out, op.kind);
            write_str(out, op.logical_channel);
            write_bits(out, op.time_s);
            write_str(out, op.def);
            write_vec(out, op.idxs);
            write_bits(out, op.value);
            write_str(out, op.interp);
            write_vec(out, op.src);
            write_vec(out, op.dst);
        }
    }
}

template<typename T>
static void print_list(std::ostream &stm, const std::vector<T> &vec)
{
    stm << "[";
    for (size_t i = 0; i < vec.size(); i++) {
        if (i)
            stm << ", ";
        stm << vec[i];
    }
    stm << "]";
}

void IntentProgram::print(std::ostream &stm) const
{
    stm << "IntentProgram <" << digest_hex(m_digest) << ">" << std::endl;
    stm << "  channels: ";
    print_list(stm, m_channels);
    stm << std::endl;
    for (auto &def: m_defs) {
        stm << "  def " << def.name << " (" << def.logical_channel << "): freqs=";
        print_list(stm, def.freqs);
        stm << " amps=";
        print_list(stm, def.amps);
        if (def.phases.empty()) {
            stm << " phases=auto";
        }
        else {
            stm << " phases=";
            print_list(stm, def.phases);
        }
        stm << std::endl;
    }
    for (auto &seg: m_segments) {
        stm << "  segment " << seg.name << " mode=" << mode_name(seg.mode);
        if (seg.mode == SegmentMode::Loop)
            stm << " loop=" << seg.loop;
        stm << std::endl;
        for (auto &op: seg.ops) {
            stm << "    " << kind_name(op.kind);
            if (op.kind != Operation::Kind::Hold)
                stm << " " << op.logical_channel;
            switch (op.kind) {
            case Operation::Kind::Hold:
                break;
            case Operation::Kind::UseDef:
                stm << " def=" << op.def;
                break;
            case Operation::Kind::Move:
                stm << " df=" << op.value << " idxs=";
                print_list(stm, op.idxs);
                break;
            case Operation::Kind::RampAmp:
                stm << " amp=" << op.value << " idxs=";
                print_list(stm, op.idxs);
                break;
            case Operation::Kind::RemapFromDef:
                stm << " def=" << op.def << " src=";
                print_list(stm, op.src);
                stm << " dst=";
                print_list(stm, op.dst);
                break;
            }
            if (op.kind != Operation::Kind::UseDef)
                stm << " time=" << op.time_s * 1e6 << "us";
            if (!op.interp.empty())
                stm << " (" << op.interp << ")";
            stm << std::endl;
        }
    }
}

}
