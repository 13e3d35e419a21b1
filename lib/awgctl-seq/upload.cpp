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

#include "upload.h"
#include "error.h"

#include "../awgctl-utils/log.h"

namespace AwgCtl::Seq {

size_t UploadSession::resident_size(uint32_t idx) const
{
    if (idx >= segments.size() || !segments[idx])
        return 0;
    return segments[idx]->samples.size();
}

Uploader::~Uploader()
{
}

CardUploader::~CardUploader()
{
}

uint32_t CardUploader::segment_memory_size(uint32_t nsegments)
{
    uint32_t res = 1;
    while (res < nsegments)
        res <<= 1;
    return res;
}

static void check_segment(const CompiledProgram &prog, uint32_t idx)
{
    if (idx >= prog.segments.size() || !prog.segments[idx]) {
        throw SessionStateError(Error::SessionState::Inconsistent,
                                "No compiled buffer for segment " + std::to_string(idx) + ".");
    }
}

static void write_segment(const CompiledProgram &prog, Card &card, uint32_t idx)
{
    auto &seg = *prog.segments[idx];
    awgDebug("Writing segment %u (%s): %s\n", idx, seg.name.c_str(),
             format_samples_time(seg.nsamples(), prog.sample_rate).c_str());
    card.write_segment(idx, seg.samples.data(), seg.samples.size());
}

void CardUploader::write_steps(const CompiledProgram &prog, Card &card,
                               UploadSession &session)
{
    auto nsteps = (uint32_t)prog.steps.size();
    if (nsteps == 0)
        throw SessionStateError(Error::SessionState::Inconsistent, "Empty step graph.");
    if (prog.entry_step >= nsteps)
        throw SessionStateError(Error::SessionState::Inconsistent,
                                "Entry step out of range.");
    for (uint32_t i = 0; i < nsteps; i++) {
        auto &step = prog.steps[i];
        if (step.segment >= prog.segments.size() || step.next >= nsteps) {
            throw SessionStateError(Error::SessionState::Inconsistent,
                                    "Step " + std::to_string(i) + " out of range.");
        }
        card.write_step(i, step, i == nsteps - 1);
    }
    card.start_step(prog.entry_step);
    session.steps = prog.steps;
    session.entry_step = prog.entry_step;
}

std::shared_ptr<UploadSession> CardUploader::upload_all(const CompiledProgram &prog,
                                                        Card &card)
{
    auto nseg = (uint32_t)prog.segments.size();
    if (nseg == 0)
        throw SessionStateError(Error::SessionState::Inconsistent, "No segment to upload.");
    for (uint32_t i = 0; i < nseg; i++)
        check_segment(prog, i);
    auto session = std::make_shared<UploadSession>();
    session->nsegments_mem = segment_memory_size(nseg);
    card.max_segments(session->nsegments_mem);
    for (uint32_t i = 0; i < nseg; i++)
        write_segment(prog, card, i);
    session->segments = prog.segments;
    write_steps(prog, card, *session);
    return session;
}

std::shared_ptr<UploadSession> CardUploader::upload(const CompiledProgram &prog, Card &card,
                                                    std::shared_ptr<UploadSession> prior,
                                                    const std::vector<uint32_t> *only,
                                                    bool upload_steps)
{
    if (!prior) {
        if (only || !upload_steps)
            throw SessionStateError(Error::SessionState::NoUpload,
                                    "Partial upload without a resident program.");
        return upload_all(prog, card);
    }
    if (prog.segments.size() != prior->segments.size())
        throw SessionStateError(Error::SessionState::Inconsistent,
                                "Segment count differs from the resident program.");
    std::vector<uint32_t> idxs;
    if (only) {
        idxs = *only;
    }
    else {
        for (uint32_t i = 0; i < prog.segments.size(); i++) {
            idxs.push_back(i);
        }
    }
    // Check everything before the first write.
    for (auto idx: idxs) {
        check_segment(prog, idx);
        auto sz = prog.segments[idx]->samples.size();
        if (sz != prior->resident_size(idx)) {
            throw SessionStateError(Error::SessionState::Inconsistent,
                                    "Buffer size of segment " + std::to_string(idx) +
                                    " changed from " +
                                    std::to_string(prior->resident_size(idx)) + " to " +
                                    std::to_string(sz) + ".");
        }
    }
    for (auto idx: idxs)
        write_segment(prog, card, idx);
    for (auto idx: idxs)
        prior->segments[idx] = prog.segments[idx];
    if (upload_steps)
        write_steps(prog, card, *prior);
    prior->npatches++;
    return prior;
}

}
