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

#ifndef __AWGCTL_SEQ_UPLOAD_H__
#define __AWGCTL_SEQ_UPLOAD_H__

#include "card.h"
#include "pipeline.h"

#include <memory>
#include <vector>

namespace AwgCtl::Seq {

// What is currently resident in the sequence memory of a card.
struct AWGCTL_EXPORT() UploadSession {
    // Segments reserved on the card.
    uint32_t nsegments_mem = 0;
    // Resident buffer of each segment.
    std::vector<std::shared_ptr<const CompiledSegment>> segments;
    std::vector<Step> steps;
    uint32_t entry_step = 0;
    // Number of successful segment-subset uploads applied on top of the full upload.
    uint32_t npatches = 0;

    // Number of samples (all channels) of the resident buffer.
    size_t resident_size(uint32_t idx) const;
};

/**
 * Moves compiled buffers and the step graph into card memory.
 *
 * All methods throw `HardwareError` on transfer failure.
 */
class AWGCTL_EXPORT() Uploader {
public:
    virtual ~Uploader();
    // `prior` is the session being patched (null for a full upload).
    // `only` lists the segment indices to upload (null for all of them).
    // The step graph is written only if `upload_steps` is true.
    virtual std::shared_ptr<UploadSession> upload(const CompiledProgram &prog, Card &card,
                                                  std::shared_ptr<UploadSession> prior,
                                                  const std::vector<uint32_t> *only,
                                                  bool upload_steps) = 0;
};

class AWGCTL_EXPORT() CardUploader : public Uploader {
public:
    ~CardUploader() override;
    std::shared_ptr<UploadSession> upload(const CompiledProgram &prog, Card &card,
                                          std::shared_ptr<UploadSession> prior,
                                          const std::vector<uint32_t> *only,
                                          bool upload_steps) override;

    // Smallest power of 2 that is not smaller than `nsegments`.
    static uint32_t segment_memory_size(uint32_t nsegments);

private:
    std::shared_ptr<UploadSession> upload_all(const CompiledProgram &prog, Card &card);
    void write_steps(const CompiledProgram &prog, Card &card, UploadSession &session);
};

}

#endif
