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

#include "pipeline.h"

#include <stdio.h>

namespace AwgCtl::Seq {

ResolvedProgram::~ResolvedProgram()
{
}

QuantizedProgram::~QuantizedProgram()
{
}

Pipeline::~Pipeline()
{
}

AWGCTL_EXPORT() std::string format_samples_time(uint64_t nsamples, double sample_rate)
{
    char buff[64];
    if (sample_rate <= 0) {
        snprintf(buff, sizeof(buff), "%llu samples", (unsigned long long)nsamples);
    }
    else {
        snprintf(buff, sizeof(buff), "%llu samples (%.3f us)", (unsigned long long)nsamples,
                 double(nsamples) / sample_rate * 1e6);
    }
    return buff;
}

}
