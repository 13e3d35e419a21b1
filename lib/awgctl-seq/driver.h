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

#ifndef __AWGCTL_SEQ_DRIVER_H__
#define __AWGCTL_SEQ_DRIVER_H__

#include "card_session.h"
#include "intent.h"
#include "physical_setup.h"
#include "pipeline.h"
#include "upload.h"

#include <yaml-cpp/yaml.h>

#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace AwgCtl::Seq {

// Everything derived from the program that is currently resident on the card.
// Either all of it is valid or none of it is kept.
struct CachedCompileState {
    uint64_t digest;
    std::shared_ptr<const IntentProgram> intent;
    std::shared_ptr<const QuantizedProgram> quantized;
    // Phase seed for recompiling a single segment.
    std::shared_ptr<const CompiledProgram> compiled;
    std::map<std::string,uint32_t> segment_index;
};

/**
 * Compiles intent programs and keeps the card running the latest one.
 *
 * Calls are expected to be serialized by the caller.
 * The card handle and the cached compile state are owned by the driver.
 */
class AWGCTL_EXPORT() Driver {
    class UploadTransaction;
public:
    struct AWGCTL_EXPORT() Config {
        int64_t serial_number = 0;
        int64_t sample_rate_hz = 0;
        int32_t card_max_mv = 282;
        std::string physical_setup;
        bool simulation = false;
        double segment_quantum_s = 40e-6;
        CardSettings card;

        // Throws `ConfigurationError` naming the offending key.
        static Config load(const YAML::Node &node);
        static Config load_file(const char *fname);
    };

    // The full scale code used when no card is attached.
    static constexpr int32_t simulation_full_scale = 32767;

    // `opener` may only be null in simulation mode.
    Driver(Config config, const SetupRegistry &registry, Pipeline &pipeline,
           Uploader &uploader, CardOpener *opener);
    Driver(const Driver&) = delete;
    Driver &operator=(const Driver&) = delete;
    ~Driver();

    bool ping() const
    {
        return true;
    }
    void print_card_info(std::ostream &stm=std::cout);
    // Returns whether the program was compiled and uploaded.
    bool plan_phase_compile_upload(const IntentProgram &prog, bool force=false);
    void hotswap_remap_src(const std::string &segment, const std::string &chn,
                           std::vector<int32_t> src);
    uint32_t get_current_step();
    // Restart the sequence from the entry step.
    void stop_start_card();
    void close_card();

    const Config &config() const
    {
        return m_config;
    }
    const PhysicalSetup &setup() const
    {
        return *m_setup;
    }
    std::optional<uint64_t> current_digest() const;
    std::shared_ptr<const CachedCompileState> cached_state() const
    {
        return m_cache;
    }
    // Null in simulation mode.
    const CardSession *card_session() const
    {
        return m_session.get();
    }

private:
    std::shared_ptr<const CachedCompileState>
    make_state(std::shared_ptr<const IntentProgram> intent,
               std::shared_ptr<const QuantizedProgram> quantized,
               std::shared_ptr<const CompiledProgram> compiled) const;
    void log_quantization(const QuantizedProgram &quantized) const;
    double resolve_rate();
    void rollback() noexcept;

    const Config m_config;
    const std::shared_ptr<const PhysicalSetup> m_setup;
    Pipeline &m_pipeline;
    Uploader &m_uploader;
    std::unique_ptr<CardSession> m_session;
    std::shared_ptr<const CachedCompileState> m_cache;
};

}

#endif
