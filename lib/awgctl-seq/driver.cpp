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

#include "driver.h"
#include "error.h"

#include "../awgctl-utils/digest.h"
#include "../awgctl-utils/log.h"

#include <sstream>

namespace AwgCtl::Seq {

static AWGCTL_NORETURN void invalid_config(const char *key, const std::string &msg)
{
    throw ConfigurationError(Error::Configuration::InvalidValue,
                             std::string("Invalid `") + key + "`: " + msg);
}

template<typename T>
static T get_value(const YAML::Node &node, const char *key)
{
    try {
        return node.as<T>();
    }
    catch (const YAML::Exception &err) {
        invalid_config(key, err.what());
    }
}

template<typename T>
static bool load_optional(const YAML::Node &node, const char *key, T &val)
{
    auto v = node[key];
    if (!v)
        return false;
    val = get_value<T>(v, key);
    return true;
}

template<typename T>
static void load_required(const YAML::Node &node, const char *key, T &val)
{
    if (!load_optional(node, key, val)) {
        throw ConfigurationError(Error::Configuration::MissingValue,
                                 std::string("Missing `") + key + "`.");
    }
}

Driver::Config Driver::Config::load(const YAML::Node &node)
{
    if (!node.IsMap())
        throw ConfigurationError(Error::Configuration::InvalidValue,
                                 "Driver configuration must be a map.");
    static const char *const known_keys[] = {
        "serial_number", "sample_rate_hz", "card_max_mv", "physical_setup",
        "simulation", "segment_quantum_s", "trigger", "output_load_ohm",
    };
    for (auto it: node) {
        std::string key;
        try {
            key = it.first.as<std::string>();
        }
        catch (const YAML::Exception&) {
            throw ConfigurationError(Error::Configuration::InvalidValue,
                                     "Driver configuration key must be a string.");
        }
        bool found = false;
        for (auto known: known_keys) {
            if (key == known) {
                found = true;
                break;
            }
        }
        if (!found) {
            awgWarn("Unknown driver configuration key `%s`\n", key.c_str());
        }
    }

    Config conf;
    load_optional(node, "simulation", conf.simulation);
    if (conf.simulation) {
        load_optional(node, "serial_number", conf.serial_number);
    }
    else {
        load_required(node, "serial_number", conf.serial_number);
        if (conf.serial_number <= 0) {
            invalid_config("serial_number", "must be positive.");
        }
    }
    load_required(node, "sample_rate_hz", conf.sample_rate_hz);
    if (conf.sample_rate_hz <= 0)
        invalid_config("sample_rate_hz", "must be positive.");
    load_optional(node, "card_max_mv", conf.card_max_mv);
    if (conf.card_max_mv < 1 || conf.card_max_mv > 10000)
        invalid_config("card_max_mv", "must be within 1 - 10000 mV.");
    load_required(node, "physical_setup", conf.physical_setup);
    load_optional(node, "segment_quantum_s", conf.segment_quantum_s);
    if (!(conf.segment_quantum_s > 0))
        invalid_config("segment_quantum_s", "must be positive.");
    load_optional(node, "output_load_ohm", conf.card.output_load_ohm);
    if (!(conf.card.output_load_ohm > 0))
        invalid_config("output_load_ohm", "must be positive.");
    if (auto trig = node["trigger"]) {
        if (!trig.IsMap())
            invalid_config("trigger", "must be a map.");
        load_optional(trig, "level_mv", conf.card.trigger_level_mv);
        load_optional(trig, "termination", conf.card.trigger_termination);
        load_optional(trig, "delay", conf.card.trigger_delay);
    }
    return conf;
}

Driver::Config Driver::Config::load_file(const char *fname)
{
    YAML::Node node;
    try {
        node = YAML::LoadFile(fname);
    }
    catch (const YAML::Exception &err) {
        throw ConfigurationError(Error::Configuration::InvalidValue,
                                 std::string("Cannot load ") + fname + ": " + err.what());
    }
    return load(node);
}

// Installs the new state on `commit`. Destroying an uncommitted transaction
// rolls the driver back to the unconfigured state with nothing cached.
class Driver::UploadTransaction {
public:
    UploadTransaction(Driver &driver)
        : m_driver(driver)
    {}
    UploadTransaction(const UploadTransaction&) = delete;
    ~UploadTransaction()
    {
        if (!m_committed) {
            m_driver.rollback();
        }
    }
    void commit(std::shared_ptr<const CachedCompileState> state,
                std::shared_ptr<UploadSession> session)
    {
        m_driver.m_session->install(std::move(session));
        m_driver.m_cache = std::move(state);
        m_committed = true;
    }

private:
    Driver &m_driver;
    bool m_committed = false;
};

Driver::Driver(Config config, const SetupRegistry &registry, Pipeline &pipeline,
               Uploader &uploader, CardOpener *opener)
    : m_config(std::move(config)),
      m_setup(registry.get(m_config.physical_setup)),
      m_pipeline(pipeline),
      m_uploader(uploader)
{
    if (m_config.simulation) {
        awgInfo("Driver running in simulation mode with setup %s\n",
                m_setup->name().c_str());
        return;
    }
    if (!opener)
        throw ConfigurationError(Error::Configuration::MissingValue,
                                 "A card opener is required unless in simulation mode.");
    m_session = std::make_unique<CardSession>(*opener, m_config.serial_number,
                                              m_config.card);
}

Driver::~Driver()
{
}

std::optional<uint64_t> Driver::current_digest() const
{
    if (!m_cache)
        return std::nullopt;
    return m_cache->digest;
}

void Driver::print_card_info(std::ostream &stm)
{
    if (m_config.simulation) {
        stm << "Simulation mode, no card attached." << std::endl;
        return;
    }
    auto &card = m_session->connect();
    stm << "Product: " << card.product_name() << ", card status: "
        << card.status() << std::endl;
}

std::shared_ptr<const CachedCompileState>
Driver::make_state(std::shared_ptr<const IntentProgram> intent,
                   std::shared_ptr<const QuantizedProgram> quantized,
                   std::shared_ptr<const CompiledProgram> compiled) const
{
    auto &names = quantized->segment_names();
    if (!compiled || compiled->segments.size() != names.size())
        throw PipelineError("Compiler returned " +
                            std::to_string(compiled ? compiled->segments.size() : 0) +
                            " segment(s) for " + std::to_string(names.size()) + ".");
    auto state = std::make_shared<CachedCompileState>();
    for (uint32_t i = 0; i < names.size(); i++) {
        if (!compiled->segments[i])
            throw PipelineError("Segment " + names[i] + " was not compiled.");
        if (!state->segment_index.emplace(names[i], i).second) {
            throw PipelineError("Duplicated segment name " + names[i] +
                                " after quantization.");
        }
    }
    state->digest = intent->digest();
    state->intent = std::move(intent);
    state->quantized = std::move(quantized);
    state->compiled = std::move(compiled);
    return state;
}

void Driver::log_quantization(const QuantizedProgram &quantized) const
{
    if (!Log::checkLevel(Log::Debug))
        return;
    auto rate = quantized.sample_rate();
    awgDebug("Quantum: %s, step: %s\n",
             format_samples_time(quantized.quantum_samples(), rate).c_str(),
             format_samples_time(quantized.step_samples(), rate).c_str());
    for (auto &info: quantized.quantization()) {
        awgDebug("  %s [%s x%u%s]: %s -> %s\n", info.name.c_str(), mode_name(info.mode),
                 info.loop, info.loopable ? ", loopable" : "",
                 format_samples_time(info.original_samples, rate).c_str(),
                 format_samples_time(info.quantized_samples, rate).c_str());
    }
}

double Driver::resolve_rate()
{
    if (!m_config.simulation && m_session->configured())
        return double(m_session->card().get_sample_rate());
    return double(m_config.sample_rate_hz);
}

void Driver::rollback() noexcept
{
    awgWarn("Upload failed, clearing the cached program\n");
    m_cache.reset();
    m_session->invalidate();
    if (!m_session->connected())
        return;
    try {
        m_session->card().stop(StopDMA);
    }
    catch (const std::exception &err) {
        awgWarn("Failed to stop DMA after upload failure: %s\n", err.what());
    }
}

bool Driver::plan_phase_compile_upload(const IntentProgram &prog, bool force)
{
    if (Log::checkLevel(Log::Debug)) {
        std::ostringstream stm;
        prog.print(stm);
        awgDebug("Received intent program:\n%s", stm.str().c_str());
    }
    auto digest = prog.digest();
    if (!force && m_cache && m_cache->digest == digest) {
        awgInfo("Intent program %s unchanged; skipping compile/upload.\n",
                digest_hex(digest).c_str());
        return false;
    }
    auto intent = std::make_shared<const IntentProgram>(prog);
    // Nothing on the card is touched before the program quantizes.
    auto resolved = m_pipeline.resolve(*intent, resolve_rate());
    auto quantized = m_pipeline.quantize(*resolved, m_config.segment_quantum_s);
    log_quantization(*quantized);

    if (m_config.simulation) {
        auto compiled = m_pipeline.compile(*quantized, *m_setup, m_config.card_max_mv,
                                           simulation_full_scale, nullptr, nullptr);
        m_cache = make_state(std::move(intent), std::move(quantized), std::move(compiled));
        awgInfo("Simulation mode; compiled program %s\n", digest_hex(digest).c_str());
        return true;
    }

    auto &card = m_session->connect();
    UploadTransaction txn(*this);
    card.stop(StopDMA);
    m_session->configure_once(m_config.sample_rate_hz, m_config.card_max_mv, *m_setup);
    int32_t full_scale = card.max_sample_value() - 1;
    auto compiled = m_pipeline.compile(*quantized, *m_setup, m_config.card_max_mv,
                                       full_scale, nullptr, nullptr);
    auto state = make_state(std::move(intent), std::move(quantized), compiled);
    auto session = m_uploader.upload(*compiled, card, nullptr, nullptr, true);
    awgInfo("Upload to AWG successful, starting\n");
    card.timeout(0);
    card.start(CardStart | EnableTrigger | ForceTrigger);
    txn.commit(std::move(state), std::move(session));
    awgInfo("Running program %s\n", digest_hex(digest).c_str());
    return true;
}

void Driver::hotswap_remap_src(const std::string &segment, const std::string &chn,
                               std::vector<int32_t> src)
{
    if (m_config.simulation) {
        awgInfo("Simulation mode; hotswap of %s/%s skipped.\n", segment.c_str(), chn.c_str());
        return;
    }
    if (m_session->state() != CardSession::State::Uploaded)
        throw SessionStateError(Error::SessionState::NoUpload,
                                "No program uploaded; a full upload is required before hotswap.");
    // Keep the baseline alive even if it is replaced.
    auto cache = m_cache;
    if (!cache || !cache->intent || !cache->quantized)
        throw SessionStateError(Error::SessionState::NoCache,
                                "No cached program to patch.");
    if (!cache->compiled)
        throw SessionStateError(Error::SessionState::NoPhaseSeed,
                                "No compiled program to seed the phases from.");
    auto idx_it = cache->segment_index.find(segment);
    if (idx_it == cache->segment_index.end())
        throw LookupError(Error::Lookup::Segment, "Unknown segment '" + segment + "'.");
    auto idx = idx_it->second;

    auto t0 = getTime();
    try {
        auto intent = std::make_shared<const IntentProgram>(
            cache->intent->with_remap_src(segment, chn, std::move(src)));
        auto &card = m_session->card();
        auto resolved = m_pipeline.resolve(*intent, double(card.get_sample_rate()));
        auto quantized = m_pipeline.quantize(*resolved, m_config.segment_quantum_s);
        auto &names = quantized->segment_names();
        if (names != cache->quantized->segment_names())
            throw SessionStateError(Error::SessionState::Inconsistent,
                                    "Segment list changed after patching.");
        std::vector<uint32_t> only{idx};
        int32_t full_scale = card.max_sample_value() - 1;
        auto out = m_pipeline.compile(*quantized, *m_setup, m_config.card_max_mv,
                                      full_scale, &only, cache->compiled.get());
        if (!out || idx >= out->segments.size() || !out->segments[idx])
            throw PipelineError("Compiler did not produce the segment.");
        auto &seg = out->segments[idx];
        auto &old_seg = cache->compiled->segments[idx];
        if (seg->samples.size() != old_seg->samples.size()) {
            throw SessionStateError(Error::SessionState::Inconsistent,
                                    "Buffer length changed from " +
                                    std::to_string(old_seg->samples.size()) + " to " +
                                    std::to_string(seg->samples.size()) + ".");
        }
        auto merged = std::make_shared<CompiledProgram>(*cache->compiled);
        merged->segments[idx] = seg;
        auto session = m_uploader.upload(*merged, card, m_session->upload_session(),
                                         &only, false);
        // Only the resident buffer changed.
        m_session->install(std::move(session));
        m_cache = make_state(std::move(intent), std::move(quantized), std::move(merged));
    }
    catch (Error &err) {
        awgWarn("Hotswap of %s failed: %s\n", segment.c_str(), err.what());
        err.set_segment(segment);
        throw;
    }
    catch (const std::exception &err) {
        awgWarn("Hotswap of %s failed: %s\n", segment.c_str(), err.what());
        PipelineError perr(err.what());
        perr.set_segment(segment);
        throw perr;
    }
    awgInfo("Hotswapped segment %s in %.3f ms\n", segment.c_str(),
            double(getTime() - t0) / 1e6);
}

uint32_t Driver::get_current_step()
{
    if (m_config.simulation)
        throw SessionStateError(Error::SessionState::Simulation,
                                "No card in simulation mode.");
    return m_session->connect().current_step();
}

void Driver::stop_start_card()
{
    if (m_config.simulation) {
        awgInfo("Simulation mode; stop/start skipped.\n");
        return;
    }
    if (m_session->state() != CardSession::State::Uploaded)
        throw SessionStateError(Error::SessionState::NoUpload, "No program uploaded.");
    auto &card = m_session->card();
    card.stop(CardStop);
    card.timeout(0);
    card.start(CardStart | EnableTrigger | ForceTrigger);
}

void Driver::close_card()
{
    m_cache.reset();
    if (m_session) {
        m_session->close();
    }
}

}
