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

#define CATCH_CONFIG_MAIN

#include "driver_helper.h"

#include "../error_helper.h"

#include <sstream>

using namespace AwgCtl;
using namespace std::literals::string_literals;

using State = Seq::CardSession::State;

TEST_CASE("skip_unchanged") {
    DriverFixture fix;
    auto &driver = fix.driver;
    auto prog = test_program();
    REQUIRE(!driver.current_digest());
    REQUIRE(driver.plan_phase_compile_upload(prog));
    REQUIRE(fix.uploader.calls.size() == 1);
    REQUIRE(fix.pipeline.ncalls() == 3);
    auto card = fix.opener.card;
    REQUIRE(card);
    auto nwrites = card->nsegment_writes;
    auto nstarts = card->nstarts;

    REQUIRE(!driver.plan_phase_compile_upload(prog));
    REQUIRE(!driver.plan_phase_compile_upload(test_program()));
    REQUIRE(fix.uploader.calls.size() == 1);
    REQUIRE(fix.pipeline.ncalls() == 3);
    REQUIRE(card->nsegment_writes == nwrites);
    REQUIRE(card->nstarts == nstarts);
    REQUIRE(fix.opener.nopens == 1);
}

TEST_CASE("force") {
    DriverFixture fix;
    auto &driver = fix.driver;
    auto prog = test_program();
    REQUIRE(driver.plan_phase_compile_upload(prog));
    REQUIRE(driver.plan_phase_compile_upload(prog, true));
    REQUIRE(driver.plan_phase_compile_upload(prog, true));
    REQUIRE(fix.uploader.calls.size() == 3);
    REQUIRE(fix.pipeline.ncompile == 3);
    for (auto &call: fix.uploader.calls) {
        REQUIRE(!call.has_prior);
        REQUIRE(!call.only);
        REQUIRE(call.upload_steps);
    }
    REQUIRE(driver.current_digest() == prog.digest());
}

TEST_CASE("full_upload") {
    DriverFixture fix;
    auto &driver = fix.driver;
    auto prog = test_program();
    REQUIRE(driver.plan_phase_compile_upload(prog));
    REQUIRE(driver.current_digest() == prog.digest());
    auto session = driver.card_session();
    REQUIRE(session);
    REQUIRE(session->state() == State::Uploaded);

    auto card = fix.opener.card;
    REQUIRE(card->serial == 14926);
    REQUIRE(card->running);
    REQUIRE(card->timeout_ms == 0);
    REQUIRE(card->sample_rate == 1000000);
    REQUIRE(card->channel_mask == 1);
    REQUIRE(card->channels[0].amplitude_mv == 282);
    REQUIRE(card->channels[0].stop_level == Seq::StopLevel::HoldLast);
    REQUIRE(card->trig_mask == Seq::TrigExt0);
    REQUIRE(card->ext0_level_mv == 800);
    REQUIRE(card->trig_term);

    // 3 segments rounded up to 4 in memory.
    REQUIRE(card->nsegments == 4);
    REQUIRE(card->segments[0].size() == 40);
    REQUIRE(card->segments[1].size() == 120);
    REQUIRE(card->segments[2].size() == 40);
    REQUIRE(card->steps.size() == 3);
    REQUIRE(card->last_step == 2);
    REQUIRE(card->steps[1].on_trig);
    REQUIRE(card->steps[0].loops == 2);

    REQUIRE(fix.pipeline.last_full_scale == 32767);
    REQUIRE(fix.pipeline.last_full_scale_mv == 282);
    REQUIRE(fix.pipeline.last_rate == 1e6);
    REQUIRE(!fix.pipeline.last_only);
    REQUIRE(!fix.pipeline.last_seed);

    auto state = driver.cached_state();
    REQUIRE(state);
    REQUIRE(state->digest == prog.digest());
    REQUIRE(state->segment_index.at("init") == 0);
    REQUIRE(state->segment_index.at("rearrange") == 1);
    REQUIRE(state->segment_index.at("final") == 2);
    REQUIRE(state->compiled->segments.size() == 3);
}

TEST_CASE("configure_once") {
    DriverFixture fix;
    auto &driver = fix.driver;
    REQUIRE(driver.plan_phase_compile_upload(test_program()));
    auto card = fix.opener.card;
    auto nconfig = card->nconfig;
    REQUIRE(nconfig > 0);
    for (int i = 0; i < 5; i++) {
        REQUIRE(driver.plan_phase_compile_upload(test_program({2, 1, 0}, 10e-6 * (i + 2))));
        REQUIRE(driver.plan_phase_compile_upload(test_program(), true));
    }
    REQUIRE(card->nconfig == nconfig);
    REQUIRE(fix.opener.nopens == 1);
    REQUIRE(fix.uploader.calls.size() == 11);
}

TEST_CASE("rollback_upload_failure") {
    DriverFixture fix;
    auto &driver = fix.driver;
    auto prog = test_program();
    REQUIRE(driver.plan_phase_compile_upload(prog));
    auto card = fix.opener.card;
    auto nconfig = card->nconfig;

    auto prog2 = test_program({1, 2, 0});
    fix.uploader.fail = true;
    auto err = expect_error<Seq::HardwareError>([&] {
        driver.plan_phase_compile_upload(prog2);
    });
    REQUIRE(err.what() == "DMA transfer failed."s);
    REQUIRE(err.code == uint16_t(Seq::Error::Hardware::Transfer));
    REQUIRE(!driver.current_digest());
    REQUIRE(!driver.cached_state());
    REQUIRE(driver.card_session()->state() == State::Connected);
    REQUIRE(!card->running);
    REQUIRE(!card->dma_running);

    // Same program again must not be skipped and must reconfigure the card.
    fix.uploader.fail = false;
    REQUIRE(driver.plan_phase_compile_upload(prog2));
    REQUIRE(driver.current_digest() == prog2.digest());
    REQUIRE(card->nconfig == 2 * nconfig);
    REQUIRE(fix.uploader.calls.size() == 3);
    REQUIRE(driver.card_session()->state() == State::Uploaded);
}

TEST_CASE("rollback_compile_failure") {
    DriverFixture fix;
    auto &driver = fix.driver;
    auto prog = test_program();
    REQUIRE(driver.plan_phase_compile_upload(prog));

    fix.pipeline.on_compile = [] { throw std::runtime_error("Tone out of calibration range."); };
    auto err = expect_error<std::runtime_error>([&] {
        driver.plan_phase_compile_upload(prog, true);
    });
    REQUIRE(err.what() == "Tone out of calibration range."s);
    REQUIRE(!driver.current_digest());
    REQUIRE(driver.card_session()->state() == State::Connected);

    fix.pipeline.on_compile = nullptr;
    REQUIRE(driver.plan_phase_compile_upload(prog));
}

TEST_CASE("rollback_cleanup_failure") {
    DriverFixture fix;
    auto &driver = fix.driver;
    REQUIRE(driver.plan_phase_compile_upload(test_program()));
    auto card = fix.opener.card;
    fix.uploader.fail = true;
    // The DMA stop at the start of the upload succeeds, the one in the cleanup fails.
    fix.pipeline.on_compile = [&] { card->fail_stop = true; };
    auto err = expect_error<Seq::HardwareError>([&] {
        driver.plan_phase_compile_upload(test_program(), true);
    });
    REQUIRE(err.what() == "DMA transfer failed."s);
    REQUIRE(!driver.current_digest());
}

TEST_CASE("failure_before_hardware") {
    DriverFixture fix;
    auto &driver = fix.driver;
    auto prog = test_program();
    REQUIRE(driver.plan_phase_compile_upload(prog));
    auto card = fix.opener.card;
    auto nstops = card->nstops;

    fix.pipeline.on_quantize = [] { throw std::runtime_error("Segment too long."); };
    expect_error<std::runtime_error>([&] {
        driver.plan_phase_compile_upload(test_program({2, 1, 0}));
    });
    // The card was not touched so the resident program is still valid.
    REQUIRE(card->nstops == nstops);
    REQUIRE(card->running);
    REQUIRE(driver.current_digest() == prog.digest());
    REQUIRE(driver.card_session()->state() == State::Uploaded);
}

TEST_CASE("configure_failure") {
    DriverFixture fix;
    auto &driver = fix.driver;
    fix.opener.fail_config = true;
    auto err = expect_error<Seq::HardwareError>([&] {
        driver.plan_phase_compile_upload(test_program());
    });
    REQUIRE(err.what() == "Cannot set sample rate."s);
    REQUIRE(!driver.current_digest());
    REQUIRE(driver.card_session()->state() == State::Connected);
    REQUIRE(fix.uploader.calls.empty());

    fix.opener.card->fail_config = false;
    REQUIRE(driver.plan_phase_compile_upload(test_program()));
    REQUIRE(fix.opener.nopens == 1);
    REQUIRE(driver.card_session()->state() == State::Uploaded);
}

TEST_CASE("open_failure") {
    DriverFixture fix;
    auto &driver = fix.driver;
    fix.opener.fail_open = true;
    auto err = expect_error<Seq::HardwareError>([&] {
        driver.plan_phase_compile_upload(test_program());
    });
    REQUIRE(err.code == uint16_t(Seq::Error::Hardware::Open));
    REQUIRE(driver.card_session()->state() == State::Disconnected);
    fix.opener.fail_open = false;
    REQUIRE(driver.plan_phase_compile_upload(test_program()));
    REQUIRE(fix.opener.nopens == 2);
}

TEST_CASE("hotswap") {
    DriverFixture fix;
    auto &driver = fix.driver;
    auto prog = test_program();
    REQUIRE(driver.plan_phase_compile_upload(prog));
    auto card = fix.opener.card;
    auto before = card->segments;
    auto old_state = driver.cached_state();
    auto nsteps = card->nstep_writes;
    auto nstarts = card->nstarts;
    card->sample_rate = 999999;

    driver.hotswap_remap_src("rearrange", "H", {2, 0, 1});

    auto patched = test_program({2, 0, 1});
    REQUIRE(driver.current_digest() == patched.digest());
    REQUIRE(patched.digest() != prog.digest());
    REQUIRE(fix.pipeline.last_rate == 999999);
    REQUIRE(fix.pipeline.last_only == std::vector<uint32_t>{1});
    REQUIRE(fix.pipeline.last_seed == old_state->compiled.get());

    REQUIRE(fix.uploader.calls.size() == 2);
    auto &call = fix.uploader.calls.back();
    REQUIRE(call.has_prior);
    REQUIRE(call.only == std::vector<uint32_t>{1});
    REQUIRE(!call.upload_steps);

    REQUIRE(card->nstep_writes == nsteps);
    REQUIRE(card->nstarts == nstarts);
    REQUIRE(card->running);
    REQUIRE(card->segments[0] == before[0]);
    REQUIRE(card->segments[2] == before[2]);
    REQUIRE(card->segments[1] != before[1]);
    REQUIRE(card->segments[1].size() == before[1].size());

    auto state = driver.cached_state();
    REQUIRE(state != old_state);
    REQUIRE(state->compiled->segments[0] == old_state->compiled->segments[0]);
    REQUIRE(state->compiled->segments[2] == old_state->compiled->segments[2]);
    REQUIRE(state->compiled->steps == old_state->compiled->steps);
    REQUIRE(driver.card_session()->upload_session()->npatches == 1);

    // The patched program is the new baseline.
    REQUIRE(!driver.plan_phase_compile_upload(patched));
    REQUIRE(driver.plan_phase_compile_upload(prog));
}

TEST_CASE("hotswap_chain") {
    DriverFixture fix;
    auto &driver = fix.driver;
    REQUIRE(driver.plan_phase_compile_upload(test_program()));
    driver.hotswap_remap_src("rearrange", "H", {1, 0, 2});
    auto seed = driver.cached_state()->compiled.get();
    driver.hotswap_remap_src("rearrange", "H", {2, 1, 0});
    REQUIRE(fix.pipeline.last_seed == seed);
    REQUIRE(driver.current_digest() == test_program({2, 1, 0}).digest());
    REQUIRE(driver.card_session()->upload_session()->npatches == 2);
}

TEST_CASE("hotswap_shape_mismatch") {
    DriverFixture fix;
    auto &driver = fix.driver;
    auto prog = test_program();
    REQUIRE(driver.plan_phase_compile_upload(prog));
    auto ncalls = fix.pipeline.ncalls();
    auto state = driver.cached_state();

    auto err = expect_error<Seq::ShapeMismatchError>([&] {
        driver.hotswap_remap_src("rearrange", "H", {0, 1});
    });
    REQUIRE(err.expected == 3);
    REQUIRE(err.got == 2);
    REQUIRE(err.segment() == "rearrange");
    REQUIRE(err.what() ==
            "segment 'rearrange': Remap source length mismatch: expected 3, got 2."s);
    REQUIRE(fix.pipeline.ncalls() == ncalls);
    REQUIRE(fix.uploader.calls.size() == 1);
    REQUIRE(driver.cached_state() == state);
    REQUIRE(driver.current_digest() == prog.digest());
}

TEST_CASE("hotswap_lookup") {
    DriverFixture fix;
    auto &driver = fix.driver;
    REQUIRE(driver.plan_phase_compile_upload(test_program()));
    auto ncalls = fix.pipeline.ncalls();

    auto err = expect_error<Seq::LookupError>([&] {
        driver.hotswap_remap_src("unload", "H", {0, 1, 2});
    });
    REQUIRE(err.code == uint16_t(Seq::Error::Lookup::Segment));
    REQUIRE(err.what() == "Unknown segment 'unload'."s);

    err = expect_error<Seq::LookupError>([&] {
        driver.hotswap_remap_src("rearrange", "V", {0, 1, 2});
    });
    REQUIRE(err.code == uint16_t(Seq::Error::Lookup::Channel));
    REQUIRE(err.segment() == "rearrange");

    err = expect_error<Seq::LookupError>([&] {
        driver.hotswap_remap_src("init", "H", {0, 1, 2});
    });
    REQUIRE(err.code == uint16_t(Seq::Error::Lookup::Operation));
    REQUIRE(fix.pipeline.ncalls() == ncalls);
}

TEST_CASE("hotswap_tone_range") {
    DriverFixture fix;
    auto &driver = fix.driver;
    auto prog = test_program();
    REQUIRE(driver.plan_phase_compile_upload(prog));
    auto ncalls = fix.pipeline.ncalls();
    auto state = driver.cached_state();

    auto err = expect_error<Seq::LookupError>([&] {
        driver.hotswap_remap_src("rearrange", "H", {0, 1, 7});
    });
    REQUIRE(err.type == Seq::Error::Type::Lookup);
    REQUIRE(err.code == uint16_t(Seq::Error::Lookup::Definition));
    REQUIRE(err.segment() == "rearrange");
    REQUIRE(err.what() ==
            "segment 'rearrange': Source tone 7 out of range for definition traps."s);
    REQUIRE(fix.pipeline.ncalls() == ncalls);
    REQUIRE(fix.uploader.calls.size() == 1);
    REQUIRE(driver.cached_state() == state);
    REQUIRE(driver.current_digest() == prog.digest());
}

TEST_CASE("hotswap_buffer_length") {
    DriverFixture fix;
    auto &driver = fix.driver;
    auto prog = test_program();
    REQUIRE(driver.plan_phase_compile_upload(prog));
    auto card = fix.opener.card;
    auto state = driver.cached_state();
    auto old_size = state->compiled->segments[1]->samples.size();
    auto before = card->segments;
    // Doubling the rate doubles the quantized length of the segment.
    card->sample_rate = 2000000;

    auto err = expect_error<Seq::SessionStateError>([&] {
        driver.hotswap_remap_src("rearrange", "H", {2, 0, 1});
    });
    REQUIRE(err.code == uint16_t(Seq::Error::SessionState::Inconsistent));
    REQUIRE(err.segment() == "rearrange");
    REQUIRE(err.what() == "segment 'rearrange': Buffer length changed from " +
            std::to_string(old_size) + " to " + std::to_string(old_size * 2) + ".");
    REQUIRE(fix.pipeline.ncompile == 2);
    REQUIRE(fix.uploader.calls.size() == 1);
    REQUIRE(card->segments == before);
    REQUIRE(driver.cached_state() == state);
    REQUIRE(driver.current_digest() == prog.digest());
}

TEST_CASE("hotswap_preconditions") {
    DriverFixture fix;
    auto &driver = fix.driver;
    auto err = expect_error<Seq::SessionStateError>([&] {
        driver.hotswap_remap_src("rearrange", "H", {0, 1, 2});
    });
    REQUIRE(err.code == uint16_t(Seq::Error::SessionState::NoUpload));
    REQUIRE(fix.opener.nopens == 0);
    REQUIRE(fix.pipeline.ncalls() == 0);

    REQUIRE(driver.plan_phase_compile_upload(test_program()));
    driver.close_card();
    err = expect_error<Seq::SessionStateError>([&] {
        driver.hotswap_remap_src("rearrange", "H", {0, 1, 2});
    });
    REQUIRE(err.code == uint16_t(Seq::Error::SessionState::NoUpload));
}

TEST_CASE("hotswap_failure") {
    DriverFixture fix;
    auto &driver = fix.driver;
    auto prog = test_program();
    REQUIRE(driver.plan_phase_compile_upload(prog));
    auto state = driver.cached_state();
    auto card = fix.opener.card;
    auto before = card->segments;

    fix.pipeline.on_compile = [] { throw std::runtime_error("Phase seed mismatch."); };
    auto err = expect_error<Seq::PipelineError>([&] {
        driver.hotswap_remap_src("rearrange", "H", {2, 1, 0});
    });
    REQUIRE(err.segment() == "rearrange");
    REQUIRE(err.what() == "segment 'rearrange': Phase seed mismatch."s);
    REQUIRE(driver.cached_state() == state);
    REQUIRE(card->segments == before);
    REQUIRE(card->running);

    fix.pipeline.on_compile = nullptr;
    fix.uploader.fail = true;
    auto herr = expect_error<Seq::HardwareError>([&] {
        driver.hotswap_remap_src("rearrange", "H", {2, 1, 0});
    });
    REQUIRE(herr.segment() == "rearrange");
    REQUIRE(herr.what() == "segment 'rearrange': DMA transfer failed."s);
    REQUIRE(driver.cached_state() == state);
    REQUIRE(driver.card_session()->state() == State::Uploaded);

    fix.uploader.fail = false;
    driver.hotswap_remap_src("rearrange", "H", {2, 1, 0});
    REQUIRE(driver.current_digest() == test_program({2, 1, 0}).digest());
}

TEST_CASE("end_to_end") {
    DriverFixture fix;
    auto &driver = fix.driver;
    REQUIRE(driver.ping());
    auto prog = test_program();
    auto d1 = prog.digest();

    REQUIRE(driver.plan_phase_compile_upload(prog));
    auto card = fix.opener.card;
    auto nconfig = card->nconfig;
    REQUIRE(fix.uploader.calls.size() == 1);
    REQUIRE(driver.current_digest() == d1);

    auto nwrites = card->nsegment_writes;
    auto nsteps = card->nstep_writes;
    REQUIRE(!driver.plan_phase_compile_upload(prog));
    REQUIRE(card->nsegment_writes == nwrites);
    REQUIRE(card->nstep_writes == nsteps);

    driver.hotswap_remap_src("rearrange", "H", {0, 2, 1});
    auto d2 = *driver.current_digest();
    REQUIRE(d2 != d1);
    REQUIRE(card->nsegment_writes == nwrites + 1);
    REQUIRE(card->nstep_writes == nsteps);
    REQUIRE(card->nconfig == nconfig);

    expect_error<Seq::ShapeMismatchError>([&] {
        driver.hotswap_remap_src("rearrange", "H", {0, 1, 2, 3});
    });
    REQUIRE(driver.current_digest() == d2);
    REQUIRE(card->nsegment_writes == nwrites + 1);
}

TEST_CASE("card_control") {
    DriverFixture fix;
    auto &driver = fix.driver;

    REQUIRE(driver.get_current_step() == 0);
    REQUIRE(driver.card_session()->state() == State::Connected);
    auto err = expect_error<Seq::SessionStateError>([&] {
        driver.stop_start_card();
    });
    REQUIRE(err.code == uint16_t(Seq::Error::SessionState::NoUpload));

    REQUIRE(driver.plan_phase_compile_upload(test_program()));
    auto card = fix.opener.card;
    card->step = 2;
    REQUIRE(driver.get_current_step() == 2);
    driver.stop_start_card();
    REQUIRE(card->running);
    REQUIRE(driver.get_current_step() == 0);

    std::ostringstream stm;
    driver.print_card_info(stm);
    REQUIRE(stm.str() == "Product: DummyAWG, card status: running, step 0\n");
}

TEST_CASE("close") {
    DriverFixture fix;
    auto &driver = fix.driver;
    driver.close_card();
    REQUIRE(fix.opener.nopens == 0);

    auto prog = test_program();
    REQUIRE(driver.plan_phase_compile_upload(prog));
    driver.close_card();
    REQUIRE(!driver.current_digest());
    REQUIRE(driver.card_session()->state() == State::Disconnected);
    driver.close_card();

    // Reconnects and fully uploads the same program.
    REQUIRE(driver.plan_phase_compile_upload(prog));
    REQUIRE(fix.opener.nopens == 2);
    REQUIRE(fix.uploader.calls.size() == 2);
}

TEST_CASE("close_failure") {
    DriverFixture fix;
    auto &driver = fix.driver;
    REQUIRE(driver.plan_phase_compile_upload(test_program()));
    fix.opener.card->fail_stop = true;
    expect_error<Seq::HardwareError>([&] {
        driver.close_card();
    });
    REQUIRE(!driver.current_digest());
    REQUIRE(driver.card_session()->state() == State::Disconnected);
}

TEST_CASE("simulation") {
    DriverFixture fix(true);
    auto &driver = fix.driver;
    REQUIRE(!driver.card_session());
    auto prog = test_program();
    REQUIRE(driver.plan_phase_compile_upload(prog));
    REQUIRE(driver.current_digest() == prog.digest());
    REQUIRE(fix.pipeline.last_full_scale == Seq::Driver::simulation_full_scale);
    REQUIRE(fix.pipeline.last_rate == 1e6);
    REQUIRE(!driver.plan_phase_compile_upload(prog));
    REQUIRE(fix.pipeline.ncompile == 1);
    REQUIRE(driver.plan_phase_compile_upload(prog, true));
    REQUIRE(fix.pipeline.ncompile == 2);

    auto ncalls = fix.pipeline.ncalls();
    driver.hotswap_remap_src("rearrange", "H", {2, 1, 0});
    REQUIRE(fix.pipeline.ncalls() == ncalls);
    REQUIRE(driver.current_digest() == prog.digest());
    driver.stop_start_card();

    auto err = expect_error<Seq::SessionStateError>([&] {
        driver.get_current_step();
    });
    REQUIRE(err.code == uint16_t(Seq::Error::SessionState::Simulation));

    std::ostringstream stm;
    driver.print_card_info(stm);
    REQUIRE(stm.str() == "Simulation mode, no card attached.\n");

    driver.close_card();
    REQUIRE(!driver.current_digest());
    REQUIRE(fix.opener.nopens == 0);
    REQUIRE(fix.uploader.calls.empty());
}

TEST_CASE("construction") {
    FakePipeline pipeline;
    RecordingUploader uploader;
    TestOpener opener;
    auto conf = test_config();
    conf.physical_setup = "AWG_000_CALIB";
    auto err = expect_error<Seq::ConfigurationError>([&] {
        Seq::Driver(conf, Seq::SetupRegistry::builtin(), pipeline, uploader, &opener);
    });
    REQUIRE(err.what() == "Unknown physical setup 'AWG_000_CALIB'. Valid options: "
            "AWG_1145_CALIB, AWG_817_CALIB, AWG_938_CALIB"s);

    err = expect_error<Seq::ConfigurationError>([&] {
        Seq::Driver(test_config(), Seq::SetupRegistry::builtin(), pipeline, uploader, nullptr);
    });
    REQUIRE(err.code == uint16_t(Seq::Error::Configuration::MissingValue));
    REQUIRE(opener.nopens == 0);
}
