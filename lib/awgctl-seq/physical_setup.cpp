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

#include "physical_setup.h"
#include "error.h"

#include "../awgctl-utils/log.h"

namespace AwgCtl::Seq {

static inline AWGCTL_NORETURN void invalid_setup(const std::string &name,
                                                 const std::string &msg)
{
    throw ConfigurationError(Error::Configuration::InvalidSetup, name + ": " + msg);
}

PhysicalSetup::PhysicalSetup(std::string name,
                             std::map<std::string,uint32_t> logical_to_hardware,
                             std::vector<AODSin2Calib> calibrations)
    : m_name(std::move(name)),
      m_logical_to_hardware(std::move(logical_to_hardware)),
      m_calibrations(std::move(calibrations))
{
    auto nchn = m_logical_to_hardware.size();
    if (nchn == 0)
        invalid_setup(m_name, "No logical channel.");
    if (nchn > 32)
        invalid_setup(m_name, "Too many channels.");
    std::vector<bool> used(nchn, false);
    for (auto &[logical, hw]: m_logical_to_hardware) {
        if (hw >= nchn)
            invalid_setup(m_name, "Hardware channel " + std::to_string(hw) + " for " +
                          logical + " out of range.");
        if (used[hw])
            invalid_setup(m_name, "Hardware channel " + std::to_string(hw) +
                          " mapped more than once.");
        used[hw] = true;
    }
    if (m_calibrations.size() != nchn)
        invalid_setup(m_name, "Expect " + std::to_string(nchn) + " calibrations, got " +
                      std::to_string(m_calibrations.size()) + ".");
    for (auto &calib: m_calibrations) {
        if (!(calib.freq_min_hz < calib.freq_max_hz)) {
            invalid_setup(m_name, "Invalid frequency range for calibration " +
                          calib.traceability + ".");
        }
    }
}

int PhysicalSetup::hardware_channel(const std::string &logical) const
{
    auto it = m_logical_to_hardware.find(logical);
    if (it == m_logical_to_hardware.end())
        return -1;
    return int(it->second);
}

uint32_t PhysicalSetup::channel_mask() const
{
    uint32_t mask = 0;
    for (uint32_t i = 0; i < nchannels(); i++)
        mask |= uint32_t(1) << i;
    return mask;
}

void PhysicalSetup::print(std::ostream &stm) const
{
    stm << m_name << ": " << nchannels() << " channel(s), mask 0x" << std::hex
        << channel_mask() << std::dec << std::endl;
    for (auto &[logical, hw]: m_logical_to_hardware) {
        auto &calib = m_calibrations[hw];
        stm << "  " << logical << " -> CH" << hw << ": "
            << calib.freq_min_hz / 1e6 << " - " << calib.freq_max_hz / 1e6 << " MHz";
        if (!calib.traceability.empty())
            stm << " [" << calib.traceability << "]";
        stm << std::endl;
    }
}

static AODSin2Calib parse_calib(const std::string &name, const YAML::Node &node)
{
    if (!node.IsMap())
        invalid_setup(name, "Calibration must be a map.");
    AODSin2Calib calib;
    auto required = [&] (const char *key) {
        auto v = node[key];
        if (!v)
            invalid_setup(name, std::string("Missing `") + key + "` in calibration.");
        return v;
    };
    calib.g_poly_high_to_low = required("g_poly_high_to_low").as<std::vector<double>>();
    calib.v0_a_poly_high_to_low = required("v0_a_poly_high_to_low").as<std::vector<double>>();
    calib.freq_min_hz = required("freq_min_hz").as<double>();
    calib.freq_max_hz = required("freq_max_hz").as<double>();
    if (auto v = node["traceability"])
        calib.traceability = v.as<std::string>();
    if (auto v = node["min_g"])
        calib.min_g = v.as<double>();
    if (auto v = node["min_v0_sq"])
        calib.min_v0_sq = v.as<double>();
    if (auto v = node["y_eps"])
        calib.y_eps = v.as<double>();
    return calib;
}

void SetupRegistry::load(const YAML::Node &node)
{
    if (!node.IsMap())
        throw ConfigurationError(Error::Configuration::InvalidSetup,
                                 "Physical setup registry must be a map.");
    // Parse everything before adding anything so that a bad document
    // doesn't leave the registry half updated.
    std::vector<std::shared_ptr<const PhysicalSetup>> setups;
    for (auto it: node) {
        std::string name;
        try {
            name = it.first.as<std::string>();
        }
        catch (const YAML::Exception&) {
            throw ConfigurationError(Error::Configuration::InvalidSetup,
                                     "Physical setup name must be a string.");
        }
        auto info = it.second;
        if (!info.IsMap())
            invalid_setup(name, "Expect `logical_to_hardware` and `channels` keys.");
        auto map_node = info["logical_to_hardware"];
        if (!map_node || !map_node.IsMap())
            invalid_setup(name, "Missing or invalid `logical_to_hardware`.");
        auto chns_node = info["channels"];
        if (!chns_node || !chns_node.IsSequence())
            invalid_setup(name, "Missing or invalid `channels`.");
        std::map<std::string,uint32_t> logical_to_hardware;
        try {
            for (auto chn: map_node) {
                logical_to_hardware.emplace(chn.first.as<std::string>(),
                                            chn.second.as<uint32_t>());
            }
        }
        catch (const YAML::Exception &err) {
            invalid_setup(name, std::string("Invalid channel map: ") + err.what());
        }
        std::vector<AODSin2Calib> calibs;
        try {
            for (auto calib: chns_node) {
                calibs.push_back(parse_calib(name, calib));
            }
        }
        catch (const YAML::Exception &err) {
            invalid_setup(name, std::string("Invalid calibration: ") + err.what());
        }
        setups.push_back(std::make_shared<PhysicalSetup>(name, std::move(logical_to_hardware),
                                                         std::move(calibs)));
    }
    for (auto &setup: setups) {
        add(std::move(setup));
    }
}

void SetupRegistry::load_file(const char *fname)
{
    YAML::Node node;
    try {
        node = YAML::LoadFile(fname);
    }
    catch (const YAML::Exception &err) {
        throw ConfigurationError(Error::Configuration::InvalidSetup,
                                 std::string("Cannot load ") + fname + ": " + err.what());
    }
    load(node);
}

void SetupRegistry::load_string(const char *str)
{
    YAML::Node node;
    try {
        node = YAML::Load(str);
    }
    catch (const YAML::Exception &err) {
        throw ConfigurationError(Error::Configuration::InvalidSetup,
                                 std::string("Cannot parse setup registry: ") + err.what());
    }
    load(node);
}

void SetupRegistry::add(std::shared_ptr<const PhysicalSetup> setup)
{
    auto &slot = m_setups[setup->name()];
    if (slot)
        awgWarn("Replacing physical setup %s\n", setup->name().c_str());
    slot = std::move(setup);
}

std::shared_ptr<const PhysicalSetup> SetupRegistry::get(const std::string &name) const
{
    auto it = m_setups.find(name);
    if (it != m_setups.end())
        return it->second;
    std::string valid;
    for (auto &[key, setup]: m_setups) {
        if (!valid.empty())
            valid += ", ";
        valid += key;
    }
    throw ConfigurationError(Error::Configuration::UnknownSetup,
                             "Unknown physical setup '" + name + "'. Valid options: " + valid);
}

std::vector<std::string> SetupRegistry::names() const
{
    std::vector<std::string> res;
    for (auto &[key, setup]: m_setups)
        res.push_back(key);
    return res;
}

AWGCTL_EXPORT() const SetupRegistry &SetupRegistry::builtin()
{
    static const SetupRegistry registry = [] {
        SetupRegistry res;
        // 814 nm H/V pair, fitted 17.02.2022
        res.add(std::make_shared<PhysicalSetup>(
                    "AWG_817_CALIB", std::map<std::string,uint32_t>{{"H", 0}, {"V", 1}},
                    std::vector<AODSin2Calib>{
                        {{0.4090989912253647, 0.2018618742515838, -0.9215927915167634,
                          -0.4412476500516808, -0.1906036583947077, -0.03972136086542679,
                          1.177618710972786},
                         {-206.7523109846387, -51.19251677219333, 328.8140960804296,
                          66.80024091181865, -142.5622869379855, -11.97940312739627,
                          199.7834400057718},
                         80e6, 120e6, "examples/calibrations/814_H_calFile_17.02.2022_0=0.txt"},
                        {{0.1476077059082392, -0.03982795249054526, -0.6737338878355211,
                          -0.02778152984507814, 0.3370885748323629, 0.02326850145597811,
                          0.9935230408830742},
                         {-155.0879927769708, -49.22556216836927, 253.8100155943833,
                          63.78042793848495, -98.59810691776225, -12.31066136792399,
                          151.8124648021865},
                         80e6, 120e6, "examples/calibrations/814_V_calFile_17.02.2022_0=0.txt"}}));
        res.add(std::make_shared<PhysicalSetup>(
                    "AWG_938_CALIB", std::map<std::string,uint32_t>{{"H", 0}},
                    std::vector<AODSin2Calib>{
                        {{3.538826714549613, 5.312443088870038, -0.04736469375881174,
                          -4.824428845570577, -4.545263097686731, 0.7659317524132674,
                          2.386968689643068},
                         {-3904.371247207825, 553.4946879703813, 5822.427228628258,
                          209.2972708093259, -1189.579569913762, 49.98357276909121,
                          273.4502137609406},
                         90e6, 246.5e6,
                         "examples/calibrations/AWG1_calibration_22_02_2023_90MHz_255MHz.awgde"}}));
        res.add(std::make_shared<PhysicalSetup>(
                    "AWG_1145_CALIB", std::map<std::string,uint32_t>{{"H", 0}},
                    std::vector<AODSin2Calib>{
                        {{-0.8754904123674585, 0.01908417521116575, 2.746368559542769,
                          0.354430567446119, -3.0483222669169, -0.5073342883236134,
                          1.384480548700198},
                         {195.3448675907807, 116.7738888023813, -242.9455379699489,
                          -166.6070725616716, 26.10215046803684, 66.14371171486478,
                          376.4358129178906},
                         85e6, 135e6,
                         "examples/calibrations/AWG3_calibration_04_10_2024_98MHz_118MHz.awgde"}}));
        return res;
    }();
    return registry;
}

}
