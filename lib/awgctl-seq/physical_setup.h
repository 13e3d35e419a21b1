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

#ifndef __AWGCTL_SEQ_PHYSICAL_SETUP_H__
#define __AWGCTL_SEQ_PHYSICAL_SETUP_H__

#include "../awgctl-utils/utils.h"

#include <yaml-cpp/yaml.h>

#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace AwgCtl::Seq {

// Optical power calibration of one deflector channel.
// The coefficients are only carried around, the model is evaluated by the synthesizer.
struct AODSin2Calib {
    std::vector<double> g_poly_high_to_low;
    std::vector<double> v0_a_poly_high_to_low;
    double freq_min_hz;
    double freq_max_hz;
    std::string traceability;
    double min_g = 1e-12;
    double min_v0_sq = 1e-9;
    double y_eps = 1e-6;
};

class AWGCTL_EXPORT() PhysicalSetup {
public:
    PhysicalSetup(std::string name, std::map<std::string,uint32_t> logical_to_hardware,
                  std::vector<AODSin2Calib> calibrations);

    const std::string &name() const
    {
        return m_name;
    }
    uint32_t nchannels() const
    {
        return uint32_t(m_logical_to_hardware.size());
    }
    const std::map<std::string,uint32_t> &logical_to_hardware() const
    {
        return m_logical_to_hardware;
    }
    // Return `-1` for unknown channel.
    int hardware_channel(const std::string &logical) const;
    // Indexed by hardware channel.
    const std::vector<AODSin2Calib> &calibrations() const
    {
        return m_calibrations;
    }
    // Mask of the hardware channels to enable on the card.
    uint32_t channel_mask() const;

    void print(std::ostream &stm) const;

private:
    const std::string m_name;
    const std::map<std::string,uint32_t> m_logical_to_hardware;
    const std::vector<AODSin2Calib> m_calibrations;
};

/**
 * Calibration profile identifier -> physical setup.
 *
 * Setups are immutable and shared with every driver that looks them up.
 */
class AWGCTL_EXPORT() SetupRegistry {
public:
    SetupRegistry() = default;

    // The profiles of the apparatus.
    static const SetupRegistry &builtin();

    // ```
    // AWG_938_CALIB:
    //   logical_to_hardware: {H: 0}
    //   channels:
    //     - g_poly_high_to_low: [...]
    //       v0_a_poly_high_to_low: [...]
    //       freq_min_hz: 90e6
    //       freq_max_hz: 246.5e6
    //       traceability: "..."
    // ```
    void load(const YAML::Node &node);
    void load_file(const char *fname);
    void load_string(const char *str);
    void add(std::shared_ptr<const PhysicalSetup> setup);

    // Throws `ConfigurationError` listing the valid names if `name` is unknown.
    std::shared_ptr<const PhysicalSetup> get(const std::string &name) const;
    std::vector<std::string> names() const;
    size_t size() const
    {
        return m_setups.size();
    }

private:
    std::map<std::string,std::shared_ptr<const PhysicalSetup>> m_setups;
};

}

#endif
