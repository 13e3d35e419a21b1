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

#ifndef __AWGCTL_SEQ_ERROR_H__
#define __AWGCTL_SEQ_ERROR_H__

#include "../awgctl-utils/utils.h"

#include <stdexcept>
#include <string>
#include <type_traits>

namespace AwgCtl::Seq {

struct AWGCTL_EXPORT() Error : std::runtime_error {
    enum class Type : uint8_t {
        None,
        Configuration,
        Hardware,
        SessionState,
        ShapeMismatch,
        Lookup,
        Pipeline,
    };
    enum class Configuration : uint8_t {
        UnknownSetup,
        InvalidSetup,
        InvalidValue,
        MissingValue,
        InvalidProgram,
    };
    enum class Hardware : uint8_t {
        Open,
        Config,
        Command,
        Transfer,
        Query,
    };
    enum class SessionState : uint8_t {
        NoUpload,
        NoCache,
        NoPhaseSeed,
        NotConnected,
        Simulation,
        Inconsistent,
    };
    enum class Lookup : uint8_t {
        Segment,
        Operation,
        Channel,
        Definition,
    };

    Error(Type type, uint16_t code, const char *what);
    Error(Type type, uint16_t code, const std::string &what);
    template<typename Code,
             typename=std::enable_if_t<!std::is_same_v<
                 std::remove_cv_t<std::remove_reference_t<Code>>,uint16_t>>>
    Error(Type type, Code code, const std::string &what)
        : Error(type, uint16_t(code), what)
    {}
    Error(const Error&);
    Error &operator=(const Error&);
    ~Error() override;

    const char *what() const noexcept override;
    // Attribute the error to a segment of the program.
    // Annotating an in-flight exception caught by reference keeps its dynamic type.
    void set_segment(std::string name);
    const std::string &segment() const
    {
        return m_segment;
    }

    Type type;
    uint16_t code;

private:
    std::string m_segment;
    std::string m_what;
};

struct AWGCTL_EXPORT() ConfigurationError : Error {
    ConfigurationError(Configuration code, const std::string &what);
    ~ConfigurationError() override;
};

struct AWGCTL_EXPORT() HardwareError : Error {
    HardwareError(Hardware code, const std::string &what);
    ~HardwareError() override;
};

struct AWGCTL_EXPORT() SessionStateError : Error {
    SessionStateError(SessionState code, const std::string &what);
    ~SessionStateError() override;
};

struct AWGCTL_EXPORT() ShapeMismatchError : Error {
    ShapeMismatchError(size_t expected, size_t got, const std::string &what);
    ~ShapeMismatchError() override;

    size_t expected;
    size_t got;
};

struct AWGCTL_EXPORT() LookupError : Error {
    LookupError(Lookup code, const std::string &what);
    ~LookupError() override;
};

// A non-`Error` exception raised by a pipeline collaborator,
// rewrapped so that the failing segment can be reported.
struct AWGCTL_EXPORT() PipelineError : Error {
    PipelineError(const std::string &what);
    ~PipelineError() override;
};

const char *type_name(Error::Type type);

}

#endif
