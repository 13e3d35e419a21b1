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

#include "error.h"

namespace AwgCtl::Seq {

Error::Error(Type type, uint16_t code, const char *what)
    : std::runtime_error(what),
      type(type),
      code(code),
      m_what(what)
{
}

Error::Error(Type type, uint16_t code, const std::string &what)
    : std::runtime_error(what),
      type(type),
      code(code),
      m_what(what)
{
}

Error::Error(const Error &other)
    : std::runtime_error(other),
      type(other.type),
      code(other.code),
      m_segment(other.m_segment),
      m_what(other.m_what)
{
}

Error &Error::operator=(const Error &other)
{
    std::runtime_error::operator=(other);
    type = other.type;
    code = other.code;
    m_segment = other.m_segment;
    m_what = other.m_what;
    return *this;
}

Error::~Error()
{
}

const char *Error::what() const noexcept
{
    return m_what.c_str();
}

void Error::set_segment(std::string name)
{
    if (!m_segment.empty())
        return;
    m_segment = std::move(name);
    m_what = "segment '" + m_segment + "': " + std::runtime_error::what();
}

ConfigurationError::ConfigurationError(Configuration code, const std::string &what)
    : Error(Type::Configuration, code, what)
{
}

ConfigurationError::~ConfigurationError()
{
}

HardwareError::HardwareError(Hardware code, const std::string &what)
    : Error(Type::Hardware, code, what)
{
}

HardwareError::~HardwareError()
{
}

SessionStateError::SessionStateError(SessionState code, const std::string &what)
    : Error(Type::SessionState, code, what)
{
}

SessionStateError::~SessionStateError()
{
}

ShapeMismatchError::ShapeMismatchError(size_t expected, size_t got, const std::string &what)
    : Error(Type::ShapeMismatch, uint16_t(0), what),
      expected(expected),
      got(got)
{
}

ShapeMismatchError::~ShapeMismatchError()
{
}

LookupError::LookupError(Lookup code, const std::string &what)
    : Error(Type::Lookup, code, what)
{
}

LookupError::~LookupError()
{
}

PipelineError::PipelineError(const std::string &what)
    : Error(Type::Pipeline, uint16_t(0), what)
{
}

PipelineError::~PipelineError()
{
}

AWGCTL_EXPORT() const char *type_name(Error::Type type)
{
    switch (type) {
    case Error::Type::None:
        return "none";
    case Error::Type::Configuration:
        return "configuration";
    case Error::Type::Hardware:
        return "hardware";
    case Error::Type::SessionState:
        return "session state";
    case Error::Type::ShapeMismatch:
        return "shape mismatch";
    case Error::Type::Lookup:
        return "lookup";
    case Error::Type::Pipeline:
        return "pipeline";
    }
    return "unknown";
}

}
