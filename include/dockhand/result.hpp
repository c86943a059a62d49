/*
    Copyright (c) 2026 Dockhand authors
    Copyright (c) 2026 Other contributors as noted in the AUTHORS file.

    This file is part of Dockhand.

    Dockhand is free software; you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation; either version 3 of the License, or
    (at your option) any later version.

    Dockhand is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef DOCKHAND_RESULT_HPP
#define DOCKHAND_RESULT_HPP

#include "dockhand/errors.hpp"

#include <boost/variant.hpp>

#include <string>
#include <system_error>
#include <utility>

namespace dockhand {

/// Failure kind together with the diagnostic text of whatever produced it.
class failure_t {
public:
    failure_t(std::error_code code,
              std::string reason = std::string()) :
        m_code(code),
        m_reason(std::move(reason))
    {
        // pass
    }

    const std::error_code&
    code() const {
        return m_code;
    }

    const std::string&
    reason() const {
        return m_reason;
    }

    // "<kind message>: <reason>", or only the kind message when there is no reason.
    std::string
    message() const {
        if(m_reason.empty()) {
            return m_code.message();
        }

        return m_code.message() + ": " + m_reason;
    }

private:
    std::error_code m_code;
    std::string m_reason;
};

/// Either a value of type T or the failure that prevented producing it.
///
/// Nothing here throws except value(), which is the explicit "I know it succeeded" accessor.
template<class T>
class result_t {
public:
    typedef T value_type;

    result_t(const T& value) :
        m_value(value)
    {
        // pass
    }

    result_t(T&& value) :
        m_value(std::move(value))
    {
        // pass
    }

    result_t(const failure_t& failure) :
        m_value(failure)
    {
        // pass
    }

    result_t(failure_t&& failure) :
        m_value(std::move(failure))
    {
        // pass
    }

    bool
    has_value() const {
        return boost::get<T>(&m_value) != nullptr;
    }

    explicit
    operator bool() const {
        return has_value();
    }

    const T&
    value() const {
        if(const T* value = boost::get<T>(&m_value)) {
            return *value;
        }

        const failure_t& failure = boost::get<failure_t>(m_value);
        throw std::system_error(failure.code(), failure.reason());
    }

    T&
    value() {
        if(T* value = boost::get<T>(&m_value)) {
            return *value;
        }

        const failure_t& failure = boost::get<failure_t>(m_value);
        throw std::system_error(failure.code(), failure.reason());
    }

    // Throws boost::bad_get when called on a successful result.
    const failure_t&
    failure() const {
        return boost::get<failure_t>(m_value);
    }

    // Empty error code on success.
    std::error_code
    error() const {
        if(const failure_t* failure = boost::get<failure_t>(&m_value)) {
            return failure->code();
        }

        return std::error_code();
    }

private:
    boost::variant<T, failure_t> m_value;
};

} // namespace dockhand

#endif // DOCKHAND_RESULT_HPP
