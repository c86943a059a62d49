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

#ifndef DOCKHAND_ERRORS_HPP
#define DOCKHAND_ERRORS_HPP

#include <cstddef>
#include <string>
#include <system_error>

namespace dockhand { namespace error {

/// Every failure a docker API call can end with.
///
/// The first three are produced by the call contract itself and are mutually exclusive, the last
/// two are produced by the resource layer around it.
enum docker_errors {
    request_preparation_failed = 1,
    no_response,
    malformed_response,
    decode_failed,
    encode_failed
};

struct docker_category_t : public std::error_category {
    constexpr static size_t
    id() {
        return 0x50ff;
    }

    const char*
    name() const noexcept {
        return "docker category";
    }

    std::string
    message(int ec) const noexcept;
};

const std::error_category&
docker_category();

std::error_code
make_error_code(docker_errors err);

}} // namespace dockhand::error

namespace std {

/// Extends the type trait std::is_error_code_enum to identify `docker_errors` error codes.
template<>
struct is_error_code_enum<dockhand::error::docker_errors> : public true_type {};

} // namespace std

#endif // DOCKHAND_ERRORS_HPP
