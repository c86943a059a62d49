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

#include "dockhand/errors.hpp"

namespace dockhand { namespace error {

std::string
docker_category_t::message(int ec) const noexcept {
    switch (ec) {
    case request_preparation_failed:
        return "error while preparing request";
    case no_response:
        return "got no response from docker host";
    case malformed_response:
        return "response body was not valid";
    case decode_failed:
        return "error while deserializing JSON response";
    case encode_failed:
        return "error while serializing request body";
    default:
        break;
    }

    return std::string(name()) + ": " + std::to_string(ec);
}

const std::error_category&
docker_category() {
    static docker_category_t category;
    return category;
}

std::error_code
make_error_code(docker_errors err) {
    return std::error_code(static_cast<int>(err), docker_category());
}

}} // namespace dockhand::error
