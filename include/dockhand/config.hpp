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

#ifndef DOCKHAND_CONFIG_HPP
#define DOCKHAND_CONFIG_HPP

#include <cocaine/dynamic.hpp>

#include <string>

namespace dockhand {

struct config_t {
    config_t();

    /// Reads the client section:
    ///
    ///     {
    ///         "endpoint": "unix:///var/run/docker.sock",
    ///         "api-version": "v1.37",
    ///         "host": "localhost"
    ///     }
    ///
    /// Every key is optional. Throws std::system_error if the section is not an object or a
    /// value has the wrong type.
    static
    config_t
    from_dynamic(const cocaine::dynamic_t& args);

    // Where the daemon listens, unix:///path or tcp://host:port.
    std::string endpoint;

    // Prefixed to every endpoint as "/<api_version>" when not empty.
    std::string api_version;

    // Value of the Host header.
    std::string host;
};

} // namespace dockhand

#endif // DOCKHAND_CONFIG_HPP
