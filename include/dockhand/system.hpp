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

#ifndef DOCKHAND_SYSTEM_HPP
#define DOCKHAND_SYSTEM_HPP

#include "dockhand/api.hpp"
#include "dockhand/result.hpp"

#include <memory>
#include <string>

namespace dockhand {

/// Daemon-wide information. Bodies are handed back as the daemon sent them, the caller decides
/// whether and how to decode the JSON.
class system_t {
public:
    explicit
    system_t(std::shared_ptr<api_t> api) :
        m_api(std::move(api))
    {
        // pass
    }

    // GET /info
    result_t<std::string>
    info() const;

    // GET /version
    result_t<std::string>
    version() const;

    // GET /_ping, the body is "OK" for a healthy daemon.
    result_t<std::string>
    ping() const;

private:
    std::shared_ptr<api_t> m_api;
};

} // namespace dockhand

#endif // DOCKHAND_SYSTEM_HPP
