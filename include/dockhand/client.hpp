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

#ifndef DOCKHAND_CLIENT_HPP
#define DOCKHAND_CLIENT_HPP

#include "dockhand/api.hpp"
#include "dockhand/config.hpp"
#include "dockhand/containers.hpp"
#include "dockhand/images.hpp"
#include "dockhand/system.hpp"
#include "dockhand/transport.hpp"

#include <cocaine/dynamic.hpp>
#include <cocaine/logging.hpp>

#include <memory>

namespace dockhand {

/// Entry point of the library.
///
///     dockhand::client_t client(dockhand::config_t(), log);
///
///     auto containers = client.containers().list_all(5);
///
///     if(!containers) {
///         COCAINE_LOG_ERROR(log, "{}", containers.failure().message());
///     }
class client_t {
public:
    /// Talks to the daemon at config.endpoint over a socket. Throws std::runtime_error when the
    /// endpoint cannot be parsed.
    client_t(const config_t& config,
             std::shared_ptr<logging::logger_t> logger);

    /// Same, with the configuration read by config_t::from_dynamic().
    client_t(const cocaine::dynamic_t& args,
             std::shared_ptr<logging::logger_t> logger);

    /// Uses the given transport instead of opening sockets, config.endpoint is ignored.
    client_t(std::shared_ptr<transport_t> transport,
             const config_t& config,
             std::shared_ptr<logging::logger_t> logger);

    containers_t
    containers() const {
        return containers_t(m_api);
    }

    images_t
    images() const {
        return images_t(m_api);
    }

    system_t
    system() const {
        return system_t(m_api);
    }

    const std::shared_ptr<api_t>&
    api() const {
        return m_api;
    }

private:
    std::shared_ptr<api_t> m_api;
};

} // namespace dockhand

#endif // DOCKHAND_CLIENT_HPP
