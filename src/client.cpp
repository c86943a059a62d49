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

#include "dockhand/client.hpp"

#include <cocaine/logging.hpp>

#include <blackhole/logger.hpp>

using namespace dockhand;

client_t::client_t(const config_t& config,
                   std::shared_ptr<logging::logger_t> logger) :
    client_t(std::make_shared<socket_transport_t>(endpoint_t::from_string(config.endpoint), logger),
             config,
             logger)
{
    COCAINE_LOG_INFO(logger, "docker client is bound to {}", config.endpoint);
}

client_t::client_t(const cocaine::dynamic_t& args,
                   std::shared_ptr<logging::logger_t> logger) :
    client_t(config_t::from_dynamic(args), std::move(logger))
{
    // pass
}

client_t::client_t(std::shared_ptr<transport_t> transport,
                   const config_t& config,
                   std::shared_ptr<logging::logger_t> logger) :
    m_api(std::make_shared<api_t>(std::move(transport), std::move(logger), config))
{
    // pass
}
