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

#include "dockhand/api.hpp"
#include "dockhand/http.hpp"

#include <cocaine/logging.hpp>

#include <blackhole/logger.hpp>

using namespace dockhand;

api_t::api_t(std::shared_ptr<transport_t> transport,
             std::shared_ptr<logging::logger_t> logger,
             const config_t& config) :
    m_transport(std::move(transport)),
    m_logger(std::move(logger)),
    m_api_version(config.api_version),
    m_host(config.host)
{
    // pass
}

result_t<std::string>
api_t::call(const std::string& endpoint,
            const std::string& method,
            const std::string& body) const
{
    std::string target = endpoint;

    // Malformed endpoints are passed through untouched so that the formatter rejects them.
    if(!m_api_version.empty() && !endpoint.empty() && endpoint[0] == '/') {
        target = "/" + m_api_version + endpoint;
    }

    auto request = http::format_request(target, method, body, m_host);

    if(!request) {
        COCAINE_LOG_WARNING(m_logger, "unable to prepare {} request to {}: {}",
                            method, target, request.failure().reason());
        return request.failure();
    }

    COCAINE_LOG_DEBUG(m_logger, "sending {} {} to docker, body is {} bytes", method, target, body.size());

    auto raw = m_transport->send(request.value());

    if(!raw) {
        COCAINE_LOG_WARNING(m_logger, "got no response from docker for {} {}", method, target);
        return failure_t(error::no_response);
    }

    auto response = http::parse_response(*raw);

    if(!response) {
        COCAINE_LOG_WARNING(m_logger, "unable to parse response for {} {}: {}",
                            method, target, response.failure().reason());
        return response.failure();
    }

    const int code = response.value().code();

    if(code >= 200 && code < 400) {
        COCAINE_LOG_DEBUG(m_logger, "docker replied with code {}", code);
    } else {
        COCAINE_LOG_WARNING(m_logger, "{} {}: docker replied with code {} and body '{}'",
                            method, target, code, response.value().body());
    }

    return std::move(response.value().body());
}
