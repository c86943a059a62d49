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

#ifndef DOCKHAND_API_HPP
#define DOCKHAND_API_HPP

#include "dockhand/config.hpp"
#include "dockhand/result.hpp"
#include "dockhand/transport.hpp"

#include <cocaine/logging.hpp>

#include <memory>
#include <string>

namespace dockhand {

/// The single round trip every resource operation is built on: format the request, send it over
/// the transport and extract the response body.
///
/// Fails with exactly one of error::request_preparation_failed, error::no_response or
/// error::malformed_response, in that order of precedence, and stops at the first one.
class api_t {
public:
    api_t(std::shared_ptr<transport_t> transport,
          std::shared_ptr<logging::logger_t> logger,
          const config_t& config = config_t());

    result_t<std::string>
    call(const std::string& endpoint,
         const std::string& method,
         const std::string& body = std::string()) const;

    const std::shared_ptr<logging::logger_t>&
    logger() const {
        return m_logger;
    }

private:
    std::shared_ptr<transport_t> m_transport;
    std::shared_ptr<logging::logger_t> m_logger;

    std::string m_api_version;
    std::string m_host;
};

} // namespace dockhand

#endif // DOCKHAND_API_HPP
