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

#ifndef DOCKHAND_TRANSPORT_HPP
#define DOCKHAND_TRANSPORT_HPP

#include <cocaine/logging.hpp>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace dockhand {

namespace logging = cocaine::logging;

class endpoint_t {
public:
    typedef std::pair<std::string, uint16_t>
            tcp_endpoint_t;

    typedef std::string
            unix_endpoint_t;

    // unix:///var/run/docker.sock or tcp://host:port, throws std::runtime_error otherwise.
    static
    endpoint_t
    from_string(const std::string& endpoint);

    endpoint_t();

    endpoint_t(const tcp_endpoint_t& e);

    endpoint_t(const unix_endpoint_t& e);

    bool
    is_unix() const;

    bool
    is_tcp() const;

    const std::string&
    get_host() const;

    uint16_t
    get_port() const;

    const std::string&
    get_path() const;

    std::string
    to_string() const;

private:
    typedef boost::variant<unix_endpoint_t, tcp_endpoint_t>
            variant_t;

    variant_t m_value;
};

/// Rewrites a reply sent with "Transfer-Encoding: chunked" into one carrying the reassembled body
/// and a Content-Length header. Other replies are returned unchanged. An empty optional means the
/// chunked framing is broken.
boost::optional<std::string>
dechunk(const std::string& raw);

/// Sends one fully formatted request and hands back whatever the daemon answered.
///
/// An empty optional means no response was obtained at all. A returned value is never empty.
class transport_t {
public:
    virtual
   ~transport_t() {
        // pass
    }

    virtual
    boost::optional<std::string>
    send(const std::string& request) = 0;
};

/// Opens a new stream socket for every request, writes the request in full and reads until the
/// daemon closes the connection. Chunked replies are reassembled before being returned. Holds no per-request state, so concurrent sends are independent.
class socket_transport_t:
    public transport_t
{
public:
    socket_transport_t(const endpoint_t& endpoint,
                       std::shared_ptr<logging::logger_t> logger);

    virtual
    boost::optional<std::string>
    send(const std::string& request);

    const endpoint_t&
    endpoint() const {
        return m_endpoint;
    }

private:
    endpoint_t m_endpoint;
    std::shared_ptr<logging::logger_t> m_logger;
};

} // namespace dockhand

#endif // DOCKHAND_TRANSPORT_HPP
