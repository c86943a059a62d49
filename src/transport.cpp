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

#include "dockhand/transport.hpp"

#include <cocaine/logging.hpp>

#include <blackhole/logger.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/asio.hpp>
#include <boost/lexical_cast.hpp>

#include <cctype>
#include <stdexcept>
#include <vector>

using namespace dockhand;

endpoint_t::endpoint_t() {
    // pass
}

endpoint_t::endpoint_t(const tcp_endpoint_t& e) :
    m_value(e)
{
    // pass
}

endpoint_t::endpoint_t(const unix_endpoint_t& e) :
    m_value(e)
{
    // pass
}

endpoint_t
endpoint_t::from_string(const std::string& endpoint) {
    if(endpoint.compare(0, 6, "tcp://") == 0) {
        size_t delim = endpoint.rfind(':');

        if(delim == std::string::npos || delim <= 6) {
            throw std::runtime_error("bad format of tcp endpoint '" + endpoint + "'");
        }

        try {
            return endpoint_t(tcp_endpoint_t(
                endpoint.substr(6, delim - 6),
                boost::lexical_cast<uint16_t>(endpoint.substr(delim + 1))
            ));
        } catch(const boost::bad_lexical_cast&) {
            throw std::runtime_error("bad port in tcp endpoint '" + endpoint + "'");
        }
    } else if(endpoint.compare(0, 7, "unix://") == 0) {
        if(endpoint.size() == 7) {
            throw std::runtime_error("bad format of unix endpoint '" + endpoint + "'");
        }

        return endpoint_t(endpoint.substr(7));
    } else {
        throw std::runtime_error("unknown endpoint scheme in '" + endpoint + "'");
    }
}

bool
endpoint_t::is_unix() const {
    return static_cast<bool>(boost::get<unix_endpoint_t>(&m_value));
}

bool
endpoint_t::is_tcp() const {
    return static_cast<bool>(boost::get<tcp_endpoint_t>(&m_value));
}

const std::string&
endpoint_t::get_host() const {
    return boost::get<tcp_endpoint_t>(m_value).first;
}

uint16_t
endpoint_t::get_port() const {
    return boost::get<tcp_endpoint_t>(m_value).second;
}

const std::string&
endpoint_t::get_path() const {
    return boost::get<unix_endpoint_t>(m_value);
}

namespace {
    struct to_string_visitor :
        public boost::static_visitor<std::string>
    {
        std::string
        operator()(const std::pair<std::string, uint16_t>& e) const {
            return "tcp://" + e.first + ":" + boost::lexical_cast<std::string>(e.second);
        }

        std::string
        operator()(const std::string& e) const {
            return "unix://" + e;
        }
    };

    const std::string separator = "\r\n\r\n";
    const std::string line_break = "\r\n";

    bool
    is_chunked(const std::string& line) {
        const auto colon = line.find(':');

        if(colon == std::string::npos) {
            return false;
        }

        if(!boost::iequals(boost::trim_copy(line.substr(0, colon)), "Transfer-Encoding")) {
            return false;
        }

        // The last applied coding is the one that frames the message.
        const std::string value = line.substr(colon + 1);

        std::vector<std::string> codings;
        boost::split(codings, value, boost::is_any_of(","));

        return boost::iequals(boost::trim_copy(codings.back()), "chunked");
    }

    // Chunk size is hexadecimal and may be followed by ";extensions".
    boost::optional<size_t>
    parse_chunk_size(const std::string& line, size_t limit) {
        const std::string digits = boost::trim_copy(line.substr(0, line.find(';')));

        if(digits.empty()) {
            return boost::none;
        }

        size_t size = 0;

        for(auto it = digits.begin(); it != digits.end(); ++it) {
            const unsigned char c = static_cast<unsigned char>(*it);

            if(!std::isxdigit(c)) {
                return boost::none;
            }

            size = size * 16 + (std::isdigit(c) ? c - '0' : std::tolower(c) - 'a' + 10);

            if(size > limit) {
                return boost::none;
            }
        }

        return size;
    }

    template<class Socket>
    boost::optional<std::string>
    exchange(Socket& socket,
             const std::string& request,
             const std::shared_ptr<logging::logger_t>& logger)
    {
        boost::system::error_code error;

        boost::asio::write(socket, boost::asio::buffer(request), error);

        if(error) {
            COCAINE_LOG_WARNING(logger, "unable to write request to docker: {}", error.message());
            return boost::none;
        }

        boost::asio::streambuf buffer;
        boost::asio::read(socket, buffer, error);

        if(error && error != boost::asio::error::eof) {
            COCAINE_LOG_WARNING(logger, "unable to read response from docker: {}", error.message());
            return boost::none;
        }

        std::string response(boost::asio::buffers_begin(buffer.data()),
                             boost::asio::buffers_end(buffer.data()));

        if(response.empty()) {
            COCAINE_LOG_WARNING(logger, "docker closed the connection without a response");
            return boost::none;
        }

        COCAINE_LOG_DEBUG(logger, "received {} bytes from docker", response.size());

        auto plain = dechunk(response);

        if(!plain) {
            COCAINE_LOG_WARNING(logger, "docker sent a chunked response with broken framing");
            return response;
        }

        return plain;
    }
} // namespace

std::string
endpoint_t::to_string() const {
    return boost::apply_visitor(to_string_visitor(), m_value);
}

boost::optional<std::string>
dockhand::dechunk(const std::string& raw) {
    const size_t header_end = raw.find(separator);

    if(header_end == std::string::npos) {
        return raw;
    }

    const std::string header_block = raw.substr(0, header_end);

    std::vector<std::string> lines;
    boost::iter_split(lines, header_block, boost::first_finder(line_break));

    std::string head;
    bool chunked = false;

    for(auto it = lines.begin(); it != lines.end(); ++it) {
        if(it != lines.begin() && is_chunked(*it)) {
            chunked = true;
        } else {
            head += *it + line_break;
        }
    }

    if(!chunked) {
        return raw;
    }

    std::string body;
    size_t offset = header_end + separator.size();

    while(true) {
        const size_t line_end = raw.find(line_break, offset);

        if(line_end == std::string::npos) {
            return boost::none;
        }

        auto size = parse_chunk_size(raw.substr(offset, line_end - offset), raw.size());

        if(!size) {
            return boost::none;
        }

        offset = line_end + line_break.size();

        // Trailers after the last chunk are dropped.
        if(*size == 0) {
            break;
        }

        if(raw.size() - offset < *size + line_break.size() ||
           raw.compare(offset + *size, line_break.size(), line_break) != 0)
        {
            return boost::none;
        }

        body.append(raw, offset, *size);
        offset += *size + line_break.size();
    }

    return head + "Content-Length: " + boost::lexical_cast<std::string>(body.size()) + separator + body;
}

socket_transport_t::socket_transport_t(const endpoint_t& endpoint,
                                       std::shared_ptr<logging::logger_t> logger) :
    m_endpoint(endpoint),
    m_logger(std::move(logger))
{
    // pass
}

boost::optional<std::string>
socket_transport_t::send(const std::string& request) {
    boost::asio::io_service ioservice;
    boost::system::error_code error;

    if(m_endpoint.is_unix()) {
        boost::asio::local::stream_protocol::socket socket(ioservice);

        COCAINE_LOG_DEBUG(m_logger, "creating a connection to {}", m_endpoint.get_path());

        socket.connect(boost::asio::local::stream_protocol::endpoint(m_endpoint.get_path()), error);

        if(error) {
            COCAINE_LOG_WARNING(m_logger, "connection to unix socket {} failed: {}",
                                m_endpoint.get_path(), error.message());
            return boost::none;
        }

        return exchange(socket, request, m_logger);
    } else {
        boost::asio::ip::tcp::resolver resolver(ioservice);
        boost::asio::ip::tcp::socket socket(ioservice);

        COCAINE_LOG_DEBUG(m_logger, "creating a connection to {}", m_endpoint.to_string());

        auto endpoints = resolver.resolve(
            boost::asio::ip::tcp::resolver::query(
                m_endpoint.get_host(),
                boost::lexical_cast<std::string>(m_endpoint.get_port())
            ),
            error
        );

        if(error) {
            COCAINE_LOG_WARNING(m_logger, "resolve of tcp address {} failed: {}",
                                m_endpoint.get_host(), error.message());
            return boost::none;
        }

        boost::asio::connect(socket, endpoints, error);

        if(error) {
            COCAINE_LOG_WARNING(m_logger, "connect to tcp address {} failed: {}",
                                m_endpoint.to_string(), error.message());
            return boost::none;
        }

        return exchange(socket, request, m_logger);
    }
}
