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

#ifndef DOCKHAND_HTTP_HPP
#define DOCKHAND_HTTP_HPP

#include "dockhand/result.hpp"

#include <string>
#include <vector>
#include <memory>

#include <boost/optional.hpp>

namespace dockhand { namespace http {

class http_headers_t {
    typedef std::vector<std::pair<std::string, std::string>>
            headers_vector_t;

public:
    explicit
    http_headers_t(const headers_vector_t& headers = headers_vector_t()) :
        m_headers(headers)
    {
        // pass
    }

    http_headers_t(headers_vector_t&& headers) :
        m_headers(std::move(headers))
    {
        // pass
    }

    const headers_vector_t&
    data() const {
        return m_headers;
    }

    // First value of the header, names are compared case-insensitively.
    boost::optional<std::string>
    header(const std::string& key) const;

    // add new entry
    void
    add_header(const std::string& key,
               const std::string& value);

    // remove all previous 'key' entries and add the new one
    void
    reset_header(const std::string& key,
                 const std::string& value);

private:
    headers_vector_t m_headers;
};

struct http_request_t {
    http_request_t() {
        // pass
    }

    http_request_t(const std::string& method,
                   const std::string& uri,
                   const std::string& http_version,
                   const http_headers_t& headers,
                   const std::string& body) :
        m_method(method),
        m_uri(uri),
        m_version(http_version),
        m_headers(headers),
        m_body(body)
    {
        // pass
    }

    const std::string&
    method() const {
        return m_method;
    }

    const std::string&
    uri() const {
        return m_uri;
    }

    const std::string&
    http_version() const {
        return m_version;
    }

    const http_headers_t&
    headers() const {
        return m_headers;
    }

    http_headers_t&
    headers() {
        return m_headers;
    }

    const std::string&
    body() const {
        return m_body;
    }

    std::string&
    body() {
        return m_body;
    }

private:
    std::string m_method;
    std::string m_uri;
    std::string m_version;
    http_headers_t m_headers;
    std::string m_body;
};

struct http_response_t {
    http_response_t() :
        m_code(0)
    {
        // pass
    }

    http_response_t(int code,
                    const http_headers_t& headers,
                    const std::string& body) :
        m_code(code),
        m_headers(headers),
        m_body(body)
    {
        // pass
    }

    int
    code() const {
        return m_code;
    }

    void
    set_code(int code) {
        m_code = code;
    }

    const http_headers_t&
    headers() const {
        return m_headers;
    }

    http_headers_t&
    headers() {
        return m_headers;
    }

    const std::string&
    body() const {
        return m_body;
    }

    std::string&
    body() {
        return m_body;
    }

private:
    int m_code;
    http_headers_t m_headers;
    std::string m_body;
};

/// Validates the endpoint and the method and assembles a request with the headers the daemon
/// expects. Fails with error::request_preparation_failed.
///
/// The endpoint is the full request target, i.e. path plus an already encoded query string.
result_t<http_request_t>
make_request(const std::string& endpoint,
             const std::string& method,
             const std::string& body,
             const std::string& host = "localhost");

/// Serializes a request into a single transport-ready buffer: request line, header block,
/// blank line and the body appended verbatim.
std::string
render(const http_request_t& request);

/// make_request() followed by render().
result_t<std::string>
format_request(const std::string& endpoint,
               const std::string& method,
               const std::string& body,
               const std::string& host = "localhost");

/// Splits a raw response into status code, headers and body. Fails with
/// error::malformed_response when the input is empty, has no header/body separator, or its
/// status line or header block cannot be interpreted.
result_t<http_response_t>
parse_response(const std::string& raw);

/// Everything past the first header/body separator, exactly as received.
result_t<std::string>
extract_body(const std::string& raw);

// Percent-encodes everything outside of the RFC 3986 unreserved set.
std::string
escape(const std::string& value);

}} // namespace dockhand::http

#endif // DOCKHAND_HTTP_HPP
