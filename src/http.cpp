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

#include "dockhand/http.hpp"

#include <cocaine/format.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <cctype>

using namespace dockhand;
using namespace dockhand::http;

namespace {

const std::string separator = "\r\n\r\n";
const std::string line_break = "\r\n";

const char* const methods[] = { "GET", "POST", "PUT", "DELETE", "HEAD" };

bool
is_known_method(const std::string& method) {
    return std::find(std::begin(methods), std::end(methods), method) != std::end(methods);
}

// Whitespace, control characters and anything outside of 7-bit ASCII would break the
// request line or the header block.
bool
is_token_safe(const std::string& value) {
    for(auto it = value.begin(); it != value.end(); ++it) {
        const unsigned char c = static_cast<unsigned char>(*it);

        if(c >= 0x80 || std::iscntrl(c) || std::isspace(c)) {
            return false;
        }
    }

    return true;
}

failure_t
preparation_failure(const std::string& reason) {
    return failure_t(error::request_preparation_failed, reason);
}

failure_t
framing_failure(const std::string& reason) {
    return failure_t(error::malformed_response, reason);
}

// HTTP/x.y NNN [reason]
boost::optional<int>
parse_status_line(const std::string& line) {
    if(line.size() < 12 || !boost::starts_with(line, "HTTP/")) {
        return boost::none;
    }

    if(!std::isdigit(static_cast<unsigned char>(line[5])) ||
       line[6] != '.' ||
       !std::isdigit(static_cast<unsigned char>(line[7])) ||
       line[8] != ' ')
    {
        return boost::none;
    }

    const std::string code = line.substr(9, 3);

    if(!std::all_of(code.begin(), code.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    })) {
        return boost::none;
    }

    if(line.size() > 12 && line[12] != ' ') {
        return boost::none;
    }

    return boost::lexical_cast<int>(code);
}

} // namespace

boost::optional<std::string>
http_headers_t::header(const std::string& key) const {
    for(auto it = m_headers.begin(); it != m_headers.end(); ++it) {
        if(boost::iequals(it->first, key)) {
            return boost::optional<std::string>(it->second);
        }
    }

    return boost::optional<std::string>();
}

void
http_headers_t::add_header(const std::string& key,
                           const std::string& value)
{
    m_headers.emplace_back(key, value);
}

void
http_headers_t::reset_header(const std::string& key,
                             const std::string& value)
{
    headers_vector_t new_headers;
    new_headers.reserve(m_headers.size() + 1);

    for(auto header = m_headers.begin(); header != m_headers.end(); ++header) {
        if(!boost::iequals(header->first, key)) {
            new_headers.push_back(*header);
        }
    }

    m_headers.swap(new_headers);

    add_header(key, value);
}

result_t<http_request_t>
http::make_request(const std::string& endpoint,
                   const std::string& method,
                   const std::string& body,
                   const std::string& host)
{
    if(endpoint.empty() || endpoint[0] != '/') {
        return preparation_failure(cocaine::format("endpoint '{}' must start with '/'", endpoint));
    }

    if(!is_token_safe(endpoint)) {
        return preparation_failure(cocaine::format("endpoint '{}' contains invalid characters", endpoint));
    }

    if(!is_known_method(method)) {
        return preparation_failure(cocaine::format("unsupported method '{}'", method));
    }

    if(host.empty() || !is_token_safe(host)) {
        return preparation_failure(cocaine::format("invalid host '{}'", host));
    }

    http_request_t request(method, endpoint, "1.1", http_headers_t(), body);

    request.headers().add_header("Host", host);
    request.headers().add_header("User-Agent", "dockhand");
    request.headers().add_header("Connection", "close");

    if(!body.empty() || method == "POST" || method == "PUT") {
        request.headers().reset_header("Content-Type", "application/json");
        request.headers().reset_header("Content-Length", boost::lexical_cast<std::string>(body.size()));
    }

    return request;
}

std::string
http::render(const http_request_t& request) {
    std::string result;
    result.reserve(request.uri().size() + request.body().size() + 128);

    result += request.method() + " " + request.uri() + " HTTP/" + request.http_version() + line_break;

    const auto& headers = request.headers().data();
    for(auto it = headers.begin(); it != headers.end(); ++it) {
        result += it->first + ": " + it->second + line_break;
    }

    result += line_break;
    result += request.body();

    return result;
}

result_t<std::string>
http::format_request(const std::string& endpoint,
                     const std::string& method,
                     const std::string& body,
                     const std::string& host)
{
    auto request = make_request(endpoint, method, body, host);

    if(!request) {
        return request.failure();
    }

    return render(request.value());
}

result_t<http_response_t>
http::parse_response(const std::string& raw) {
    if(raw.empty()) {
        return framing_failure("empty response");
    }

    const size_t delim = raw.find(separator);

    if(delim == std::string::npos) {
        return framing_failure("header and body separator not found");
    }

    const std::string head = raw.substr(0, delim);

    std::vector<std::string> lines;

    size_t begin = 0;
    while(begin <= head.size()) {
        size_t end = head.find(line_break, begin);

        if(end == std::string::npos) {
            end = head.size();
        }

        lines.push_back(head.substr(begin, end - begin));
        begin = end + line_break.size();
    }

    auto code = parse_status_line(lines.front());

    if(!code) {
        return framing_failure(cocaine::format("invalid status line '{}'", lines.front()));
    }

    http_response_t response;
    response.set_code(*code);

    for(auto it = lines.begin() + 1; it != lines.end(); ++it) {
        const size_t colon = it->find(':');

        if(colon == std::string::npos || colon == 0) {
            return framing_failure(cocaine::format("invalid header line '{}'", *it));
        }

        response.headers().add_header(
            boost::algorithm::trim_copy(it->substr(0, colon)),
            boost::algorithm::trim_copy(it->substr(colon + 1))
        );
    }

    response.body() = raw.substr(delim + separator.size());

    return response;
}

result_t<std::string>
http::extract_body(const std::string& raw) {
    auto response = parse_response(raw);

    if(!response) {
        return response.failure();
    }

    return std::move(response.value().body());
}

std::string
http::escape(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";

    std::string result;
    result.reserve(value.size());

    for(auto it = value.begin(); it != value.end(); ++it) {
        const unsigned char c = static_cast<unsigned char>(*it);

        if(std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            result.push_back(static_cast<char>(c));
        } else {
            result.push_back('%');
            result.push_back(hex[c >> 4]);
            result.push_back(hex[c & 0x0F]);
        }
    }

    return result;
}
