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

#include "dockhand/config.hpp"

#include <cocaine/dynamic.hpp>

#include <system_error>

using namespace dockhand;

using cocaine::dynamic_t;

namespace {

std::string
string_option(const dynamic_t::object_t& args,
              const std::string& key,
              const std::string& fallback)
{
    const dynamic_t value = args.at(key, fallback);

    if(!value.is_string()) {
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                                "docker client option '" + key + "' must be a string");
    }

    return value.as_string();
}

} // namespace

config_t::config_t() :
    endpoint("unix:///var/run/docker.sock"),
    host("localhost")
{
    // pass
}

config_t
config_t::from_dynamic(const dynamic_t& args) {
    config_t config;

    if(args.is_null()) {
        return config;
    }

    if(!args.is_object()) {
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                                "docker client configuration must be an object");
    }

    const auto& object = args.as_object();

    config.endpoint    = string_option(object, "endpoint", config.endpoint);
    config.api_version = string_option(object, "api-version", config.api_version);
    config.host        = string_option(object, "host", config.host);

    return config;
}
