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

#ifndef DOCKHAND_CONTAINERS_HPP
#define DOCKHAND_CONTAINERS_HPP

#include "dockhand/api.hpp"
#include "dockhand/result.hpp"

#include <boost/optional.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dockhand {

typedef std::map<std::string, std::string> labels_t;

struct port_t {
    std::string ip;
    uint32_t private_port;
    uint32_t public_port;
    std::string type;
};

struct mount_t {
    std::string name;
    std::string source;
    std::string destination;
    std::string driver;
    std::string mode;
    bool rw;
    std::string propagation;
};

/// One entry of GET /containers/json.
struct container_t {
    std::string id;
    std::vector<std::string> names;
    std::string image;
    std::string image_id;
    std::string command;
    int64_t created;
    std::string state;
    std::string status;
    std::vector<port_t> ports;
    boost::optional<labels_t> labels;
    boost::optional<uint64_t> size_rw;
    uint64_t size_root_fs;
    std::string network_mode;
    std::vector<mount_t> mounts;
};

/// Body of POST /containers/create. Everything but the image and the command may stay at its
/// default, which is an empty value or false.
struct container_config_t {
    container_config_t() :
        attach_stdin(false),
        attach_stdout(false),
        attach_stderr(false),
        tty(false),
        open_stdin(false),
        stdin_once(false)
    {
        // pass
    }

    std::string image;
    std::vector<std::string> cmd;

    std::string hostname;
    std::string domainname;
    std::string user;
    bool attach_stdin;
    bool attach_stdout;
    bool attach_stderr;
    bool tty;
    bool open_stdin;
    bool stdin_once;
    std::vector<std::string> env;
    std::string entrypoint;
    boost::optional<labels_t> labels;
    std::string working_dir;
};

/// Starts from the default configuration and applies only what was asked for.
class container_config_builder_t {
public:
    container_config_builder_t(const std::string& image,
                               const std::vector<std::string>& cmd);

    container_config_builder_t&
    hostname(const std::string& value);

    container_config_builder_t&
    domainname(const std::string& value);

    container_config_builder_t&
    user(const std::string& value);

    container_config_builder_t&
    attach(bool stdin_, bool stdout_, bool stderr_);

    container_config_builder_t&
    tty(bool value);

    container_config_builder_t&
    open_stdin(bool value, bool once = false);

    container_config_builder_t&
    env(const std::string& name, const std::string& value);

    container_config_builder_t&
    entrypoint(const std::string& value);

    container_config_builder_t&
    label(const std::string& key, const std::string& value);

    container_config_builder_t&
    working_dir(const std::string& value);

    const container_config_t&
    build() const {
        return m_config;
    }

private:
    container_config_t m_config;
};

struct create_response_t {
    std::string id;
    std::vector<std::string> warnings;
};

/// Container operations of the daemon API.
///
/// Listing always asks the daemon for sizes (`size=true`), listing everything additionally
/// passes `all=true`. Neither can be switched off.
class containers_t {
public:
    explicit
    containers_t(std::shared_ptr<api_t> api);

    /// Running containers only.
    result_t<std::vector<container_t>>
    list_running(const boost::optional<unsigned int>& limit = boost::none) const;

    /// Running and stopped containers.
    result_t<std::vector<container_t>>
    list_all(const boost::optional<unsigned int>& limit = boost::none) const;

    /// All containers matching the filter expression, see the Docker Engine API documentation of
    /// ContainerList for its syntax.
    result_t<std::vector<container_t>>
    list_with_filter(const std::string& filter,
                     const boost::optional<unsigned int>& limit = boost::none) const;

    result_t<create_response_t>
    create(const std::string& name,
           const container_config_t& config) const;

    result_t<create_response_t>
    create_minimal(const std::string& name,
                   const std::string& image,
                   const std::vector<std::string>& cmd) const;

    /// Query string of the listing operations, "?all=true&size=true&limit=5" and the like.
    static
    std::string
    list_query(bool all,
               const boost::optional<unsigned int>& limit,
               const boost::optional<std::string>& filter);

    static
    result_t<std::vector<container_t>>
    decode_list(const std::string& body);

    static
    result_t<std::string>
    encode_config(const container_config_t& config);

private:
    result_t<std::vector<container_t>>
    list(const std::string& query) const;

private:
    std::shared_ptr<api_t> m_api;
};

} // namespace dockhand

#endif // DOCKHAND_CONTAINERS_HPP
