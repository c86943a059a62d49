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

#include "dockhand/containers.hpp"
#include "dockhand/detail/json.hpp"
#include "dockhand/http.hpp"

#include <cocaine/format.hpp>
#include <cocaine/logging.hpp>

#include <blackhole/logger.hpp>

#include <boost/lexical_cast.hpp>

using namespace dockhand;

namespace json = dockhand::detail::json;

namespace {

const std::string containers_endpoint = "/containers/json";

port_t
decode_port(const rapidjson::Value& value) {
    port_t port;

    // Unpublished ports come without an address and a public port.
    port.ip = json::optional_string(value, "IP");
    port.private_port = json::as_uint(json::field(value, "PrivatePort"), "PrivatePort");

    const rapidjson::Value* public_port = json::optional_field(value, "PublicPort");
    port.public_port = public_port ? json::as_uint(*public_port, "PublicPort") : 0;

    port.type = json::string_field(value, "Type");

    return port;
}

mount_t
decode_mount(const rapidjson::Value& value) {
    mount_t mount;

    mount.name = json::optional_string(value, "Name");
    mount.source = json::string_field(value, "Source");
    mount.destination = json::string_field(value, "Destination");
    mount.driver = json::optional_string(value, "Driver");
    mount.mode = json::string_field(value, "Mode");
    mount.rw = json::as_bool(json::field(value, "RW"), "RW");
    mount.propagation = json::string_field(value, "Propagation");

    return mount;
}

container_t
decode_container(const rapidjson::Value& value) {
    container_t container;

    container.id = json::string_field(value, "Id");
    container.names = json::as_string_array(json::field(value, "Names"), "Names");
    container.image = json::string_field(value, "Image");
    container.image_id = json::string_field(value, "ImageID");
    container.command = json::string_field(value, "Command");

    const rapidjson::Value* created = json::optional_field(value, "Created");
    container.created = created ? json::as_int64(*created, "Created") : 0;

    container.state = json::string_field(value, "State");
    container.status = json::string_field(value, "Status");
    container.ports = json::as_array(json::field(value, "Ports"), "Ports", &decode_port);
    container.labels = json::optional_string_map(value, "Labels");

    if(const rapidjson::Value* size_rw = json::optional_field(value, "SizeRw")) {
        container.size_rw = json::as_uint64(*size_rw, "SizeRw");
    }

    const rapidjson::Value* size_root_fs = json::optional_field(value, "SizeRootFs");
    container.size_root_fs = size_root_fs ? json::as_uint64(*size_root_fs, "SizeRootFs") : 0;

    container.network_mode = json::string_field(json::field(value, "HostConfig"), "NetworkMode");
    container.mounts = json::as_array(json::field(value, "Mounts"), "Mounts", &decode_mount);

    return container;
}

create_response_t
decode_create_response(const std::string& body) {
    rapidjson::Document document;
    json::parse(document, body);

    create_response_t response;
    response.id = json::string_field(document, "Id");
    response.warnings = json::optional_string_array(document, "Warnings");

    return response;
}

} // namespace

container_config_builder_t::container_config_builder_t(const std::string& image,
                                                       const std::vector<std::string>& cmd)
{
    m_config.image = image;
    m_config.cmd = cmd;
}

container_config_builder_t&
container_config_builder_t::hostname(const std::string& value) {
    m_config.hostname = value;
    return *this;
}

container_config_builder_t&
container_config_builder_t::domainname(const std::string& value) {
    m_config.domainname = value;
    return *this;
}

container_config_builder_t&
container_config_builder_t::user(const std::string& value) {
    m_config.user = value;
    return *this;
}

container_config_builder_t&
container_config_builder_t::attach(bool stdin_, bool stdout_, bool stderr_) {
    m_config.attach_stdin = stdin_;
    m_config.attach_stdout = stdout_;
    m_config.attach_stderr = stderr_;
    return *this;
}

container_config_builder_t&
container_config_builder_t::tty(bool value) {
    m_config.tty = value;
    return *this;
}

container_config_builder_t&
container_config_builder_t::open_stdin(bool value, bool once) {
    m_config.open_stdin = value;
    m_config.stdin_once = once;
    return *this;
}

container_config_builder_t&
container_config_builder_t::env(const std::string& name, const std::string& value) {
    m_config.env.push_back(name + "=" + value);
    return *this;
}

container_config_builder_t&
container_config_builder_t::entrypoint(const std::string& value) {
    m_config.entrypoint = value;
    return *this;
}

container_config_builder_t&
container_config_builder_t::label(const std::string& key, const std::string& value) {
    if(!m_config.labels) {
        m_config.labels = labels_t();
    }

    (*m_config.labels)[key] = value;
    return *this;
}

container_config_builder_t&
container_config_builder_t::working_dir(const std::string& value) {
    m_config.working_dir = value;
    return *this;
}

containers_t::containers_t(std::shared_ptr<api_t> api) :
    m_api(std::move(api))
{
    // pass
}

std::string
containers_t::list_query(bool all,
                         const boost::optional<unsigned int>& limit,
                         const boost::optional<std::string>& filter)
{
    std::string query = all ? "?all=true&size=true" : "?size=true";

    if(limit) {
        query += "&limit=" + boost::lexical_cast<std::string>(*limit);
    }

    if(filter) {
        query += "&filter=" + http::escape(*filter);
    }

    return query;
}

result_t<std::vector<container_t>>
containers_t::decode_list(const std::string& body) {
    try {
        rapidjson::Document document;
        json::parse(document, body);

        return json::as_array(document, "containers", &decode_container);
    } catch(const json::error_t& e) {
        return failure_t(error::decode_failed, json::describe(e, body));
    }
}

result_t<std::string>
containers_t::encode_config(const container_config_t& config) {
    rapidjson::StringBuffer buffer;
    json::writer_t writer(buffer);

    try {
        if(!writer.StartObject()) {
            throw json::error_t("unable to start the configuration object");
        }

        json::write_string(writer, "Image", config.image);
        json::write_string_array(writer, "Cmd", config.cmd);
        json::write_string(writer, "Hostname", config.hostname);
        json::write_string(writer, "Domainname", config.domainname);
        json::write_string(writer, "User", config.user);
        json::write_bool(writer, "AttachStdin", config.attach_stdin);
        json::write_bool(writer, "AttachStdout", config.attach_stdout);
        json::write_bool(writer, "AttachStderr", config.attach_stderr);
        json::write_bool(writer, "Tty", config.tty);
        json::write_bool(writer, "OpenStdin", config.open_stdin);
        json::write_bool(writer, "StdinOnce", config.stdin_once);
        json::write_string_array(writer, "Env", config.env);
        json::write_string(writer, "Entrypoint", config.entrypoint);

        if(config.labels) {
            json::write_string_map(writer, "Labels", *config.labels);
        } else if(!writer.Key("Labels") || !writer.Null()) {
            throw json::error_t("unable to serialize field 'Labels'");
        }

        json::write_string(writer, "WorkingDir", config.working_dir);

        if(!writer.EndObject()) {
            throw json::error_t("unable to finish the configuration object");
        }
    } catch(const json::error_t& e) {
        return failure_t(error::encode_failed, e.what());
    }

    return std::string(buffer.GetString(), buffer.GetSize());
}

result_t<std::vector<container_t>>
containers_t::list(const std::string& query) const {
    auto body = m_api->call(containers_endpoint + query, "GET");

    if(!body) {
        return body.failure();
    }

    auto containers = decode_list(body.value());

    if(!containers) {
        COCAINE_LOG_WARNING(m_api->logger(), "unable to decode container list: {}",
                            containers.failure().reason());
    }

    return containers;
}

result_t<std::vector<container_t>>
containers_t::list_running(const boost::optional<unsigned int>& limit) const {
    return list(list_query(false, limit, boost::none));
}

result_t<std::vector<container_t>>
containers_t::list_all(const boost::optional<unsigned int>& limit) const {
    return list(list_query(true, limit, boost::none));
}

result_t<std::vector<container_t>>
containers_t::list_with_filter(const std::string& filter,
                               const boost::optional<unsigned int>& limit) const
{
    return list(list_query(true, limit, filter));
}

result_t<create_response_t>
containers_t::create(const std::string& name,
                     const container_config_t& config) const
{
    if(config.image.empty()) {
        return failure_t(error::request_preparation_failed, "container image is not specified");
    }

    auto body = encode_config(config);

    if(!body) {
        COCAINE_LOG_WARNING(m_api->logger(), "unable to serialize configuration of container '{}': {}",
                            name, body.failure().reason());
        return body.failure();
    }

    std::string endpoint = "/containers/create";

    if(!name.empty()) {
        endpoint += "?name=" + http::escape(name);
    }

    auto response = m_api->call(endpoint, "POST", body.value());

    if(!response) {
        return response.failure();
    }

    try {
        auto created = decode_create_response(response.value());

        for(auto it = created.warnings.begin(); it != created.warnings.end(); ++it) {
            COCAINE_LOG_WARNING(m_api->logger(), "warning from docker: '{}'", *it);
        }

        COCAINE_LOG_INFO(m_api->logger(), "container {} has been created from image '{}'",
                         created.id, config.image);

        return created;
    } catch(const json::error_t& e) {
        COCAINE_LOG_WARNING(m_api->logger(), "unable to create a container: unexpected reply from docker: '{}'",
                            response.value());
        return failure_t(error::decode_failed, json::describe(e, response.value()));
    }
}

result_t<create_response_t>
containers_t::create_minimal(const std::string& name,
                             const std::string& image,
                             const std::vector<std::string>& cmd) const
{
    return create(name, container_config_builder_t(image, cmd).build());
}
