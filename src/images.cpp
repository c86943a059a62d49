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

#include "dockhand/images.hpp"
#include "dockhand/detail/json.hpp"

#include <cocaine/format.hpp>
#include <cocaine/logging.hpp>

#include <blackhole/logger.hpp>

#include <boost/algorithm/string.hpp>

using namespace dockhand;

namespace json = dockhand::detail::json;

namespace {

int64_t
optional_int64(const rapidjson::Value& object, const char* name) {
    const rapidjson::Value* value = json::optional_field(object, name);
    return value ? json::as_int64(*value, name) : 0;
}

image_t
decode_image(const rapidjson::Value& value) {
    image_t image;

    image.id = json::string_field(value, "Id");
    image.parent_id = json::optional_string(value, "ParentId");
    image.repo_tags = json::optional_string_array(value, "RepoTags");
    image.repo_digests = json::optional_string_array(value, "RepoDigests");
    image.created = json::as_int64(json::field(value, "Created"), "Created");
    image.size = json::as_int64(json::field(value, "Size"), "Size");
    image.virtual_size = optional_int64(value, "VirtualSize");
    image.labels = json::optional_string_map(value, "Labels");

    return image;
}

image_details_t
decode_details(const rapidjson::Value& value) {
    image_details_t details;

    details.id = json::string_field(value, "Id");
    details.parent = json::optional_string(value, "Parent");
    details.repo_tags = json::optional_string_array(value, "RepoTags");
    details.created = json::string_field(value, "Created");
    details.architecture = json::optional_string(value, "Architecture");
    details.os = json::optional_string(value, "Os");
    details.size = json::as_int64(json::field(value, "Size"), "Size");

    return details;
}

// Names end up in the request path as they are, so anything that would move the request to another
// target is refused: query and fragment delimiters, empty segments and dot segments.
bool
is_valid_name(const std::string& name) {
    if(name.empty() || name.find_first_of("?#") != std::string::npos) {
        return false;
    }

    std::vector<std::string> segments;
    boost::split(segments, name, boost::is_any_of("/"));

    for(auto it = segments.begin(); it != segments.end(); ++it) {
        if(it->empty() || *it == "." || *it == "..") {
            return false;
        }
    }

    return true;
}

} // namespace

images_t::images_t(std::shared_ptr<api_t> api) :
    m_api(std::move(api))
{
    // pass
}

result_t<std::vector<image_t>>
images_t::list(bool all) const {
    auto body = m_api->call(all ? "/images/json?all=true" : "/images/json", "GET");

    if(!body) {
        return body.failure();
    }

    try {
        rapidjson::Document document;
        json::parse(document, body.value());

        return json::as_array(document, "images", &decode_image);
    } catch(const json::error_t& e) {
        const auto reason = json::describe(e, body.value());
        COCAINE_LOG_WARNING(m_api->logger(), "unable to decode image list: {}", reason);
        return failure_t(error::decode_failed, reason);
    }
}

result_t<image_details_t>
images_t::inspect(const std::string& name) const {
    if(!is_valid_name(name)) {
        COCAINE_LOG_WARNING(m_api->logger(), "refusing to inspect image with invalid name '{}'", name);
        return failure_t(error::request_preparation_failed,
                         cocaine::format("invalid image name '{}'", name));
    }

    auto body = m_api->call(cocaine::format("/images/{}/json", name), "GET");

    if(!body) {
        return body.failure();
    }

    try {
        rapidjson::Document document;
        json::parse(document, body.value());

        return decode_details(document);
    } catch(const json::error_t& e) {
        const auto reason = json::describe(e, body.value());
        COCAINE_LOG_WARNING(m_api->logger(), "unable to inspect image '{}': {}", name, reason);
        return failure_t(error::decode_failed, reason);
    }
}
