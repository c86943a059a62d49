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

#ifndef DOCKHAND_IMAGES_HPP
#define DOCKHAND_IMAGES_HPP

#include "dockhand/api.hpp"
#include "dockhand/result.hpp"

#include <boost/optional.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dockhand {

/// One entry of GET /images/json.
struct image_t {
    std::string id;
    std::string parent_id;
    std::vector<std::string> repo_tags;
    std::vector<std::string> repo_digests;
    int64_t created;
    int64_t size;
    int64_t virtual_size;
    boost::optional<std::map<std::string, std::string>> labels;
};

/// Subset of GET /images/{name}/json.
struct image_details_t {
    std::string id;
    std::string parent;
    std::vector<std::string> repo_tags;
    std::string created;
    std::string architecture;
    std::string os;
    int64_t size;
};

class images_t {
public:
    explicit
    images_t(std::shared_ptr<api_t> api);

    /// Top-level images only, unless `all` is set.
    result_t<std::vector<image_t>>
    list(bool all = false) const;

    result_t<image_details_t>
    inspect(const std::string& name) const;

private:
    std::shared_ptr<api_t> m_api;
};

} // namespace dockhand

#endif // DOCKHAND_IMAGES_HPP
