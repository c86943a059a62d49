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

#ifndef DOCKHAND_DETAIL_JSON_HPP
#define DOCKHAND_DETAIL_JSON_HPP

#include <cocaine/format.hpp>

#include <rapidjson/rapidjson.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <boost/optional.hpp>

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace dockhand { namespace detail { namespace json {

/// Raised by the decoding helpers below. Never leaves the resource layer, which turns it into an
/// error::decode_failed result carrying what().
class error_t:
    public std::runtime_error
{
public:
    explicit
    error_t(const std::string& reason) :
        std::runtime_error(reason)
    {
        // pass
    }
};

// Fails on invalid UTF-8 instead of writing it out.
typedef rapidjson::Writer<
    rapidjson::StringBuffer,
    rapidjson::UTF8<>,
    rapidjson::UTF8<>,
    rapidjson::CrtAllocator,
    rapidjson::kWriteValidateEncodingFlag
> writer_t;

inline
void
parse(rapidjson::Document& document, const std::string& data) {
    document.Parse<0>(data.c_str());

    if(document.HasParseError()) {
        throw error_t(cocaine::format("{} (offset {})",
                                      rapidjson::GetParseError_En(document.GetParseError()),
                                      document.GetErrorOffset()));
    }
}

inline
const rapidjson::Value&
field(const rapidjson::Value& object, const char* name) {
    if(!object.IsObject()) {
        throw error_t(cocaine::format("expected an object holding field '{}'", name));
    }

    auto it = object.FindMember(name);

    if(it == object.MemberEnd()) {
        throw error_t(cocaine::format("missing field '{}'", name));
    }

    return it->value;
}

// Missing and null fields are both treated as absent.
inline
const rapidjson::Value*
optional_field(const rapidjson::Value& object, const char* name) {
    if(!object.IsObject()) {
        throw error_t(cocaine::format("expected an object holding field '{}'", name));
    }

    auto it = object.FindMember(name);

    if(it == object.MemberEnd() || it->value.IsNull()) {
        return nullptr;
    }

    return &it->value;
}

inline
std::string
as_string(const rapidjson::Value& value, const char* name) {
    if(!value.IsString()) {
        throw error_t(cocaine::format("field '{}' is not a string", name));
    }

    return std::string(value.GetString(), value.GetStringLength());
}

inline
bool
as_bool(const rapidjson::Value& value, const char* name) {
    if(!value.IsBool()) {
        throw error_t(cocaine::format("field '{}' is not a boolean", name));
    }

    return value.GetBool();
}

inline
uint32_t
as_uint(const rapidjson::Value& value, const char* name) {
    if(!value.IsUint()) {
        throw error_t(cocaine::format("field '{}' is not an unsigned 32-bit integer", name));
    }

    return value.GetUint();
}

inline
uint64_t
as_uint64(const rapidjson::Value& value, const char* name) {
    if(!value.IsUint64()) {
        throw error_t(cocaine::format("field '{}' is not an unsigned integer", name));
    }

    return value.GetUint64();
}

inline
int64_t
as_int64(const rapidjson::Value& value, const char* name) {
    if(!value.IsInt64()) {
        throw error_t(cocaine::format("field '{}' is not an integer", name));
    }

    return value.GetInt64();
}

template<class Decoder>
auto
as_array(const rapidjson::Value& value, const char* name, Decoder decoder)
    -> std::vector<decltype(decoder(value))>
{
    if(!value.IsArray()) {
        throw error_t(cocaine::format("field '{}' is not an array", name));
    }

    std::vector<decltype(decoder(value))> result;
    result.reserve(value.Size());

    for(auto it = value.Begin(); it != value.End(); ++it) {
        result.push_back(decoder(*it));
    }

    return result;
}

inline
std::vector<std::string>
as_string_array(const rapidjson::Value& value, const char* name) {
    return as_array(value, name, [name](const rapidjson::Value& item) {
        return as_string(item, name);
    });
}

inline
std::map<std::string, std::string>
as_string_map(const rapidjson::Value& value, const char* name) {
    if(!value.IsObject()) {
        throw error_t(cocaine::format("field '{}' is not an object", name));
    }

    std::map<std::string, std::string> result;

    for(auto it = value.MemberBegin(); it != value.MemberEnd(); ++it) {
        result[as_string(it->name, name)] = as_string(it->value, name);
    }

    return result;
}

inline
std::string
string_field(const rapidjson::Value& object, const char* name) {
    return as_string(field(object, name), name);
}

// Empty string when the field is missing or null.
inline
std::string
optional_string(const rapidjson::Value& object, const char* name) {
    const rapidjson::Value* value = optional_field(object, name);
    return value ? as_string(*value, name) : std::string();
}

// Empty sequence when the field is missing or null.
inline
std::vector<std::string>
optional_string_array(const rapidjson::Value& object, const char* name) {
    const rapidjson::Value* value = optional_field(object, name);
    return value ? as_string_array(*value, name) : std::vector<std::string>();
}

inline
boost::optional<std::map<std::string, std::string>>
optional_string_map(const rapidjson::Value& object, const char* name) {
    if(const rapidjson::Value* value = optional_field(object, name)) {
        return as_string_map(*value, name);
    }

    return boost::none;
}

// Error replies from docker look like {"message": "..."}, that text is appended to the diagnostic.
inline
std::string
describe(const error_t& e, const std::string& body) {
    rapidjson::Document document;
    document.Parse<0>(body.c_str());

    if(!document.HasParseError() && document.IsObject()) {
        auto it = document.FindMember("message");

        if(it != document.MemberEnd() && it->value.IsString()) {
            return cocaine::format("{} (docker: {})", e.what(), it->value.GetString());
        }
    }

    return e.what();
}

inline
void
write_string(writer_t& writer, const char* key, const std::string& value) {
    if(!writer.Key(key) || !writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()))) {
        throw error_t(cocaine::format("unable to serialize field '{}'", key));
    }
}

inline
void
write_bool(writer_t& writer, const char* key, bool value) {
    if(!writer.Key(key) || !writer.Bool(value)) {
        throw error_t(cocaine::format("unable to serialize field '{}'", key));
    }
}

inline
void
write_string_array(writer_t& writer, const char* key, const std::vector<std::string>& values) {
    if(!writer.Key(key) || !writer.StartArray()) {
        throw error_t(cocaine::format("unable to serialize field '{}'", key));
    }

    for(auto it = values.begin(); it != values.end(); ++it) {
        if(!writer.String(it->data(), static_cast<rapidjson::SizeType>(it->size()))) {
            throw error_t(cocaine::format("unable to serialize an item of field '{}'", key));
        }
    }

    if(!writer.EndArray()) {
        throw error_t(cocaine::format("unable to serialize field '{}'", key));
    }
}

inline
void
write_string_map(writer_t& writer, const char* key, const std::map<std::string, std::string>& values) {
    if(!writer.Key(key) || !writer.StartObject()) {
        throw error_t(cocaine::format("unable to serialize field '{}'", key));
    }

    for(auto it = values.begin(); it != values.end(); ++it) {
        if(!writer.Key(it->first.data(), static_cast<rapidjson::SizeType>(it->first.size())) ||
           !writer.String(it->second.data(), static_cast<rapidjson::SizeType>(it->second.size())))
        {
            throw error_t(cocaine::format("unable to serialize an entry of field '{}'", key));
        }
    }

    if(!writer.EndObject()) {
        throw error_t(cocaine::format("unable to serialize field '{}'", key));
    }
}

}}} // namespace dockhand::detail::json

#endif // DOCKHAND_DETAIL_JSON_HPP
