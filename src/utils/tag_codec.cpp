/**
 * @file tag_codec.cpp
 * @brief Implementation of tag parsing and service shape conversion
 *
 * @date 2025
 */

#include "stratus/utils/tag_codec.hpp"
#include "stratus/core/errors.hpp"
#include "stratus/utils/string_utils.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace stratus {
namespace utils {

const char* const kMarkerTagKey = "inspect_sandbox";
const char* const kMarkerTagValue = "true";

TagSet TagCodec::Unpack(const std::string& tags) {
    TagSet unpacked;
    if (tags.empty()) {
        return unpacked;
    }

    for (const auto& element : StringUtils::Split(tags, ';')) {
        auto parts = StringUtils::Split(element, '=');
        if (parts.size() != 2) {
            throw TagFormatError(tags);
        }
        unpacked.emplace_back(parts[0], parts[1]);
    }

    return unpacked;
}

std::string TagCodec::Pack(const TagSet& tags) {
    std::vector<std::string> elements;
    elements.reserve(tags.size());
    for (const auto& [key, value] : tags) {
        elements.push_back(key + "=" + value);
    }
    return StringUtils::Join(elements, ";");
}

json TagCodec::ToTagSpecifications(const std::string& resource_type, const TagSet& tags) {
    json tag_list = json::array();
    for (const auto& [key, value] : tags) {
        json tag = json::object();
        tag["Key"] = key;
        tag["Value"] = value;
        tag_list.push_back(tag);
    }

    json specification = json::object();
    specification["ResourceType"] = resource_type;
    specification["Tags"] = tag_list;

    json specifications = json::array();
    specifications.push_back(specification);
    return specifications;
}

TagSet TagCodec::FromResourceTags(const json& tags) {
    TagSet decoded;
    if (!tags.is_array()) {
        return decoded;
    }

    for (const auto& entry : tags) {
        if (!entry.is_object() || !entry.contains("Key") || !entry["Key"].is_string()) {
            continue;
        }
        decoded.emplace_back(entry["Key"].get<std::string>(), entry.value("Value", ""));
    }

    return decoded;
}

ResourceFilter TagCodec::TagFilter(const std::string& key, const std::string& value) {
    return ResourceFilter{"tag:" + key, {value}};
}

json TagCodec::ToFilters(const std::vector<ResourceFilter>& filters) {
    json encoded = json::array();
    for (const auto& filter : filters) {
        json entry = json::object();
        entry["Name"] = filter.name;
        entry["Values"] = filter.values;
        encoded.push_back(entry);
    }
    return encoded;
}

std::string TagCodec::Lookup(const TagSet& tags, const std::string& key) {
    for (const auto& [k, v] : tags) {
        if (k == key) {
            return v;
        }
    }
    return "";
}

} // namespace utils
} // namespace stratus
