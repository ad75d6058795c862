/**
 * @file tag_codec.hpp
 * @brief Conversions between flat key/value tags and service tag/filter shapes
 *
 * Tags enter the system as a `key1=value1;key2=value2` string, travel as an
 * ordered TagSet, and leave as the control plane's TagSpecifications and
 * Filters JSON. Listing results come back as `[{"Key": ..., "Value": ...}]`
 * and are decoded into a TagSet again.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <utility>
#include <vector>

namespace stratus {
namespace utils {

using Tag = std::pair<std::string, std::string>;

/// Ordered key/value pairs; duplicate keys are kept as given
using TagSet = std::vector<Tag>;

/// Tag applied to every instance this system creates
extern const char* const kMarkerTagKey;
extern const char* const kMarkerTagValue;

/**
 * @struct ResourceFilter
 * @brief One `{"Name": ..., "Values": [...]}` control plane filter
 */
struct ResourceFilter {
    std::string name;                  ///< Filter name, e.g. `tag:owner` or `instance-state-name`
    std::vector<std::string> values;   ///< Accepted values (OR)
};

/**
 * @class TagCodec
 * @brief Pure, stateless tag conversions
 *
 * **Usage Example**:
 * @code
 * auto tags = TagCodec::Unpack("team=infra;env=dev");
 * tags.push_back({"Name", "sandbox"});
 * auto spec = TagCodec::ToTagSpecifications("instance", tags);
 * // [{"ResourceType":"instance","Tags":[{"Key":"team","Value":"infra"}, ...]}]
 * @endcode
 */
class TagCodec {
public:
    /**
     * @brief Parse `k1=v1;k2=v2` into an ordered TagSet
     *
     * An empty string yields an empty set. Every `;`-separated element must
     * contain exactly one `=`.
     *
     * @throws TagFormatError naming the whole input otherwise
     */
    static TagSet Unpack(const std::string& tags);

    /**
     * @brief Inverse of Unpack
     */
    static std::string Pack(const TagSet& tags);

    /**
     * @brief Control plane TagSpecifications for one resource type
     */
    static nlohmann::json ToTagSpecifications(const std::string& resource_type, const TagSet& tags);

    /**
     * @brief Decode a `[{"Key": k, "Value": v}, ...]` array
     *
     * Entries without a string Key are skipped; a missing Value decodes as "".
     */
    static TagSet FromResourceTags(const nlohmann::json& tags);

    /// Filter matching resources that carry tag key=value
    static ResourceFilter TagFilter(const std::string& key, const std::string& value);

    /// Filter list as `[{"Name": ..., "Values": [...]}, ...]`
    static nlohmann::json ToFilters(const std::vector<ResourceFilter>& filters);

    /// Value of the first tag with key, or "" when absent
    static std::string Lookup(const TagSet& tags, const std::string& key);
};

} // namespace utils
} // namespace stratus
