#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace shardsink {
/**
 * @brief What a successfully closed bundle attempt hands back to the write
 * operation: the path of its temporary file.
 */
struct BundleResult
{
    std::string filename;

    bool operator==(const BundleResult&) const = default;
};

void
to_json(nlohmann::json& json, const BundleResult& result);

void
from_json(const nlohmann::json& json, BundleResult& result);

/**
 * @brief Encodes bundle results so they can be moved between processes.
 */
class BundleResultCoder
{
  public:
    /// Identifies the encoded type to the serialization layer.
    std::string_view type_name() const;

    std::string encode(const BundleResult& result) const;

    /**
     * @throws std::runtime_error if @p encoded is not an encoded BundleResult.
     */
    BundleResult decode(std::string_view encoded) const;
};
} // namespace shardsink
