#pragma once

#include <nlohmann/json.hpp>

#include <cstddef> // size_t
#include <optional>
#include <string>

namespace shardsink {
struct S3Settings
{
    std::string endpoint;          /* Endpoint for the S3 service */
    std::string access_key_id;     /* Access key ID for the S3 service */
    std::string secret_access_key; /* Secret access key for the S3 service */
    size_t n_connections{ 8 };     /* Size of the connection pool */
};

struct StorageSettings
{
    unsigned int n_threads{ 0 }; /* Worker threads; 0 means one per core */
    size_t max_requests_per_batch{ 1000 }; /* Requests per remote batch */
    std::optional<S3Settings> s3; /* Set to enable s3:// paths */

    /**
     * @brief Read settings from JSON.
     * @details Recognized keys are "n_threads", "max_requests_per_batch" and
     * "s3", an object with "endpoint", "access_key_id", "secret_access_key"
     * and "n_connections". Missing keys keep their defaults.
     * @throws nlohmann::json::exception if a key has the wrong type.
     */
    static StorageSettings from_json(const nlohmann::json& json);
    nlohmann::json to_json() const;
};

/**
 * @brief Check that settings are usable, logging the first problem found.
 * @return True if the settings are valid, otherwise false.
 */
[[nodiscard]] bool
validate_settings(const StorageSettings& settings);

/**
 * @brief Read S3 settings from SHARDSINK_S3_ENDPOINT,
 * SHARDSINK_S3_ACCESS_KEY_ID and SHARDSINK_S3_SECRET_ACCESS_KEY.
 * @return The settings, or nullopt if any variable is unset.
 */
std::optional<S3Settings>
s3_settings_from_environment();
} // namespace shardsink
