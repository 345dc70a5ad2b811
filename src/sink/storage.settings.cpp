#include "macros.hh"
#include "sink.common.hh"
#include "storage.settings.hh"

#include <cstdlib>

namespace {
bool
get_env(const char* name, std::string& value)
{
    const char* env = std::getenv(name);
    if (env == nullptr) {
        LOG_DEBUG(name, " not set.");
        return false;
    }

    value = env;
    return true;
}
} // namespace

shardsink::StorageSettings
shardsink::StorageSettings::from_json(const nlohmann::json& json)
{
    StorageSettings settings;
    settings.n_threads = json.value("n_threads", settings.n_threads);
    settings.max_requests_per_batch =
      json.value("max_requests_per_batch", settings.max_requests_per_batch);

    if (json.contains("s3") && !json["s3"].is_null()) {
        const auto& s3 = json["s3"];

        S3Settings s3_settings;
        s3_settings.endpoint = s3.value("endpoint", std::string{});
        s3_settings.access_key_id = s3.value("access_key_id", std::string{});
        s3_settings.secret_access_key =
          s3.value("secret_access_key", std::string{});
        s3_settings.n_connections =
          s3.value("n_connections", s3_settings.n_connections);
        settings.s3 = s3_settings;
    }

    return settings;
}

nlohmann::json
shardsink::StorageSettings::to_json() const
{
    nlohmann::json json;
    json["n_threads"] = n_threads;
    json["max_requests_per_batch"] = max_requests_per_batch;

    if (s3) {
        json["s3"] = {
            { "endpoint", s3->endpoint },
            { "access_key_id", s3->access_key_id },
            { "secret_access_key", s3->secret_access_key },
            { "n_connections", s3->n_connections },
        };
    } else {
        json["s3"] = nullptr;
    }

    return json;
}

bool
shardsink::validate_settings(const StorageSettings& settings)
{
    if (settings.max_requests_per_batch == 0) {
        LOG_ERROR("Maximum requests per batch must be positive.");
        return false;
    }

    if (!settings.s3) {
        return true;
    }

    const auto& s3 = *settings.s3;
    if (is_empty_string(s3.endpoint, "S3 endpoint is empty") ||
        is_empty_string(s3.access_key_id, "S3 access key ID is empty") ||
        is_empty_string(s3.secret_access_key,
                        "S3 secret access key is empty")) {
        return false;
    }

    if (!s3.endpoint.starts_with("http://") &&
        !s3.endpoint.starts_with("https://")) {
        LOG_ERROR("S3 endpoint must begin with http:// or https://: ",
                  s3.endpoint);
        return false;
    }

    if (s3.n_connections == 0) {
        LOG_ERROR("S3 connection pool must have at least one connection.");
        return false;
    }

    return true;
}

std::optional<shardsink::S3Settings>
shardsink::s3_settings_from_environment()
{
    S3Settings settings;
    if (!get_env("SHARDSINK_S3_ENDPOINT", settings.endpoint) ||
        !get_env("SHARDSINK_S3_ACCESS_KEY_ID", settings.access_key_id) ||
        !get_env("SHARDSINK_S3_SECRET_ACCESS_KEY",
                 settings.secret_access_key)) {
        return std::nullopt;
    }

    return settings;
}
