#pragma once

#include <string>
#include <string_view>

namespace shardsink {
/// Storage backend addressed by a path.
enum class Scheme
{
    Local,
    S3,
    Unsupported
};

struct S3Path
{
    std::string bucket;
    std::string object;
};

/**
 * @brief Trim whitespace from a string.
 * @param s The string to trim.
 * @return The string with leading and trailing whitespace removed.
 */
[[nodiscard]]
std::string
trim(std::string_view s);

/**
 * @brief Check if a string is empty, including whitespace.
 * @param s The string to check.
 * @param err_on_empty The message to log if the string is empty.
 * @return True if the string is empty, false otherwise.
 */
bool
is_empty_string(std::string_view s, std::string_view err_on_empty);

/**
 * @brief Determine the storage scheme of a path.
 * @details Paths without a `scheme://` prefix, and `file://` paths, are local.
 * `s3://` paths address an S3 bucket. Any other prefix is unsupported.
 * @param path The path to inspect.
 * @return The scheme of @p path.
 */
Scheme
scheme_of(std::string_view path);

const char*
scheme_to_string(Scheme scheme);

/**
 * @brief Strip a leading `file://` from a local path.
 */
std::string_view
strip_file_scheme(std::string_view path);

/**
 * @brief Split an `s3://bucket/object` URI into its bucket and object key.
 * @throw std::runtime_error if @p uri is not an S3 URI or has no bucket.
 */
S3Path
parse_s3_path(std::string_view uri);

/// Inverse of parse_s3_path.
std::string
make_s3_uri(const S3Path& path);

/**
 * @brief Match @p name against a glob pattern.
 * @details `*` matches any run of characters, including an empty one, and `?`
 * matches exactly one character. Every other character matches itself.
 */
bool
matches_glob(std::string_view name, std::string_view pattern);

/**
 * @brief Return the part of @p pattern before its first wildcard.
 */
std::string_view
glob_literal_prefix(std::string_view pattern);
} // namespace shardsink
