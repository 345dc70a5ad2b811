#include "file.channel.hh"
#include "filesystem.hh"
#include "macros.hh"
#include "s3.channel.hh"
#include "sink.common.hh"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

std::unique_ptr<shardsink::WritableChannel>
shardsink::LocalFilesystem::create(std::string_view path, std::string_view)
{
    path = strip_file_scheme(path);
    EXPECT(!path.empty(), "File path must not be empty.");

    fs::path file_path(path);
    fs::path parent_path = file_path.parent_path();

    if (!parent_path.empty() && !fs::is_directory(parent_path)) {
        // another writer may create the same directory concurrently
        std::error_code ec;
        fs::create_directories(parent_path, ec);
        EXPECT(fs::is_directory(parent_path),
               "Failed to create directory '",
               parent_path.string(),
               "': ",
               ec.message());
    }

    return std::make_unique<FileChannel>(path);
}

std::vector<std::string>
shardsink::LocalFilesystem::match(std::string_view pattern)
{
    const bool has_scheme = pattern.size() != strip_file_scheme(pattern).size();
    const std::string_view local_pattern = strip_file_scheme(pattern);
    EXPECT(!local_pattern.empty(), "Glob pattern must not be empty.");

    const fs::path pattern_path(local_pattern);
    const std::string parent = pattern_path.parent_path().string();
    const std::string name_pattern = pattern_path.filename().string();
    EXPECT(glob_literal_prefix(parent).size() == parent.size(),
           "Wildcards are only supported in the file name: ",
           pattern);

    const fs::path directory = parent.empty() ? fs::path(".") : fs::path(parent);

    std::vector<std::string> matches;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        LOG_DEBUG("Directory ", directory.string(), " does not exist.");
        return matches;
    }

    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }

        const auto filename = entry.path().filename().string();
        if (!matches_glob(filename, name_pattern)) {
            continue;
        }

        std::string match =
          parent.empty() ? filename : (fs::path(parent) / filename).string();
        matches.push_back(has_scheme ? "file://" + match : match);
    }
    EXPECT(!ec,
           "Failed to list directory '",
           directory.string(),
           "': ",
           ec.message());

    std::sort(matches.begin(), matches.end());
    return matches;
}

shardsink::S3Filesystem::S3Filesystem(
  std::shared_ptr<S3ConnectionPool> connection_pool)
  : connection_pool_{ connection_pool }
{
    EXPECT(connection_pool_, "S3 connection pool not provided.");
}

std::unique_ptr<shardsink::WritableChannel>
shardsink::S3Filesystem::create(std::string_view path,
                                std::string_view mime_type)
{
    const auto s3_path = parse_s3_path(path);
    EXPECT(!s3_path.object.empty(), "Object key must not be empty: ", path);

    return std::make_unique<S3Channel>(
      s3_path.bucket, s3_path.object, mime_type, connection_pool_);
}

std::vector<std::string>
shardsink::S3Filesystem::match(std::string_view pattern)
{
    const auto s3_pattern = parse_s3_path(pattern);
    EXPECT(glob_literal_prefix(s3_pattern.bucket).size() ==
             s3_pattern.bucket.size(),
           "Wildcards are not supported in bucket names: ",
           pattern);

    auto connection = connection_pool_->get_connection();
    EXPECT(connection, "No S3 connection available.");

    std::vector<std::string> keys;
    try {
        keys = connection->list_objects(
          s3_pattern.bucket, glob_literal_prefix(s3_pattern.object));
    } catch (const std::exception&) {
        connection_pool_->return_connection(std::move(connection));
        throw;
    }
    connection_pool_->return_connection(std::move(connection));

    std::vector<std::string> matches;
    for (const auto& key : keys) {
        if (matches_glob(key, s3_pattern.object)) {
            matches.push_back(make_s3_uri({ s3_pattern.bucket, key }));
        }
    }

    std::sort(matches.begin(), matches.end());
    return matches;
}
