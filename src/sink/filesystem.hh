#pragma once

#include "channel.hh"
#include "s3.connection.hh"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace shardsink {
/**
 * @brief The create/match primitives the sink needs from a storage backend.
 */
class Filesystem
{
  public:
    virtual ~Filesystem() = default;

    /**
     * @brief Open a new file (or object) for writing, replacing any existing
     * one.
     * @param path The path of the file.
     * @param mime_type Content type hint. Backends may ignore it.
     * @return A writable channel to the file.
     * @throws std::runtime_error if the file cannot be created.
     */
    virtual std::unique_ptr<WritableChannel> create(
      std::string_view path,
      std::string_view mime_type) = 0;

    /**
     * @brief Find all paths matching a glob pattern.
     * @details Wildcards may only appear in the last path component for the
     * local backend.
     * @param pattern The glob pattern, in the same form as paths passed to
     * create().
     * @return The matching paths, sorted ascending.
     */
    virtual std::vector<std::string> match(std::string_view pattern) = 0;
};

class LocalFilesystem : public Filesystem
{
  public:
    std::unique_ptr<WritableChannel> create(std::string_view path,
                                            std::string_view mime_type) override;
    std::vector<std::string> match(std::string_view pattern) override;
};

class S3Filesystem : public Filesystem
{
  public:
    explicit S3Filesystem(std::shared_ptr<S3ConnectionPool> connection_pool);

    std::unique_ptr<WritableChannel> create(std::string_view path,
                                            std::string_view mime_type) override;
    std::vector<std::string> match(std::string_view pattern) override;

  private:
    std::shared_ptr<S3ConnectionPool> connection_pool_;
};
} // namespace shardsink
