#pragma once

#include "file.operations.hh"
#include "filesystem.hh"
#include "s3.connection.hh"
#include "sink.common.hh"
#include "storage.settings.hh"
#include "thread.pool.hh"

#include <memory>
#include <string_view>

namespace shardsink {
/**
 * @brief Select the storage backend for a path by its scheme.
 * @details Plain paths and file:// paths resolve to local disk, s3:// paths to
 * the S3 backend. Any other scheme, or an s3:// path when no connection pool
 * was configured, is an error.
 */
class FilesystemFactory
{
  public:
    /**
     * @brief Build the thread pool and, if S3 settings are present, the S3
     * connection pool.
     * @throws std::runtime_error if the settings are invalid.
     */
    explicit FilesystemFactory(const StorageSettings& settings);

    FilesystemFactory(std::shared_ptr<ThreadPool> thread_pool,
                      std::shared_ptr<S3ConnectionPool> connection_pool,
                      size_t max_requests_per_batch);

    std::shared_ptr<Filesystem> make_filesystem(std::string_view path) const;

    std::unique_ptr<FileOperations> make_file_operations(
      std::string_view path) const;

  private:
    std::shared_ptr<ThreadPool> thread_pool_;
    std::shared_ptr<S3ConnectionPool> connection_pool_;
    size_t max_requests_per_batch_;

    std::shared_ptr<LocalFilesystem> local_filesystem_;
    std::shared_ptr<S3Filesystem> s3_filesystem_;

    Scheme checked_scheme_(std::string_view path) const;
};
} // namespace shardsink
