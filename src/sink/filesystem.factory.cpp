#include "filesystem.factory.hh"
#include "macros.hh"
#include "sink.common.hh"

namespace {
std::shared_ptr<shardsink::ThreadPool>
make_thread_pool(unsigned int n_threads)
{
    if (n_threads == 0) {
        n_threads = std::thread::hardware_concurrency();
    }

    return std::make_shared<shardsink::ThreadPool>(
      n_threads, [](const std::string& err) { LOG_ERROR(err); });
}

std::shared_ptr<shardsink::S3ConnectionPool>
make_connection_pool(const std::optional<shardsink::S3Settings>& settings)
{
    if (!settings) {
        return nullptr;
    }

    return std::make_shared<shardsink::S3ConnectionPool>(
      settings->n_connections,
      settings->endpoint,
      settings->access_key_id,
      settings->secret_access_key);
}
} // namespace

shardsink::FilesystemFactory::FilesystemFactory(
  const StorageSettings& settings)
  : max_requests_per_batch_{ settings.max_requests_per_batch }
{
    EXPECT(validate_settings(settings), "Invalid storage settings.");

    thread_pool_ = make_thread_pool(settings.n_threads);
    connection_pool_ = make_connection_pool(settings.s3);

    local_filesystem_ = std::make_shared<LocalFilesystem>();
    if (connection_pool_) {
        s3_filesystem_ = std::make_shared<S3Filesystem>(connection_pool_);
    }
}

shardsink::FilesystemFactory::FilesystemFactory(
  std::shared_ptr<ThreadPool> thread_pool,
  std::shared_ptr<S3ConnectionPool> connection_pool,
  size_t max_requests_per_batch)
  : thread_pool_{ thread_pool }
  , connection_pool_{ connection_pool }
  , max_requests_per_batch_{ max_requests_per_batch }
  , local_filesystem_{ std::make_shared<LocalFilesystem>() }
{
    EXPECT(thread_pool_, "Thread pool not provided.");
    EXPECT(max_requests_per_batch_ > 0,
           "Maximum requests per batch must be positive.");

    if (connection_pool_) {
        s3_filesystem_ = std::make_shared<S3Filesystem>(connection_pool_);
    }
}

std::shared_ptr<shardsink::Filesystem>
shardsink::FilesystemFactory::make_filesystem(std::string_view path) const
{
    if (checked_scheme_(path) == Scheme::S3) {
        return s3_filesystem_;
    }

    return local_filesystem_;
}

std::unique_ptr<shardsink::FileOperations>
shardsink::FilesystemFactory::make_file_operations(std::string_view path) const
{
    if (checked_scheme_(path) == Scheme::S3) {
        return std::make_unique<S3FileOperations>(
          connection_pool_, thread_pool_, max_requests_per_batch_);
    }

    return std::make_unique<LocalFileOperations>();
}

shardsink::Scheme
shardsink::FilesystemFactory::checked_scheme_(std::string_view path) const
{
    const auto scheme = scheme_of(path);
    EXPECT(scheme != Scheme::Unsupported, "Unrecognized file system: ", path);
    EXPECT(scheme != Scheme::S3 || connection_pool_,
           "No connection pool for the ",
           scheme_to_string(scheme),
           " file system; cannot access ",
           path);

    return scheme;
}
