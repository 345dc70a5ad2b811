#include "batch.dispatcher.hh"
#include "file.operations.hh"
#include "macros.hh"
#include "sink.common.hh"

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {
// Borrow a connection for one request and run @p fn on it.
template<typename Fn>
shardsink::RequestResult
with_connection(const std::shared_ptr<shardsink::S3ConnectionPool>& pool,
                Fn&& fn)
{
    if (pool == nullptr) {
        return { shardsink::RequestStatus::Failure,
                 "S3 connection pool not provided." };
    }

    auto connection = pool->get_connection();
    if (connection == nullptr) {
        return { shardsink::RequestStatus::Failure,
                 "No S3 connection available." };
    }

    shardsink::RequestResult result;
    try {
        result = fn(*connection);
    } catch (const std::exception& exc) {
        result = { shardsink::RequestStatus::Failure, exc.what() };
    }

    pool->return_connection(std::move(connection));
    return result;
}
} // namespace

void
shardsink::check_copy_arguments(const std::vector<std::string>& src_filenames,
                                const std::vector<std::string>& dst_filenames)
{
    if (src_filenames.size() != dst_filenames.size()) {
        const std::string err =
          LOG_ERROR("Number of source files ",
                    src_filenames.size(),
                    " must equal number of destination files ",
                    dst_filenames.size());
        throw std::invalid_argument(err);
    }
}

void
shardsink::LocalFileOperations::copy(
  const std::vector<std::string>& src_filenames,
  const std::vector<std::string>& dst_filenames)
{
    check_copy_arguments(src_filenames, dst_filenames);

    for (auto i = 0u; i < src_filenames.size(); ++i) {
        LOG_DEBUG("Copying ", src_filenames[i], " to ", dst_filenames[i]);
        copy_one_(std::string(strip_file_scheme(src_filenames[i])),
                  std::string(strip_file_scheme(dst_filenames[i])));
    }
}

void
shardsink::LocalFileOperations::remove(const std::vector<std::string>& filenames)
{
    for (const auto& filename : filenames) {
        LOG_DEBUG("Removing file ", filename);
        remove_one_(std::string(strip_file_scheme(filename)));
    }
}

void
shardsink::LocalFileOperations::copy_one_(const std::string& source,
                                          const std::string& destination)
{
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        EXPECT(!ec, "Failed to stat ", source, ": ", ec.message());

        // consumed by an earlier finalize
        LOG_DEBUG(source, " does not exist.");
        return;
    }

    const fs::path dst_path(destination);
    if (const auto parent = dst_path.parent_path();
        !parent.empty() && !fs::is_directory(parent)) {
        fs::create_directories(parent, ec);
        EXPECT(fs::is_directory(parent),
               "Failed to create directory '",
               parent.string(),
               "': ",
               ec.message());
    }

    // stage next to the destination, then rename over it
    const fs::path staging = dst_path.string() + ".copying";
    const bool copied =
      fs::copy_file(source, staging, fs::copy_options::overwrite_existing, ec);
    if (!copied) {
        std::error_code ignored;
        fs::remove(staging, ignored);

        if (!fs::exists(source, ignored)) {
            LOG_DEBUG(source, " does not exist.");
            return;
        }
    }
    EXPECT(copied,
           "Failed to copy ",
           source,
           " to ",
           destination,
           ": ",
           ec.message());

    fs::rename(staging, dst_path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(staging, ignored);
    }
    EXPECT(!ec,
           "Failed to move ",
           staging.string(),
           " to ",
           destination,
           ": ",
           ec.message());
}

void
shardsink::LocalFileOperations::remove_one_(const std::string& filename)
{
    std::error_code ec;
    if (fs::remove(filename, ec)) {
        return;
    }

    EXPECT(!ec, "Failed to remove ", filename, ": ", ec.message());
    LOG_DEBUG(filename, " does not exist.");
}

shardsink::S3FileOperations::S3FileOperations(
  std::shared_ptr<S3ConnectionPool> connection_pool,
  std::shared_ptr<ThreadPool> thread_pool,
  size_t max_requests_per_batch)
  : S3FileOperations(
      connection_pool,
      [thread_pool] { return std::make_unique<ThreadPoolBatch>(thread_pool); },
      max_requests_per_batch)
{
    EXPECT(connection_pool_, "S3 connection pool not provided.");
    EXPECT(thread_pool, "Thread pool not provided.");
}

shardsink::S3FileOperations::S3FileOperations(
  std::shared_ptr<S3ConnectionPool> connection_pool,
  RequestBatchFactory make_batch,
  size_t max_requests_per_batch)
  : connection_pool_{ connection_pool }
  , make_batch_{ std::move(make_batch) }
  , max_requests_per_batch_{ max_requests_per_batch }
{
    EXPECT(make_batch_, "Request batch factory not provided.");
}

void
shardsink::S3FileOperations::copy(const std::vector<std::string>& src_filenames,
                                  const std::vector<std::string>& dst_filenames)
{
    check_copy_arguments(src_filenames, dst_filenames);

    BatchDispatcher dispatcher(make_batch_(), max_requests_per_batch_);

    for (auto i = 0u; i < src_filenames.size(); ++i) {
        const auto source = parse_s3_path(src_filenames[i]);
        const auto destination = parse_s3_path(dst_filenames[i]);
        LOG_DEBUG("Copying ", src_filenames[i], " to ", dst_filenames[i]);

        dispatcher.queue(
          [pool = connection_pool_, source, destination] {
              return with_connection(pool, [&](S3Connection& connection) {
                  return connection.copy_object(source.bucket,
                                                source.object,
                                                destination.bucket,
                                                destination.object);
              });
          },
          [src = src_filenames[i], dst = dst_filenames[i]](
            const RequestResult& result) {
              if (result.not_found()) {
                  LOG_DEBUG(src, " does not exist.");
                  return;
              }
              EXPECT(result.ok(),
                     "Failed to copy ",
                     src,
                     " to ",
                     dst,
                     ": ",
                     result.message);
              LOG_DEBUG("Successfully copied ", src, " to ", dst);
          });
    }

    dispatcher.flush();
}

void
shardsink::S3FileOperations::remove(const std::vector<std::string>& filenames)
{
    BatchDispatcher dispatcher(make_batch_(), max_requests_per_batch_);

    for (const auto& filename : filenames) {
        const auto path = parse_s3_path(filename);
        LOG_DEBUG("Removing ", filename);

        dispatcher.queue(
          [pool = connection_pool_, path] {
              return with_connection(pool, [&](S3Connection& connection) {
                  return connection.delete_object(path.bucket, path.object);
              });
          },
          [filename](const RequestResult& result) {
              if (result.not_found()) {
                  LOG_DEBUG(filename, " does not exist.");
                  return;
              }
              EXPECT(result.ok(),
                     "Failed to remove ",
                     filename,
                     ": ",
                     result.message);
              LOG_DEBUG("Successfully removed ", filename);
          });
    }

    dispatcher.flush();
}
