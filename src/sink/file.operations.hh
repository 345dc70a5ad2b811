#pragma once

#include "batch.dispatcher.hh"
#include "s3.connection.hh"
#include "thread.pool.hh"

#include <memory>
#include <string>
#include <vector>

namespace shardsink {
/**
 * @brief Idempotent copy and remove over one storage backend.
 * @details Missing sources (copy) and missing targets (remove) are skipped.
 */
class FileOperations
{
  public:
    virtual ~FileOperations() = default;

    /**
     * @brief Copy each of @p src_filenames to the corresponding entry of
     * @p dst_filenames, replacing existing destinations.
     * @throws std::invalid_argument if the lists differ in length, before any
     * file is touched.
     * @throws std::runtime_error if a copy fails for a reason other than a
     * missing source.
     */
    virtual void copy(const std::vector<std::string>& src_filenames,
                      const std::vector<std::string>& dst_filenames) = 0;

    /**
     * @brief Remove each of @p filenames.
     * @throws std::runtime_error if a removal fails for a reason other than a
     * missing file.
     */
    virtual void remove(const std::vector<std::string>& filenames) = 0;
};

class LocalFileOperations : public FileOperations
{
  public:
    void copy(const std::vector<std::string>& src_filenames,
              const std::vector<std::string>& dst_filenames) override;
    void remove(const std::vector<std::string>& filenames) override;

  private:
    void copy_one_(const std::string& source, const std::string& destination);
    void remove_one_(const std::string& filename);
};

using RequestBatchFactory = std::function<std::unique_ptr<RequestBatch>()>;

/**
 * @brief Server-side copies and deletes, sent in batches.
 * @details A missing object is skipped. Any other failed request throws from
 * its batch's callbacks, so no later batch of the same call is sent.
 */
class S3FileOperations : public FileOperations
{
  public:
    /// Batches run concurrently on @p thread_pool.
    S3FileOperations(std::shared_ptr<S3ConnectionPool> connection_pool,
                     std::shared_ptr<ThreadPool> thread_pool,
                     size_t max_requests_per_batch);

    /// Each copy() or remove() call sends its requests through a fresh batch
    /// from @p make_batch.
    S3FileOperations(std::shared_ptr<S3ConnectionPool> connection_pool,
                     RequestBatchFactory make_batch,
                     size_t max_requests_per_batch);

    void copy(const std::vector<std::string>& src_filenames,
              const std::vector<std::string>& dst_filenames) override;
    void remove(const std::vector<std::string>& filenames) override;

  private:
    std::shared_ptr<S3ConnectionPool> connection_pool_;
    RequestBatchFactory make_batch_;
    const size_t max_requests_per_batch_;
};

/**
 * @brief Throw std::invalid_argument unless both lists have the same length.
 */
void
check_copy_arguments(const std::vector<std::string>& src_filenames,
                     const std::vector<std::string>& dst_filenames);
} // namespace shardsink
