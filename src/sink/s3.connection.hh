#pragma once

#include "definitions.hh"

#include <miniocpp/client.h>

#include <atomic>
#include <condition_variable>
#include <list>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shardsink {
class S3Connection
{
  public:
    S3Connection(const std::string& endpoint,
                 const std::string& access_key_id,
                 const std::string& secret_access_key);

    /**
     * @brief Test a connection by listing all buckets at this connection's
     * endpoint.
     * @returns True if the connection is valid, otherwise false.
     */
    bool is_connection_valid();

    /* Bucket operations */

    /**
     * @brief Check whether a bucket exists.
     * @param bucket_name The name of the bucket.
     * @returns True if the bucket exists, otherwise false.
     * @throws std::runtime_error if the bucket name is empty.
     */
    bool bucket_exists(std::string_view bucket_name);

    /* Object operations */

    /**
     * @brief Check whether an object exists.
     * @param bucket_name The name of the bucket containing the object.
     * @param object_name The name of the object.
     * @returns True if the object exists, otherwise false.
     * @throws std::runtime_error if the bucket name is empty or the object
     * name is empty.
     */
    bool object_exists(std::string_view bucket_name,
                       std::string_view object_name);

    /**
     * @brief Put an object.
     * @param bucket_name The name of the bucket to put the object in.
     * @param object_name The name of the object.
     * @param data The data to put in the object. May be empty.
     * @param content_type Value of the Content-Type header.
     * @returns The etag of the object.
     * @throws std::runtime_error if the bucket name or object name is empty.
     */
    [[nodiscard]] std::string put_object(std::string_view bucket_name,
                                         std::string_view object_name,
                                         std::span<uint8_t> data,
                                         std::string_view content_type);

    /**
     * @brief Delete an object.
     * @returns NotFound if the object (or its bucket) does not exist.
     */
    [[nodiscard]] RequestResult delete_object(std::string_view bucket_name,
                                              std::string_view object_name);

    /**
     * @brief Copy an object server-side, replacing the destination.
     * @returns NotFound if the source object does not exist.
     */
    [[nodiscard]] RequestResult copy_object(std::string_view src_bucket_name,
                                            std::string_view src_object_name,
                                            std::string_view dst_bucket_name,
                                            std::string_view dst_object_name);

    /**
     * @brief List the keys of all objects in a bucket beginning with a
     * prefix.
     * @throws std::runtime_error if the listing fails.
     */
    std::vector<std::string> list_objects(std::string_view bucket_name,
                                          std::string_view prefix);

    /* Multipart object operations */

    /// @brief Create a multipart object.
    /// @param bucket_name The name of the bucket containing the object.
    /// @param object_name The name of the object.
    /// @param content_type Value of the Content-Type header.
    /// @returns The upload id of the multipart object. Nonempty if and only if
    ///          the operation succeeds.
    /// @throws std::runtime_error if the bucket name is empty or the object
    ///         name is empty.
    [[nodiscard]] std::string create_multipart_object(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view content_type);

    /// @brief Upload a part of a multipart object.
    /// @returns The etag of the uploaded part. Nonempty if and only if the
    ///          operation is successful.
    [[nodiscard]] std::string upload_multipart_object_part(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      std::span<uint8_t> data,
      unsigned int part_number);

    /// @brief Complete a multipart object.
    /// @returns True if the operation is successful, false otherwise.
    [[nodiscard]] bool complete_multipart_object(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      const std::list<minio::s3::Part>& parts);

  private:
    std::unique_ptr<minio::s3::Client> client_;
    std::unique_ptr<minio::creds::StaticProvider> provider_;
};

class S3ConnectionPool
{
  public:
    S3ConnectionPool(size_t n_connections,
                     const std::string& endpoint,
                     const std::string& access_key_id,
                     const std::string& secret_access_key);
    ~S3ConnectionPool();

    /**
     * @brief Borrow a connection, blocking until one is available.
     * @return A connection, or nullptr if the pool is shutting down.
     */
    std::unique_ptr<S3Connection> get_connection();
    void return_connection(std::unique_ptr<S3Connection>&& conn);

  private:
    std::vector<std::unique_ptr<S3Connection>> connections_;
    mutable std::mutex connections_mutex_;
    std::condition_variable cv_;

    std::atomic<bool> is_accepting_connections_{ true };
};
} // namespace shardsink
