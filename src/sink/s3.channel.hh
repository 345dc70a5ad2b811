#pragma once

#include "channel.hh"
#include "s3.connection.hh"

#include <miniocpp/types.h>

#include <list>
#include <optional>
#include <string>
#include <vector>

namespace shardsink {
class S3Channel : public WritableChannel
{
  public:
    S3Channel(std::string_view bucket_name,
              std::string_view object_key,
              std::string_view content_type,
              std::shared_ptr<S3ConnectionPool> connection_pool);

    bool write(ConstByteSpan data) override;

  protected:
    bool flush_() override;

  private:
    struct MultiPartUpload
    {
        std::string upload_id;
        std::list<minio::s3::Part> parts;
    };

    static constexpr size_t max_part_size_ = 5 << 20;
    std::string bucket_name_;
    std::string object_key_;
    std::string content_type_;

    std::shared_ptr<S3ConnectionPool> connection_pool_;

    std::vector<std::byte> part_buffer_;
    size_t nbytes_buffered_{ 0 };

    std::optional<MultiPartUpload> multipart_upload_;

    /**
     * @brief Upload the buffered bytes as a single object.
     * @return True if the object was successfully uploaded, otherwise false.
     */
    [[nodiscard]] bool put_object_();

    /**
     * @brief Check if a multipart upload is in progress.
     * @return True if a multipart upload is in progress, otherwise false.
     */
    bool is_multipart_upload_() const;

    /**
     * @brief Create a new multipart upload.
     * @return True if an upload id was obtained, otherwise false.
     */
    [[nodiscard]] bool create_multipart_upload_();

    /**
     * @brief Flush the current part to S3.
     * @return True if the part was successfully flushed, otherwise false.
     */
    [[nodiscard]] bool flush_part_();

    /**
     * @brief Finalize the multipart upload.
     * @returns True if a multipart upload was successfully finalized,
     * otherwise false.
     */
    [[nodiscard]] bool finalize_multipart_upload_();
};
} // namespace shardsink
