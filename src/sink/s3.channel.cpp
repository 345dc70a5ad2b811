#include "macros.hh"
#include "s3.channel.hh"

#include <algorithm>

#ifdef min
#undef min
#endif

shardsink::S3Channel::S3Channel(
  std::string_view bucket_name,
  std::string_view object_key,
  std::string_view content_type,
  std::shared_ptr<S3ConnectionPool> connection_pool)
  : bucket_name_{ bucket_name }
  , object_key_{ object_key }
  , content_type_{ content_type }
  , connection_pool_{ connection_pool }
  , part_buffer_(max_part_size_)
{
    EXPECT(!bucket_name_.empty(), "Bucket name must not be empty");
    EXPECT(!object_key_.empty(), "Object key must not be empty");
    EXPECT(connection_pool_, "Null pointer: connection_pool");
}

bool
shardsink::S3Channel::flush_()
{
    if (is_multipart_upload_()) {
        const auto& parts = multipart_upload_->parts;
        if (nbytes_buffered_ > 0 && !flush_part_()) {
            LOG_ERROR("Failed to upload part ",
                      parts.size() + 1,
                      " of object ",
                      object_key_);
            return false;
        }
        if (!finalize_multipart_upload_()) {
            LOG_ERROR("Failed to finalize multipart upload of object ",
                      object_key_);
            return false;
        }
    } else if (!put_object_()) {
        // an empty bundle still produces an (empty) object
        LOG_ERROR("Failed to upload object: ", object_key_);
        return false;
    }

    // cleanup
    nbytes_buffered_ = 0;

    return true;
}

bool
shardsink::S3Channel::write(ConstByteSpan data)
{
    if (data.data() == nullptr || data.empty()) {
        return true;
    }

    size_t bytes_of_data = data.size();
    const std::byte* data_ptr = data.data();
    while (bytes_of_data > 0) {
        const auto bytes_to_write =
          std::min(bytes_of_data, part_buffer_.size() - nbytes_buffered_);

        if (bytes_to_write) {
            std::copy_n(data_ptr,
                        bytes_to_write,
                        part_buffer_.begin() +
                          static_cast<std::ptrdiff_t>(nbytes_buffered_));
            nbytes_buffered_ += bytes_to_write;
            data_ptr += bytes_to_write;
            bytes_of_data -= bytes_to_write;
        }

        if (nbytes_buffered_ == part_buffer_.size() && !flush_part_()) {
            return false;
        }
    }

    return true;
}

bool
shardsink::S3Channel::put_object_()
{
    auto connection = connection_pool_->get_connection();
    if (connection == nullptr) {
        LOG_ERROR("No S3 connection available for object ", object_key_);
        return false;
    }

    std::span data(reinterpret_cast<uint8_t*>(part_buffer_.data()),
                   nbytes_buffered_);

    bool retval = false;
    try {
        std::string etag = connection->put_object(
          bucket_name_, object_key_, data, content_type_);
        EXPECT(!etag.empty(), "Failed to upload object: ", object_key_);

        retval = true;
        nbytes_buffered_ = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Error: ", exc.what());
    }

    // cleanup
    connection_pool_->return_connection(std::move(connection));

    return retval;
}

bool
shardsink::S3Channel::is_multipart_upload_() const
{
    return multipart_upload_.has_value();
}

bool
shardsink::S3Channel::create_multipart_upload_()
{
    if (!is_multipart_upload_()) {
        multipart_upload_ = MultiPartUpload{};
    }

    if (!multipart_upload_->upload_id.empty()) {
        return true;
    }

    auto connection = connection_pool_->get_connection();
    if (connection == nullptr) {
        LOG_ERROR("No S3 connection available for object ", object_key_);
        return false;
    }

    try {
        multipart_upload_->upload_id = connection->create_multipart_object(
          bucket_name_, object_key_, content_type_);
    } catch (const std::exception& exc) {
        LOG_ERROR("Error: ", exc.what());
    }

    connection_pool_->return_connection(std::move(connection));

    return !multipart_upload_->upload_id.empty();
}

bool
shardsink::S3Channel::flush_part_()
{
    if (nbytes_buffered_ == 0) {
        return false;
    }

    if (!create_multipart_upload_()) {
        return false;
    }

    auto connection = connection_pool_->get_connection();
    if (connection == nullptr) {
        LOG_ERROR("No S3 connection available for object ", object_key_);
        return false;
    }

    bool retval = false;
    try {
        auto& parts = multipart_upload_->parts;

        minio::s3::Part part;
        part.number = static_cast<unsigned int>(parts.size()) + 1;

        std::span data(reinterpret_cast<uint8_t*>(part_buffer_.data()),
                       nbytes_buffered_);
        part.etag =
          connection->upload_multipart_object_part(bucket_name_,
                                                   object_key_,
                                                   multipart_upload_->upload_id,
                                                   data,
                                                   part.number);
        EXPECT(!part.etag.empty(),
               "Failed to upload part ",
               part.number,
               " of object ",
               object_key_);

        parts.push_back(part);

        retval = true;
    } catch (const std::exception& exc) {
        LOG_ERROR("Error: ", exc.what());
    }

    // cleanup
    connection_pool_->return_connection(std::move(connection));
    nbytes_buffered_ = 0;

    return retval;
}

bool
shardsink::S3Channel::finalize_multipart_upload_()
{
    auto connection = connection_pool_->get_connection();
    if (connection == nullptr) {
        LOG_ERROR("No S3 connection available for object ", object_key_);
        return false;
    }

    const auto& upload_id = multipart_upload_->upload_id;
    const auto& parts = multipart_upload_->parts;

    bool retval = false;
    try {
        retval = connection->complete_multipart_object(
          bucket_name_, object_key_, upload_id, parts);
    } catch (const std::exception& exc) {
        LOG_ERROR("Error: ", exc.what());
    }

    connection_pool_->return_connection(std::move(connection));

    return retval;
}
