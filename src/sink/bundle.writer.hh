#pragma once

#include "bundle.result.hh"
#include "channel.hh"
#include "filesystem.hh"
#include "format.writer.hh"

#include <memory>
#include <string>
#include <string_view>

namespace shardsink {
inline constexpr std::string_view kTemporaryFilenameSeparator = "-temp-";

/**
 * @brief Name of the temporary file for one bundle attempt.
 * @return @p prefix, "-temp-", then @p suffix.
 */
std::string
build_temporary_filename(std::string_view prefix, std::string_view suffix);

/**
 * @brief Writes one bundle attempt to its own temporary file.
 */
class BundleWriter
{
  public:
    enum class State
    {
        Created,
        Open,
        HeaderWritten,
        Writing,
        FooterWritten,
        Closed,
        Failed
    };

    BundleWriter(std::string_view base_temporary_filename,
                 std::shared_ptr<Filesystem> filesystem,
                 std::unique_ptr<FormatWriter> format);
    ~BundleWriter();

    BundleWriter(const BundleWriter&) = delete;
    BundleWriter& operator=(const BundleWriter&) = delete;

    /**
     * @brief Create the temporary file for @p attempt_id and write the header.
     * @details If preparing the channel or writing the header fails, the
     * channel is closed before the original exception is rethrown.
     * @throws Whatever the filesystem or format throws.
     */
    void open(std::string_view attempt_id);

    /**
     * @brief Append one record.
     * @throws std::runtime_error if the writer is not open, or whatever the
     * format throws.
     */
    void write(ConstByteSpan record);

    /**
     * @brief Write the footer and close the temporary file.
     * @details The channel is released whether or not the footer is written.
     * @return The result naming the temporary file.
     * @throws std::runtime_error if the writer was never opened or the file
     * cannot be flushed.
     */
    [[nodiscard]] BundleResult close();

    State state() const;
    const std::string& filename() const;
    std::string_view mime_type() const;

  private:
    std::string base_temporary_filename_;
    std::shared_ptr<Filesystem> filesystem_;
    std::unique_ptr<FormatWriter> format_;

    std::string attempt_id_;
    std::string filename_;
    std::unique_ptr<WritableChannel> channel_;
    State state_{ State::Created };

    /// Close a channel during error cleanup, logging any failure.
    void release_channel_quietly_(std::unique_ptr<WritableChannel> channel);
};

const char*
bundle_writer_state_to_string(BundleWriter::State state);
} // namespace shardsink
