#pragma once

#include "bundle.result.hh"
#include "bundle.writer.hh"
#include "filesystem.factory.hh"
#include "format.writer.hh"
#include "sink.config.hh"

#include <memory>
#include <string>
#include <vector>

namespace shardsink {
enum class TemporaryFileRetention
{
    Keep,
    Remove
};

/**
 * @brief Coordinates one run of a file-based sink: hands out bundle writers
 * and commits their temporary files to numbered output shards.
 * @details finalize() may be called again after a partial or complete run
 * with the same results (or a subset of them) without error or duplication.
 * Concurrent finalize() calls over the same temporary files are not
 * supported.
 */
class WriteOperation
{
  public:
    /**
     * @param config Output naming.
     * @param make_format Creates one format writer per bundle writer.
     * @param filesystems Resolves paths to storage backends.
     * @param base_temporary_filename Prefix for temporary files. Defaults to
     * the base output filename when empty.
     * @param retention Whether finalize() removes temporary files.
     */
    WriteOperation(
      SinkConfig config,
      FormatWriterFactory make_format,
      std::shared_ptr<FilesystemFactory> filesystems,
      std::string_view base_temporary_filename = {},
      TemporaryFileRetention retention = TemporaryFileRetention::Remove);
    virtual ~WriteOperation() = default;

    /**
     * @brief Prepare the sink before any bundle is written. Does nothing by
     * default. Must be safe to call more than once.
     */
    virtual void initialize();

    /**
     * @brief Create a writer for one bundle attempt. Safe to call from
     * several threads at once.
     */
    std::unique_ptr<BundleWriter> create_writer() const;

    /**
     * @brief Copy the temporary files of @p results to their final names and,
     * depending on the retention policy, remove all temporary files.
     * @throws std::runtime_error if a copy or removal fails for a reason other
     * than a missing file.
     */
    void finalize(const std::vector<BundleResult>& results);

    /**
     * @brief Copy @p filenames, in sorted order, to the output shards.
     * @return The destination filenames, one per source.
     */
    std::vector<std::string> copy_to_output_files(
      const std::vector<std::string>& filenames);

    /// @brief Names of the output shards for @p n_files committed bundles.
    std::vector<std::string> generate_destination_filenames(
      size_t n_files) const;

    /// @brief Remove every file matching "{base_temporary_filename}-temp-*".
    void remove_temporary_files();

    BundleResultCoder writer_result_coder() const;

    const SinkConfig& sink_config() const;
    const std::string& base_temporary_filename() const;
    TemporaryFileRetention temporary_file_retention() const;

  private:
    const SinkConfig config_;
    const FormatWriterFactory make_format_;
    const std::shared_ptr<FilesystemFactory> filesystems_;
    const std::string base_temporary_filename_;
    const TemporaryFileRetention retention_;
};
} // namespace shardsink
