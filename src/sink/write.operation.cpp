#include "macros.hh"
#include "write.operation.hh"

#include <algorithm>

shardsink::WriteOperation::WriteOperation(
  SinkConfig config,
  FormatWriterFactory make_format,
  std::shared_ptr<FilesystemFactory> filesystems,
  std::string_view base_temporary_filename,
  TemporaryFileRetention retention)
  : config_(std::move(config))
  , make_format_(std::move(make_format))
  , filesystems_(filesystems)
  , base_temporary_filename_(base_temporary_filename.empty()
                               ? config_.base_output_filename()
                               : std::string(base_temporary_filename))
  , retention_(retention)
{
    EXPECT(make_format_, "Format writer factory not provided.");
    EXPECT(filesystems_, "Filesystem factory not provided.");
}

void
shardsink::WriteOperation::initialize()
{
}

std::unique_ptr<shardsink::BundleWriter>
shardsink::WriteOperation::create_writer() const
{
    return std::make_unique<BundleWriter>(
      base_temporary_filename_,
      filesystems_->make_filesystem(base_temporary_filename_),
      make_format_());
}

void
shardsink::WriteOperation::finalize(const std::vector<BundleResult>& results)
{
    // collect names of temporary files and copy them
    std::vector<std::string> files;
    files.reserve(results.size());
    for (const auto& result : results) {
        LOG_DEBUG("Temporary bundle output file ",
                  result.filename,
                  " will be copied.");
        files.push_back(result.filename);
    }
    copy_to_output_files(files);

    if (retention_ == TemporaryFileRetention::Remove) {
        remove_temporary_files();
    }
}

std::vector<std::string>
shardsink::WriteOperation::copy_to_output_files(
  const std::vector<std::string>& filenames)
{
    const auto n_files = filenames.size();
    EXPECT(n_files <= 1 || config_.is_sharded(),
           "Naming template '",
           config_.naming_template(),
           "' has no shard index but ",
           n_files,
           " files were committed.");

    auto dst_filenames = generate_destination_filenames(n_files);

    // shard order is the sorted order of the temporary files
    std::vector<std::string> src_filenames(filenames);
    std::sort(src_filenames.begin(), src_filenames.end());

    if (n_files > 0) {
        LOG_DEBUG("Copying ", n_files, " files.");
        auto file_operations =
          filesystems_->make_file_operations(dst_filenames.front());
        file_operations->copy(src_filenames, dst_filenames);
    } else {
        LOG_INFO("No output files to write.");
    }

    return dst_filenames;
}

std::vector<std::string>
shardsink::WriteOperation::generate_destination_filenames(size_t n_files) const
{
    const auto suffix = config_.file_extension_suffix();

    std::vector<std::string> dst_filenames;
    dst_filenames.reserve(n_files);
    for (auto i = 0u; i < n_files; ++i) {
        dst_filenames.push_back(
          construct_shard_name(config_.base_output_filename(),
                               config_.naming_template(),
                               suffix,
                               i,
                               n_files));
    }

    return dst_filenames;
}

void
shardsink::WriteOperation::remove_temporary_files()
{
    const auto pattern = build_temporary_filename(base_temporary_filename_, "*");
    LOG_DEBUG("Finding temporary bundle output files matching ", pattern);

    auto file_operations = filesystems_->make_file_operations(pattern);
    auto filesystem = filesystems_->make_filesystem(pattern);

    const auto matches = filesystem->match(pattern);
    LOG_DEBUG(matches.size(), " temporary files matched ", pattern);

    file_operations->remove(matches);
}

shardsink::BundleResultCoder
shardsink::WriteOperation::writer_result_coder() const
{
    return {};
}

const shardsink::SinkConfig&
shardsink::WriteOperation::sink_config() const
{
    return config_;
}

const std::string&
shardsink::WriteOperation::base_temporary_filename() const
{
    return base_temporary_filename_;
}

shardsink::TemporaryFileRetention
shardsink::WriteOperation::temporary_file_retention() const
{
    return retention_;
}
