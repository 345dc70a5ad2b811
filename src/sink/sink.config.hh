#pragma once

#include <cstddef> // size_t
#include <string>
#include <string_view>

namespace shardsink {
/// Shards named like "-0001-of-0004".
inline constexpr std::string_view kShardNameTemplateIndexOfMax =
  "-SSSS-of-NNNN";
/// Shards placed in a directory named after the output, like "/part-0001".
inline constexpr std::string_view kShardNameTemplateDirectoryContainer =
  "/part-SSSS";
/// A single output file with no shard number.
inline constexpr std::string_view kShardNameTemplateNone = "";

/**
 * @brief Naming parameters of a file-based sink.
 */
class SinkConfig
{
  public:
    /**
     * @throws std::invalid_argument if @p base_output_filename is empty.
     */
    SinkConfig(std::string_view base_output_filename,
               std::string_view extension,
               std::string_view naming_template = kShardNameTemplateIndexOfMax);

    const std::string& base_output_filename() const;
    const std::string& extension() const;
    const std::string& naming_template() const;

    /**
     * @brief The suffix appended to every output filename: empty if there is
     * no extension, otherwise the extension with exactly one leading dot.
     */
    std::string file_extension_suffix() const;

    /// True if the naming template renders the shard index.
    bool is_sharded() const;

  private:
    std::string base_output_filename_;
    std::string extension_;
    std::string naming_template_;
};

/**
 * @brief Render a shard filename.
 * @details Each run of 'S' in @p shard_template is replaced by @p shard_index
 * and each run of 'N' by @p n_shards, zero-padded to the length of the run.
 * Numbers wider than the run are written in full.
 * @return @p prefix, the rendered template, then @p suffix.
 */
std::string
construct_shard_name(std::string_view prefix,
                     std::string_view shard_template,
                     std::string_view suffix,
                     size_t shard_index,
                     size_t n_shards);
} // namespace shardsink
