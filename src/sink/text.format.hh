#pragma once

#include "format.writer.hh"

#include <optional>
#include <string>

namespace shardsink {
/**
 * @brief Newline-delimited records, with an optional header line and an
 * optional footer line.
 */
class TextFormatWriter : public FormatWriter
{
  public:
    TextFormatWriter(std::optional<std::string> header = std::nullopt,
                     std::optional<std::string> footer = std::nullopt);

    void prepare_write(WritableChannel& channel) override;
    void write_header() override;
    void write_value(ConstByteSpan value) override;
    void write_footer() override;

  private:
    std::optional<std::string> header_;
    std::optional<std::string> footer_;
    WritableChannel* channel_{ nullptr };

    void write_line_(ConstByteSpan line);
};

/// @brief Make a factory producing TextFormatWriters with the given lines.
FormatWriterFactory
make_text_format(std::optional<std::string> header = std::nullopt,
                 std::optional<std::string> footer = std::nullopt);
} // namespace shardsink
