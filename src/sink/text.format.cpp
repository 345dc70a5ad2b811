#include "macros.hh"
#include "text.format.hh"

namespace {
constexpr std::byte newline{ '\n' };

ConstByteSpan
as_bytes(const std::string& s)
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}
} // namespace

shardsink::TextFormatWriter::TextFormatWriter(std::optional<std::string> header,
                                              std::optional<std::string> footer)
  : header_(std::move(header))
  , footer_(std::move(footer))
{
}

void
shardsink::TextFormatWriter::prepare_write(WritableChannel& channel)
{
    channel_ = &channel;
}

void
shardsink::TextFormatWriter::write_header()
{
    if (header_) {
        write_line_(as_bytes(*header_));
    }
}

void
shardsink::TextFormatWriter::write_value(ConstByteSpan value)
{
    write_line_(value);
}

void
shardsink::TextFormatWriter::write_footer()
{
    if (footer_) {
        write_line_(as_bytes(*footer_));
    }
}

void
shardsink::TextFormatWriter::write_line_(ConstByteSpan line)
{
    EXPECT(channel_, "Channel not prepared for writing.");
    EXPECT(channel_->write(line), "Failed to write record.");
    EXPECT(channel_->write({ &newline, 1 }), "Failed to write newline.");
}

shardsink::FormatWriterFactory
shardsink::make_text_format(std::optional<std::string> header,
                            std::optional<std::string> footer)
{
    return [header = std::move(header), footer = std::move(footer)] {
        return std::make_unique<TextFormatWriter>(header, footer);
    };
}
