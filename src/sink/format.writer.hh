#pragma once

#include "channel.hh"
#include "definitions.hh"

#include <functional>
#include <memory>
#include <string_view>

namespace shardsink {
inline constexpr std::string_view kMimeTypeText = "text/plain";

/**
 * @brief Encoding of records into one output file.
 * @details A BundleWriter calls prepare_write() once with the freshly created
 * channel, then write_header(), write_value() per record and write_footer().
 * The channel outlives every call. Implementations must not share mutable
 * state between instances, since writers for different bundles run
 * concurrently.
 */
class FormatWriter
{
  public:
    virtual ~FormatWriter() = default;

    virtual void prepare_write(WritableChannel& channel) = 0;
    virtual void write_header() {}
    virtual void write_value(ConstByteSpan value) = 0;
    virtual void write_footer() {}

    /// Content type of the files this format produces.
    virtual std::string_view mime_type() const { return kMimeTypeText; }
};

using FormatWriterFactory = std::function<std::unique_ptr<FormatWriter>()>;
} // namespace shardsink
