#pragma once

#include "definitions.hh"

#include <memory> // std::unique_ptr

namespace shardsink {
/**
 * @brief An append-only byte channel to one file or object.
 * @details A channel is released with finalize_channel(), which flushes it
 * and destroys it. Destroying a channel without finalizing it releases the
 * underlying resource without flushing buffered data.
 */
class WritableChannel
{
  public:
    virtual ~WritableChannel() = default;

    /**
     * @brief Append data to the channel.
     * @param data The buffer to append.
     * @return True if the write was successful, false otherwise.
     */
    [[nodiscard]] virtual bool write(ConstByteSpan data) = 0;

  protected:
    [[nodiscard]] virtual bool flush_() = 0;

    friend bool finalize_channel(std::unique_ptr<WritableChannel>&& channel);
};

/**
 * @brief Flush and release a channel.
 * @details @p channel is null on return, whether or not flushing succeeds
 * or throws.
 * @return True if the channel was null or flushed successfully.
 */
bool
finalize_channel(std::unique_ptr<WritableChannel>&& channel);
} // namespace shardsink
