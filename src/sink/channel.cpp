#include "channel.hh"
#include "macros.hh"

bool
shardsink::finalize_channel(std::unique_ptr<WritableChannel>&& channel)
{
    if (channel == nullptr) {
        LOG_INFO("Channel is null. Nothing to finalize.");
        return true;
    }

    // released even if flushing throws
    const auto owned = std::move(channel);
    return owned->flush_();
}
