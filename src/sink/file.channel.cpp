#include "file.channel.hh"
#include "macros.hh"

shardsink::FileChannel::FileChannel(std::string_view filename)
  : filename_(filename)
  , file_(filename_, std::ios::binary | std::ios::trunc)
{
    EXPECT(file_.is_open(), "Failed to open file '", filename_, "'.");
}

bool
shardsink::FileChannel::write(ConstByteSpan data)
{
    if (data.data() == nullptr || data.empty()) {
        return true;
    }

    file_.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(data.size()));
    if (!file_) {
        LOG_ERROR("Failed to write ", data.size(), " bytes to ", filename_);
        return false;
    }

    return true;
}

bool
shardsink::FileChannel::flush_()
{
    file_.flush();
    file_.close();
    if (file_.fail()) {
        LOG_ERROR("Failed to flush file ", filename_);
        return false;
    }

    return true;
}
