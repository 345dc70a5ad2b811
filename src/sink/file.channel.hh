#pragma once

#include "channel.hh"

#include <fstream>
#include <string>
#include <string_view>

namespace shardsink {
class FileChannel : public WritableChannel
{
  public:
    /**
     * @brief Open @p filename for writing, truncating it.
     * @throws std::runtime_error if the file cannot be opened.
     */
    explicit FileChannel(std::string_view filename);

    bool write(ConstByteSpan data) override;

  protected:
    bool flush_() override;

  private:
    std::string filename_;
    std::ofstream file_;
};
} // namespace shardsink
