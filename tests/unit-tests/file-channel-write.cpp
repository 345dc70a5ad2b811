#include "file.channel.hh"
#include "unit.test.macros.hh"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {
std::string
read_file(const fs::path& path)
{
    std::ifstream file(path, std::ios::binary);
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}
} // namespace

int
main()
{
    int retval = 1;

    const fs::path base_dir = fs::temp_directory_path() / TEST;
    const fs::path filename = base_dir / "channel.bin";

    try {
        fs::create_directories(base_dir);
        {
            // an existing file is truncated
            std::ofstream stale(filename);
            stale << "stale contents that must disappear";
        }

        const std::string payload = "0123456789";
        {
            std::unique_ptr<shardsink::WritableChannel> channel =
              std::make_unique<shardsink::FileChannel>(filename.string());

            ConstByteSpan data(
              reinterpret_cast<const std::byte*>(payload.data()),
              payload.size());
            CHECK(channel->write(data));
            CHECK(channel->write(data.subspan(0, 3)));
            CHECK(channel->write({}));
            CHECK(shardsink::finalize_channel(std::move(channel)));
            CHECK(!channel);
        }

        EXPECT_STR_EQ(read_file(filename), payload + "012");

        // finalizing nothing is fine
        CHECK(shardsink::finalize_channel(nullptr));

        // missing parent directories are not created by the channel itself
        EXPECT_THROWS(std::runtime_error,
                      shardsink::FileChannel(
                        (base_dir / "missing" / "channel.bin").string()));

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
