#include "text.format.hh"
#include "unit.test.macros.hh"
#include "write.operation.hh"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace shardsink;

int
main()
{
    int retval = 1;

    const fs::path base_dir = fs::temp_directory_path() / TEST;
    const std::string base = (base_dir / "out").string();

    try {
        auto thread_pool = std::make_shared<ThreadPool>(
          1, [](const std::string& err) { LOG_ERROR(err); });
        auto filesystems =
          std::make_shared<FilesystemFactory>(thread_pool, nullptr, 10);

        WriteOperation operation(
          SinkConfig(base, "txt"), make_text_format(), filesystems);

        // nothing written and the directory does not exist yet
        operation.finalize({});
        CHECK(!fs::exists(base_dir));

        // an orphaned temporary file is still cleaned up
        fs::create_directories(base_dir);
        std::ofstream(base + "-temp-orphan") << "partial";
        CHECK(operation.copy_to_output_files({}).empty());
        operation.finalize({});
        CHECK(!fs::exists(base + "-temp-orphan"));
        CHECK(fs::is_empty(base_dir));

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
