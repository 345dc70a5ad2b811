#include "thread.pool.hh"
#include "unit.test.macros.hh"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

int
main()
{
    int retval = 0;

    fs::path tmp_path = fs::temp_directory_path() / TEST;

    try {
        CHECK(!fs::exists(tmp_path));

        shardsink::ThreadPool pool{ 1, [](const std::string&) {} };

        CHECK(pool.push_job([&tmp_path](std::string&) {
            std::ofstream ofs(tmp_path);
            ofs << "Hello, ShardSink!";
            ofs.close();
            return true;
        }));
        pool.await_stop();

        // no more jobs after stopping
        CHECK(!pool.push_job([](std::string&) { return true; }));

        CHECK(fs::exists(tmp_path));

        std::ifstream ifs(tmp_path);
        CHECK(ifs.is_open());

        std::string contents;
        while (!ifs.eof()) {
            std::getline(ifs, contents);
        }
        ifs.close();

        EXPECT_STR_EQ(contents, "Hello, ShardSink!");

        // failing and throwing jobs reach the error handler; queued jobs
        // still run when the pool stops
        std::vector<std::string> errors;
        std::atomic<int> n_ran = 0;
        {
            shardsink::ThreadPool failing{
                1, [&errors](const std::string& err) { errors.push_back(err); }
            };
            EXPECT_EQ(size_t, failing.n_threads(), 1);

            CHECK(failing.push_job([&n_ran](std::string& err) {
                ++n_ran;
                err = "returned false";
                return false;
            }));
            CHECK(failing.push_job([&n_ran](std::string&) -> bool {
                ++n_ran;
                throw std::runtime_error("threw");
            }));
            CHECK(failing.push_job([&n_ran](std::string&) -> bool {
                ++n_ran;
                throw 7;
            }));
            for (auto i = 0; i < 7; ++i) {
                CHECK(failing.push_job([&n_ran](std::string&) {
                    ++n_ran;
                    return true;
                }));
            }
            failing.await_stop();
            EXPECT_EQ(size_t, failing.n_failed_jobs(), 3);
        }
        EXPECT_EQ(int, n_ran.load(), 10);
        EXPECT_EQ(size_t, errors.size(), 3);
        EXPECT_STR_EQ(errors[0], "returned false");
        EXPECT_STR_EQ(errors[1], "threw");
        EXPECT_STR_EQ(errors[2], "Job threw an unknown exception.");
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    std::error_code ec;
    if (!fs::remove(tmp_path, ec)) {
        LOG_ERROR("Failed to remove file: ", ec.message());
        retval = 1;
    }

    return retval;
}
