#include "file.operations.hh"
#include "unit.test.macros.hh"

#include <deque>
#include <vector>

using namespace shardsink;

namespace {
struct BatchScript
{
    std::deque<RequestResult> results; // handed out in request order
    std::vector<size_t> batch_sizes;   // one entry per execute()
};

// Answers each request from the script instead of contacting the store.
class ScriptedBatch : public RequestBatch
{
  public:
    explicit ScriptedBatch(BatchScript& script)
      : script_(script)
    {
    }

    void add(Request&&, RequestCallback&& callback) override
    {
        callbacks_.push_back(std::move(callback));
    }

    size_t size() const override { return callbacks_.size(); }

    void execute() override
    {
        auto callbacks = std::move(callbacks_);
        callbacks_.clear();

        script_.batch_sizes.push_back(callbacks.size());
        for (auto& callback : callbacks) {
            RequestResult result;
            if (!script_.results.empty()) {
                result = script_.results.front();
                script_.results.pop_front();
            }
            callback(result);
        }
    }

  private:
    BatchScript& script_;
    std::vector<RequestCallback> callbacks_;
};

S3FileOperations
make_operations(BatchScript& script, size_t max_requests_per_batch)
{
    return S3FileOperations(
      nullptr,
      [&script] { return std::make_unique<ScriptedBatch>(script); },
      max_requests_per_batch);
}

std::vector<std::string>
make_uris(const std::string& stem, size_t n)
{
    std::vector<std::string> uris;
    for (auto i = 0u; i < n; ++i) {
        uris.push_back("s3://bucket/" + stem + std::to_string(i));
    }
    return uris;
}

const RequestResult not_found{ RequestStatus::NotFound, "NoSuchKey" };
const RequestResult failure{ RequestStatus::Failure, "AccessDenied" };
} // namespace

int
main()
{
    int retval = 1;

    try {
        // missing objects are skipped on copy
        {
            BatchScript script;
            script.results = { not_found, {}, not_found };
            auto operations = make_operations(script, 1);

            operations.copy(make_uris("src-", 3), make_uris("dst-", 3));
            EXPECT_EQ(size_t, script.batch_sizes.size(), 3);
        }

        // and on remove
        {
            BatchScript script;
            script.results = { not_found, not_found };
            auto operations = make_operations(script, 10);

            operations.remove(make_uris("tmp-", 2));
            EXPECT_EQ(size_t, script.batch_sizes.size(), 1);
            EXPECT_EQ(size_t, script.batch_sizes.front(), 2);
        }

        // any other failure throws, and no later batch is sent
        {
            BatchScript script;
            script.results = { {}, {}, failure, {}, {}, {} };
            auto operations = make_operations(script, 2);

            EXPECT_THROWS(
              std::runtime_error,
              operations.copy(make_uris("src-", 6), make_uris("dst-", 6)));
            EXPECT_EQ(size_t, script.batch_sizes.size(), 2);
            EXPECT_EQ(size_t, script.results.size(), 3);
        }
        {
            BatchScript script;
            script.results = { failure, {}, {} };
            auto operations = make_operations(script, 2);

            EXPECT_THROWS(std::runtime_error,
                          operations.remove(make_uris("tmp-", 3)));
            EXPECT_EQ(size_t, script.batch_sizes.size(), 1);
        }

        // a failure in the final, partial batch still throws
        {
            BatchScript script;
            script.results = { {}, {}, {}, not_found, failure };
            auto operations = make_operations(script, 2);

            EXPECT_THROWS(std::runtime_error,
                          operations.remove(make_uris("tmp-", 5)));
            EXPECT_EQ(size_t, script.batch_sizes.size(), 3);
        }

        // argument errors are raised before any batch is created
        {
            BatchScript script;
            auto operations = make_operations(script, 2);

            EXPECT_THROWS(
              std::invalid_argument,
              operations.copy(make_uris("src-", 2), make_uris("dst-", 1)));
            EXPECT_THROWS(std::runtime_error,
                          operations.remove({ "/local/path" }));
            CHECK(script.batch_sizes.empty());
        }

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
