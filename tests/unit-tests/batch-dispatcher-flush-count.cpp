#include "batch.dispatcher.hh"
#include "unit.test.macros.hh"

#include <vector>

using namespace shardsink;

namespace {
struct BatchLog
{
    std::vector<size_t> batch_sizes; // one entry per execute()
    std::vector<int> executed;       // request ids, in execution order
};

// Runs requests synchronously and records every round.
class RecordingBatch : public RequestBatch
{
  public:
    explicit RecordingBatch(BatchLog& log)
      : log_(log)
    {
    }

    void add(Request&& request, RequestCallback&& callback) override
    {
        entries_.emplace_back(std::move(request), std::move(callback));
    }

    size_t size() const override { return entries_.size(); }

    void execute() override
    {
        auto entries = std::move(entries_);
        entries_.clear();

        log_.batch_sizes.push_back(entries.size());
        for (auto& [request, callback] : entries) {
            callback(request());
        }
    }

  private:
    BatchLog& log_;
    std::vector<std::pair<Request, RequestCallback>> entries_;
};

void
check_flushes(size_t n_requests, size_t max_per_batch)
{
    BatchLog log;
    BatchDispatcher dispatcher(std::make_unique<RecordingBatch>(log),
                               max_per_batch);

    std::vector<int> completed;
    for (auto i = 0u; i < n_requests; ++i) {
        const int id = static_cast<int>(i);
        dispatcher.queue(
          [&log, id] {
              log.executed.push_back(id);
              return RequestResult{};
          },
          [&completed, id](const RequestResult& result) {
              CHECK(result.ok());
              completed.push_back(id);
          });
    }

    // only full batches are sent while queueing
    EXPECT_EQ(size_t, log.batch_sizes.size(), n_requests / max_per_batch);
    for (const auto size : log.batch_sizes) {
        EXPECT_EQ(size_t, size, max_per_batch);
    }
    EXPECT_EQ(size_t, dispatcher.pending(), n_requests % max_per_batch);

    dispatcher.flush();
    EXPECT_EQ(size_t, dispatcher.pending(), 0);

    const size_t expected_batches =
      n_requests / max_per_batch + (n_requests % max_per_batch ? 1 : 0);
    EXPECT_EQ(size_t, log.batch_sizes.size(), expected_batches);

    // every request ran exactly once, in queue order
    EXPECT_EQ(size_t, log.executed.size(), n_requests);
    EXPECT_EQ(size_t, completed.size(), n_requests);
    for (auto i = 0u; i < n_requests; ++i) {
        EXPECT_EQ(int, log.executed[i], i);
        EXPECT_EQ(int, completed[i], i);
    }

    // flushing again sends nothing
    dispatcher.flush();
    EXPECT_EQ(size_t, log.batch_sizes.size(), expected_batches);
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        check_flushes(0, 3);
        check_flushes(1, 3);
        check_flushes(3, 3);
        check_flushes(7, 3);
        check_flushes(9, 3);
        check_flushes(10, 1);
        check_flushes(2500, 1000);

        EXPECT_THROWS(std::runtime_error,
                      BatchDispatcher(nullptr, 10));

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
