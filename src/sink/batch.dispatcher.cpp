#include "batch.dispatcher.hh"
#include "macros.hh"

#include <latch>

namespace {
class FlushingGuard
{
  public:
    explicit FlushingGuard(bool& flushing)
      : flushing_(flushing)
    {
        flushing_ = true;
    }
    ~FlushingGuard() { flushing_ = false; }

  private:
    bool& flushing_;
};
} // namespace

shardsink::ThreadPoolBatch::ThreadPoolBatch(
  std::shared_ptr<ThreadPool> thread_pool)
  : thread_pool_{ thread_pool }
{
    EXPECT(thread_pool_, "Thread pool not provided.");
}

void
shardsink::ThreadPoolBatch::add(Request&& request, RequestCallback&& callback)
{
    entries_.push_back({ std::move(request), std::move(callback), {} });
}

size_t
shardsink::ThreadPoolBatch::size() const
{
    return entries_.size();
}

void
shardsink::ThreadPoolBatch::execute()
{
    if (entries_.empty()) {
        return;
    }

    std::vector<Entry> entries;
    entries.swap(entries_);

    std::latch latch(static_cast<std::ptrdiff_t>(entries.size()));
    for (auto& entry : entries) {
        auto job = [&entry, &latch](std::string&) {
            try {
                entry.result = entry.request();
            } catch (const std::exception& exc) {
                entry.result = { RequestStatus::Failure, exc.what() };
            } catch (...) {
                entry.result = { RequestStatus::Failure,
                                 "Request threw an unknown exception." };
            }

            latch.count_down();
            return true;
        };

        if (!thread_pool_->push_job(std::move(job))) {
            LOG_ERROR("Failed to push job to thread pool.");
            entry.result = { RequestStatus::Failure,
                             "Thread pool is not accepting jobs." };
            latch.count_down();
        }
    }

    latch.wait();

    for (const auto& entry : entries) {
        if (entry.callback) {
            entry.callback(entry.result);
        }
    }
}

shardsink::BatchDispatcher::BatchDispatcher(std::unique_ptr<RequestBatch> batch,
                                            size_t max_requests_per_batch)
  : batch_{ std::move(batch) }
  , max_requests_per_batch_{ max_requests_per_batch }
{
    EXPECT(batch_, "Request batch not provided.");
    EXPECT(max_requests_per_batch_ > 0,
           "Maximum requests per batch must be positive.");
}

void
shardsink::BatchDispatcher::queue(Request&& request, RequestCallback&& callback)
{
    pending_.emplace_back([this,
                           request = std::move(request),
                           callback = std::move(callback)]() mutable {
        batch_->add(std::move(request), std::move(callback));
    });

    flush_if_possible_and_required_();
}

void
shardsink::BatchDispatcher::flush()
{
    while (!flushing_ && !pending_.empty()) {
        flush_if_possible_();
    }
}

size_t
shardsink::BatchDispatcher::pending() const
{
    return pending_.size();
}

void
shardsink::BatchDispatcher::flush_if_possible_and_required_()
{
    if (pending_.size() >= max_requests_per_batch_) {
        flush_if_possible_();
    }
}

void
shardsink::BatchDispatcher::flush_if_possible_()
{
    if (flushing_ || pending_.empty()) {
        return;
    }

    FlushingGuard guard(flushing_);
    while (batch_->size() < max_requests_per_batch_ && !pending_.empty()) {
        auto enqueue = std::move(pending_.front());
        pending_.pop_front();
        enqueue();
    }

    LOG_DEBUG("Sending batch of ", batch_->size(), " requests.");
    batch_->execute();
}
