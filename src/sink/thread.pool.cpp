#include "thread.pool.hh"

#include <algorithm>

shardsink::ThreadPool::ThreadPool(unsigned int n_threads, ErrorCallback&& err)
  : error_handler_{ std::move(err) }
{
    const auto max_threads = std::max(std::thread::hardware_concurrency(), 1u);
    n_threads = std::clamp(n_threads, 1u, max_threads);

    workers_.reserve(n_threads);
    for (auto i = 0u; i < n_threads; ++i) {
        workers_.emplace_back([this] { worker_loop_(); });
    }
}

shardsink::ThreadPool::~ThreadPool() noexcept
{
    await_stop();
}

bool
shardsink::ThreadPool::push_job(Task&& job)
{
    {
        std::scoped_lock lock(mutex_);
        if (!is_accepting_jobs_) {
            return false;
        }
        jobs_.push_back(std::move(job));
    }

    cv_.notify_one();
    return true;
}

void
shardsink::ThreadPool::await_stop() noexcept
{
    {
        std::scoped_lock lock(mutex_);
        is_accepting_jobs_ = false;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t
shardsink::ThreadPool::n_threads() const noexcept
{
    return workers_.size();
}

size_t
shardsink::ThreadPool::n_failed_jobs() const
{
    std::scoped_lock lock(mutex_);
    return n_failed_jobs_;
}

std::optional<shardsink::ThreadPool::Task>
shardsink::ThreadPool::next_job_()
{
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !is_accepting_jobs_ || !jobs_.empty(); });

    if (jobs_.empty()) {
        return std::nullopt; // stopped and drained
    }

    auto job = std::move(jobs_.front());
    jobs_.pop_front();
    return job;
}

void
shardsink::ThreadPool::run_job_(Task& job)
{
    std::string err_msg;
    bool succeeded = false;
    try {
        succeeded = job(err_msg);
    } catch (const std::exception& exc) {
        err_msg = exc.what();
    } catch (...) {
        err_msg = "Job threw an unknown exception.";
    }

    if (succeeded) {
        return;
    }

    {
        std::scoped_lock lock(mutex_);
        ++n_failed_jobs_;
    }

    if (error_handler_) {
        error_handler_(err_msg);
    }
}

void
shardsink::ThreadPool::worker_loop_()
{
    while (auto job = next_job_()) {
        run_job_(*job);
    }
}
