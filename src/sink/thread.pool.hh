#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace shardsink {
/**
 * @brief Fixed set of worker threads shared by every remote batch and
 * filesystem operation of one sink.
 */
class ThreadPool
{
  public:
    using Task = std::function<bool(std::string&)>;
    using ErrorCallback = std::function<void(const std::string&)>;

    // The error handler `err` is called when a job returns false or throws.
    // The argument is the job's diagnostic message, or the exception's
    // what() string.
    ThreadPool(unsigned int n_threads, ErrorCallback&& err);

    /// Runs every job already queued, then joins the workers.
    ~ThreadPool() noexcept;

    /**
     * @brief Push a job onto the job queue.
     * @param job The job to push onto the queue.
     * @return True if the job was queued, false if the pool is stopping.
     */
    [[nodiscard]] bool push_job(Task&& job);

    /**
     * @brief Stop accepting jobs, drain the queue and join the workers.
     */
    void await_stop() noexcept;

    size_t n_threads() const noexcept;

    /// Number of jobs that returned false or threw so far.
    size_t n_failed_jobs() const;

  private:
    ErrorCallback error_handler_;

    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> jobs_;

    bool is_accepting_jobs_{ true };
    size_t n_failed_jobs_{ 0 };

    /// Block until a job is available; nullopt once stopped and drained.
    std::optional<Task> next_job_();
    void run_job_(Task& job);
    void worker_loop_();
};
} // namespace shardsink
