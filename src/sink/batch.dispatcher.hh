#pragma once

#include "definitions.hh"
#include "thread.pool.hh"

#include <deque>
#include <functional>
#include <memory>
#include <vector>

namespace shardsink {
using Request = std::function<RequestResult()>;
using RequestCallback = std::function<void(const RequestResult&)>;

/**
 * @brief A set of requests sent to the remote store in one round.
 */
class RequestBatch
{
  public:
    virtual ~RequestBatch() = default;

    virtual void add(Request&& request, RequestCallback&& callback) = 0;
    [[nodiscard]] virtual size_t size() const = 0;

    /**
     * @brief Send every added request, then invoke their callbacks in the
     * order the requests were added.
     * @details The batch is empty when this returns, even if a callback
     * throws.
     * @throws Whatever a callback throws. Remaining callbacks are skipped.
     */
    virtual void execute() = 0;
};

/**
 * @brief A batch whose requests run concurrently on a thread pool.
 * @details Requests must not throw; an exception escaping a request is
 * reported to its callback as a failed RequestResult.
 */
class ThreadPoolBatch : public RequestBatch
{
  public:
    explicit ThreadPoolBatch(std::shared_ptr<ThreadPool> thread_pool);

    void add(Request&& request, RequestCallback&& callback) override;
    size_t size() const override;
    void execute() override;

  private:
    struct Entry
    {
        Request request;
        RequestCallback callback;
        RequestResult result;
    };

    std::shared_ptr<ThreadPool> thread_pool_;
    std::vector<Entry> entries_;
};

/**
 * @brief Accumulates requests and sends them in batches of bounded size.
 * @details Not thread safe. Create one per copy or remove call.
 */
class BatchDispatcher
{
  public:
    static constexpr size_t default_max_requests_per_batch = 1000;

    BatchDispatcher(std::unique_ptr<RequestBatch> batch,
                    size_t max_requests_per_batch);

    /**
     * @brief Queue a request, sending a batch once the number of pending
     * requests reaches the maximum batch size.
     */
    void queue(Request&& request, RequestCallback&& callback);

    /// @brief Send all pending requests.
    void flush();

    size_t pending() const;

  private:
    std::unique_ptr<RequestBatch> batch_;
    const size_t max_requests_per_batch_;

    std::deque<std::function<void()>> pending_;
    bool flushing_{ false };

    void flush_if_possible_and_required_();
    void flush_if_possible_();
};
} // namespace shardsink
