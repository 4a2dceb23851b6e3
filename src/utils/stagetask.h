/**
 * @file stagetask.h
 * @brief Runs one pipeline stage on a dedicated worker thread.
 */

#ifndef STAGETASK_H
#define STAGETASK_H

#include <chrono>
#include <future>
#include <thread>
#include <utility>

/**
 * @brief A single stage invocation executing on its own thread.
 *
 * The caller blocks on the returned result through a future instead of
 * spinning an event loop. Exceptions thrown by the stage are rethrown from
 * take(). A task that is abandoned is detached and its thread handle is
 * never touched again.
 *
 * @par Example usage:
 * @code
 * auto fetcher = std::make_shared<ChunkedFetcher>(client);
 * StageTask<FetchResult> task([fetcher, url, path]() {
 *     return fetcher->fetch(url, path);
 * });
 * FetchResult result = task.take();
 * @endcode
 *
 * Anything the callable touches must be owned by the callable itself
 * (shared pointers or copies) so an abandoned stage cannot outlive it.
 */
template <typename Result>
class StageTask
{
public:
    template <typename Fn>
    explicit StageTask(Fn fn)
    {
        std::packaged_task<Result()> task(std::move(fn));
        future_ = task.get_future();
        thread_ = std::thread(std::move(task));
    }

    ~StageTask()
    {
        if (!thread_.joinable()) {
            return;
        }
        if (isFinished()) {
            thread_.join();
        } else {
            thread_.detach();
        }
    }

    StageTask(const StageTask &) = delete;
    StageTask &operator=(const StageTask &) = delete;

    /**
     * @brief Waits up to @p timeoutMs for the stage to return.
     * @return True if the result is available.
     */
    [[nodiscard]] bool waitFor(int timeoutMs)
    {
        return future_.wait_for(std::chrono::milliseconds(timeoutMs)) == std::future_status::ready;
    }

    [[nodiscard]] bool isFinished() const
    {
        return future_.valid()
            && future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    /**
     * @brief Joins the worker and returns its result.
     *
     * Blocks until the stage returns. Rethrows any exception it raised.
     */
    Result take()
    {
        Result result = future_.get();
        if (thread_.joinable()) {
            thread_.join();
        }
        return result;
    }

    /**
     * @brief Gives up on the worker without joining it.
     */
    void abandon()
    {
        if (thread_.joinable()) {
            thread_.detach();
        }
    }

private:
    std::future<Result> future_;
    std::thread thread_;
};

#endif // STAGETASK_H
