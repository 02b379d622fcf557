#pragma once

#include <asio.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace relaunch::infra {

/**
 * @brief Shared Asio I/O context driven by a small pool of worker threads.
 *
 * Every asynchronous unit of work in the library (forwarding attempts, server
 * activation, channel I/O and notification delivery) runs on this pool, so
 * none of it ties up the caller's thread. An executor_work_guard keeps the
 * context alive between bursts of work until stop() is called.
 *
 * Work posted before start() is queued and runs once the pool is started.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    using Strand = asio::strand<asio::io_context::executor_type>;

    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads (at least one is used).
     */
    explicit AsioContext(size_t threadCount = 2);

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Creates the work guard and spawns the worker threads.
     *
     * Has no effect if already running.
     */
    void start();

    /**
     * @brief Releases the work guard, stops the context and joins all workers.
     *
     * Must not be called from one of the worker threads.
     */
    void stop();

    bool isRunning() const { return running_.load(); }
    size_t threadCount() const { return threadCount_; }

    asio::io_context& getContext() { return ioContext_; }

    /**
     * @brief Creates a strand for handlers that must not run concurrently.
     */
    Strand makeStrand() { return asio::make_strand(ioContext_); }

    /**
     * @brief Posts a handler to be executed asynchronously.
     * @param handler The handler to execute on the worker pool.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    /**
     * @brief Runs a callable on the worker pool and exposes its outcome.
     *
     * A value returned by the callable, or an exception thrown by it, is
     * stored in the returned future.
     *
     * @param fn Callable taking no arguments.
     * @return Future holding the callable's result.
     */
    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
        using Result = std::invoke_result_t<std::decay_t<Fn>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        auto future = task->get_future();
        asio::post(ioContext_, [task]() { (*task)(); });
        return future;
    }

    /**
     * @brief Checks whether the calling thread is one of this pool's workers.
     */
    bool runningInThisThread() const;

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace relaunch::infra
