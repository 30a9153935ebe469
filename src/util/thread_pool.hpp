#ifndef PROMPTGUARD_UTIL_THREAD_POOL_HPP
#define PROMPTGUARD_UTIL_THREAD_POOL_HPP

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool. The HTTP front end hands every accepted
 *        connection to it so a slow generation only ties up one worker.
 *
 * Usage Example:
 *  @code
 *    promptguard::util::ThreadPool pool(4);
 *    auto reply = pool.enqueue([&gw](std::string msg) { return gw.handleMessage(msg); }, text);
 *    std::cout << reply.get().response << std::endl;
 *  @endcode
 */

namespace promptguard {
namespace util {

class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads. Zero means hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false), active_(0)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    /**
     * @brief Stops accepting work, drains the queue and joins all workers.
     */
    ~ThreadPool()
    {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a callable. The returned future carries its result or exception.
     * @throw std::runtime_error if the pool has been shut down.
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using return_type = typename std::invoke_result<F, Args...>::type;

        auto taskPtr = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> res = taskPtr->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            taskQueue_.emplace([taskPtr]() { (*taskPtr)(); });
        }
        condVar_.notify_one();
        return res;
    }

    /**
     * @brief Idempotent. Queued tasks still run before the workers exit.
     */
    void shutdown()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_ && workers_.empty()) {
                return;
            }
            stop_ = true;
        }
        condVar_.notify_all();
        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    size_t size() const
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        return workers_.size();
    }

    /// Tasks waiting for a worker (not counting running ones).
    size_t pending() const
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        return taskQueue_.size();
    }

    /// Tasks currently executing.
    size_t active() const
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        return active_;
    }

private:
    void workerLoop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                condVar_.wait(lock, [this] {
                    return !taskQueue_.empty() || stop_;
                });
                if (stop_ && taskQueue_.empty()) {
                    return;
                }
                task = std::move(taskQueue_.front());
                taskQueue_.pop();
                ++active_;
            }
            // packaged_task stores any exception in the future
            task();
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                --active_;
            }
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> taskQueue_;
    mutable std::mutex queueMutex_;
    std::condition_variable condVar_;
    bool stop_;
    size_t active_;
};

} // namespace util
} // namespace promptguard

#endif // PROMPTGUARD_UTIL_THREAD_POOL_HPP
