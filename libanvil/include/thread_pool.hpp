/**
 * @file thread_pool.hpp
 * @brief Fixed-size thread pool running candidate encodes and metric evaluations.
 */

#ifndef ANVIL_THREAD_POOL_HPP
#define ANVIL_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <stdexcept>
#include <stop_token>
#include <thread>

/**
 * @brief A simple fixed-size thread pool for executing tasks concurrently.
 *
 * @details Workers are std::jthread instances, joined on destruction.
 * Every task receives a `std::stop_token` so that a long codec call can
 * notice a cancellation request between its own steps.
 */
class ThreadPool {
public:
    /**
     * @brief Constructs the thread pool and starts worker threads.
     * @param threads Number of worker threads; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency() / 2);

    /**
     * @brief Drains the queue, then joins all worker threads.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task to be executed by a worker thread.
     *
     * @tparam F Callable accepting a `std::stop_token`.
     * @param f The task to execute.
     * @return A std::future carrying the task result or its exception.
     * @throws std::runtime_error if enqueue is called on a stopped pool.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        condition_.notify_one();
        return task->get_future();
    }

    /**
     * @return Number of worker threads.
     */
    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    std::mutex queue_mutex_;                ///< Protects tasks_ and stop_
    std::condition_variable_any condition_; ///< Notifies workers of new tasks or stop requests
    std::queue<std::function<void(std::stop_token)>> tasks_; ///< The queue of tasks
    bool stop_{false};                      ///< Flag to signal workers to stop
    std::vector<std::jthread> workers_;     ///< The worker threads
};

#endif // ANVIL_THREAD_POOL_HPP
