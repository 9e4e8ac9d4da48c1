#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) {
            for (;;) {
                std::function<void(std::stop_token)> task;
                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, st, [this] {
                        return stop_ || !tasks_.empty();
                    });
                    if (tasks_.empty()) {
                        if (stop_ || st.stop_requested()) return;
                        continue;
                    }
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                // packaged_task stores exceptions in the future; this only
                // catches failures of the wrapper itself
                try {
                    task(st);
                } catch (const std::exception& e) {
                    Logger::log(LogLevel::Error, std::string("Unhandled exception in thread pool: ") + e.what(),
                                "thread_pool");
                }
            }
        });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
}
