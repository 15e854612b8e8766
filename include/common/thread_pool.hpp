#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace picmod {

/**
 * @brief 编辑任务工作线程池
 *
 * Fixed number of workers fed from a FIFO queue. Tracks running jobs so
 * callers can wait for the pool to go idle. shutdown() drains the queue
 * before joining.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency()) {
        if (num_threads == 0) num_threads = 2;

        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back(&ThreadPool::workerLoop, this);
        }
    }

    ~ThreadPool() {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief 提交无参任务
     * @return 任务结果的 future
     * @throws std::runtime_error 线程池已关闭
     */
    template<typename F>
    auto enqueue(F&& job) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(job));
        std::future<Result> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            queue_.emplace_back([task]() { (*task)(); });
        }
        wake_.notify_one();
        return result;
    }

    /**
     * @brief 阻塞直到队列为空且没有正在执行的任务
     */
    void waitIdle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
    }

    /**
     * @brief 执行完队列中的任务后停止所有工作线程（可重复调用）
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return;
            }
            stopping_ = true;
        }
        wake_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    size_t size() const { return workers_.size(); }

    size_t pendingTasks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t runningTasks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

private:
    void workerLoop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                // stopping_ 且队列已空
                return;
            }

            std::function<void()> job = std::move(queue_.front());
            queue_.pop_front();
            ++running_;

            lock.unlock();
            job();
            lock.lock();

            --running_;
            if (queue_.empty() && running_ == 0) {
                idle_.notify_all();
            }
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    size_t running_ = 0;
    bool stopping_ = false;
};

} // namespace picmod
