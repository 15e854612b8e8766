#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "common/thread_pool.hpp"
#include "session/edit_session.h"

namespace picmod {

/**
 * @brief 进度回调封装
 */
class ProgressReporter {
public:
    using Callback = std::function<void(int percent, const std::string& message)>;

    explicit ProgressReporter(Callback callback = nullptr)
        : callback_(std::move(callback)) {}

    /**
     * @brief 报告进度，percent 裁剪到 [0, 100]
     */
    void report(int percent, const std::string& message);

    int lastPercent() const { return last_percent_; }

private:
    Callback callback_;
    std::atomic<int> last_percent_{0};
};

/**
 * @brief 后台执行编辑任务
 *
 * Tasks run on a worker pool. Tasks on the same session are serialized by a
 * per-session mutex; different sessions run in parallel. Cancellation is
 * cooperative: tasks poll the flag between stages, and a task still queued
 * when cancelAll() is called finishes with EditError::Cancelled without
 * running.
 */
class AsyncEditor {
public:
    using Task = std::function<EditStatus(EditSession&, ProgressReporter&, const std::atomic<bool>&)>;

    explicit AsyncEditor(size_t workers = 2);
    ~AsyncEditor();

    AsyncEditor(const AsyncEditor&) = delete;
    AsyncEditor& operator=(const AsyncEditor&) = delete;

    /**
     * @brief 提交任务
     * @param session 任务执行期间由本对象保持存活
     * @param task 任务函数，抛出的 std::exception 转为 ProcessingFailed
     * @param progress 进度回调（在工作线程中调用）
     */
    std::future<EditStatus> submit(std::shared_ptr<EditSession> session,
                                   Task task,
                                   ProgressReporter::Callback progress = nullptr);

    /**
     * @brief 取消已提交的所有任务，之后提交的任务不受影响
     */
    void cancelAll();

    /**
     * @brief 等待所有任务完成
     */
    void waitIdle() { pool_.waitIdle(); }

    size_t workers() const { return pool_.size(); }

private:
    std::shared_ptr<std::mutex> sessionMutex(const EditSession* session);

    std::mutex mutex_;
    std::shared_ptr<std::atomic<bool>> cancel_token_;
    std::map<const EditSession*, std::weak_ptr<std::mutex>> session_mutexes_;

    // Declared last so workers are joined before the members above go away
    ThreadPool pool_;
};

} // namespace picmod
