#include "session/async_editor.h"
#include "common/logger.hpp"

#include <algorithm>

namespace picmod {

void ProgressReporter::report(int percent, const std::string& message) {
    percent = std::clamp(percent, 0, 100);
    last_percent_ = percent;
    LOG_TRACE("Progress {}%: {}", percent, message);
    if (callback_) {
        callback_(percent, message);
    }
}

AsyncEditor::AsyncEditor(size_t workers)
    : cancel_token_(std::make_shared<std::atomic<bool>>(false)),
      pool_(std::max<size_t>(1, workers)) {
    LOG_DEBUG("AsyncEditor started with {} workers", pool_.size());
}

AsyncEditor::~AsyncEditor() {
    cancelAll();
    pool_.waitIdle();
}

std::shared_ptr<std::mutex> AsyncEditor::sessionMutex(const EditSession* session) {
    // 清理已无任务引用的条目
    for (auto it = session_mutexes_.begin(); it != session_mutexes_.end();) {
        if (it->second.expired()) {
            it = session_mutexes_.erase(it);
        } else {
            ++it;
        }
    }

    auto& slot = session_mutexes_[session];
    std::shared_ptr<std::mutex> m = slot.lock();
    if (!m) {
        m = std::make_shared<std::mutex>();
        slot = m;
    }
    return m;
}

std::future<EditStatus> AsyncEditor::submit(std::shared_ptr<EditSession> session,
                                            Task task,
                                            ProgressReporter::Callback progress) {
    if (!session || !task) {
        std::promise<EditStatus> p;
        p.set_value(EditStatus::Fail(EditError::InvalidArgument, "submit needs a session and a task"));
        return p.get_future();
    }

    std::shared_ptr<std::mutex> session_mutex;
    std::shared_ptr<std::atomic<bool>> token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_mutex = sessionMutex(session.get());
        token = cancel_token_;
    }

    return pool_.enqueue([session, session_mutex, token,
                          task = std::move(task), progress = std::move(progress)]() {
        if (*token) {
            return EditStatus::Fail(EditError::Cancelled, "Cancelled before start");
        }

        std::lock_guard<std::mutex> lock(*session_mutex);
        if (*token) {
            return EditStatus::Fail(EditError::Cancelled, "Cancelled before start");
        }

        ProgressReporter reporter(progress);
        reporter.report(0, "started");

        EditStatus status;
        try {
            status = task(*session, reporter, *token);
        } catch (const std::exception& e) {
            LOG_ERROR("Edit task failed: {}", e.what());
            status = EditStatus::Fail(EditError::ProcessingFailed, e.what());
        }

        if (status.ok()) {
            reporter.report(100, status.message.empty() ? "done" : status.message);
        }
        return status;
    });
}

void AsyncEditor::cancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    *cancel_token_ = true;
    cancel_token_ = std::make_shared<std::atomic<bool>>(false);
    LOG_DEBUG("AsyncEditor: cancel requested");
}

} // namespace picmod
