#include "editing/history_manager.h"
#include "common/logger.hpp"
#include <algorithm>

namespace picmod {

HistoryManager::HistoryManager(size_t max_history)
    : max_history_(std::max<size_t>(1, max_history)) {
}

void HistoryManager::saveState(const cv::Mat& image) {
    // 截断重做分支
    if (index_ + 1 < static_cast<int>(history_.size())) {
        history_.erase(history_.begin() + (index_ + 1), history_.end());
    }

    history_.push_back(image.clone());

    if (history_.size() > max_history_) {
        history_.erase(history_.begin());
        LOG_TRACE("History full, dropped oldest snapshot");
    } else {
        index_++;
    }
}

cv::Mat HistoryManager::undo() {
    if (!canUndo()) {
        return cv::Mat();
    }
    index_--;
    return history_[index_].clone();
}

cv::Mat HistoryManager::redo() {
    if (!canRedo()) {
        return cv::Mat();
    }
    index_++;
    return history_[index_].clone();
}

void HistoryManager::clear() {
    history_.clear();
    index_ = -1;
}

cv::Mat HistoryManager::currentState() const {
    if (index_ < 0 || index_ >= static_cast<int>(history_.size())) {
        return cv::Mat();
    }
    return history_[index_].clone();
}

void HistoryManager::reset(const cv::Mat& image) {
    clear();
    if (!image.empty()) {
        saveState(image);
    }
}

} // namespace picmod
