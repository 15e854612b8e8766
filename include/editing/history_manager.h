#pragma once

#include <opencv2/opencv.hpp>
#include <vector>

namespace picmod {

/**
 * @brief 历史记录管理器（撤销/重做）
 *
 * Bounded list of image snapshots with a cursor. Snapshots are deep copies
 * on the way in and on the way out.
 */
class HistoryManager {
public:
    explicit HistoryManager(size_t max_history = 20);

    /**
     * @brief 保存当前状态，丢弃光标之后的重做分支
     */
    void saveState(const cv::Mat& image);

    /**
     * @brief 撤销
     * @return 上一个快照，不可撤销时返回空Mat
     */
    cv::Mat undo();

    /**
     * @brief 重做
     * @return 下一个快照，不可重做时返回空Mat
     */
    cv::Mat redo();

    bool canUndo() const { return index_ > 0; }
    bool canRedo() const { return index_ + 1 < static_cast<int>(history_.size()); }

    void clear();

    /**
     * @brief 当前快照，无记录时返回空Mat
     */
    cv::Mat currentState() const;

    /**
     * @brief 清空并以给定图像作为第一个快照
     */
    void reset(const cv::Mat& image);

    size_t size() const { return history_.size(); }
    int currentIndex() const { return index_; }
    size_t maxHistory() const { return max_history_; }

private:
    size_t max_history_;
    std::vector<cv::Mat> history_;
    int index_ = -1;
};

} // namespace picmod
