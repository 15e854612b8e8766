#pragma once

#include <optional>
#include <utility>
#include "common/types.hpp"

namespace picmod {

/**
 * @brief 选择区域管理器
 *
 * Tracks a rubber-band selection between a press point and the current
 * point. The stored rectangle always has x1 <= x2 and y1 <= y2.
 */
class SelectionManager {
public:
    /// Selections must exceed this many pixels in both directions
    static constexpr int kMinSelectionSize = 5;

    SelectionManager() = default;

    void startSelection(int x, int y);
    void updateSelection(int x, int y);
    void endSelection(int x, int y);

    /**
     * @brief 直接设置选区（命令行等非交互入口）
     */
    void setSelection(const SelectionRect& rect);

    std::optional<SelectionRect> selection() const { return rect_; }
    void clearSelection();

    bool isSelecting() const { return selecting_; }

    /**
     * @brief 选区是否有效（宽高均大于5像素）
     */
    bool hasSelection() const;

    /**
     * @brief 选区尺寸 (width, height)，无效时为 (0, 0)
     */
    std::pair<int, int> selectionSize() const;

    /**
     * @brief 将选区裁剪到图像范围内
     */
    void normalizeSelection(int image_width, int image_height);

private:
    std::optional<SelectionRect> rect_;
    std::optional<cv::Point> start_;
    bool selecting_ = false;
};

} // namespace picmod
