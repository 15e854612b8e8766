#include "editing/selection_manager.h"

namespace picmod {

void SelectionManager::startSelection(int x, int y) {
    selecting_ = true;
    start_ = cv::Point(x, y);
    rect_.reset();
}

void SelectionManager::updateSelection(int x, int y) {
    if (!selecting_ || !start_) {
        return;
    }
    rect_ = SelectionRect(start_->x, start_->y, x, y).normalized();
}

void SelectionManager::endSelection(int x, int y) {
    if (!selecting_) {
        return;
    }
    updateSelection(x, y);
    selecting_ = false;
}

void SelectionManager::setSelection(const SelectionRect& rect) {
    rect_ = rect.normalized();
    start_.reset();
    selecting_ = false;
}

void SelectionManager::clearSelection() {
    rect_.reset();
    start_.reset();
    selecting_ = false;
}

bool SelectionManager::hasSelection() const {
    if (!rect_) {
        return false;
    }
    return rect_->width() > kMinSelectionSize && rect_->height() > kMinSelectionSize;
}

std::pair<int, int> SelectionManager::selectionSize() const {
    if (!hasSelection()) {
        return {0, 0};
    }
    return {rect_->width(), rect_->height()};
}

void SelectionManager::normalizeSelection(int image_width, int image_height) {
    if (!rect_) {
        return;
    }
    rect_ = rect_->clampedTo(image_width, image_height);
}

} // namespace picmod
