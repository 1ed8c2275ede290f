#include "selection_tracker.hpp"
#include <algorithm>

namespace systop {

void SelectionTracker::move_up() {
    if (cursor_ > 0) {
        --cursor_;
    }
}

void SelectionTracker::move_down(size_t current_length) {
    if (current_length > 0 && cursor_ + 1 < current_length) {
        ++cursor_;
    }
    clamp(current_length);
}

void SelectionTracker::clamp(size_t current_length) {
    const size_t last = current_length > 0 ? current_length - 1 : 0;
    cursor_ = std::min(cursor_, last);
}

} // namespace systop
