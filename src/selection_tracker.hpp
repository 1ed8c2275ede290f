#pragma once

#include <cstddef>

namespace systop {

// Cursor into the current process view. With an empty view the cursor is
// 0 and points at nothing.
class SelectionTracker {
public:
    void move_up();
    void move_down(size_t current_length);

    // Pull the cursor back inside a view that may have shrunk
    void clamp(size_t current_length);

    void reset() { cursor_ = 0; }

    [[nodiscard]] size_t cursor() const { return cursor_; }

private:
    size_t cursor_ = 0;
};

} // namespace systop
