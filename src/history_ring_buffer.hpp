#pragma once

#include <array>
#include <cstddef>
#include <vector>

namespace systop {

static constexpr size_t kHistorySize = 60;  // 60 data points

// Fixed-capacity FIFO of samples. Storage is a fixed arena indexed from
// head_, so the capacity bound holds structurally: a push at capacity
// overwrites the oldest slot.
template <typename T, size_t Capacity = kHistorySize>
class HistoryRingBuffer {
    static_assert(Capacity > 0, "HistoryRingBuffer needs at least one slot");

public:
    void push(T value) {
        if (size_ == Capacity) {
            slots_[head_] = value;
            head_ = (head_ + 1) % Capacity;
        } else {
            slots_[(head_ + size_) % Capacity] = value;
            ++size_;
        }
    }

    // Oldest to newest
    [[nodiscard]] std::vector<T> values() const {
        std::vector<T> result;
        result.reserve(size_);
        for (size_t i = 0; i < size_; ++i) {
            result.push_back(slots_[(head_ + i) % Capacity]);
        }
        return result;
    }

    // 0 is the oldest sample
    [[nodiscard]] const T& operator[](size_t index) const {
        return slots_[(head_ + index) % Capacity];
    }

    // Newest sample; only valid when !empty()
    [[nodiscard]] const T& latest() const {
        return slots_[(head_ + size_ - 1) % Capacity];
    }

    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] bool empty() const { return size_ == 0; }
    [[nodiscard]] static constexpr size_t capacity() { return Capacity; }

private:
    std::array<T, Capacity> slots_{};
    size_t head_ = 0;
    size_t size_ = 0;
};

} // namespace systop
