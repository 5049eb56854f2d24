#pragma once

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace drivescore::common {

/// Fixed-capacity history that overwrites its oldest entry when full.
/// Not synchronized: callers hold the lock of the record that owns it.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity)
        : slots_(capacity)
        , capacity_(capacity)
    {
        if (capacity == 0) {
            throw std::invalid_argument("Buffer capacity must be greater than zero");
        }
    }

    void push(T item)
    {
        slots_[head_] = std::move(item);
        head_         = (head_ + 1) % capacity_;
        if (count_ < capacity_) {
            ++count_;
        }
    }

    /// Element `index` counted from the oldest retained entry.
    const T& operator[](std::size_t index) const { return slots_[(tail() + index) % capacity_]; }

    const T& at(std::size_t index) const
    {
        if (index >= count_) {
            throw std::out_of_range("RingBuffer index out of range");
        }
        return (*this)[index];
    }

    /// Oldest-first copy of the retained entries.
    std::vector<T> snapshot() const
    {
        std::vector<T> out;
        out.reserve(count_);
        for (std::size_t i = 0; i < count_; ++i) {
            out.push_back((*this)[i]);
        }
        return out;
    }

    void clear()
    {
        head_  = 0;
        count_ = 0;
    }

    std::size_t capacity() const { return capacity_; }
    std::size_t size() const { return count_; }
    bool        empty() const { return count_ == 0; }
    bool        full() const { return count_ == capacity_; }

private:
    std::size_t tail() const { return (head_ + capacity_ - count_) % capacity_; }

    std::vector<T> slots_;
    std::size_t    capacity_;
    std::size_t    head_  = 0;
    std::size_t    count_ = 0;
};

} // namespace drivescore::common
