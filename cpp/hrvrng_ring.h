// Bounded, thread-safe ring used for bit buffers and sample channels
#pragma once

#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace hrvrng {

// Oldest element is evicted first once capacity is reached.
// Every accessor takes the lock; callers snapshot size() once per operation.
template <typename T>
class BoundedRing {
public:
    explicit BoundedRing(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) throw std::invalid_argument("ring capacity must be > 0");
    }

    void push(const T& v) {
        std::lock_guard<std::mutex> lock(m_);
        pushLocked(v);
    }

    void push(T&& v) {
        std::lock_guard<std::mutex> lock(m_);
        if (buf_.size() >= capacity_) { buf_.pop_front(); ++evicted_; }
        buf_.push_back(std::move(v));
        ++pushed_;
    }

    template <typename It>
    void pushRange(It first, It last) {
        std::lock_guard<std::mutex> lock(m_);
        for (; first != last; ++first) pushLocked(*first);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_);
        return buf_.size();
    }

    bool empty() const { return size() == 0; }
    size_t capacity() const { return capacity_; }

    // Elements ever pushed / evicted (monotonic)
    size_t totalPushed() const { std::lock_guard<std::mutex> lock(m_); return pushed_; }
    size_t totalEvicted() const { std::lock_guard<std::mutex> lock(m_); return evicted_; }

    std::vector<T> snapshot() const {
        std::lock_guard<std::mutex> lock(m_);
        return std::vector<T>(buf_.begin(), buf_.end());
    }

    // Most recent n elements, oldest first
    std::vector<T> tail(size_t n) const {
        std::lock_guard<std::mutex> lock(m_);
        const size_t k = (n < buf_.size()) ? n : buf_.size();
        return std::vector<T>(buf_.end() - static_cast<std::ptrdiff_t>(k), buf_.end());
    }

    // Remove and return everything currently buffered
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(m_);
        std::vector<T> out(std::make_move_iterator(buf_.begin()), std::make_move_iterator(buf_.end()));
        buf_.clear();
        return out;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_);
        buf_.clear();
    }

private:
    void pushLocked(const T& v) {
        if (buf_.size() >= capacity_) { buf_.pop_front(); ++evicted_; }
        buf_.push_back(v);
        ++pushed_;
    }

    const size_t capacity_;
    mutable std::mutex m_;
    std::deque<T> buf_;
    size_t pushed_ {0};
    size_t evicted_ {0};
};

} // namespace hrvrng
