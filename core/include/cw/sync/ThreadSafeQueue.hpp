#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace cw {

// Mutex-guarded unbounded FIFO. After close() push() refuses new items;
// the closed check and the enqueue happen under the same lock. Items already
// queued stay poppable.
template <typename T>
class ThreadSafeQueue {
public:
  bool push(T item) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) return false;
    queue_.push_back(std::move(item));
    return true;
  }

  void close() {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
  }

  bool isClosed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
  }

  bool pop(T& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.empty()) return false;
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
  }

  std::vector<T> drain() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<T> out;
    out.reserve(queue_.size());
    for (auto& item : queue_) out.push_back(std::move(item));
    queue_.clear();
    return out;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

  bool empty() const { return size() == 0; }

  void clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    queue_.clear();
  }

private:
  mutable std::mutex mtx_;
  std::deque<T> queue_;
  bool closed_{false};
};

} // namespace cw
