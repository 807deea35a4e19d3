#include "cw/sync/EventLoopWaker.hpp"

namespace cw {

void LoopSignal::notify() {
  if (shutdown_.load()) return;
  notifies_.fetch_add(1, std::memory_order_relaxed);
  {
    std::lock_guard<std::mutex> lock(mtx_);
    pending_.store(true);
  }
  cv_.notify_all();
}

bool LoopSignal::wait() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return pending_.load() || shutdown_.load(); });
  return pending_.exchange(false);
}

bool LoopSignal::waitFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait_for(lock, timeout, [this] { return pending_.load() || shutdown_.load(); });
  return pending_.exchange(false);
}

bool LoopSignal::consume() {
  std::lock_guard<std::mutex> lock(mtx_);
  return pending_.exchange(false);
}

void LoopSignal::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    shutdown_.store(true);
  }
  cv_.notify_all();
}

SignalWaker::SignalWaker(std::weak_ptr<LoopSignal> signal)
  : signal_(std::move(signal)) {}

void SignalWaker::wake() {
  if (auto s = signal_.lock()) s->notify();
}

std::unique_ptr<EventLoopWaker> SignalWaker::clone() const {
  return std::make_unique<SignalWaker>(signal_);
}

} // namespace cw
