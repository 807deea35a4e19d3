#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace cw {

// Thread-safe handle that forces a blocked event loop to resume draining.
class EventLoopWaker {
public:
  virtual ~EventLoopWaker() = default;
  virtual void wake() = 0;
  virtual std::unique_ptr<EventLoopWaker> clone() const = 0;
};

// Wake primitive owned by an event loop: pending flag + condition variable.
// Any number of notify() calls before the next wait collapse into one wake.
class LoopSignal {
public:
  void notify();

  // Block until notified or shut down. Returns true if a wake was consumed.
  bool wait();
  bool waitFor(std::chrono::milliseconds timeout);

  // Consume a pending wake without blocking.
  bool consume();

  // After shutdown, notify() is a no-op and waits return immediately.
  void shutdown();
  bool isShutdown() const { return shutdown_.load(); }

  std::uint64_t notifyCount() const { return notifies_.load(); }

private:
  std::mutex mtx_;
  std::condition_variable cv_;
  std::atomic<bool> pending_{false};
  std::atomic<bool> shutdown_{false};
  std::atomic<std::uint64_t> notifies_{0};
};

// Holds only a weak reference: waking a loop that no longer exists is a no-op.
class SignalWaker : public EventLoopWaker {
public:
  explicit SignalWaker(std::weak_ptr<LoopSignal> signal);

  void wake() override;
  std::unique_ptr<EventLoopWaker> clone() const override;

private:
  std::weak_ptr<LoopSignal> signal_;
};

} // namespace cw
