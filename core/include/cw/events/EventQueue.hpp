#pragma once
#include "cw/events/WindowEvent.hpp"
#include "cw/sync/EventLoopWaker.hpp"
#include "cw/sync/ThreadSafeQueue.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>

namespace cw {

// Backend -> compositor event channel. Every push wakes the loop signal.
// Once closed (after Quit) pushes are refused and the event is dropped.
class EventQueue {
public:
  EventQueue();
  ~EventQueue();

  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  bool push(WindowEvent event);
  bool pop(WindowEvent& out);
  std::vector<WindowEvent> drain();

  std::size_t size() const { return queue_.size(); }
  bool empty() const { return queue_.empty(); }

  void close();
  bool isClosed() const { return queue_.isClosed(); }

  // Events refused because the queue was closed.
  std::size_t refusedCount() const { return refused_.load(); }

  std::unique_ptr<EventLoopWaker> createWaker() const;
  const std::shared_ptr<LoopSignal>& signal() const { return signal_; }

private:
  ThreadSafeQueue<WindowEvent> queue_;
  std::shared_ptr<LoopSignal> signal_;
  std::atomic<std::size_t> refused_{0};
};

} // namespace cw
