#include "cw/events/EventQueue.hpp"

#include <cstdio>

namespace cw {

EventQueue::EventQueue() : signal_(std::make_shared<LoopSignal>()) {}

EventQueue::~EventQueue() { signal_->shutdown(); }

bool EventQueue::push(WindowEvent event) {
  // Label is taken first: a refused event is destroyed inside push().
  const char* label = eventLabel(event);
  if (!queue_.push(std::move(event))) {
    refused_.fetch_add(1);
    std::fprintf(stderr, "[EventQueue] closed, dropping %s\n", label);
    return false;
  }
  signal_->notify();
  return true;
}

bool EventQueue::pop(WindowEvent& out) { return queue_.pop(out); }

std::vector<WindowEvent> EventQueue::drain() { return queue_.drain(); }

void EventQueue::close() {
  queue_.close();
  signal_->notify();
}

std::unique_ptr<EventLoopWaker> EventQueue::createWaker() const {
  return std::make_unique<SignalWaker>(signal_);
}

} // namespace cw
