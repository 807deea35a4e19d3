#pragma once
#include "cw/compositor/EventValidator.hpp"
#include "cw/events/EventQueue.hpp"
#include "cw/events/WindowEventHandler.hpp"
#include "cw/ids/BrowsingContextRegistry.hpp"
#include "cw/window/WindowConfig.hpp"
#include "cw/window/WindowMethods.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cw {

struct CompositorLoopConfig {
  std::chrono::milliseconds animatingPollInterval{16};
  std::uint64_t firstContextId{1};
  bool traceEvents{false};
};

CompositorLoopConfig compositorLoopConfigFrom(const WindowConfig& cfg);

struct ContractViolation {
  std::string label;    // eventLabel() of the rejected event
  std::string code;
  std::string message;
};

struct LoopStats {
  std::size_t dispatched{0};
  std::size_t rejected{0};
  std::size_t wakeups{0};
  std::size_t composites{0};
  std::size_t skippedComposites{0};
};

// Reference compositor control loop. Owns the window's single WindowMethods
// instance, drains the event queue one event at a time and keeps the
// browsing-context bookkeeping the taxonomy implies:
//   NewBrowser    allocate an id, reply before the handler runs
//   CloseBrowser  retire the id for good
//   SelectBrowser switch the visible context
//   Refresh       prepareForComposite -> handler -> present (or skip)
//   Quit          handler, then close the queue
// Events breaking the producer contract are logged, recorded and dropped.
class CompositorLoop {
public:
  CompositorLoop(std::unique_ptr<WindowMethods> window,
                 std::shared_ptr<EventQueue> queue,
                 WindowEventHandler& handler,
                 CompositorLoopConfig config = {});

  CompositorLoop(const CompositorLoop&) = delete;
  CompositorLoop& operator=(const CompositorLoop&) = delete;

  // Blocks while Idle, waits at most one poll interval while Animating,
  // then drains. Returns false once Quit has been processed.
  bool runOnce();

  // Drains without blocking. Returns the number of events taken.
  std::size_t drainPending();

  void run();

  void setAnimationState(AnimationState state);
  AnimationState animationState() const { return animation_; }

  bool quitRequested() const { return quit_; }

  std::unique_ptr<EventLoopWaker> createWaker() { return window_->createEventLoopWaker(); }

  WindowMethods& window() { return *window_; }
  const BrowsingContextRegistry& registry() const { return registry_; }
  const std::vector<ContractViolation>& violations() const { return violations_; }
  const LoopStats& stats() const { return stats_; }

private:
  void process(WindowEvent& event);
  void composite(WindowEvent& event);

  std::unique_ptr<WindowMethods> window_;
  std::shared_ptr<EventQueue> queue_;
  WindowEventHandler& handler_;
  CompositorLoopConfig config_;

  BrowsingContextRegistry registry_;
  std::vector<ContractViolation> violations_;
  LoopStats stats_;
  AnimationState animation_{AnimationState::Idle};
  bool quit_{false};
};

} // namespace cw
