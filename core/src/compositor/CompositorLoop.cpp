#include "cw/compositor/CompositorLoop.hpp"
#include "cw/events/EventTrace.hpp"

#include <cstdio>
#include <utility>

namespace cw {

CompositorLoopConfig compositorLoopConfigFrom(const WindowConfig& cfg) {
  CompositorLoopConfig out;
  out.animatingPollInterval = std::chrono::milliseconds(cfg.animatingPollIntervalMs);
  out.traceEvents = cfg.traceEvents;
  return out;
}

CompositorLoop::CompositorLoop(std::unique_ptr<WindowMethods> window,
                               std::shared_ptr<EventQueue> queue,
                               WindowEventHandler& handler,
                               CompositorLoopConfig config)
  : window_(std::move(window)),
    queue_(std::move(queue)),
    handler_(handler),
    config_(config),
    registry_(config.firstContextId) {}

bool CompositorLoop::runOnce() {
  if (quit_) return false;

  const auto& signal = queue_->signal();
  bool woke = (animation_ == AnimationState::Animating)
                  ? signal->waitFor(config_.animatingPollInterval)
                  : signal->wait();
  if (woke) ++stats_.wakeups;

  drainPending();
  return !quit_;
}

std::size_t CompositorLoop::drainPending() {
  std::size_t n = 0;
  WindowEvent event;
  while (queue_->pop(event)) {
    process(event);
    ++n;
  }
  return n;
}

void CompositorLoop::run() {
  while (runOnce()) {
  }
}

void CompositorLoop::setAnimationState(AnimationState state) {
  animation_ = state;
  window_->setAnimationState(state);
}

void CompositorLoop::process(WindowEvent& event) {
  CheckResult check = validateEvent(event, registry_, quit_);
  if (!check.ok) {
    std::fprintf(stderr, "[CompositorLoop] rejected %s: %s (%s)\n",
                 eventLabel(event), check.code.c_str(), check.message.c_str());
    violations_.push_back({eventLabel(event), check.code, check.message});
    ++stats_.rejected;
    return;
  }

  if (config_.traceEvents) {
    std::fprintf(stderr, "[CompositorLoop] %s\n", eventToJson(event).c_str());
  }

  if (auto* nb = std::get_if<ev::NewBrowser>(&event)) {
    TopLevelBrowsingContextId id = registry_.create();
    if (!nb->reply.send(id)) {
      std::fprintf(stderr, "[CompositorLoop] NewBrowser requester gone, ctx=%llu unclaimed\n",
                   static_cast<unsigned long long>(id.value));
    }
  } else if (const auto* cb = std::get_if<ev::CloseBrowser>(&event)) {
    registry_.close(cb->ctx);
  } else if (const auto* sb = std::get_if<ev::SelectBrowser>(&event)) {
    registry_.select(sb->ctx);
  } else if (std::holds_alternative<ev::Refresh>(event)) {
    composite(event);
    return;
  } else if (isQuit(event)) {
    quit_ = true;
  }

  dispatchEvent(event, handler_);
  ++stats_.dispatched;

  if (quit_) queue_->close();
}

void CompositorLoop::composite(WindowEvent& event) {
  DeviceUintSize fb = window_->framebufferSize();
  if (!window_->prepareForComposite(fb.width, fb.height)) {
    ++stats_.skippedComposites;
    return;
  }
  dispatchEvent(event, handler_);
  ++stats_.dispatched;
  window_->present();
  ++stats_.composites;
}

} // namespace cw
