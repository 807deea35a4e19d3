#include "cw/platform/HeadlessWindow.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace cw {

HeadlessWindow::HeadlessWindow(const WindowConfig& config,
                               std::shared_ptr<EventQueue> queue,
                               std::shared_ptr<GlApi> gl)
  : config_(config),
    queue_(std::move(queue)),
    gl_(gl ? std::move(gl) : std::make_shared<NullGlApi>()) {
  hidpi_.value = config_.hidpiFactor > 0.0f ? config_.hidpiFactor : 1.0f;
  applyInnerSizeLocked(static_cast<float>(config_.width) * hidpi_.value,
                       static_cast<float>(config_.height) * hidpi_.value);
  restoreSize_ = size_;
  if (config_.fullscreen) {
    fullscreen_ = true;
    applyInnerSizeLocked(static_cast<float>(config_.screenWidth),
                         static_cast<float>(config_.screenHeight));
  }
}

HeadlessWindow::~HeadlessWindow() = default;

// ---- geometry ----

DeviceUintSize HeadlessWindow::framebufferSizeLocked() const {
  return toDeviceUintSize(size_, hidpi_);
}

DeviceUintSize HeadlessWindow::framebufferSize() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return framebufferSizeLocked();
}

DeviceUintRect HeadlessWindow::windowRect() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return {{0, 0}, framebufferSizeLocked()};
}

WindowSize HeadlessWindow::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return size_;
}

HiDpiFactor HeadlessWindow::hidpiFactor() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return hidpi_;
}

// Device-pixel request -> density-independent size, clamped to the screen.
void HeadlessWindow::applyInnerSizeLocked(float width, float height) {
  float maxW = static_cast<float>(config_.screenWidth);
  float maxH = static_cast<float>(config_.screenHeight);
  width = std::clamp(width, 0.0f, maxW);
  height = std::clamp(height, 0.0f, maxH);
  size_.width = width / hidpi_.value;
  size_.height = height / hidpi_.value;
}

void HeadlessWindow::pushResize() {
  if (!queue_) return;
  queue_->push(ev::Resize{framebufferSize()});
}

// ---- presentation ----

void HeadlessWindow::present() {
  gl_->finish();
  std::lock_guard<std::mutex> lock(mtx_);
  ++presents_;
}

bool HeadlessWindow::prepareForComposite(std::size_t width, std::size_t height) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (minimized_ || width == 0 || height == 0) {
      ++refusedComposites_;
      return false;
    }
  }
  if (!gl_->resizeTarget(static_cast<int>(width), static_cast<int>(height))) {
    std::fprintf(stderr, "[HeadlessWindow] GL target resize to %zux%zu failed, skipping composite\n",
                 width, height);
    std::lock_guard<std::mutex> lock(mtx_);
    ++refusedComposites_;
    return false;
  }
  if (!gl_->makeCurrent()) {
    std::fprintf(stderr, "[HeadlessWindow] makeCurrent failed, skipping composite\n");
    std::lock_guard<std::mutex> lock(mtx_);
    ++refusedComposites_;
    return false;
  }
  return true;
}

// ---- window control ----

std::pair<UintSize, IntPoint> HeadlessWindow::clientWindow(TopLevelBrowsingContextId) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto fb = framebufferSizeLocked();
  return {UintSize{fb.width, fb.height}, position_};
}

void HeadlessWindow::setInnerSize(TopLevelBrowsingContextId, UintSize size) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (fullscreen_) {
      restoreSize_.width = static_cast<float>(size.width) / hidpi_.value;
      restoreSize_.height = static_cast<float>(size.height) / hidpi_.value;
      return;
    }
    applyInnerSizeLocked(static_cast<float>(size.width), static_cast<float>(size.height));
  }
  pushResize();
}

void HeadlessWindow::setPosition(TopLevelBrowsingContextId, IntPoint point) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto fb = framebufferSizeLocked();
  auto maxX = static_cast<std::int64_t>(config_.screenWidth) - fb.width;
  auto maxY = static_cast<std::int64_t>(config_.screenHeight) - fb.height;
  position_.x = static_cast<std::int32_t>(
      std::clamp<std::int64_t>(point.x, 0, std::max<std::int64_t>(0, maxX)));
  position_.y = static_cast<std::int32_t>(
      std::clamp<std::int64_t>(point.y, 0, std::max<std::int64_t>(0, maxY)));
}

void HeadlessWindow::setFullscreenState(TopLevelBrowsingContextId, bool state) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (fullscreen_ == state) return;
    fullscreen_ = state;
    if (state) {
      restoreSize_ = size_;
      applyInnerSizeLocked(static_cast<float>(config_.screenWidth),
                           static_cast<float>(config_.screenHeight));
    } else {
      applyInnerSizeLocked(restoreSize_.width * hidpi_.value,
                           restoreSize_.height * hidpi_.value);
    }
  }
  pushResize();
}

// ---- chrome notifications ----

void HeadlessWindow::setPageTitle(TopLevelBrowsingContextId ctx, std::optional<std::string> title) {
  chrome_.push(chrome::TitleChanged{ctx, std::move(title)});
}

void HeadlessWindow::status(TopLevelBrowsingContextId ctx, std::optional<std::string> text) {
  chrome_.push(chrome::StatusChanged{ctx, std::move(text)});
}

void HeadlessWindow::loadStart(TopLevelBrowsingContextId ctx) {
  chrome_.push(chrome::LoadStarted{ctx});
}

void HeadlessWindow::loadEnd(TopLevelBrowsingContextId ctx) {
  chrome_.push(chrome::LoadEnded{ctx});
}

void HeadlessWindow::loadError(TopLevelBrowsingContextId ctx, NetError code, std::string url) {
  std::fprintf(stderr, "[HeadlessWindow] load error ctx=%llu %s (%s)\n",
               static_cast<unsigned long long>(ctx.value), url.c_str(), netErrorName(code));
  chrome_.push(chrome::LoadFailed{ctx, code, std::move(url)});
}

void HeadlessWindow::headParsed(TopLevelBrowsingContextId ctx) {
  chrome_.push(chrome::HeadParsed{ctx});
}

void HeadlessWindow::historyChanged(TopLevelBrowsingContextId ctx, std::vector<LoadData> entries,
                                    std::size_t current) {
  chrome_.push(chrome::HistoryChanged{ctx, std::move(entries), current});
}

void HeadlessWindow::setFavicon(TopLevelBrowsingContextId ctx, Url url) {
  chrome_.push(chrome::FaviconChanged{ctx, std::move(url)});
}

void HeadlessWindow::allowNavigation(TopLevelBrowsingContextId ctx, Url url,
                                     OneShotSender<bool> reply) {
  NavigationFilter filter;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    filter = navFilter_;
  }
  if (filter) {
    if (!reply.send(filter(ctx, url))) {
      std::fprintf(stderr, "[HeadlessWindow] navigation reply for ctx=%llu not delivered\n",
                   static_cast<unsigned long long>(ctx.value));
    }
    return;
  }
  chrome_.push(chrome::NavigationRequest{ctx, std::move(url), std::move(reply)});
}

// ---- input / cursor ----

void HeadlessWindow::setCursor(Cursor cursor) {
  std::lock_guard<std::mutex> lock(mtx_);
  cursor_ = cursor;
}

void HeadlessWindow::handleKey(std::optional<TopLevelBrowsingContextId> ctx,
                               std::optional<char32_t> ch, Key key, KeyModifiers mods) {
  chrome_.push(chrome::KeyHandled{ctx, ch, key, mods});
}

std::unique_ptr<EventLoopWaker> HeadlessWindow::createEventLoopWaker() {
  if (!queue_) return std::make_unique<SignalWaker>(std::weak_ptr<LoopSignal>());
  return queue_->createWaker();
}

void HeadlessWindow::setAnimationState(AnimationState state) {
  std::lock_guard<std::mutex> lock(mtx_);
  animation_ = state;
}

// ---- producer side ----

bool HeadlessWindow::injectEvent(WindowEvent event) {
  if (!queue_) return false;
  return queue_->push(std::move(event));
}

void HeadlessWindow::resize(std::uint32_t width, std::uint32_t height) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    applyInnerSizeLocked(static_cast<float>(width) * hidpi_.value,
                         static_cast<float>(height) * hidpi_.value);
  }
  pushResize();
}

void HeadlessWindow::setHidpiFactor(float factor) {
  if (!(factor > 0.0f)) return;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    // Density-independent size stays; the framebuffer follows the factor
    // but never outgrows the screen.
    float width = size_.width * factor;
    float height = size_.height * factor;
    hidpi_.value = factor;
    applyInnerSizeLocked(width, height);
  }
  pushResize();
}

void HeadlessWindow::setMinimized(bool minimized) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    minimized_ = minimized;
  }
  if (!minimized) requestRefresh();
}

bool HeadlessWindow::requestRefresh() { return injectEvent(ev::Refresh{}); }

bool HeadlessWindow::requestQuit() { return injectEvent(ev::Quit{}); }

OneShotReceiver<TopLevelBrowsingContextId> HeadlessWindow::openBrowser(const Url& url) {
  auto [tx, rx] = makeOneShot<TopLevelBrowsingContextId>();
  injectEvent(ev::NewBrowser{url, std::move(tx)});
  return std::move(rx);
}

// ---- embedder side ----

void HeadlessWindow::setNavigationFilter(NavigationFilter filter) {
  std::lock_guard<std::mutex> lock(mtx_);
  navFilter_ = std::move(filter);
}

bool HeadlessWindow::pollChromeEvent(ChromeEvent& out) { return chrome_.pop(out); }

std::vector<ChromeEvent> HeadlessWindow::drainChromeEvents() { return chrome_.drain(); }

// ---- introspection ----

std::size_t HeadlessWindow::presentCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return presents_;
}

std::size_t HeadlessWindow::refusedCompositeCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return refusedComposites_;
}

Cursor HeadlessWindow::cursor() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return cursor_;
}

AnimationState HeadlessWindow::animationState() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return animation_;
}

bool HeadlessWindow::isFullscreen() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return fullscreen_;
}

bool HeadlessWindow::isMinimized() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return minimized_;
}

IntPoint HeadlessWindow::position() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return position_;
}

} // namespace cw
