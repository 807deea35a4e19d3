#include "cw/compositor/EventValidator.hpp"

#include <cmath>

namespace cw {

namespace {

CheckResult fail(const std::string& code, const std::string& message) {
  CheckResult r;
  r.ok = false;
  r.code = code;
  r.message = message;
  return r;
}

bool validZoom(float m) { return std::isfinite(m) && m > 0.0f; }

} // namespace

CheckResult validateEvent(const WindowEvent& event,
                          const BrowsingContextRegistry& registry,
                          bool quitSeen) {
  if (quitSeen) {
    return fail("EVENT_AFTER_QUIT",
                std::string(eventLabel(event)) + " arrived after Quit");
  }

  if (auto ctx = browsingContextOf(event)) {
    if (registry.wasClosed(*ctx)) {
      return fail("CLOSED_CONTEXT",
                  "context " + std::to_string(ctx->value) + " was closed");
    }
    if (!registry.isAlive(*ctx)) {
      return fail("UNKNOWN_CONTEXT",
                  "context " + std::to_string(ctx->value) + " was never created");
    }
  }

  if (const auto* z = std::get_if<ev::Zoom>(&event)) {
    if (!validZoom(z->magnification)) return fail("BAD_ZOOM", "zoom factor must be > 0");
  }
  if (const auto* z = std::get_if<ev::PinchZoom>(&event)) {
    if (!validZoom(z->magnification)) return fail("BAD_ZOOM", "pinch zoom factor must be > 0");
  }

  return {};
}

} // namespace cw
