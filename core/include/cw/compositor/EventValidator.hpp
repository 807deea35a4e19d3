#pragma once
#include "cw/events/WindowEvent.hpp"
#include "cw/ids/BrowsingContextRegistry.hpp"

#include <string>

namespace cw {

struct CheckResult {
  bool ok{true};
  std::string code;     // e.g. "CLOSED_CONTEXT"
  std::string message;
};

// Checks an event against the producer contract before dispatch:
//   EVENT_AFTER_QUIT  anything after Quit
//   UNKNOWN_CONTEXT   id never created
//   CLOSED_CONTEXT    id already closed
//   BAD_ZOOM          non-finite or non-positive zoom factor
CheckResult validateEvent(const WindowEvent& event,
                          const BrowsingContextRegistry& registry,
                          bool quitSeen);

} // namespace cw
