#pragma once
#include "cw/events/WindowEvent.hpp"

#include <string>

namespace cw {

// One-line JSON rendering of an event for logs and trace files:
// {"type":"Resize","width":800,"height":600}
// The NewBrowser reply channel is reported as "replyPending".
std::string eventToJson(const WindowEvent& e);

} // namespace cw
