#include "cw/events/EventTrace.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>

namespace cw {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void writePoint(JsonWriter& w, const char* key, float x, float y) {
  w.Key(key);
  w.StartObject();
  w.Key("x"); w.Double(static_cast<double>(x));
  w.Key("y"); w.Double(static_cast<double>(y));
  w.EndObject();
}

void writeCtx(JsonWriter& w, TopLevelBrowsingContextId ctx) {
  w.Key("ctx");
  w.Uint64(ctx.value);
}

// Encodes one code point as UTF-8. Surrogates and values past U+10FFFF have
// no encoding and become U+FFFD.
std::string utf8(char32_t cp) {
  if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) cp = 0xFFFD;
  std::string out;
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
  return out;
}

struct PayloadWriter {
  JsonWriter& w;

  void operator()(const ev::Idle&) const {}
  void operator()(const ev::Refresh&) const {}
  void operator()(const ev::Resize& e) const {
    w.Key("width"); w.Uint(e.size.width);
    w.Key("height"); w.Uint(e.size.height);
  }
  void operator()(const ev::TouchpadPressure& e) const {
    writePoint(w, "point", e.point.x, e.point.y);
    w.Key("pressure"); w.Double(static_cast<double>(e.pressure));
    w.Key("phase"); w.String(touchpadPressurePhaseName(e.phase));
  }
  void operator()(const ev::LoadUrl& e) const {
    writeCtx(w, e.ctx);
    w.Key("url"); w.String(e.url.c_str());
  }
  void operator()(const ev::MouseWindowEventClass& e) const {
    w.Key("kind"); w.String(mouseWindowEventKindName(e.event.kind));
    w.Key("button"); w.String(mouseButtonName(e.event.button));
    writePoint(w, "point", e.event.point.x, e.event.point.y);
  }
  void operator()(const ev::MouseWindowMoveEventClass& e) const {
    writePoint(w, "point", e.point.x, e.point.y);
  }
  void operator()(const ev::Touch& e) const {
    w.Key("touchType"); w.String(touchEventTypeName(e.type));
    w.Key("id"); w.Int(e.id);
    writePoint(w, "point", e.point.x, e.point.y);
  }
  void operator()(const ev::Scroll& e) const {
    w.Key("location"); w.String(scrollLocationKindName(e.location.kind));
    if (e.location.kind == ScrollLocation::Kind::Delta)
      writePoint(w, "delta", e.location.delta.x, e.location.delta.y);
    w.Key("origin");
    w.StartObject();
    w.Key("x"); w.Int(e.origin.x);
    w.Key("y"); w.Int(e.origin.y);
    w.EndObject();
    w.Key("touchType"); w.String(touchEventTypeName(e.type));
  }
  void operator()(const ev::Zoom& e) const {
    w.Key("magnification"); w.Double(static_cast<double>(e.magnification));
  }
  void operator()(const ev::PinchZoom& e) const {
    w.Key("magnification"); w.Double(static_cast<double>(e.magnification));
  }
  void operator()(const ev::ResetZoom&) const {}
  void operator()(const ev::Navigation& e) const {
    writeCtx(w, e.ctx);
    w.Key("direction"); w.String(traversalDirectionName(e.direction.kind));
    w.Key("steps"); w.Uint64(e.direction.steps);
  }
  void operator()(const ev::Quit&) const {}
  void operator()(const ev::KeyEvent& e) const {
    w.Key("key"); w.String(keyName(e.key));
    w.Key("state"); w.String(keyStateName(e.state));
    w.Key("modifiers"); w.Uint(e.modifiers.bits);
    w.Key("char");
    if (e.ch) {
      std::string s = utf8(*e.ch);
      w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
    } else {
      w.Null();
    }
  }
  void operator()(const ev::Reload& e) const { writeCtx(w, e.ctx); }
  void operator()(const ev::NewBrowser& e) const {
    w.Key("url"); w.String(e.url.c_str());
    w.Key("replyPending"); w.Bool(e.reply.isConnected());
  }
  void operator()(const ev::CloseBrowser& e) const { writeCtx(w, e.ctx); }
  void operator()(const ev::SelectBrowser& e) const { writeCtx(w, e.ctx); }
  void operator()(const ev::ToggleWebRenderDebug& e) const {
    w.Key("option"); w.String(webRenderDebugOptionName(e.option));
  }
};

} // namespace

std::string eventToJson(const WindowEvent& e) {
  rapidjson::StringBuffer sb;
  JsonWriter writer(sb);
  writer.StartObject();
  writer.Key("type");
  writer.String(eventLabel(e));
  if (!e.valueless_by_exception()) std::visit(PayloadWriter{writer}, e);
  writer.EndObject();
  return sb.GetString();
}

} // namespace cw
