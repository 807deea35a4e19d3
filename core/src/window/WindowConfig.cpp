#include "cw/window/WindowConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cstdio>
#include <fstream>
#include <sstream>

namespace cw {

std::string serializeWindowConfig(const WindowConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("title", rapidjson::Value(cfg.title.c_str(), alloc), alloc);
  doc.AddMember("width", cfg.width, alloc);
  doc.AddMember("height", cfg.height, alloc);
  doc.AddMember("hidpiFactor", static_cast<double>(cfg.hidpiFactor), alloc);

  rapidjson::Value screen(rapidjson::kObjectType);
  screen.AddMember("width", cfg.screenWidth, alloc);
  screen.AddMember("height", cfg.screenHeight, alloc);
  doc.AddMember("screen", screen, alloc);

  doc.AddMember("fullscreen", cfg.fullscreen, alloc);
  doc.AddMember("supportsClipboard", cfg.supportsClipboard, alloc);
  doc.AddMember("animatingPollIntervalMs", cfg.animatingPollIntervalMs, alloc);

  rapidjson::Value nav(rapidjson::kObjectType);
  nav.AddMember("timeoutMs", cfg.navigationTimeoutMs, alloc);
  nav.AddMember("allowOnTimeout", cfg.allowNavigationOnTimeout, alloc);
  doc.AddMember("navigation", nav, alloc);

  doc.AddMember("traceEvents", cfg.traceEvents, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeWindowConfig(const std::string& json, WindowConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  if (doc.HasMember("title") && doc["title"].IsString())
    out.title = doc["title"].GetString();
  if (doc.HasMember("width") && doc["width"].IsUint())
    out.width = doc["width"].GetUint();
  if (doc.HasMember("height") && doc["height"].IsUint())
    out.height = doc["height"].GetUint();
  if (doc.HasMember("hidpiFactor") && doc["hidpiFactor"].IsNumber()) {
    double f = doc["hidpiFactor"].GetDouble();
    if (f >= 0.0) out.hidpiFactor = static_cast<float>(f);
  }

  if (doc.HasMember("screen") && doc["screen"].IsObject()) {
    const auto& s = doc["screen"];
    if (s.HasMember("width") && s["width"].IsUint())
      out.screenWidth = s["width"].GetUint();
    if (s.HasMember("height") && s["height"].IsUint())
      out.screenHeight = s["height"].GetUint();
  }

  if (doc.HasMember("fullscreen") && doc["fullscreen"].IsBool())
    out.fullscreen = doc["fullscreen"].GetBool();
  if (doc.HasMember("supportsClipboard") && doc["supportsClipboard"].IsBool())
    out.supportsClipboard = doc["supportsClipboard"].GetBool();
  if (doc.HasMember("animatingPollIntervalMs") && doc["animatingPollIntervalMs"].IsInt()) {
    int v = doc["animatingPollIntervalMs"].GetInt();
    if (v > 0) out.animatingPollIntervalMs = v;
  }

  if (doc.HasMember("navigation") && doc["navigation"].IsObject()) {
    const auto& n = doc["navigation"];
    if (n.HasMember("timeoutMs") && n["timeoutMs"].IsInt()) {
      int v = n["timeoutMs"].GetInt();
      if (v >= 0) out.navigationTimeoutMs = v;
    }
    if (n.HasMember("allowOnTimeout") && n["allowOnTimeout"].IsBool())
      out.allowNavigationOnTimeout = n["allowOnTimeout"].GetBool();
  }

  if (doc.HasMember("traceEvents") && doc["traceEvents"].IsBool())
    out.traceEvents = doc["traceEvents"].GetBool();

  return true;
}

bool loadWindowConfigFile(const std::string& path, WindowConfig& out) {
  std::ifstream in(path);
  if (!in) {
    std::fprintf(stderr, "[WindowConfig] cannot open %s\n", path.c_str());
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (!deserializeWindowConfig(ss.str(), out)) {
    std::fprintf(stderr, "[WindowConfig] %s is not a JSON object\n", path.c_str());
    return false;
  }
  return true;
}

} // namespace cw
