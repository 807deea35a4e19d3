#pragma once
#include "cw/window/GlApi.hpp"

#ifdef CW_HAS_OSMESA

#include <glad/gl.h>    // GLAD must precede osmesa.h (guards GL/gl.h)

// OSMesa header uses GLAPI and APIENTRY from GL/gl.h, which GLAD suppresses.
#ifndef APIENTRY
#define APIENTRY
#endif
#ifndef GLAPI
#define GLAPI extern
#endif

#include <GL/osmesa.h>
#include <cstdint>
#include <vector>

namespace cw {

// Offscreen GL for the headless backend: an OSMesa core-profile context
// rendering into a client-side RGBA buffer.
class OsMesaGlApi : public GlApi {
public:
  OsMesaGlApi() = default;
  ~OsMesaGlApi() override;

  OsMesaGlApi(const OsMesaGlApi&) = delete;
  OsMesaGlApi& operator=(const OsMesaGlApi&) = delete;

  bool init(int width, int height);

  bool makeCurrent() override;
  void* getProcAddress(const char* name) const override;
  int version() const override { return version_; }
  void finish() override;

  // Reallocates the color buffer and rebinds a live context to it.
  bool resizeTarget(int width, int height) override;

  int width() const { return width_; }
  int height() const { return height_; }

private:
  void allocate(int width, int height);

  OSMesaContext ctx_{nullptr};
  int width_{0};
  int height_{0};
  int version_{0};
  std::vector<std::uint8_t> framebuf_;
};

} // namespace cw

#endif // CW_HAS_OSMESA
