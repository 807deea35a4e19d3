#ifdef CW_HAS_OSMESA

#include "cw/platform/OsMesaGlApi.hpp"
#include <cstdio>

namespace cw {

OsMesaGlApi::~OsMesaGlApi() {
  if (ctx_) {
    OSMesaDestroyContext(ctx_);
  }
}

bool OsMesaGlApi::init(int width, int height) {
  static const int attribs[] = {
    OSMESA_FORMAT,            OSMESA_RGBA,
    OSMESA_DEPTH_BITS,        24,
    OSMESA_STENCIL_BITS,      8,
    OSMESA_PROFILE,           OSMESA_CORE_PROFILE,
    OSMESA_CONTEXT_MAJOR_VERSION, 3,
    OSMESA_CONTEXT_MINOR_VERSION, 3,
    0
  };

  ctx_ = OSMesaCreateContextAttribs(attribs, nullptr);
  if (!ctx_) {
    std::fprintf(stderr, "OsMesaGlApi: OSMesaCreateContextAttribs failed\n");
    return false;
  }

  allocate(width, height);
  if (!makeCurrent()) {
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
    return false;
  }

  version_ = gladLoadGL((GLADloadfunc)OSMesaGetProcAddress);
  if (!version_) {
    std::fprintf(stderr, "OsMesaGlApi: gladLoadGL failed\n");
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
    return false;
  }
  return true;
}

void OsMesaGlApi::allocate(int width, int height) {
  width_  = width > 0 ? width : 1;
  height_ = height > 0 ? height : 1;
  framebuf_.assign(static_cast<std::size_t>(width_) * height_ * 4, 0);
}

bool OsMesaGlApi::resizeTarget(int width, int height) {
  if ((width > 0 ? width : 1) == width_ && (height > 0 ? height : 1) == height_) return true;
  allocate(width, height);
  // The old buffer is gone; a context still bound to it must move over now.
  return ctx_ ? makeCurrent() : true;
}

bool OsMesaGlApi::makeCurrent() {
  if (!ctx_) return false;
  if (!OSMesaMakeCurrent(ctx_, framebuf_.data(), GL_UNSIGNED_BYTE, width_, height_)) {
    std::fprintf(stderr, "OsMesaGlApi: OSMesaMakeCurrent failed\n");
    return false;
  }
  return true;
}

void* OsMesaGlApi::getProcAddress(const char* name) const {
  return reinterpret_cast<void*>(OSMesaGetProcAddress(name));
}

void OsMesaGlApi::finish() {
  if (ctx_) glFinish();
}

} // namespace cw

#endif // CW_HAS_OSMESA
