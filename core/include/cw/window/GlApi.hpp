#pragma once

namespace cw {

// Handle to a loaded GL function-pointer table. Shared between the
// compositor and the window backend; it lives as long as its last holder.
class GlApi {
public:
  virtual ~GlApi() = default;

  virtual bool makeCurrent() = 0;
  virtual void* getProcAddress(const char* name) const = 0;

  // GLAD version number (major * 10000 + minor), 0 when nothing is loaded.
  virtual int version() const = 0;

  // Block until submitted GL work has completed.
  virtual void finish() = 0;

  // Resize the render target to width x height device pixels. Backends whose
  // target follows the native window have nothing to do.
  virtual bool resizeTarget(int /*width*/, int /*height*/) { return true; }
};

// Stand-in for backends without a GL context. There is nothing to bind, so
// makeCurrent() trivially succeeds.
class NullGlApi : public GlApi {
public:
  bool makeCurrent() override { return true; }
  void* getProcAddress(const char*) const override { return nullptr; }
  int version() const override { return 0; }
  void finish() override {}
};

} // namespace cw
