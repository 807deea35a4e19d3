#pragma once
#include <cmath>
#include <cstdint>

namespace cw {

// Unit tags. Device pixels are hardware pixels; density-independent ("px")
// units are device pixels divided by the hidpi factor.
struct DevicePixel {};
struct DeviceIndependentPixel {};
struct LayoutPixel {};
struct UnknownUnit {};

template <typename T, typename Unit>
struct TypedPoint2D {
  T x{};
  T y{};
};

template <typename T, typename Unit>
struct TypedSize2D {
  T width{};
  T height{};

  bool isEmpty() const { return width <= T{} || height <= T{}; }
};

template <typename T, typename Unit>
struct TypedRect {
  TypedPoint2D<T, Unit> origin;
  TypedSize2D<T, Unit> size;
};

template <typename T, typename Unit>
bool operator==(const TypedPoint2D<T, Unit>& a, const TypedPoint2D<T, Unit>& b) {
  return a.x == b.x && a.y == b.y;
}

template <typename T, typename Unit>
bool operator==(const TypedSize2D<T, Unit>& a, const TypedSize2D<T, Unit>& b) {
  return a.width == b.width && a.height == b.height;
}

template <typename T, typename Unit>
bool operator!=(const TypedSize2D<T, Unit>& a, const TypedSize2D<T, Unit>& b) {
  return !(a == b);
}

// Multiplier converting a length in Src units into Dst units.
template <typename Src, typename Dst>
struct ScaleFactor {
  float value{1.0f};

  TypedSize2D<float, Dst> transform(const TypedSize2D<float, Src>& s) const {
    return {s.width * value, s.height * value};
  }
  TypedPoint2D<float, Dst> transform(const TypedPoint2D<float, Src>& p) const {
    return {p.x * value, p.y * value};
  }
};

using DevicePoint     = TypedPoint2D<float, DevicePixel>;
using DeviceIntPoint  = TypedPoint2D<std::int32_t, DevicePixel>;
using DeviceUintSize  = TypedSize2D<std::uint32_t, DevicePixel>;
using DeviceUintRect  = TypedRect<std::uint32_t, DevicePixel>;
using WindowSize      = TypedSize2D<float, DeviceIndependentPixel>;
using LayoutVector2D  = TypedPoint2D<float, LayoutPixel>;
using HiDpiFactor     = ScaleFactor<DeviceIndependentPixel, DevicePixel>;

// Window-manager geometry (outer window size, screen position).
using UintSize = TypedSize2D<std::uint32_t, UnknownUnit>;
using IntPoint = TypedPoint2D<std::int32_t, UnknownUnit>;

// Density-independent size -> device pixels, rounded, clamped at zero.
inline DeviceUintSize toDeviceUintSize(const WindowSize& size, HiDpiFactor factor) {
  auto px = factor.transform(size);
  auto clampRound = [](float v) -> std::uint32_t {
    if (!(v > 0.0f)) return 0;
    return static_cast<std::uint32_t>(std::lround(v));
  };
  return {clampRound(px.width), clampRound(px.height)};
}

} // namespace cw
