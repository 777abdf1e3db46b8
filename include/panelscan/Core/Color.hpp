/*****************************************************************
 * File:      Color.hpp
 * Category:  include/panelscan/Core
 *
 * Purpose:
 *    Pixel color type for the panel driver. 8 bits per channel
 *    in the frame buffer; reduced to COLOR_BITS only when a
 *    bitplane is shifted out.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_CORE_COLOR_HPP_
#define PANELSCAN_INCLUDE_CORE_COLOR_HPP_

#include <stdint.h>

namespace panelscan{

// ============================================================
// RGB Color (8-bit per channel)
// ============================================================

struct RGB{
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;

  constexpr RGB() = default;
  constexpr RGB(uint8_t red, uint8_t green, uint8_t blue) : r(red), g(green), b(blue){}

  // From 32-bit packed (0xRRGGBB)
  static constexpr RGB fromPacked(uint32_t packed){
    return RGB(
      static_cast<uint8_t>((packed >> 16) & 0xFF),
      static_cast<uint8_t>((packed >> 8) & 0xFF),
      static_cast<uint8_t>(packed & 0xFF)
    );
  }

  constexpr uint32_t toPacked() const{
    return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;
  }

  // RGB565 with bit replication so 0x1F/0x3F expand to 0xFF
  static constexpr RGB fromRgb565(uint16_t c){
    return RGB(
      static_cast<uint8_t>(((c >> 11) & 0x1F) << 3 | ((c >> 11) & 0x1F) >> 2),
      static_cast<uint8_t>(((c >> 5) & 0x3F) << 2 | ((c >> 5) & 0x3F) >> 4),
      static_cast<uint8_t>((c & 0x1F) << 3 | (c & 0x1F) >> 2)
    );
  }

  constexpr uint16_t toRgb565() const{
    return static_cast<uint16_t>(((r >> 3) << 11) | ((g >> 2) << 5) | (b >> 3));
  }

  /** Per-channel blend, t in [0,1], rounded to nearest */
  static RGB lerp(const RGB& a, const RGB& b, float t){
    t = t < 0.0f ? 0.0f : (t > 1.0f ? 1.0f : t);
    auto mix = [t](uint8_t from, uint8_t to) -> uint8_t{
      float v = from * (1.0f - t) + to * t;
      return static_cast<uint8_t>(v + 0.5f);
    };
    return RGB(mix(a.r, b.r), mix(a.g, b.g), mix(a.b, b.b));
  }

  constexpr bool operator==(const RGB& o) const{ return r == o.r && g == o.g && b == o.b; }
  constexpr bool operator!=(const RGB& o) const{ return !(*this == o); }

  // Common colors
  static constexpr RGB Black()   { return RGB(0, 0, 0); }
  static constexpr RGB White()   { return RGB(255, 255, 255); }
  static constexpr RGB Red()     { return RGB(255, 0, 0); }
  static constexpr RGB Green()   { return RGB(0, 255, 0); }
  static constexpr RGB Blue()    { return RGB(0, 0, 255); }
  static constexpr RGB Yellow()  { return RGB(255, 255, 0); }
  static constexpr RGB Cyan()    { return RGB(0, 255, 255); }
  static constexpr RGB Magenta() { return RGB(255, 0, 255); }
};

// ============================================================
// Linear depth reduction
// ============================================================

/** Drop an 8-bit channel to BITS by truncation (no gamma) */
template<int BITS>
constexpr uint8_t quantizeChannel(uint8_t v){
  static_assert(BITS >= 1 && BITS <= 8, "BITS must be 1..8");
  return static_cast<uint8_t>(v >> (8 - BITS));
}

/** Widen a BITS channel back to 8 bits */
template<int BITS>
constexpr uint8_t expandChannel(uint8_t v){
  static_assert(BITS >= 1 && BITS <= 8, "BITS must be 1..8");
  constexpr uint8_t max_val = static_cast<uint8_t>((1 << BITS) - 1);
  return static_cast<uint8_t>((v > max_val ? max_val : v) << (8 - BITS));
}

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_CORE_COLOR_HPP_
