/*****************************************************************
 * File:      Geometry.hpp
 * Category:  include/panelscan/Core
 *
 * Purpose:
 *    Compile-time panel geometry. HUB75 panels drive two rows
 *    at once (row r and row r + HEIGHT/2), so only HEIGHT/2 rows
 *    need an address.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_CORE_GEOMETRY_HPP_
#define PANELSCAN_INCLUDE_CORE_GEOMETRY_HPP_

#include <stdint.h>

namespace panelscan{

/** Maximum HUB75 address lines (A, B, C, D, E) */
constexpr int MAX_ADDRESS_LINES = 5;

/** ceil(log2(rows)), 0 for a single row */
constexpr int addressBitsFor(int rows){
  int bits = 0;
  while((1 << bits) < rows) bits++;
  return bits;
}

template<int WIDTH, int HEIGHT, int COLOR_BITS>
struct PanelGeometry{
  static_assert(WIDTH > 0, "WIDTH must be positive");
  static_assert(HEIGHT >= 2 && (HEIGHT % 2) == 0, "HEIGHT must be even");
  static_assert(COLOR_BITS >= 1 && COLOR_BITS <= 8, "COLOR_BITS must be 1..8");

  static constexpr int width = WIDTH;
  static constexpr int height = HEIGHT;
  static constexpr int colorBits = COLOR_BITS;
  static constexpr int rows = HEIGHT / 2;
  static constexpr int addressBits = addressBitsFor(HEIGHT / 2);

  // Sum of bitplane weights 2^0 + ... + 2^(COLOR_BITS-1)
  static constexpr uint32_t totalWeight = (1u << COLOR_BITS) - 1;

  static_assert(addressBits <= MAX_ADDRESS_LINES, "HEIGHT/2 needs more than 5 address lines");
};

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_CORE_GEOMETRY_HPP_
