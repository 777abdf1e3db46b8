/*****************************************************************
 * File:      Font5x7.hpp
 * Category:  include/panelscan/Core
 *
 * Purpose:
 *    Fixed 5x7 bitmap font covering printable ASCII (32-126).
 *    Glyphs are stored column-wise: one byte per column, LSB
 *    is the top row.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_CORE_FONT_5X7_HPP_
#define PANELSCAN_INCLUDE_CORE_FONT_5X7_HPP_

#include <stdint.h>

namespace panelscan{

constexpr int GLYPH_WIDTH = 5;
constexpr int GLYPH_HEIGHT = 7;

/** Column data for one character
 * @param c Character; anything outside 32-126 maps to '?'
 * @return GLYPH_WIDTH column bytes
 */
const uint8_t* glyphColumns(char c);

/** True if pixel (col, row) of the glyph for c is set */
inline bool glyphPixel(char c, int col, int row){
  if(col < 0 || col >= GLYPH_WIDTH || row < 0 || row >= GLYPH_HEIGHT) return false;
  return (glyphColumns(c)[col] >> row) & 1;
}

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_CORE_FONT_5X7_HPP_
