/*****************************************************************
 * File:      PixelSink.hpp
 * Category:  include/panelscan/Display
 *
 * Purpose:
 *    Pixel write contract exposed to 2D rasterizers (shapes,
 *    fonts, images). Anything that can take a coloured pixel
 *    and report its bounds can be drawn on.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_DISPLAY_PIXEL_SINK_HPP_
#define PANELSCAN_INCLUDE_DISPLAY_PIXEL_SINK_HPP_

#include "panelscan/Core/Color.hpp"

namespace panelscan{

/** Axis-aligned rectangle, origin top-left */
struct Rect{
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  bool contains(int px, int py) const{
    return px >= x && px < x + width && py >= y && py < y + height;
  }
};

class IPixelSink{
public:
  virtual ~IPixelSink() = default;

  /** Write one pixel. Out-of-bounds coordinates are ignored. */
  virtual void drawPixel(int x, int y, const RGB& color) = 0;

  /** Drawable area */
  virtual Rect bounds() const = 0;

  /** Fill a rectangle, clipped to bounds() */
  virtual void fillRect(int x, int y, int w, int h, const RGB& color){
    const Rect b = bounds();
    int x1 = x < b.x ? b.x : x;
    int y1 = y < b.y ? b.y : y;
    int x2 = (x + w > b.x + b.width) ? b.x + b.width : x + w;
    int y2 = (y + h > b.y + b.height) ? b.y + b.height : y + h;
    for(int py = y1; py < y2; py++){
      for(int px = x1; px < x2; px++){
        drawPixel(px, py, color);
      }
    }
  }

  /** 16-bit colour entry point for rasterizers that work in RGB565 */
  void drawPixel565(int x, int y, uint16_t color){
    drawPixel(x, y, RGB::fromRgb565(color));
  }
};

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_DISPLAY_PIXEL_SINK_HPP_
