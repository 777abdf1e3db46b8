/*****************************************************************
 * File:      FrameBuffer.hpp
 * Category:  include/panelscan/Display
 *
 * Purpose:
 *    Fixed-size pixel storage for one panel image.
 *    Every access is bounds checked: writes outside the panel
 *    are dropped, reads outside the panel return black.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_DISPLAY_FRAME_BUFFER_HPP_
#define PANELSCAN_INCLUDE_DISPLAY_FRAME_BUFFER_HPP_

#include "panelscan/Core/Color.hpp"
#include "panelscan/Display/PixelSink.hpp"
#include "panelscan/HAL/HalTypes.hpp"

#include <algorithm>

namespace panelscan{

template<int WIDTH, int HEIGHT>
class FrameBuffer : public IPixelSink{
public:
  static_assert(WIDTH > 0 && HEIGHT > 0, "FrameBuffer needs a non-empty area");

  static constexpr int BUFFER_WIDTH = WIDTH;
  static constexpr int BUFFER_HEIGHT = HEIGHT;
  static constexpr int PIXEL_COUNT = WIDTH * HEIGHT;
  static constexpr size_t RGB_DATA_SIZE = static_cast<size_t>(PIXEL_COUNT) * 3;

  FrameBuffer(){
    clear();
  }

  /** Clear to black */
  void clear(){
    fill(RGB::Black());
  }

  /** Clear to a colour */
  void clear(const RGB& color){
    fill(color);
  }

  void fill(const RGB& color){
    std::fill(pixels_, pixels_ + PIXEL_COUNT, color);
  }

  void setPixel(int x, int y, const RGB& color){
    if(inBounds(x, y)){
      pixels_[y * WIDTH + x] = color;
    }
  }

  RGB getPixel(int x, int y) const{
    if(inBounds(x, y)){
      return pixels_[y * WIDTH + x];
    }
    return RGB::Black();
  }

  // No bounds check, for the scan loop
  const RGB& at(int x, int y) const{
    return pixels_[y * WIDTH + x];
  }

  RGB& at(int x, int y){
    return pixels_[y * WIDTH + x];
  }

  static bool inBounds(int x, int y){
    return x >= 0 && x < WIDTH && y >= 0 && y < HEIGHT;
  }

  /** Pointer to the first pixel of row y, nullptr if out of range */
  const RGB* row(int y) const{
    return (y >= 0 && y < HEIGHT) ? &pixels_[y * WIDTH] : nullptr;
  }

  void copyFrom(const FrameBuffer& other){
    std::copy(other.pixels_, other.pixels_ + PIXEL_COUNT, pixels_);
  }

  /** Load packed RGB888 (row-major, 3 bytes per pixel)
   * @return HalResult::INVALID_PARAM if len != WIDTH * HEIGHT * 3
   */
  hal::HalResult fromRgbData(const uint8_t* data, size_t len){
    if(data == nullptr || len != RGB_DATA_SIZE){
      return hal::HalResult::INVALID_PARAM;
    }
    for(int i = 0; i < PIXEL_COUNT; i++){
      pixels_[i] = RGB(data[i * 3], data[i * 3 + 1], data[i * 3 + 2]);
    }
    return hal::HalResult::OK;
  }

  /** Export as packed RGB888
   * @return HalResult::INVALID_PARAM if out is smaller than WIDTH * HEIGHT * 3
   */
  hal::HalResult toRgbData(uint8_t* out, size_t len) const{
    if(out == nullptr || len < RGB_DATA_SIZE){
      return hal::HalResult::INVALID_PARAM;
    }
    for(int i = 0; i < PIXEL_COUNT; i++){
      out[i * 3] = pixels_[i].r;
      out[i * 3 + 1] = pixels_[i].g;
      out[i * 3 + 2] = pixels_[i].b;
    }
    return hal::HalResult::OK;
  }

  const RGB* data() const{ return pixels_; }
  RGB* data(){ return pixels_; }

  bool operator==(const FrameBuffer& other) const{
    for(int i = 0; i < PIXEL_COUNT; i++){
      if(pixels_[i] != other.pixels_[i]) return false;
    }
    return true;
  }

  bool operator!=(const FrameBuffer& other) const{ return !(*this == other); }

  // IPixelSink
  void drawPixel(int x, int y, const RGB& color) override{
    setPixel(x, y, color);
  }

  Rect bounds() const override{
    return Rect{0, 0, WIDTH, HEIGHT};
  }

private:
  RGB pixels_[PIXEL_COUNT];
};

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_DISPLAY_FRAME_BUFFER_HPP_
