/*****************************************************************
 * File:      FrameSource.hpp
 * Category:  include/panelscan/Animation
 *
 * Purpose:
 *    Ordered, immutable frame sets an Animation plays from.
 *    Frames can be owned buffers, a packed RGB888 block (for
 *    images baked into flash), one character of a string per
 *    frame, or generated on demand.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_ANIMATION_FRAME_SOURCE_HPP_
#define PANELSCAN_INCLUDE_ANIMATION_FRAME_SOURCE_HPP_

#include "panelscan/Core/Font5x7.hpp"
#include "panelscan/Display/FrameBuffer.hpp"
#include "panelscan/HAL/HalTypes.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace panelscan{

template<int WIDTH, int HEIGHT>
class IFrameSource{
public:
  using Buffer = FrameBuffer<WIDTH, HEIGHT>;

  virtual ~IFrameSource() = default;

  virtual size_t frameCount() const = 0;

  /** Copy frame `index` into out
   * @return HalResult::INVALID_PARAM if index >= frameCount()
   */
  virtual hal::HalResult frameAt(size_t index, Buffer& out) const = 0;
};

// ============================================================
// Owned frame list
// ============================================================

template<int WIDTH, int HEIGHT>
class FrameListSource : public IFrameSource<WIDTH, HEIGHT>{
public:
  using Buffer = FrameBuffer<WIDTH, HEIGHT>;

  FrameListSource() = default;
  explicit FrameListSource(std::vector<Buffer> frames) : frames_(std::move(frames)){}

  void add(const Buffer& frame){ frames_.push_back(frame); }

  size_t frameCount() const override{ return frames_.size(); }

  hal::HalResult frameAt(size_t index, Buffer& out) const override{
    if(index >= frames_.size()) return hal::HalResult::INVALID_PARAM;
    out.copyFrom(frames_[index]);
    return hal::HalResult::OK;
  }

private:
  std::vector<Buffer> frames_;
};

// ============================================================
// Packed RGB888 block
// ============================================================

/** Non-owning view over WIDTH*HEIGHT*3 bytes per frame.
 *  A length that is not a whole number of frames yields no
 *  frames at all.
 */
template<int WIDTH, int HEIGHT>
class RgbDataSource : public IFrameSource<WIDTH, HEIGHT>{
public:
  using Buffer = FrameBuffer<WIDTH, HEIGHT>;

  RgbDataSource(const uint8_t* data, size_t len)
    : data_(data)
    , len_(len)
  {}

  size_t frameCount() const override{
    if(data_ == nullptr || len_ % Buffer::RGB_DATA_SIZE != 0) return 0;
    return len_ / Buffer::RGB_DATA_SIZE;
  }

  hal::HalResult frameAt(size_t index, Buffer& out) const override{
    if(index >= frameCount()) return hal::HalResult::INVALID_PARAM;
    return out.fromRgbData(data_ + index * Buffer::RGB_DATA_SIZE, Buffer::RGB_DATA_SIZE);
  }

private:
  const uint8_t* data_;
  size_t len_;
};

// ============================================================
// Text
// ============================================================

/** One frame per character of text, each glyph centered on a
 *  black frame. Characters the font lacks render as '?'.
 */
template<int WIDTH, int HEIGHT>
class TextSource : public IFrameSource<WIDTH, HEIGHT>{
public:
  using Buffer = FrameBuffer<WIDTH, HEIGHT>;

  explicit TextSource(std::string text, const RGB& color = RGB::White())
    : text_(std::move(text))
    , color_(color)
  {}

  size_t frameCount() const override{ return text_.size(); }

  hal::HalResult frameAt(size_t index, Buffer& out) const override{
    if(index >= text_.size()) return hal::HalResult::INVALID_PARAM;
    out.clear();
    const char c = text_[index];
    for(int col = 0; col < GLYPH_WIDTH; col++){
      for(int row = 0; row < GLYPH_HEIGHT; row++){
        if(glyphPixel(c, col, row)){
          out.setPixel(ORIGIN_X + col, ORIGIN_Y + row, color_);
        }
      }
    }
    return hal::HalResult::OK;
  }

  static constexpr int ORIGIN_X = (WIDTH - GLYPH_WIDTH) / 2;
  static constexpr int ORIGIN_Y = (HEIGHT - GLYPH_HEIGHT) / 2;

private:
  std::string text_;
  RGB color_;
};

// ============================================================
// Generator
// ============================================================

template<int WIDTH, int HEIGHT>
class GeneratorSource : public IFrameSource<WIDTH, HEIGHT>{
public:
  using Buffer = FrameBuffer<WIDTH, HEIGHT>;
  using Generator = std::function<void(size_t index, Buffer& out)>;

  GeneratorSource(size_t count, Generator generator)
    : count_(count)
    , generator_(std::move(generator))
  {}

  size_t frameCount() const override{
    return generator_ ? count_ : 0;
  }

  hal::HalResult frameAt(size_t index, Buffer& out) const override{
    if(index >= frameCount()) return hal::HalResult::INVALID_PARAM;
    out.clear();
    generator_(index, out);
    return hal::HalResult::OK;
  }

private:
  size_t count_;
  Generator generator_;
};

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_ANIMATION_FRAME_SOURCE_HPP_
