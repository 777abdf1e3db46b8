/*****************************************************************
 * File:      FrameBufferTests.cpp
 * Category:  test
 *
 * Purpose:
 *    Frame buffer bounds handling, RGB888 import/export and
 *    front/back buffer swapping.
 *****************************************************************/

#include "TestFramework.hpp"

#include "panelscan/Display/BufferPair.hpp"
#include "panelscan/Display/FrameBuffer.hpp"

#include <climits>
#include <vector>

using namespace panelscan;
using panelscan::hal::HalResult;

namespace{

using Buffer = FrameBuffer<16, 8>;

RGB pattern(int x, int y){
  return RGB(static_cast<uint8_t>(x * 10), static_cast<uint8_t>(y * 20), static_cast<uint8_t>(x + y));
}

void fillPattern(Buffer& fb){
  for(int y = 0; y < 8; y++){
    for(int x = 0; x < 16; x++){
      fb.setPixel(x, y, pattern(x, y));
    }
  }
}

} // namespace

// ============================================================
// Frame buffer
// ============================================================

REGISTER_TEST(framebuffer_starts_black, "FrameBuffer"){
  Buffer fb;
  for(int i = 0; i < Buffer::PIXEL_COUNT; i++){
    TEST_ASSERT(fb.data()[i] == RGB::Black());
  }
}

REGISTER_TEST(framebuffer_set_get_in_range, "FrameBuffer"){
  Buffer fb;
  fillPattern(fb);
  bool all = true;
  for(int y = 0; y < 8; y++){
    for(int x = 0; x < 16; x++){
      if(fb.getPixel(x, y) != pattern(x, y)) all = false;
    }
  }
  TEST_ASSERT(all);
}

REGISTER_TEST(framebuffer_out_of_range_set_ignored, "FrameBuffer"){
  Buffer fb;
  fillPattern(fb);
  Buffer before;
  before.copyFrom(fb);

  const int coords[][2] = {{-1, 0}, {0, -1}, {16, 0}, {0, 8}, {16, 8}, {-100, -100}, {INT_MAX, 0}, {0, INT_MIN}};
  for(const auto& c : coords){
    fb.setPixel(c[0], c[1], RGB::White());
  }
  TEST_ASSERT(fb == before);
}

REGISTER_TEST(framebuffer_out_of_range_get_black, "FrameBuffer"){
  Buffer fb;
  fb.fill(RGB::White());
  TEST_ASSERT(fb.getPixel(-1, 0) == RGB::Black());
  TEST_ASSERT(fb.getPixel(16, 0) == RGB::Black());
  TEST_ASSERT(fb.getPixel(0, 8) == RGB::Black());
  TEST_ASSERT(fb.row(8) == nullptr);
  TEST_ASSERT_NOT_NULL(fb.row(7));
}

REGISTER_TEST(framebuffer_clear, "FrameBuffer"){
  Buffer fb;
  fillPattern(fb);
  fb.clear(RGB::Blue());
  TEST_ASSERT(fb.getPixel(5, 5) == RGB::Blue());
  fb.clear();
  TEST_ASSERT(fb.getPixel(5, 5) == RGB::Black());
}

REGISTER_TEST(framebuffer_fill_rect_clips, "FrameBuffer"){
  Buffer fb;
  IPixelSink& sink = fb;
  sink.fillRect(-2, -2, 4, 4, RGB::Red());
  TEST_ASSERT(fb.getPixel(0, 0) == RGB::Red());
  TEST_ASSERT(fb.getPixel(1, 1) == RGB::Red());
  TEST_ASSERT(fb.getPixel(2, 2) == RGB::Black());

  sink.fillRect(14, 6, 10, 10, RGB::Green());
  TEST_ASSERT(fb.getPixel(15, 7) == RGB::Green());
  TEST_ASSERT(fb.getPixel(13, 7) == RGB::Black());

  const Rect b = sink.bounds();
  TEST_ASSERT_EQ(16, b.width);
  TEST_ASSERT_EQ(8, b.height);
  TEST_ASSERT(b.contains(15, 7));
  TEST_ASSERT(!b.contains(16, 7));
}

REGISTER_TEST(framebuffer_draw_pixel_565, "FrameBuffer"){
  Buffer fb;
  fb.drawPixel565(3, 3, 0xF800);
  TEST_ASSERT(fb.getPixel(3, 3) == RGB::Red());
}

REGISTER_TEST(framebuffer_rgb_data, "FrameBuffer"){
  std::vector<uint8_t> data(Buffer::RGB_DATA_SIZE);
  for(size_t i = 0; i < data.size(); i++) data[i] = static_cast<uint8_t>(i);

  Buffer fb;
  TEST_ASSERT(fb.fromRgbData(data.data(), data.size()) == HalResult::OK);
  TEST_ASSERT(fb.getPixel(0, 0) == RGB(0, 1, 2));
  TEST_ASSERT(fb.getPixel(1, 0) == RGB(3, 4, 5));

  std::vector<uint8_t> out(Buffer::RGB_DATA_SIZE);
  TEST_ASSERT(fb.toRgbData(out.data(), out.size()) == HalResult::OK);
  TEST_ASSERT(out == data);
}

REGISTER_TEST(framebuffer_rgb_data_size_mismatch, "FrameBuffer"){
  std::vector<uint8_t> data(Buffer::RGB_DATA_SIZE - 1, 0xFF);
  Buffer fb;
  TEST_ASSERT(fb.fromRgbData(data.data(), data.size()) == HalResult::INVALID_PARAM);
  TEST_ASSERT(fb.getPixel(0, 0) == RGB::Black());
  TEST_ASSERT(fb.fromRgbData(nullptr, Buffer::RGB_DATA_SIZE) == HalResult::INVALID_PARAM);
  TEST_ASSERT(fb.toRgbData(data.data(), data.size()) == HalResult::INVALID_PARAM);
}

// ============================================================
// Buffer pair
// ============================================================

REGISTER_TEST(buffers_draw_goes_to_back, "Buffers"){
  BufferPair<16, 8> pair;
  pair.back().setPixel(1, 1, RGB::Red());
  TEST_ASSERT(pair.front().getPixel(1, 1) == RGB::Black());
  TEST_ASSERT(pair.swap());
  TEST_ASSERT(pair.front().getPixel(1, 1) == RGB::Red());
  TEST_ASSERT(&pair.front() != &pair.back());
}

REGISTER_TEST(buffers_swap_is_a_flip, "Buffers"){
  BufferPair<16, 8> pair;
  const Buffer* front = &pair.front();
  const Buffer* back = &pair.back();
  pair.swap();
  TEST_ASSERT(&pair.front() == back);
  TEST_ASSERT(&pair.back() == front);
  pair.swap();
  TEST_ASSERT(&pair.front() == front);
}

REGISTER_TEST(buffers_swap_deferred_while_scanning, "Buffers"){
  BufferPair<16, 8> pair;
  pair.back().fill(RGB::Green());

  const Buffer& scanned = pair.beginScan();
  TEST_ASSERT(pair.isScanning());
  TEST_ASSERT(!pair.swap());
  TEST_ASSERT(pair.swapPending());
  // Still scanning the old frame
  TEST_ASSERT(&pair.front() == &scanned);
  TEST_ASSERT(scanned.getPixel(0, 0) == RGB::Black());
  pair.endScan();

  // Applied at the start of the next pass
  const Buffer& next = pair.beginScan();
  TEST_ASSERT(!pair.swapPending());
  TEST_ASSERT(next.getPixel(0, 0) == RGB::Green());
  pair.endScan();
  TEST_ASSERT(!pair.isScanning());
}

REGISTER_TEST(buffers_repeated_swap_while_scanning, "Buffers"){
  BufferPair<16, 8> pair;
  const Buffer* original = &pair.front();
  pair.beginScan();
  pair.swap();
  pair.swap();
  pair.endScan();
  // Two requests collapse into one flip
  pair.beginScan();
  TEST_ASSERT(&pair.front() != original);
  pair.endScan();
}

REGISTER_TEST(buffers_back_is_free_after_deferred_swap, "Buffers"){
  BufferPair<16, 8> pair;
  const Buffer& scanned = pair.beginScan();
  pair.back().fill(RGB::Blue());
  TEST_ASSERT(!pair.swap());

  // Drawing continues in a buffer that is neither scanned nor pending
  pair.back().setPixel(0, 0, RGB::Green());
  TEST_ASSERT(&pair.back() != &scanned);
  pair.endScan();

  const Buffer& next = pair.beginScan();
  TEST_ASSERT(&next != &pair.back());
  TEST_ASSERT(next.getPixel(0, 0) == RGB::Blue());
  TEST_ASSERT(next.getPixel(1, 1) == RGB::Blue());
  pair.endScan();

  TEST_ASSERT(pair.swap());
  TEST_ASSERT(pair.front().getPixel(0, 0) == RGB::Green());
}

REGISTER_TEST(buffers_second_deferred_swap_replaces_parked_frame, "Buffers"){
  BufferPair<16, 8> pair;
  pair.beginScan();
  pair.back().fill(RGB::Red());
  pair.swap();
  pair.back().fill(RGB::Green());
  pair.swap();
  // The red buffer comes back for drawing
  TEST_ASSERT(pair.back().getPixel(0, 0) == RGB::Red());
  pair.endScan();

  TEST_ASSERT(pair.beginScan().getPixel(0, 0) == RGB::Green());
  pair.endScan();
}

REGISTER_TEST(buffers_single_mode, "Buffers"){
  BufferPair<16, 8> pair(false);
  TEST_ASSERT(!pair.isDoubleBuffered());
  TEST_ASSERT(&pair.front() == &pair.back());
  pair.back().setPixel(2, 2, RGB::Blue());
  TEST_ASSERT(pair.front().getPixel(2, 2) == RGB::Blue());
  TEST_ASSERT(!pair.swap());
  TEST_ASSERT(&pair.front() == &pair.back());
  // Storage is the same in either mode
  TEST_ASSERT(sizeof(pair) >= 3 * sizeof(Buffer));
}

REGISTER_TEST(buffers_enable_double_seeds_back, "Buffers"){
  BufferPair<16, 8> pair(false);
  pair.back().setPixel(4, 4, RGB::Yellow());
  pair.setDoubleBuffered(true);
  TEST_ASSERT(&pair.front() != &pair.back());
  TEST_ASSERT(pair.back().getPixel(4, 4) == RGB::Yellow());
  TEST_ASSERT(pair.front().getPixel(4, 4) == RGB::Yellow());

  pair.setDoubleBuffered(false);
  TEST_ASSERT(&pair.front() == &pair.back());
}
