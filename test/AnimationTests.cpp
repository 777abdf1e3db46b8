/*****************************************************************
 * File:      AnimationTests.cpp
 * Category:  test
 *
 * Purpose:
 *    Animation sequencer states, step timing and effects.
 *****************************************************************/

#include "TestFramework.hpp"

#include "panelscan/Animation/Animation.hpp"

#include <memory>
#include <vector>

using namespace panelscan;
using panelscan::hal::HalResult;

namespace{

constexpr int W = 8;
constexpr int H = 4;
using Buffer = FrameBuffer<W, H>;
using Anim = Animation<W, H>;

Buffer solid(const RGB& color){
  Buffer fb;
  fb.fill(color);
  return fb;
}

/** Each pixel's red channel is its column, green tags the frame */
Buffer columns(uint8_t tag){
  Buffer fb;
  for(int y = 0; y < H; y++){
    for(int x = 0; x < W; x++){
      fb.setPixel(x, y, RGB(static_cast<uint8_t>(x), tag, 0));
    }
  }
  return fb;
}

std::unique_ptr<IFrameSource<W, H>> listOf(std::vector<Buffer> frames){
  return std::unique_ptr<IFrameSource<W, H>>(new FrameListSource<W, H>(std::move(frames)));
}

} // namespace

// ============================================================
// Construction
// ============================================================

REGISTER_TEST(animation_rejects_empty_source, "Animation"){
  std::unique_ptr<Anim> anim;
  TEST_ASSERT(Anim::create(listOf({}), AnimationEffect::NONE, 100, 0, anim) == HalResult::INVALID_PARAM);
  TEST_ASSERT(anim == nullptr);
  TEST_ASSERT(Anim::create(nullptr, AnimationEffect::NONE, 100, 0, anim) == HalResult::INVALID_PARAM);
  TEST_ASSERT(anim == nullptr);
}

REGISTER_TEST(animation_rejects_zero_duration, "Animation"){
  std::unique_ptr<Anim> anim;
  TEST_ASSERT(Anim::create(listOf({solid(RGB::Red())}), AnimationEffect::FADE, 0, 0, anim) == HalResult::INVALID_PARAM);
  TEST_ASSERT(anim == nullptr);
}

// ============================================================
// NONE
// ============================================================

REGISTER_TEST(animation_none_three_frames, "Animation"){
  std::unique_ptr<Anim> anim;
  TEST_ASSERT(Anim::create(listOf({solid(RGB::Red()), solid(RGB::Green()), solid(RGB::Blue())}),
                           AnimationEffect::NONE, 300, 0, anim) == HalResult::OK);
  Buffer out;

  TEST_ASSERT(anim->next(0, out) == AnimationStatus::APPLY);
  TEST_ASSERT(out.getPixel(0, 0) == RGB::Red());

  TEST_ASSERT(anim->next(50, out) == AnimationStatus::WAIT);

  TEST_ASSERT(anim->next(100, out) == AnimationStatus::APPLY);
  TEST_ASSERT(out.getPixel(0, 0) == RGB::Green());

  TEST_ASSERT(anim->next(250, out) == AnimationStatus::APPLY);
  TEST_ASSERT(out.getPixel(0, 0) == RGB::Blue());

  TEST_ASSERT(anim->next(300, out) == AnimationStatus::DONE);
  TEST_ASSERT(anim->isDone(300));
}

REGISTER_TEST(animation_done_is_terminal, "Animation"){
  std::unique_ptr<Anim> anim;
  TEST_ASSERT(Anim::create(listOf({solid(RGB::Red()), solid(RGB::Green())}),
                           AnimationEffect::NONE, 200, 0, anim) == HalResult::OK);
  Buffer out;
  TEST_ASSERT(anim->next(500, out) == AnimationStatus::DONE);
  TEST_ASSERT(anim->next(100, out) == AnimationStatus::DONE);

  anim->restart(1000);
  TEST_ASSERT(!anim->isDone(1000));
  TEST_ASSERT(anim->next(1000, out) == AnimationStatus::APPLY);
  TEST_ASSERT(out.getPixel(0, 0) == RGB::Red());
}

REGISTER_TEST(animation_waits_before_start, "Animation"){
  std::unique_ptr<Anim> anim;
  TEST_ASSERT(Anim::create(listOf({solid(RGB::Red())}), AnimationEffect::NONE, 100, 1000, anim) == HalResult::OK);
  Buffer out;
  TEST_ASSERT(anim->next(500, out) == AnimationStatus::WAIT);
  TEST_ASSERT(!anim->isDone(500));
  TEST_ASSERT(anim->next(1000, out) == AnimationStatus::APPLY);
}

REGISTER_TEST(animation_clock_wraparound, "Animation"){
  std::unique_ptr<Anim> anim;
  const hal::timestamp_ms_t start = UINT32_MAX - 49;
  TEST_ASSERT(Anim::create(listOf({solid(RGB::Red()), solid(RGB::Green())}),
                           AnimationEffect::NONE, 200, start, anim) == HalResult::OK);
  Buffer out;
  TEST_ASSERT(anim->next(start, out) == AnimationStatus::APPLY);
  // 150 ms after start, past the 32-bit wrap
  TEST_ASSERT(anim->next(100, out) == AnimationStatus::APPLY);
  TEST_ASSERT(out.getPixel(0, 0) == RGB::Green());
}

REGISTER_TEST(animation_per_step_duration, "Animation"){
  std::unique_ptr<Anim> anim;
  TEST_ASSERT(Anim::createPerStep(listOf({solid(RGB::Red()), solid(RGB::Green()), solid(RGB::Blue())}),
                                  AnimationEffect::NONE, 100, 0, anim) == HalResult::OK);
  TEST_ASSERT_EQ(300u, anim->duration());
  TEST_ASSERT_EQ(3u, anim->totalSteps());

  TEST_ASSERT(Anim::createPerStep(listOf({solid(RGB::Red()), solid(RGB::Green()), solid(RGB::Blue())}),
                                  AnimationEffect::FADE, 100, 0, anim) == HalResult::OK);
  TEST_ASSERT_EQ(200u, anim->duration());
  TEST_ASSERT_EQ(2 * FADE_STEPS, anim->totalSteps());
}

// ============================================================
// Effects
// ============================================================

REGISTER_TEST(animation_fade_midpoint_is_mean, "Animation"){
  const RGB a(0, 100, 200);
  const RGB b(200, 50, 0);
  std::unique_ptr<Anim> anim;
  TEST_ASSERT(Anim::create(listOf({solid(a), solid(b)}), AnimationEffect::FADE, 200, 0, anim) == HalResult::OK);

  Buffer out;
  TEST_ASSERT(anim->next(0, out) == AnimationStatus::APPLY);
  TEST_ASSERT(out.getPixel(0, 0) == a);

  TEST_ASSERT(anim->next(100, out) == AnimationStatus::APPLY);
  const RGB mid = out.getPixel(3, 2);
  TEST_ASSERT_NEAR((a.r + b.r) / 2.0, mid.r, 1);
  TEST_ASSERT_NEAR((a.g + b.g) / 2.0, mid.g, 1);
  TEST_ASSERT_NEAR((a.b + b.b) / 2.0, mid.b, 1);
}

REGISTER_TEST(animation_fade_single_frame_is_static, "Animation"){
  std::unique_ptr<Anim> anim;
  TEST_ASSERT(Anim::create(listOf({solid(RGB::Cyan())}), AnimationEffect::FADE, 160, 0, anim) == HalResult::OK);
  Buffer out;
  TEST_ASSERT(anim->next(90, out) == AnimationStatus::APPLY);
  TEST_ASSERT(out.getPixel(1, 1) == RGB::Cyan());
}

REGISTER_TEST(animation_wipe_reveals_left_to_right, "Animation"){
  std::unique_ptr<Anim> anim;
  // W sub-steps over 80 ms, 10 ms each
  TEST_ASSERT(Anim::create(listOf({solid(RGB::Red()), solid(RGB::Blue())}), AnimationEffect::WIPE, 80, 0, anim) == HalResult::OK);
  Buffer out;

  TEST_ASSERT(anim->next(0, out) == AnimationStatus::APPLY);
  TEST_ASSERT(out.getPixel(0, 0) == RGB::Red());

  TEST_ASSERT(anim->next(40, out) == AnimationStatus::APPLY);
  for(int x = 0; x < W; x++){
    TEST_ASSERT(out.getPixel(x, 1) == (x < 4 ? RGB::Blue() : RGB::Red()));
  }
  TEST_ASSERT(anim->next(45, out) == AnimationStatus::WAIT);
}

REGISTER_TEST(animation_slide_enters_from_right, "Animation"){
  std::unique_ptr<Anim> anim;
  TEST_ASSERT(Anim::create(listOf({columns(1), columns(2)}), AnimationEffect::SLIDE, 80, 0, anim) == HalResult::OK);
  Buffer out;

  TEST_ASSERT(anim->next(30, out) == AnimationStatus::APPLY);
  // Offset 3: columns 0..4 show current x+3, 5..7 show next x-5
  for(int x = 0; x < W; x++){
    const RGB expected = x + 3 < W ? RGB(static_cast<uint8_t>(x + 3), 1, 0)
                                   : RGB(static_cast<uint8_t>(x + 3 - W), 2, 0);
    TEST_ASSERT(out.getPixel(x, 0) == expected);
  }
}

REGISTER_TEST(animation_effect_names, "Animation"){
  TEST_ASSERT(strcmp("Slide", animationEffectToString(AnimationEffect::SLIDE)) == 0);
  TEST_ASSERT(strcmp("Wait", animationStatusToString(AnimationStatus::WAIT)) == 0);
}

// ============================================================
// Frame sources
// ============================================================

REGISTER_TEST(animation_rgb_data_source, "Animation"){
  std::vector<uint8_t> data(Buffer::RGB_DATA_SIZE * 2, 0);
  for(size_t i = Buffer::RGB_DATA_SIZE; i < data.size(); i += 3) data[i] = 255;

  RgbDataSource<W, H> src(data.data(), data.size());
  TEST_ASSERT_EQ(2u, src.frameCount());
  Buffer fb;
  TEST_ASSERT(src.frameAt(1, fb) == HalResult::OK);
  TEST_ASSERT(fb.getPixel(2, 2) == RGB::Red());
  TEST_ASSERT(src.frameAt(2, fb) == HalResult::INVALID_PARAM);

  // Truncated block holds no whole frame set
  RgbDataSource<W, H> bad(data.data(), data.size() - 1);
  TEST_ASSERT_EQ(0u, bad.frameCount());
  std::unique_ptr<Anim> anim;
  TEST_ASSERT(Anim::create(std::unique_ptr<IFrameSource<W, H>>(new RgbDataSource<W, H>(data.data(), data.size() - 1)),
                           AnimationEffect::NONE, 100, 0, anim) == HalResult::INVALID_PARAM);
}

REGISTER_TEST(animation_generator_source, "Animation"){
  auto gen = [](size_t index, Buffer& out){
    out.setPixel(static_cast<int>(index), 0, RGB::White());
  };
  std::unique_ptr<Anim> anim;
  TEST_ASSERT(Anim::create(std::unique_ptr<IFrameSource<W, H>>(new GeneratorSource<W, H>(W, gen)),
                           AnimationEffect::NONE, W * 10, 0, anim) == HalResult::OK);
  Buffer out;
  TEST_ASSERT(anim->next(35, out) == AnimationStatus::APPLY);
  TEST_ASSERT(out.getPixel(3, 0) == RGB::White());
  TEST_ASSERT(out.getPixel(2, 0) == RGB::Black());

  GeneratorSource<W, H> empty(4, nullptr);
  TEST_ASSERT_EQ(0u, empty.frameCount());
}

REGISTER_TEST(animation_text_source, "Animation"){
  using Text = TextSource<16, 16>;
  using TextBuffer = FrameBuffer<16, 16>;

  Text hello("Hello");
  TEST_ASSERT_EQ(5u, hello.frameCount());
  TEST_ASSERT_EQ(5, Text::ORIGIN_X);
  TEST_ASSERT_EQ(4, Text::ORIGIN_Y);

  // 'H': both outer columns full height, bar across row 3
  TextBuffer fb;
  TEST_ASSERT(hello.frameAt(0, fb) == HalResult::OK);
  for(int row = 0; row < GLYPH_HEIGHT; row++){
    TEST_ASSERT(fb.getPixel(5, 4 + row) == RGB::White());
    TEST_ASSERT(fb.getPixel(9, 4 + row) == RGB::White());
  }
  TEST_ASSERT(fb.getPixel(7, 7) == RGB::White());
  TEST_ASSERT(fb.getPixel(7, 4) == RGB::Black());
  TEST_ASSERT(fb.getPixel(0, 0) == RGB::Black());
  TEST_ASSERT(hello.frameAt(5, fb) == HalResult::INVALID_PARAM);

  // Unprintable characters fall back to '?'
  Text odd("\n", RGB::Red());
  TextBuffer q;
  TEST_ASSERT(odd.frameAt(0, q) == HalResult::OK);
  TEST_ASSERT(q.getPixel(6, 4) == RGB::Red());
  TEST_ASSERT(glyphPixel('\n', 1, 0) == glyphPixel('?', 1, 0));

  TEST_ASSERT_EQ(0u, Text("").frameCount());
}

REGISTER_TEST(animation_plays_text_one_char_per_step, "Animation"){
  using TextAnim = Animation<16, 16>;
  std::unique_ptr<TextAnim> anim;
  TEST_ASSERT(TextAnim::create(std::unique_ptr<IFrameSource<16, 16>>(new TextSource<16, 16>("Hello")),
                               AnimationEffect::NONE, 500, 0, anim) == HalResult::OK);
  FrameBuffer<16, 16> out;
  TEST_ASSERT(anim->next(150, out) == AnimationStatus::APPLY);
  // 'e' column 0 covers rows 3..5 only
  TEST_ASSERT(out.getPixel(5, 7) == RGB::White());
  TEST_ASSERT(out.getPixel(5, 4) == RGB::Black());
}
