/*****************************************************************
 * File:      AnimationEffect.hpp
 * Category:  include/panelscan/Animation
 *
 * Purpose:
 *    Frame transition effects. Each effect is a pure function
 *    of two adjacent source frames and a fraction
 *    f = subStep / subSteps in [0, 1).
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_ANIMATION_ANIMATION_EFFECT_HPP_
#define PANELSCAN_INCLUDE_ANIMATION_ANIMATION_EFFECT_HPP_

#include "panelscan/Display/FrameBuffer.hpp"

namespace panelscan{

enum class AnimationEffect : uint8_t{
  NONE = 0,   // Show each source frame as is
  SLIDE,      // Next frame pushes in from the right
  FADE,       // Per-channel cross fade
  WIPE        // Next frame revealed left to right
};

inline const char* animationEffectToString(AnimationEffect effect){
  switch(effect){
    case AnimationEffect::NONE:  return "None";
    case AnimationEffect::SLIDE: return "Slide";
    case AnimationEffect::FADE:  return "Fade";
    case AnimationEffect::WIPE:  return "Wipe";
    default:                     return "Unknown";
  }
}

/** Sub-steps per transition segment */
constexpr uint32_t FADE_STEPS = 16;

template<int WIDTH>
constexpr uint32_t effectSubSteps(AnimationEffect effect){
  return effect == AnimationEffect::NONE ? 1u
       : effect == AnimationEffect::FADE ? FADE_STEPS
       : static_cast<uint32_t>(WIDTH);
}

/** Compose `out` from current/next at fraction sub/subs
 *  (out must not alias either input)
 */
template<int WIDTH, int HEIGHT>
void applyEffect(AnimationEffect effect,
                 const FrameBuffer<WIDTH, HEIGHT>& current,
                 const FrameBuffer<WIDTH, HEIGHT>& next,
                 uint32_t sub, uint32_t subs,
                 FrameBuffer<WIDTH, HEIGHT>& out){
  switch(effect){
    case AnimationEffect::SLIDE:{
      const int offset = static_cast<int>(static_cast<uint64_t>(sub) * WIDTH / subs);
      for(int y = 0; y < HEIGHT; y++){
        for(int x = 0; x < WIDTH; x++){
          const int src = x + offset;
          out.at(x, y) = src < WIDTH ? current.at(src, y) : next.at(src - WIDTH, y);
        }
      }
      break;
    }

    case AnimationEffect::FADE:{
      const float f = static_cast<float>(sub) / static_cast<float>(subs);
      const RGB* a = current.data();
      const RGB* b = next.data();
      RGB* o = out.data();
      for(int i = 0; i < FrameBuffer<WIDTH, HEIGHT>::PIXEL_COUNT; i++){
        o[i] = RGB::lerp(a[i], b[i], f);
      }
      break;
    }

    case AnimationEffect::WIPE:{
      // x / WIDTH < sub / subs
      for(int y = 0; y < HEIGHT; y++){
        for(int x = 0; x < WIDTH; x++){
          const bool revealed = static_cast<uint64_t>(x) * subs < static_cast<uint64_t>(sub) * WIDTH;
          out.at(x, y) = revealed ? next.at(x, y) : current.at(x, y);
        }
      }
      break;
    }

    case AnimationEffect::NONE:
    default:
      out.copyFrom(current);
      break;
  }
}

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_ANIMATION_ANIMATION_EFFECT_HPP_
