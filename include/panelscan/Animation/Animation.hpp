/*****************************************************************
 * File:      Animation.hpp
 * Category:  include/panelscan/Animation
 *
 * Purpose:
 *    Time-driven frame sequencer. next(now) is a pure function
 *    of the polled time: it says whether a new frame should be
 *    applied, whether to wait, or that the animation is over.
 *
 * Notes:
 *    No timers or tasks are created. The caller polls and
 *    sleeps. Restart by calling restart() or by creating a new
 *    animation with a new start time.
 *
 *    Step layout for N source frames:
 *      NONE                  N steps, one per frame
 *      SLIDE / WIPE          max(N-1,1) segments x WIDTH sub-steps
 *      FADE                  max(N-1,1) segments x FADE_STEPS sub-steps
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_ANIMATION_ANIMATION_HPP_
#define PANELSCAN_INCLUDE_ANIMATION_ANIMATION_HPP_

#include "panelscan/Animation/AnimationEffect.hpp"
#include "panelscan/Animation/FrameSource.hpp"
#include "panelscan/HAL/IHalLog.hpp"

#include <memory>
#include <utility>

namespace panelscan{

/** Result of one poll */
enum class AnimationStatus : uint8_t{
  APPLY = 0,  // `out` holds a new frame to draw and swap in
  WAIT,       // Nothing new yet, poll again later
  DONE        // Animation finished (terminal)
};

inline const char* animationStatusToString(AnimationStatus status){
  switch(status){
    case AnimationStatus::APPLY: return "Apply";
    case AnimationStatus::WAIT:  return "Wait";
    case AnimationStatus::DONE:  return "Done";
    default:                     return "Unknown";
  }
}

template<int WIDTH, int HEIGHT>
class Animation{
public:
  using Buffer = FrameBuffer<WIDTH, HEIGHT>;
  using Source = IFrameSource<WIDTH, HEIGHT>;

  /** Create an animation spanning duration_ms in total
   * @param out Receives the animation on success
   * @return HalResult::INVALID_PARAM for a missing or empty frame
   *         source or a zero duration
   */
  static hal::HalResult create(std::unique_ptr<Source> source,
                               AnimationEffect effect,
                               hal::timestamp_ms_t duration_ms,
                               hal::timestamp_ms_t start_ms,
                               std::unique_ptr<Animation>& out,
                               hal::IHalLog* log = nullptr){
    if(!source || source->frameCount() == 0){
      PANELSCAN_LOG_E(log, TAG, "Animation needs at least one frame");
      return hal::HalResult::INVALID_PARAM;
    }
    if(duration_ms == 0){
      PANELSCAN_LOG_E(log, TAG, "Animation duration must be positive");
      return hal::HalResult::INVALID_PARAM;
    }
    out.reset(new Animation(std::move(source), effect, duration_ms, start_ms, log));
    return hal::HalResult::OK;
  }

  /** Create an animation where each frame (NONE) or each
   *  transition (SLIDE/FADE/WIPE) lasts step_ms
   */
  static hal::HalResult createPerStep(std::unique_ptr<Source> source,
                                      AnimationEffect effect,
                                      hal::timestamp_ms_t step_ms,
                                      hal::timestamp_ms_t start_ms,
                                      std::unique_ptr<Animation>& out,
                                      hal::IHalLog* log = nullptr){
    const size_t count = source ? source->frameCount() : 0;
    const uint64_t total = static_cast<uint64_t>(step_ms) * segmentsFor(effect, count);
    if(total > UINT32_MAX){
      PANELSCAN_LOG_E(log, TAG, "Animation duration overflows");
      return hal::HalResult::INVALID_PARAM;
    }
    return create(std::move(source), effect, static_cast<hal::timestamp_ms_t>(total), start_ms, out, log);
  }

  Animation(const Animation&) = delete;
  Animation& operator=(const Animation&) = delete;

  /** Poll at time now
   * @param out Filled with the frame to show when APPLY is returned
   */
  AnimationStatus next(hal::timestamp_ms_t now, Buffer& out){
    if(finished_) return AnimationStatus::DONE;

    const int32_t elapsed = static_cast<int32_t>(now - start_);
    if(elapsed < 0) return AnimationStatus::WAIT;
    if(static_cast<uint32_t>(elapsed) >= duration_){
      finished_ = true;
      return AnimationStatus::DONE;
    }

    const uint32_t step = static_cast<uint32_t>(
      static_cast<uint64_t>(elapsed) * totalSteps_ / duration_);
    if(static_cast<int64_t>(step) == lastStep_) return AnimationStatus::WAIT;

    const hal::HalResult result = render(step, out);
    if(result != hal::HalResult::OK){
      PANELSCAN_LOG_RESULT(log_, result, TAG, "frame fetch");
      finished_ = true;
      return AnimationStatus::DONE;
    }
    lastStep_ = step;
    return AnimationStatus::APPLY;
  }

  /** True once DONE was returned, or now is past the end */
  bool isDone(hal::timestamp_ms_t now) const{
    if(finished_) return true;
    const int32_t elapsed = static_cast<int32_t>(now - start_);
    return elapsed >= 0 && static_cast<uint32_t>(elapsed) >= duration_;
  }

  /** Replay from start_ms */
  void restart(hal::timestamp_ms_t start_ms){
    start_ = start_ms;
    lastStep_ = -1;
    finished_ = false;
  }

  AnimationEffect effect() const{ return effect_; }
  hal::timestamp_ms_t duration() const{ return duration_; }
  hal::timestamp_ms_t startTime() const{ return start_; }
  size_t frameCount() const{ return source_->frameCount(); }
  uint32_t totalSteps() const{ return totalSteps_; }

private:
  static constexpr const char* TAG = "Animation";

  static uint32_t segmentsFor(AnimationEffect effect, size_t frames){
    if(effect == AnimationEffect::NONE) return static_cast<uint32_t>(frames);
    return frames > 1 ? static_cast<uint32_t>(frames - 1) : 1u;
  }

  Animation(std::unique_ptr<Source> source, AnimationEffect effect,
            hal::timestamp_ms_t duration_ms, hal::timestamp_ms_t start_ms,
            hal::IHalLog* log)
    : source_(std::move(source))
    , effect_(effect)
    , duration_(duration_ms)
    , start_(start_ms)
    , subSteps_(effectSubSteps<WIDTH>(effect))
    , log_(log)
  {
    totalSteps_ = segmentsFor(effect_, source_->frameCount()) * subSteps_;
  }

  hal::HalResult render(uint32_t step, Buffer& out){
    const size_t count = source_->frameCount();
    const size_t segment = step / subSteps_;
    const uint32_t sub = step % subSteps_;

    hal::HalResult result = source_->frameAt(segment, current_);
    if(result != hal::HalResult::OK) return result;

    if(effect_ == AnimationEffect::NONE){
      out.copyFrom(current_);
      return hal::HalResult::OK;
    }

    const size_t next_index = segment + 1 < count ? segment + 1 : count - 1;
    result = source_->frameAt(next_index, next_);
    if(result != hal::HalResult::OK) return result;

    applyEffect(effect_, current_, next_, sub, subSteps_, out);
    return hal::HalResult::OK;
  }

  std::unique_ptr<Source> source_;
  AnimationEffect effect_;
  hal::timestamp_ms_t duration_;
  hal::timestamp_ms_t start_;
  uint32_t subSteps_;
  uint32_t totalSteps_ = 0;
  int64_t lastStep_ = -1;
  bool finished_ = false;
  hal::IHalLog* log_;

  // Scratch frames for the effect inputs
  Buffer current_;
  Buffer next_;
};

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_ANIMATION_ANIMATION_HPP_
