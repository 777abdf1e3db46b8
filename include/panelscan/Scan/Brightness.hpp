/*****************************************************************
 * File:      Brightness.hpp
 * Category:  include/panelscan/Scan
 *
 * Purpose:
 *    Global brightness and base BCM time unit. The scan engine
 *    reads both once per bitplane, so a change made from another
 *    task lands at the next bitplane boundary.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_SCAN_BRIGHTNESS_HPP_
#define PANELSCAN_INCLUDE_SCAN_BRIGHTNESS_HPP_

#include "panelscan/HAL/HalTypes.hpp"

#include <atomic>

namespace panelscan{

using hal::duration_ns_t;

/** Brightness level 0..255 with saturating arithmetic */
class Brightness{
public:
  static constexpr uint8_t MIN = 0;
  static constexpr uint8_t MAX = 255;

  constexpr Brightness() : level_(MAX){}
  constexpr explicit Brightness(uint8_t level) : level_(level){}

  constexpr uint8_t level() const{ return level_; }

  constexpr Brightness operator+(int delta) const{
    return Brightness(clamp(static_cast<int>(level_) + delta));
  }

  constexpr Brightness operator-(int delta) const{
    return Brightness(clamp(static_cast<int>(level_) - delta));
  }

  Brightness& operator+=(int delta){ level_ = clamp(level_ + delta); return *this; }
  Brightness& operator-=(int delta){ level_ = clamp(level_ - delta); return *this; }

  constexpr bool operator==(const Brightness& o) const{ return level_ == o.level_; }
  constexpr bool operator!=(const Brightness& o) const{ return level_ != o.level_; }

  /** Scale a duration by level/255 */
  constexpr uint64_t scale(uint64_t ns) const{
    return ns * level_ / MAX;
  }

private:
  static constexpr uint8_t clamp(int v){
    return static_cast<uint8_t>(v < MIN ? MIN : (v > MAX ? MAX : v));
  }

  uint8_t level_;
};

/** Shared brightness/timing state read by the scan engine */
class BrightnessController{
public:
  static constexpr duration_ns_t DEFAULT_REFRESH_NS = 100000;

  explicit BrightnessController(uint8_t level = Brightness::MAX,
                                duration_ns_t refresh_ns = DEFAULT_REFRESH_NS)
    : level_(level)
    , refreshNs_(refresh_ns)
  {}

  void setBrightness(uint8_t level){
    level_.store(level, std::memory_order_relaxed);
  }

  uint8_t brightness() const{
    return level_.load(std::memory_order_relaxed);
  }

  /** Raise by delta, saturating at 255 */
  uint8_t increase(int delta){
    return update(delta);
  }

  /** Lower by delta, saturating at 0 */
  uint8_t decrease(int delta){
    return update(-delta);
  }

  /** Base unit: hold time of bitplane 0 at full brightness */
  void setRefreshIntervalNs(duration_ns_t ns){
    refreshNs_.store(ns, std::memory_order_relaxed);
  }

  duration_ns_t refreshIntervalNs() const{
    return refreshNs_.load(std::memory_order_relaxed);
  }

  /** OE-low time for one row of bitplane `plane`:
   *  base * 2^plane * brightness / 255
   */
  duration_ns_t holdNs(int plane) const{
    const uint64_t weighted = static_cast<uint64_t>(refreshIntervalNs()) << plane;
    const uint64_t ns = Brightness(brightness()).scale(weighted);
    return ns > UINT32_MAX ? UINT32_MAX : static_cast<duration_ns_t>(ns);
  }

private:
  uint8_t update(int delta){
    uint8_t cur = level_.load(std::memory_order_relaxed);
    uint8_t next;
    do{
      next = (Brightness(cur) + delta).level();
    }while(!level_.compare_exchange_weak(cur, next, std::memory_order_relaxed));
    return next;
  }

  std::atomic<uint8_t> level_;
  std::atomic<duration_ns_t> refreshNs_;
};

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_SCAN_BRIGHTNESS_HPP_
