/*****************************************************************
 * File:      ScanEngine.hpp
 * Category:  include/panelscan/Scan
 *
 * Purpose:
 *    Binary Code Modulation scan-out for HUB75 panels.
 *    Turns one frame buffer into the GPIO sequence of a full
 *    refresh: COLOR_BITS bitplanes, HEIGHT/2 rows each, with
 *    the OE hold doubling from one bitplane to the next.
 *
 * Notes:
 *    Per row: blank, address, shift WIDTH columns, latch, hold.
 *    The hold is the only suspension point. OE is high again
 *    on every exit path (OutputBlankGuard).
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_SCAN_SCAN_ENGINE_HPP_
#define PANELSCAN_INCLUDE_SCAN_SCAN_ENGINE_HPP_

#include "panelscan/Core/Gamma.hpp"
#include "panelscan/Core/Geometry.hpp"
#include "panelscan/Display/FrameBuffer.hpp"
#include "panelscan/HAL/IHalGpio.hpp"
#include "panelscan/HAL/IHalLog.hpp"
#include "panelscan/HAL/IHalTimer.hpp"
#include "panelscan/Scan/Brightness.hpp"
#include "panelscan/Scan/CancelToken.hpp"
#include "panelscan/Scan/OutputBlankGuard.hpp"
#include "panelscan/Scan/PinBundle.hpp"

#include <memory>

namespace panelscan{

/** Refresh diagnostics, owned by the refreshing task */
struct RefreshStats{
  uint32_t passes = 0;           // Completed passes
  uint32_t cancelledPasses = 0;  // Passes stopped by a cancel request
  uint32_t failedPasses = 0;     // Passes stopped by a GPIO/timer error
  hal::timestamp_us_t lastPassUs = 0;
  uint64_t totalOnTimeNs = 0;    // Sum of all OE-low holds
};

template<int WIDTH, int HEIGHT, int COLOR_BITS>
class ScanEngine{
public:
  using Geometry = PanelGeometry<WIDTH, HEIGHT, COLOR_BITS>;
  using Buffer = FrameBuffer<WIDTH, HEIGHT>;

  static constexpr int ROWS = Geometry::rows;
  static constexpr int ADDRESS_BITS = Geometry::addressBits;

  /** Build an engine after checking the pins against the geometry
   * @param out Receives the engine on success, untouched otherwise
   * @return HalResult::INVALID_CONFIG if a mandatory pin is missing,
   *         a pin is duplicated, or fewer than ADDRESS_BITS address
   *         lines are wired
   */
  static hal::HalResult create(const PinBundle& pins,
                               hal::IHalGpio& gpio,
                               hal::IHalSystemTimer& timer,
                               std::unique_ptr<ScanEngine>& out,
                               GammaMode gamma = GammaMode::GAMMA_2_2,
                               hal::IHalLog* log = nullptr){
    hal::HalResult result = pins.validate();
    if(result != hal::HalResult::OK){
      return result;
    }
    if(pins.addressPinCount() < ADDRESS_BITS){
      PANELSCAN_LOG_E(log, TAG, "%dx%d needs %d address lines, %d wired",
                      WIDTH, HEIGHT, ADDRESS_BITS, pins.addressPinCount());
      return hal::HalResult::INVALID_CONFIG;
    }
    out.reset(new ScanEngine(pins, gpio, timer, gamma, log));
    return hal::HalResult::OK;
  }

  ScanEngine(const ScanEngine&) = delete;
  ScanEngine& operator=(const ScanEngine&) = delete;

  /** Configure pins and drive them to idle (OE high) */
  hal::HalResult init(){
    hal::HalResult result = gpio_.init();
    if(result != hal::HalResult::OK && result != hal::HalResult::ALREADY_INITIALIZED){
      PANELSCAN_LOG_RESULT(log_, result, TAG, "gpio init");
      return result;
    }
    result = pins_.init(gpio_);
    if(result != hal::HalResult::OK){
      PANELSCAN_LOG_RESULT(log_, result, TAG, "pin setup");
      return result;
    }
    initialized_ = true;
    PANELSCAN_LOG_I(log_, TAG, "%dx%d, %d bitplanes, %d rows, gamma %s",
                    WIDTH, HEIGHT, COLOR_BITS, ROWS, gammaModeToString(gamma_.mode()));
    return hal::HalResult::OK;
  }

  bool isInitialized() const{ return initialized_; }

  /** Run one full refresh pass over frame
   * @param cancel Optional stop request, checked at each hold
   * @return HalResult::OK, HalResult::CANCELLED, or the first
   *         GPIO/timer failure. OE is high on return.
   */
  hal::HalResult refresh(const Buffer& frame, const CancelToken* cancel = nullptr){
    if(!initialized_) return hal::HalResult::NOT_INITIALIZED;

    const hal::timestamp_us_t start = timer_.micros();
    hal::HalResult result;
    {
      OutputBlankGuard blank(gpio_, pins_.oe);
      result = scanPlanes(frame, cancel);
    }
    stats_.lastPassUs = timer_.micros() - start;

    if(result == hal::HalResult::OK){
      stats_.passes++;
    }else if(result == hal::HalResult::CANCELLED){
      stats_.cancelledPasses++;
      PANELSCAN_LOG_D(log_, TAG, "Refresh cancelled");
    }else{
      stats_.failedPasses++;
      PANELSCAN_LOG_RESULT(log_, result, TAG, "refresh");
    }
    return result;
  }

  /** Total OE-low time of one pass at the current brightness
   *  (excludes shift and latch overhead)
   */
  uint64_t estimatePassNs() const{
    uint64_t total = 0;
    for(int plane = 0; plane < COLOR_BITS; plane++){
      total += static_cast<uint64_t>(brightness_.holdNs(plane)) * ROWS;
    }
    return total;
  }

  BrightnessController& brightness(){ return brightness_; }
  const BrightnessController& brightness() const{ return brightness_; }

  const GammaTable<COLOR_BITS>& gamma() const{ return gamma_; }
  const PinBundle& pins() const{ return pins_; }

  const RefreshStats& stats() const{ return stats_; }
  void resetStats(){ stats_ = RefreshStats(); }

private:
  static constexpr const char* TAG = "ScanEngine";

  ScanEngine(const PinBundle& pins, hal::IHalGpio& gpio, hal::IHalSystemTimer& timer,
             GammaMode gamma, hal::IHalLog* log)
    : pins_(pins)
    , gpio_(gpio)
    , timer_(timer)
    , gamma_(gamma)
    , log_(log)
  {}

  hal::HalResult scanPlanes(const Buffer& frame, const CancelToken* cancel){
    hal::HalResult result;
    for(int plane = 0; plane < COLOR_BITS; plane++){
      // Brightness is sampled once per plane
      const hal::duration_ns_t hold = brightness_.holdNs(plane);

      for(int row = 0; row < ROWS; row++){
        result = gpio_.setHigh(pins_.oe);
        if(result != hal::HalResult::OK) return result;

        result = selectRow(row);
        if(result != hal::HalResult::OK) return result;

        result = shiftRow(frame, row, plane);
        if(result != hal::HalResult::OK) return result;

        result = latch();
        if(result != hal::HalResult::OK) return result;

        if(isCancelled(cancel)) return hal::HalResult::CANCELLED;

        result = hold > 0 ? holdRow(hold) : yieldRow();
        if(result != hal::HalResult::OK) return result;

        if(isCancelled(cancel)) return hal::HalResult::CANCELLED;
      }
    }
    return hal::HalResult::OK;
  }

  hal::HalResult selectRow(int row){
    for(int bit = 0; bit < ADDRESS_BITS; bit++){
      hal::HalResult result = gpio_.setLevel(pins_.address(bit), (row >> bit) & 1);
      if(result != hal::HalResult::OK) return result;
    }
    return hal::HalResult::OK;
  }

  hal::HalResult shiftRow(const Buffer& frame, int row, int plane){
    for(int x = 0; x < WIDTH; x++){
      const RGB& top = frame.at(x, row);
      const RGB& bottom = frame.at(x, row + ROWS);

      const bool levels[6] = {
        gamma_.planeBit(top.r, plane),    gamma_.planeBit(top.g, plane),    gamma_.planeBit(top.b, plane),
        gamma_.planeBit(bottom.r, plane), gamma_.planeBit(bottom.g, plane), gamma_.planeBit(bottom.b, plane)
      };
      const hal::gpio_pin_t pins[6] = {pins_.r1, pins_.g1, pins_.b1, pins_.r2, pins_.g2, pins_.b2};

      for(int i = 0; i < 6; i++){
        hal::HalResult result = gpio_.setLevel(pins[i], levels[i]);
        if(result != hal::HalResult::OK) return result;
      }

      // Shift registers sample on the rising edge
      hal::HalResult result = gpio_.setHigh(pins_.clk);
      if(result != hal::HalResult::OK) return result;
      result = gpio_.setLow(pins_.clk);
      if(result != hal::HalResult::OK) return result;
    }
    return hal::HalResult::OK;
  }

  hal::HalResult latch(){
    hal::HalResult result = gpio_.setHigh(pins_.lat);
    if(result != hal::HalResult::OK) return result;
    return gpio_.setLow(pins_.lat);
  }

  hal::HalResult holdRow(hal::duration_ns_t hold){
    hal::HalResult result = gpio_.setLow(pins_.oe);
    if(result != hal::HalResult::OK) return result;

    const hal::HalResult slept = timer_.sleepNs(hold);
    result = gpio_.setHigh(pins_.oe);

    if(slept == hal::HalResult::CANCELLED || slept == hal::HalResult::TIMEOUT){
      return hal::HalResult::CANCELLED;
    }
    if(slept != hal::HalResult::OK) return slept;

    stats_.totalOnTimeNs += hold;
    return result;
  }

  // Zero brightness: keep the panel dark but still give up the CPU
  hal::HalResult yieldRow(){
    timer_.yield();
    return hal::HalResult::OK;
  }

  PinBundle pins_;
  hal::IHalGpio& gpio_;
  hal::IHalSystemTimer& timer_;
  GammaTable<COLOR_BITS> gamma_;
  BrightnessController brightness_;
  hal::IHalLog* log_;
  RefreshStats stats_;
  bool initialized_ = false;
};

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_SCAN_SCAN_ENGINE_HPP_
