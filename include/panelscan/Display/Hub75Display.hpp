/*****************************************************************
 * File:      Hub75Display.hpp
 * Category:  include/panelscan/Display
 *
 * Purpose:
 *    Public HUB75 display. Draw calls land in the back buffer,
 *    swapBuffers() publishes them, refresh() scans the front
 *    buffer out through the BCM engine.
 *
 * Features:
 *    - Compile-time WIDTH, HEIGHT, COLOR_BITS
 *    - Single or double buffering, switchable at runtime
 *    - Global brightness and BCM base unit
 *    - Animation playback into the back buffer
 *    - Pixel sink for external rasterizers
 *
 * Usage:
 *    std::unique_ptr<Hub75_64x32<>> display;
 *    if(Hub75_64x32<>::create(cfg, gpio, timer, display) != HalResult::OK) ...
 *    display->setPixel(3, 4, RGB::Red());
 *    display->swapBuffers();
 *    display->runRefreshLoop(&stop);
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_DISPLAY_HUB75_DISPLAY_HPP_
#define PANELSCAN_INCLUDE_DISPLAY_HUB75_DISPLAY_HPP_

#include "panelscan/Animation/Animation.hpp"
#include "panelscan/Core/PanelConfig.hpp"
#include "panelscan/Display/BufferPair.hpp"
#include "panelscan/Display/PixelSink.hpp"
#include "panelscan/Scan/ScanEngine.hpp"

#include <memory>

namespace panelscan{

template<int WIDTH, int HEIGHT, int COLOR_BITS = 6>
class Hub75Display : public IPixelSink{
public:
  using Engine = ScanEngine<WIDTH, HEIGHT, COLOR_BITS>;
  using Buffer = FrameBuffer<WIDTH, HEIGHT>;
  using AnimationType = Animation<WIDTH, HEIGHT>;

  /** Validate the configuration, set up the pins and build the display
   * @param out Receives the display on success, untouched otherwise
   * @return HalResult::INVALID_CONFIG on a pin/geometry mismatch,
   *         or the GPIO error that stopped pin setup
   */
  static hal::HalResult create(const DisplayConfig& config,
                               hal::IHalGpio& gpio,
                               hal::IHalSystemTimer& timer,
                               std::unique_ptr<Hub75Display>& out,
                               hal::IHalLog* log = nullptr){
    std::unique_ptr<Engine> engine;
    hal::HalResult result = Engine::create(config.pins, gpio, timer, engine, config.gamma, log);
    if(result != hal::HalResult::OK){
      PANELSCAN_LOG_RESULT(log, result, TAG, "create");
      return result;
    }

    engine->brightness().setBrightness(config.brightness);
    engine->brightness().setRefreshIntervalNs(config.refreshIntervalNs);

    result = engine->init();
    if(result != hal::HalResult::OK){
      return result;
    }

    out.reset(new Hub75Display(std::move(engine), config.doubleBuffered, timer, log));
    return hal::HalResult::OK;
  }

  Hub75Display(const Hub75Display&) = delete;
  Hub75Display& operator=(const Hub75Display&) = delete;

  // ========== Drawing (back buffer) ==========

  void setPixel(int x, int y, const RGB& color){
    buffers_.back().setPixel(x, y, color);
  }

  /** Reads the back buffer, i.e. what the next swap will show */
  RGB getPixel(int x, int y) const{
    return buffers_.back().getPixel(x, y);
  }

  void fill(const RGB& color){
    buffers_.back().fill(color);
  }

  void clear(){
    buffers_.back().clear();
  }

  Buffer& backBuffer(){ return buffers_.back(); }
  const Buffer& frontBuffer() const{ return buffers_.front(); }

  // IPixelSink
  void drawPixel(int x, int y, const RGB& color) override{
    setPixel(x, y, color);
  }

  Rect bounds() const override{
    return Rect{0, 0, WIDTH, HEIGHT};
  }

  // ========== Buffering ==========

  /** Publish the back buffer
   *
   * The back buffer handed out afterwards holds an older frame,
   * so the next frame should be drawn in full.
   * @return true if visible from the next pass, false if deferred
   *         behind a running pass or single-buffered
   */
  bool swapBuffers(){
    return buffers_.swap();
  }

  void setDoubleBuffering(bool enabled){
    buffers_.setDoubleBuffered(enabled);
    PANELSCAN_LOG_D(log_, TAG, "Double buffering %s", enabled ? "on" : "off");
  }

  bool isDoubleBuffered() const{ return buffers_.isDoubleBuffered(); }

  // ========== Refresh ==========

  /** One full BCM pass over the front buffer */
  hal::HalResult refresh(const CancelToken* cancel = nullptr){
    const Buffer& front = buffers_.beginScan();
    const hal::HalResult result = engine_->refresh(front, cancel);
    buffers_.endScan();
    return result;
  }

  /** Refresh repeatedly for at least duration_ms */
  hal::HalResult refreshFor(uint32_t duration_ms, const CancelToken* cancel = nullptr){
    const hal::timestamp_ms_t start = timer_.millis();
    do{
      hal::HalResult result = refresh(cancel);
      if(result != hal::HalResult::OK) return result;
    }while(timer_.millis() - start < duration_ms);
    return hal::HalResult::OK;
  }

  /** Refresh until cancel is set
   * @return HalResult::CANCELLED on a normal stop, otherwise the
   *         error that ended the loop
   */
  hal::HalResult runRefreshLoop(const CancelToken* cancel){
    if(cancel == nullptr) return hal::HalResult::INVALID_PARAM;
    PANELSCAN_LOG_I(log_, TAG, "Refresh loop started");
    hal::HalResult result;
    do{
      result = refresh(cancel);
    }while(result == hal::HalResult::OK);
    PANELSCAN_LOG_I(log_, TAG, "Refresh loop stopped: %s", hal::halResultToString(result));
    return result;
  }

  /** Copy frame into the back buffer, swap, and keep it on
   *  screen for duration_ms
   */
  hal::HalResult displayFrame(const Buffer& frame, uint32_t duration_ms, const CancelToken* cancel = nullptr){
    buffers_.back().copyFrom(frame);
    buffers_.swap();
    return refreshFor(duration_ms, cancel);
  }

  /** Poll an animation; on APPLY the new frame is drawn into the
   *  back buffer and swapped in
   */
  AnimationStatus applyAnimation(AnimationType& animation, hal::timestamp_ms_t now){
    const AnimationStatus status = animation.next(now, buffers_.back());
    if(status == AnimationStatus::APPLY){
      buffers_.swap();
    }
    return status;
  }

  /** Play an animation to completion, refreshing between polls */
  hal::HalResult playAnimation(AnimationType& animation, const CancelToken* cancel = nullptr){
    for(;;){
      if(applyAnimation(animation, timer_.millis()) == AnimationStatus::DONE){
        return hal::HalResult::OK;
      }
      hal::HalResult result = refresh(cancel);
      if(result != hal::HalResult::OK) return result;
    }
  }

  // ========== Brightness / timing ==========

  void setBrightness(uint8_t level){ engine_->brightness().setBrightness(level); }
  uint8_t brightness() const{ return engine_->brightness().brightness(); }
  uint8_t increaseBrightness(int delta){ return engine_->brightness().increase(delta); }
  uint8_t decreaseBrightness(int delta){ return engine_->brightness().decrease(delta); }

  void setRefreshIntervalNs(hal::duration_ns_t ns){ engine_->brightness().setRefreshIntervalNs(ns); }
  hal::duration_ns_t refreshIntervalNs() const{ return engine_->brightness().refreshIntervalNs(); }

  // ========== Info ==========

  static constexpr int width(){ return WIDTH; }
  static constexpr int height(){ return HEIGHT; }
  static constexpr int colorBits(){ return COLOR_BITS; }
  static constexpr int addressableRows(){ return Engine::ROWS; }

  const RefreshStats& stats() const{ return engine_->stats(); }
  void resetStats(){ engine_->resetStats(); }
  uint64_t estimatePassNs() const{ return engine_->estimatePassNs(); }
  GammaMode gammaMode() const{ return engine_->gamma().mode(); }

private:
  static constexpr const char* TAG = "Hub75Display";

  Hub75Display(std::unique_ptr<Engine> engine, bool double_buffered,
               hal::IHalSystemTimer& timer, hal::IHalLog* log)
    : engine_(std::move(engine))
    , buffers_(double_buffered)
    , timer_(timer)
    , log_(log)
  {}

  std::unique_ptr<Engine> engine_;
  BufferPair<WIDTH, HEIGHT> buffers_;
  hal::IHalSystemTimer& timer_;
  hal::IHalLog* log_;
};

// Common panel sizes
template<int COLOR_BITS = 6> using Hub75_32x16 = Hub75Display<32, 16, COLOR_BITS>;
template<int COLOR_BITS = 6> using Hub75_64x32 = Hub75Display<64, 32, COLOR_BITS>;
template<int COLOR_BITS = 6> using Hub75_64x64 = Hub75Display<64, 64, COLOR_BITS>;
template<int COLOR_BITS = 6> using Hub75_128x64 = Hub75Display<128, 64, COLOR_BITS>;

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_DISPLAY_HUB75_DISPLAY_HPP_
