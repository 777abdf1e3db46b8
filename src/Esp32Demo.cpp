/*****************************************************************
 * File:      Esp32Demo.cpp
 * Category:  Main Application (ESP-IDF)
 *
 * Purpose:
 *    Bit-banged HUB75 demo for a 64x32 panel on an ESP32.
 *    One task owns the refresh loop, the main task plays a
 *    frame animation and a second drawer task pulses the
 *    brightness. Drawers share the display through
 *    LockedDisplay.
 *
 * Hardware:
 *    R1=25 G1=26 B1=27 R2=14 G2=12 B2=13
 *    A=23 B=19 C=5 D=17 LAT=4 OE=15 CLK=16
 *
 * Usage:
 *    Build as an ESP-IDF component with PANELSCAN_ESP32_DEMO=ON
 *****************************************************************/

#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "panelscan/PanelScan.hpp"

#include "HAL/ESP32/Esp32HalGpio.hpp"
#include "HAL/ESP32/Esp32HalLog.hpp"
#include "HAL/ESP32/Esp32HalMutex.hpp"
#include "HAL/ESP32/Esp32HalTimer.hpp"

#include <memory>

using namespace panelscan;
using namespace panelscan::hal;
using namespace panelscan::hal::esp32;

// ============================================================
// Configuration
// ============================================================

static constexpr const char* TAG = "PanelScanDemo";

using Display = Hub75_64x32<6>;
using Shared = LockedDisplay<Display>;

constexpr int FRAME_COUNT = 8;
constexpr timestamp_ms_t FRAME_STEP_MS = 400;
constexpr uint32_t LOCK_TIMEOUT_MS = 50;

// ============================================================
// Global State
// ============================================================

static Esp32HalLog s_log;
static Esp32HalGpio s_gpio(&s_log);
static Esp32HalSystemTimer s_timer;
static Esp32HalMutex s_mutex;

static std::unique_ptr<Display> s_display;
static std::unique_ptr<Shared> s_shared;
static CancelToken s_stop;

// ============================================================
// Frames
// ============================================================

/** HSV to RGB conversion */
static RGB hsvToRgb(uint8_t h, uint8_t s, uint8_t v){
  if(s == 0){
    return RGB(v, v, v);
  }

  uint8_t region = h / 43;
  uint8_t remainder = (h - region * 43) * 6;

  uint8_t p = (v * (255 - s)) >> 8;
  uint8_t q = (v * (255 - ((s * remainder) >> 8))) >> 8;
  uint8_t t = (v * (255 - ((s * (255 - remainder)) >> 8))) >> 8;

  switch(region){
    case 0:  return RGB(v, t, p);
    case 1:  return RGB(q, v, p);
    case 2:  return RGB(p, v, t);
    case 3:  return RGB(p, q, v);
    case 4:  return RGB(t, p, v);
    default: return RGB(v, p, q);
  }
}

/** Diagonal rainbow, shifted per frame */
static void rainbowFrame(size_t index, Display::Buffer& out){
  for(int y = 0; y < Display::height(); y++){
    for(int x = 0; x < Display::width(); x++){
      const uint8_t hue = static_cast<uint8_t>((x + y) * 4 + index * (256 / FRAME_COUNT));
      out.setPixel(x, y, hsvToRgb(hue, 255, 255));
    }
  }
}

// ============================================================
// Tasks
// ============================================================

static void refreshTask(void*){
  const HalResult result = s_display->runRefreshLoop(&s_stop);
  if(result != HalResult::CANCELLED){
    s_log.logResult(result, TAG, "refresh loop");
  }
  vTaskDelete(nullptr);
}

static void brightnessTask(void*){
  int delta = 8;
  while(!s_stop.isCancelled()){
    {
      auto guard = s_shared->tryLock(LOCK_TIMEOUT_MS);
      if(guard){
        const uint8_t level = delta > 0 ? guard->increaseBrightness(delta)
                                        : guard->decreaseBrightness(-delta);
        if(level == Brightness::MAX || level <= 32) delta = -delta;
      }
    }
    vTaskDelay(pdMS_TO_TICKS(50));
  }
  vTaskDelete(nullptr);
}

// ============================================================
// Main Application
// ============================================================

extern "C" void app_main(void){
  s_log.init(LogLevel::INFO);
  g_hal_log = &s_log;

  HalResult result = s_mutex.init();
  if(result != HalResult::OK){
    s_log.logResult(result, TAG, "mutex init");
    return;
  }

  const PinBundle pins = PinBundle::Panel64x32(25, 26, 27, 14, 12, 13,
                                               23, 19, 5, 17,
                                               16, 4, 15);
  result = Display::create(DisplayConfig::Default(pins), s_gpio, s_timer, s_display, &s_log);
  if(result != HalResult::OK){
    s_log.logResult(result, TAG, "display create");
    return;
  }
  s_shared.reset(new Shared(*s_display, s_mutex));

  PANELSCAN_LOG_I(&s_log, TAG, "64x32 panel, %d bitplanes, pass ~%lu us",
                  Display::colorBits(),
                  static_cast<unsigned long>(s_display->estimatePassNs() / 1000));

  // Refresh on the second core, drawing stays on this one
  xTaskCreatePinnedToCore(refreshTask, "Hub75Refresh", 4096, nullptr, 5, nullptr, 1);
  xTaskCreatePinnedToCore(brightnessTask, "Brightness", 2048, nullptr, 3, nullptr, 0);

  std::unique_ptr<Animation<64, 32>> animation;
  result = Animation<64, 32>::createPerStep(
    std::unique_ptr<IFrameSource<64, 32>>(new GeneratorSource<64, 32>(FRAME_COUNT, rainbowFrame)),
    AnimationEffect::FADE, FRAME_STEP_MS, s_timer.millis(), animation, &s_log);
  if(result != HalResult::OK){
    s_log.logResult(result, TAG, "animation create");
    s_stop.cancel();
    return;
  }

  while(true){
    {
      auto guard = s_shared->tryLock(LOCK_TIMEOUT_MS);
      if(guard && guard->applyAnimation(*animation, s_timer.millis()) == AnimationStatus::DONE){
        animation->restart(s_timer.millis());
        PANELSCAN_LOG_D(&s_log, TAG, "Animation restarted, brightness %d", guard->brightness());
      }
    }
    vTaskDelay(pdMS_TO_TICKS(10));
  }
}
