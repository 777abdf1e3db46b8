/*****************************************************************
 * File:      HostDemo.cpp
 * Category:  Main Application (Host)
 *
 * Purpose:
 *    Runs the driver against the in-memory host GPIO: a refresh
 *    thread scans while the main thread animates a wipe, then
 *    both are stopped and the refresh statistics are printed.
 *
 * Usage:
 *    panelscan_host_demo [run_ms]
 *****************************************************************/

#include "panelscan/PanelScan.hpp"

#include "HAL/Host/HostHalGpio.hpp"
#include "HAL/Host/HostHalLog.hpp"
#include "HAL/Host/HostHalMutex.hpp"
#include "HAL/Host/HostHalTimer.hpp"

#include <chrono>
#include <memory>
#include <stdio.h>
#include <stdlib.h>
#include <thread>

using namespace panelscan;
using namespace panelscan::hal;
using namespace panelscan::hal::host;

static constexpr const char* TAG = "HostDemo";

using Display = Hub75_32x16<4>;

int main(int argc, char** argv){
  const timestamp_ms_t run_ms = argc > 1 ? static_cast<timestamp_ms_t>(atoi(argv[1])) : 500;

  HostHalLog log;
  log.init(LogLevel::DEBUG);
  g_hal_log = &log;

  HostHalGpio gpio(&log);
  HostHalSystemTimer timer;
  HostHalMutex mutex;

  const PinBundle pins = PinBundle::Panel32x16(1, 2, 3, 4, 5, 6, 10, 11, 12, 20, 21, 22);
  std::unique_ptr<Display> display;
  HalResult result = Display::create(DisplayConfig::Fast(pins), gpio, timer, display, &log);
  if(result != HalResult::OK){
    log.logResult(result, TAG, "display create");
    return 1;
  }
  LockedDisplay<Display> shared(*display, mutex);

  std::unique_ptr<Animation<32, 16>> wipe;
  std::unique_ptr<IFrameSource<32, 16>> frames(new GeneratorSource<32, 16>(3, [](size_t index, Display::Buffer& out){
    const RGB colors[3] = {RGB::Red(), RGB::Green(), RGB::Blue()};
    out.fill(colors[index]);
  }));
  result = Animation<32, 16>::create(std::move(frames), AnimationEffect::WIPE, run_ms, timer.millis(), wipe, &log);
  if(result != HalResult::OK){
    log.logResult(result, TAG, "animation create");
    return 1;
  }

  CancelToken stop;
  HalResult loop_result = HalResult::OK;
  std::thread refresher([&]{
    loop_result = display->runRefreshLoop(&stop);
  });

  while(true){
    AnimationStatus status;
    {
      auto guard = shared.lock();
      status = guard->applyAnimation(*wipe, timer.millis());
    }
    if(status == AnimationStatus::DONE) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  stop.cancel();
  timer.cancel();
  refresher.join();

  const RefreshStats& stats = display->stats();
  printf("Refresh loop: %s\n", halResultToString(loop_result));
  printf("Passes: %lu (cancelled %lu, failed %lu)\n",
         static_cast<unsigned long>(stats.passes),
         static_cast<unsigned long>(stats.cancelledPasses),
         static_cast<unsigned long>(stats.failedPasses));
  printf("Last pass: %llu us, lit: %llu us, GPIO writes: %llu\n",
         static_cast<unsigned long long>(stats.lastPassUs),
         static_cast<unsigned long long>(stats.totalOnTimeNs / 1000),
         static_cast<unsigned long long>(gpio.writeCount()));

  g_hal_log = nullptr;
  return loop_result == HalResult::CANCELLED ? 0 : 1;
}
