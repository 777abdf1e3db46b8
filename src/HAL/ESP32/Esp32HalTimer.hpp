/*****************************************************************
 * File:      Esp32HalTimer.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    ESP32 implementation of the HAL timer interface using
 *    esp_timer and FreeRTOS.
 *
 * Notes:
 *    sleepNs() works against an esp_timer deadline. Holds of at
 *    least MIN_BLOCK_US arm a one-shot esp_timer and block the
 *    task on a notification, so other tasks run during sub-tick
 *    holds. The timer is armed WAKE_LATENCY_US early and the
 *    remainder up to the deadline is busy-waited, so a hold never
 *    ends early and the bitplane weights stay binary. Shorter
 *    holds are busy-waited whole.
 *    Only one task may sleep on an instance at a time.
 *****************************************************************/

#ifndef PANELSCAN_SRC_HAL_ESP32_HAL_TIMER_HPP_
#define PANELSCAN_SRC_HAL_ESP32_HAL_TIMER_HPP_

#include "panelscan/HAL/IHalTimer.hpp"

#include "esp_rom_sys.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include <atomic>

namespace panelscan::hal::esp32{

/** ESP32 System Timer Implementation */
class Esp32HalSystemTimer : public IHalSystemTimer{
public:
  /** Shortest hold that blocks instead of spinning */
  static constexpr uint32_t MIN_BLOCK_US = 50;

  /** Head start given to the wakeup for dispatch and context switch */
  static constexpr uint32_t WAKE_LATENCY_US = 20;

  Esp32HalSystemTimer() = default;

  ~Esp32HalSystemTimer() override{
    if(wakeTimer_){
      esp_timer_stop(wakeTimer_);
      esp_timer_delete(wakeTimer_);
    }
  }

  Esp32HalSystemTimer(const Esp32HalSystemTimer&) = delete;
  Esp32HalSystemTimer& operator=(const Esp32HalSystemTimer&) = delete;

  timestamp_ms_t millis() const override{
    return static_cast<timestamp_ms_t>(esp_timer_get_time() / 1000);
  }

  timestamp_us_t micros() const override{
    return static_cast<timestamp_us_t>(esp_timer_get_time());
  }

  HalResult sleepNs(duration_ns_t ns) override{
    const uint32_t us = (ns + 999) / 1000;
    const int64_t deadline = esp_timer_get_time() + us;

    if(us >= MIN_BLOCK_US){
      HalResult result = ensureWakeTimer();
      if(result != HalResult::OK) return result;

      // Drop a wakeup left over from an earlier timed-out wait
      ulTaskNotifyTake(pdTRUE, 0);
      waiter_.store(xTaskGetCurrentTaskHandle(), std::memory_order_release);

      if(esp_timer_start_once(wakeTimer_, us - WAKE_LATENCY_US) != ESP_OK){
        waiter_.store(nullptr, std::memory_order_release);
        return HalResult::HARDWARE_FAULT;
      }

      // Backstop past the deadline; a missed wakeup only costs latency
      const TickType_t limit = pdMS_TO_TICKS(us / 1000) + 2;
      if(ulTaskNotifyTake(pdTRUE, limit) == 0){
        esp_timer_stop(wakeTimer_);
      }
      waiter_.store(nullptr, std::memory_order_release);
    }

    const int64_t remaining = deadline - esp_timer_get_time();
    if(remaining > 0){
      esp_rom_delay_us(static_cast<uint32_t>(remaining));
    }
    return HalResult::OK;
  }

  void delayUs(uint32_t us) override{
    esp_rom_delay_us(us);
  }

  void yield() override{
    taskYIELD();
  }

private:
  static void onWake(void* arg){
    Esp32HalSystemTimer* self = static_cast<Esp32HalSystemTimer*>(arg);
    TaskHandle_t task = self->waiter_.load(std::memory_order_acquire);
    if(task){
      xTaskNotifyGive(task);
    }
  }

  HalResult ensureWakeTimer(){
    if(wakeTimer_) return HalResult::OK;

    esp_timer_create_args_t args = {};
    args.callback = &Esp32HalSystemTimer::onWake;
    args.arg = this;
    args.dispatch_method = ESP_TIMER_TASK;
    args.name = "panelscan_hold";
    if(esp_timer_create(&args, &wakeTimer_) != ESP_OK){
      wakeTimer_ = nullptr;
      return HalResult::NO_MEMORY;
    }
    return HalResult::OK;
  }

  esp_timer_handle_t wakeTimer_ = nullptr;
  std::atomic<TaskHandle_t> waiter_{nullptr};
};

} // namespace panelscan::hal::esp32

#endif // PANELSCAN_SRC_HAL_ESP32_HAL_TIMER_HPP_
