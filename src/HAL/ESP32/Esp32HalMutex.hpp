/*****************************************************************
 * File:      Esp32HalMutex.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    FreeRTOS mutex behind the HAL mutex interface.
 *****************************************************************/

#ifndef PANELSCAN_SRC_HAL_ESP32_HAL_MUTEX_HPP_
#define PANELSCAN_SRC_HAL_ESP32_HAL_MUTEX_HPP_

#include "panelscan/HAL/IHalMutex.hpp"

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"

namespace panelscan::hal::esp32{

class Esp32HalMutex : public IHalMutex{
public:
  Esp32HalMutex() : handle_(nullptr){}

  ~Esp32HalMutex() override{
    if(handle_) vSemaphoreDelete(handle_);
  }

  Esp32HalMutex(const Esp32HalMutex&) = delete;
  Esp32HalMutex& operator=(const Esp32HalMutex&) = delete;

  /** Allocate the semaphore; must succeed before lock() */
  HalResult init(){
    if(handle_) return HalResult::ALREADY_INITIALIZED;
    handle_ = xSemaphoreCreateMutex();
    return handle_ ? HalResult::OK : HalResult::NO_MEMORY;
  }

  void lock() override{
    xSemaphoreTake(handle_, portMAX_DELAY);
  }

  bool tryLock(uint32_t timeout_ms) override{
    return xSemaphoreTake(handle_, pdMS_TO_TICKS(timeout_ms)) == pdTRUE;
  }

  void unlock() override{
    xSemaphoreGive(handle_);
  }

private:
  SemaphoreHandle_t handle_;
};

} // namespace panelscan::hal::esp32

#endif // PANELSCAN_SRC_HAL_ESP32_HAL_MUTEX_HPP_
