/*****************************************************************
 * File:      HostHalGpio.hpp
 * Category:  src/HAL/Host
 *
 * Purpose:
 *    In-memory GPIO for running the driver off-target. Keeps
 *    the last written level and mode of every pin and counts
 *    writes.
 *****************************************************************/

#ifndef PANELSCAN_SRC_HAL_HOST_HAL_GPIO_HPP_
#define PANELSCAN_SRC_HAL_HOST_HAL_GPIO_HPP_

#include "panelscan/HAL/IHalGpio.hpp"
#include "panelscan/HAL/IHalLog.hpp"

namespace panelscan::hal::host{

class HostHalGpio : public IHalGpio{
public:
  static constexpr int MAX_PINS = 64;

  explicit HostHalGpio(IHalLog* log = nullptr) : log_(log){}

  HalResult init() override{
    if(initialized_) return HalResult::ALREADY_INITIALIZED;
    for(int i = 0; i < MAX_PINS; i++){
      levels_[i] = GpioState::GPIO_LOW;
      outputs_[i] = false;
    }
    initialized_ = true;
    PANELSCAN_LOG_I(log_, TAG, "Host GPIO initialized (%d pins)", MAX_PINS);
    return HalResult::OK;
  }

  HalResult pinMode(gpio_pin_t pin, GpioMode mode) override{
    if(!initialized_) return HalResult::NOT_INITIALIZED;
    if(pin >= MAX_PINS) return HalResult::INVALID_PARAM;
    outputs_[pin] = mode == GpioMode::GPIO_OUTPUT;
    return HalResult::OK;
  }

  GpioState digitalRead(gpio_pin_t pin) override{
    return pin < MAX_PINS ? levels_[pin] : GpioState::GPIO_LOW;
  }

  HalResult digitalWrite(gpio_pin_t pin, GpioState state) override{
    if(!initialized_) return HalResult::NOT_INITIALIZED;
    if(pin >= MAX_PINS) return HalResult::INVALID_PARAM;
    if(!outputs_[pin]){
      PANELSCAN_LOG_W(log_, TAG, "Write to pin %d not configured as output", pin);
      return HalResult::INVALID_STATE;
    }
    levels_[pin] = state;
    writes_++;
    return HalResult::OK;
  }

  bool isOutput(gpio_pin_t pin) const{ return pin < MAX_PINS && outputs_[pin]; }
  uint64_t writeCount() const{ return writes_; }

private:
  static constexpr const char* TAG = "HostGPIO";

  IHalLog* log_;
  bool initialized_ = false;
  GpioState levels_[MAX_PINS] = {};
  bool outputs_[MAX_PINS] = {};
  uint64_t writes_ = 0;
};

} // namespace panelscan::hal::host

#endif // PANELSCAN_SRC_HAL_HOST_HAL_GPIO_HPP_
