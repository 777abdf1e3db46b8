/*****************************************************************
 * File:      Esp32HalGpio.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    ESP32 implementation of the HAL GPIO interface using the
 *    ESP-IDF GPIO driver.
 *****************************************************************/

#ifndef PANELSCAN_SRC_HAL_ESP32_HAL_GPIO_HPP_
#define PANELSCAN_SRC_HAL_ESP32_HAL_GPIO_HPP_

#include "panelscan/HAL/IHalGpio.hpp"
#include "panelscan/HAL/IHalLog.hpp"

#include "driver/gpio.h"
#include "esp_err.h"

namespace panelscan::hal::esp32{

/** ESP32 GPIO Implementation */
class Esp32HalGpio : public IHalGpio{
private:
  static constexpr const char* TAG = "GPIO";
  IHalLog* log_ = nullptr;
  bool initialized_ = false;

  static HalResult fromEspErr(esp_err_t err){
    switch(err){
      case ESP_OK:              return HalResult::OK;
      case ESP_ERR_INVALID_ARG: return HalResult::INVALID_PARAM;
      case ESP_ERR_NO_MEM:      return HalResult::NO_MEMORY;
      default:                  return HalResult::HARDWARE_FAULT;
    }
  }

public:
  explicit Esp32HalGpio(IHalLog* log = nullptr) : log_(log){}

  HalResult init() override{
    if(initialized_) return HalResult::ALREADY_INITIALIZED;
    initialized_ = true;
    PANELSCAN_LOG_I(log_, TAG, "GPIO initialized");
    return HalResult::OK;
  }

  HalResult pinMode(gpio_pin_t pin, GpioMode mode) override{
    if(!initialized_) return HalResult::NOT_INITIALIZED;
    if(pin == PIN_NOT_CONNECTED || !GPIO_IS_VALID_GPIO(pin)) return HalResult::INVALID_PARAM;

    gpio_config_t io = {};
    io.pin_bit_mask = 1ULL << pin;
    io.intr_type = GPIO_INTR_DISABLE;
    io.pull_up_en = GPIO_PULLUP_DISABLE;
    io.pull_down_en = GPIO_PULLDOWN_DISABLE;

    switch(mode){
      case GpioMode::GPIO_INPUT:          io.mode = GPIO_MODE_INPUT; break;
      case GpioMode::GPIO_OUTPUT:         io.mode = GPIO_MODE_OUTPUT; break;
      case GpioMode::GPIO_INPUT_PULLUP:   io.mode = GPIO_MODE_INPUT; io.pull_up_en = GPIO_PULLUP_ENABLE; break;
      case GpioMode::GPIO_INPUT_PULLDOWN: io.mode = GPIO_MODE_INPUT; io.pull_down_en = GPIO_PULLDOWN_ENABLE; break;
      default: return HalResult::INVALID_PARAM;
    }

    const esp_err_t err = gpio_config(&io);
    if(err != ESP_OK){
      PANELSCAN_LOG_E(log_, TAG, "Pin %d config failed: %s", pin, esp_err_to_name(err));
      return fromEspErr(err);
    }
    PANELSCAN_LOG_D(log_, TAG, "Pin %d mode set to %d", pin, static_cast<int>(mode));
    return HalResult::OK;
  }

  GpioState digitalRead(gpio_pin_t pin) override{
    return gpio_get_level(static_cast<gpio_num_t>(pin)) ? GpioState::GPIO_HIGH : GpioState::GPIO_LOW;
  }

  HalResult digitalWrite(gpio_pin_t pin, GpioState state) override{
    if(!initialized_) return HalResult::NOT_INITIALIZED;
    return fromEspErr(gpio_set_level(static_cast<gpio_num_t>(pin), state == GpioState::GPIO_HIGH ? 1 : 0));
  }
};

} // namespace panelscan::hal::esp32

#endif // PANELSCAN_SRC_HAL_ESP32_HAL_GPIO_HPP_
