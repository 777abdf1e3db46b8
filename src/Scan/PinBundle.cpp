/*****************************************************************
 * File:      PinBundle.cpp
 * Category:  src/Scan
 *
 * Purpose:
 *    Pin bundle validation, idle-level setup and panel presets.
 *****************************************************************/

#include "panelscan/Scan/PinBundle.hpp"
#include "panelscan/HAL/IHalLog.hpp"

namespace panelscan{

using hal::GpioMode;
using hal::GpioState;

static constexpr const char* TAG = "PinBundle";

int PinBundle::addressPinCount() const{
  int count = 0;
  while(count < 5 && address(count) != PIN_NOT_CONNECTED){
    count++;
  }
  return count;
}

HalResult PinBundle::validate() const{
  const gpio_pin_t required[] = {r1, g1, b1, r2, g2, b2, clk, lat, oe};
  for(gpio_pin_t pin : required){
    if(pin == PIN_NOT_CONNECTED){
      PANELSCAN_LOG_E(nullptr, TAG, "Mandatory data/control pin not connected");
      return HalResult::INVALID_CONFIG;
    }
  }

  const gpio_pin_t all[] = {r1, g1, b1, r2, g2, b2, a, b, c, d, e, clk, lat, oe};
  const int n = sizeof(all) / sizeof(all[0]);
  for(int i = 0; i < n; i++){
    if(all[i] == PIN_NOT_CONNECTED) continue;
    for(int j = i + 1; j < n; j++){
      if(all[i] == all[j]){
        PANELSCAN_LOG_E(nullptr, TAG, "GPIO %u assigned twice", static_cast<unsigned>(all[i]));
        return HalResult::INVALID_CONFIG;
      }
    }
  }

  // Address lines must be wired from A upward without gaps
  const int wired = addressPinCount();
  for(int i = wired; i < 5; i++){
    if(address(i) != PIN_NOT_CONNECTED){
      PANELSCAN_LOG_E(nullptr, TAG, "Address line %c wired but %c is not", 'A' + i, 'A' + wired);
      return HalResult::INVALID_CONFIG;
    }
  }
  return HalResult::OK;
}

HalResult PinBundle::init(hal::IHalGpio& gpio) const{
  const gpio_pin_t low_pins[] = {r1, g1, b1, r2, g2, b2, a, b, c, d, e, clk, lat};

  // Blank first so nothing lights while the rest settles
  HalResult result = gpio.pinMode(oe, GpioMode::GPIO_OUTPUT);
  if(result != HalResult::OK) return result;
  result = gpio.digitalWrite(oe, GpioState::GPIO_HIGH);
  if(result != HalResult::OK) return result;

  for(gpio_pin_t pin : low_pins){
    if(pin == PIN_NOT_CONNECTED) continue;
    result = gpio.pinMode(pin, GpioMode::GPIO_OUTPUT);
    if(result != HalResult::OK) return result;
    result = gpio.digitalWrite(pin, GpioState::GPIO_LOW);
    if(result != HalResult::OK) return result;
  }
  return HalResult::OK;
}

// ============================================================
// Presets
// ============================================================

PinBundle PinBundle::Panel32x16(gpio_pin_t r1, gpio_pin_t g1, gpio_pin_t b1,
                                gpio_pin_t r2, gpio_pin_t g2, gpio_pin_t b2,
                                gpio_pin_t a, gpio_pin_t b, gpio_pin_t c,
                                gpio_pin_t clk, gpio_pin_t lat, gpio_pin_t oe){
  PinBundle p;
  p.r1 = r1; p.g1 = g1; p.b1 = b1;
  p.r2 = r2; p.g2 = g2; p.b2 = b2;
  p.a = a; p.b = b; p.c = c;
  p.clk = clk; p.lat = lat; p.oe = oe;
  return p;
}

PinBundle PinBundle::Panel64x32(gpio_pin_t r1, gpio_pin_t g1, gpio_pin_t b1,
                                gpio_pin_t r2, gpio_pin_t g2, gpio_pin_t b2,
                                gpio_pin_t a, gpio_pin_t b, gpio_pin_t c, gpio_pin_t d,
                                gpio_pin_t clk, gpio_pin_t lat, gpio_pin_t oe){
  PinBundle p = Panel32x16(r1, g1, b1, r2, g2, b2, a, b, c, clk, lat, oe);
  p.d = d;
  return p;
}

PinBundle PinBundle::Panel64x64(gpio_pin_t r1, gpio_pin_t g1, gpio_pin_t b1,
                                gpio_pin_t r2, gpio_pin_t g2, gpio_pin_t b2,
                                gpio_pin_t a, gpio_pin_t b, gpio_pin_t c, gpio_pin_t d, gpio_pin_t e,
                                gpio_pin_t clk, gpio_pin_t lat, gpio_pin_t oe){
  PinBundle p = Panel64x32(r1, g1, b1, r2, g2, b2, a, b, c, d, clk, lat, oe);
  p.e = e;
  return p;
}

} // namespace panelscan
