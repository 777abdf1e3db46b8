/*****************************************************************
 * File:      IHalGpio.hpp
 * Category:  include/panelscan/HAL
 *
 * Purpose:
 *    GPIO Hardware Abstraction Layer interface.
 *    The panel driver only needs individually addressable
 *    digital outputs; any pin type can sit behind this.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_HAL_IHAL_GPIO_HPP_
#define PANELSCAN_INCLUDE_HAL_IHAL_GPIO_HPP_

#include "HalTypes.hpp"

namespace panelscan::hal{

/** GPIO Hardware Abstraction Interface
 *
 * Provides platform-independent control of digital pins.
 * The scan engine drives every HUB75 signal through this.
 */
class IHalGpio{
public:
  virtual ~IHalGpio() = default;

  /** Initialize GPIO subsystem
   * @return HalResult::OK on success
   */
  virtual HalResult init() = 0;

  /** Configure pin mode
   * @param pin GPIO pin number
   * @param mode Pin mode (INPUT, OUTPUT, etc.)
   * @return HalResult::OK on success
   */
  virtual HalResult pinMode(gpio_pin_t pin, GpioMode mode) = 0;

  /** Read digital pin state
   * @param pin GPIO pin number
   * @return GpioState::GPIO_HIGH or GpioState::GPIO_LOW
   */
  virtual GpioState digitalRead(gpio_pin_t pin) = 0;

  /** Write digital pin state
   * @param pin GPIO pin number
   * @param state Pin state to write
   * @return HalResult::OK on success
   */
  virtual HalResult digitalWrite(gpio_pin_t pin, GpioState state) = 0;

  /** Drive pin high */
  HalResult setHigh(gpio_pin_t pin){
    return digitalWrite(pin, GpioState::GPIO_HIGH);
  }

  /** Drive pin low */
  HalResult setLow(gpio_pin_t pin){
    return digitalWrite(pin, GpioState::GPIO_LOW);
  }

  /** Drive pin to a boolean level */
  HalResult setLevel(gpio_pin_t pin, bool high){
    return digitalWrite(pin, high ? GpioState::GPIO_HIGH : GpioState::GPIO_LOW);
  }
};

} // namespace panelscan::hal

#endif // PANELSCAN_INCLUDE_HAL_IHAL_GPIO_HPP_
