/*****************************************************************
 * File:      PinBundle.hpp
 * Category:  include/panelscan/Scan
 *
 * Purpose:
 *    HUB75 pin assignment. Colour data for the upper (R1/G1/B1)
 *    and lower (R2/G2/B2) half, row address A..E, and the
 *    CLK/LAT/OE control lines. D and E are optional.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_SCAN_PIN_BUNDLE_HPP_
#define PANELSCAN_INCLUDE_SCAN_PIN_BUNDLE_HPP_

#include "panelscan/HAL/HalTypes.hpp"
#include "panelscan/HAL/IHalGpio.hpp"

namespace panelscan{

using hal::gpio_pin_t;
using hal::HalResult;
using hal::PIN_NOT_CONNECTED;

struct PinBundle{
  // RGB data
  gpio_pin_t r1 = PIN_NOT_CONNECTED;
  gpio_pin_t g1 = PIN_NOT_CONNECTED;
  gpio_pin_t b1 = PIN_NOT_CONNECTED;
  gpio_pin_t r2 = PIN_NOT_CONNECTED;
  gpio_pin_t g2 = PIN_NOT_CONNECTED;
  gpio_pin_t b2 = PIN_NOT_CONNECTED;

  // Row address, A is the LSB
  gpio_pin_t a = PIN_NOT_CONNECTED;
  gpio_pin_t b = PIN_NOT_CONNECTED;
  gpio_pin_t c = PIN_NOT_CONNECTED;
  gpio_pin_t d = PIN_NOT_CONNECTED;
  gpio_pin_t e = PIN_NOT_CONNECTED;

  // Control (OE is active low)
  gpio_pin_t clk = PIN_NOT_CONNECTED;
  gpio_pin_t lat = PIN_NOT_CONNECTED;
  gpio_pin_t oe = PIN_NOT_CONNECTED;

  /** Address pin for bit i (0 = A) */
  gpio_pin_t address(int bit) const{
    switch(bit){
      case 0: return a;
      case 1: return b;
      case 2: return c;
      case 3: return d;
      case 4: return e;
      default: return PIN_NOT_CONNECTED;
    }
  }

  /** Number of consecutive address lines wired from A upward */
  int addressPinCount() const;

  /** Rows reachable with the wired address lines */
  int maxAddressableRows() const{
    return 1 << addressPinCount();
  }

  /** Check every mandatory pin is wired and no pin is used twice
   * @return HalResult::OK or HalResult::INVALID_CONFIG
   */
  HalResult validate() const;

  /** Configure all wired pins as outputs and drive idle levels:
   *  data, address, CLK and LAT low; OE high (blanked).
   */
  HalResult init(hal::IHalGpio& gpio) const;

  // Factory methods for common panels
  static PinBundle Panel32x16(gpio_pin_t r1, gpio_pin_t g1, gpio_pin_t b1,
                              gpio_pin_t r2, gpio_pin_t g2, gpio_pin_t b2,
                              gpio_pin_t a, gpio_pin_t b, gpio_pin_t c,
                              gpio_pin_t clk, gpio_pin_t lat, gpio_pin_t oe);

  static PinBundle Panel64x32(gpio_pin_t r1, gpio_pin_t g1, gpio_pin_t b1,
                              gpio_pin_t r2, gpio_pin_t g2, gpio_pin_t b2,
                              gpio_pin_t a, gpio_pin_t b, gpio_pin_t c, gpio_pin_t d,
                              gpio_pin_t clk, gpio_pin_t lat, gpio_pin_t oe);

  static PinBundle Panel64x64(gpio_pin_t r1, gpio_pin_t g1, gpio_pin_t b1,
                              gpio_pin_t r2, gpio_pin_t g2, gpio_pin_t b2,
                              gpio_pin_t a, gpio_pin_t b, gpio_pin_t c, gpio_pin_t d, gpio_pin_t e,
                              gpio_pin_t clk, gpio_pin_t lat, gpio_pin_t oe);
};

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_SCAN_PIN_BUNDLE_HPP_
