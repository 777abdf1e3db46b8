/*****************************************************************
 * File:      OutputBlankGuard.hpp
 * Category:  include/panelscan/Scan
 *
 * Purpose:
 *    Scoped guard that drives OE high (panel blanked) when it
 *    goes out of scope, whichever way the refresh pass exits.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_SCAN_OUTPUT_BLANK_GUARD_HPP_
#define PANELSCAN_INCLUDE_SCAN_OUTPUT_BLANK_GUARD_HPP_

#include "panelscan/HAL/IHalGpio.hpp"

namespace panelscan{

class OutputBlankGuard{
public:
  OutputBlankGuard(hal::IHalGpio& gpio, hal::gpio_pin_t oe)
    : gpio_(gpio)
    , oe_(oe)
  {}

  ~OutputBlankGuard(){
    (void)gpio_.setHigh(oe_);
  }

  OutputBlankGuard(const OutputBlankGuard&) = delete;
  OutputBlankGuard& operator=(const OutputBlankGuard&) = delete;

private:
  hal::IHalGpio& gpio_;
  hal::gpio_pin_t oe_;
};

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_SCAN_OUTPUT_BLANK_GUARD_HPP_
