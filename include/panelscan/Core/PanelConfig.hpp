/*****************************************************************
 * File:      PanelConfig.hpp
 * Category:  include/panelscan/Core
 *
 * Purpose:
 *    Build-time defaults and the runtime display configuration.
 *
 * Build options (define before including, or via the compiler):
 *    PANELSCAN_GAMMA_MODE          0 linear, 1 CIE1931, 2 gamma 2.2
 *    PANELSCAN_DEFAULT_BRIGHTNESS  0..255
 *    PANELSCAN_DEFAULT_REFRESH_NS  bitplane-0 hold at full brightness
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_CORE_PANEL_CONFIG_HPP_
#define PANELSCAN_INCLUDE_CORE_PANEL_CONFIG_HPP_

#include "panelscan/Core/Gamma.hpp"
#include "panelscan/HAL/HalTypes.hpp"
#include "panelscan/Scan/PinBundle.hpp"

#ifndef PANELSCAN_GAMMA_MODE
#define PANELSCAN_GAMMA_MODE 2
#endif

#ifndef PANELSCAN_DEFAULT_BRIGHTNESS
#define PANELSCAN_DEFAULT_BRIGHTNESS 128
#endif

#ifndef PANELSCAN_DEFAULT_REFRESH_NS
#define PANELSCAN_DEFAULT_REFRESH_NS 100000
#endif

static_assert(PANELSCAN_GAMMA_MODE >= 0 && PANELSCAN_GAMMA_MODE <= 2, "PANELSCAN_GAMMA_MODE must be 0, 1 or 2");
static_assert(PANELSCAN_DEFAULT_BRIGHTNESS >= 0 && PANELSCAN_DEFAULT_BRIGHTNESS <= 255, "PANELSCAN_DEFAULT_BRIGHTNESS must be 0..255");

namespace panelscan{

constexpr GammaMode DEFAULT_GAMMA_MODE = static_cast<GammaMode>(PANELSCAN_GAMMA_MODE);
constexpr uint8_t DEFAULT_BRIGHTNESS = PANELSCAN_DEFAULT_BRIGHTNESS;
constexpr hal::duration_ns_t DEFAULT_REFRESH_NS = PANELSCAN_DEFAULT_REFRESH_NS;

/** Runtime construction parameters for Hub75Display */
struct DisplayConfig{
  PinBundle pins;
  uint8_t brightness = DEFAULT_BRIGHTNESS;
  bool doubleBuffered = true;
  hal::duration_ns_t refreshIntervalNs = DEFAULT_REFRESH_NS;
  GammaMode gamma = DEFAULT_GAMMA_MODE;

  static DisplayConfig Default(const PinBundle& pins){
    DisplayConfig cfg;
    cfg.pins = pins;
    return cfg;
  }

  /** Draw straight into the scanned buffer (may tear) */
  static DisplayConfig SingleBuffered(const PinBundle& pins){
    DisplayConfig cfg = Default(pins);
    cfg.doubleBuffered = false;
    return cfg;
  }

  /** Shorter base unit for higher refresh rate at lower depth */
  static DisplayConfig Fast(const PinBundle& pins){
    DisplayConfig cfg = Default(pins);
    cfg.refreshIntervalNs = DEFAULT_REFRESH_NS / 4;
    return cfg;
  }
};

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_CORE_PANEL_CONFIG_HPP_
