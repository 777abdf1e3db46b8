/*****************************************************************
 * File:      Gamma.hpp
 * Category:  include/panelscan/Core
 *
 * Purpose:
 *    Maps an 8-bit channel value to a COLOR_BITS intensity for
 *    Binary Code Modulation. The table is built once and never
 *    changes afterwards.
 *
 * Notes:
 *    Low inputs quantize to 0 at small COLOR_BITS (anything
 *    below roughly 2^(8-COLOR_BITS) is dark). The table stays
 *    monotonic.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_CORE_GAMMA_HPP_
#define PANELSCAN_INCLUDE_CORE_GAMMA_HPP_

#include <stdint.h>

namespace panelscan{

/** Perceptual curve applied before quantization */
enum class GammaMode : uint8_t{
  LINEAR = 0,     // Plain truncation to COLOR_BITS
  CIE1931 = 1,    // CIE 1931 lightness
  GAMMA_2_2 = 2   // Power law, exponent 2.2
};

const char* gammaModeToString(GammaMode mode);

/** Evaluate one curve point
 * @param mode Curve
 * @param input 8-bit channel value
 * @param bits Output resolution (1..8)
 * @return Intensity in [0, 2^bits - 1]
 */
uint16_t gammaCurveValue(GammaMode mode, uint8_t input, int bits);

/** 256-entry lookup table for one COLOR_BITS depth */
template<int COLOR_BITS>
class GammaTable{
public:
  static_assert(COLOR_BITS >= 1 && COLOR_BITS <= 8, "COLOR_BITS must be 1..8");

  static constexpr uint16_t MAX_VALUE = (1u << COLOR_BITS) - 1;

  explicit GammaTable(GammaMode mode = GammaMode::GAMMA_2_2) : mode_(mode){
    for(int i = 0; i < 256; i++){
      lut_[i] = gammaCurveValue(mode, static_cast<uint8_t>(i), COLOR_BITS);
    }
  }

  uint16_t planeIntensity(uint8_t channel) const{
    return lut_[channel];
  }

  /** Bit `plane` of the mapped intensity */
  bool planeBit(uint8_t channel, int plane) const{
    return (lut_[channel] >> plane) & 1u;
  }

  GammaMode mode() const{ return mode_; }

  const uint16_t* data() const{ return lut_; }

private:
  uint16_t lut_[256];
  GammaMode mode_;
};

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_CORE_GAMMA_HPP_
