/*****************************************************************
 * File:      Gamma.cpp
 * Category:  src/Core
 *
 * Purpose:
 *    Gamma curve evaluation used to fill GammaTable.
 *****************************************************************/

#include "panelscan/Core/Gamma.hpp"

#include <cmath>

namespace panelscan{

const char* gammaModeToString(GammaMode mode){
  switch(mode){
    case GammaMode::LINEAR:    return "Linear";
    case GammaMode::CIE1931:   return "CIE1931";
    case GammaMode::GAMMA_2_2: return "Gamma2.2";
    default:                   return "Unknown";
  }
}

uint16_t gammaCurveValue(GammaMode mode, uint8_t input, int bits){
  if(bits < 1) bits = 1;
  if(bits > 8) bits = 8;
  const int max_val = (1 << bits) - 1;

  if(mode == GammaMode::LINEAR){
    return static_cast<uint16_t>(input >> (8 - bits));
  }

  const double x = input / 255.0;
  double y;
  if(mode == GammaMode::CIE1931){
    // L* in 0..100 back to relative luminance
    const double l = x * 100.0;
    y = (l <= 8.0) ? (l / 903.3) : std::pow((l + 16.0) / 116.0, 3.0);
  }else{
    y = std::pow(x, 2.2);
  }

  int out = static_cast<int>(std::lround(y * max_val));
  if(out < 0) out = 0;
  if(out > max_val) out = max_val;
  return static_cast<uint16_t>(out);
}

} // namespace panelscan
