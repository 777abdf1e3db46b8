/*****************************************************************
 * File:      HalLog.cpp
 * Category:  src/HAL
 *
 * Purpose:
 *    Storage for the process-wide logger pointer.
 *****************************************************************/

#include "panelscan/HAL/IHalLog.hpp"

namespace panelscan::hal{

IHalLog* g_hal_log = nullptr;

} // namespace panelscan::hal
