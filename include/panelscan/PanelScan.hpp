/*****************************************************************
 * File:      PanelScan.hpp
 * Category:  include/panelscan
 *
 * Purpose:
 *    Single include for applications using the HUB75 driver.
 *    Platform backends live under src/HAL and are included
 *    separately.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_PANEL_SCAN_HPP_
#define PANELSCAN_INCLUDE_PANEL_SCAN_HPP_

// HAL
#include "panelscan/HAL/HalTypes.hpp"
#include "panelscan/HAL/IHalGpio.hpp"
#include "panelscan/HAL/IHalLog.hpp"
#include "panelscan/HAL/IHalMutex.hpp"
#include "panelscan/HAL/IHalTimer.hpp"

// Core
#include "panelscan/Core/Color.hpp"
#include "panelscan/Core/Font5x7.hpp"
#include "panelscan/Core/Gamma.hpp"
#include "panelscan/Core/Geometry.hpp"
#include "panelscan/Core/PanelConfig.hpp"

// Scan
#include "panelscan/Scan/Brightness.hpp"
#include "panelscan/Scan/CancelToken.hpp"
#include "panelscan/Scan/PinBundle.hpp"
#include "panelscan/Scan/ScanEngine.hpp"

// Display
#include "panelscan/Display/BufferPair.hpp"
#include "panelscan/Display/FrameBuffer.hpp"
#include "panelscan/Display/Hub75Display.hpp"
#include "panelscan/Display/LockedDisplay.hpp"
#include "panelscan/Display/PixelSink.hpp"

// Animation
#include "panelscan/Animation/Animation.hpp"
#include "panelscan/Animation/AnimationEffect.hpp"
#include "panelscan/Animation/FrameSource.hpp"

#endif // PANELSCAN_INCLUDE_PANEL_SCAN_HPP_
