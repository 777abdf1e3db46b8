/*****************************************************************
 * File:      HalTypes.hpp
 * Category:  include/panelscan/HAL
 *
 * Purpose:
 *    Common type definitions used by the HAL capability
 *    interfaces and the panel driver built on top of them.
 *    These types are platform-independent.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_HAL_HAL_TYPES_HPP_
#define PANELSCAN_INCLUDE_HAL_HAL_TYPES_HPP_

#include <stdint.h>
#include <stddef.h>

namespace panelscan::hal{

// ============================================================
// Result Types
// ============================================================

/** HAL operation result codes */
enum class HalResult : uint8_t{
  OK = 0,              // Operation successful
  ERROR,               // Generic error
  TIMEOUT,             // Operation timed out
  BUSY,                // Resource is busy
  INVALID_PARAM,       // Invalid parameter
  INVALID_CONFIG,      // Construction-time configuration rejected
  NOT_INITIALIZED,     // Module not initialized
  NOT_SUPPORTED,       // Feature not supported
  CANCELLED,           // Operation cancelled by the caller
  HARDWARE_FAULT,      // Hardware fault detected
  ALREADY_INITIALIZED, // Already initialized
  INVALID_STATE,       // Invalid state for operation
  NO_MEMORY,           // Memory allocation failed
  WRITE_FAILED         // Write operation failed
};

/** Convert HalResult to string */
inline const char* halResultToString(HalResult result){
  switch(result){
    case HalResult::OK:                  return "OK";
    case HalResult::ERROR:               return "ERROR";
    case HalResult::TIMEOUT:             return "TIMEOUT";
    case HalResult::BUSY:                return "BUSY";
    case HalResult::INVALID_PARAM:       return "INVALID_PARAM";
    case HalResult::INVALID_CONFIG:      return "INVALID_CONFIG";
    case HalResult::NOT_INITIALIZED:     return "NOT_INITIALIZED";
    case HalResult::NOT_SUPPORTED:       return "NOT_SUPPORTED";
    case HalResult::CANCELLED:           return "CANCELLED";
    case HalResult::HARDWARE_FAULT:      return "HARDWARE_FAULT";
    case HalResult::ALREADY_INITIALIZED: return "ALREADY_INITIALIZED";
    case HalResult::INVALID_STATE:       return "INVALID_STATE";
    case HalResult::NO_MEMORY:           return "NO_MEMORY";
    case HalResult::WRITE_FAILED:        return "WRITE_FAILED";
    default:                             return "UNKNOWN";
  }
}

// ============================================================
// Time Types
// ============================================================

/** Timestamp in milliseconds since boot */
using timestamp_ms_t = uint32_t;

/** Timestamp in microseconds since boot */
using timestamp_us_t = uint64_t;

/** Duration in nanoseconds */
using duration_ns_t = uint32_t;

// ============================================================
// GPIO Types
// ============================================================

/** GPIO pin number type */
using gpio_pin_t = uint8_t;

/** Marker for an optional pin that is not wired */
constexpr gpio_pin_t PIN_NOT_CONNECTED = 0xFF;

/** GPIO pin mode */
enum class GpioMode : uint8_t{
  GPIO_INPUT,
  GPIO_OUTPUT,
  GPIO_INPUT_PULLUP,
  GPIO_INPUT_PULLDOWN
};

/** GPIO pin state */
enum class GpioState : uint8_t{
  GPIO_LOW = 0,
  GPIO_HIGH = 1
};

} // namespace panelscan::hal

#endif // PANELSCAN_INCLUDE_HAL_HAL_TYPES_HPP_
