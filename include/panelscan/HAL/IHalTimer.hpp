/*****************************************************************
 * File:      IHalTimer.hpp
 * Category:  include/panelscan/HAL
 *
 * Purpose:
 *    Timer Hardware Abstraction Layer interface.
 *    Provides timestamps, blocking delays and the cooperative
 *    sleep used as the suspension point during BCM holds.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_HAL_IHAL_TIMER_HPP_
#define PANELSCAN_INCLUDE_HAL_IHAL_TIMER_HPP_

#include "HalTypes.hpp"

namespace panelscan::hal{

/** System Timer Hardware Abstraction Interface
 *
 * Provides platform-independent timing functions.
 * Implementations decide how a sleep hands the CPU back to
 * the scheduler (RTOS delay, condition variable, virtual clock).
 */
class IHalSystemTimer{
public:
  virtual ~IHalSystemTimer() = default;

  /** Get milliseconds since boot
   * @return Milliseconds since system start
   */
  virtual timestamp_ms_t millis() const = 0;

  /** Get microseconds since boot
   * @return Microseconds since system start
   */
  virtual timestamp_us_t micros() const = 0;

  /** Suspend the calling task for at least ns nanoseconds
   *
   * Other cooperative tasks may run during the wait.
   * @param ns Duration in nanoseconds
   * @return HalResult::OK when the full duration elapsed,
   *         HalResult::CANCELLED or HalResult::TIMEOUT if the
   *         wait was aborted early
   */
  virtual HalResult sleepNs(duration_ns_t ns) = 0;

  /** Delay for specified microseconds (blocking, no yield)
   * @param us Microseconds to delay
   */
  virtual void delayUs(uint32_t us) = 0;

  /** Yield to other tasks (RTOS aware)
   */
  virtual void yield() = 0;
};

} // namespace panelscan::hal

#endif // PANELSCAN_INCLUDE_HAL_IHAL_TIMER_HPP_
