/*****************************************************************
 * File:      IHalMutex.hpp
 * Category:  include/panelscan/HAL
 *
 * Purpose:
 *    Mutual exclusion interface used to share one display
 *    between a refreshing task and a drawing task.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_HAL_IHAL_MUTEX_HPP_
#define PANELSCAN_INCLUDE_HAL_IHAL_MUTEX_HPP_

#include "HalTypes.hpp"

namespace panelscan::hal{

/** Mutex Hardware Abstraction Interface */
class IHalMutex{
public:
  virtual ~IHalMutex() = default;

  /** Block until the mutex is owned by the caller */
  virtual void lock() = 0;

  /** Try to take the mutex within timeout_ms
   * @return true if the mutex is now owned by the caller
   */
  virtual bool tryLock(uint32_t timeout_ms) = 0;

  /** Release the mutex */
  virtual void unlock() = 0;
};

} // namespace panelscan::hal

#endif // PANELSCAN_INCLUDE_HAL_IHAL_MUTEX_HPP_
