/*****************************************************************
 * File:      HostHalMutex.hpp
 * Category:  src/HAL/Host
 *
 * Purpose:
 *    std::timed_mutex behind the HAL mutex interface.
 *****************************************************************/

#ifndef PANELSCAN_SRC_HAL_HOST_HAL_MUTEX_HPP_
#define PANELSCAN_SRC_HAL_HOST_HAL_MUTEX_HPP_

#include "panelscan/HAL/IHalMutex.hpp"

#include <chrono>
#include <mutex>

namespace panelscan::hal::host{

class HostHalMutex : public IHalMutex{
public:
  void lock() override{ mutex_.lock(); }

  bool tryLock(uint32_t timeout_ms) override{
    return mutex_.try_lock_for(std::chrono::milliseconds(timeout_ms));
  }

  void unlock() override{ mutex_.unlock(); }

private:
  std::timed_mutex mutex_;
};

} // namespace panelscan::hal::host

#endif // PANELSCAN_SRC_HAL_HOST_HAL_MUTEX_HPP_
