/*****************************************************************
 * File:      HostHalTimer.hpp
 * Category:  src/HAL/Host
 *
 * Purpose:
 *    Desktop implementation of the HAL timer interface on
 *    std::chrono. sleepNs() waits on a condition variable so
 *    another thread can cut a hold short with cancel().
 *****************************************************************/

#ifndef PANELSCAN_SRC_HAL_HOST_HAL_TIMER_HPP_
#define PANELSCAN_SRC_HAL_HOST_HAL_TIMER_HPP_

#include "panelscan/HAL/IHalTimer.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace panelscan::hal::host{

class HostHalSystemTimer : public IHalSystemTimer{
public:
  using Clock = std::chrono::steady_clock;

  HostHalSystemTimer() : start_(Clock::now()){}

  timestamp_ms_t millis() const override{
    return static_cast<timestamp_ms_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_).count());
  }

  timestamp_us_t micros() const override{
    return static_cast<timestamp_us_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start_).count());
  }

  HalResult sleepNs(duration_ns_t ns) override{
    std::unique_lock<std::mutex> lock(mutex_);
    const bool cancelled = cv_.wait_for(lock, std::chrono::nanoseconds(ns),
                                        [this]{ return cancelled_; });
    return cancelled ? HalResult::CANCELLED : HalResult::OK;
  }

  void delayUs(uint32_t us) override{
    const Clock::time_point until = Clock::now() + std::chrono::microseconds(us);
    while(Clock::now() < until){}
  }

  void yield() override{
    std::this_thread::yield();
  }

  /** Abort the current and all later sleeps until reset() */
  void cancel(){
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  void reset(){
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = false;
  }

private:
  const Clock::time_point start_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_ = false;
};

} // namespace panelscan::hal::host

#endif // PANELSCAN_SRC_HAL_HOST_HAL_TIMER_HPP_
