/*****************************************************************
 * File:      LockedDisplay.hpp
 * Category:  include/panelscan/Display
 *
 * Purpose:
 *    Share one display between tasks. Access goes through a
 *    Guard that holds the mutex for one logically atomic
 *    operation: a refresh pass, or a draw-then-swap sequence.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_DISPLAY_LOCKED_DISPLAY_HPP_
#define PANELSCAN_INCLUDE_DISPLAY_LOCKED_DISPLAY_HPP_

#include "panelscan/HAL/IHalMutex.hpp"

namespace panelscan{

template<typename DisplayT>
class LockedDisplay{
public:
  class Guard{
  public:
    Guard(Guard&& other) noexcept
      : display_(other.display_)
      , mutex_(other.mutex_)
    {
      other.display_ = nullptr;
      other.mutex_ = nullptr;
    }

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    Guard& operator=(Guard&&) = delete;

    ~Guard(){
      if(mutex_) mutex_->unlock();
    }

    /** False when a tryLock() timed out */
    bool owns() const{ return display_ != nullptr; }
    explicit operator bool() const{ return owns(); }

    DisplayT* operator->() const{ return display_; }
    DisplayT& operator*() const{ return *display_; }

  private:
    friend class LockedDisplay;

    Guard(DisplayT* display, hal::IHalMutex* mutex)
      : display_(display)
      , mutex_(mutex)
    {}

    DisplayT* display_;
    hal::IHalMutex* mutex_;
  };

  LockedDisplay(DisplayT& display, hal::IHalMutex& mutex)
    : display_(display)
    , mutex_(mutex)
  {}

  /** Block until the display is ours */
  Guard lock(){
    mutex_.lock();
    return Guard(&display_, &mutex_);
  }

  /** Wait at most timeout_ms; check owns() on the result */
  Guard tryLock(uint32_t timeout_ms){
    if(mutex_.tryLock(timeout_ms)){
      return Guard(&display_, &mutex_);
    }
    return Guard(nullptr, nullptr);
  }

private:
  DisplayT& display_;
  hal::IHalMutex& mutex_;
};

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_DISPLAY_LOCKED_DISPLAY_HPP_
