/*****************************************************************
 * File:      CancelToken.hpp
 * Category:  include/panelscan/Scan
 *
 * Purpose:
 *    Cross-task stop request for a refresh pass or loop.
 *    Checked by the scan engine at every bitplane hold.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_SCAN_CANCEL_TOKEN_HPP_
#define PANELSCAN_INCLUDE_SCAN_CANCEL_TOKEN_HPP_

#include <atomic>

namespace panelscan{

class CancelToken{
public:
  CancelToken() : cancelled_(false){}

  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  void cancel(){ cancelled_.store(true, std::memory_order_release); }
  void reset(){ cancelled_.store(false, std::memory_order_release); }

  bool isCancelled() const{
    return cancelled_.load(std::memory_order_acquire);
  }

private:
  std::atomic<bool> cancelled_;
};

/** Null-safe check */
inline bool isCancelled(const CancelToken* token){
  return token != nullptr && token->isCancelled();
}

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_SCAN_CANCEL_TOKEN_HPP_
