/*****************************************************************
 * File:      BufferPair.hpp
 * Category:  include/panelscan/Display
 *
 * Purpose:
 *    Front/back frame buffers for flicker-free updates, plus a
 *    parking slot. The scan engine reads the front buffer,
 *    drawing goes to the back buffer, and swap() publishes it.
 *
 * Notes:
 *    A swap requested while a refresh pass is running parks the
 *    back buffer as pending and hands drawing the third buffer,
 *    so a drawer that carries on never writes into the frame
 *    beginScan() is about to show. beginScan() promotes the
 *    pending buffer at the start of the next pass. A second
 *    deferred swap replaces the parked frame.
 *    All three buffers stay allocated in single-buffer mode,
 *    where back() and front() are the same buffer and swap()
 *    does nothing.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_DISPLAY_BUFFER_PAIR_HPP_
#define PANELSCAN_INCLUDE_DISPLAY_BUFFER_PAIR_HPP_

#include "panelscan/Display/FrameBuffer.hpp"

#include <atomic>

namespace panelscan{

template<int WIDTH, int HEIGHT>
class BufferPair{
public:
  using Buffer = FrameBuffer<WIDTH, HEIGHT>;

  explicit BufferPair(bool double_buffered = true)
    : state_(INITIAL_STATE)
    , doubleBuffered_(double_buffered)
  {}

  BufferPair(const BufferPair&) = delete;
  BufferPair& operator=(const BufferPair&) = delete;

  /** Buffer the engine scans */
  const Buffer& front() const{
    return buffers_[frontIndex()];
  }

  /** Buffer that receives drawing */
  Buffer& back(){
    return buffers_[backIndex()];
  }

  const Buffer& back() const{
    return buffers_[backIndex()];
  }

  /** Publish the back buffer
   * @return true if it is the front buffer now, false if it was
   *         parked for the next beginScan() or ignored in
   *         single-buffer mode
   */
  bool swap(){
    if(!doubleBuffered_.load(std::memory_order_acquire)) return false;

    uint8_t cur = state_.load(std::memory_order_acquire);
    for(;;){
      const int f = frontOf(cur);
      const int b = backOf(cur);
      uint8_t next;
      if(cur & SCANNING_BIT){
        // Park the finished frame, keep drawing in the free slot
        next = pack(f, thirdOf(f, b), SCANNING_BIT | PENDING_BIT);
      }else{
        next = pack(b, f, 0);
      }
      if(state_.compare_exchange_weak(cur, next, std::memory_order_acq_rel)){
        return (cur & SCANNING_BIT) == 0;
      }
    }
  }

  /** Mark a refresh pass as started, promoting any pending buffer
   * @return The buffer to scan for this pass
   */
  const Buffer& beginScan(){
    uint8_t cur = state_.load(std::memory_order_acquire);
    for(;;){
      int f = frontOf(cur);
      const int b = backOf(cur);
      if(cur & PENDING_BIT){
        f = thirdOf(f, b);
      }
      const uint8_t next = pack(f, b, SCANNING_BIT);
      if(state_.compare_exchange_weak(cur, next, std::memory_order_acq_rel)){
        return buffers_[f];
      }
    }
  }

  void endScan(){
    state_.fetch_and(static_cast<uint8_t>(~SCANNING_BIT), std::memory_order_acq_rel);
  }

  bool isScanning() const{
    return (state_.load(std::memory_order_acquire) & SCANNING_BIT) != 0;
  }

  bool swapPending() const{
    return (state_.load(std::memory_order_acquire) & PENDING_BIT) != 0;
  }

  bool isDoubleBuffered() const{
    return doubleBuffered_.load(std::memory_order_acquire);
  }

  /** Switch buffering mode. Entering double-buffer mode seeds the
   *  back buffer with the current front image. Leaving it drops a
   *  pending swap.
   */
  void setDoubleBuffered(bool enabled){
    if(enabled == doubleBuffered_.load(std::memory_order_acquire)) return;
    if(enabled){
      buffers_[backIndex(true)].copyFrom(buffers_[frontIndex()]);
    }else{
      state_.fetch_and(static_cast<uint8_t>(~PENDING_BIT), std::memory_order_acq_rel);
    }
    doubleBuffered_.store(enabled, std::memory_order_release);
  }

  /** Clear every buffer */
  void clearAll(const RGB& color = RGB::Black()){
    for(Buffer& buffer : buffers_){
      buffer.fill(color);
    }
  }

private:
  // state_ layout: bits 0-1 front index, bits 2-3 back index, flags above.
  // The slot that is neither front nor back is pending when PENDING_BIT
  // is set, spare otherwise.
  static constexpr uint8_t INDEX_MASK = 0x03;
  static constexpr uint8_t BACK_SHIFT = 2;
  static constexpr uint8_t PENDING_BIT = 0x10;
  static constexpr uint8_t SCANNING_BIT = 0x20;
  static constexpr uint8_t INITIAL_STATE = 1 << BACK_SHIFT;

  static int frontOf(uint8_t state){ return state & INDEX_MASK; }
  static int backOf(uint8_t state){ return (state >> BACK_SHIFT) & INDEX_MASK; }
  static int thirdOf(int a, int b){ return 3 - a - b; }

  static uint8_t pack(int front, int back, uint8_t flags){
    return static_cast<uint8_t>(front | (back << BACK_SHIFT) | flags);
  }

  int frontIndex() const{
    return frontOf(state_.load(std::memory_order_acquire));
  }

  int backIndex(bool double_buffered) const{
    const uint8_t cur = state_.load(std::memory_order_acquire);
    return double_buffered ? backOf(cur) : frontOf(cur);
  }

  int backIndex() const{
    return backIndex(doubleBuffered_.load(std::memory_order_acquire));
  }

  Buffer buffers_[3];
  std::atomic<uint8_t> state_;
  std::atomic<bool> doubleBuffered_;
};

} // namespace panelscan

#endif // PANELSCAN_INCLUDE_DISPLAY_BUFFER_PAIR_HPP_
