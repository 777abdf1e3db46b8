/*****************************************************************
 * File:      HostHalLog.hpp
 * Category:  src/HAL/Host
 *
 * Purpose:
 *    Desktop implementation of the HAL logging interface
 *    writing to stderr (or any FILE*).
 *****************************************************************/

#ifndef PANELSCAN_SRC_HAL_HOST_HAL_LOG_HPP_
#define PANELSCAN_SRC_HAL_HOST_HAL_LOG_HPP_

#include "panelscan/HAL/IHalLog.hpp"

#include <chrono>
#include <mutex>
#include <stdarg.h>
#include <stdio.h>

namespace panelscan::hal::host{

class HostHalLog : public IHalLog{
private:
  static constexpr size_t LOG_BUFFER_SIZE = 256;

  FILE* out_;
  LogLevel level_ = LogLevel::INFO;
  char buffer_[LOG_BUFFER_SIZE];
  bool initialized_ = false;
  std::mutex mutex_;
  uint32_t count_ = 0;
  const std::chrono::steady_clock::time_point start_;

  void printLog(LogLevel lvl, const char* tag, const char* format, va_list args){
    if(lvl > level_ || !initialized_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    unsigned long ms = static_cast<unsigned long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_).count());
    int len = snprintf(buffer_, LOG_BUFFER_SIZE, "[%c][%lu][%s] ",
                       logLevelChar(lvl), ms, tag);

    if(len > 0 && len < (int)LOG_BUFFER_SIZE - 1){
      vsnprintf(buffer_ + len, LOG_BUFFER_SIZE - len, format, args);
    }

    fprintf(out_, "%s\n", buffer_);
    count_++;
  }

public:
  explicit HostHalLog(FILE* out = stderr)
    : out_(out)
    , start_(std::chrono::steady_clock::now())
  {}

  HalResult init(LogLevel level = LogLevel::INFO) override{
    level_ = level;
    initialized_ = true;
    return HalResult::OK;
  }

  void setLevel(LogLevel level) override{
    level_ = level;
  }

  LogLevel getLevel() const override{
    return level_;
  }

  void error(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::ERROR, tag, format, args);
    va_end(args);
  }

  void warn(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::WARN, tag, format, args);
    va_end(args);
  }

  void info(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::INFO, tag, format, args);
    va_end(args);
  }

  void debug(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::DEBUG, tag, format, args);
    va_end(args);
  }

  void verbose(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::VERBOSE, tag, format, args);
    va_end(args);
  }

  void logResult(HalResult result, const char* tag, const char* operation) override{
    if(result == HalResult::OK){
      info(tag, "%s: OK", operation);
    }else{
      error(tag, "%s: FAILED (%s)", operation, halResultToString(result));
    }
  }

  void flush() override{
    fflush(out_);
  }

  /** Lines actually written (after level filtering) */
  uint32_t count() const{ return count_; }

  /** Last formatted line */
  const char* lastLine() const{ return buffer_; }
};

} // namespace panelscan::hal::host

#endif // PANELSCAN_SRC_HAL_HOST_HAL_LOG_HPP_
