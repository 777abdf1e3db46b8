/*****************************************************************
 * File:      Esp32HalLog.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    ESP32 implementation of the HAL logging interface on top
 *    of the ESP-IDF log component.
 *****************************************************************/

#ifndef PANELSCAN_SRC_HAL_ESP32_HAL_LOG_HPP_
#define PANELSCAN_SRC_HAL_ESP32_HAL_LOG_HPP_

#include "panelscan/HAL/IHalLog.hpp"

#include "esp_log.h"
#include "esp_timer.h"

#include <stdarg.h>
#include <stdio.h>

namespace panelscan::hal::esp32{

/** ESP-IDF Logger Implementation */
class Esp32HalLog : public IHalLog{
private:
  static constexpr size_t LOG_BUFFER_SIZE = 256;

  LogLevel level_ = LogLevel::INFO;
  char buffer_[LOG_BUFFER_SIZE];
  bool initialized_ = false;

  static esp_log_level_t toEspLevel(LogLevel lvl){
    switch(lvl){
      case LogLevel::ERROR:   return ESP_LOG_ERROR;
      case LogLevel::WARN:    return ESP_LOG_WARN;
      case LogLevel::INFO:    return ESP_LOG_INFO;
      case LogLevel::DEBUG:   return ESP_LOG_DEBUG;
      case LogLevel::VERBOSE: return ESP_LOG_VERBOSE;
      default:                return ESP_LOG_NONE;
    }
  }

  void printLog(LogLevel lvl, const char* tag, const char* format, va_list args){
    if(lvl > level_ || !initialized_) return;

    unsigned long ms = static_cast<unsigned long>(esp_timer_get_time() / 1000);
    int len = snprintf(buffer_, LOG_BUFFER_SIZE, "[%c][%lu][%s] ",
                       logLevelChar(lvl), ms, tag);

    if(len > 0 && len < (int)LOG_BUFFER_SIZE - 1){
      vsnprintf(buffer_ + len, LOG_BUFFER_SIZE - len, format, args);
    }

    esp_log_write(toEspLevel(lvl), tag, "%s\n", buffer_);
  }

public:
  Esp32HalLog() = default;

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

  void flush() override{}
};

} // namespace panelscan::hal::esp32

#endif // PANELSCAN_SRC_HAL_ESP32_HAL_LOG_HPP_
