/*****************************************************************
 * File:      IHalLog.hpp
 * Category:  include/panelscan/HAL
 *
 * Purpose:
 *    Logging Hardware Abstraction Layer interface.
 *    Provides platform-independent tagged logging for the
 *    HAL backends and the panel driver.
 *****************************************************************/

#ifndef PANELSCAN_INCLUDE_HAL_IHAL_LOG_HPP_
#define PANELSCAN_INCLUDE_HAL_IHAL_LOG_HPP_

#include "HalTypes.hpp"

namespace panelscan::hal{

// ============================================================
// Log Levels
// ============================================================

/** Log severity levels */
enum class LogLevel : uint8_t{
  NONE = 0,     // No logging
  ERROR = 1,    // Errors only
  WARN = 2,     // Warnings and errors
  INFO = 3,     // Info, warnings, errors
  DEBUG = 4,    // Debug and above
  VERBOSE = 5   // All messages
};

// ============================================================
// Log Interface
// ============================================================

/** Logging Hardware Abstraction Interface
 *
 * Implementations can output to a console, ESP-IDF log, file, etc.
 */
class IHalLog{
public:
  virtual ~IHalLog() = default;

  /** Initialize logging system
   * @param level Minimum log level to output
   * @return HalResult::OK on success
   */
  virtual HalResult init(LogLevel level = LogLevel::INFO) = 0;

  /** Set log level */
  virtual void setLevel(LogLevel level) = 0;

  /** Get current log level */
  virtual LogLevel getLevel() const = 0;

  /** Log error message
   * @param tag Module tag
   * @param format Printf-style format string
   */
  virtual void error(const char* tag, const char* format, ...) = 0;

  /** Log warning message */
  virtual void warn(const char* tag, const char* format, ...) = 0;

  /** Log info message */
  virtual void info(const char* tag, const char* format, ...) = 0;

  /** Log debug message */
  virtual void debug(const char* tag, const char* format, ...) = 0;

  /** Log verbose message */
  virtual void verbose(const char* tag, const char* format, ...) = 0;

  /** Log HalResult with context
   * @param result Result code to log
   * @param tag Module tag
   * @param operation Description of operation
   */
  virtual void logResult(HalResult result, const char* tag, const char* operation) = 0;

  /** Flush log buffer (if buffered) */
  virtual void flush() = 0;
};

/** Process-wide logger used by the PANELSCAN_LOG_* macros.
 *  Null until the application installs one.
 */
extern IHalLog* g_hal_log;

/** Convert LogLevel to string */
inline const char* logLevelToString(LogLevel level){
  switch(level){
    case LogLevel::NONE:    return "NONE";
    case LogLevel::ERROR:   return "ERROR";
    case LogLevel::WARN:    return "WARN";
    case LogLevel::INFO:    return "INFO";
    case LogLevel::DEBUG:   return "DEBUG";
    case LogLevel::VERBOSE: return "VERBOSE";
    default:                return "UNKNOWN";
  }
}

/** Get log level prefix character */
inline char logLevelChar(LogLevel level){
  switch(level){
    case LogLevel::ERROR:   return 'E';
    case LogLevel::WARN:    return 'W';
    case LogLevel::INFO:    return 'I';
    case LogLevel::DEBUG:   return 'D';
    case LogLevel::VERBOSE: return 'V';
    default:                return '?';
  }
}

} // namespace panelscan::hal

// ============================================================
// Logging Macros
// ============================================================

// Route through an explicit logger pointer when a component was
// handed one, otherwise through the global g_hal_log.
// Define PANELSCAN_LOG_ENABLED=0 to compile all logging out.

#ifndef PANELSCAN_LOG_ENABLED
#define PANELSCAN_LOG_ENABLED 1
#endif

#if PANELSCAN_LOG_ENABLED

#define PANELSCAN_LOGGER(log) \
  ((log) ? (log) : ::panelscan::hal::g_hal_log)

#define PANELSCAN_LOG_E(log, tag, fmt, ...) \
  do{ if(auto* l_ = PANELSCAN_LOGGER(log)) l_->error(tag, fmt, ##__VA_ARGS__); }while(0)

#define PANELSCAN_LOG_W(log, tag, fmt, ...) \
  do{ if(auto* l_ = PANELSCAN_LOGGER(log)) l_->warn(tag, fmt, ##__VA_ARGS__); }while(0)

#define PANELSCAN_LOG_I(log, tag, fmt, ...) \
  do{ if(auto* l_ = PANELSCAN_LOGGER(log)) l_->info(tag, fmt, ##__VA_ARGS__); }while(0)

#define PANELSCAN_LOG_D(log, tag, fmt, ...) \
  do{ if(auto* l_ = PANELSCAN_LOGGER(log)) l_->debug(tag, fmt, ##__VA_ARGS__); }while(0)

#define PANELSCAN_LOG_V(log, tag, fmt, ...) \
  do{ if(auto* l_ = PANELSCAN_LOGGER(log)) l_->verbose(tag, fmt, ##__VA_ARGS__); }while(0)

#define PANELSCAN_LOG_RESULT(log, result, tag, op) \
  do{ if(auto* l_ = PANELSCAN_LOGGER(log)) l_->logResult(result, tag, op); }while(0)

#else

#define PANELSCAN_LOG_E(log, tag, fmt, ...) do{}while(0)
#define PANELSCAN_LOG_W(log, tag, fmt, ...) do{}while(0)
#define PANELSCAN_LOG_I(log, tag, fmt, ...) do{}while(0)
#define PANELSCAN_LOG_D(log, tag, fmt, ...) do{}while(0)
#define PANELSCAN_LOG_V(log, tag, fmt, ...) do{}while(0)
#define PANELSCAN_LOG_RESULT(log, result, tag, op) do{}while(0)

#endif

#endif // PANELSCAN_INCLUDE_HAL_IHAL_LOG_HPP_
