/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for zia (loghelper-compatible interface).
 * Provides ZIA_LOG_DEBUG, ZIA_LOG_INFO, ZIA_LOG_WARN, ZIA_LOG_ERROR macros.
 */

#ifndef ZIA_LOG_HPP_
#define ZIA_LOG_HPP_

#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace zia {

class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

  static void log(Level level, const std::string& msg) {
    if (!enabled(level))
      return;

    const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};
    char ts[32];
    std::time_t t = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);

    std::lock_guard<std::mutex> lock(mutex());
    std::cerr << ts << " " << prefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

  static bool enabled(Level level) {
    return static_cast<int>(level) >= min_level().load(std::memory_order_relaxed);
  }

  static void set_level(Level level) { min_level().store(static_cast<int>(level), std::memory_order_relaxed); }

  static Level level() { return static_cast<Level>(min_level().load(std::memory_order_relaxed)); }

  // Accepts "debug", "info", "warn" / "warning" and "error".
  static bool parse_level(std::string_view name, Level& out) {
    if (name == "debug" || name == "trace") {
      out = Level::kDebug;
    } else if (name == "info") {
      out = Level::kInfo;
    } else if (name == "warn" || name == "warning") {
      out = Level::kWarn;
    } else if (name == "error") {
      out = Level::kError;
    } else {
      return false;
    }
    return true;
  }

 private:
  static std::atomic<int>& min_level() {
    static std::atomic<int> level{static_cast<int>(Level::kInfo)};
    return level;
  }

  static std::mutex& mutex() {
    static std::mutex m;
    return m;
  }
};

#define ZIA_LOG_DEBUG(msg)                                          \
  do {                                                              \
    if (::zia::Logger::enabled(::zia::Logger::Level::kDebug))       \
      ::zia::Logger::log(::zia::Logger::Level::kDebug, msg);        \
  } while (0)
#define ZIA_LOG_INFO(msg) ::zia::Logger::log(::zia::Logger::Level::kInfo, msg)
#define ZIA_LOG_WARN(msg) ::zia::Logger::log(::zia::Logger::Level::kWarn, msg)
#define ZIA_LOG_ERROR(msg) ::zia::Logger::log(::zia::Logger::Level::kError, msg)

}  // namespace zia

#endif  // ZIA_LOG_HPP_
