#pragma once

#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <string>

// Logging (thread-safe, stderr, level-tagged)

namespace railwatch::core::log {

enum class Level { INFO, WARN, ERROR };

namespace detail {

inline std::mutex& log_mutex() {
  static std::mutex m;
  return m;
}

inline void write(Level level, const std::string& msg) {
  const char* tag = "";
  switch (level) {
    case Level::INFO:  tag = "INFO "; break;
    case Level::WARN:  tag = "WARN "; break;
    case Level::ERROR: tag = "ERROR"; break;
  }

  const auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()) % 1000;

  std::tm tm_buf;
  ::localtime_r(&time, &tm_buf);

  char time_buf[16];
  std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

  const auto formatted = std::format("{}.{:03d} [{}] railwatch: {}\n",
      time_buf, static_cast<int>(ms.count()), tag, msg);

  std::lock_guard<std::mutex> lock(log_mutex());
  std::cerr << formatted;
}

}  // namespace detail

inline void info(const std::string& msg) { detail::write(Level::INFO, msg); }
inline void warn(const std::string& msg) { detail::write(Level::WARN, msg); }
inline void error(const std::string& msg) { detail::write(Level::ERROR, msg); }

}  // namespace railwatch::core::log
