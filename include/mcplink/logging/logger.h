#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include "mcplink/logging/log_level.h"
#include "mcplink/logging/log_message.h"
#include "mcplink/logging/log_sink.h"

namespace mcplink {
namespace logging {

/**
 * Named logger writing through a shared sink.
 *
 * Messages use fmt syntax. The format string is checked at runtime so a
 * malformed pattern produces a log line describing the problem instead of
 * an exception escaping into the caller.
 */
class Logger {
 public:
  explicit Logger(const std::string& name) : name_(name) {}

  template <typename... Args>
  void debug(const char* fmt, const Args&... args) {
    log(LogLevel::Debug, nullptr, 0, nullptr, fmt, args...);
  }

  template <typename... Args>
  void info(const char* fmt, const Args&... args) {
    log(LogLevel::Info, nullptr, 0, nullptr, fmt, args...);
  }

  template <typename... Args>
  void warning(const char* fmt, const Args&... args) {
    log(LogLevel::Warning, nullptr, 0, nullptr, fmt, args...);
  }

  template <typename... Args>
  void error(const char* fmt, const Args&... args) {
    log(LogLevel::Error, nullptr, 0, nullptr, fmt, args...);
  }

  // Direct log with location
  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           const char* fmt,
           const Args&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg;
    msg.level = level;
    msg.message = formatMessage(fmt, args...);
    msg.logger_name = name_;
    msg.file = file;
    msg.line = line;
    msg.function = function;
    logMessage(msg);
  }

  // Pre-built record, used when the caller attaches connection context
  void logMessage(const LogMessage& msg) {
    std::shared_ptr<LogSink> sink = getSink();
    if (sink) {
      sink->log(msg);
    }
  }

  void setLevel(LogLevel level) {
    effective_level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const {
    return effective_level_.load(std::memory_order_relaxed);
  }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  std::shared_ptr<LogSink> getSink() const {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return sink_;
  }

  bool shouldLog(LogLevel level) const {
    LogLevel current = effective_level_.load(std::memory_order_relaxed);
    return current != LogLevel::Off && level >= current;
  }

  const std::string& getName() const { return name_; }

  void flush() {
    std::shared_ptr<LogSink> sink = getSink();
    if (sink) {
      sink->flush();
    }
  }

 private:
  template <typename... Args>
  static std::string formatMessage(const char* fmt, const Args&... args) {
    try {
      return fmt::vformat(fmt, fmt::make_format_args(args...));
    } catch (const fmt::format_error& e) {
      return fmt::format("[bad log format '{}': {}]", fmt, e.what());
    }
  }

  std::atomic<LogLevel> effective_level_{LogLevel::Info};
  std::shared_ptr<LogSink> sink_;
  std::string name_;
  mutable std::mutex sink_mutex_;
};

}  // namespace logging
}  // namespace mcplink
