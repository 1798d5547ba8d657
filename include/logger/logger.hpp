#pragma once

#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel {
  LEVEL_DEBUG = 0,
  LEVEL_INFO = 1,
  LEVEL_WARNING = 2,
  LEVEL_ERROR = 3,
  LEVEL_CRITICAL = 4
};

// Accepts "debug", "info", "warning"/"warn", "error", "critical" (any case).
// Throws std::invalid_argument for anything else.
LogLevel parse_log_level(const std::string &name);

// Receives every formatted line instead of stdout/stderr when installed.
using LogSink = std::function<void(LogLevel level, const std::string &line)>;

class Logger {
public:
  explicit Logger(const std::string &context = "");

  static void set_global_level(LogLevel level);
  static LogLevel get_global_level();

  void set_level(LogLevel level);
  LogLevel get_level() const;

  static void enable_timestamps(bool enable);
  static void enable_colors(bool enable);

  // Pass an empty function to restore console output
  static void set_sink(LogSink sink);

  class LogStream {
  public:
    LogStream(Logger &logger, LogLevel level);
    ~LogStream();

    template <typename T> LogStream &operator<<(const T &value) {
      if (should_log_) {
        stream_ << value;
      }
      return *this;
    }

    LogStream &operator<<(std::ostream &(*manip)(std::ostream &)) {
      if (should_log_) {
        stream_ << manip;
      }
      return *this;
    }

  private:
    Logger &logger_;
    LogLevel level_;
    bool should_log_;
    std::ostringstream stream_;
  };

  LogStream debug();
  LogStream info();
  LogStream warning();
  LogStream error();
  LogStream critical();

  void log(LogLevel level, const std::string &message);

  // "==================== title ====================" at info level
  void separator(const std::string &title = "");

  const std::string &context() const { return context_; }

private:
  std::string context_;
  LogLevel instance_level_;

  static LogLevel global_level_;
  static bool timestamps_enabled_;
  static bool colors_enabled_;
  static LogSink sink_;
  static std::mutex mutex_;

  bool should_log(LogLevel level) const;
  std::string get_timestamp() const;
  std::string get_level_string(LogLevel level) const;
  std::string get_level_color(LogLevel level) const;
  void write_log(LogLevel level, const std::string &message);

  friend class LogStream;
};
