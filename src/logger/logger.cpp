#include "logger/logger.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

LogLevel Logger::global_level_ = LogLevel::LEVEL_INFO;
bool Logger::timestamps_enabled_ = true;
bool Logger::colors_enabled_ = true;
LogSink Logger::sink_;
std::mutex Logger::mutex_;

LogLevel parse_log_level(const std::string &name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "debug")
    return LogLevel::LEVEL_DEBUG;
  if (lower == "info")
    return LogLevel::LEVEL_INFO;
  if (lower == "warning" || lower == "warn")
    return LogLevel::LEVEL_WARNING;
  if (lower == "error")
    return LogLevel::LEVEL_ERROR;
  if (lower == "critical")
    return LogLevel::LEVEL_CRITICAL;

  throw std::invalid_argument("Unknown log level: " + name);
}

Logger::Logger(const std::string &context)
    : context_(context), instance_level_(LogLevel::LEVEL_DEBUG) {}

void Logger::set_global_level(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;
}

LogLevel Logger::get_global_level() {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void Logger::set_level(LogLevel level) { instance_level_ = level; }

LogLevel Logger::get_level() const { return instance_level_; }

void Logger::enable_timestamps(bool enable) {
  std::lock_guard<std::mutex> lock(mutex_);
  timestamps_enabled_ = enable;
}

void Logger::enable_colors(bool enable) {
  std::lock_guard<std::mutex> lock(mutex_);
  colors_enabled_ = enable;
}

void Logger::set_sink(LogSink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
}

Logger::LogStream Logger::debug() {
  return LogStream(*this, LogLevel::LEVEL_DEBUG);
}

Logger::LogStream Logger::info() {
  return LogStream(*this, LogLevel::LEVEL_INFO);
}

Logger::LogStream Logger::warning() {
  return LogStream(*this, LogLevel::LEVEL_WARNING);
}

Logger::LogStream Logger::error() {
  return LogStream(*this, LogLevel::LEVEL_ERROR);
}

Logger::LogStream Logger::critical() {
  return LogStream(*this, LogLevel::LEVEL_CRITICAL);
}

void Logger::log(LogLevel level, const std::string &message) {
  if (should_log(level)) {
    write_log(level, message);
  }
}

void Logger::separator(const std::string &title) {
  const std::string bar(20, '=');
  if (title.empty()) {
    log(LogLevel::LEVEL_INFO, bar + bar + bar);
  } else {
    log(LogLevel::LEVEL_INFO, bar + " " + title + " " + bar);
  }
}

bool Logger::should_log(LogLevel level) const {
  return level >= instance_level_ && level >= get_global_level();
}

std::string Logger::get_timestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm local_tm{};
  localtime_r(&time_t, &local_tm);

  std::ostringstream oss;
  oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();

  return oss.str();
}

std::string Logger::get_level_string(LogLevel level) const {
  switch (level) {
  case LogLevel::LEVEL_DEBUG:
    return "DEBUG";
  case LogLevel::LEVEL_INFO:
    return "INFO";
  case LogLevel::LEVEL_WARNING:
    return "WARNING";
  case LogLevel::LEVEL_ERROR:
    return "ERROR";
  case LogLevel::LEVEL_CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::get_level_color(LogLevel level) const {
  switch (level) {
  case LogLevel::LEVEL_DEBUG:
    return "\033[36m"; // Cyan
  case LogLevel::LEVEL_INFO:
    return "\033[34m"; // Blue
  case LogLevel::LEVEL_WARNING:
    return "\033[33m"; // Yellow
  case LogLevel::LEVEL_ERROR:
    return "\033[31m"; // Red
  case LogLevel::LEVEL_CRITICAL:
    return "\033[1;31m"; // Bold Red
  default:
    return "\033[0m";
  }
}

void Logger::write_log(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::ostringstream line;

  if (timestamps_enabled_) {
    line << "[" << get_timestamp() << "] ";
  }

  line << "[" << std::setw(8) << std::left << get_level_string(level) << "] ";

  if (!context_.empty()) {
    line << "[" << context_ << "] ";
  }

  line << message;

  if (sink_) {
    sink_(level, line.str());
    return;
  }

  std::ostream &out = (level >= LogLevel::LEVEL_ERROR) ? std::cerr : std::cout;

  if (colors_enabled_) {
    out << get_level_color(level) << line.str() << "\033[0m" << std::endl;
  } else {
    out << line.str() << std::endl;
  }
}

Logger::LogStream::LogStream(Logger &logger, LogLevel level)
    : logger_(logger), level_(level), should_log_(logger.should_log(level)) {}

Logger::LogStream::~LogStream() {
  if (should_log_) {
    logger_.write_log(level_, stream_.str());
  }
}
