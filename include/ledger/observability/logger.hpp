#ifndef LEDGER_LOGGER_HPP_
#define LEDGER_LOGGER_HPP_

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>

namespace ledger {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

/**
 * Parses "debug", "info", "warn", "error" or "fatal" (any case).
 * Unknown names map to INFO.
 */
LogLevel parseLogLevel(const std::string& name);

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe; the component is normally the calling function.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  // Set output stream (default: std::cerr)
  void setOutputStream(std::ostream& stream);

  void debug(const std::string& message, const std::string& component = "");
  void info(const std::string& message, const std::string& component = "");
  void warn(const std::string& message, const std::string& component = "");
  void error(const std::string& message, const std::string& component = "");
  void fatal(const std::string& message, const std::string& component = "");

  // Structured logging with key-value pairs, emitted on destruction
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "");

    ~LogBuilder();

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, size_t value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, bool value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    std::unordered_map<std::string, std::string> fields_;
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const std::unordered_map<std::string, std::string>& fields = {});

  std::string levelToString(LogLevel level) const;
  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

#define LEDGER_LOG_DEBUG(msg) ledger::observability::Logger::getInstance().debug(msg, __func__)
#define LEDGER_LOG_INFO(msg) ledger::observability::Logger::getInstance().info(msg, __func__)
#define LEDGER_LOG_WARN(msg) ledger::observability::Logger::getInstance().warn(msg, __func__)
#define LEDGER_LOG_ERROR(msg) ledger::observability::Logger::getInstance().error(msg, __func__)
#define LEDGER_LOG_FATAL(msg) ledger::observability::Logger::getInstance().fatal(msg, __func__)

#define LEDGER_LOG_BUILDER(level, msg) \
  ledger::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace ledger

#endif  // LEDGER_LOGGER_HPP_
