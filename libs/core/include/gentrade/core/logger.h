/**
 * @file logger.h
 * @brief Logging for gentrade services
 *
 * Thread-safe logger with a pluggable formatter and any number of outputs.
 * Every entry carries the correlation id of the thread that produced it, so
 * log lines emitted while a worker runs a job can be grouped by job.
 */

#pragma once

#include <cstdint>
#include <fstream>
#include <kj/common.h>
#include <kj/filesystem.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>
#include <source_location>

namespace gentrade::core {

enum class LogLevel : std::uint8_t {
  Trace = 0,
  Debug = 1,
  Info = 2,
  Warn = 3,
  Error = 4,
  Critical = 5,
  Off = 6,
};

[[nodiscard]] kj::StringPtr to_string(LogLevel level);

/**
 * @brief Parse a level name (case-insensitive: "trace", "INFO", "warning", ...)
 */
[[nodiscard]] kj::Maybe<LogLevel> parse_log_level(kj::StringPtr name);

struct LogEntry {
  LogLevel level;
  kj::String timestamp; // UTC, ISO 8601
  kj::String file;
  int_least32_t line;
  kj::String function;
  kj::String message;
  kj::String correlation_id; // empty when no CorrelationScope is active
};

/**
 * @brief RAII tag attached to every log entry produced on this thread
 *
 * Scopes nest; the previous id is restored when the scope ends.
 */
class CorrelationScope final {
public:
  explicit CorrelationScope(kj::StringPtr correlation_id);
  ~CorrelationScope() noexcept;

  KJ_DISALLOW_COPY_AND_MOVE(CorrelationScope);

  // Correlation id active on the calling thread, empty if none
  [[nodiscard]] static kj::StringPtr current();

private:
  kj::String previous_;
};

class LogFormatter {
public:
  virtual ~LogFormatter() = default;
  [[nodiscard]] virtual kj::String format(const LogEntry& entry) const = 0;
};

/**
 * @brief Human-readable formatter
 *
 * Format: <timestamp> [LEVEL] [correlation] file:line - message
 */
class TextFormatter final : public LogFormatter {
public:
  explicit TextFormatter(bool include_function = false) : include_function_(include_function) {}

  [[nodiscard]] kj::String format(const LogEntry& entry) const override;

private:
  bool include_function_;
};

/**
 * @brief One JSON object per line
 *
 * Fields: timestamp, level, file, line, function, correlation_id, message
 */
class JsonFormatter final : public LogFormatter {
public:
  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
};

class LogOutput {
public:
  virtual ~LogOutput() = default;
  virtual void write(kj::StringPtr formatted, const LogEntry& entry) = 0;
  virtual void flush() = 0;
};

/**
 * @brief stdout output; Error and Critical go to stderr
 */
class ConsoleOutput final : public LogOutput {
public:
  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;
};

/**
 * @brief Append-only file output with size-based rotation
 *
 * Once the file reaches `max_size` bytes it becomes `<stem>.1<ext>`, older
 * backups move up by one and the one past `max_files` is deleted.
 */
class FileOutput final : public LogOutput {
public:
  explicit FileOutput(const kj::Path& path, size_t max_size = 10 * 1024 * 1024,
                      size_t max_files = 5);

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;

private:
  struct State {
    std::ofstream stream;
    size_t written{0};
  };

  void rotate(State& state);
  void open(State& state, std::ios::openmode mode);

  const kj::Path path_;
  const size_t max_size_;
  const size_t max_files_;
  kj::MutexGuarded<State> state_;
};

/**
 * @brief Thread-safe logger
 *
 * Messages are plain strings; build them with kj::str(...) at the call site.
 */
class Logger final {
public:
  explicit Logger(kj::Own<LogFormatter> formatter = kj::heap<TextFormatter>(),
                  kj::Own<LogOutput> output = kj::heap<ConsoleOutput>());

  void set_level(LogLevel level);
  [[nodiscard]] bool enabled(LogLevel level) const;

  void set_formatter(kj::Own<LogFormatter> formatter);
  void add_output(kj::Own<LogOutput> output);

  void log(LogLevel level, kj::StringPtr message,
           const std::source_location& location = std::source_location::current());

  void debug(kj::StringPtr message,
             const std::source_location& location = std::source_location::current()) {
    log(LogLevel::Debug, message, location);
  }
  void info(kj::StringPtr message,
            const std::source_location& location = std::source_location::current()) {
    log(LogLevel::Info, message, location);
  }
  void warn(kj::StringPtr message,
            const std::source_location& location = std::source_location::current()) {
    log(LogLevel::Warn, message, location);
  }
  void error(kj::StringPtr message,
             const std::source_location& location = std::source_location::current()) {
    log(LogLevel::Error, message, location);
  }
  void critical(kj::StringPtr message,
                const std::source_location& location = std::source_location::current()) {
    log(LogLevel::Critical, message, location);
  }

  void flush();

private:
  struct State {
    kj::Own<LogFormatter> formatter;
    kj::Vector<kj::Own<LogOutput>> outputs;
    LogLevel level{LogLevel::Info};
  };

  kj::MutexGuarded<State> state_;
};

/**
 * @brief Process-wide logger, created on first use with a text console output
 */
[[nodiscard]] Logger& global_logger();

} // namespace gentrade::core
