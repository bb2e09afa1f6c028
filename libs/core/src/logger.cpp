#include "gentrade/core/logger.h"

#include "gentrade/core/json.h"
#include "gentrade/core/time.h"

#include <iostream>
#include <kj/debug.h>

namespace gentrade::core {

namespace {

constexpr kj::StringPtr kLevelNames[] = {"TRACE"_kj, "DEBUG"_kj, "INFO"_kj,    "WARN"_kj,
                                         "ERROR"_kj, "CRITICAL"_kj, "OFF"_kj};

thread_local kj::String t_correlation_id;

bool equals_ignoring_case(kj::StringPtr a, kj::StringPtr b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    char c = a[i] >= 'A' && a[i] <= 'Z' ? static_cast<char>(a[i] - 'A' + 'a') : a[i];
    char d = b[i] >= 'A' && b[i] <= 'Z' ? static_cast<char>(b[i] - 'A' + 'a') : b[i];
    if (c != d) {
      return false;
    }
  }
  return true;
}

// worker.log -> worker.3.log; names without an extension get the index appended
kj::Path backup_path(const kj::Path& path, size_t index) {
  kj::StringPtr name = path.basename()[0];
  KJ_IF_SOME(dot, name.findLast('.')) {
    if (dot > 0) {
      return path.parent().append(kj::str(name.slice(0, dot), ".", index, name.slice(dot)));
    }
  }
  return path.parent().append(kj::str(name, ".", index));
}

} // namespace

kj::StringPtr to_string(LogLevel level) {
  auto index = static_cast<size_t>(level);
  return index < kj::size(kLevelNames) ? kLevelNames[index] : "UNKNOWN"_kj;
}

kj::Maybe<LogLevel> parse_log_level(kj::StringPtr name) {
  if (equals_ignoring_case(name, "warning"_kj)) {
    return LogLevel::Warn;
  }
  for (size_t i = 0; i < kj::size(kLevelNames); ++i) {
    if (equals_ignoring_case(name, kLevelNames[i])) {
      return static_cast<LogLevel>(i);
    }
  }
  return kj::none;
}

CorrelationScope::CorrelationScope(kj::StringPtr correlation_id)
    : previous_(kj::mv(t_correlation_id)) {
  t_correlation_id = kj::str(correlation_id);
}

CorrelationScope::~CorrelationScope() noexcept {
  t_correlation_id = kj::mv(previous_);
}

kj::StringPtr CorrelationScope::current() {
  return t_correlation_id.size() == 0 ? ""_kj : t_correlation_id.asPtr();
}

kj::String TextFormatter::format(const LogEntry& entry) const {
  auto correlation =
      entry.correlation_id.size() > 0 ? kj::str(" [", entry.correlation_id, "]") : kj::str();
  auto location = include_function_ ? kj::str(entry.file, ":", entry.line, " ", entry.function)
                                    : kj::str(entry.file, ":", entry.line);
  return kj::str(entry.timestamp, " [", to_string(entry.level), "]", correlation, " ", location,
                 " - ", entry.message);
}

kj::String JsonFormatter::format(const LogEntry& entry) const {
  auto builder = JsonBuilder::object();
  builder.put("timestamp"_kj, entry.timestamp.asPtr())
      .put("level"_kj, to_string(entry.level))
      .put("file"_kj, entry.file.asPtr())
      .put("line"_kj, static_cast<int>(entry.line))
      .put("function"_kj, entry.function.asPtr());
  if (entry.correlation_id.size() > 0) {
    builder.put("correlation_id"_kj, entry.correlation_id.asPtr());
  }
  builder.put("message"_kj, entry.message.asPtr());
  return builder.build();
}

void ConsoleOutput::write(kj::StringPtr formatted, const LogEntry& entry) {
  auto& out = entry.level >= LogLevel::Error ? std::cerr : std::cout;
  out.write(formatted.begin(), static_cast<std::streamsize>(formatted.size()));
  out << '\n';
}

void ConsoleOutput::flush() {
  std::cout.flush();
  std::cerr.flush();
}

FileOutput::FileOutput(const kj::Path& path, size_t max_size, size_t max_files)
    : path_(path.clone()), max_size_(max_size), max_files_(max_files) {
  auto lock = state_.lockExclusive();
  open(*lock, std::ios::out | std::ios::app);
  lock->stream.seekp(0, std::ios::end);
  lock->written = static_cast<size_t>(lock->stream.tellp());
}

void FileOutput::open(State& state, std::ios::openmode mode) {
  auto native = path_.toString(true);
  state.stream.open(native.cStr(), mode);
  KJ_REQUIRE(state.stream.is_open(), "cannot open log file", native);
}

void FileOutput::write(kj::StringPtr formatted, const LogEntry&) {
  auto lock = state_.lockExclusive();
  lock->stream.write(formatted.begin(), static_cast<std::streamsize>(formatted.size()));
  lock->stream << '\n';
  lock->written += formatted.size() + 1;
  if (max_size_ > 0 && lock->written >= max_size_) {
    rotate(*lock);
  }
}

void FileOutput::flush() {
  state_.lockExclusive()->stream.flush();
}

void FileOutput::rotate(State& state) {
  state.stream.close();
  auto fs = kj::newDiskFilesystem();
  auto& root = fs->getRoot();

  if (max_files_ == 0) {
    root.tryRemove(path_);
  } else {
    root.tryRemove(backup_path(path_, max_files_));
    for (size_t index = max_files_; index > 1; --index) {
      auto older = backup_path(path_, index - 1);
      if (root.exists(older)) {
        root.transfer(backup_path(path_, index), kj::WriteMode::CREATE_OR_MODIFY, older,
                      kj::TransferMode::MOVE);
      }
    }
    if (root.exists(path_)) {
      root.transfer(backup_path(path_, 1), kj::WriteMode::CREATE_OR_MODIFY, path_,
                    kj::TransferMode::MOVE);
    }
  }
  open(state, std::ios::out | std::ios::trunc);
  state.written = 0;
}

Logger::Logger(kj::Own<LogFormatter> formatter, kj::Own<LogOutput> output) {
  auto lock = state_.lockExclusive();
  lock->formatter = kj::mv(formatter);
  lock->outputs.add(kj::mv(output));
}

void Logger::set_level(LogLevel level) {
  state_.lockExclusive()->level = level;
}

bool Logger::enabled(LogLevel level) const {
  auto current = state_.lockShared()->level;
  return current != LogLevel::Off && level >= current;
}

void Logger::set_formatter(kj::Own<LogFormatter> formatter) {
  state_.lockExclusive()->formatter = kj::mv(formatter);
}

void Logger::add_output(kj::Own<LogOutput> output) {
  state_.lockExclusive()->outputs.add(kj::mv(output));
}

void Logger::log(LogLevel level, kj::StringPtr message, const std::source_location& location) {
  auto lock = state_.lockExclusive();
  if (lock->level == LogLevel::Off || level < lock->level) {
    return;
  }

  kj::StringPtr file = location.file_name();
  KJ_IF_SOME(slash, file.findLast('/')) {
    file = file.slice(slash + 1);
  }
  LogEntry entry{.level = level,
                 .timestamp = now_utc_iso8601(),
                 .file = kj::str(file),
                 .line = static_cast<int_least32_t>(location.line()),
                 .function = kj::str(location.function_name()),
                 .message = kj::str(message),
                 .correlation_id = kj::str(CorrelationScope::current())};

  auto formatted = lock->formatter->format(entry);
  for (auto& output : lock->outputs) {
    output->write(formatted, entry);
  }
}

void Logger::flush() {
  auto lock = state_.lockExclusive();
  for (auto& output : lock->outputs) {
    output->flush();
  }
}

Logger& global_logger() {
  static Logger logger;
  return logger;
}

} // namespace gentrade::core
