#include "gentrade/exec/log_parser.h"

#include "gentrade/core/json.h"

#include <cstring>
#include <kj/debug.h>
#include <kj/vector.h>

namespace gentrade::exec {

namespace {

constexpr kj::StringPtr kDumpMarker = "dumping json to \""_kj;
constexpr size_t kMaxSummary = 500;

kj::ArrayPtr<const char> trim(kj::ArrayPtr<const char> text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && (text[begin] == ' ' || text[begin] == '\t')) {
    ++begin;
  }
  while (end > begin && (text[end - 1] == ' ' || text[end - 1] == '\t' || text[end - 1] == '\r')) {
    --end;
  }
  return text.slice(begin, end);
}

template <typename Func> void for_each_line(kj::StringPtr output, Func&& func) {
  kj::ArrayPtr<const char> rest = output;
  while (rest.size() > 0) {
    size_t eol = 0;
    while (eol < rest.size() && rest[eol] != '\n') {
      ++eol;
    }
    auto line = trim(rest.first(eol));
    if (line.size() > 0) {
      func(kj::heapString(line));
    }
    rest = eol < rest.size() ? rest.slice(eol + 1, rest.size()) : rest.slice(rest.size(), rest.size());
  }
}

kj::Maybe<LogLine> parse_json_line(kj::StringPtr line) {
  kj::Maybe<LogLine> parsed;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               auto doc = core::JsonDocument::parse(line);
               auto root = doc.root();
               if (root.is_object() && root["message"].is_string()) {
                 parsed = LogLine{root["name"].get_string(), root["levelname"].get_string(),
                                  root["message"].get_string()};
               }
             })) {
    (void)exception; // not JSON after all, read it as text
    return kj::none;
  }
  return kj::mv(parsed);
}

// Splits "<ts> - <component> - <LEVEL> - <message>"
kj::Maybe<LogLine> parse_text_line(kj::StringPtr line) {
  const char* fields[3];
  const char* cursor = line.cStr();
  for (auto& field : fields) {
    const char* sep = std::strstr(cursor, " - ");
    if (sep == nullptr) {
      return kj::none;
    }
    field = sep;
    cursor = sep + 3;
  }
  auto component = kj::heapString(fields[0] + 3, fields[1] - fields[0] - 3);
  auto level = kj::heapString(fields[1] + 3, fields[2] - fields[1] - 3);
  if (level.size() == 0 || component.size() == 0) {
    return kj::none;
  }
  for (char c : level) {
    if (c < 'A' || c > 'Z') {
      return kj::none;
    }
  }
  return LogLine{kj::mv(component), kj::mv(level), kj::str(cursor)};
}

} // namespace

bool LogLine::is_error() const {
  return level == "ERROR"_kj || level == "CRITICAL"_kj;
}

LogLine parse_log_line(kj::StringPtr line) {
  if (line.startsWith("{"_kj)) {
    KJ_IF_SOME(parsed, parse_json_line(line)) {
      return kj::mv(parsed);
    }
  }
  KJ_IF_SOME(parsed, parse_text_line(line)) {
    return kj::mv(parsed);
  }
  return LogLine{kj::str(), kj::str(), kj::str(line)};
}

kj::Array<LogLine> parse_log(kj::StringPtr output) {
  kj::Vector<LogLine> lines;
  for_each_line(output, [&](kj::String line) { lines.add(parse_log_line(line)); });
  return lines.releaseAsArray();
}

kj::Maybe<kj::String> find_result_path(kj::StringPtr output) {
  kj::Maybe<kj::String> found;
  for (auto& line : parse_log(output)) {
    const char* marker = std::strstr(line.message.cStr(), kDumpMarker.cStr());
    if (marker == nullptr) {
      continue;
    }
    const char* begin = marker + kDumpMarker.size();
    const char* end = std::strchr(begin, '"');
    if (end != nullptr && end > begin) {
      found = kj::heapString(begin, end - begin);
    }
  }
  return found;
}

kj::Maybe<kj::String> last_error_line(kj::StringPtr output) {
  kj::Maybe<kj::String> found;
  for (auto& line : parse_log(output)) {
    if (line.is_error()) {
      found = kj::mv(line.message);
    }
  }
  return found;
}

size_t count_error_lines(kj::StringPtr output) {
  size_t count = 0;
  for (auto& line : parse_log(output)) {
    if (line.is_error()) {
      ++count;
    }
  }
  return count;
}

kj::String summarize_failure(kj::StringPtr output) {
  kj::String summary;
  KJ_IF_SOME(error, last_error_line(output)) {
    summary = kj::mv(error);
  } else {
    auto lines = parse_log(output);
    summary = lines.size() > 0 ? kj::mv(lines.back().message) : kj::str("no output");
  }
  if (summary.size() > kMaxSummary) {
    return kj::str(summary.asArray().first(kMaxSummary), "...");
  }
  return summary;
}

} // namespace gentrade::exec
