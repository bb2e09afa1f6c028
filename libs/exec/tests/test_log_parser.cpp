#include "gentrade/exec/log_parser.h"
#include "kj/test.h"

using namespace gentrade::exec;

namespace {

KJ_TEST("parse_log_line: text format") {
  auto line = parse_log_line(
      "2024-01-01 10:00:00,123 - freqtrade.misc - INFO - dumping json to \"/a - b.json\""_kj);
  KJ_EXPECT(line.component == "freqtrade.misc"_kj);
  KJ_EXPECT(line.level == "INFO"_kj);
  KJ_EXPECT(line.message == "dumping json to \"/a - b.json\""_kj);
  KJ_EXPECT(!line.is_error());
}

KJ_TEST("parse_log_line: JSON lines") {
  auto line = parse_log_line(
      R"({"name": "freqtrade.main", "levelname": "ERROR", "message": "boom"})"_kj);
  KJ_EXPECT(line.component == "freqtrade.main"_kj);
  KJ_EXPECT(line.level == "ERROR"_kj);
  KJ_EXPECT(line.message == "boom"_kj);
  KJ_EXPECT(line.is_error());
}

KJ_TEST("parse_log_line: anything else is kept as the message") {
  auto line = parse_log_line("{ not json"_kj);
  KJ_EXPECT(line.level.size() == 0);
  KJ_EXPECT(line.message == "{ not json"_kj);

  auto plain = parse_log_line("Traceback (most recent call last):"_kj);
  KJ_EXPECT(plain.component.size() == 0);
  KJ_EXPECT(plain.message == "Traceback (most recent call last):"_kj);
}

KJ_TEST("find_result_path: last reported file wins") {
  auto output = "x - freqtrade.misc - INFO - dumping json to \"/freqtrade/user_data/a.json\"\n"
                "x - freqtrade.optimize - INFO - done\r\n"
                "x - freqtrade.misc - INFO - dumping json to \"/freqtrade/user_data/b.meta.json\"\n"_kj;
  KJ_IF_SOME(path, find_result_path(output)) {
    KJ_EXPECT(path == "/freqtrade/user_data/b.meta.json"_kj);
  } else {
    KJ_FAIL_EXPECT("no result path");
  }
  KJ_EXPECT(find_result_path("nothing here\n"_kj) == kj::none);
}

KJ_TEST("last_error_line and summarize_failure") {
  auto output = "t - freqtrade - ERROR - first problem\n"
                "t - freqtrade - CRITICAL - second problem\n"
                "t - freqtrade - INFO - exiting\n"_kj;
  KJ_IF_SOME(line, last_error_line(output)) {
    KJ_EXPECT(line == "second problem"_kj);
  } else {
    KJ_FAIL_EXPECT("no error line");
  }
  KJ_EXPECT(count_error_lines(output) == 2);
  KJ_EXPECT(summarize_failure(output) == "second problem"_kj);

  KJ_EXPECT(last_error_line("t - a - INFO - fine\n"_kj) == kj::none);
  KJ_EXPECT(summarize_failure("first\nlast words\n\n"_kj) == "last words"_kj);
  KJ_EXPECT(summarize_failure(""_kj) == "no output"_kj);
}

} // namespace
