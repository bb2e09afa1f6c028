#include "gentrade/core/config.h"
#include "kj/test.h"

#include <kj/filesystem.h>
#include <kj/string.h>

using namespace gentrade::core;

namespace {

KJ_TEST("Config: nested objects are flattened with dots") {
  Config config;
  config.load_from_string(R"({
    "database": {"url": "postgresql://db/gentrade"},
    "worker": {"concurrency": 3},
    "exec": {"timeout_s": 1.5, "pairs": ["BTC/USDT", "ETH/USDT"]},
    "log": {"json": true}
  })"_kj);

  KJ_EXPECT(config.get_or<kj::StringPtr>("database.url"_kj, ""_kj) ==
            "postgresql://db/gentrade"_kj);
  KJ_EXPECT(config.get_or<int64_t>("worker.concurrency"_kj, 0) == 3);
  KJ_EXPECT(config.get_or<double>("exec.timeout_s"_kj, 0.0) == 1.5);
  KJ_EXPECT(config.get_or<bool>("log.json"_kj, false));
  KJ_EXPECT(config.get_or<int64_t>("missing"_kj, 11) == 11);

  KJ_IF_SOME(pairs, config.get<kj::ArrayPtr<const kj::String>>("exec.pairs"_kj)) {
    KJ_EXPECT(pairs.size() == 2);
    KJ_EXPECT(pairs[1] == "ETH/USDT"_kj);
  }
  else {
    KJ_FAIL_EXPECT("exec.pairs missing");
  }
}

KJ_TEST("Config: lists come from arrays or comma-separated strings") {
  Config config;
  config.load_from_string(R"({"exec": {"pairs": ["BTC/USDT:USDT"]}})"_kj);
  config.set("exec.env_pairs"_kj, kj::str("ETH/USDT,,SOL/USDT"));

  KJ_IF_SOME(pairs, config.get_list("exec.pairs"_kj)) {
    KJ_EXPECT(pairs.size() == 1);
    KJ_EXPECT(pairs[0] == "BTC/USDT:USDT"_kj);
  } else {
    KJ_FAIL_EXPECT("exec.pairs missing");
  }
  KJ_IF_SOME(pairs, config.get_list("exec.env_pairs"_kj)) {
    KJ_EXPECT(pairs.size() == 2);
    KJ_EXPECT(pairs[1] == "SOL/USDT"_kj);
  } else {
    KJ_FAIL_EXPECT("exec.env_pairs missing");
  }
  KJ_EXPECT(config.get_list("exec.none"_kj) == kj::none);
}

KJ_TEST("Config: integer keys can be read as double") {
  Config config;
  config.set("exec.timeout_s"_kj, static_cast<int64_t>(30));
  KJ_EXPECT(config.get_or<double>("exec.timeout_s"_kj, 0.0) == 30.0);
}

KJ_TEST("Config: wrong type raises ConfigException") {
  Config config;
  config.set("worker.concurrency"_kj, kj::str("two"));
  bool thrown = false;
  try {
    (void)config.get<int64_t>("worker.concurrency"_kj);
  } catch (const ConfigException& e) {
    thrown = true;
    KJ_EXPECT(e.code() == ErrorCode::Configuration);
  }
  KJ_EXPECT(thrown);
}

KJ_TEST("Config: malformed JSON raises ConfigException") {
  Config config;
  bool thrown = false;
  try {
    config.load_from_string("[1, 2"_kj);
  } catch (const ConfigException&) {
    thrown = true;
  }
  KJ_EXPECT(thrown);
}

KJ_TEST("Config: environment overrides map to dotted keys") {
  Config config;
  config.load_from_string(R"({"database": {"url": "from-file"}, "worker": {"concurrency": 1}})"_kj);

  const char* env[] = {"GENTRADE_DATABASE_URL=postgresql://env/db", "GENTRADE_WORKER_CONCURRENCY=8",
                       "GENTRADE_LOG_JSON=true", "HOME=/root", "GENTRADE_BROKER_MAX_IDLE=2",
                       nullptr};
  auto applied = config.apply_env_overrides("GENTRADE_"_kj, env);

  KJ_EXPECT(applied == 4);
  KJ_EXPECT(config.get_or<kj::StringPtr>("database.url"_kj, ""_kj) == "postgresql://env/db"_kj);
  KJ_EXPECT(config.get_or<int64_t>("worker.concurrency"_kj, 0) == 8);
  KJ_EXPECT(config.get_or<bool>("log.json"_kj, false));
  KJ_EXPECT(config.get_or<int64_t>("broker.max_idle"_kj, 0) == 2);
  KJ_EXPECT(!config.has_key("home"_kj));
}

KJ_TEST("Config: merge overrides existing keys") {
  Config base;
  base.set("a"_kj, static_cast<int64_t>(1));
  base.set("b"_kj, kj::str("keep"));
  Config overlay;
  overlay.set("a"_kj, static_cast<int64_t>(2));

  base.merge(overlay);
  KJ_EXPECT(base.get_or<int64_t>("a"_kj, 0) == 2);
  KJ_EXPECT(base.get_or<kj::StringPtr>("b"_kj, ""_kj) == "keep"_kj);
  KJ_EXPECT(base.size() == 2);
}

KJ_TEST("Config: load_from_file reads a JSON file and reports missing ones") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  dir->openFile(kj::Path("worker.json"), kj::WriteMode::CREATE)
      ->writeAll(R"({"broker": {"queue": "bt"}})"_kj);

  Config config;
  config.load_from_file(*dir, kj::Path("worker.json"));
  KJ_EXPECT(config.get_or<kj::StringPtr>("broker.queue"_kj, ""_kj) == "bt"_kj);

  bool thrown = false;
  try {
    config.load_from_file(*dir, kj::Path("absent.json"));
  } catch (const ConfigException&) {
    thrown = true;
  }
  KJ_EXPECT(thrown);
}

} // namespace
