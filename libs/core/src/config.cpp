#include "gentrade/core/config.h"

#include "gentrade/core/json.h"

#include <cstdlib>
#include <kj/common.h>
#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/vector.h>

namespace gentrade::core {

namespace {

void put_value(kj::TreeMap<kj::String, Config::Value>& out, kj::String key, Config::Value value) {
  out.upsert(kj::mv(key), kj::mv(value),
             [](Config::Value& existing, Config::Value&& replacement) {
               existing = kj::mv(replacement);
             });
}

void flatten(kj::TreeMap<kj::String, Config::Value>& out, kj::StringPtr prefix,
             const JsonValue& node) {
  node.for_each_object([&](kj::StringPtr key, const JsonValue& value) {
    auto full_key = prefix.size() > 0 ? kj::str(prefix, ".", key) : kj::str(key);
    if (value.is_object()) {
      flatten(out, full_key, value);
    } else if (value.is_bool()) {
      put_value(out, kj::mv(full_key), value.get_bool());
    } else if (value.is_int()) {
      put_value(out, kj::mv(full_key), value.get_int());
    } else if (value.is_real()) {
      put_value(out, kj::mv(full_key), value.get_double());
    } else if (value.is_string()) {
      put_value(out, kj::mv(full_key), value.get_string());
    } else if (value.is_array()) {
      put_value(out, kj::mv(full_key), value.get_string_array().releaseAsArray());
    } else if (!value.is_null()) {
      KJ_FAIL_REQUIRE("unsupported value type for config key", full_key);
    }
  });
}

Config::Value clone_value(const Config::Value& v) {
  KJ_SWITCH_ONEOF(v) {
    KJ_CASE_ONEOF(b, bool) {
      return b;
    }
    KJ_CASE_ONEOF(i, int64_t) {
      return i;
    }
    KJ_CASE_ONEOF(d, double) {
      return d;
    }
    KJ_CASE_ONEOF(s, kj::String) {
      return kj::str(s);
    }
    KJ_CASE_ONEOF(a, kj::Array<kj::String>) {
      return KJ_MAP(item, a) { return kj::str(item); };
    }
  }
  KJ_UNREACHABLE;
}

Config::Value parse_env_value(kj::StringPtr raw) {
  if (raw == "true"_kj) {
    return true;
  }
  if (raw == "false"_kj) {
    return false;
  }
  KJ_IF_SOME(i, raw.tryParseAs<int64_t>()) {
    return i;
  }
  return kj::str(raw);
}

} // namespace

void Config::load_from_string(kj::StringPtr json_content) {
  kj::TreeMap<kj::String, Value> parsed;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               auto doc = JsonDocument::parse(json_content);
               auto root = doc.root();
               KJ_REQUIRE(root.is_object(), "config root must be a JSON object");
               flatten(parsed, ""_kj, root);
             })) {
    throw ConfigException(kj::str("invalid configuration: ", describe(exception)));
  }
  config_ = kj::mv(parsed);
}

void Config::load_from_file(const kj::ReadableDirectory& dir, const kj::Path& path) {
  KJ_IF_SOME(file, dir.tryOpenFile(path)) {
    load_from_string(file->readAllText());
    return;
  }
  throw ConfigException(kj::str("configuration file not found: ", path.toString(true)));
}

size_t Config::apply_env_overrides(kj::StringPtr prefix, const char* const* environ_block) {
  size_t applied = 0;
  if (environ_block == nullptr) {
    return applied;
  }
  for (const char* const* entry = environ_block; *entry != nullptr; ++entry) {
    kj::StringPtr var(*entry);
    if (!var.startsWith(prefix)) {
      continue;
    }
    KJ_IF_SOME(eq, var.findFirst('=')) {
      auto name = var.slice(prefix.size()).first(eq - prefix.size());
      kj::StringPtr raw = var.slice(eq + 1);

      // DATABASE_URL -> database.url; the first '_' separates section from key
      kj::Vector<char> key(name.size() + 1);
      bool separated = false;
      for (char c : name) {
        if (c == '_' && !separated) {
          key.add('.');
          separated = true;
        } else {
          key.add(c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c);
        }
      }
      if (key.size() == 0) {
        continue;
      }
      key.add('\0');
      put_value(config_, kj::heapString(key.begin(), key.size() - 1), parse_env_value(raw));
      ++applied;
    }
  }
  return applied;
}

bool Config::has_key(kj::StringPtr key) const {
  return config_.find(key) != kj::none;
}

void Config::set(kj::StringPtr key, Value value) {
  put_value(config_, kj::str(key), kj::mv(value));
}

kj::Maybe<kj::Array<kj::String>> Config::get_list(kj::StringPtr key) const {
  KJ_IF_SOME(value, config_.find(key)) {
    if (value.is<kj::Array<kj::String>>()) {
      return KJ_MAP(item, value.get<kj::Array<kj::String>>()) { return kj::str(item); };
    }
    if (value.is<kj::String>()) {
      auto text = value.get<kj::String>().asPtr();
      kj::Vector<kj::String> items;
      size_t start = 0;
      for (size_t i = 0; i <= text.size(); ++i) {
        if (i == text.size() || text[i] == ',') {
          if (i > start) {
            items.add(kj::heapString(text.asArray().slice(start, i)));
          }
          start = i + 1;
        }
      }
      return items.releaseAsArray();
    }
    throw ConfigException(kj::str("config key '", key, "' has the wrong type"));
  }
  return kj::none;
}

void Config::merge(const Config& other) {
  for (const auto& entry : other.config_) {
    set(entry.key, clone_value(entry.value));
  }
}

kj::Array<kj::String> Config::keys() const {
  return KJ_MAP(entry, config_) { return kj::str(entry.key); };
}

} // namespace gentrade::core
