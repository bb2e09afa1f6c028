#pragma once

#include "gentrade/core/error.h"

#include <kj/array.h>
#include <kj/common.h>
#include <kj/filesystem.h>
#include <kj/map.h>
#include <kj/one-of.h>
#include <kj/string.h>
#include <type_traits>

namespace gentrade::core {

/**
 * @brief Flat key/value configuration loaded from JSON
 *
 * Nested objects are flattened with '.' separators, so
 * `{"database": {"url": "..."}}` is read back with `get<kj::StringPtr>("database.url")`.
 */
class Config final {
public:
  using Value = kj::OneOf<bool, int64_t, double, kj::String, kj::Array<kj::String>>;

  Config() = default;

  /**
   * @brief Replace the contents with the JSON document in `json_content`
   * @throws ConfigException on malformed JSON or unsupported value types
   */
  void load_from_string(kj::StringPtr json_content);

  /**
   * @brief Load a JSON file relative to `dir`
   * @throws ConfigException if the file is missing or malformed
   */
  void load_from_file(const kj::ReadableDirectory& dir, const kj::Path& path);

  /**
   * @brief Override keys from environment variables
   *
   * For every variable `<prefix>SECTION_KEY` the key `section.key` is set. The
   * value is stored as int64 or bool when it parses as one, otherwise as a string.
   * Returns the number of keys overridden.
   */
  size_t apply_env_overrides(kj::StringPtr prefix, const char* const* environ_block);

  [[nodiscard]] bool has_key(kj::StringPtr key) const;
  void set(kj::StringPtr key, Value value);

  template <typename T> [[nodiscard]] kj::Maybe<T> get(kj::StringPtr key) const {
    KJ_IF_SOME(value, config_.find(key)) {
      if constexpr (std::is_same_v<T, bool>) {
        if (value.template is<bool>()) {
          return value.template get<bool>();
        }
      } else if constexpr (std::is_same_v<T, int64_t>) {
        if (value.template is<int64_t>()) {
          return value.template get<int64_t>();
        }
      } else if constexpr (std::is_same_v<T, double>) {
        if (value.template is<double>()) {
          return value.template get<double>();
        }
        if (value.template is<int64_t>()) {
          return static_cast<double>(value.template get<int64_t>());
        }
      } else if constexpr (std::is_same_v<T, kj::StringPtr>) {
        if (value.template is<kj::String>()) {
          return value.template get<kj::String>().asPtr();
        }
      } else if constexpr (std::is_same_v<T, kj::ArrayPtr<const kj::String>>) {
        if (value.template is<kj::Array<kj::String>>()) {
          return value.template get<kj::Array<kj::String>>().asPtr();
        }
      } else {
        static_assert(kj::isSameType<T, void>(), "Unsupported config get<T>() type");
      }
      throw ConfigException(kj::str("config key '", key, "' has the wrong type"));
    }
    return kj::none;
  }

  template <typename T> T get_or(kj::StringPtr key, T default_value) const {
    KJ_IF_SOME(value, get<T>(key)) {
      return value;
    }
    return default_value;
  }

  /**
   * @brief A list value, given either as a JSON array or a comma-separated string
   *
   * Empty items are dropped. Environment overrides can only carry the string form.
   */
  [[nodiscard]] kj::Maybe<kj::Array<kj::String>> get_list(kj::StringPtr key) const;

  void merge(const Config& other);

  [[nodiscard]] kj::Array<kj::String> keys() const;

  [[nodiscard]] bool empty() const {
    return config_.size() == 0;
  }
  [[nodiscard]] size_t size() const {
    return config_.size();
  }

private:
  kj::TreeMap<kj::String, Value> config_;
};

} // namespace gentrade::core
