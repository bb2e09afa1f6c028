#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>

// yyjson types stay out of the public header
struct yyjson_doc;
struct yyjson_val;
struct yyjson_mut_doc;
struct yyjson_mut_val;

namespace gentrade::core {

class JsonValue;

/**
 * @brief Immutable parsed JSON document (yyjson)
 *
 * Owns the parse tree; JsonValue views into it are valid while the document lives.
 */
class JsonDocument {
public:
  JsonDocument() = default;
  ~JsonDocument();

  JsonDocument(const JsonDocument&) = delete;
  JsonDocument& operator=(const JsonDocument&) = delete;
  JsonDocument(JsonDocument&& other) noexcept;
  JsonDocument& operator=(JsonDocument&& other) noexcept;

  /**
   * @brief Parse a JSON string
   * @throws kj::Exception (FAILED) on malformed input
   */
  static JsonDocument parse(kj::StringPtr text);

  [[nodiscard]] JsonValue root() const;

private:
  explicit JsonDocument(yyjson_doc* doc) : doc_(doc) {}
  yyjson_doc* doc_{nullptr};
};

/**
 * @brief Non-owning view of a JSON value
 *
 * A missing member is an invalid view. Accessors on a value of the wrong type
 * return the default instead of throwing.
 */
class JsonValue {
public:
  explicit JsonValue(yyjson_val* val = nullptr) : val_(val) {}

  [[nodiscard]] bool is_valid() const {
    return val_ != nullptr;
  }
  [[nodiscard]] bool is_null() const;
  [[nodiscard]] bool is_bool() const;
  [[nodiscard]] bool is_int() const;
  [[nodiscard]] bool is_real() const;
  [[nodiscard]] bool is_string() const;
  [[nodiscard]] bool is_array() const;
  [[nodiscard]] bool is_object() const;

  [[nodiscard]] bool get_bool(bool fallback = false) const;
  [[nodiscard]] int64_t get_int(int64_t fallback = 0) const;
  [[nodiscard]] double get_double(double fallback = 0.0) const;
  [[nodiscard]] kj::String get_string(kj::StringPtr fallback = ""_kj) const;
  [[nodiscard]] kj::Maybe<kj::StringPtr> get_string_ptr() const;

  // Member lookup; invalid when this is not an object or has no such key
  JsonValue operator[](kj::StringPtr key) const;

  void for_each_object(kj::FunctionParam<void(kj::StringPtr, const JsonValue&)> callback) const;

  // String elements of an array; other elements are skipped
  [[nodiscard]] kj::Vector<kj::String> get_string_array() const;

private:
  yyjson_val* val_;
};

/**
 * @brief Writer for one flat JSON object
 */
class JsonBuilder {
public:
  static JsonBuilder object();

  ~JsonBuilder();
  JsonBuilder(const JsonBuilder&) = delete;
  JsonBuilder& operator=(const JsonBuilder&) = delete;
  JsonBuilder(JsonBuilder&& other) noexcept;
  JsonBuilder& operator=(JsonBuilder&& other) noexcept;

  JsonBuilder& put(kj::StringPtr key, kj::StringPtr value);
  JsonBuilder& put(kj::StringPtr key, int value);
  JsonBuilder& put(kj::StringPtr key, int64_t value);
  JsonBuilder& put(kj::StringPtr key, decltype(nullptr));

  [[nodiscard]] kj::String build(bool pretty = false) const;

private:
  JsonBuilder(yyjson_mut_doc* doc, yyjson_mut_val* root) : doc_(doc), root_(root) {}
  JsonBuilder& put_value(kj::StringPtr key, yyjson_mut_val* value);

  yyjson_mut_doc* doc_{nullptr};
  yyjson_mut_val* root_{nullptr};
};

} // namespace gentrade::core
