#include "gentrade/core/json.h"

#include <cstdlib>
#include <kj/debug.h>
#include <yyjson.h>

namespace gentrade::core {

JsonDocument::~JsonDocument() {
  if (doc_ != nullptr) {
    yyjson_doc_free(doc_);
  }
}

JsonDocument::JsonDocument(JsonDocument&& other) noexcept : doc_(other.doc_) {
  other.doc_ = nullptr;
}

JsonDocument& JsonDocument::operator=(JsonDocument&& other) noexcept {
  if (this != &other) {
    if (doc_ != nullptr) {
      yyjson_doc_free(doc_);
    }
    doc_ = other.doc_;
    other.doc_ = nullptr;
  }
  return *this;
}

JsonDocument JsonDocument::parse(kj::StringPtr text) {
  yyjson_read_err err;
  // without YYJSON_READ_INSITU the input is only read
  auto* doc = yyjson_read_opts(const_cast<char*>(text.cStr()), text.size(), 0, nullptr, &err);
  if (doc == nullptr) {
    KJ_FAIL_REQUIRE("JSON parse error", err.pos, err.msg != nullptr ? err.msg : "unknown error");
  }
  return JsonDocument(doc);
}

JsonValue JsonDocument::root() const {
  return JsonValue(doc_ != nullptr ? yyjson_doc_get_root(doc_) : nullptr);
}

bool JsonValue::is_null() const {
  return val_ == nullptr || yyjson_is_null(val_);
}

bool JsonValue::is_bool() const {
  return val_ != nullptr && yyjson_is_bool(val_);
}

bool JsonValue::is_int() const {
  return val_ != nullptr && yyjson_is_int(val_);
}

bool JsonValue::is_real() const {
  return val_ != nullptr && yyjson_is_real(val_);
}

bool JsonValue::is_string() const {
  return val_ != nullptr && yyjson_is_str(val_);
}

bool JsonValue::is_array() const {
  return val_ != nullptr && yyjson_is_arr(val_);
}

bool JsonValue::is_object() const {
  return val_ != nullptr && yyjson_is_obj(val_);
}

bool JsonValue::get_bool(bool fallback) const {
  return is_bool() ? yyjson_get_bool(val_) : fallback;
}

int64_t JsonValue::get_int(int64_t fallback) const {
  if (val_ == nullptr) {
    return fallback;
  }
  if (yyjson_is_sint(val_)) {
    return yyjson_get_sint(val_);
  }
  if (yyjson_is_uint(val_)) {
    return static_cast<int64_t>(yyjson_get_uint(val_));
  }
  return fallback;
}

double JsonValue::get_double(double fallback) const {
  return val_ != nullptr && yyjson_is_num(val_) ? yyjson_get_num(val_) : fallback;
}

kj::String JsonValue::get_string(kj::StringPtr fallback) const {
  KJ_IF_SOME(text, get_string_ptr()) {
    return kj::str(text);
  }
  return kj::str(fallback);
}

kj::Maybe<kj::StringPtr> JsonValue::get_string_ptr() const {
  if (!is_string()) {
    return kj::none;
  }
  const char* text = yyjson_get_str(val_);
  if (text == nullptr) {
    return kj::none;
  }
  return kj::StringPtr(text, yyjson_get_len(val_));
}

JsonValue JsonValue::operator[](kj::StringPtr key) const {
  return JsonValue(is_object() ? yyjson_obj_getn(val_, key.cStr(), key.size()) : nullptr);
}

void JsonValue::for_each_object(
    kj::FunctionParam<void(kj::StringPtr, const JsonValue&)> callback) const {
  if (!is_object()) {
    return;
  }
  yyjson_obj_iter iter;
  yyjson_obj_iter_init(val_, &iter);
  while (auto* key = yyjson_obj_iter_next(&iter)) {
    callback(kj::StringPtr(yyjson_get_str(key), yyjson_get_len(key)),
             JsonValue(yyjson_obj_iter_get_val(key)));
  }
}

kj::Vector<kj::String> JsonValue::get_string_array() const {
  kj::Vector<kj::String> items;
  if (!is_array()) {
    return items;
  }
  size_t index, count;
  yyjson_val* item;
  yyjson_arr_foreach(val_, index, count, item) {
    KJ_IF_SOME(text, JsonValue(item).get_string_ptr()) {
      items.add(kj::str(text));
    }
  }
  return items;
}

JsonBuilder JsonBuilder::object() {
  auto* doc = yyjson_mut_doc_new(nullptr);
  KJ_REQUIRE(doc != nullptr, "yyjson allocation failed");
  return JsonBuilder(doc, yyjson_mut_obj(doc));
}

JsonBuilder::~JsonBuilder() {
  if (doc_ != nullptr) {
    yyjson_mut_doc_free(doc_);
  }
}

JsonBuilder::JsonBuilder(JsonBuilder&& other) noexcept : doc_(other.doc_), root_(other.root_) {
  other.doc_ = nullptr;
  other.root_ = nullptr;
}

JsonBuilder& JsonBuilder::operator=(JsonBuilder&& other) noexcept {
  if (this != &other) {
    if (doc_ != nullptr) {
      yyjson_mut_doc_free(doc_);
    }
    doc_ = other.doc_;
    root_ = other.root_;
    other.doc_ = nullptr;
    other.root_ = nullptr;
  }
  return *this;
}

JsonBuilder& JsonBuilder::put_value(kj::StringPtr key, yyjson_mut_val* value) {
  KJ_REQUIRE(doc_ != nullptr, "builder was moved from");
  yyjson_mut_obj_add(root_, yyjson_mut_strncpy(doc_, key.cStr(), key.size()), value);
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, kj::StringPtr value) {
  return put_value(key, yyjson_mut_strncpy(doc_, value.cStr(), value.size()));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, int value) {
  return put(key, static_cast<int64_t>(value));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, int64_t value) {
  return put_value(key, yyjson_mut_sint(doc_, value));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, decltype(nullptr)) {
  return put_value(key, yyjson_mut_null(doc_));
}

kj::String JsonBuilder::build(bool pretty) const {
  KJ_REQUIRE(doc_ != nullptr, "builder was moved from");
  yyjson_mut_doc_set_root(doc_, root_);
  size_t length = 0;
  yyjson_write_err err;
  char* json =
      yyjson_mut_write_opts(doc_, pretty ? YYJSON_WRITE_PRETTY : 0, nullptr, &length, &err);
  KJ_REQUIRE(json != nullptr, "JSON write error", err.msg != nullptr ? err.msg : "unknown error");
  KJ_DEFER(free(json));
  return kj::heapString(json, length);
}

} // namespace gentrade::core
