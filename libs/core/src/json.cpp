#include "evoguard/core/json.h"

#include <cstdlib>
#include <fstream>
#include <kj/debug.h>
#include <kj/exception.h>
#include <yyjson.h>

namespace evoguard::core {

// ============================================================================
// RAII wrappers
// ============================================================================

YyJsonDoc::~YyJsonDoc() noexcept {
  if (doc_) {
    yyjson_doc_free(doc_);
  }
}

void YyJsonDoc::reset(yyjson_doc* doc) noexcept {
  if (doc_ && doc_ != doc) {
    yyjson_doc_free(doc_);
  }
  doc_ = doc;
}

YyJsonMutDoc::~YyJsonMutDoc() noexcept {
  if (doc_) {
    yyjson_mut_doc_free(doc_);
  }
}

void YyJsonMutDoc::reset(yyjson_mut_doc* doc) noexcept {
  if (doc_ && doc_ != doc) {
    yyjson_mut_doc_free(doc_);
  }
  doc_ = doc;
}

// ============================================================================
// JsonDocument
// ============================================================================

JsonDocument JsonDocument::parse(kj::StringPtr str) {
  yyjson_read_err err;
  yyjson_doc* doc = yyjson_read_opts(const_cast<char*>(str.cStr()), str.size(), 0, nullptr, &err);
  if (!doc) {
    KJ_FAIL_REQUIRE("JSON parse error", err.pos, err.msg ? err.msg : "unknown error");
  }
  return JsonDocument(doc);
}

JsonDocument JsonDocument::parse_file(kj::StringPtr path_str) {
  std::ifstream file(path_str.cStr(), std::ios::binary | std::ios::ate);
  KJ_REQUIRE(file.is_open(), "Failed to open file", path_str);

  std::streamsize size = file.tellg();
  KJ_REQUIRE(size >= 0, "Failed to get file size", path_str);
  file.seekg(0, std::ios::beg);

  // One extra byte for the NUL terminator kj::StringPtr requires
  auto buf = kj::heapArray<char>(static_cast<size_t>(size) + 1);
  file.read(buf.begin(), size);
  KJ_REQUIRE(file.good() || file.eof(), "Failed to read file", path_str);
  buf[static_cast<size_t>(size)] = '\0';

  return parse(kj::StringPtr(buf.begin(), static_cast<size_t>(size)));
}

JsonValue JsonDocument::root() const {
  if (!doc_) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_doc_get_root(doc_.get()));
}

// ============================================================================
// JsonValue
// ============================================================================

bool JsonValue::is_null() const {
  return val_ && yyjson_is_null(val_);
}

bool JsonValue::is_bool() const {
  return val_ && yyjson_is_bool(val_);
}

bool JsonValue::is_number() const {
  return val_ && yyjson_is_num(val_);
}

bool JsonValue::is_int() const {
  return val_ && yyjson_is_int(val_);
}

bool JsonValue::is_real() const {
  return val_ && yyjson_is_real(val_);
}

bool JsonValue::is_string() const {
  return val_ && yyjson_is_str(val_);
}

bool JsonValue::is_array() const {
  return val_ && yyjson_is_arr(val_);
}

bool JsonValue::is_object() const {
  return val_ && yyjson_is_obj(val_);
}

bool JsonValue::get_bool(bool default_val) const {
  if (!is_bool()) {
    return default_val;
  }
  return yyjson_get_bool(val_);
}

int64_t JsonValue::get_int(int64_t default_val) const {
  if (!is_number()) {
    return default_val;
  }
  if (yyjson_is_sint(val_)) {
    return yyjson_get_sint(val_);
  }
  if (yyjson_is_uint(val_)) {
    return static_cast<int64_t>(yyjson_get_uint(val_));
  }
  return static_cast<int64_t>(yyjson_get_real(val_));
}

double JsonValue::get_double(double default_val) const {
  if (!is_number()) {
    return default_val;
  }
  return yyjson_get_num(val_);
}

kj::String JsonValue::get_string(kj::StringPtr default_val) const {
  KJ_IF_SOME(str, get_string_ptr()) {
    return kj::str(str);
  }
  return kj::str(default_val);
}

kj::Maybe<kj::StringPtr> JsonValue::get_string_ptr() const {
  if (!is_string()) {
    return kj::none;
  }
  const char* str = yyjson_get_str(val_);
  if (str == nullptr) {
    return kj::none;
  }
  return kj::StringPtr(str, yyjson_get_len(val_));
}

size_t JsonValue::size() const {
  if (is_array()) {
    return yyjson_arr_size(val_);
  }
  if (is_object()) {
    return yyjson_obj_size(val_);
  }
  return 0;
}

JsonValue JsonValue::operator[](size_t index) const {
  if (!is_array()) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_arr_get(val_, index));
}

JsonValue JsonValue::operator[](kj::StringPtr key) const {
  if (!is_object()) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_obj_getn(val_, key.cStr(), key.size()));
}

kj::Maybe<JsonValue> JsonValue::get(kj::StringPtr key) const {
  auto child = operator[](key);
  if (!child.is_valid()) {
    return kj::none;
  }
  return child;
}

void JsonValue::for_each_array(kj::FunctionParam<void(const JsonValue&)> callback) const {
  if (!is_array()) {
    return;
  }
  size_t idx, max;
  yyjson_val* item;
  yyjson_arr_foreach(val_, idx, max, item) {
    callback(JsonValue(item));
  }
}

void JsonValue::for_each_object(
    kj::FunctionParam<void(kj::StringPtr, const JsonValue&)> callback) const {
  if (!is_object()) {
    return;
  }
  yyjson_obj_iter iter;
  yyjson_obj_iter_init(val_, &iter);
  yyjson_val* key;
  while ((key = yyjson_obj_iter_next(&iter))) {
    yyjson_val* val = yyjson_obj_iter_get_val(key);
    callback(kj::StringPtr(yyjson_get_str(key), yyjson_get_len(key)), JsonValue(val));
  }
}

kj::Vector<kj::String> JsonValue::keys() const {
  kj::Vector<kj::String> result;
  for_each_object([&result](kj::StringPtr key, const JsonValue&) { result.add(kj::str(key)); });
  return result;
}

// ============================================================================
// JsonBuilder
// ============================================================================

struct JsonBuilder::Impl {
  YyJsonMutDoc doc;
  yyjson_mut_val* current = nullptr; // owned by doc
  bool is_object = true;

  yyjson_mut_val* key(kj::StringPtr k) {
    return yyjson_mut_strncpy(doc.get(), k.cStr(), k.size());
  }

  void put_val(kj::StringPtr k, yyjson_mut_val* val) {
    if (!is_object || val == nullptr) {
      return;
    }
    yyjson_mut_obj_add(current, key(k), val);
  }

  void add_val(yyjson_mut_val* val) {
    if (is_object || val == nullptr) {
      return;
    }
    yyjson_mut_arr_append(current, val);
  }

  // Runs builder with `nested` as the current container, then restores
  yyjson_mut_val* nest(yyjson_mut_val* nested, bool nested_is_object, JsonBuilder& self,
                       kj::FunctionParam<void(JsonBuilder&)>& builder) {
    yyjson_mut_val* saved_current = current;
    bool saved_is_object = is_object;
    current = nested;
    is_object = nested_is_object;
    builder(self);
    current = saved_current;
    is_object = saved_is_object;
    return nested;
  }
};

JsonBuilder::JsonBuilder(Type type) : impl_(kj::heap<Impl>()) {
  impl_->doc.reset(yyjson_mut_doc_new(nullptr));
  KJ_REQUIRE(static_cast<bool>(impl_->doc), "Failed to allocate JSON document");
  impl_->is_object = type == Type::Object;
  impl_->current =
      impl_->is_object ? yyjson_mut_obj(impl_->doc.get()) : yyjson_mut_arr(impl_->doc.get());
}

JsonBuilder::~JsonBuilder() = default;
JsonBuilder::JsonBuilder(JsonBuilder&& other) noexcept = default;
JsonBuilder& JsonBuilder::operator=(JsonBuilder&& other) noexcept = default;

JsonBuilder JsonBuilder::object() {
  return JsonBuilder(Type::Object);
}

JsonBuilder JsonBuilder::array() {
  return JsonBuilder(Type::Array);
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, const char* value) {
  impl_->put_val(key, yyjson_mut_strcpy(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, kj::StringPtr value) {
  impl_->put_val(key, yyjson_mut_strncpy(impl_->doc.get(), value.cStr(), value.size()));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, bool value) {
  impl_->put_val(key, yyjson_mut_bool(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, int value) {
  impl_->put_val(key, yyjson_mut_sint(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, int64_t value) {
  impl_->put_val(key, yyjson_mut_sint(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, uint64_t value) {
  impl_->put_val(key, yyjson_mut_uint(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, double value) {
  impl_->put_val(key, yyjson_mut_real(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, std::nullptr_t) {
  impl_->put_val(key, yyjson_mut_null(impl_->doc.get()));
  return *this;
}

JsonBuilder& JsonBuilder::put_object(kj::StringPtr key,
                                     kj::FunctionParam<void(JsonBuilder&)> builder) {
  if (impl_->is_object) {
    auto* nested = impl_->nest(yyjson_mut_obj(impl_->doc.get()), true, *this, builder);
    impl_->put_val(key, nested);
  }
  return *this;
}

JsonBuilder& JsonBuilder::put_array(kj::StringPtr key,
                                    kj::FunctionParam<void(JsonBuilder&)> builder) {
  if (impl_->is_object) {
    auto* nested = impl_->nest(yyjson_mut_arr(impl_->doc.get()), false, *this, builder);
    impl_->put_val(key, nested);
  }
  return *this;
}

JsonBuilder& JsonBuilder::add(kj::StringPtr value) {
  impl_->add_val(yyjson_mut_strncpy(impl_->doc.get(), value.cStr(), value.size()));
  return *this;
}

JsonBuilder& JsonBuilder::add(bool value) {
  impl_->add_val(yyjson_mut_bool(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::add(int value) {
  impl_->add_val(yyjson_mut_sint(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::add(int64_t value) {
  impl_->add_val(yyjson_mut_sint(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::add(double value) {
  impl_->add_val(yyjson_mut_real(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::add(std::nullptr_t) {
  impl_->add_val(yyjson_mut_null(impl_->doc.get()));
  return *this;
}

JsonBuilder& JsonBuilder::add_object(kj::FunctionParam<void(JsonBuilder&)> builder) {
  if (!impl_->is_object) {
    impl_->add_val(impl_->nest(yyjson_mut_obj(impl_->doc.get()), true, *this, builder));
  }
  return *this;
}

JsonBuilder& JsonBuilder::add_array(kj::FunctionParam<void(JsonBuilder&)> builder) {
  if (!impl_->is_object) {
    impl_->add_val(impl_->nest(yyjson_mut_arr(impl_->doc.get()), false, *this, builder));
  }
  return *this;
}

kj::String JsonBuilder::build(bool pretty) const {
  yyjson_mut_doc_set_root(impl_->doc.get(), impl_->current);
  size_t len = 0;
  yyjson_write_flag flags = pretty ? YYJSON_WRITE_PRETTY : YYJSON_WRITE_NOFLAG;
  // NaN and Inf metrics are written as null instead of failing the whole document
  flags |= YYJSON_WRITE_INF_AND_NAN_AS_NULL;
  yyjson_write_err err;
  char* json = yyjson_mut_write_opts(impl_->doc.get(), flags, nullptr, &len, &err);
  KJ_REQUIRE(json != nullptr, "JSON write error", err.msg ? err.msg : "unknown error");
  kj::String result = kj::heapString(json, len);
  std::free(json);
  return result;
}

namespace json_utils {

bool is_valid_json(kj::StringPtr str) {
  kj::Maybe<kj::Exception> maybe_exception =
      kj::runCatchingExceptions([&]() { (void)JsonDocument::parse(str); });
  return maybe_exception == kj::none;
}

} // namespace json_utils

} // namespace evoguard::core
