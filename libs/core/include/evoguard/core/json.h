/**
 * @file json.h
 * @brief RAII wrapper around yyjson
 *
 * Usage:
 *   auto doc = JsonDocument::parse(text);
 *   double sigma = doc.root()["exit_mutation"]["gaussian_std_dev"].get_double(0.15);
 *
 *   auto builder = JsonBuilder::object();
 *   builder.put("tier", 2).put("success", true);
 *   kj::String json = builder.build();
 */

#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>
#include <type_traits>

// yyjson types are forward declared to keep the C header out of public headers
struct yyjson_doc;
struct yyjson_val;
struct yyjson_mut_doc;
struct yyjson_mut_val;

namespace evoguard::core {

// ============================================================================
// Low-level RAII wrappers
// ============================================================================

/**
 * @brief Owns a yyjson_doc* (immutable document)
 */
class YyJsonDoc {
public:
  YyJsonDoc() noexcept : doc_(nullptr) {}
  explicit YyJsonDoc(yyjson_doc* doc) noexcept : doc_(doc) {}
  ~YyJsonDoc() noexcept;

  YyJsonDoc(YyJsonDoc&& other) noexcept : doc_(other.doc_) {
    other.doc_ = nullptr;
  }
  YyJsonDoc& operator=(YyJsonDoc&& other) noexcept {
    if (this != &other) {
      reset(other.doc_);
      other.doc_ = nullptr;
    }
    return *this;
  }
  YyJsonDoc(const YyJsonDoc&) = delete;
  YyJsonDoc& operator=(const YyJsonDoc&) = delete;

  [[nodiscard]] yyjson_doc* get() const noexcept {
    return doc_;
  }
  void reset(yyjson_doc* doc = nullptr) noexcept;
  [[nodiscard]] explicit operator bool() const noexcept {
    return doc_ != nullptr;
  }

private:
  yyjson_doc* doc_;
};

/**
 * @brief Owns a yyjson_mut_doc* (mutable document)
 */
class YyJsonMutDoc {
public:
  YyJsonMutDoc() noexcept : doc_(nullptr) {}
  explicit YyJsonMutDoc(yyjson_mut_doc* doc) noexcept : doc_(doc) {}
  ~YyJsonMutDoc() noexcept;

  YyJsonMutDoc(YyJsonMutDoc&& other) noexcept : doc_(other.doc_) {
    other.doc_ = nullptr;
  }
  YyJsonMutDoc& operator=(YyJsonMutDoc&& other) noexcept {
    if (this != &other) {
      reset(other.doc_);
      other.doc_ = nullptr;
    }
    return *this;
  }
  YyJsonMutDoc(const YyJsonMutDoc&) = delete;
  YyJsonMutDoc& operator=(const YyJsonMutDoc&) = delete;

  [[nodiscard]] yyjson_mut_doc* get() const noexcept {
    return doc_;
  }
  void reset(yyjson_mut_doc* doc = nullptr) noexcept;
  [[nodiscard]] explicit operator bool() const noexcept {
    return doc_ != nullptr;
  }

private:
  yyjson_mut_doc* doc_;
};

// ============================================================================
// High-level API
// ============================================================================

class JsonValue;

class JsonDocument {
public:
  JsonDocument() = default;
  JsonDocument(JsonDocument&&) noexcept = default;
  JsonDocument& operator=(JsonDocument&&) noexcept = default;

  /**
   * @brief Parse JSON text
   * @throws kj::Exception on malformed input (position and reason in the description)
   */
  static JsonDocument parse(kj::StringPtr str);

  static JsonDocument parse_file(kj::StringPtr path);

  [[nodiscard]] JsonValue root() const;

  [[nodiscard]] bool is_valid() const {
    return static_cast<bool>(doc_);
  }

private:
  explicit JsonDocument(yyjson_doc* doc) : doc_(doc) {}
  YyJsonDoc doc_;
};

/**
 * @brief Non-owning view of a value inside a JsonDocument
 *
 * Lookups on missing keys or wrong types yield an invalid JsonValue rather
 * than failing, so chained access like `root["a"]["b"].get_double(1.0)`
 * falls back to the default.
 */
class JsonValue {
public:
  explicit JsonValue(yyjson_val* val = nullptr) : val_(val) {}

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_int() const;
  bool is_real() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  bool get_bool(bool default_val = false) const;
  int64_t get_int(int64_t default_val = 0) const;
  double get_double(double default_val = 0.0) const;
  kj::String get_string(kj::StringPtr default_val = ""_kj) const;
  kj::Maybe<kj::StringPtr> get_string_ptr() const;

  size_t size() const;

  JsonValue operator[](size_t index) const;
  JsonValue operator[](kj::StringPtr key) const;
  JsonValue operator[](const char* key) const {
    return operator[](kj::StringPtr(key));
  }

  kj::Maybe<JsonValue> get(kj::StringPtr key) const;

  void for_each_array(kj::FunctionParam<void(const JsonValue&)> callback) const;
  void for_each_object(kj::FunctionParam<void(kj::StringPtr, const JsonValue&)> callback) const;
  kj::Vector<kj::String> keys() const;

  bool is_valid() const {
    return val_ != nullptr;
  }

  template <typename T> kj::Maybe<T> parse_as() const {
    if constexpr (std::is_same_v<T, bool>) {
      if (!is_bool())
        return kj::none;
      return get_bool();
    } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, int>) {
      if (!is_int())
        return kj::none;
      return static_cast<T>(get_int());
    } else if constexpr (std::is_same_v<T, double>) {
      if (!is_number())
        return kj::none;
      return get_double();
    } else if constexpr (std::is_same_v<T, kj::String>) {
      if (!is_string())
        return kj::none;
      return get_string();
    } else {
      static_assert(!sizeof(T*), "Unsupported type for parse_as<T>");
    }
  }

private:
  yyjson_val* val_;
};

/**
 * @brief Fluent builder producing JSON text
 *
 * `put*` methods apply to object builders and `add*` methods to array
 * builders; calls on the wrong kind are ignored.
 */
class JsonBuilder {
public:
  enum class Type { Object, Array };

  ~JsonBuilder();
  JsonBuilder(JsonBuilder&& other) noexcept;
  JsonBuilder& operator=(JsonBuilder&& other) noexcept;
  JsonBuilder(const JsonBuilder&) = delete;
  JsonBuilder& operator=(const JsonBuilder&) = delete;

  static JsonBuilder object();
  static JsonBuilder array();

  JsonBuilder& put(kj::StringPtr key, const char* value);
  JsonBuilder& put(kj::StringPtr key, kj::StringPtr value);
  JsonBuilder& put(kj::StringPtr key, bool value);
  JsonBuilder& put(kj::StringPtr key, int value);
  JsonBuilder& put(kj::StringPtr key, int64_t value);
  JsonBuilder& put(kj::StringPtr key, uint64_t value);
  JsonBuilder& put(kj::StringPtr key, double value);
  JsonBuilder& put(kj::StringPtr key, std::nullptr_t);
  JsonBuilder& put_object(kj::StringPtr key, kj::FunctionParam<void(JsonBuilder&)> builder);
  JsonBuilder& put_array(kj::StringPtr key, kj::FunctionParam<void(JsonBuilder&)> builder);

  JsonBuilder& add(kj::StringPtr value);
  JsonBuilder& add(bool value);
  JsonBuilder& add(int value);
  JsonBuilder& add(int64_t value);
  JsonBuilder& add(double value);
  JsonBuilder& add(std::nullptr_t);
  JsonBuilder& add_object(kj::FunctionParam<void(JsonBuilder&)> builder);
  JsonBuilder& add_array(kj::FunctionParam<void(JsonBuilder&)> builder);

  [[nodiscard]] kj::String build(bool pretty = false) const;

private:
  explicit JsonBuilder(Type type);

  struct Impl;
  kj::Own<Impl> impl_;
};

namespace json_utils {

[[nodiscard]] bool is_valid_json(kj::StringPtr str);

} // namespace json_utils

} // namespace evoguard::core
