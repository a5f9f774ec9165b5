#pragma once

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/refcount.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace evoguard::snippet {

struct Stmt;
class Value;

struct SeriesData : public kj::Refcounted {
  explicit SeriesData(kj::Array<double> v) : values(kj::mv(v)) {}
  kj::Array<double> values;
};

struct ListData;

/**
 * @brief Dynamically typed interpreter value
 *
 * Series and list payloads are shared by reference count, so copying a
 * Value is cheap. Series are never mutated after creation; lists follow
 * reference semantics (item assignment is visible through every alias).
 */
class Value {
public:
  enum class Kind : uint8_t {
    None,
    Bool,
    Number,
    String,
    Series,
    List,
    Function,
    Builtin,
    Method,
    Data,
    Params,
    Rolling,
  };

  Value();
  ~Value() noexcept;
  Value(const Value& other);
  Value& operator=(const Value& other);
  Value(Value&& other) noexcept;
  Value& operator=(Value&& other) noexcept;

  static Value boolean(bool v);
  static Value number(double v);
  static Value string(kj::StringPtr v);
  static Value series(kj::Array<double> values);
  static Value list(kj::Vector<Value> items);
  static Value function(const Stmt& def);
  static Value builtin(kj::StringPtr name);
  static Value data();
  static Value params();
  /// `series.rolling(window)`; only aggregations may be called on it
  static Value rolling(const Value& series, int window);

  /// Attribute lookup result: `receiver.name` awaiting a call
  [[nodiscard]] Value bind_method(kj::StringPtr name) const;
  /// For Method values, the object the method was looked up on
  [[nodiscard]] Value receiver() const;

  [[nodiscard]] Kind kind() const noexcept {
    return kind_;
  }
  [[nodiscard]] bool is(Kind k) const noexcept {
    return kind_ == k;
  }
  [[nodiscard]] kj::StringPtr type_name() const;

  [[nodiscard]] bool as_bool() const;
  /// Bool or Number
  [[nodiscard]] double as_number() const;
  [[nodiscard]] kj::StringPtr as_string() const;
  [[nodiscard]] kj::ArrayPtr<const double> as_series() const;
  [[nodiscard]] kj::ArrayPtr<const Value> as_list() const;
  [[nodiscard]] ListData& list_data() const;
  [[nodiscard]] const Stmt& as_function() const;
  /// Builtin or Method name
  [[nodiscard]] kj::StringPtr name() const;
  [[nodiscard]] int window() const;

  [[nodiscard]] bool is_numeric() const noexcept {
    return kind_ == Kind::Bool || kind_ == Kind::Number;
  }

  /// Python-style repr, used in error messages and the CLI
  [[nodiscard]] kj::String to_display() const;

private:
  Kind kind_ = Kind::None;
  Kind receiver_kind_ = Kind::None;
  double number_ = 0.0;
  int window_ = 0;
  kj::String text_;
  kj::Own<SeriesData> series_;
  kj::Own<ListData> list_;
  const Stmt* function_ = nullptr;
};

struct ListData : public kj::Refcounted {
  kj::Vector<Value> items;
};

} // namespace evoguard::snippet
