#include "evoguard/snippet/value.h"

#include "evoguard/snippet/ast.h"
#include "evoguard/snippet/printer.h"

#include <cmath>
#include <kj/debug.h>

namespace evoguard::snippet {

namespace {

kj::Own<SeriesData> share(const kj::Own<SeriesData>& s) {
  if (s.get() == nullptr) {
    return {};
  }
  return kj::addRef(*s);
}

kj::Own<ListData> share(const kj::Own<ListData>& l) {
  if (l.get() == nullptr) {
    return {};
  }
  return kj::addRef(*l);
}

} // namespace

Value::Value() = default;
Value::~Value() noexcept = default;

Value::Value(const Value& other)
    : kind_(other.kind_), receiver_kind_(other.receiver_kind_), number_(other.number_),
      window_(other.window_), text_(kj::str(other.text_)), series_(share(other.series_)),
      list_(share(other.list_)), function_(other.function_) {}

Value& Value::operator=(const Value& other) {
  if (this != &other) {
    kind_ = other.kind_;
    receiver_kind_ = other.receiver_kind_;
    number_ = other.number_;
    window_ = other.window_;
    text_ = kj::str(other.text_);
    series_ = share(other.series_);
    list_ = share(other.list_);
    function_ = other.function_;
  }
  return *this;
}

Value::Value(Value&& other) noexcept = default;
Value& Value::operator=(Value&& other) noexcept = default;

Value Value::boolean(bool v) {
  Value out;
  out.kind_ = Kind::Bool;
  out.number_ = v ? 1.0 : 0.0;
  return out;
}

Value Value::number(double v) {
  Value out;
  out.kind_ = Kind::Number;
  out.number_ = v;
  return out;
}

Value Value::string(kj::StringPtr v) {
  Value out;
  out.kind_ = Kind::String;
  out.text_ = kj::str(v);
  return out;
}

Value Value::series(kj::Array<double> values) {
  Value out;
  out.kind_ = Kind::Series;
  out.series_ = kj::refcounted<SeriesData>(kj::mv(values));
  return out;
}

Value Value::list(kj::Vector<Value> items) {
  Value out;
  out.kind_ = Kind::List;
  auto data = kj::refcounted<ListData>();
  data->items = kj::mv(items);
  out.list_ = kj::mv(data);
  return out;
}

Value Value::function(const Stmt& def) {
  KJ_REQUIRE(def.kind == Stmt::Kind::FunctionDef);
  Value out;
  out.kind_ = Kind::Function;
  out.function_ = &def;
  out.text_ = kj::str(def.name);
  return out;
}

Value Value::builtin(kj::StringPtr name) {
  Value out;
  out.kind_ = Kind::Builtin;
  out.text_ = kj::str(name);
  return out;
}

Value Value::data() {
  Value out;
  out.kind_ = Kind::Data;
  return out;
}

Value Value::params() {
  Value out;
  out.kind_ = Kind::Params;
  return out;
}

Value Value::rolling(const Value& series, int window) {
  KJ_REQUIRE(series.kind_ == Kind::Series);
  Value out;
  out.kind_ = Kind::Rolling;
  out.series_ = share(series.series_);
  out.window_ = window;
  return out;
}

Value Value::bind_method(kj::StringPtr name) const {
  KJ_REQUIRE(kind_ != Kind::String && kind_ != Kind::Method && kind_ != Kind::Builtin,
             "cannot bind a method on this value", type_name());
  Value out(*this);
  out.receiver_kind_ = kind_;
  out.kind_ = Kind::Method;
  out.text_ = kj::str(name);
  return out;
}

Value Value::receiver() const {
  KJ_REQUIRE(kind_ == Kind::Method);
  Value out(*this);
  out.kind_ = receiver_kind_;
  out.receiver_kind_ = Kind::None;
  out.text_ = kj::String();
  return out;
}

kj::StringPtr Value::type_name() const {
  switch (kind_) {
  case Kind::None:
    return "NoneType"_kj;
  case Kind::Bool:
    return "bool"_kj;
  case Kind::Number:
    return "number"_kj;
  case Kind::String:
    return "str"_kj;
  case Kind::Series:
    return "Series"_kj;
  case Kind::List:
    return "list"_kj;
  case Kind::Function:
    return "function"_kj;
  case Kind::Builtin:
    return "builtin_function"_kj;
  case Kind::Method:
    return "method"_kj;
  case Kind::Data:
    return "DataProvider"_kj;
  case Kind::Params:
    return "Params"_kj;
  case Kind::Rolling:
    return "Rolling"_kj;
  }
  KJ_UNREACHABLE;
}

bool Value::as_bool() const {
  KJ_REQUIRE(kind_ == Kind::Bool, "expected bool", type_name());
  return number_ != 0.0;
}

double Value::as_number() const {
  KJ_REQUIRE(is_numeric(), "expected number", type_name());
  return number_;
}

kj::StringPtr Value::as_string() const {
  KJ_REQUIRE(kind_ == Kind::String, "expected str", type_name());
  return text_;
}

kj::ArrayPtr<const double> Value::as_series() const {
  KJ_REQUIRE(kind_ == Kind::Series || kind_ == Kind::Rolling ||
                 (kind_ == Kind::Method && series_.get() != nullptr),
             "expected Series", type_name());
  return series_->values.asPtr();
}

kj::ArrayPtr<const Value> Value::as_list() const {
  KJ_REQUIRE(list_.get() != nullptr, "expected list", type_name());
  return list_->items.asPtr();
}

ListData& Value::list_data() const {
  KJ_REQUIRE(kind_ == Kind::List, "expected list", type_name());
  return *list_;
}

const Stmt& Value::as_function() const {
  KJ_REQUIRE(kind_ == Kind::Function, "expected function", type_name());
  return *function_;
}

kj::StringPtr Value::name() const {
  KJ_REQUIRE(kind_ == Kind::Builtin || kind_ == Kind::Method || kind_ == Kind::Function,
             "value has no name", type_name());
  return text_;
}

int Value::window() const {
  KJ_REQUIRE(kind_ == Kind::Rolling || receiver_kind_ == Kind::Rolling, "expected Rolling",
             type_name());
  return window_;
}

kj::String Value::to_display() const {
  switch (kind_) {
  case Kind::None:
    return kj::str("None");
  case Kind::Bool:
    return kj::str(number_ != 0.0 ? "True" : "False");
  case Kind::Number: {
    bool integral = std::isfinite(number_) && std::floor(number_) == number_ &&
                    std::fabs(number_) < 1e15;
    return format_number(number_, integral);
  }
  case Kind::String:
    return kj::str("'", text_, "'");
  case Kind::Series:
    return kj::str("Series(len=", series_->values.size(), ")");
  case Kind::List: {
    kj::Vector<kj::String> parts;
    for (auto& item : list_->items) {
      parts.add(item.to_display());
    }
    return kj::str("[", kj::strArray(parts, ", "), "]");
  }
  case Kind::Function:
    return kj::str("<function ", text_, ">");
  case Kind::Builtin:
    return kj::str("<built-in function ", text_, ">");
  case Kind::Method:
    return kj::str("<bound method ", text_, ">");
  case Kind::Data:
    return kj::str("<data>");
  case Kind::Params:
    return kj::str("<params>");
  case Kind::Rolling:
    return kj::str("Rolling(window=", window_, ")");
  }
  KJ_UNREACHABLE;
}

} // namespace evoguard::snippet
