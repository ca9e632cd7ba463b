#pragma once
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nj {

// JSON DOM node. Objects keep insertion order: keys_[i] names items_[i].
// Arrays use items_ only.
class Value {
public:
  enum class Kind : std::uint8_t { Null, Bool, Int, Double, String, Array, Object };

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : kind_(Kind::Bool), b_(b) {}
  Value(int i) : kind_(Kind::Int), i_(i) {}
  Value(long i) : kind_(Kind::Int), i_(i) {}
  Value(long long i) : kind_(Kind::Int), i_(static_cast<std::int64_t>(i)) {}
  Value(double d) : kind_(Kind::Double), d_(d) {}
  Value(const char* s) : kind_(Kind::String), s_(s) {}
  Value(std::string s) : kind_(Kind::String), s_(std::move(s)) {}
  Value(std::string_view s) : kind_(Kind::String), s_(s) {}

  static Value array(std::vector<Value> items = {});
  static Value object();
  static Value object(std::initializer_list<std::pair<std::string, Value>> fields);

  Kind kind() const noexcept { return kind_; }
  bool is_null() const noexcept { return kind_ == Kind::Null; }
  bool is_bool() const noexcept { return kind_ == Kind::Bool; }
  bool is_int() const noexcept { return kind_ == Kind::Int; }
  bool is_double() const noexcept { return kind_ == Kind::Double; }
  bool is_number() const noexcept { return kind_ == Kind::Int || kind_ == Kind::Double; }
  bool is_string() const noexcept { return kind_ == Kind::String; }
  bool is_array() const noexcept { return kind_ == Kind::Array; }
  bool is_object() const noexcept { return kind_ == Kind::Object; }
  bool is_container() const noexcept { return is_array() || is_object(); }
  // null is not a scalar.
  bool is_scalar() const noexcept { return !is_null() && !is_container(); }

  // Accessors assume the kind matches.
  bool as_bool() const noexcept { return b_; }
  std::int64_t as_int() const noexcept { return i_; }
  double as_double() const noexcept { return kind_ == Kind::Int ? static_cast<double>(i_) : d_; }
  const std::string& as_string() const noexcept { return s_; }

  // Array elements or object values, in order.
  const std::vector<Value>& items() const noexcept { return items_; }
  std::vector<Value>& items() noexcept { return items_; }
  // Object keys; empty for anything else.
  const std::vector<std::string>& keys() const noexcept { return keys_; }

  std::size_t size() const noexcept { return items_.size(); }
  bool empty() const noexcept { return items_.empty(); }

  // Positional view: array copy, or object values in key order.
  Value values() const;

  const Value* find(std::string_view key) const;
  // Insert or replace; a replaced key keeps its position.
  void set(std::string key, Value v);
  void push_back(Value v);

  friend bool operator==(const Value& a, const Value& b);
  friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
  Kind kind_{Kind::Null};
  bool b_{false};
  std::int64_t i_{0};
  double d_{0.0};
  std::string s_;
  std::vector<Value> items_;
  std::vector<std::string> keys_;
};

const char* kind_name(Value::Kind k) noexcept;

}
