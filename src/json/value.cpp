#include "ndjson/value.hpp"

namespace nj {

Value Value::array(std::vector<Value> items) {
  Value v;
  v.kind_ = Kind::Array;
  v.items_ = std::move(items);
  return v;
}

Value Value::object() {
  Value v;
  v.kind_ = Kind::Object;
  return v;
}

Value Value::object(std::initializer_list<std::pair<std::string, Value>> fields) {
  Value v = object();
  for (const auto& kv : fields) v.set(kv.first, kv.second);
  return v;
}

Value Value::values() const {
  if (kind_ == Kind::Array) return *this;
  return array(items_);
}

const Value* Value::find(std::string_view key) const {
  for (std::size_t i = 0; i < keys_.size(); ++i) {
    if (keys_[i] == key) return &items_[i];
  }
  return nullptr;
}

void Value::set(std::string key, Value v) {
  if (kind_ != Kind::Object) {
    *this = object();
  }
  for (std::size_t i = 0; i < keys_.size(); ++i) {
    if (keys_[i] == key) { items_[i] = std::move(v); return; }
  }
  keys_.push_back(std::move(key));
  items_.push_back(std::move(v));
}

void Value::push_back(Value v) {
  if (kind_ != Kind::Array) {
    *this = array();
  }
  items_.push_back(std::move(v));
}

bool operator==(const Value& a, const Value& b) {
  if (a.kind_ != b.kind_) return false;
  switch (a.kind_) {
    case Value::Kind::Null:   return true;
    case Value::Kind::Bool:   return a.b_ == b.b_;
    case Value::Kind::Int:    return a.i_ == b.i_;
    case Value::Kind::Double: return a.d_ == b.d_;
    case Value::Kind::String: return a.s_ == b.s_;
    case Value::Kind::Array:  return a.items_ == b.items_;
    case Value::Kind::Object: return a.keys_ == b.keys_ && a.items_ == b.items_;
  }
  return false;
}

const char* kind_name(Value::Kind k) noexcept {
  switch (k) {
    case Value::Kind::Null:   return "null";
    case Value::Kind::Bool:   return "bool";
    case Value::Kind::Int:    return "int";
    case Value::Kind::Double: return "double";
    case Value::Kind::String: return "string";
    case Value::Kind::Array:  return "array";
    case Value::Kind::Object: return "object";
  }
  return "unknown";
}

}
