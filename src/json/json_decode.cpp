#include "ndjson/json.hpp"

#include <fast_float/fast_float.h>
#include <simdjson.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace nj {

struct DecodeState {
  JsonFlags flags;
  int max_depth;
  int depth = 0;
};

static Value convert(DecodeState& st, simdjson::dom::element el);

static void enter(DecodeState& st) {
  if (++st.depth > st.max_depth) {
    throw JsonError(JsonError::Code::Depth, "Maximum stack depth exceeded");
  }
}

static Value convert_array(DecodeState& st, simdjson::dom::array arr) {
  enter(st);
  Value out = Value::array();
  for (simdjson::dom::element e : arr) out.push_back(convert(st, e));
  --st.depth;
  return out;
}

static Value convert_object(DecodeState& st, simdjson::dom::object obj) {
  enter(st);
  Value out = Value::object();
  for (auto field : obj) {
    // Duplicate keys: the last one wins, as set() replaces in place.
    out.set(std::string(field.key), convert(st, field.value));
  }
  --st.depth;
  return out;
}

static Value convert(DecodeState& st, simdjson::dom::element el) {
  switch (el.type()) {
    case simdjson::dom::element_type::ARRAY:
      return convert_array(st, el.get_array().value());
    case simdjson::dom::element_type::OBJECT:
      return convert_object(st, el.get_object().value());
    case simdjson::dom::element_type::INT64:
      return Value(static_cast<long long>(el.get_int64().value()));
    case simdjson::dom::element_type::UINT64: {
      // Only reached above INT64_MAX.
      const std::uint64_t u = el.get_uint64().value();
      if (st.flags & BigintAsString) return Value(std::to_string(u));
      return Value(static_cast<double>(u));
    }
    case simdjson::dom::element_type::DOUBLE:
      return Value(el.get_double().value());
    case simdjson::dom::element_type::STRING:
      return Value(el.get_string().value());
    case simdjson::dom::element_type::BOOL:
      return Value(el.get_bool().value());
    case simdjson::dom::element_type::NULL_VALUE:
      return Value();
  }
  return Value();
}

// Integers wider than 64 bits: the literal itself under BigintAsString,
// otherwise the nearest double.
static Value big_integer(DecodeState& st, std::string_view token) {
  while (!token.empty() && (token.back() == ' ' || token.back() == '\t' ||
                            token.back() == '\r' || token.back() == '\n')) {
    token.remove_suffix(1);
  }
  std::string_view digits = token;
  if (!digits.empty() && digits.front() == '-') digits.remove_prefix(1);
  const bool well_formed = !digits.empty() && digits.front() != '0' &&
      std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; });
  if (!well_formed) throw JsonError(JsonError::Code::Syntax, "Invalid number: " + std::string(token));
  if (st.flags & BigintAsString) return Value(token);
  double d = 0.0;
  auto r = fast_float::from_chars(token.data(), token.data() + token.size(), d);
  if (r.ec != std::errc() || r.ptr != token.data() + token.size()) {
    throw JsonError(JsonError::Code::Syntax, "Invalid number: " + std::string(token));
  }
  return Value(d);
}

// value:: and document:: disagree on whether these return a result wrapper.
static bool token_of(std::string_view tok, std::string_view& out) { out = tok; return true; }
static bool token_of(simdjson::simdjson_result<std::string_view> tok, std::string_view& out) {
  return !std::move(tok).get(out);
}
static bool holds_true(bool b) { return b; }
static bool holds_true(simdjson::simdjson_result<bool> r) {
  bool b = false;
  return !std::move(r).get(b) && b;
}

// Second pass over a document the DOM parser refused for a number it could
// not represent. Works on both ondemand::document and ondemand::value;
// false on any simdjson error.
template <class Node>
static bool convert_lazy(DecodeState& st, Node& node, Value& out) {
  using simdjson::ondemand::json_type;
  json_type t;
  if (node.type().get(t)) return false;
  switch (t) {
    case json_type::array: {
      simdjson::ondemand::array arr;
      if (node.get_array().get(arr)) return false;
      enter(st);
      out = Value::array();
      for (auto child : arr) {
        simdjson::ondemand::value v;
        if (std::move(child).get(v)) return false;
        Value item;
        if (!convert_lazy(st, v, item)) return false;
        out.push_back(std::move(item));
      }
      --st.depth;
      return true;
    }
    case json_type::object: {
      simdjson::ondemand::object obj;
      if (node.get_object().get(obj)) return false;
      enter(st);
      out = Value::object();
      for (auto field : obj) {
        simdjson::ondemand::field f;
        if (std::move(field).get(f)) return false;
        std::string_view key;
        if (f.unescaped_key().get(key)) return false;
        std::string name(key);
        Value item;
        if (!convert_lazy(st, f.value(), item)) return false;
        out.set(std::move(name), std::move(item));
      }
      --st.depth;
      return true;
    }
    case json_type::number: {
      simdjson::ondemand::number_type nt;
      if (node.get_number_type().get(nt)) return false;
      switch (nt) {
        case simdjson::ondemand::number_type::signed_integer: {
          std::int64_t i = 0;
          if (node.get_int64().get(i)) return false;
          out = Value(static_cast<long long>(i));
          return true;
        }
        case simdjson::ondemand::number_type::unsigned_integer: {
          std::uint64_t u = 0;
          if (node.get_uint64().get(u)) return false;
          if (st.flags & BigintAsString) out = Value(std::to_string(u));
          else out = Value(static_cast<double>(u));
          return true;
        }
        case simdjson::ondemand::number_type::floating_point_number: {
          double d = 0.0;
          if (node.get_double().get(d)) return false;
          out = Value(d);
          return true;
        }
        case simdjson::ondemand::number_type::big_integer: {
          std::string_view token;
          if (!token_of(node.raw_json_token(), token)) return false;
          out = big_integer(st, token);
          return true;
        }
      }
      return false;
    }
    case json_type::string: {
      std::string_view sv;
      if (node.get_string().get(sv)) return false;
      out = Value(sv);
      return true;
    }
    case json_type::boolean: {
      bool b = false;
      if (node.get_bool().get(b)) return false;
      out = Value(b);
      return true;
    }
    case json_type::null: {
      if (!holds_true(node.is_null())) return false;
      out = Value();
      return true;
    }
    default:
      return false;
  }
}

static bool decode_lazy(DecodeState& st, const simdjson::padded_string& padded, Value& out) {
  thread_local simdjson::ondemand::parser parser;
  const std::size_t need_depth = static_cast<std::size_t>(std::max(st.max_depth, 1)) + 1;
  if (parser.max_depth() < need_depth) {
    if (parser.allocate(std::max<std::size_t>({parser.capacity(), padded.size(), 64}), need_depth)) return false;
  }
  simdjson::ondemand::document doc;
  if (parser.iterate(padded).get(doc)) return false;
  if (!convert_lazy(st, doc, out)) return false;
  return doc.at_end();
}

Value json_decode(std::string_view text, JsonFlags flags, int depth) {
  std::string why;
  if (!json_validate_flags(flags, &why)) {
    throw JsonError(JsonError::Code::Unsupported, why);
  }

  std::string fixed;
  if ((flags & (InvalidUtf8Ignore | InvalidUtf8Substitute)) && !is_valid_utf8(text)) {
    fixed = sanitize_utf8(text, (flags & InvalidUtf8Substitute) != 0);
    text = fixed;
  }

  // thread-local parser; grows its depth budget when asked for more.
  thread_local simdjson::dom::parser parser;
  const std::size_t need_depth = static_cast<std::size_t>(std::max(depth, 1)) + 1;
  if (parser.max_depth() < need_depth) {
    auto err = parser.allocate(std::max<std::size_t>({parser.capacity(), text.size(), 64}), need_depth);
    if (err) throw JsonError(JsonError::Code::Depth, simdjson::error_message(err));
  }

  simdjson::padded_string padded(text.data(), text.size());
  simdjson::dom::element doc;
  auto err = parser.parse(padded).get(doc);
  if (err == simdjson::NUMBER_ERROR || err == simdjson::BIGINT_ERROR) {
    DecodeState lazy{flags, depth};
    Value out;
    if (decode_lazy(lazy, padded, out)) return out;
  }
  if (err) {
    const auto code = (err == simdjson::UTF8_ERROR) ? JsonError::Code::Utf8
                    : (err == simdjson::DEPTH_ERROR) ? JsonError::Code::Depth
                    : JsonError::Code::Syntax;
    throw JsonError(code, simdjson::error_message(err));
  }

  DecodeState st{flags, depth};
  return convert(st, doc);
}

}
