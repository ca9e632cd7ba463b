#include "ndjson/json.hpp"

#include <fast_float/fast_float.h>
#include <simdjson.h>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace nj {

// Length of the UTF-8 sequence starting at s[i] (code point in *cp),
// or 0 when the bytes there are not well-formed.
static std::size_t utf8_next(std::string_view s, std::size_t i, std::uint32_t* cp) {
  const auto c0 = static_cast<unsigned char>(s[i]);
  if (c0 < 0x80) { *cp = c0; return 1; }

  std::size_t len = 0;
  std::uint32_t min = 0;
  std::uint32_t v = 0;
  if ((c0 & 0xE0) == 0xC0)      { len = 2; min = 0x80;    v = c0 & 0x1F; }
  else if ((c0 & 0xF0) == 0xE0) { len = 3; min = 0x800;   v = c0 & 0x0F; }
  else if ((c0 & 0xF8) == 0xF0) { len = 4; min = 0x10000; v = c0 & 0x07; }
  else return 0;

  if (i + len > s.size()) return 0;
  for (std::size_t k = 1; k < len; ++k) {
    const auto c = static_cast<unsigned char>(s[i + k]);
    if ((c & 0xC0) != 0x80) return 0;
    v = (v << 6) | (c & 0x3F);
  }
  if (v < min || v > 0x10FFFF || (v >= 0xD800 && v <= 0xDFFF)) return 0;
  *cp = v;
  return len;
}

bool is_valid_utf8(std::string_view s) {
  return simdjson::validate_utf8(s.data(), s.size());
}

std::string sanitize_utf8(std::string_view s, bool substitute) {
  std::string out;
  out.reserve(s.size());
  std::uint32_t cp = 0;
  for (std::size_t i = 0; i < s.size();) {
    std::size_t n = utf8_next(s, i, &cp);
    if (n == 0) {
      if (substitute) out.append("\xEF\xBF\xBD");
      ++i;
      continue;
    }
    out.append(s.substr(i, n));
    i += n;
  }
  return out;
}

struct EncodeState {
  JsonFlags flags;
  int max_depth;
  int depth = 0;
  std::string out;

  bool has(JsonFlag f) const { return (flags & f) != 0; }
};

static void append_u16(std::string& o, std::uint32_t u) {
  static const char* hex = "0123456789abcdef";
  o += "\\u";
  o += hex[(u >> 12) & 0xF];
  o += hex[(u >> 8) & 0xF];
  o += hex[(u >> 4) & 0xF];
  o += hex[u & 0xF];
}

static void append_codepoint(std::string& o, std::uint32_t cp) {
  if (cp < 0x10000) { append_u16(o, cp); return; }
  cp -= 0x10000;
  append_u16(o, 0xD800 | (cp >> 10));
  append_u16(o, 0xDC00 | (cp & 0x3FF));
}

// Strings with a pure numeric form are emitted as numbers under NumericCheck.
static bool numeric_value(std::string_view s, Value& out) {
  if (s.empty()) return false;
  const char c = s.front();
  if (!(c == '-' || c == '.' || (c >= '0' && c <= '9'))) return false;

  std::int64_t i = 0;
  auto ir = std::from_chars(s.data(), s.data() + s.size(), i);
  if (ir.ec == std::errc() && ir.ptr == s.data() + s.size()) {
    out = Value(static_cast<long long>(i));
    return true;
  }

  double d = 0.0;
  auto dr = fast_float::from_chars(s.data(), s.data() + s.size(), d);
  if (dr.ec != std::errc() || dr.ptr != s.data() + s.size()) return false;
  out = Value(d);
  return true;
}

static void write_double(EncodeState& st, double d) {
  if (!std::isfinite(d)) {
    if (st.has(PartialOutputOnError)) { st.out += '0'; return; }
    throw JsonError(JsonError::Code::InfOrNan, "Inf and NaN cannot be JSON encoded");
  }
  char buf[64];
  auto r = std::to_chars(buf, buf + sizeof(buf), d);
  std::string_view txt(buf, static_cast<std::size_t>(r.ptr - buf));
  st.out.append(txt);
  if (st.has(PreserveZeroFraction) && txt.find_first_of(".eEn") == std::string_view::npos) {
    st.out += ".0";
  }
}

static void write_string(EncodeState& st, std::string_view raw, bool is_key) {
  if (!is_key && st.has(NumericCheck)) {
    Value num;
    if (numeric_value(raw, num)) {
      if (num.is_int()) st.out += std::to_string(num.as_int());
      else write_double(st, num.as_double());
      return;
    }
  }

  std::string fixed;
  std::string_view s = raw;
  if (!is_valid_utf8(s)) {
    if (st.has(InvalidUtf8Ignore) || st.has(InvalidUtf8Substitute)) {
      fixed = sanitize_utf8(s, st.has(InvalidUtf8Substitute));
      s = fixed;
    } else if (st.has(PartialOutputOnError)) {
      st.out += is_key ? "\"\"" : "null";
      return;
    } else {
      throw JsonError(JsonError::Code::Utf8, "Malformed UTF-8 characters, possibly incorrectly encoded");
    }
  }

  std::string& o = st.out;
  o += '"';
  std::uint32_t cp = 0;
  for (std::size_t i = 0; i < s.size();) {
    const std::size_t n = utf8_next(s, i, &cp);
    if (n > 1) {
      const bool line_term = (cp == 0x2028 || cp == 0x2029);
      if (!st.has(UnescapedUnicode) || (line_term && !st.has(UnescapedLineTerminators))) {
        append_codepoint(o, cp);
      } else {
        o.append(s.substr(i, n));
      }
      i += n;
      continue;
    }
    const char c = s[i++];
    switch (c) {
      case '"':
        if (st.has(HexQuot)) o += "\\u0022"; else o += "\\\"";
        break;
      case '\\': o += "\\\\"; break;
      case '/':
        if (st.has(UnescapedSlashes)) o += '/'; else o += "\\/";
        break;
      case '\b': o += "\\b"; break;
      case '\f': o += "\\f"; break;
      case '\n': o += "\\n"; break;
      case '\r': o += "\\r"; break;
      case '\t': o += "\\t"; break;
      case '<':
        if (st.has(HexTag)) o += "\\u003C"; else o += c;
        break;
      case '>':
        if (st.has(HexTag)) o += "\\u003E"; else o += c;
        break;
      case '&':
        if (st.has(HexAmp)) o += "\\u0026"; else o += c;
        break;
      case '\'':
        if (st.has(HexApos)) o += "\\u0027"; else o += c;
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) append_u16(o, static_cast<unsigned char>(c));
        else o += c;
        break;
    }
  }
  o += '"';
}

static void newline_indent(EncodeState& st) {
  if (!st.has(PrettyPrint)) return;
  st.out += '\n';
  st.out.append(static_cast<std::size_t>(st.depth) * 4, ' ');
}

static void write_value(EncodeState& st, const Value& v);

static void enter(EncodeState& st) {
  if (++st.depth > st.max_depth) {
    throw JsonError(JsonError::Code::Depth, "Maximum stack depth exceeded");
  }
}

static void write_container(EncodeState& st, const Value& v) {
  const bool as_object = v.is_object() || st.has(ForceObject);
  const char open = as_object ? '{' : '[';
  const char close = as_object ? '}' : ']';

  enter(st);
  st.out += open;
  if (v.empty()) {
    --st.depth;
    st.out += close;
    return;
  }

  const auto& items = v.items();
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i) st.out += ',';
    newline_indent(st);
    if (as_object) {
      if (v.is_object()) write_string(st, v.keys()[i], true);
      else write_string(st, std::to_string(i), true);
      st.out += st.has(PrettyPrint) ? ": " : ":";
    }
    write_value(st, items[i]);
  }
  --st.depth;
  newline_indent(st);
  st.out += close;
}

static void write_value(EncodeState& st, const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Null:   st.out += "null"; break;
    case Value::Kind::Bool:   st.out += v.as_bool() ? "true" : "false"; break;
    case Value::Kind::Int:    st.out += std::to_string(v.as_int()); break;
    case Value::Kind::Double: write_double(st, v.as_double()); break;
    case Value::Kind::String: write_string(st, v.as_string(), false); break;
    case Value::Kind::Array:
    case Value::Kind::Object: write_container(st, v); break;
  }
}

std::string json_encode(const Value& v, JsonFlags flags, int depth) {
  std::string why;
  if (!json_validate_flags(flags, &why)) {
    throw JsonError(JsonError::Code::Unsupported, why);
  }
  EncodeState st{flags, depth};
  write_value(st, v);
  return std::move(st.out);
}

std::optional<JsonFlag> json_flag_from_name(std::string_view name) {
  for (const auto& f : kJsonFlagNames) {
    if (f.name == name) return f.flag;
  }
  return std::nullopt;
}

std::string_view json_flag_name(JsonFlag flag) {
  for (const auto& f : kJsonFlagNames) {
    if (f.flag == flag) return f.name;
  }
  return {};
}

bool json_validate_flags(JsonFlags flags, std::string* err_out) {
  if ((flags & ~kAllJsonFlags) != 0) {
    if (err_out) *err_out = "unknown JSON flag bits: " + std::to_string(flags & ~kAllJsonFlags);
    return false;
  }
  if ((flags & InvalidUtf8Ignore) && (flags & InvalidUtf8Substitute)) {
    if (err_out) *err_out = "invalid-utf8-ignore and invalid-utf8-substitute are mutually exclusive";
    return false;
  }
  return true;
}

}
