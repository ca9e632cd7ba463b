#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ndjson/errors.hpp"
#include "ndjson/value.hpp"

namespace nj {

// Encoder/decoder options. Bits are stable; combine with |.
enum JsonFlag : std::uint32_t {
  HexTag                   = 1u << 0,
  HexAmp                   = 1u << 1,
  HexApos                  = 1u << 2,
  HexQuot                  = 1u << 3,
  ForceObject              = 1u << 4,
  NumericCheck             = 1u << 5,
  UnescapedSlashes         = 1u << 6,
  PrettyPrint              = 1u << 7,
  UnescapedUnicode         = 1u << 8,
  PartialOutputOnError     = 1u << 9,
  PreserveZeroFraction     = 1u << 10,
  UnescapedLineTerminators = 1u << 11,
  ObjectAsArray            = 1u << 12, // decode only
  BigintAsString           = 1u << 13, // decode only
  InvalidUtf8Ignore        = 1u << 14,
  InvalidUtf8Substitute    = 1u << 15,
  ThrowOnError             = 1u << 16,
};

using JsonFlags = std::uint32_t;

constexpr JsonFlags kAllJsonFlags = (1u << 17) - 1;
constexpr int kDefaultDepth = 512;

struct JsonFlagName {
  std::string_view name;
  JsonFlag flag;
};

// Kebab-case name of every flag, in bit order.
constexpr JsonFlagName kJsonFlagNames[] = {
  {"hex-tag", HexTag},
  {"hex-amp", HexAmp},
  {"hex-apos", HexApos},
  {"hex-quot", HexQuot},
  {"force-object", ForceObject},
  {"numeric-check", NumericCheck},
  {"unescaped-slashes", UnescapedSlashes},
  {"pretty-print", PrettyPrint},
  {"unescaped-unicode", UnescapedUnicode},
  {"partial-output-on-error", PartialOutputOnError},
  {"preserve-zero-fraction", PreserveZeroFraction},
  {"unescaped-line-terminators", UnescapedLineTerminators},
  {"object-as-array", ObjectAsArray},
  {"bigint-as-string", BigintAsString},
  {"invalid-utf8-ignore", InvalidUtf8Ignore},
  {"invalid-utf8-substitute", InvalidUtf8Substitute},
  {"throw-on-error", ThrowOnError},
};

std::optional<JsonFlag> json_flag_from_name(std::string_view name);
std::string_view json_flag_name(JsonFlag flag);

// False (with a reason in err_out) for unknown bits or contradictory options.
bool json_validate_flags(JsonFlags flags, std::string* err_out = nullptr);

// Raised by json_encode/json_decode.
class JsonError : public Error {
public:
  enum class Code { Depth, Syntax, Utf8, InfOrNan, Unsupported };

  JsonError(Code code, const std::string& msg) : Error(msg), code_(code) {}
  Code code() const noexcept { return code_; }

private:
  Code code_;
};

// Containers may nest at most `depth` levels. Throws JsonError.
std::string json_encode(const Value& v, JsonFlags flags = 0, int depth = kDefaultDepth);

// Objects always decode as Value objects. Throws JsonError.
Value json_decode(std::string_view text, JsonFlags flags = 0, int depth = kDefaultDepth);

// Drop (or replace with U+FFFD when `substitute`) invalid UTF-8 sequences.
std::string sanitize_utf8(std::string_view s, bool substitute);
bool is_valid_utf8(std::string_view s);

}
