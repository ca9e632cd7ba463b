#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ndjson/record.hpp"
#include "ndjson/value.hpp"

namespace nj {

// Shape of the records on the wire.
enum class Format {
  Record,         // one object per line, no header
  List,           // one positional array per line
  ListWithHeader  // positional arrays, first line (or an explicit header) names the fields
};

// "record", "list", "list-header".
std::optional<Format> format_from_name(std::string_view name);
std::string_view format_name(Format f);

// One header entry: the field at `position` in a row is called `name`.
struct HeaderField {
  std::int64_t position = 0;
  Value name;
};

using Header = std::vector<HeaderField>;

// Where the header comes from: nowhere, a row of the data itself, or the
// caller.
class HeaderOption {
public:
  HeaderOption() = default;

  static HeaderOption none() { return HeaderOption(); }
  static HeaderOption offset(std::int64_t row);
  static HeaderOption names(const std::vector<std::string>& names);
  static HeaderOption fields(Header fields);

  bool has_offset() const noexcept { return offset_.has_value(); }
  std::int64_t row() const noexcept { return offset_.value_or(-1); }
  const Header& explicit_fields() const noexcept { return fields_; }

private:
  std::optional<std::int64_t> offset_;
  Header fields_;
};

struct ResolvedHeader {
  Header fields;
  std::optional<std::int64_t> offset;  // set when the header was looked up by row
};

using RecordHook = std::shared_ptr<const RecordFn>;

// Explicit names must all be strings. A row offset must be >= 0; the row at
// that position supplies its values (positional row) or its keys (object
// row). A missing or scalar row gives an empty header. Rows consumed while
// looking are replayed by `data`.
ResolvedHeader resolve_header(PeekReader& data, const HeaderOption& opt);

// Names must be scalar and unique (compared as object keys), positions >= 0.
// Throws InvalidArgument.
void validate_header(const Header& header);

// Object key a header name stands for.
std::string header_key(const Value& name);

// Positional view of a record: array as-is, object values in key order.
// Throws InvalidArgument for anything else.
Value to_positional(Value record, std::int64_t offset);

// Encode direction: formatter, then reshape `values` to `format`. For
// ListWithHeader the header row comes first followed by every record as a
// list.
RecordReaderPtr prepare(RecordReaderPtr values, Format format, const HeaderOption& opt,
                        const RecordHook& formatter);

// Decode direction: resolve the header against decoded records, drop the
// header row (ListWithHeader only), zip rows into objects, then map.
RecordReaderPtr reshape(RecordReaderPtr decoded, Format format, const HeaderOption& opt,
                        const RecordHook& mapper);

}
