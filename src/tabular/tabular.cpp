#include "ndjson/tabular.hpp"
#include "ndjson/errors.hpp"
#include "ndjson/json.hpp"

#include <exception>
#include <string>
#include <unordered_set>
#include <utility>

namespace nj {

std::optional<Format> format_from_name(std::string_view name) {
  if (name == "record") return Format::Record;
  if (name == "list") return Format::List;
  if (name == "list-header" || name == "list-with-header") return Format::ListWithHeader;
  return std::nullopt;
}

std::string_view format_name(Format f) {
  switch (f) {
    case Format::Record: return "record";
    case Format::List: return "list";
    case Format::ListWithHeader: return "list-header";
  }
  return "record";
}

HeaderOption HeaderOption::offset(std::int64_t row) {
  HeaderOption o;
  o.offset_ = row;
  return o;
}

HeaderOption HeaderOption::names(const std::vector<std::string>& names) {
  HeaderOption o;
  o.fields_.reserve(names.size());
  for (std::size_t i = 0; i < names.size(); ++i) {
    o.fields_.push_back(HeaderField{static_cast<std::int64_t>(i), Value(names[i])});
  }
  return o;
}

HeaderOption HeaderOption::fields(Header fields) {
  HeaderOption o;
  o.fields_ = std::move(fields);
  return o;
}

std::string header_key(const Value& name) {
  switch (name.kind()) {
    case Value::Kind::String: return name.as_string();
    case Value::Kind::Int: return std::to_string(name.as_int());
    case Value::Kind::Bool: return name.as_bool() ? "1" : "0";
    case Value::Kind::Double: return json_encode(name);
    default: break;
  }
  throw InvalidArgument("The header mapper must only contain scalar values.");
}

static Header header_from_row(const Value& row) {
  Header h;
  if (row.is_array()) {
    const auto& items = row.items();
    for (std::size_t i = 0; i < items.size(); ++i) {
      h.push_back(HeaderField{static_cast<std::int64_t>(i), items[i]});
    }
  } else if (row.is_object()) {
    const auto& keys = row.keys();
    for (std::size_t i = 0; i < keys.size(); ++i) {
      h.push_back(HeaderField{static_cast<std::int64_t>(i), Value(keys[i])});
    }
  }
  return h;
}

ResolvedHeader resolve_header(PeekReader& data, const HeaderOption& opt) {
  ResolvedHeader out;
  if (!opt.explicit_fields().empty()) {
    for (const auto& f : opt.explicit_fields()) {
      if (!f.name.is_string()) throw InvalidArgument("The header must contain string values only.");
    }
    out.fields = opt.explicit_fields();
    return out;
  }

  if (!opt.has_offset()) return out;

  if (opt.row() < 0) {
    throw InvalidArgument("Invalid header option, the header offset must be an integer greater or equal to 0.");
  }
  out.offset = opt.row();

  Record row;
  if (data.peek(static_cast<std::size_t>(opt.row()), row)) out.fields = header_from_row(row.value);
  return out;
}

void validate_header(const Header& header) {
  std::unordered_set<std::string> seen;
  for (const auto& f : header) {
    if (!f.name.is_scalar()) throw InvalidArgument("The header mapper must only contain scalar values.");
    if (!seen.insert(header_key(f.name)).second) {
      throw InvalidArgument("The header must contain unique values.");
    }
    if (f.position < 0) {
      throw InvalidArgument("The header mapper indexes should only contain positive integer or 0.");
    }
  }
}

Value to_positional(Value record, std::int64_t offset) {
  if (record.is_array()) return record;
  if (record.is_object()) return record.values();
  throw InvalidArgument("Unable to convert the record at offset " + std::to_string(offset) +
                        " into an array; " + kind_name(record.kind()) + " given.");
}

static RecordFn guard_formatter(RecordHook hook) {
  return [hook](Value v, std::int64_t offset) -> Value {
    try {
      return (*hook)(v, offset);
    } catch (const EncodingFailed&) {
      throw;
    } catch (const std::exception& e) {
      throw EncodingFailed("Unable to format data: " + std::string(e.what()),
                           std::move(v), offset, std::current_exception());
    }
  };
}

static RecordFn guard_mapper(RecordHook hook) {
  return [hook](Value v, std::int64_t offset) -> Value {
    try {
      return (*hook)(v, offset);
    } catch (const DecodingFailed&) {
      throw;
    } catch (const std::exception& e) {
      throw DecodingFailed("Unable to map the record: " + std::string(e.what()),
                           std::move(v), offset, std::current_exception());
    }
  };
}

RecordReaderPtr prepare(RecordReaderPtr values, Format format, const HeaderOption& opt,
                        const RecordHook& formatter) {
  RecordReaderPtr records = std::move(values);
  if (formatter) records = map_records(std::move(records), guard_formatter(formatter));

  if (format == Format::Record) return records;
  if (format == Format::List) return map_records(std::move(records), to_positional);

  auto peek = std::make_unique<PeekReader>(std::move(records));
  ResolvedHeader header = resolve_header(*peek, opt);
  if (header.fields.empty()) {
    throw InvalidArgument("A non-empty header required when using the list-header format.");
  }

  Value row = Value::array();
  for (auto& f : header.fields) row.push_back(std::move(f.name));

  return prepend_record(Record{0, std::move(row)},
                        map_records(std::move(peek), to_positional));
}

// Rows become objects keyed by the header; missing positions are null.
static RecordFn zip_rows(Header header, Format format) {
  std::vector<std::string> keys;
  keys.reserve(header.size());
  for (const auto& f : header) keys.push_back(header_key(f.name));

  return [header = std::move(header), keys = std::move(keys), format](Value record, std::int64_t offset) -> Value {
    if (!record.is_container()) {
      throw InvalidArgument("The record at offset " + std::to_string(offset) +
                            " is expected to be an array or an object; " +
                            kind_name(record.kind()) + " given.");
    }
    const std::vector<Value>& row = record.items();

    Value out = Value::object();
    for (std::size_t i = 0; i < header.size(); ++i) {
      const auto pos = static_cast<std::size_t>(header[i].position);
      out.set(keys[i], pos < row.size() ? row[pos] : Value());
    }
    if (format == Format::List) return out.values();
    return out;
  };
}

RecordReaderPtr reshape(RecordReaderPtr decoded, Format format, const HeaderOption& opt,
                        const RecordHook& mapper) {
  auto peek = std::make_unique<PeekReader>(std::move(decoded));
  ResolvedHeader header = resolve_header(*peek, opt);

  if (!header.offset && header.fields.empty() && format == Format::ListWithHeader) {
    throw InvalidArgument("A valid header or header offset must be provided with the list-header format.");
  }

  RecordReaderPtr records = std::move(peek);
  if (header.offset && format == Format::ListWithHeader) {
    // Only a positional row at the header offset is the header itself.
    const std::int64_t at = *header.offset;
    records = filter_records(std::move(records), [at](const Record& r) {
      return r.offset != at || !r.value.is_array();
    });
  }

  if (header.fields.empty()) {
    if (format == Format::List) records = map_records(std::move(records), to_positional);
  } else {
    validate_header(header.fields);
    records = map_records(std::move(records), zip_rows(std::move(header.fields), format));
  }

  if (mapper) records = map_records(std::move(records), guard_mapper(mapper));
  return records;
}

}
