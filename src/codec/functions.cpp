#include "ndjson/functions.hpp"

#include <utility>

namespace nj {

static Codec codec_for(JsonFlags flags, int depth) {
  return Codec().add_flags(flags).with_depth(depth);
}

static HeaderOption header_for(Format format) {
  return format == Format::ListWithHeader ? HeaderOption::offset(0) : HeaderOption::none();
}

std::string ndjson_encode(std::vector<Value> values, JsonFlags flags, int depth, Format format) {
  return ndjson_encode(from_values(std::move(values)), flags, depth, format);
}

std::string ndjson_encode(RecordReaderPtr values, JsonFlags flags, int depth, Format format) {
  return codec_for(flags, depth).encode(std::move(values), format, header_for(format));
}

RecordReaderPtr ndjson_decode(std::string ndjson, JsonFlags flags, int depth, Format format) {
  return codec_for(flags, depth).decode(std::move(ndjson), format, header_for(format));
}

std::size_t ndjson_write(RecordReaderPtr values, const std::string& path, JsonFlags flags,
                         int depth, Format format) {
  return codec_for(flags, depth).write(std::move(values), path, format, header_for(format));
}

std::size_t ndjson_write(RecordReaderPtr values, LineStream& sink, JsonFlags flags,
                         int depth, Format format) {
  return codec_for(flags, depth).write(std::move(values), sink, format, header_for(format));
}

RecordReaderPtr ndjson_read(const std::string& path, JsonFlags flags, int depth, Format format) {
  return codec_for(flags, depth).read(path, format, header_for(format));
}

RecordReaderPtr ndjson_read(LineStream source, JsonFlags flags, int depth, Format format) {
  return codec_for(flags, depth).read(std::move(source), format, header_for(format));
}

}
