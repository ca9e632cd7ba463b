#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "ndjson/codec.hpp"

namespace nj {

// One-call helpers over a default Codec. With Format::ListWithHeader the
// header is row 0 of the data.

std::string ndjson_encode(std::vector<Value> values, JsonFlags flags = 0,
                          int depth = kDefaultDepth, Format format = Format::Record);
std::string ndjson_encode(RecordReaderPtr values, JsonFlags flags = 0,
                          int depth = kDefaultDepth, Format format = Format::Record);

RecordReaderPtr ndjson_decode(std::string ndjson, JsonFlags flags = 0,
                              int depth = kDefaultDepth, Format format = Format::Record);

std::size_t ndjson_write(RecordReaderPtr values, const std::string& path, JsonFlags flags = 0,
                         int depth = kDefaultDepth, Format format = Format::Record);
std::size_t ndjson_write(RecordReaderPtr values, LineStream& sink, JsonFlags flags = 0,
                         int depth = kDefaultDepth, Format format = Format::Record);

RecordReaderPtr ndjson_read(const std::string& path, JsonFlags flags = 0,
                            int depth = kDefaultDepth, Format format = Format::Record);
RecordReaderPtr ndjson_read(LineStream source, JsonFlags flags = 0,
                            int depth = kDefaultDepth, Format format = Format::Record);

}
