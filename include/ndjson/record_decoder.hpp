#pragma once
#include <string>

#include "ndjson/json.hpp"
#include "ndjson/line_stream.hpp"
#include "ndjson/record.hpp"

namespace nj {

// Turns NDJSON lines into a lazy sequence of decoded values. Offsets count
// non-blank lines from zero. A malformed line raises DecodingFailed when it
// is pulled, carrying the raw line, its offset and the JsonError.
class RecordDecoder {
public:
  struct Config {
    JsonFlags flags = 0;
    int       depth = kDefaultDepth;
  };

  // Throws InvalidArgument for bad flags or depth < 1.
  RecordDecoder();
  explicit RecordDecoder(Config cfg);

  // The returned reader owns the stream and releases it when destroyed.
  RecordReaderPtr decode(LineStream stream) const;
  RecordReaderPtr decode_string(std::string ndjson) const;
  RecordReaderPtr read(const std::string& path) const;

  const Config& config() const noexcept { return cfg_; }

private:
  Config cfg_;
};

}
