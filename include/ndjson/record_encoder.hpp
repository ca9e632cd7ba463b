#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ndjson/json.hpp"
#include "ndjson/line_stream.hpp"
#include "ndjson/record.hpp"

namespace nj {

// Lazy sequence of encoded NDJSON chunks. Every chunk holds up to
// `chunk_size` newline-terminated lines. An empty input yields the single
// chunk "[]".
class ChunkStream {
public:
  ChunkStream(RecordReaderPtr values, JsonFlags flags, int depth, std::size_t chunk_size);

  // False when exhausted. Throws EncodingFailed for an unencodable record;
  // chunks already returned stay valid.
  bool read_next(std::string& chunk);

  // Offset of the last record pulled from the input, -1 before the first.
  std::int64_t last_offset() const noexcept { return last_offset_; }

private:
  RecordReaderPtr values_;
  JsonFlags flags_;
  int depth_;
  std::size_t chunk_size_;
  std::int64_t last_offset_{-1};
  bool saw_data_{false};
  bool done_{false};
};

using HeaderLines = std::vector<std::pair<std::string, std::string>>;

// Attachment headers for an NDJSON download, in emission order. Empty when
// no filename is given. Throws InvalidArgument if the name contains '/' or '\'.
HeaderLines attachment_headers(const std::optional<std::string>& filename);

class RecordEncoder {
public:
  struct Config {
    JsonFlags   flags      = 0;
    int         depth      = kDefaultDepth;
    std::size_t chunk_size = 1;
  };

  // Throws InvalidArgument for bad flags, depth < 1 or chunk_size < 1.
  RecordEncoder();
  explicit RecordEncoder(Config cfg);

  ChunkStream convert(RecordReaderPtr values) const;

  // Drain into `sink`; returns bytes written. Sink failures are reported
  // as EncodingFailed attributed to the last attempted offset.
  std::size_t write(RecordReaderPtr values, LineStream& sink) const;
  // Opens `path` for writing and closes it afterwards.
  std::size_t write(RecordReaderPtr values, const std::string& path) const;

  std::string encode(RecordReaderPtr values) const;

  // Writes attachment headers (CGI style, blank line terminated) and then
  // the body to `out`.
  std::size_t download(RecordReaderPtr values,
                       const std::optional<std::string>& filename,
                       std::FILE* out = stdout) const;

  const Config& config() const noexcept { return cfg_; }

private:
  Config cfg_;
};

}
