#pragma once
#include <cstddef>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ndjson/json.hpp"
#include "ndjson/line_stream.hpp"
#include "ndjson/record.hpp"
#include "ndjson/record_encoder.hpp"
#include "ndjson/tabular.hpp"

namespace nj {

// Immutable NDJSON codec. Setters return a new Codec and leave this one
// untouched; a setter that would not change anything returns a Codec
// sharing the same state. Safe to share between threads.
class Codec {
public:
  struct Config {
    JsonFlags   flags      = 0;
    int         depth      = kDefaultDepth;
    std::size_t chunk_size = 1;
    RecordFn    formatter;  // applied before encoding
    RecordFn    mapper;     // applied after decoding
  };

  // Throws InvalidArgument for bad flags, depth < 1 or chunk_size < 1.
  Codec();
  explicit Codec(Config cfg);

  // --- flags
  Codec add_flags(JsonFlags flags) const;
  Codec remove_flags(JsonFlags flags) const;
  // True when every bit of `flags` is set; false for an empty mask.
  bool use_flags(JsonFlags flags) const noexcept;

  Codec with(JsonFlag flag) const { return add_flags(flag); }
  Codec without(JsonFlag flag) const { return remove_flags(flag); }
  bool uses(JsonFlag flag) const noexcept { return use_flags(flag); }

  // --- options
  Codec with_depth(int depth) const;
  Codec with_chunk_size(std::size_t chunk_size) const;
  Codec with_formatter(RecordFn formatter) const;
  Codec without_formatter() const;
  Codec with_mapper(RecordFn mapper) const;
  Codec without_mapper() const;

  JsonFlags flags() const noexcept;
  int depth() const noexcept;
  std::size_t chunk_size() const noexcept;
  bool has_formatter() const noexcept;
  bool has_mapper() const noexcept;

  // Same option values and the same hook instances.
  bool operator==(const Codec& other) const noexcept;
  bool operator!=(const Codec& other) const noexcept { return !(*this == other); }

  // --- encoding
  std::string encode(RecordReaderPtr values, Format format = Format::Record,
                     const HeaderOption& header = HeaderOption()) const;
  std::string encode(std::vector<Value> values, Format format = Format::Record,
                     const HeaderOption& header = HeaderOption()) const;

  ChunkStream chunk(RecordReaderPtr values, Format format = Format::Record,
                    const HeaderOption& header = HeaderOption()) const;

  // Sink stays open; a path is opened for writing and closed afterwards.
  std::size_t write(RecordReaderPtr values, LineStream& sink, Format format = Format::Record,
                    const HeaderOption& header = HeaderOption()) const;
  std::size_t write(RecordReaderPtr values, const std::string& path, Format format = Format::Record,
                    const HeaderOption& header = HeaderOption()) const;

  std::size_t download(RecordReaderPtr values, const std::optional<std::string>& filename,
                       Format format = Format::Record,
                       const HeaderOption& header = HeaderOption(),
                       std::FILE* out = stdout) const;

  // --- decoding
  RecordReaderPtr decode(std::string ndjson, Format format = Format::Record,
                         const HeaderOption& header = HeaderOption()) const;
  RecordReaderPtr read(LineStream source, Format format = Format::Record,
                       const HeaderOption& header = HeaderOption()) const;
  RecordReaderPtr read(const std::string& path, Format format = Format::Record,
                       const HeaderOption& header = HeaderOption()) const;

private:
  struct State {
    JsonFlags   flags;
    int         depth;
    std::size_t chunk_size;
    RecordHook  formatter;
    RecordHook  mapper;
  };

  explicit Codec(std::shared_ptr<const State> s) : s_(std::move(s)) {}
  Codec rebuild(State next) const;

  RecordEncoder encoder() const;
  RecordReaderPtr prepared(RecordReaderPtr values, Format format, const HeaderOption& header) const;

  std::shared_ptr<const State> s_;
};

}
