#include "ndjson/record_decoder.hpp"
#include "ndjson/errors.hpp"

#include <exception>
#include <string>
#include <utility>

namespace nj {

static void validate(const RecordDecoder::Config& cfg) {
  std::string err;
  if (!json_validate_flags(cfg.flags, &err)) throw InvalidArgument(err);
  if (cfg.depth < 1) throw InvalidArgument("The depth value must be greater than 0.");
}

struct LineDecodeReader : RecordReader {
  LineStream stream;
  JsonFlags flags;
  int depth;

  LineDecodeReader(LineStream s, JsonFlags f, int d) : stream(std::move(s)), flags(f), depth(d) {}

  bool read_next(Record& out) override {
    const std::string* line = stream.current();
    if (!line) return false;

    const std::int64_t offset = stream.line();
    std::string raw = *line;
    stream.advance();

    try {
      out.value = json_decode(raw, flags, depth);
    } catch (const JsonError& e) {
      throw DecodingFailed("Unable to decode the json line: " + std::string(e.what()),
                           Value(std::move(raw)), offset, std::current_exception());
    }
    out.offset = offset;
    return true;
  }
};

RecordDecoder::RecordDecoder() : RecordDecoder(Config{}) {}

RecordDecoder::RecordDecoder(Config cfg) : cfg_(cfg) { validate(cfg_); }

RecordReaderPtr RecordDecoder::decode(LineStream stream) const {
  // Objects always come back as objects; key order is kept either way.
  const JsonFlags flags = (cfg_.flags | ThrowOnError) & ~(ObjectAsArray | ForceObject);
  return std::make_unique<LineDecodeReader>(std::move(stream), flags, cfg_.depth);
}

RecordReaderPtr RecordDecoder::decode_string(std::string ndjson) const {
  return decode(LineStream::from_string(std::move(ndjson)));
}

RecordReaderPtr RecordDecoder::read(const std::string& path) const {
  return decode(LineStream::open(path, LineStream::Mode::Read));
}

}
