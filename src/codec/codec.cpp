#include "ndjson/codec.hpp"
#include "ndjson/errors.hpp"
#include "ndjson/record_decoder.hpp"

#include <string>
#include <utility>

namespace nj {

static RecordHook to_hook(RecordFn fn) {
  if (!fn) return nullptr;
  return std::make_shared<const RecordFn>(std::move(fn));
}

Codec::Codec() : Codec(Config{}) {}

Codec::Codec(Config cfg) {
  std::string err;
  if (!json_validate_flags(cfg.flags, &err)) {
    throw InvalidArgument("The flags are not valid JSON encoding parameters; " + err);
  }
  if (cfg.depth < 1) throw InvalidArgument("The depth value must be greater than 0.");
  if (cfg.chunk_size < 1) throw InvalidArgument("The chunk size must be greater or equal to 1.");

  s_ = std::make_shared<const State>(State{cfg.flags, cfg.depth, cfg.chunk_size,
                                           to_hook(std::move(cfg.formatter)),
                                           to_hook(std::move(cfg.mapper))});
}

Codec Codec::rebuild(State next) const {
  Config cfg;
  cfg.flags = next.flags;
  cfg.depth = next.depth;
  cfg.chunk_size = next.chunk_size;
  Codec out(cfg);  // validates

  // Hooks are carried over as-is so identity survives a rebuild.
  State s = *out.s_;
  s.formatter = std::move(next.formatter);
  s.mapper = std::move(next.mapper);
  return Codec(std::make_shared<const State>(std::move(s)));
}

Codec Codec::add_flags(JsonFlags flags) const {
  const JsonFlags next = s_->flags | flags;
  if (next == s_->flags) return *this;
  State s = *s_;
  s.flags = next;
  return rebuild(std::move(s));
}

Codec Codec::remove_flags(JsonFlags flags) const {
  const JsonFlags next = s_->flags & ~flags;
  if (next == s_->flags) return *this;
  State s = *s_;
  s.flags = next;
  return rebuild(std::move(s));
}

bool Codec::use_flags(JsonFlags flags) const noexcept {
  return flags != 0 && (s_->flags & flags) == flags;
}

Codec Codec::with_depth(int depth) const {
  if (depth == s_->depth) return *this;
  State s = *s_;
  s.depth = depth;
  return rebuild(std::move(s));
}

Codec Codec::with_chunk_size(std::size_t chunk_size) const {
  if (chunk_size == s_->chunk_size) return *this;
  State s = *s_;
  s.chunk_size = chunk_size;
  return rebuild(std::move(s));
}

Codec Codec::with_formatter(RecordFn formatter) const {
  if (!formatter) return without_formatter();
  State s = *s_;
  s.formatter = to_hook(std::move(formatter));
  return rebuild(std::move(s));
}

Codec Codec::without_formatter() const {
  if (!s_->formatter) return *this;
  State s = *s_;
  s.formatter = nullptr;
  return rebuild(std::move(s));
}

Codec Codec::with_mapper(RecordFn mapper) const {
  if (!mapper) return without_mapper();
  State s = *s_;
  s.mapper = to_hook(std::move(mapper));
  return rebuild(std::move(s));
}

Codec Codec::without_mapper() const {
  if (!s_->mapper) return *this;
  State s = *s_;
  s.mapper = nullptr;
  return rebuild(std::move(s));
}

JsonFlags Codec::flags() const noexcept { return s_->flags; }
int Codec::depth() const noexcept { return s_->depth; }
std::size_t Codec::chunk_size() const noexcept { return s_->chunk_size; }
bool Codec::has_formatter() const noexcept { return s_->formatter != nullptr; }
bool Codec::has_mapper() const noexcept { return s_->mapper != nullptr; }

bool Codec::operator==(const Codec& other) const noexcept {
  if (s_ == other.s_) return true;
  return s_->flags == other.s_->flags && s_->depth == other.s_->depth &&
         s_->chunk_size == other.s_->chunk_size && s_->formatter == other.s_->formatter &&
         s_->mapper == other.s_->mapper;
}

RecordEncoder Codec::encoder() const {
  RecordEncoder::Config cfg;
  cfg.flags = s_->flags;
  cfg.depth = s_->depth;
  cfg.chunk_size = s_->chunk_size;
  return RecordEncoder(cfg);
}

RecordReaderPtr Codec::prepared(RecordReaderPtr values, Format format, const HeaderOption& header) const {
  return prepare(std::move(values), format, header, s_->formatter);
}

std::string Codec::encode(RecordReaderPtr values, Format format, const HeaderOption& header) const {
  return encoder().encode(prepared(std::move(values), format, header));
}

std::string Codec::encode(std::vector<Value> values, Format format, const HeaderOption& header) const {
  return encode(from_values(std::move(values)), format, header);
}

ChunkStream Codec::chunk(RecordReaderPtr values, Format format, const HeaderOption& header) const {
  return encoder().convert(prepared(std::move(values), format, header));
}

std::size_t Codec::write(RecordReaderPtr values, LineStream& sink, Format format,
                         const HeaderOption& header) const {
  return encoder().write(prepared(std::move(values), format, header), sink);
}

std::size_t Codec::write(RecordReaderPtr values, const std::string& path, Format format,
                         const HeaderOption& header) const {
  return encoder().write(prepared(std::move(values), format, header), path);
}

std::size_t Codec::download(RecordReaderPtr values, const std::optional<std::string>& filename,
                            Format format, const HeaderOption& header, std::FILE* out) const {
  return encoder().download(prepared(std::move(values), format, header), filename, out);
}

RecordReaderPtr Codec::decode(std::string ndjson, Format format, const HeaderOption& header) const {
  return read(LineStream::from_string(std::move(ndjson)), format, header);
}

RecordReaderPtr Codec::read(LineStream source, Format format, const HeaderOption& header) const {
  RecordDecoder::Config cfg;
  cfg.flags = s_->flags;
  cfg.depth = s_->depth;
  return reshape(RecordDecoder(cfg).decode(std::move(source)), format, header, s_->mapper);
}

RecordReaderPtr Codec::read(const std::string& path, Format format, const HeaderOption& header) const {
  return read(LineStream::open(path, LineStream::Mode::Read), format, header);
}

}
