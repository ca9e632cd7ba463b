#include "ndjson/record_encoder.hpp"
#include "ndjson/errors.hpp"

#include <cstdio>
#include <exception>
#include <string>
#include <utility>

namespace nj {

static void validate(const RecordEncoder::Config& cfg) {
  std::string err;
  if (!json_validate_flags(cfg.flags, &err)) throw InvalidArgument(err);
  if (cfg.depth < 1) throw InvalidArgument("The depth value must be greater than 0.");
  if (cfg.chunk_size < 1) throw InvalidArgument("The chunk size must be greater or equal to 1.");
}

ChunkStream::ChunkStream(RecordReaderPtr values, JsonFlags flags, int depth, std::size_t chunk_size)
  : values_(std::move(values)),
    flags_((flags | ThrowOnError) & ~(PrettyPrint | ForceObject)),
    depth_(depth),
    chunk_size_(chunk_size) {}

bool ChunkStream::read_next(std::string& chunk) {
  chunk.clear();
  if (done_) return false;

  std::size_t n = 0;
  Record r;
  while (n < chunk_size_ && values_->read_next(r)) {
    saw_data_ = true;
    last_offset_ = r.offset;
    try {
      chunk += json_encode(r.value, flags_, depth_);
    } catch (const JsonError& e) {
      done_ = true;
      throw EncodingFailed("Unable to encode data: " + std::string(e.what()),
                           std::move(r.value), r.offset, std::current_exception());
    }
    chunk += '\n';
    ++n;
  }
  if (n > 0) return true;

  done_ = true;
  if (!saw_data_) {
    chunk = "[]";
    return true;
  }
  return false;
}

// Percent-encode bytes that cannot appear in a quoted-string fallback.
static std::string rfc5987_encode(const std::string& name) {
  static const char* hex = "0123456789abcdef";
  std::string out;
  out.reserve(name.size() * 3);
  for (unsigned char c : name) {
    if (c == '%' || c == '"' || c < 0x20 || c >= 0x7F) {
      out += '%';
      out += hex[c >> 4];
      out += hex[c & 0x0F];
    } else {
      out += static_cast<char>(c);
    }
  }
  return out;
}

HeaderLines attachment_headers(const std::optional<std::string>& filename) {
  HeaderLines out;
  if (!filename) return out;

  const std::string& name = *filename;
  if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
    throw InvalidArgument("The filename `" + name + "` cannot contain the \"/\" or \"\\\" characters.");
  }

  // ASCII fallback: control, high and '%' bytes are dropped.
  std::string fallback;
  fallback.reserve(name.size());
  for (unsigned char c : name) {
    if (c < 0x20 || c > 0x7F || c == '%') continue;
    fallback += static_cast<char>(c);
  }

  std::string quoted;
  quoted.reserve(fallback.size());
  for (char c : fallback) {
    if (c == '"') quoted += '\\';
    quoted += c;
  }

  std::string disposition = "attachment;filename=\"" + quoted + "\"";
  if (fallback != name) disposition += ";filename*=UTF-8''" + rfc5987_encode(name);

  out.emplace_back("content-type", "application/x-ndjson; charset=utf-8");
  out.emplace_back("content-transfer-encoding", "binary");
  out.emplace_back("content-description", "File Transfer");
  out.emplace_back("content-disposition", disposition);
  return out;
}

RecordEncoder::RecordEncoder() : RecordEncoder(Config{}) {}

RecordEncoder::RecordEncoder(Config cfg) : cfg_(cfg) { validate(cfg_); }

ChunkStream RecordEncoder::convert(RecordReaderPtr values) const {
  return ChunkStream(std::move(values), cfg_.flags, cfg_.depth, cfg_.chunk_size);
}

std::size_t RecordEncoder::write(RecordReaderPtr values, LineStream& sink) const {
  ChunkStream chunks = convert(std::move(values));
  std::string chunk;
  std::size_t bytes = 0;
  // Only sink failures are attributed to the destination; source errors propagate unchanged.
  auto sink_failed = [&](const StreamError& e) {
    return EncodingFailed("Unable to write to the destination path `" + sink.pathname() + "`: " + e.what(),
                          Value(chunk), chunks.last_offset(), std::current_exception());
  };
  while (chunks.read_next(chunk)) {
    try {
      bytes += sink.write(chunk);
    } catch (const StreamError& e) {
      throw sink_failed(e);
    }
  }
  try {
    sink.flush();
  } catch (const StreamError& e) {
    throw sink_failed(e);
  }
  return bytes;
}

std::size_t RecordEncoder::write(RecordReaderPtr values, const std::string& path) const {
  LineStream sink = LineStream::open(path, LineStream::Mode::Write);
  std::size_t bytes = write(std::move(values), sink);
  try {
    sink.close();
  } catch (const StreamError& e) {
    throw EncodingFailed("Unable to write to the destination path `" + path + "`: " + e.what(),
                         Value(), -1, std::current_exception());
  }
  return bytes;
}

std::string RecordEncoder::encode(RecordReaderPtr values) const {
  LineStream sink = LineStream::memory_sink();
  write(std::move(values), sink);
  return sink.contents();
}

std::size_t RecordEncoder::download(RecordReaderPtr values,
                                    const std::optional<std::string>& filename,
                                    std::FILE* out) const {
  // Validate the filename before anything reaches the output.
  const HeaderLines headers = attachment_headers(filename);

  LineStream sink = LineStream::adopt(out, "<output>");
  if (!headers.empty()) {
    std::string head;
    for (const auto& h : headers) head += h.first + ": " + h.second + "\r\n";
    head += "\r\n";
    sink.write(head);
  }
  return write(std::move(values), sink);
}

}
