#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace nj {

// Cursor over a byte source (file, caller-owned FILE*, or memory buffer)
// yielding one line at a time. Line terminators are stripped and lines
// that are blank after trimming are skipped. A stream can also be used as
// a write sink.
class LineStream {
public:
  enum class Mode { Read, Write, Append };

  struct Config {
    std::size_t chunk_bytes = 64 * 1024; // fread block size
    bool        strip_cr    = true;      // trim trailing '\r' (CRLF)
  };

  // Throws InvalidArgument for an empty path or when the file cannot be opened.
  static LineStream open(const std::string& path, Mode mode = Mode::Read);
  static LineStream open(const std::string& path, Mode mode, Config cfg);

  // Caller keeps ownership; the handle is left open on destruction.
  static LineStream adopt(std::FILE* handle, std::string name = "<handle>");
  static LineStream adopt(std::FILE* handle, std::string name, Config cfg);

  // Seekable, read-only view over an in-memory document.
  static LineStream from_string(std::string data);
  // Seekable, writable in-memory buffer; read back with contents().
  static LineStream memory_sink();

  LineStream(LineStream&& other) noexcept;
  LineStream& operator=(LineStream&& other) noexcept;
  LineStream(const LineStream&) = delete;
  LineStream& operator=(const LineStream&) = delete;
  ~LineStream();

  // Current line or nullptr at end of input. Idempotent.
  const std::string* current();
  void advance();
  bool at_end();
  // Zero-based index of the current line since the last rewind.
  std::int64_t line() const noexcept;

  // Throws StreamError when the source does not support seeking.
  void rewind();
  // Rewind, then advance n times. O(n).
  void seek_to_line(std::int64_t n);

  // Returns bytes written; throws StreamError on failure.
  std::size_t write(std::string_view bytes);
  void flush();
  // Flush and release an owned handle, reporting close errors.
  void close();

  bool seekable() const noexcept;
  const std::string& pathname() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  // Buffer of a memory stream; empty for file-backed streams.
  const std::string& contents() const noexcept;

private:
  struct Impl;
  explicit LineStream(Impl* p) : p_(p) {}
  Impl* p_;
};

}
