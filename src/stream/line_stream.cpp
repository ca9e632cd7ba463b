#include "ndjson/line_stream.hpp"
#include "ndjson/errors.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace nj {

static bool is_blank(std::string_view s) {
  for (char c : s) {
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n' && c != '\v' && c != '\f') return false;
  }
  return true;
}

static std::string errno_text(int e) {
  return e ? std::string(std::strerror(e)) : std::string("unknown error");
}

struct LineStream::Impl {
  std::FILE* file{nullptr};
  bool owns_file{false};
  bool is_seekable{false};
  bool writable{false};
  std::string name;
  Config cfg;

  // memory backend (file == nullptr)
  std::string mem;
  std::size_t mem_pos{0};

  // file read buffer
  std::vector<char> buf;
  std::size_t buf_pos{0};
  std::size_t buf_len{0};
  bool eof{false};

  std::string cur;
  bool has_cur{false};
  bool done{false};
  std::int64_t index{0};
  std::uint64_t bytes{0};

  ~Impl() {
    if (owns_file && file) std::fclose(file);
  }

  // Next raw line without its '\n'; false once input is exhausted.
  bool read_raw(std::string& out) {
    out.clear();
    if (!file) {
      if (mem_pos >= mem.size()) return false;
      std::size_t nl = mem.find('\n', mem_pos);
      std::size_t end = (nl == std::string::npos) ? mem.size() : nl;
      out.assign(mem, mem_pos, end - mem_pos);
      bytes += (end - mem_pos) + (nl == std::string::npos ? 0 : 1);
      mem_pos = (nl == std::string::npos) ? mem.size() : nl + 1;
      return true;
    }

    bool got = false;
    while (true) {
      if (buf_pos == buf_len) {
        if (eof) return got;
        if (buf.size() < cfg.chunk_bytes) buf.resize(cfg.chunk_bytes);
        std::size_t n = std::fread(buf.data(), 1, buf.size(), file);
        if (n == 0) {
          if (std::ferror(file)) {
            throw StreamError("`" + name + "`: read failed: " + errno_text(errno));
          }
          eof = true;
          return got;
        }
        bytes += n;
        buf_pos = 0;
        buf_len = n;
      }
      got = true;
      const char* start = buf.data() + buf_pos;
      const void* hit = std::memchr(start, '\n', buf_len - buf_pos);
      if (hit) {
        std::size_t len = static_cast<const char*>(hit) - start;
        out.append(start, len);
        buf_pos += len + 1;
        return true;
      }
      out.append(start, buf_len - buf_pos);
      buf_pos = buf_len;
    }
  }

  void fill() {
    if (has_cur || done) return;
    while (read_raw(cur)) {
      if (is_blank(cur)) continue;
      if (cfg.strip_cr) {
        while (!cur.empty() && cur.back() == '\r') cur.pop_back();
      }
      has_cur = true;
      return;
    }
    done = true;
  }

  void reset_cursor() {
    buf_pos = buf_len = 0;
    eof = false;
    mem_pos = 0;
    cur.clear();
    has_cur = false;
    done = false;
    index = 0;
  }
};

LineStream LineStream::open(const std::string& path, Mode mode) {
  return open(path, mode, Config{});
}

LineStream LineStream::open(const std::string& path, Mode mode, Config cfg) {
  if (is_blank(path)) throw InvalidArgument("The path cannot be empty.");

  const char* m = (mode == Mode::Read) ? "rb" : (mode == Mode::Write) ? "wb" : "ab";
  std::FILE* f = std::fopen(path.c_str(), m);
  if (!f) {
    throw InvalidArgument("`" + path + "`: failed to open stream: " + errno_text(errno));
  }

  auto* p = new Impl();
  p->file = f;
  p->owns_file = true;
  p->is_seekable = (std::fseek(f, 0, SEEK_CUR) == 0);
  p->writable = (mode != Mode::Read);
  p->name = path;
  p->cfg = cfg;
  return LineStream(p);
}

LineStream LineStream::adopt(std::FILE* handle, std::string name) {
  return adopt(handle, std::move(name), Config{});
}

LineStream LineStream::adopt(std::FILE* handle, std::string name, Config cfg) {
  if (!handle) throw InvalidArgument("Argument passed must be an open stream.");
  auto* p = new Impl();
  p->file = handle;
  p->owns_file = false;
  p->is_seekable = (std::fseek(handle, 0, SEEK_CUR) == 0);
  p->writable = true;
  p->name = std::move(name);
  p->cfg = cfg;
  return LineStream(p);
}

LineStream LineStream::from_string(std::string data) {
  auto* p = new Impl();
  p->mem = std::move(data);
  p->is_seekable = true;
  p->name = "<memory>";
  return LineStream(p);
}

LineStream LineStream::memory_sink() {
  auto* p = new Impl();
  p->is_seekable = true;
  p->writable = true;
  p->name = "<memory>";
  return LineStream(p);
}

LineStream::LineStream(LineStream&& other) noexcept : p_(other.p_) { other.p_ = nullptr; }

LineStream& LineStream::operator=(LineStream&& other) noexcept {
  if (this != &other) {
    delete p_;
    p_ = other.p_;
    other.p_ = nullptr;
  }
  return *this;
}

LineStream::~LineStream() { delete p_; }

const std::string* LineStream::current() {
  p_->fill();
  return p_->has_cur ? &p_->cur : nullptr;
}

void LineStream::advance() {
  p_->fill();
  if (!p_->has_cur) return;
  p_->has_cur = false;
  ++p_->index;
}

bool LineStream::at_end() { return current() == nullptr; }

std::int64_t LineStream::line() const noexcept { return p_->index; }

void LineStream::rewind() {
  if (!p_->is_seekable) throw StreamError("`" + p_->name + "`: stream does not support seeking.");
  if (p_->file && std::fseek(p_->file, 0, SEEK_SET) != 0) {
    throw StreamError("`" + p_->name + "`: unable to rewind the document: " + errno_text(errno));
  }
  p_->reset_cursor();
}

void LineStream::seek_to_line(std::int64_t n) {
  if (n < 0) throw StreamError("can't seek stream to negative line " + std::to_string(n));
  rewind();
  while (p_->index < n && !at_end()) advance();
}

std::size_t LineStream::write(std::string_view bytes) {
  if (!p_->writable) throw StreamError("`" + p_->name + "`: stream is not writable.");
  if (!p_->file) {
    p_->mem.append(bytes.data(), bytes.size());
    return bytes.size();
  }
  errno = 0;
  std::size_t n = std::fwrite(bytes.data(), 1, bytes.size(), p_->file);
  if (n != bytes.size()) {
    throw StreamError("`" + p_->name + "`: can't write to stream: " + errno_text(errno));
  }
  return n;
}

void LineStream::flush() {
  if (p_->file && std::fflush(p_->file) != 0) {
    throw StreamError("`" + p_->name + "`: flush failed: " + errno_text(errno));
  }
}

void LineStream::close() {
  if (!p_->file) return;
  if (!p_->owns_file) { flush(); return; }
  std::FILE* f = p_->file;
  p_->file = nullptr;
  p_->owns_file = false;
  p_->writable = false;
  p_->is_seekable = false;
  p_->has_cur = false;
  p_->done = true;
  if (std::fclose(f) != 0) {
    throw StreamError("`" + p_->name + "`: close failed: " + errno_text(errno));
  }
}

bool LineStream::seekable() const noexcept { return p_->is_seekable; }
const std::string& LineStream::pathname() const noexcept { return p_->name; }
std::uint64_t LineStream::bytes_read() const noexcept { return p_->bytes; }
const std::string& LineStream::contents() const noexcept { return p_->mem; }

}
