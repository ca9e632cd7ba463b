#include "ndjson/line_stream.hpp"
#include "ndjson/errors.hpp"
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int fails = 0;

static void check(bool ok, const std::string& what) {
  if (ok) std::cout << "[PASS] " << what << "\n";
  else { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

static std::vector<std::string> drain(nj::LineStream& s) {
  std::vector<std::string> out;
  while (const std::string* l = s.current()) { out.push_back(*l); s.advance(); }
  return out;
}

int main(){
  const fs::path f = "tests/data/blank_lines_crlf.jsonl";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }

  {
    auto s = nj::LineStream::open(f.string());
    check(s.seekable(), "file stream is seekable");
    check(s.pathname() == f.string(), "pathname is kept");
    const std::string* a = s.current();
    const std::string* b = s.current();
    check(a && b && *a == *b && s.line() == 0, "current() is idempotent");

    auto lines = drain(s);
    check(lines == std::vector<std::string>{"{\"a\":1}", "{\"a\":2}", "{\"a\":3}"},
          "blank lines skipped, CR and LF stripped");
    check(s.at_end() && s.line() == 3, "at_end after three lines");
    check(s.bytes_read() == fs::file_size(f), "bytes_read matches file size");

    s.rewind();
    check(s.current() && *s.current() == "{\"a\":1}" && s.line() == 0, "rewind restarts at line 0");

    s.seek_to_line(2);
    check(s.current() && *s.current() == "{\"a\":3}" && s.line() == 2, "seek_to_line(2)");

    bool threw = false;
    try { s.seek_to_line(-1); } catch (const nj::StreamError&) { threw = true; }
    check(threw, "negative seek raises StreamError");

    threw = false;
    try { s.write("x"); } catch (const nj::StreamError&) { threw = true; }
    check(threw, "read-only stream refuses writes");
  }

  {
    bool threw = false;
    try { (void)nj::LineStream::open(""); } catch (const nj::InvalidArgument&) { threw = true; }
    check(threw, "empty path raises InvalidArgument");

    threw = false;
    try { (void)nj::LineStream::open("tests/data/no-such-file.jsonl"); } catch (const nj::InvalidArgument&) { threw = true; }
    check(threw, "missing path raises InvalidArgument");
  }

  {
    auto s = nj::LineStream::from_string("");
    check(s.at_end() && s.current() == nullptr, "empty buffer yields no lines");

    auto m = nj::LineStream::from_string("one\n\ntwo");
    check(drain(m) == std::vector<std::string>{"one", "two"}, "memory source without trailing newline");
  }

  {
    auto sink = nj::LineStream::memory_sink();
    std::size_t n = sink.write("{\"a\":1}\n");
    n += sink.write("{\"a\":2}\n");
    check(n == 16 && sink.contents() == "{\"a\":1}\n{\"a\":2}\n", "memory sink collects writes");
  }

  {
    // Caller-owned handles stay open after the stream goes away.
    std::FILE* h = std::tmpfile();
    if (!h) { std::cerr << "[ERR] tmpfile failed\n"; return 2; }
    {
      auto s = nj::LineStream::adopt(h, "<tmp>");
      s.write("abc\n");
      s.flush();
    }
    std::rewind(h);
    char buf[8] = {0};
    std::size_t got = std::fread(buf, 1, 4, h);
    check(got == 4 && std::string(buf, 4) == "abc\n", "adopted handle left open");
    std::fclose(h);
  }

  {
    std::FILE* pipe = ::popen("printf 'x\\ny\\n'", "r");
    if (!pipe) { std::cerr << "[ERR] popen failed\n"; return 2; }
    {
      auto s = nj::LineStream::adopt(pipe, "<pipe>");
      check(!s.seekable(), "pipe is not seekable");
      check(drain(s) == std::vector<std::string>{"x", "y"}, "pipe lines");
      bool threw = false;
      try { s.rewind(); } catch (const nj::StreamError&) { threw = true; }
      check(threw, "rewind on a pipe raises StreamError");
    }
    ::pclose(pipe);
  }

  {
    const fs::path out = fs::temp_directory_path() / "nj_line_stream_out.ndjson";
    auto s = nj::LineStream::open(out.string(), nj::LineStream::Mode::Write);
    s.write("{}\n");
    s.close();
    bool threw = false;
    try { s.write("{}\n"); } catch (const nj::StreamError&) { threw = true; }
    check(threw && fs::file_size(out) == 3, "closed stream refuses writes");

    auto app = nj::LineStream::open(out.string(), nj::LineStream::Mode::Append);
    app.write("[]\n");
    app.close();
    check(fs::file_size(out) == 6, "append mode extends the file");
    fs::remove(out);
  }

  return fails ? 1 : 0;
}
