#include "ndjson/record_encoder.hpp"
#include "ndjson/errors.hpp"
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using nj::Value;

static int fails = 0;

static void check(bool ok, const std::string& what) {
  if (ok) std::cout << "[PASS] " << what << "\n";
  else { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

static std::vector<Value> people() {
  return {Value::object({{"Name", "Alice"}, {"Score", 42}}),
          Value::object({{"Name", "Bob"}, {"Score", 27}})};
}

// Yields one record, then fails the way a broken input file does.
struct FailingSource : nj::RecordReader {
  int n = 0;
  bool read_next(nj::Record& out) override {
    if (n++ == 0) { out = nj::Record{0, Value::object({{"i", 0}})}; return true; }
    throw nj::StreamError("`in.ndjson`: read failed: Input/output error");
  }
};

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

int main(){
  const std::string expected = "{\"Name\":\"Alice\",\"Score\":42}\n{\"Name\":\"Bob\",\"Score\":27}\n";

  {
    nj::RecordEncoder enc;
    check(enc.encode(nj::from_values(people())) == expected, "records encode one per line");
  }

  {
    nj::RecordEncoder::Config cfg;
    cfg.flags = nj::PrettyPrint | nj::ForceObject;
    nj::RecordEncoder enc(cfg);
    check(enc.encode(nj::from_values({Value::array({1, 2})})) == "[1,2]\n", "pretty-print and force-object masked");
  }

  {
    std::vector<Value> v;
    for (int i = 0; i < 5; ++i) v.push_back(Value::object({{"i", i}}));
    const std::string whole = nj::RecordEncoder().encode(nj::from_values(v));

    nj::RecordEncoder::Config cfg;
    cfg.chunk_size = 2;
    auto chunks = nj::RecordEncoder(cfg).convert(nj::from_values(v));
    std::vector<std::string> got;
    std::string c;
    while (chunks.read_next(c)) got.push_back(c);
    check(got.size() == 3, "5 records in chunks of 2 give 3 chunks");
    check(got.size() == 3 && got[0] + got[1] + got[2] == whole, "chunks concatenate to the unchunked text");
    check(got.size() == 3 && got[2] == "{\"i\":4}\n", "remainder flushed at end");
    check(chunks.last_offset() == 4, "last_offset follows the input");
  }

  {
    auto chunks = nj::RecordEncoder().convert(nj::from_values({}));
    std::string c;
    bool first = chunks.read_next(c) && c == "[]";
    check(first && !chunks.read_next(c), "empty input yields the single chunk []");
    check(nj::RecordEncoder().encode(nj::from_values({})) == "[]", "encode of nothing is []");
  }

  {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    auto chunks = nj::RecordEncoder().convert(nj::from_values({Value(1), Value(nan), Value(3)}));
    std::string c;
    bool ok = chunks.read_next(c) && c == "1\n";
    try {
      chunks.read_next(c);
      ok = false;
    } catch (const nj::EncodingFailed& e) {
      ok &= e.offset() == 1 && e.value().is_double() && e.cause() != nullptr &&
            std::string(e.what()).rfind("Unable to encode data: ", 0) == 0;
    }
    check(ok, "EncodingFailed carries offset, value and cause after earlier output");
  }

  {
    const fs::path out = fs::temp_directory_path() / "nj_encoder_write.ndjson";
    std::size_t n = nj::RecordEncoder().write(nj::from_values(people()), out.string());
    check(n == expected.size() && slurp(out) == expected, "write to path returns byte count");
    fs::remove(out);
  }

  {
    auto ro = nj::LineStream::from_string("");
    bool ok = false;
    try {
      nj::RecordEncoder().write(nj::from_values(people()), ro);
    } catch (const nj::EncodingFailed& e) {
      bool stream_cause = false;
      try { e.rethrow_cause(); } catch (const nj::StreamError&) { stream_cause = true; }
      ok = stream_cause && e.offset() == 0;
    }
    check(ok, "sink failure wrapped as EncodingFailed");
  }

  {
    auto sink = nj::LineStream::memory_sink();
    bool ok = false;
    try {
      nj::RecordEncoder().write(std::make_unique<FailingSource>(), sink);
    } catch (const nj::EncodingFailed&) {
      ok = false;
    } catch (const nj::StreamError& e) {
      ok = std::string(e.what()) == "`in.ndjson`: read failed: Input/output error";
    }
    check(ok, "source read failure is not reported as a destination failure");
  }

  {
    check(nj::attachment_headers(std::nullopt).empty(), "no filename, no headers");

    auto h = nj::attachment_headers(std::string("data.ndjson"));
    check(h.size() == 4 && h[0].first == "content-type" &&
          h[0].second == "application/x-ndjson; charset=utf-8" &&
          h[1] == std::make_pair(std::string("content-transfer-encoding"), std::string("binary")) &&
          h[2].second == "File Transfer" &&
          h[3].second == "attachment;filename=\"data.ndjson\"", "plain ASCII filename");

    auto u = nj::attachment_headers(std::string("r\xC3\xA9sum\xC3\xA9.ndjson"));
    check(u.size() == 4 &&
          u[3].second == "attachment;filename=\"rsum.ndjson\";filename*=UTF-8''r%c3%a9sum%c3%a9.ndjson",
          "non-ASCII filename gets a fallback and filename*");

    auto q = nj::attachment_headers(std::string("50%\"off\".ndjson"));
    check(q.size() == 4 &&
          q[3].second == "attachment;filename=\"50\\\"off\\\".ndjson\";filename*=UTF-8''50%25%22off%22.ndjson",
          "percent and quote handling");

    bool threw = false;
    try { nj::attachment_headers(std::string("../etc/passwd")); } catch (const nj::InvalidArgument&) { threw = true; }
    check(threw, "path separator rejected");
    threw = false;
    try { nj::attachment_headers(std::string("a\\b.ndjson")); } catch (const nj::InvalidArgument&) { threw = true; }
    check(threw, "backslash rejected");
  }

  {
    std::FILE* out = std::tmpfile();
    if (!out) { std::cerr << "[ERR] tmpfile failed\n"; return 2; }
    std::size_t n = nj::RecordEncoder().download(nj::from_values(people()), std::string("people.ndjson"), out);
    std::rewind(out);
    std::string got;
    char buf[512];
    std::size_t k;
    while ((k = std::fread(buf, 1, sizeof(buf), out)) > 0) got.append(buf, k);
    std::fclose(out);

    const std::string head =
      "content-type: application/x-ndjson; charset=utf-8\r\n"
      "content-transfer-encoding: binary\r\n"
      "content-description: File Transfer\r\n"
      "content-disposition: attachment;filename=\"people.ndjson\"\r\n"
      "\r\n";
    check(n == expected.size() && got == head + expected, "download writes headers then body");
  }

  {
    bool threw = false;
    nj::RecordEncoder::Config cfg;
    cfg.chunk_size = 0;
    try { nj::RecordEncoder e(cfg); } catch (const nj::InvalidArgument& e) {
      threw = std::string(e.what()) == "The chunk size must be greater or equal to 1.";
    }
    check(threw, "chunk size 0 rejected");
  }

  return fails ? 1 : 0;
}
