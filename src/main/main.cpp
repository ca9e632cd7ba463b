#include "ndjson/codec.hpp"
#include "ndjson/errors.hpp"
#include "ndjson/http_server.hpp"
#include "ndjson/line_stream.hpp"
#include "ndjson/path_utils.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace {

struct Cli {
  std::string in  = "-";
  std::string out = "-";
  nj::Format from = nj::Format::Record;
  nj::Format to   = nj::Format::Record;
  std::vector<std::string> header;         // explicit input header
  std::optional<std::int64_t> header_offset;
  long long chunk_size = 1;
  long long depth = nj::kDefaultDepth;
  nj::JsonFlags flags = 0;
  bool serve = false;
  int port = 8080;
  std::string data_root = "data";
};

void usage(std::ostream& os) {
  os <<
    "Usage: ndjson [--in=PATH|-] [--out=PATH|-]\n"
    "              [--from=record|list|list-header] [--to=record|list|list-header]\n"
    "              [--header=a,b,c] [--header-offset=N]\n"
    "              [--chunk-size=N] [--depth=N] [--flag=NAME ...]\n"
    "       ndjson --serve [--port=N] [--data-root=DIR] [--chunk-size=N] [--flag=NAME ...]\n"
    "\n"
    "Flags are kebab-case JSON options, e.g. --flag=unescaped-slashes.\n";
}

bool parse_int(const std::string& s, long long* out) {
  auto r = std::from_chars(s.data(), s.data() + s.size(), *out);
  return r.ec == std::errc() && r.ptr == s.data() + s.size();
}

std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    std::size_t comma = s.find(',', start);
    out.push_back(s.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return out;
}

// Returns false (reason in err) on a malformed option.
bool parse_cli(int argc, char** argv, Cli* c, std::string* err) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    std::string v;
    auto eat = [&](const char* pfx){
      if (a.rfind(pfx, 0) == 0) { v = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto number = [&](long long* out){
      if (parse_int(v, out)) return true;
      *err = "not a number: " + a;
      return false;
    };
    auto format = [&](nj::Format* out){
      auto f = nj::format_from_name(v);
      if (f) { *out = *f; return true; }
      *err = "unknown format: " + v;
      return false;
    };

    long long n = 0;
    if (eat("--in="))  { c->in = v; continue; }
    if (eat("--out=")) { c->out = v; continue; }
    if (eat("--from=")) { if (!format(&c->from)) return false; continue; }
    if (eat("--to="))   { if (!format(&c->to)) return false; continue; }
    if (eat("--header=")) { c->header = split_csv(v); continue; }
    if (eat("--header-offset=")) { if (!number(&n)) return false; c->header_offset = n; continue; }
    if (eat("--chunk-size=")) { if (!number(&c->chunk_size)) return false; continue; }
    if (eat("--depth="))      { if (!number(&c->depth)) return false; continue; }
    if (eat("--port="))       { if (!number(&n)) return false; c->port = static_cast<int>(n); continue; }
    if (eat("--data-root="))  { c->data_root = v; continue; }
    if (eat("--flag=")) {
      auto f = nj::json_flag_from_name(v);
      if (!f) { *err = "unknown flag: " + v; return false; }
      c->flags |= *f;
      continue;
    }
    if (a == "--serve") { c->serve = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    *err = "unknown option: " + a;
    return false;
  }
  if (c->chunk_size < 1) { *err = "--chunk-size must be >= 1"; return false; }
  if (c->depth < 1 || c->depth > INT32_MAX) { *err = "--depth must be >= 1"; return false; }
  return true;
}

nj::HeaderOption input_header(const Cli& c) {
  if (!c.header.empty()) return nj::HeaderOption::names(c.header);
  if (c.header_offset) return nj::HeaderOption::offset(*c.header_offset);
  if (c.from == nj::Format::ListWithHeader) return nj::HeaderOption::offset(0);
  return nj::HeaderOption::none();
}

int convert(const Cli& c, const nj::Codec& codec) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  nj::LineStream source = (c.in == "-")
      ? nj::LineStream::adopt(stdin, "<stdin>")
      : nj::LineStream::open(c.in, nj::LineStream::Mode::Read);

  std::uint64_t records = 0;
  nj::RecordReaderPtr reader = nj::map_records(
      codec.read(std::move(source), c.from, input_header(c)),
      [&records](nj::Value v, std::int64_t) { ++records; return v; });

  // The output header is the first converted record's keys.
  const nj::HeaderOption out_header = (c.to == nj::Format::ListWithHeader)
      ? nj::HeaderOption::offset(0) : nj::HeaderOption::none();

  std::size_t bytes = 0;
  if (c.out == "-") {
    nj::LineStream sink = nj::LineStream::adopt(stdout, "<stdout>");
    bytes = codec.write(std::move(reader), sink, c.to, out_header);
  } else {
    std::string err;
    if (!nj::ensure_parent_dirs(c.out, &err)) {
      std::cerr << "[convert] cannot create output directory: " << err << "\n";
      return 2;
    }
    bytes = codec.write(std::move(reader), c.out, c.to, out_header);
  }

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  std::cerr << "[convert] ok: " << records << " records, " << bytes << " bytes "
            << nj::format_name(c.from) << " -> " << nj::format_name(c.to)
            << " in " << wall_ms << " ms\n";
  return 0;
}

}

int main(int argc, char** argv) {
  Cli cli;
  std::string err;
  if (!parse_cli(argc, argv, &cli, &err)) {
    std::cerr << "[ndjson] " << err << "\n";
    usage(std::cerr);
    return 2;
  }

  try {
    nj::Codec::Config ccfg;
    ccfg.flags = cli.flags;
    ccfg.depth = static_cast<int>(cli.depth);
    ccfg.chunk_size = static_cast<std::size_t>(cli.chunk_size);
    nj::Codec codec(ccfg);

    if (cli.serve) {
      nj::HttpServer::Config scfg;
      scfg.port = cli.port;
      scfg.data_root = cli.data_root;
      scfg.codec = codec;
      nj::HttpServer server(scfg);
      int rc = server.run();
      if (rc != 0) {
        std::cerr << "[ndjson] server failed to start on port " << scfg.port << "\n";
        return rc;
      }
      return 0;
    }

    return convert(cli, codec);
  } catch (const nj::RecordError& e) {
    std::cerr << "[ndjson] record " << e.offset() << ": " << e.what() << "\n";
    return 3;
  } catch (const nj::Error& e) {
    std::cerr << "[ndjson] " << e.what() << "\n";
    return 3;
  }
}
