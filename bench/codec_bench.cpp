#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "ndjson/codec.hpp"
#include "ndjson/errors.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

static std::string make_synth_ndjson(std::size_t rows, std::size_t cols) {
  fs::path p = fs::temp_directory_path() / "nj_bench_synth.ndjson";
  std::ofstream out(p, std::ios::binary);
  for (size_t r = 0; r < rows; ++r) {
    out << "{";
    for (size_t c = 0; c < cols; ++c) {
      out << "\"k" << c << "\":";
      if (c % 3 == 0) out << (r % 10) << "." << (c * 37 % 1000);
      else if (c % 3 == 1) out << "\"v" << r << "/" << c << "\"";
      else out << (r * c);
      if (c+1<cols) out << ",";
    }
    out << "}\n";
  }
  out.flush();
  return p.string();
}

struct Args {
  std::string path;            // if empty -> synth
  std::size_t rows = 200'000;  // for synth
  std::size_t cols = 8;        // for synth
  std::size_t chunk = 64;
  int iters = 3;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--in") a.path = val;
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--cols") a.cols = std::stoull(val);
    else if (key=="--chunk-size") a.chunk = std::stoull(val);
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: codec_bench [--in=path] [--rows=N] [--cols=M] [--chunk-size=C] [--iters=K]\n"
        "If --in is omitted, a synthetic NDJSON file is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

static void report(const char* what, int k, std::uint64_t nrec, std::uint64_t bytes, clk::time_point t0) {
  const double sec = std::chrono::duration<double>(clk::now()-t0).count();
  const double mib = bytes / (1024.0*1024.0);
  std::cout << "  " << what << " iter " << k
            << ": rows=" << nrec
            << " bytes=" << bytes
            << " time=" << sec << "s"
            << "  throughput=" << (mib/sec) << " MiB/s"
            << "  rows/s=" << (nrec/sec) << "\n";
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);

  std::string path = a.path;
  if (path.empty() || !fs::exists(path)) path = make_synth_ndjson(a.rows, a.cols);
  const nj::Codec codec = nj::Codec().with_chunk_size(a.chunk);
  const std::uint64_t file_bytes = fs::file_size(path);

  std::cout << "\n[NDJSON] file=" << path << " chunk=" << a.chunk << " iters=" << a.iters << "\n";
  try {
    std::vector<nj::Value> values;
    for (int k=1;k<=a.iters;++k) {
      values.clear();
      auto t0 = clk::now();
      codec.read(path)->for_each([&](const nj::Record& r){ values.push_back(r.value); });
      report("decode", k, values.size(), file_bytes, t0);
    }

    for (int k=1;k<=a.iters;++k) {
      auto t0 = clk::now();
      nj::ChunkStream chunks = codec.chunk(nj::from_values(values));
      std::string c;
      std::uint64_t bytes = 0;
      while (chunks.read_next(c)) bytes += c.size();
      report("encode", k, values.size(), bytes, t0);
    }

    for (int k=1;k<=a.iters;++k) {
      auto t0 = clk::now();
      std::string text = codec.encode(values, nj::Format::ListWithHeader, nj::HeaderOption::offset(0));
      report("list-header", k, values.size(), text.size(), t0);
    }
  } catch (const nj::Error& e) {
    std::cerr << "[bench] " << e.what() << "\n";
    return 1;
  }
  return 0;
}
