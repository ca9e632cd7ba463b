#include "ndjson/codec.hpp"
#include "ndjson/errors.hpp"
#include "ndjson/path_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static bool expected_ok_for(const fs::path& p) {
  const std::string n = p.filename().string();
  if (n.find("bad") != std::string::npos) return false;
  if (n.find("malformed") != std::string::npos) return false;
  return true;
}

static bool is_list_header(const fs::path& p) {
  return p.filename().string().find("list_header") != std::string::npos;
}

static std::uint64_t non_blank_lines(const fs::path& f) {
  std::ifstream in(f, std::ios::binary);
  std::uint64_t n = 0;
  std::string s;
  while (std::getline(in, s)) {
    if (s.find_first_not_of(" \t\r\n") != std::string::npos) ++n;
  }
  return n;
}

struct Res {
  bool ok{true};
  std::uint64_t records{0};
  std::int64_t fail_offset{-1};
  std::string fail_value;
  std::string err;
};

static Res run_one(const nj::Codec& codec, const fs::path& f) {
  Res r;
  const nj::Format format = is_list_header(f) ? nj::Format::ListWithHeader : nj::Format::Record;
  const nj::HeaderOption header = is_list_header(f) ? nj::HeaderOption::offset(0) : nj::HeaderOption::none();
  try {
    codec.read(f.string(), format, header)->for_each([&](const nj::Record&) { ++r.records; });
  } catch (const nj::DecodingFailed& e) {
    r.ok = false;
    r.fail_offset = e.offset();
    r.fail_value = e.value().is_string() ? e.value().as_string() : std::string();
    r.err = e.what();
  }
  return r;
}

int main() {
  const fs::path dir = "tests/data";
  if (!fs::exists(dir)) { std::cerr << "[ERR] missing: " << dir << "\n"; return 2; }

  std::vector<fs::path> files;
  for (auto& e : fs::directory_iterator(dir)) {
    if (e.is_regular_file() && nj::has_ndjson_extension(e.path().string())) files.push_back(e.path());
  }
  std::sort(files.begin(), files.end());
  if (files.empty()) { std::cerr << "[ERR] no fixtures under " << dir << "\n"; return 2; }

  const nj::Codec codec;
  int failures = 0;
  for (const auto& f : files) {
    const bool expect_ok = expected_ok_for(f);
    Res r = run_one(codec, f);

    if (r.ok != expect_ok) {
      std::cerr << "[FAIL] " << f.filename().string() << ": expected " << (expect_ok ? "ok" : "failure")
                << (r.ok ? "" : " got: " + r.err) << "\n";
      ++failures;
      continue;
    }

    if (r.ok) {
      std::uint64_t expect = non_blank_lines(f) - (is_list_header(f) ? 1 : 0);
      if (r.records != expect) {
        std::cerr << "[FAIL] " << f.filename().string() << ": records=" << r.records
                  << " expect=" << expect << "\n";
        ++failures;
        continue;
      }
      std::cout << "[PASS] " << f.filename().string() << " records=" << r.records << "\n";
    } else {
      std::cout << "[PASS] " << f.filename().string() << " failed as expected at offset "
                << r.fail_offset << " (" << r.fail_value << ")\n";
    }
  }

  // The broken line of bad.jsonl is its third non-blank line.
  const fs::path bad = dir / "bad.jsonl";
  if (fs::exists(bad)) {
    Res r = run_one(codec, bad);
    if (r.ok || r.fail_offset != 2 || r.fail_value != "BROKEN") {
      std::cerr << "[FAIL] bad.jsonl: offset=" << r.fail_offset << " value=" << r.fail_value << "\n";
      ++failures;
    } else {
      std::cout << "[PASS] bad.jsonl attributed to offset 2\n";
    }
  }

  return failures ? 1 : 0;
}
