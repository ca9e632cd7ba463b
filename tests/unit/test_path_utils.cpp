#include "ndjson/path_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int fails = 0;

static void check(bool ok, const std::string& what) {
  if (ok) std::cout << "[PASS] " << what << "\n";
  else { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

int main(){
  const fs::path root = fs::temp_directory_path() / "nj_path_utils";
  fs::remove_all(root);
  fs::create_directories(root / "sub");
  std::ofstream(root / "v1..2.ndjson") << "{}\n";
  std::ofstream(root / "sub" / "a.jsonl") << "{}\n";
  std::ofstream(fs::temp_directory_path() / "nj_path_utils_outside.ndjson") << "{}\n";

  fs::path got;
  check(nj::resolve_under(root, "v1..2.ndjson", &got) && got.filename() == "v1..2.ndjson",
        "dots inside a file name are allowed");
  check(nj::resolve_under(root, "sub/a.jsonl", &got) && got.filename() == "a.jsonl", "nested file resolves");

  check(!nj::resolve_under(root, "../nj_path_utils_outside.ndjson", &got), "parent component rejected");
  check(!nj::resolve_under(root, "sub/../v1..2.ndjson", &got), "parent component in the middle rejected");
  check(!nj::resolve_under(root, (fs::temp_directory_path() / "nj_path_utils_outside.ndjson").string(), &got),
        "absolute path outside the root rejected");
  check(!nj::resolve_under(root, "missing.ndjson", &got), "missing file rejected");
  check(!nj::resolve_under(root, "sub", &got), "directory rejected");
  check(!nj::resolve_under(root, "", &got), "empty name rejected");

  check(nj::has_ndjson_extension("a.NDJSON") && nj::has_ndjson_extension("b.jsonl") &&
        !nj::has_ndjson_extension("c.json"), "extension match ignores case");

  fs::remove_all(root);
  fs::remove(fs::temp_directory_path() / "nj_path_utils_outside.ndjson");
  return fails ? 1 : 0;
}
