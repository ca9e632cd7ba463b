#include "ndjson/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <iomanip>
#include <sstream>
#include <system_error>
#if defined(NJ_USE_OPENSSL)
  #include <openssl/sha.h>
#endif

namespace nj {

bool ensure_parent_dirs(const std::filesystem::path& p, std::string* err_out) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    if (err_out) *err_out = parent.string() + ": " + ec.message();
    return false;
  }
  return true;
}

bool has_ndjson_extension(std::string_view path) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == ".ndjson" || ext == ".jsonl";
}

bool resolve_under(const std::filesystem::path& root, std::string_view rel,
                   std::filesystem::path* out) {
  if (rel.empty()) return false;
  const std::filesystem::path relp{std::string(rel)};
  for (const auto& part : relp) {
    if (part == "..") return false;
  }

  std::error_code ec;
  auto base = std::filesystem::weakly_canonical(root, ec);
  if (ec) return false;
  auto target = std::filesystem::weakly_canonical(base / relp, ec);
  if (ec) return false;

  // target must sit inside base
  auto mm = std::mismatch(base.begin(), base.end(), target.begin(), target.end());
  if (mm.first != base.end()) return false;
  if (!std::filesystem::is_regular_file(target, ec)) return false;

  if (out) *out = target;
  return true;
}

std::string hex_hash_prefix(std::string_view data, int len) {
#ifdef NJ_USE_OPENSSL
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
  std::ostringstream o;
  for (int i = 0; i < (len+1)/2 && i < SHA256_DIGEST_LENGTH; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  auto s = o.str();
  if ((int)s.size() > len) s.resize(len);
  return s;
#else
  // Fallback (non-crypto)
  size_t h = std::hash<std::string_view>{}(data);
  std::ostringstream o; o << std::hex << std::setw(16) << std::setfill('0') << h;
  auto s = o.str(); if ((int)s.size() > len) s.resize(len); return s;
#endif
}

}
