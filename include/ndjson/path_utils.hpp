#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace nj {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p, std::string* err_out = nullptr);

// .ndjson | .jsonl
bool has_ndjson_extension(std::string_view path);

// Resolve `rel` under `root`; false when it escapes root or does not exist.
bool resolve_under(const std::filesystem::path& root, std::string_view rel,
                   std::filesystem::path* out);

// Stable hex digest prefix (SHA-256 with NJ_USE_OPENSSL).
std::string hex_hash_prefix(std::string_view data, int len);

}
