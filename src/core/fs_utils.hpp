#ifndef BOOTSTREAM_CORE_FS_UTILS_HPP_
#define BOOTSTREAM_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace bootstream::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

inline bool ReadFileBytes(const std::filesystem::path& path, std::string& contents,
                          std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read file: " + path.string();
    return false;
  }

  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading file: " + path.string();
    return false;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

// Writes `text` to exactly `path`, truncating. Used for staging files whose
// publish happens later through rename.
inline bool WriteFileBytes(const std::filesystem::path& path, std::string_view text,
                           std::string& error) {
  if (!EnsureParentDirectory(path, error)) {
    return false;
  }

  std::ofstream out_file(path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    error = "failed to open output file '" + path.string() + "'";
    return false;
  }
  out_file.write(text.data(), static_cast<std::streamsize>(text.size()));
  out_file.flush();
  if (!out_file) {
    error = "failed while writing output file '" + path.string() + "'";
    return false;
  }
  return true;
}

// Best-effort atomic text file write:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  if (!WriteFileBytes(temp_path, text, error)) {
    std::error_code cleanup_ec;
    (void)std::filesystem::remove(temp_path, cleanup_ec);
    return false;
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

// True when `path` (after lexical normalization) stays inside `base`.
inline bool IsWithinDirectory(const std::filesystem::path& base, const std::filesystem::path& path) {
  const std::filesystem::path normalized_base = base.lexically_normal();
  const std::filesystem::path relative = path.lexically_normal().lexically_relative(normalized_base);
  if (relative.empty()) {
    return false;
  }
  const std::string first = relative.begin()->string();
  return first != ".." && !relative.is_absolute();
}

} // namespace bootstream::core

#endif // BOOTSTREAM_CORE_FS_UTILS_HPP_
