#include "stream/artifact_resolver.hpp"

#include "core/fs_utils.hpp"
#include "core/hash/sha256.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <system_error>
#include <tuple>

namespace fs = std::filesystem;

namespace bootstream::stream {

namespace {

using core::errors::Error;
using core::errors::ErrorKind;

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

} // namespace

bool ResolveArtifact(const fs::path& base_dir, const Artifact& claim, ResolvedArtifact& resolved,
                     Error& error) {
  const fs::path relative(claim.path);
  if (claim.path.empty() || relative.is_absolute()) {
    return error.Set(ErrorKind::kMissingArtifactFile,
                     "artifact path must be relative to the stream: '" + claim.path + "'");
  }

  const fs::path absolute = (base_dir / relative).lexically_normal();
  if (!core::IsWithinDirectory(base_dir, absolute)) {
    return error.Set(ErrorKind::kMissingArtifactFile,
                     "artifact path escapes the stream directory: '" + claim.path + "'");
  }

  std::error_code ec;
  if (!fs::is_regular_file(absolute, ec) || ec) {
    return error.Set(ErrorKind::kMissingArtifactFile,
                     "artifact file not found: " + absolute.string());
  }

  std::string digest;
  std::uintmax_t size_bytes = 0;
  std::string hash_error;
  if (!core::hash::Sha256File(absolute, digest, size_bytes, hash_error)) {
    return error.Set(ErrorKind::kMissingArtifactFile, hash_error);
  }

  if (size_bytes != claim.size) {
    return error.Set(ErrorKind::kChecksumMismatch,
                     absolute.string() + ": size " + std::to_string(size_bytes) +
                         " does not match claimed " + std::to_string(claim.size));
  }
  if (digest != ToLower(claim.sha256)) {
    return error.Set(ErrorKind::kChecksumMismatch,
                     absolute.string() + ": sha256 " + digest + " does not match claimed " +
                         claim.sha256);
  }

  resolved.artifact = claim;
  resolved.artifact.sha256 = digest;
  resolved.absolute_path = absolute;
  return true;
}

bool RelativizeSource(const fs::path& base_dir, const fs::path& absolute_source,
                      std::string& relative, Error& error) {
  const fs::path normalized_base = fs::absolute(base_dir).lexically_normal();
  const fs::path normalized_source = fs::absolute(absolute_source).lexically_normal();
  if (!core::IsWithinDirectory(normalized_base, normalized_source)) {
    return error.Set(ErrorKind::kMissingArtifactFile,
                     "artifact source '" + absolute_source.string() +
                         "' is outside the stream directory '" + base_dir.string() + "'");
  }
  relative = normalized_source.lexically_relative(normalized_base).generic_string();
  return true;
}

void VerifyStreamArtifacts(const Stream& stream, ArtifactVerifyReport& report) {
  report = ArtifactVerifyReport{};

  using ClaimKey = std::tuple<std::string, std::string, std::uint64_t>;
  std::map<ClaimKey, Error> checked;

  for (const auto& [content_id, product_file] : stream.product_files) {
    for (const auto& [product_id, product] : product_file.products) {
      for (const auto& [version_id, version] : product.versions) {
        for (const auto& [item_name, artifact] : version.items) {
          ++report.referenced_items;
          const ClaimKey key{artifact.path, ToLower(artifact.sha256), artifact.size};
          auto it = checked.find(key);
          if (it == checked.end()) {
            ResolvedArtifact resolved;
            Error error;
            const bool ok = ResolveArtifact(stream.base_dir, artifact, resolved, error);
            it = checked.emplace(key, ok ? Error{} : std::move(error)).first;
            ++report.checked_files;
          }
          if (it->second.kind == ErrorKind::kNone) {
            continue;
          }
          report.findings.push_back(ArtifactFinding{
              .content_id = content_id,
              .product_id = product_id,
              .version_id = version_id,
              .item_name = item_name,
              .path = artifact.path,
              .error = it->second,
          });
        }
      }
    }
  }
}

} // namespace bootstream::stream
