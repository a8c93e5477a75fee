#pragma once

#include "core/errors/error.hpp"
#include "stream/model.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace bootstream::stream {

// A resolved artifact: the claim plus the absolute location it was checked at.
struct ResolvedArtifact {
  Artifact artifact;
  std::filesystem::path absolute_path;
};

// Checks one artifact claim against the filesystem.
//
// Contract:
// - the claim path must be relative and stay under `base_dir`
// - kMissingArtifactFile when the path escapes the tree or is not a file
// - kChecksumMismatch when the on-disk size or SHA-256 differ from the claim
bool ResolveArtifact(const std::filesystem::path& base_dir, const Artifact& claim,
                     ResolvedArtifact& resolved, core::errors::Error& error);

// Converts an absolute build-pipeline path into a stream-relative path
// ("xenial/amd64/20240101/root-image.gz"). Sources outside `base_dir` are
// rejected with kMissingArtifactFile.
bool RelativizeSource(const std::filesystem::path& base_dir,
                      const std::filesystem::path& absolute_source, std::string& relative,
                      core::errors::Error& error);

struct ArtifactFinding {
  std::string content_id;
  std::string product_id;
  std::string version_id;
  std::string item_name;
  std::string path;
  core::errors::Error error;
};

struct ArtifactVerifyReport {
  std::size_t checked_files = 0;
  std::size_t referenced_items = 0;
  std::vector<ArtifactFinding> findings;
};

// Read-only sweep over every item of every version. Each distinct
// (path, sha256, size) claim is hashed once; every item sharing a failing claim
// gets its own finding.
void VerifyStreamArtifacts(const Stream& stream, ArtifactVerifyReport& report);

} // namespace bootstream::stream
