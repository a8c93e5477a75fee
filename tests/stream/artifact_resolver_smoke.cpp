#include "common/assertions.hpp"
#include "common/stream_fixtures.hpp"
#include "common/temp_dir.hpp"
#include "stream/artifact_resolver.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
namespace common = bootstream::tests::common;
namespace stream = bootstream::stream;
using bootstream::core::errors::Error;
using bootstream::core::errors::ErrorKind;

namespace {

void ExpectResolveFailure(const fs::path& root, const stream::Artifact& claim, ErrorKind expected,
                          const std::string& context) {
  stream::ResolvedArtifact resolved;
  Error error;
  if (stream::ResolveArtifact(root, claim, resolved, error)) {
    common::Fail(context + ": resolve should have failed");
  }
  common::Expect(error.kind == expected, context + ": unexpected kind " +
                                             bootstream::core::errors::Describe(error));
}

} // namespace

int main() {
  const fs::path root = common::CreateUniqueTempDir("bootstream-artifact-resolver");
  const stream::Artifact good =
      common::WriteArtifact(root, "noble/amd64/20260217/boot-kernel", "kernel", "boot-kernel");

  stream::ResolvedArtifact resolved;
  Error error;
  if (!stream::ResolveArtifact(root, good, resolved, error)) {
    common::Fail("valid artifact rejected: " + bootstream::core::errors::Describe(error));
  }
  common::Expect(resolved.absolute_path == (root / good.path).lexically_normal(),
                 "resolved path mismatch");

  stream::Artifact wrong_size = good;
  wrong_size.size += 1;
  ExpectResolveFailure(root, wrong_size, ErrorKind::kChecksumMismatch, "size mismatch");

  stream::Artifact wrong_hash = good;
  wrong_hash.sha256[0] = wrong_hash.sha256[0] == '0' ? '1' : '0';
  ExpectResolveFailure(root, wrong_hash, ErrorKind::kChecksumMismatch, "sha mismatch");

  stream::Artifact missing = good;
  missing.path = "noble/amd64/20260217/absent";
  ExpectResolveFailure(root, missing, ErrorKind::kMissingArtifactFile, "missing file");

  stream::Artifact escaping = good;
  escaping.path = "../outside/boot-kernel";
  ExpectResolveFailure(root, escaping, ErrorKind::kMissingArtifactFile, "escaping path");

  stream::Artifact absolute = good;
  absolute.path = (root / good.path).string();
  ExpectResolveFailure(root, absolute, ErrorKind::kMissingArtifactFile, "absolute claim path");

  // Build-pipeline sources are relativized against the base directory.
  std::string relative;
  if (!stream::RelativizeSource(root, root / "noble/amd64/20260217/boot-kernel", relative,
                                error)) {
    common::Fail("relativize failed: " + bootstream::core::errors::Describe(error));
  }
  common::Expect(relative == "noble/amd64/20260217/boot-kernel", "relativized path mismatch");
  Error outside_error;
  common::Expect(!stream::RelativizeSource(root, root.parent_path() / "elsewhere/file", relative,
                                           outside_error),
                 "source outside the tree must be rejected");

  // Verification mode hashes shared files once and reports each bad item.
  stream::Stream tree = common::BuildFixtureStream(root);
  stream::ArtifactVerifyReport report;
  stream::VerifyStreamArtifacts(tree, report);
  common::Expect(report.findings.empty(), "fixture artifacts should verify");
  common::Expect(report.referenced_items == 12, "fixture has 12 items");

  auto& product = tree.product_files.at(std::string(common::kPrimaryContentId))
                      .products.at("com.example:18.04:amd64");
  product.versions["20191022"] = product.versions.at("20191004");
  common::WriteStringToFile(root / "bionic/amd64/20191004/boot-kernel", "tampered");
  stream::VerifyStreamArtifacts(tree, report);
  common::Expect(report.checked_files == 12, "shared claims must be hashed once");
  common::Expect(report.findings.size() == 2, "both versions sharing the file should be reported");
  for (const auto& finding : report.findings) {
    common::Expect(finding.error.kind == ErrorKind::kChecksumMismatch, "expected checksum finding");
    common::Expect(finding.item_name == "boot-kernel", "wrong item reported");
  }

  common::RemovePathBestEffort(root);
  return 0;
}
