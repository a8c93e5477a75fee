#include "common/assertions.hpp"
#include "common/stream_fixtures.hpp"
#include "common/temp_dir.hpp"
#include "ops/orphans.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace common = bootstream::tests::common;
namespace ops = bootstream::ops;
using bootstream::core::errors::Describe;
using bootstream::core::errors::Error;

int main() {
  const fs::path root = common::CreateUniqueTempDir("bootstream-find-orphans");
  bootstream::stream::Stream tree = common::BuildFixtureStream(root);

  ops::OrphanReport report;
  Error error;
  if (!ops::FindOrphans(tree, report, error)) {
    common::Fail("scan failed: " + Describe(error));
  }
  common::Expect(report.orphans.empty(), "fixture tree has no orphans");
  common::Expect(report.scanned_files == 12, "streams/ must not be scanned");
  common::Expect(report.referenced_paths == 12, "twelve distinct artifact paths");

  common::WriteStringToFile(root / "bionic/amd64/20190901/root-image.gz", "old");
  common::WriteStringToFile(root / "SHA256SUMS", "stale");
  common::WriteStringToFile(root / "streams/v1/notes.txt", "ignored");
  common::WriteStringToFile(root / ".data/mirror-state", "ignored");

  // A second version sharing existing files adds no orphans.
  auto& product = tree.product_files.at(std::string(common::kPrimaryContentId))
                      .products.at("com.example:18.04:amd64");
  product.versions["20191022"] = product.versions.at("20191004");

  const auto before = common::SnapshotTree(root);
  if (!ops::FindOrphans(tree, report, error)) {
    common::Fail("second scan failed: " + Describe(error));
  }
  const std::vector<std::string> expected = {"SHA256SUMS", "bionic/amd64/20190901/root-image.gz"};
  common::Expect(report.orphans == expected, "unexpected orphan list");
  common::AssertTreeUnchanged(before, root, "find-orphans");

  // The orphan-data ledger remembers when each file was first seen orphaned.
  const fs::path data = root.parent_path() / (root.filename().string() + "-orphans.json");
  ops::OrphanLedger ledger;
  if (!ops::ReadOrphanData(data, ledger, error)) {
    common::Fail("missing orphan data should read as empty: " + Describe(error));
  }
  common::Expect(ledger.empty(), "missing orphan data should be empty");
  ops::RecordOrphans(report, common::kFixtureStamp, ledger);
  if (!ops::WriteOrphanData(data, ledger, error)) {
    common::Fail("write orphan data failed: " + Describe(error));
  }
  common::AssertContains(common::ReadFileToString(data), "\"format\": \"orphans:1.0\"");

  // A later scan keeps the first-seen stamp, stamps new orphans and drops
  // files that are gone.
  fs::remove(root / "SHA256SUMS");
  common::WriteStringToFile(root / "bionic/amd64/20190901/boot-kernel", "old");
  if (!ops::FindOrphans(tree, report, error)) {
    common::Fail("third scan failed: " + Describe(error));
  }
  ops::OrphanLedger reread;
  if (!ops::ReadOrphanData(data, reread, error)) {
    common::Fail("read orphan data failed: " + Describe(error));
  }
  common::Expect(reread == ledger, "orphan data should read back as written");
  ops::RecordOrphans(report, common::kPinnedStamp, reread);
  const ops::OrphanLedger expected_ledger = {
      {"bionic/amd64/20190901/boot-kernel", std::string(common::kPinnedStamp)},
      {"bionic/amd64/20190901/root-image.gz", std::string(common::kFixtureStamp)},
  };
  common::Expect(reread == expected_ledger, "first-seen stamps should survive a rescan");

  // Invalid orphan data is rejected.
  const std::vector<std::string> invalid = {
      "{ not json",
      "{\"format\": \"orphans:2.0\", \"orphans\": {}}",
      "{\"format\": \"orphans:1.0\", \"orphans\": []}",
      "{\"format\": \"orphans:1.0\", \"orphans\": {\"a\": \"yesterday\"}}",
      "{\"format\": \"orphans:1.0\", \"orphans\": {\"../outside\": \"" +
          std::string(common::kFixtureStamp) + "\"}}",
  };
  for (const auto& text : invalid) {
    common::WriteStringToFile(data, text);
    common::Expect(!ops::ReadOrphanData(data, reread, error), "accepted invalid data: " + text);
    common::Expect(error.kind == bootstream::core::errors::ErrorKind::kCorruptIndex,
                   "expected CorruptIndex for: " + text);
  }

  common::RemovePathBestEffort(data);
  common::RemovePathBestEffort(root);
  return 0;
}
