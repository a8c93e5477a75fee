#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/stream_fixtures.hpp"
#include "common/temp_dir.hpp"
#include "core/errors/exit_codes.hpp"
#include "ops/orphans.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace common = bootstream::tests::common;
namespace ops = bootstream::ops;
using bootstream::core::errors::ExitCode;
using bootstream::core::errors::ToInt;

namespace {

common::CapturedDispatch Run(const std::vector<std::string>& args, ExitCode expected,
                             std::string_view context) {
  std::vector<std::string> argv = {"bootstream"};
  argv.insert(argv.end(), args.begin(), args.end());
  const common::CapturedDispatch result = common::DispatchCaptured(argv);
  if (result.exit_code != ToInt(expected)) {
    std::cerr << result.out << result.err;
  }
  common::AssertExitCode(result.exit_code, ToInt(expected), context);
  return result;
}

ops::OrphanLedger ReadLedger(const fs::path& path) {
  ops::OrphanLedger ledger;
  bootstream::core::errors::Error error;
  if (!ops::ReadOrphanData(path, ledger, error)) {
    common::Fail("read orphan data failed: " + error.message);
  }
  return ledger;
}

} // namespace

int main() {
  const fs::path root = common::CreateUniqueTempDir("bootstream-cli-orphans");
  common::BuildFixtureStream(root);
  const std::string tree = root.string();
  // Kept inside the tree; it must never list itself.
  const fs::path data = root / "orphans.json";

  common::WriteStringToFile(root / "SHA256SUMS", "stale");
  common::WriteStringToFile(root / "bionic/amd64/20190901/root-image.gz", "old");
  common::WriteStringToFile(root / ".data/mirror-state", "tool state");

  // Without orphan data the scan only prints.
  const auto listed = Run({"find-orphans", tree}, ExitCode::kSuccess, "find-orphans");
  common::AssertContains(listed.out, "SHA256SUMS\nbionic/amd64/20190901/root-image.gz\n");
  common::AssertNotContains(listed.out, "mirror-state");
  common::Expect(!fs::exists(data), "plain scan must not write orphan data");

  const auto recorded =
      Run({"find-orphans", tree, data.string()}, ExitCode::kSuccess, "find-orphans record");
  common::AssertNotContains(recorded.out, "orphans.json");
  ops::OrphanLedger ledger = ReadLedger(data);
  common::Expect(ledger.size() == 2 && ledger.count("SHA256SUMS") == 1 &&
                     ledger.count("bionic/amd64/20190901/root-image.gz") == 1,
                 "orphan data should hold both orphans");

  // Backdate one entry; a rescan keeps the first-seen stamp.
  ledger["SHA256SUMS"] = std::string(common::kFixtureStamp);
  bootstream::core::errors::Error error;
  if (!ops::WriteOrphanData(data, ledger, error)) {
    common::Fail("write orphan data failed: " + error.message);
  }
  const auto rescanned = Run({"find-orphans", tree, data.string(), "--json"},
                             ExitCode::kSuccess, "find-orphans rescan");
  common::AssertContains(rescanned.out, "\"SHA256SUMS\": \"" +
                                            std::string(common::kFixtureStamp) + "\"");
  common::Expect(ReadLedger(data).at("SHA256SUMS") == common::kFixtureStamp,
                 "first-seen stamp should survive a rescan");

  // Dry run names what would go and changes nothing.
  const auto before = common::SnapshotTree(root);
  const auto dry = Run({"reap-orphans", tree, data.string(), "--dry-run"}, ExitCode::kSuccess,
                       "reap dry run");
  common::AssertContains(dry.out, "would reap SHA256SUMS orphaned on " +
                                      std::string(common::kFixtureStamp));
  common::AssertContains(dry.out, "summary reaped=1 kept=1 released=0");
  common::AssertTreeUnchanged(before, root, "reap dry run");

  // Default age is three days: only the backdated orphan goes.
  const auto reaped = Run({"reap-orphans", tree, data.string()}, ExitCode::kSuccess, "reap");
  common::AssertContains(reaped.out, "reaped SHA256SUMS orphaned on ");
  common::Expect(!fs::exists(root / "SHA256SUMS"), "old orphan should be deleted");
  common::Expect(fs::exists(root / "bionic/amd64/20190901/root-image.gz"),
                 "recent orphan should stay");
  common::Expect(ReadLedger(data).size() == 1, "reaped entry should leave the orphan data");

  Run({"reap-orphans", tree, data.string(), "--older", "3w"}, ExitCode::kUsage, "bad age");
  Run({"reap-orphans", tree, data.string(), "--older", "1h", "--keyring", "k.pem"},
      ExitCode::kUsage, "flag not accepted by reap-orphans");
  Run({"reap-orphans", tree}, ExitCode::kUsage, "reap without orphan data argument");

  const auto now = Run({"reap-orphans", tree, data.string(), "--now"}, ExitCode::kSuccess,
                       "reap now");
  common::AssertContains(now.out, "reaped bionic/amd64/20190901/root-image.gz");
  common::AssertContains(now.out, "pruned bionic/amd64/20190901");
  common::Expect(!fs::exists(root / "bionic/amd64/20190901"), "emptied directory should be gone");
  common::Expect(ReadLedger(data).empty(), "orphan data should be empty");
  common::Expect(fs::exists(root / ".data/mirror-state"), ".data must never be touched");

  // Invalid orphan data is refused before anything is scanned or written.
  common::WriteStringToFile(data, "{ not json");
  const auto invalid = Run({"find-orphans", tree, data.string()}, ExitCode::kCatalogInvalid,
                           "find-orphans with invalid orphan data");
  common::AssertContains(invalid.err, "CorruptIndex");
  common::Expect(common::ReadFileToString(data) == "{ not json",
                 "invalid orphan data must be left as it was");
  Run({"reap-orphans", tree, data.string()}, ExitCode::kCatalogInvalid,
      "reap-orphans with invalid orphan data");
  Run({"reap-orphans", tree, (root / "absent.json").string()}, ExitCode::kFailure,
      "reap-orphans without orphan data");

  common::RemovePathBestEffort(root);
  return 0;
}
