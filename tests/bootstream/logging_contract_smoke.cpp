#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/stream_fixtures.hpp"
#include "common/temp_dir.hpp"
#include "core/errors/exit_codes.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
namespace common = bootstream::tests::common;
using bootstream::core::errors::ExitCode;
using bootstream::core::errors::ToInt;

int main() {
  const fs::path root = common::CreateUniqueTempDir("bootstream-logging");
  common::BuildFixtureStream(root);
  const std::string tree = root.string();

  const auto debug_run = common::DispatchCaptured({"bootstream", "copy-version", tree, "20191004",
                                                   "20191022", "arch=arm64", "--no-sign",
                                                   "--log-level", "debug"});
  common::AssertExitCode(debug_run.exit_code, ToInt(ExitCode::kSuccess), "debug copy");
  common::AssertContains(debug_run.err, "level=DEBUG");
  common::AssertContains(debug_run.err, "op=\"copy-version\"");
  common::AssertContains(debug_run.err, "tree=\"" + tree + "\"");
  common::AssertContains(debug_run.err, "msg=\"copy decision\"");
  common::AssertContains(debug_run.err, "product_id=\"com.example:18.04:arm64\"");
  common::AssertContains(debug_run.err, "msg=\"operation applied\"");
  common::AssertNotContains(debug_run.out, "ts_utc=");

  const auto quiet_run = common::DispatchCaptured({"bootstream", "remove-version", tree,
                                                   "20191022", "--no-sign", "--log-level",
                                                   "error"});
  common::AssertExitCode(quiet_run.exit_code, ToInt(ExitCode::kSuccess), "quiet remove");
  common::Expect(quiet_run.err.empty(), "error level should suppress info logs");

  const auto failed_run = common::DispatchCaptured(
      {"bootstream", "copy-version", tree, "20191004", "20191022", "--log-level", "error"});
  common::AssertExitCode(failed_run.exit_code, ToInt(ExitCode::kKeyringUnavailable),
                         "unsigned copy without keyring");
  common::AssertContains(failed_run.err, "level=ERROR");
  common::AssertContains(failed_run.err, "msg=\"operation aborted\"");
  common::AssertContains(failed_run.err, "kind=\"KeyringUnavailable\"");

  common::RemovePathBestEffort(root);
  return 0;
}
