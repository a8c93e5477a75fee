#pragma once

namespace bootstream::core::errors {

// Stable process-exit contract for publishing automation.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Additional values classify catalog failure modes so release pipelines can
// branch without scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kCatalogInvalid = 10,
  kFilterSyntax = 11,
  kArtifactInvalid = 20,
  kUnknownProduct = 21,
  kSignatureMismatch = 30,
  kKeyringUnavailable = 31,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace bootstream::core::errors
