#pragma once

#include "core/errors/error.hpp"

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace bootstream::ops {

enum class OperationPhase {
  kValidated,
  kPlanned,
  kApplied,
  kAborted,
};

enum class DecisionKind {
  kAdded,
  kReplaced,
  kSkippedExists,
  kSkippedAbsent,
  kRemoved,
};

const char* ToString(OperationPhase phase);
const char* ToString(DecisionKind kind);

// One per-product outcome of a version operation.
struct Decision {
  std::string content_id;
  std::string product_id;
  std::string version_id;
  DecisionKind kind = DecisionKind::kAdded;
};

// Result of one engine invocation. Dry runs fill only `decisions`; commits
// also list what was published.
struct OperationReport {
  std::string operation;
  std::filesystem::path base_dir;
  bool commit = false;
  OperationPhase phase = OperationPhase::kValidated;
  std::vector<Decision> decisions;
  std::vector<std::filesystem::path> files_written;
  std::vector<std::filesystem::path> files_removed;
  std::vector<std::filesystem::path> signed_documents;
  std::vector<std::filesystem::path> signatures_removed;
  std::vector<std::filesystem::path> artifacts_duplicated;
  core::errors::Error error;

  std::size_t CountDecisions(DecisionKind kind) const;
  bool HasChanges() const;
};

// Human-readable lines:
//
//   copy-version base=/srv/tree phase=Applied commit=true
//   added com.example:download ubuntu:24.04:amd64 20240201
//   summary added=1 replaced=0 skipped-exists=0 skipped-absent=0 removed=0
//   wrote streams/v1/com.example:download.json
void WriteReportText(const OperationReport& report, std::ostream& out);

// Same content as a JSON document (sorted keys, trailing newline).
std::string RenderReportJson(const OperationReport& report);

} // namespace bootstream::ops
