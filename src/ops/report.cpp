#include "ops/report.hpp"

#include "core/json_dom.hpp"
#include "core/json_writer.hpp"

#include <algorithm>
#include <array>

namespace fs = std::filesystem;

namespace bootstream::ops {

namespace {

using JsonValue = core::json::Value;

constexpr std::array<DecisionKind, 5> kAllDecisionKinds = {
    DecisionKind::kAdded,         DecisionKind::kReplaced, DecisionKind::kSkippedExists,
    DecisionKind::kSkippedAbsent, DecisionKind::kRemoved,
};

// Paths inside the tree are shown relative to it.
std::string DisplayPath(const fs::path& base_dir, const fs::path& path) {
  const fs::path relative = path.lexically_relative(base_dir);
  if (relative.empty() || *relative.begin() == "..") {
    return path.generic_string();
  }
  return relative.generic_string();
}

JsonValue PathArray(const fs::path& base_dir, const std::vector<fs::path>& paths) {
  JsonValue array = JsonValue::MakeArray();
  for (const auto& path : paths) {
    array.array_value.push_back(JsonValue::String(DisplayPath(base_dir, path)));
  }
  return array;
}

void WritePathLines(const fs::path& base_dir, std::string_view verb,
                    const std::vector<fs::path>& paths, std::ostream& out) {
  for (const auto& path : paths) {
    out << verb << ' ' << DisplayPath(base_dir, path) << '\n';
  }
}

} // namespace

const char* ToString(OperationPhase phase) {
  switch (phase) {
  case OperationPhase::kValidated:
    return "Validated";
  case OperationPhase::kPlanned:
    return "Planned";
  case OperationPhase::kApplied:
    return "Applied";
  case OperationPhase::kAborted:
    return "Aborted";
  }
  return "Aborted";
}

const char* ToString(DecisionKind kind) {
  switch (kind) {
  case DecisionKind::kAdded:
    return "added";
  case DecisionKind::kReplaced:
    return "replaced";
  case DecisionKind::kSkippedExists:
    return "skipped-exists";
  case DecisionKind::kSkippedAbsent:
    return "skipped-absent";
  case DecisionKind::kRemoved:
    return "removed";
  }
  return "skipped-absent";
}

std::size_t OperationReport::CountDecisions(DecisionKind kind) const {
  return static_cast<std::size_t>(
      std::count_if(decisions.begin(), decisions.end(),
                    [kind](const Decision& decision) { return decision.kind == kind; }));
}

bool OperationReport::HasChanges() const {
  return CountDecisions(DecisionKind::kAdded) + CountDecisions(DecisionKind::kReplaced) +
             CountDecisions(DecisionKind::kRemoved) >
         0;
}

void WriteReportText(const OperationReport& report, std::ostream& out) {
  out << report.operation << " base=" << report.base_dir.string()
      << " phase=" << ToString(report.phase) << " commit=" << (report.commit ? "true" : "false")
      << '\n';

  for (const auto& decision : report.decisions) {
    out << ToString(decision.kind) << ' ' << decision.content_id << ' ' << decision.product_id
        << ' ' << decision.version_id << '\n';
  }

  out << "summary";
  for (const DecisionKind kind : kAllDecisionKinds) {
    out << ' ' << ToString(kind) << '=' << report.CountDecisions(kind);
  }
  out << '\n';

  WritePathLines(report.base_dir, "duplicated", report.artifacts_duplicated, out);
  WritePathLines(report.base_dir, "wrote", report.files_written, out);
  WritePathLines(report.base_dir, "removed", report.files_removed, out);
  WritePathLines(report.base_dir, "signed", report.signed_documents, out);
  WritePathLines(report.base_dir, "unsigned", report.signatures_removed, out);

  if (report.phase == OperationPhase::kAborted) {
    out << "aborted " << core::errors::Describe(report.error) << '\n';
  }
}

std::string RenderReportJson(const OperationReport& report) {
  JsonValue root = JsonValue::MakeObject();
  root.object_value["operation"] = JsonValue::String(report.operation);
  root.object_value["base_dir"] = JsonValue::String(report.base_dir.string());
  root.object_value["commit"] = JsonValue::Bool(report.commit);
  root.object_value["phase"] = JsonValue::String(ToString(report.phase));

  JsonValue decisions = JsonValue::MakeArray();
  for (const auto& decision : report.decisions) {
    JsonValue item = JsonValue::MakeObject();
    item.object_value["content_id"] = JsonValue::String(decision.content_id);
    item.object_value["product_id"] = JsonValue::String(decision.product_id);
    item.object_value["version"] = JsonValue::String(decision.version_id);
    item.object_value["decision"] = JsonValue::String(ToString(decision.kind));
    decisions.array_value.push_back(std::move(item));
  }
  root.object_value["decisions"] = std::move(decisions);

  JsonValue summary = JsonValue::MakeObject();
  for (const DecisionKind kind : kAllDecisionKinds) {
    summary.object_value[ToString(kind)] =
        JsonValue::Number(static_cast<double>(report.CountDecisions(kind)));
  }
  root.object_value["summary"] = std::move(summary);

  root.object_value["files_written"] = PathArray(report.base_dir, report.files_written);
  root.object_value["files_removed"] = PathArray(report.base_dir, report.files_removed);
  root.object_value["signed"] = PathArray(report.base_dir, report.signed_documents);
  root.object_value["signatures_removed"] = PathArray(report.base_dir, report.signatures_removed);
  root.object_value["artifacts_duplicated"] =
      PathArray(report.base_dir, report.artifacts_duplicated);

  if (report.phase == OperationPhase::kAborted) {
    JsonValue error = JsonValue::MakeObject();
    error.object_value["kind"] = JsonValue::String(core::errors::ToString(report.error.kind));
    error.object_value["message"] = JsonValue::String(report.error.message);
    root.object_value["error"] = std::move(error);
  }

  return core::json::Serialize(root) + "\n";
}

} // namespace bootstream::ops
