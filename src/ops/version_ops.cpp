#include "ops/version_ops.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "signing/ed25519_signer.hpp"
#include "signing/synchronizer.hpp"
#include "stream/artifact_resolver.hpp"
#include "stream/filter.hpp"

#include <algorithm>
#include <cmath>
#include <system_error>
#include <tuple>

namespace fs = std::filesystem;

namespace bootstream::ops {

namespace {

using core::errors::Error;
using core::errors::ErrorKind;
using core::logging::LogDebug;
using core::logging::LogInfo;
using JsonValue = core::json::Value;

// Hashes each distinct artifact claim once per operation; copies across
// hundreds of products usually share the same few files.
class ArtifactCheckCache {
public:
  explicit ArtifactCheckCache(fs::path base_dir) : base_dir_(std::move(base_dir)) {}

  bool Check(const stream::Artifact& artifact, Error& error) {
    const Key key{artifact.path, artifact.sha256, artifact.size};
    const auto it = results_.find(key);
    if (it != results_.end()) {
      if (it->second.kind == ErrorKind::kNone) {
        return true;
      }
      error = it->second;
      return false;
    }

    stream::ResolvedArtifact resolved;
    Error check_error;
    const bool ok = stream::ResolveArtifact(base_dir_, artifact, resolved, check_error);
    results_.emplace(key, ok ? Error{} : check_error);
    if (!ok) {
      error = std::move(check_error);
    }
    return ok;
  }

private:
  using Key = std::tuple<std::string, std::string, std::uint64_t>;

  fs::path base_dir_;
  std::map<Key, Error> results_;
};

// Filters see the product attributes plus `product_name` and `content_id`
// unless the product defines those keys itself.
stream::AttributeMap FilterView(const std::string& content_id, const std::string& product_id,
                                const stream::Product& product) {
  stream::AttributeMap view = product.attributes;
  view.emplace("product_name", product_id);
  view.emplace("content_id", content_id);
  return view;
}

// "noble/amd64/20240101/root.gz" -> "noble/amd64/20240201/root.gz"
std::string RewriteVersionSegments(const std::string& path, std::string_view from,
                                   std::string_view to) {
  std::string rewritten;
  std::size_t start = 0;
  while (start <= path.size()) {
    const std::size_t end = std::min(path.find('/', start), path.size());
    const std::string_view segment(path.data() + start, end - start);
    rewritten.append(segment == from ? to : segment);
    if (end == path.size()) {
      break;
    }
    rewritten.push_back('/');
    start = end + 1;
  }
  return rewritten;
}

bool RequireVersionId(std::string_view version, std::string_view what, Error& error) {
  if (version.empty()) {
    return error.Set(ErrorKind::kMalformedProduct, std::string(what) + " must not be empty");
  }
  if (version.find('/') != std::string_view::npos) {
    return error.Set(ErrorKind::kMalformedProduct,
                     std::string(what) + " '" + std::string(version) + "' must not contain '/'");
  }
  return true;
}

bool ReadStringMap(const JsonValue& root, std::string_view key, const std::string& where,
                   stream::AttributeMap& out, Error& error) {
  const JsonValue* field = root.Find(key);
  if (field == nullptr) {
    return true;
  }
  if (!field->IsObject()) {
    return error.Set(ErrorKind::kMalformedProduct,
                     where + "." + std::string(key) + " must be an object");
  }
  for (const auto& [name, value] : field->object_value) {
    if (!value.IsString()) {
      return error.Set(ErrorKind::kMalformedProduct,
                       where + "." + std::string(key) + "." + name + " must be a string");
    }
    out[name] = value.string_value;
  }
  return true;
}

bool ReadRequiredString(const JsonValue& root, std::string_view key, const std::string& where,
                        std::string& out, Error& error) {
  const JsonValue* field = root.Find(key);
  if (field == nullptr || !field->IsString() || field->string_value.empty()) {
    return error.Set(ErrorKind::kMalformedProduct,
                     where + "." + std::string(key) + " must be a non-empty string");
  }
  out = field->string_value;
  return true;
}

bool ReadItem(const JsonValue& value, const std::string& where, CreateItem& item, Error& error) {
  if (!value.IsObject()) {
    return error.Set(ErrorKind::kMalformedProduct, where + " must be an object");
  }
  if (!ReadRequiredString(value, "path", where, item.source, error) ||
      !ReadRequiredString(value, "sha256", where, item.sha256, error) ||
      !ReadRequiredString(value, "ftype", where, item.ftype, error)) {
    return false;
  }

  const JsonValue* size = value.Find("size");
  if (size == nullptr || size->type != JsonValue::Type::kNumber || size->number_value < 0.0 ||
      std::floor(size->number_value) != size->number_value) {
    return error.Set(ErrorKind::kMalformedProduct, where + ".size must be a non-negative integer");
  }
  item.size = static_cast<std::uint64_t>(size->number_value);

  for (const auto& [name, field] : value.object_value) {
    if (name == "path" || name == "sha256" || name == "ftype" || name == "size") {
      continue;
    }
    if (!field.IsString()) {
      return error.Set(ErrorKind::kMalformedProduct, where + "." + name + " must be a string");
    }
    item.extra[name] = field.string_value;
  }
  return true;
}

} // namespace

bool LoadCreateVersionRequest(const fs::path& request_path, CreateVersionRequest& request,
                              Error& error) {
  std::string text;
  std::string io_error;
  if (!core::ReadFileBytes(request_path, text, io_error)) {
    return error.Set(ErrorKind::kIoFailure, io_error);
  }

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error)) {
    return error.Set(ErrorKind::kMalformedProduct,
                     "invalid JSON in request '" + request_path.string() + "': " + parse_error);
  }
  if (!root.IsObject()) {
    return error.Set(ErrorKind::kMalformedProduct, "request root must be an object");
  }

  const std::string where = "request";
  CreateVersionRequest parsed;
  if (!ReadRequiredString(root, "content_id", where, parsed.content_id, error) ||
      !ReadRequiredString(root, "product_id", where, parsed.product_id, error) ||
      !ReadRequiredString(root, "version", where, parsed.version_id, error) ||
      !ReadStringMap(root, "attributes", where, parsed.attributes, error) ||
      !ReadStringMap(root, "version_attributes", where, parsed.version_extra, error)) {
    return false;
  }
  if (const JsonValue* datatype = root.Find("datatype"); datatype != nullptr) {
    if (!datatype->IsString() || datatype->string_value.empty()) {
      return error.Set(ErrorKind::kMalformedProduct,
                       "request.datatype must be a non-empty string");
    }
    parsed.datatype = datatype->string_value;
  }

  const JsonValue* items = root.Find("items");
  if (items == nullptr || !items->IsObject() || items->object_value.empty()) {
    return error.Set(ErrorKind::kMalformedProduct, "request.items must be a non-empty object");
  }
  for (const auto& [name, value] : items->object_value) {
    CreateItem item;
    if (!ReadItem(value, where + ".items." + name, item, error)) {
      return false;
    }
    parsed.items.emplace(name, std::move(item));
  }

  request = std::move(parsed);
  return true;
}

VersionEngine::VersionEngine(core::EngineConfig config, core::logging::Logger* logger)
    : config_(std::move(config)), logger_(logger) {}

void VersionEngine::SetSigner(signing::ISigner* signer) {
  injected_signer_ = signer;
}

void VersionEngine::SetPublishHooks(core::PublishHooks hooks) {
  hooks_ = std::move(hooks);
}

const core::EngineConfig& VersionEngine::Config() const {
  return config_;
}

void VersionEngine::BeginReport(std::string_view operation, OperationReport& report) const {
  report = OperationReport{};
  report.operation = std::string(operation);
  report.base_dir = config_.base_dir;
  report.commit = config_.commit;
  report.phase = OperationPhase::kValidated;
}

bool VersionEngine::Abort(OperationReport& report, Error& error) const {
  report.phase = OperationPhase::kAborted;
  report.error = error;
  if (logger_ != nullptr) {
    logger_->Error("operation aborted", {{"kind", core::errors::ToString(error.kind)},
                                         {"error", error.message}});
  }
  return false;
}

bool VersionEngine::AcquireSigner(signing::ISigner*& signer, Error& error) {
  signer = injected_signer_;
  if (signer != nullptr) {
    return true;
  }
  if (keyring_signer_ == nullptr && !config_.keyring_path.empty()) {
    std::unique_ptr<signing::Ed25519Signer> loaded;
    if (!signing::Ed25519Signer::LoadFromPemFile(config_.keyring_path, loaded, error)) {
      return false;
    }
    LogDebug(logger_, "keyring loaded", {{"key_id", loaded->KeyId()}});
    keyring_signer_ = std::move(loaded);
  }
  signer = keyring_signer_.get();
  return true;
}

bool VersionEngine::Preflight(Plan& plan, Error& error) {
  if (!config_.commit) {
    return true;
  }
  const fs::path journal = stream::JournalPath(config_.base_dir);
  if (core::HasPendingJournal(journal)) {
    return error.Set(ErrorKind::kPartialWriteDetected,
                     "interrupted publish journal found at '" + journal.string() +
                         "'; run `bootstream recover` first");
  }
  if (!AcquireSigner(plan.signer, error)) {
    return false;
  }
  if (config_.sign && plan.signer == nullptr) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "signing is enabled but no keyring is configured (pass --keyring or "
                     "--no-sign)");
  }

  if (plan.signer != nullptr) {
    signing::SignatureVerifyReport verify_report;
    if (!signing::VerifyStreamSignatures(config_.base_dir, *plan.signer, false, verify_report,
                                         error)) {
      return false;
    }
    LogDebug(logger_, "pre-flight signature check passed",
             {{"documents", std::to_string(verify_report.checked_documents)}});
  }
  return true;
}

bool VersionEngine::Apply(Plan& plan, OperationReport& report, Error& error) {
  signing::ISigner* signer = plan.signer;

  signing::SyncOptions sync_options;
  sync_options.signer = config_.sign ? signer : nullptr;
  sync_options.clock = config_.clock;
  sync_options.logger = logger_;

  signing::SyncResult sync;
  if (!signing::SynchronizeStream(plan.next, plan.changed_ids, sync_options, sync, error)) {
    return false;
  }
  sync.request.duplicates = plan.duplicates;

  stream::SaveResult saved;
  if (!stream::SaveDocuments(config_.base_dir, sync.request, hooks_, saved, error)) {
    return false;
  }

  report.files_written = std::move(saved.written);
  report.files_removed = std::move(saved.removed);
  report.signed_documents = std::move(sync.signed_documents);
  report.signatures_removed = std::move(sync.signatures_removed);
  for (const auto& duplicate : plan.duplicates) {
    report.artifacts_duplicated.push_back(duplicate.target);
  }
  report.phase = OperationPhase::kApplied;

  LogInfo(logger_, "operation applied",
          {{"written", std::to_string(report.files_written.size())},
           {"removed", std::to_string(report.files_removed.size())},
           {"signed", std::to_string(report.signed_documents.size())}});
  return true;
}

bool VersionEngine::CreateVersion(const CreateVersionRequest& request, OperationReport& report,
                                  Error& error) {
  BeginReport("create-version", report);

  if (!stream::IsValidContentId(request.content_id)) {
    error.Set(ErrorKind::kMalformedProduct,
              "invalid content id '" + request.content_id + "'");
    return Abort(report, error);
  }
  if (request.product_id.empty()) {
    error.Set(ErrorKind::kMalformedProduct, "product id must not be empty");
    return Abort(report, error);
  }
  if (!RequireVersionId(request.version_id, "version id", error)) {
    return Abort(report, error);
  }
  if (request.items.empty()) {
    error.Set(ErrorKind::kMalformedProduct, "a version needs at least one item");
    return Abort(report, error);
  }

  Plan plan;
  if (!Preflight(plan, error) ||
      !stream::LoadOrCreateStream(config_.base_dir, plan.next, error)) {
    return Abort(report, error);
  }

  const stream::ProductFile* owner = stream::FindOwningFile(plan.next, request.product_id);
  if (owner != nullptr && owner->content_id != request.content_id) {
    error.Set(ErrorKind::kUnknownProduct, "product '" + request.product_id +
                                              "' is cataloged under '" + owner->content_id +
                                              "', not '" + request.content_id + "'");
    return Abort(report, error);
  }

  auto file_it = plan.next.product_files.find(request.content_id);
  const bool new_file = file_it == plan.next.product_files.end();
  if (new_file) {
    stream::ProductFile created;
    created.content_id = request.content_id;
    created.datatype = request.datatype;
    file_it = plan.next.product_files.emplace(request.content_id, std::move(created)).first;
  }
  stream::ProductFile& product_file = file_it->second;

  auto product_it = product_file.products.find(request.product_id);
  if (product_it == product_file.products.end()) {
    if (!new_file && !product_file.products.empty()) {
      error.Set(ErrorKind::kUnknownProduct, "product '" + request.product_id +
                                                "' does not exist in '" + request.content_id +
                                                "'");
      return Abort(report, error);
    }
    stream::Product created;
    created.attributes = request.attributes;
    product_it = product_file.products.emplace(request.product_id, std::move(created)).first;
    LogInfo(logger_, "creating product", {{"product_id", request.product_id}});
  }

  stream::Version version;
  version.extra = request.version_extra;
  version.updated = core::FormatStreamTimestamp(config_.clock());
  for (const auto& [item_name, item] : request.items) {
    stream::Artifact artifact;
    if (fs::path(item.source).is_absolute()) {
      if (!stream::RelativizeSource(config_.base_dir, item.source, artifact.path, error)) {
        return Abort(report, error);
      }
    } else {
      artifact.path = item.source;
    }
    artifact.sha256 = item.sha256;
    artifact.size = item.size;
    artifact.ftype = item.ftype;
    artifact.extra = item.extra;

    stream::ResolvedArtifact resolved;
    if (!stream::ResolveArtifact(config_.base_dir, artifact, resolved, error)) {
      error.message = "item '" + item_name + "': " + error.message;
      return Abort(report, error);
    }
    version.items.emplace(item_name, std::move(resolved.artifact));
  }

  auto& versions = product_it->second.versions;
  const bool replacing = versions.find(request.version_id) != versions.end();
  versions[request.version_id] = std::move(version);
  plan.changed_ids.insert(request.content_id);
  report.decisions.push_back(Decision{
      .content_id = request.content_id,
      .product_id = request.product_id,
      .version_id = request.version_id,
      .kind = replacing ? DecisionKind::kReplaced : DecisionKind::kAdded,
  });
  report.phase = OperationPhase::kPlanned;

  if (!config_.commit) {
    return true;
  }
  if (!Apply(plan, report, error)) {
    return Abort(report, error);
  }
  return true;
}

bool VersionEngine::CopyVersion(std::string_view from_version, std::string_view to_version,
                                const std::vector<std::string>& filters, OperationReport& report,
                                Error& error) {
  BeginReport("copy-version", report);

  std::vector<stream::Filter> parsed_filters;
  if (!RequireVersionId(from_version, "source version", error) ||
      !RequireVersionId(to_version, "target version", error) ||
      !stream::ParseFilters(filters, parsed_filters, error)) {
    return Abort(report, error);
  }

  Plan plan;
  if (!Preflight(plan, error) || !stream::LoadStream(config_.base_dir, plan.next, error)) {
    return Abort(report, error);
  }

  const std::string from(from_version);
  const std::string to(to_version);
  const std::string now = core::FormatStreamTimestamp(config_.clock());
  const bool duplicate_files = config_.copy_policy == core::ArtifactCopyPolicy::kDuplicateFiles;
  ArtifactCheckCache checks(config_.base_dir);
  std::set<fs::path> duplicate_targets;

  for (auto& [content_id, product_file] : plan.next.product_files) {
    for (auto& [product_id, product] : product_file.products) {
      if (!stream::Matches(FilterView(content_id, product_id, product), parsed_filters)) {
        continue;
      }

      Decision decision{.content_id = content_id, .product_id = product_id, .version_id = to};
      auto& versions = product.versions;
      if (versions.find(to) != versions.end()) {
        decision.kind = DecisionKind::kSkippedExists;
      } else if (versions.find(from) == versions.end()) {
        decision.kind = DecisionKind::kSkippedAbsent;
      } else {
        stream::Version copy = versions.at(from);
        copy.updated = now;
        for (auto& [item_name, artifact] : copy.items) {
          if (!checks.Check(artifact, error)) {
            error.message = product_id + "/" + from + "/" + item_name + ": " + error.message;
            return Abort(report, error);
          }
          if (!duplicate_files) {
            continue;
          }

          const std::string new_path = RewriteVersionSegments(artifact.path, from, to);
          if (new_path == artifact.path) {
            continue;
          }
          stream::Artifact target = artifact;
          target.path = new_path;
          const fs::path target_abs = (config_.base_dir / new_path).lexically_normal();
          std::error_code ec;
          if (fs::exists(target_abs, ec)) {
            // An identical file already at the target is reused as is.
            if (!checks.Check(target, error)) {
              error.message = "duplicate target already exists: " + error.message;
              return Abort(report, error);
            }
          } else if (duplicate_targets.insert(target_abs).second) {
            plan.duplicates.push_back(stream::FileDuplicate{
                .source = (config_.base_dir / artifact.path).lexically_normal(),
                .target = target_abs,
            });
          }
          artifact.path = new_path;
        }
        versions.emplace(to, std::move(copy));
        plan.changed_ids.insert(content_id);
        decision.kind = DecisionKind::kAdded;
      }

      LogDebug(logger_, "copy decision",
               {{"product_id", product_id}, {"decision", ToString(decision.kind)}});
      report.decisions.push_back(std::move(decision));
    }
  }
  report.phase = OperationPhase::kPlanned;

  if (!config_.commit) {
    return true;
  }
  if (!Apply(plan, report, error)) {
    return Abort(report, error);
  }
  return true;
}

bool VersionEngine::RemoveVersion(std::string_view version,
                                  const std::vector<std::string>& filters,
                                  OperationReport& report, Error& error) {
  BeginReport("remove-version", report);

  std::vector<stream::Filter> parsed_filters;
  if (!RequireVersionId(version, "version", error) ||
      !stream::ParseFilters(filters, parsed_filters, error)) {
    return Abort(report, error);
  }

  Plan plan;
  if (!Preflight(plan, error) || !stream::LoadStream(config_.base_dir, plan.next, error)) {
    return Abort(report, error);
  }

  const std::string version_id(version);
  for (auto& [content_id, product_file] : plan.next.product_files) {
    for (auto& [product_id, product] : product_file.products) {
      if (!stream::Matches(FilterView(content_id, product_id, product), parsed_filters)) {
        continue;
      }

      Decision decision{.content_id = content_id,
                        .product_id = product_id,
                        .version_id = version_id};
      if (product.versions.erase(version_id) > 0) {
        decision.kind = DecisionKind::kRemoved;
        plan.changed_ids.insert(content_id);
      } else {
        decision.kind = DecisionKind::kSkippedAbsent;
      }

      LogDebug(logger_, "remove decision",
               {{"product_id", product_id}, {"decision", ToString(decision.kind)}});
      report.decisions.push_back(std::move(decision));
    }
  }
  report.phase = OperationPhase::kPlanned;

  if (!config_.commit) {
    return true;
  }
  if (!Apply(plan, report, error)) {
    return Abort(report, error);
  }
  return true;
}

} // namespace bootstream::ops
