#include "bootstream/cli/router.hpp"

#include "core/config.hpp"
#include "core/errors/error.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_writer.hpp"
#include "core/logging/logger.hpp"
#include "core/publish.hpp"
#include "core/time_utils.hpp"
#include "ops/orphans.hpp"
#include "ops/report.hpp"
#include "ops/version_ops.hpp"
#include "signing/ed25519_signer.hpp"
#include "signing/synchronizer.hpp"
#include "stream/artifact_resolver.hpp"
#include "stream/model.hpp"
#include "stream/store.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace bootstream::cli {

namespace {

using core::errors::Error;
using core::errors::ErrorKind;
using core::logging::LogLevel;
using JsonValue = core::json::Value;

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

constexpr std::string_view kVersionText = "bootstream 0.1.0";

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  bootstream copy-version <tree> <from> <to> [filters...] [--dry-run] [--no-sign] "
         "[--keyring <pem>] [--duplicate-files]\n"
      << "  bootstream remove-version <tree> <version> [filters...] [--dry-run] [--no-sign] "
         "[--keyring <pem>]\n"
      << "  bootstream create-version <tree> <request.json> [--dry-run] [--no-sign] "
         "[--keyring <pem>]\n"
      << "  bootstream sign <tree> --keyring <pem>\n"
      << "  bootstream verify <tree> --keyring <pem> [--artifacts]\n"
      << "  bootstream find-orphans <tree> [<orphan-data>]\n"
      << "  bootstream reap-orphans <tree> <orphan-data> [--older <N[s|m|h|d]>] [--now] "
         "[--dry-run]\n"
      << "  bootstream recover <tree>\n"
      << "  bootstream version\n"
      << "common flags: --config <file.json> --log-level <debug|info|warn|error> --json\n"
      << "filters: field=value (exact) or field~regex (search); all must match\n";
}

// Flags a subcommand accepts on top of --config/--log-level/--json.
struct AllowedFlags {
  bool dry_run = false;
  bool no_sign = false;
  bool keyring = false;
  bool duplicate_files = false;
  bool artifacts = false;
  bool older = false;
  bool now = false;
};

struct Invocation {
  std::vector<std::string> positionals;
  std::optional<fs::path> config_path;
  std::optional<LogLevel> log_level;
  std::optional<fs::path> keyring;
  bool json_output = false;
  bool dry_run = false;
  bool no_sign = false;
  bool duplicate_files = false;
  bool check_artifacts = false;
  std::optional<std::string> older;
  bool reap_now = false;
};

// Parse subcommand args with an explicit contract: known flags anywhere,
// everything else positional. Unknown `--` flags are usage errors.
bool ParseInvocation(const std::vector<std::string_view>& args, const AllowedFlags& allowed,
                     Invocation& invocation, std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];

    auto take_value = [&](std::string_view flag, std::string& value) {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(flag);
        return false;
      }
      value = std::string(args[++i]);
      return true;
    };

    if (token == "--config") {
      std::string value;
      if (!take_value(token, value)) {
        return false;
      }
      invocation.config_path = value;
      continue;
    }
    if (token == "--log-level") {
      std::string value;
      if (!take_value(token, value)) {
        return false;
      }
      LogLevel level = LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, level, error)) {
        return false;
      }
      invocation.log_level = level;
      continue;
    }
    if (token == "--json") {
      invocation.json_output = true;
      continue;
    }
    if (token == "--keyring" && allowed.keyring) {
      std::string value;
      if (!take_value(token, value)) {
        return false;
      }
      invocation.keyring = value;
      continue;
    }
    if (token == "--dry-run" && allowed.dry_run) {
      invocation.dry_run = true;
      continue;
    }
    if (token == "--no-sign" && allowed.no_sign) {
      invocation.no_sign = true;
      continue;
    }
    if (token == "--duplicate-files" && allowed.duplicate_files) {
      invocation.duplicate_files = true;
      continue;
    }
    if (token == "--artifacts" && allowed.artifacts) {
      invocation.check_artifacts = true;
      continue;
    }
    if (token == "--older" && allowed.older) {
      std::string value;
      if (!take_value(token, value)) {
        return false;
      }
      invocation.older = value;
      continue;
    }
    if (token == "--now" && allowed.now) {
      invocation.reap_now = true;
      continue;
    }
    if (token.size() > 2 && token.substr(0, 2) == "--") {
      error = "unknown option: " + std::string(token);
      return false;
    }
    invocation.positionals.emplace_back(token);
  }
  return true;
}

// Config file first, explicit flags on top.
bool BuildEngineConfig(const Invocation& invocation, const fs::path& tree,
                       core::EngineConfig& config, LogLevel& log_level, std::string& error) {
  config = core::EngineConfig{};
  config.base_dir = tree;
  log_level = LogLevel::kInfo;

  if (invocation.config_path.has_value()) {
    core::ConfigFileValues values;
    if (!core::LoadConfigFile(*invocation.config_path, values, error)) {
      return false;
    }
    if (values.keyring_path.has_value()) {
      config.keyring_path = *values.keyring_path;
    }
    if (values.sign.has_value()) {
      config.sign = *values.sign;
    }
    if (values.log_level.has_value()) {
      log_level = *values.log_level;
    }
    if (values.copy_policy.has_value()) {
      config.copy_policy = *values.copy_policy;
    }
  }

  if (invocation.keyring.has_value()) {
    config.keyring_path = *invocation.keyring;
  }
  if (invocation.no_sign) {
    config.sign = false;
  }
  if (invocation.dry_run) {
    config.commit = false;
  }
  if (invocation.duplicate_files) {
    config.copy_policy = core::ArtifactCopyPolicy::kDuplicateFiles;
  }
  if (invocation.log_level.has_value()) {
    log_level = *invocation.log_level;
  }
  return true;
}

// Shared front half of every tree command: parse, check arity, build config.
bool PrepareTreeCommand(std::string_view command, const std::vector<std::string_view>& args,
                        const AllowedFlags& allowed, std::size_t min_positionals,
                        std::size_t max_positionals, Invocation& invocation,
                        core::EngineConfig& config, LogLevel& log_level, int& exit_code) {
  std::string error;
  if (!ParseInvocation(args, allowed, invocation, error)) {
    std::cerr << "error: " << error << '\n';
    exit_code = kExitUsage;
    return false;
  }
  const std::size_t count = invocation.positionals.size();
  if (count < min_positionals || count > max_positionals) {
    std::cerr << "error: wrong number of arguments for " << command << '\n';
    PrintUsage(std::cerr);
    exit_code = kExitUsage;
    return false;
  }
  if (!BuildEngineConfig(invocation, invocation.positionals.front(), config, log_level, error)) {
    std::cerr << "error: " << error << '\n';
    exit_code = kExitUsage;
    return false;
  }
  return true;
}

int ReportFailure(const Error& error) {
  std::cerr << "error: " << core::errors::Describe(error) << '\n';
  return core::errors::ToInt(core::errors::ToExitCode(error.kind));
}

void EmitReport(const ops::OperationReport& report, bool json_output) {
  if (json_output) {
    std::cout << ops::RenderReportJson(report);
    return;
  }
  ops::WriteReportText(report, std::cout);
}

JsonValue StringArray(const std::vector<std::string>& values) {
  JsonValue array = JsonValue::MakeArray();
  for (const auto& value : values) {
    array.array_value.push_back(JsonValue::String(value));
  }
  return array;
}

bool LoadSigner(const core::EngineConfig& config, std::unique_ptr<signing::Ed25519Signer>& signer,
                Error& error) {
  if (config.keyring_path.empty()) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "no keyring configured (pass --keyring or set \"keyring\" in --config)");
  }
  return signing::Ed25519Signer::LoadFromPemFile(config.keyring_path, signer, error);
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << kVersionText << '\n';
  return kExitSuccess;
}

int CommandCopyVersion(const std::vector<std::string_view>& args) {
  Invocation invocation;
  core::EngineConfig config;
  LogLevel log_level = LogLevel::kInfo;
  int exit_code = kExitSuccess;
  const AllowedFlags allowed{
      .dry_run = true, .no_sign = true, .keyring = true, .duplicate_files = true};
  if (!PrepareTreeCommand("copy-version", args, allowed, 3, static_cast<std::size_t>(-1),
                          invocation, config, log_level, exit_code)) {
    return exit_code;
  }

  core::logging::Logger logger(log_level);
  logger.SetOperation("copy-version", config.base_dir.string());

  const std::vector<std::string> filters(invocation.positionals.begin() + 3,
                                         invocation.positionals.end());
  ops::VersionEngine engine(config, &logger);
  ops::OperationReport report;
  Error error;
  const bool ok = engine.CopyVersion(invocation.positionals[1], invocation.positionals[2],
                                     filters, report, error);
  EmitReport(report, invocation.json_output);
  return ok ? kExitSuccess : ReportFailure(error);
}

int CommandRemoveVersion(const std::vector<std::string_view>& args) {
  Invocation invocation;
  core::EngineConfig config;
  LogLevel log_level = LogLevel::kInfo;
  int exit_code = kExitSuccess;
  const AllowedFlags allowed{.dry_run = true, .no_sign = true, .keyring = true};
  if (!PrepareTreeCommand("remove-version", args, allowed, 2, static_cast<std::size_t>(-1),
                          invocation, config, log_level, exit_code)) {
    return exit_code;
  }

  core::logging::Logger logger(log_level);
  logger.SetOperation("remove-version", config.base_dir.string());

  const std::vector<std::string> filters(invocation.positionals.begin() + 2,
                                         invocation.positionals.end());
  ops::VersionEngine engine(config, &logger);
  ops::OperationReport report;
  Error error;
  const bool ok = engine.RemoveVersion(invocation.positionals[1], filters, report, error);
  EmitReport(report, invocation.json_output);
  return ok ? kExitSuccess : ReportFailure(error);
}

int CommandCreateVersion(const std::vector<std::string_view>& args) {
  Invocation invocation;
  core::EngineConfig config;
  LogLevel log_level = LogLevel::kInfo;
  int exit_code = kExitSuccess;
  const AllowedFlags allowed{.dry_run = true, .no_sign = true, .keyring = true};
  if (!PrepareTreeCommand("create-version", args, allowed, 2, 2, invocation, config, log_level,
                          exit_code)) {
    return exit_code;
  }

  core::logging::Logger logger(log_level);
  logger.SetOperation("create-version", config.base_dir.string());

  Error error;
  ops::CreateVersionRequest request;
  if (!ops::LoadCreateVersionRequest(invocation.positionals[1], request, error)) {
    return ReportFailure(error);
  }

  ops::VersionEngine engine(config, &logger);
  ops::OperationReport report;
  const bool ok = engine.CreateVersion(request, report, error);
  EmitReport(report, invocation.json_output);
  return ok ? kExitSuccess : ReportFailure(error);
}

int CommandSign(const std::vector<std::string_view>& args) {
  Invocation invocation;
  core::EngineConfig config;
  LogLevel log_level = LogLevel::kInfo;
  int exit_code = kExitSuccess;
  const AllowedFlags allowed{.keyring = true};
  if (!PrepareTreeCommand("sign", args, allowed, 1, 1, invocation, config, log_level,
                          exit_code)) {
    return exit_code;
  }

  core::logging::Logger logger(log_level);
  logger.SetOperation("sign", config.base_dir.string());

  Error error;
  std::unique_ptr<signing::Ed25519Signer> signer;
  if (!LoadSigner(config, signer, error)) {
    return ReportFailure(error);
  }

  signing::SyncResult sync;
  if (!signing::SignStream(config.base_dir, *signer, config.clock, &logger, sync, error)) {
    return ReportFailure(error);
  }
  stream::SaveResult saved;
  if (!stream::SaveDocuments(config.base_dir, sync.request, core::PublishHooks{}, saved,
                             error)) {
    return ReportFailure(error);
  }

  if (invocation.json_output) {
    std::vector<std::string> signed_paths;
    for (const auto& path : sync.signed_documents) {
      signed_paths.push_back(path.lexically_relative(config.base_dir).generic_string());
    }
    JsonValue root = JsonValue::MakeObject();
    root.object_value["key_id"] = JsonValue::String(signer->KeyId());
    root.object_value["signed"] = StringArray(signed_paths);
    std::cout << core::json::Serialize(root) << '\n';
  } else {
    for (const auto& path : sync.signed_documents) {
      std::cout << "signed " << path.lexically_relative(config.base_dir).generic_string()
                << '\n';
    }
    std::cout << "key_id " << signer->KeyId() << " signed=" << sync.signed_documents.size()
              << '\n';
  }
  return kExitSuccess;
}

int CommandVerify(const std::vector<std::string_view>& args) {
  Invocation invocation;
  core::EngineConfig config;
  LogLevel log_level = LogLevel::kInfo;
  int exit_code = kExitSuccess;
  const AllowedFlags allowed{.keyring = true, .artifacts = true};
  if (!PrepareTreeCommand("verify", args, allowed, 1, 1, invocation, config, log_level,
                          exit_code)) {
    return exit_code;
  }

  core::logging::Logger logger(log_level);
  logger.SetOperation("verify", config.base_dir.string());

  Error error;
  const fs::path journal = stream::JournalPath(config.base_dir);
  if (core::HasPendingJournal(journal)) {
    error.Set(ErrorKind::kPartialWriteDetected,
              "interrupted publish journal found at '" + journal.string() +
                  "'; run `bootstream recover` first");
    return ReportFailure(error);
  }
  std::unique_ptr<signing::Ed25519Signer> signer;
  if (!LoadSigner(config, signer, error)) {
    return ReportFailure(error);
  }

  // Signatures cover the published bytes; nothing is parsed before they pass.
  signing::SignatureVerifyReport signatures;
  Error signature_error;
  const bool signatures_ok = signing::VerifyStreamSignatures(config.base_dir, *signer, true,
                                                             signatures, signature_error);
  if (!signatures_ok && signature_error.kind != ErrorKind::kSignatureMismatch) {
    return ReportFailure(signature_error);
  }

  // Authentic documents are then loaded, which catches a product file
  // removed together with its signatures.
  const bool check_artifacts = invocation.check_artifacts && signatures_ok;
  stream::ArtifactVerifyReport artifacts;
  if (signatures_ok) {
    stream::Stream stream;
    if (!stream::LoadStream(config.base_dir, stream, error)) {
      return ReportFailure(error);
    }
    if (check_artifacts) {
      stream::VerifyStreamArtifacts(stream, artifacts);
    }
  }

  if (invocation.json_output) {
    JsonValue root = JsonValue::MakeObject();
    root.object_value["documents_checked"] =
        JsonValue::Number(static_cast<double>(signatures.checked_documents));
    JsonValue signature_findings = JsonValue::MakeArray();
    for (const auto& finding : signatures.findings) {
      JsonValue item = JsonValue::MakeObject();
      item.object_value["document"] = JsonValue::String(
          finding.document.lexically_relative(config.base_dir).generic_string());
      item.object_value["problem"] = JsonValue::String(finding.problem);
      signature_findings.array_value.push_back(std::move(item));
    }
    root.object_value["signature_findings"] = std::move(signature_findings);
    if (check_artifacts) {
      root.object_value["artifacts_checked"] =
          JsonValue::Number(static_cast<double>(artifacts.checked_files));
      JsonValue artifact_findings = JsonValue::MakeArray();
      for (const auto& finding : artifacts.findings) {
        JsonValue item = JsonValue::MakeObject();
        item.object_value["product_id"] = JsonValue::String(finding.product_id);
        item.object_value["version"] = JsonValue::String(finding.version_id);
        item.object_value["item"] = JsonValue::String(finding.item_name);
        item.object_value["path"] = JsonValue::String(finding.path);
        item.object_value["kind"] =
            JsonValue::String(core::errors::ToString(finding.error.kind));
        item.object_value["message"] = JsonValue::String(finding.error.message);
        artifact_findings.array_value.push_back(std::move(item));
      }
      root.object_value["artifact_findings"] = std::move(artifact_findings);
    }
    std::cout << core::json::Serialize(root) << '\n';
  } else {
    for (const auto& finding : signatures.findings) {
      std::cout << "bad-signature "
                << finding.document.lexically_relative(config.base_dir).generic_string() << ": "
                << finding.problem << '\n';
    }
    for (const auto& finding : artifacts.findings) {
      std::cout << "bad-artifact " << finding.product_id << ' ' << finding.version_id << ' '
                << finding.item_name << ' ' << finding.path << ": "
                << core::errors::Describe(finding.error) << '\n';
    }
    std::cout << "documents_checked=" << signatures.checked_documents;
    if (check_artifacts) {
      std::cout << " artifacts_checked=" << artifacts.checked_files;
    }
    std::cout << '\n';
  }

  if (!signatures_ok) {
    return ReportFailure(signature_error);
  }
  if (!artifacts.findings.empty()) {
    return ReportFailure(artifacts.findings.front().error);
  }
  logger.Info("stream verified",
              {{"documents", std::to_string(signatures.checked_documents)},
               {"key_id", signer->KeyId()}});
  return kExitSuccess;
}

int CommandFindOrphans(const std::vector<std::string_view>& args) {
  Invocation invocation;
  core::EngineConfig config;
  LogLevel log_level = LogLevel::kInfo;
  int exit_code = kExitSuccess;
  if (!PrepareTreeCommand("find-orphans", args, AllowedFlags{}, 1, 2, invocation, config,
                          log_level, exit_code)) {
    return exit_code;
  }

  core::logging::Logger logger(log_level);
  logger.SetOperation("find-orphans", config.base_dir.string());

  // An existing orphan-data file is validated before the tree is scanned.
  Error error;
  std::optional<fs::path> orphan_data;
  ops::OrphanLedger ledger;
  if (invocation.positionals.size() > 1) {
    orphan_data = fs::path(invocation.positionals[1]);
    if (!ops::ReadOrphanData(*orphan_data, ledger, error)) {
      return ReportFailure(error);
    }
  }

  stream::Stream stream;
  if (!stream::LoadStream(config.base_dir, stream, error)) {
    return ReportFailure(error);
  }
  ops::OrphanReport report;
  if (!ops::FindOrphans(stream, report, error)) {
    return ReportFailure(error);
  }

  if (orphan_data.has_value()) {
    // The orphan-data file may live inside the tree; it is not an orphan.
    std::error_code data_ec;
    std::error_code base_ec;
    const fs::path absolute_data = fs::absolute(*orphan_data, data_ec).lexically_normal();
    const fs::path absolute_base = fs::absolute(config.base_dir, base_ec).lexically_normal();
    if (!data_ec && !base_ec && core::IsWithinDirectory(absolute_base, absolute_data)) {
      const std::string self = absolute_data.lexically_relative(absolute_base).generic_string();
      report.orphans.erase(std::remove(report.orphans.begin(), report.orphans.end(), self),
                           report.orphans.end());
    }
    ops::RecordOrphans(report, core::FormatStreamTimestamp(config.clock()), ledger);
    if (!ops::WriteOrphanData(*orphan_data, ledger, error)) {
      return ReportFailure(error);
    }
    logger.Info("orphan data written", {{"orphans", std::to_string(ledger.size())},
                                        {"path", orphan_data->string()}});
  }

  if (invocation.json_output) {
    JsonValue root = JsonValue::MakeObject();
    root.object_value["scanned_files"] =
        JsonValue::Number(static_cast<double>(report.scanned_files));
    root.object_value["orphans"] = StringArray(report.orphans);
    if (orphan_data.has_value()) {
      JsonValue first_seen = JsonValue::MakeObject();
      for (const auto& [relative, seen] : ledger) {
        first_seen.object_value[relative] = JsonValue::String(seen);
      }
      root.object_value["first_seen"] = std::move(first_seen);
    }
    std::cout << core::json::Serialize(root) << '\n';
    return kExitSuccess;
  }
  for (const auto& orphan : report.orphans) {
    std::cout << orphan << '\n';
  }
  return kExitSuccess;
}

int CommandReapOrphans(const std::vector<std::string_view>& args) {
  Invocation invocation;
  core::EngineConfig config;
  LogLevel log_level = LogLevel::kInfo;
  int exit_code = kExitSuccess;
  const AllowedFlags allowed{.dry_run = true, .older = true, .now = true};
  if (!PrepareTreeCommand("reap-orphans", args, allowed, 2, 2, invocation, config, log_level,
                          exit_code)) {
    return exit_code;
  }

  ops::ReapOptions options;
  options.dry_run = invocation.dry_run;
  if (invocation.older.has_value()) {
    std::string age_error;
    if (!ops::ParseOrphanAge(*invocation.older, options.older_than, age_error)) {
      std::cerr << "error: " << age_error << '\n';
      return kExitUsage;
    }
  }
  if (invocation.reap_now) {
    options.older_than = std::chrono::seconds(-1);
  }

  core::logging::Logger logger(log_level);
  logger.SetOperation("reap-orphans", config.base_dir.string());

  Error error;
  const fs::path orphan_data(invocation.positionals[1]);
  std::error_code exists_ec;
  if (!fs::exists(orphan_data, exists_ec)) {
    error.Set(ErrorKind::kIoFailure, "orphan data '" + orphan_data.string() +
                                         "' not found; run find-orphans first");
    return ReportFailure(error);
  }
  ops::OrphanLedger ledger;
  if (!ops::ReadOrphanData(orphan_data, ledger, error)) {
    return ReportFailure(error);
  }
  stream::Stream stream;
  if (!stream::LoadStream(config.base_dir, stream, error)) {
    return ReportFailure(error);
  }

  // A failure part way leaves the ledger as it was; deleting an already
  // deleted file is a no-op on the next run.
  ops::ReapReport report;
  if (!ops::ReapOrphans(stream, options, config.clock(), &logger, ledger, report, error)) {
    return ReportFailure(error);
  }
  if (!options.dry_run && !ops::WriteOrphanData(orphan_data, ledger, error)) {
    return ReportFailure(error);
  }

  if (invocation.json_output) {
    JsonValue reaped = JsonValue::MakeArray();
    for (const auto& orphan : report.reaped) {
      JsonValue item = JsonValue::MakeObject();
      item.object_value["path"] = JsonValue::String(orphan.path);
      item.object_value["orphaned_on"] = JsonValue::String(orphan.orphaned_on);
      reaped.array_value.push_back(std::move(item));
    }
    JsonValue root = JsonValue::MakeObject();
    root.object_value["dry_run"] = JsonValue::Bool(options.dry_run);
    root.object_value["reaped"] = std::move(reaped);
    root.object_value["kept"] = StringArray(report.kept);
    root.object_value["released"] = StringArray(report.released);
    root.object_value["pruned_directories"] = StringArray(report.pruned_directories);
    std::cout << core::json::Serialize(root) << '\n';
    return kExitSuccess;
  }

  const std::string_view verb = options.dry_run ? "would reap " : "reaped ";
  for (const auto& orphan : report.reaped) {
    std::cout << verb << orphan.path << " orphaned on " << orphan.orphaned_on << '\n';
  }
  for (const auto& relative : report.released) {
    std::cout << "released " << relative << '\n';
  }
  for (const auto& directory : report.pruned_directories) {
    std::cout << "pruned " << directory << '\n';
  }
  std::cout << "summary reaped=" << report.reaped.size() << " kept=" << report.kept.size()
            << " released=" << report.released.size() << '\n';
  return kExitSuccess;
}

int CommandRecover(const std::vector<std::string_view>& args) {
  Invocation invocation;
  core::EngineConfig config;
  LogLevel log_level = LogLevel::kInfo;
  int exit_code = kExitSuccess;
  if (!PrepareTreeCommand("recover", args, AllowedFlags{}, 1, 1, invocation, config, log_level,
                          exit_code)) {
    return exit_code;
  }

  core::logging::Logger logger(log_level);
  logger.SetOperation("recover", config.base_dir.string());

  const fs::path journal = stream::JournalPath(config.base_dir);
  if (!core::HasPendingJournal(journal)) {
    std::cout << "nothing to recover\n";
    return kExitSuccess;
  }

  Error error;
  core::PublishResult result;
  if (!core::RecoverPublish(journal, result, error)) {
    return ReportFailure(error);
  }
  logger.Info("interrupted publish rolled forward",
              {{"replaced", std::to_string(result.replaced.size())},
               {"removed", std::to_string(result.removed.size())}});
  std::cout << "recovered replaced=" << result.replaced.size()
            << " removed=" << result.removed.size() << '\n';
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "copy-version") {
    return CommandCopyVersion(args);
  }
  if (command == "remove-version") {
    return CommandRemoveVersion(args);
  }
  if (command == "create-version") {
    return CommandCreateVersion(args);
  }
  if (command == "sign") {
    return CommandSign(args);
  }
  if (command == "verify") {
    return CommandVerify(args);
  }
  if (command == "find-orphans") {
    return CommandFindOrphans(args);
  }
  if (command == "reap-orphans") {
    return CommandReapOrphans(args);
  }
  if (command == "recover") {
    return CommandRecover(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace bootstream::cli
