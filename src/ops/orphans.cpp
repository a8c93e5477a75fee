#include "ops/orphans.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_writer.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace bootstream::ops {

namespace {

using core::errors::Error;
using core::errors::ErrorKind;
using core::logging::LogDebug;
using core::logging::LogInfo;
using JsonValue = core::json::Value;

// Longest accepted age count; keeps the seconds arithmetic far from overflow.
constexpr std::size_t kMaxAgeDigits = 9;

std::set<std::string> ReferencedPaths(const stream::Stream& stream) {
  std::set<std::string> referenced;
  for (const auto& [content_id, product_file] : stream.product_files) {
    for (const auto& [product_id, product] : product_file.products) {
      for (const auto& [version_id, version] : product.versions) {
        for (const auto& [item_name, artifact] : version.items) {
          referenced.insert(fs::path(artifact.path).lexically_normal().generic_string());
        }
      }
    }
  }
  return referenced;
}

bool ScanFailed(const fs::path& base_dir, const std::error_code& ec, Error& error) {
  return error.Set(ErrorKind::kIoFailure,
                   "failed to scan '" + base_dir.string() + "': " + ec.message());
}

bool InvalidOrphanData(const fs::path& path, const std::string& detail, Error& error) {
  return error.Set(ErrorKind::kCorruptIndex,
                   "orphan data '" + path.string() + "' is invalid: " + detail);
}

// Removes `directory` and its ancestors while they are empty, stopping at
// `base_dir`.
bool PruneEmptyParents(const fs::path& base_dir, fs::path directory,
                       std::vector<std::string>& pruned, Error& error) {
  const fs::path base = base_dir.lexically_normal();
  while (core::IsWithinDirectory(base, directory) &&
         directory.lexically_normal().lexically_relative(base) != fs::path(".")) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec) || !fs::is_empty(directory, ec) || ec) {
      return true;
    }
    if (!fs::remove(directory, ec) || ec) {
      return error.Set(ErrorKind::kIoFailure, "failed to remove empty directory '" +
                                                  directory.string() + "': " + ec.message());
    }
    pruned.push_back(directory.lexically_relative(base_dir).generic_string());
    directory = directory.parent_path();
  }
  return true;
}

} // namespace

bool FindOrphans(const stream::Stream& stream, OrphanReport& report, Error& error) {
  report = OrphanReport{};

  const std::set<std::string> referenced = ReferencedPaths(stream);
  report.referenced_paths = referenced.size();

  // Stream documents and signatures, and the tooling state beside them.
  const std::set<fs::path> skipped = {stream.base_dir / "streams", stream.base_dir / ".data"};
  std::error_code ec;
  fs::recursive_directory_iterator it(stream.base_dir, ec);
  if (ec) {
    return ScanFailed(stream.base_dir, ec, error);
  }

  for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      return ScanFailed(stream.base_dir, ec, error);
    }
    if (it.depth() == 0 && skipped.count(it->path()) > 0) {
      it.disable_recursion_pending();
      continue;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) {
      continue;
    }
    ++report.scanned_files;
    const std::string relative = it->path().lexically_relative(stream.base_dir).generic_string();
    if (referenced.count(relative) == 0) {
      report.orphans.push_back(relative);
    }
  }
  if (ec) {
    return ScanFailed(stream.base_dir, ec, error);
  }

  std::sort(report.orphans.begin(), report.orphans.end());
  return true;
}

bool ReadOrphanData(const fs::path& path, OrphanLedger& ledger, Error& error) {
  ledger.clear();
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return true;
  }

  std::string text;
  std::string io_error;
  if (!core::ReadFileBytes(path, text, io_error)) {
    return error.Set(ErrorKind::kIoFailure, io_error);
  }
  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error)) {
    return InvalidOrphanData(path, parse_error, error);
  }

  const JsonValue* format = root.Find("format");
  if (format == nullptr || !format->IsString() || format->string_value != kOrphanDataFormat) {
    return InvalidOrphanData(path, "expected format '" + std::string(kOrphanDataFormat) + "'",
                             error);
  }
  const JsonValue* orphans = root.Find("orphans");
  if (orphans == nullptr || !orphans->IsObject()) {
    return InvalidOrphanData(path, "'orphans' must be an object", error);
  }

  for (const auto& [relative, seen] : orphans->object_value) {
    const fs::path relative_path(relative);
    if (relative.empty() || relative_path.is_absolute() ||
        relative_path.lexically_normal() == fs::path(".") ||
        !core::IsWithinDirectory("base", fs::path("base") / relative_path)) {
      return InvalidOrphanData(path, "entry '" + relative + "' escapes the tree", error);
    }
    std::chrono::system_clock::time_point when;
    if (!seen.IsString() || !core::ParseStreamTimestamp(seen.string_value, when)) {
      return InvalidOrphanData(path, "entry '" + relative + "' has no valid timestamp", error);
    }
    ledger.emplace(relative, seen.string_value);
  }
  return true;
}

bool WriteOrphanData(const fs::path& path, const OrphanLedger& ledger, Error& error) {
  JsonValue orphans = JsonValue::MakeObject();
  for (const auto& [relative, seen] : ledger) {
    orphans.object_value[relative] = JsonValue::String(seen);
  }
  JsonValue root = JsonValue::MakeObject();
  root.object_value["format"] = JsonValue::String(std::string(kOrphanDataFormat));
  root.object_value["orphans"] = std::move(orphans);

  std::string io_error;
  if (!core::WriteTextFileAtomic(path, core::json::Serialize(root) + "\n", io_error)) {
    return error.Set(ErrorKind::kIoFailure, io_error);
  }
  return true;
}

void RecordOrphans(const OrphanReport& report, std::string_view seen_stamp,
                   OrphanLedger& ledger) {
  OrphanLedger next;
  for (const auto& orphan : report.orphans) {
    const auto previous = ledger.find(orphan);
    next.emplace(orphan, previous != ledger.end() ? previous->second : std::string(seen_stamp));
  }
  ledger = std::move(next);
}

bool ParseOrphanAge(std::string_view text, std::chrono::seconds& age, std::string& error) {
  std::size_t digits = 0;
  while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits])) != 0) {
    ++digits;
  }
  if (digits == 0 || digits > kMaxAgeDigits || text.size() > digits + 1) {
    error = "invalid age '" + std::string(text) + "' (expected <N>[s|m|h|d])";
    return false;
  }

  const long long count = std::stoll(std::string(text.substr(0, digits)));
  const char unit = digits < text.size() ? text[digits] : 'd';
  switch (unit) {
  case 's':
    age = std::chrono::seconds(count);
    return true;
  case 'm':
    age = std::chrono::minutes(count);
    return true;
  case 'h':
    age = std::chrono::hours(count);
    return true;
  case 'd':
    age = std::chrono::hours(24 * count);
    return true;
  default:
    error = "invalid age unit '" + std::string(1, unit) + "' (expected s, m, h or d)";
    return false;
  }
}

bool ReapOrphans(const stream::Stream& stream, const ReapOptions& options,
                 std::chrono::system_clock::time_point now, core::logging::Logger* logger,
                 OrphanLedger& ledger, ReapReport& report, Error& error) {
  report = ReapReport{};
  const std::set<std::string> referenced = ReferencedPaths(stream);

  std::vector<std::string> settled;
  for (const auto& [relative, seen] : ledger) {
    if (referenced.count(fs::path(relative).lexically_normal().generic_string()) > 0) {
      report.released.push_back(relative);
      settled.push_back(relative);
      LogInfo(logger, "orphan referenced again", {{"path", relative}});
      continue;
    }

    std::chrono::system_clock::time_point orphaned_on;
    if (!core::ParseStreamTimestamp(seen, orphaned_on)) {
      return error.Set(ErrorKind::kCorruptIndex,
                       "orphan '" + relative + "' has invalid timestamp '" + seen + "'");
    }
    if (orphaned_on + options.older_than >= now) {
      report.kept.push_back(relative);
      LogDebug(logger, "orphan too recent", {{"path", relative}, {"orphaned_on", seen}});
      continue;
    }

    report.reaped.push_back(ReapedOrphan{.path = relative, .orphaned_on = seen});
    settled.push_back(relative);
    if (options.dry_run) {
      continue;
    }

    const fs::path target = stream.base_dir / relative;
    std::error_code ec;
    (void)fs::remove(target, ec);
    if (ec) {
      return error.Set(ErrorKind::kIoFailure,
                       "failed to remove orphan '" + target.string() + "': " + ec.message());
    }
    LogInfo(logger, "orphan reaped", {{"path", relative}, {"orphaned_on", seen}});
    if (!PruneEmptyParents(stream.base_dir, target.parent_path(), report.pruned_directories,
                           error)) {
      return false;
    }
  }

  if (!options.dry_run) {
    for (const auto& relative : settled) {
      ledger.erase(relative);
    }
  }
  return true;
}

} // namespace bootstream::ops
