#pragma once

#include "core/errors/error.hpp"
#include "core/logging/logger.hpp"
#include "stream/model.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace bootstream::ops {

struct OrphanReport {
  std::size_t scanned_files = 0;
  std::size_t referenced_paths = 0;
  // Stream-relative paths, sorted.
  std::vector<std::string> orphans;
};

// Lists regular files under the stream base directory that no artifact of any
// version references. The top-level `streams/` and `.data/` directories are
// never scanned. Read-only.
bool FindOrphans(const stream::Stream& stream, OrphanReport& report, core::errors::Error& error);

// Orphan-data file contents: stream-relative path -> stream timestamp of the
// scan that first saw the file orphaned.
//
// On disk:
//   {"format": "orphans:1.0", "orphans": {"<path>": "<first-seen stamp>", ...}}
using OrphanLedger = std::map<std::string, std::string>;

inline constexpr std::string_view kOrphanDataFormat = "orphans:1.0";

// A missing file reads as an empty ledger. Anything else that is not a valid
// orphan-data document fails with kCorruptIndex.
bool ReadOrphanData(const std::filesystem::path& path, OrphanLedger& ledger,
                    core::errors::Error& error);
bool WriteOrphanData(const std::filesystem::path& path, const OrphanLedger& ledger,
                     core::errors::Error& error);

// Replaces the ledger with the orphans of `report`. Files already in the
// ledger keep their first-seen stamp, new ones get `seen_stamp` and files that
// are no longer orphaned drop out.
void RecordOrphans(const OrphanReport& report, std::string_view seen_stamp,
                   OrphanLedger& ledger);

// "<N>[s|m|h|d]"; a bare number counts days.
bool ParseOrphanAge(std::string_view text, std::chrono::seconds& age, std::string& error);

struct ReapOptions {
  std::chrono::seconds older_than = std::chrono::hours(72);
  bool dry_run = false;
};

struct ReapedOrphan {
  std::string path;
  std::string orphaned_on;
};

struct ReapReport {
  // Deleted files, or the files a dry run would delete.
  std::vector<ReapedOrphan> reaped;
  // Orphans not yet old enough.
  std::vector<std::string> kept;
  // Ledger entries an artifact references again; dropped without deleting.
  std::vector<std::string> released;
  // Directories left empty by a deletion and removed with it.
  std::vector<std::string> pruned_directories;
};

// Deletes every ledger entry orphaned for longer than `options.older_than`
// as of `now`, then removes the parent directories the deletion left empty
// (never the base directory itself). Reaped and released entries are erased
// from `ledger`; a dry run leaves both the tree and the ledger untouched.
bool ReapOrphans(const stream::Stream& stream, const ReapOptions& options,
                 std::chrono::system_clock::time_point now, core::logging::Logger* logger,
                 OrphanLedger& ledger, ReapReport& report, core::errors::Error& error);

} // namespace bootstream::ops
