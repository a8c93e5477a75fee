#pragma once

#include "core/errors/error.hpp"
#include "core/publish.hpp"
#include "stream/model.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace bootstream::stream {

// `streams/v1/<name>.json.gpg`
std::filesystem::path DetachedSignaturePath(const std::filesystem::path& json_path);
// `streams/v1/<name>.sjson`
std::filesystem::path SelfContainedPath(const std::filesystem::path& json_path);
std::filesystem::path JournalPath(const std::filesystem::path& base_dir);

// Loads index.json and every product file it references.
//
// Contract:
// - all-or-nothing: on failure `stream` is reset to an empty catalog
// - kPartialWriteDetected when a publish journal is pending
// - kCorruptIndex when the index is missing, unparsable or inconsistent
// - kMissingProductFile when a referenced product file is absent
// - kMalformedProduct when any product/version/artifact record is invalid
bool LoadStream(const std::filesystem::path& base_dir, Stream& stream,
                core::errors::Error& error);

// First-build variant: a base directory with no index and no product files
// yields an empty stream instead of kCorruptIndex.
bool LoadOrCreateStream(const std::filesystem::path& base_dir, Stream& stream,
                        core::errors::Error& error);

// Loads every `streams/v1/*.json` product file. Index entries are carried over
// from a readable existing index only for files still present; pass the result
// through SynchronizeStream to rebuild the index. Used by `sign`.
bool LoadStreamFromProductFiles(const std::filesystem::path& base_dir, Stream& stream,
                                core::errors::Error& error);

// One document to publish. Signature fields are both empty when the document
// is published unsigned; any previously published signatures are then removed
// in the same publish.
struct DocumentWrite {
  std::filesystem::path json_path;
  std::string content;
  std::string detached_signature;
  std::string self_contained;
};

struct FileDuplicate {
  std::filesystem::path source;
  std::filesystem::path target;
};

struct SaveRequest {
  std::vector<FileDuplicate> duplicates;
  // Product files first, index last.
  std::vector<DocumentWrite> documents;
};

struct SaveResult {
  std::vector<std::filesystem::path> written;
  std::vector<std::filesystem::path> removed;
};

// Publishes artifacts, documents and signatures as one staged batch.
bool SaveDocuments(const std::filesystem::path& base_dir, const SaveRequest& request,
                   const core::PublishHooks& hooks, SaveResult& result,
                   core::errors::Error& error);

// True when `content` differs from the bytes currently published at `path`
// (a missing file counts as different).
bool DiffersFromPublished(const std::filesystem::path& path, const std::string& content,
                          bool& differs, core::errors::Error& error);

// Writes the listed product files and the index, each only if its canonical
// serialization differs from disk, without signing.
bool SaveStream(const Stream& stream, const std::set<std::string>& changed_ids,
                const core::PublishHooks& hooks, SaveResult& result,
                core::errors::Error& error);

} // namespace bootstream::stream
