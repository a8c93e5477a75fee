#pragma once

#include "core/errors/error.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "signing/signer.hpp"
#include "stream/model.hpp"
#include "stream/store.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace bootstream::signing {

struct SyncOptions {
  // Null means publish unsigned and drop stale signatures.
  ISigner* signer = nullptr;
  core::Clock clock = core::SystemClock();
  core::logging::Logger* logger = nullptr;
};

struct SyncResult {
  stream::SaveRequest request;
  std::vector<std::filesystem::path> signed_documents;
  std::vector<std::filesystem::path> signatures_removed;
};

// Brings the index and every touched document up to date with `stream`.
//
// Contract:
// - a product file listed in `changed_ids` is re-stamped only when its
//   serialization with the old stamp differs from the published bytes
// - an index entry is recomputed only when its product set, datatype, format
//   or path changed, or the entry is new
// - the index is re-stamped only when its serialization differs from disk
// - every re-stamped document is signed (or has its signatures dropped when
//   no signer is given); untouched documents keep their signatures
// - nothing is written; `result.request` is handed to SaveDocuments
bool SynchronizeStream(stream::Stream& stream, const std::set<std::string>& changed_ids,
                       const SyncOptions& options, SyncResult& result,
                       core::errors::Error& error);

struct SignatureFinding {
  std::filesystem::path document;
  std::string problem;
};

struct SignatureVerifyReport {
  std::size_t checked_documents = 0;
  std::vector<SignatureFinding> findings;
};

// Checks every `streams/v1/*.json` document against its `.json.gpg` and
// `.sjson`. Read-only. With `require_signatures` false a document with no
// signature files at all is accepted; mismatching or half-present signatures
// always count. Any finding fails with kSignatureMismatch.
bool VerifyStreamSignatures(const std::filesystem::path& base_dir, ISigner& signer,
                            bool require_signatures, SignatureVerifyReport& report,
                            core::errors::Error& error);

// Rebuilds the index from the product files on disk and signs every document
// whose signatures are missing or do not verify.
bool SignStream(const std::filesystem::path& base_dir, ISigner& signer, const core::Clock& clock,
                core::logging::Logger* logger, SyncResult& result, core::errors::Error& error);

} // namespace bootstream::signing
