#include "signing/synchronizer.hpp"

#include "core/fs_utils.hpp"
#include "signing/armor.hpp"

#include <algorithm>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace bootstream::signing {

namespace {

using core::errors::Error;
using core::errors::ErrorKind;
using core::logging::LogDebug;
using core::logging::LogInfo;

// Product lists compare as sets; a reordered index entry is not a change.
bool SameProducts(std::vector<std::string> lhs, std::vector<std::string> rhs) {
  std::sort(lhs.begin(), lhs.end());
  std::sort(rhs.begin(), rhs.end());
  return lhs == rhs;
}

bool EntryNeedsRecompute(const stream::IndexEntry& existing, const stream::IndexEntry& fresh) {
  return !SameProducts(existing.products, fresh.products) ||
         existing.datatype != fresh.datatype || existing.format != fresh.format ||
         existing.path != fresh.path;
}

bool HasSignatureFiles(const fs::path& json_path) {
  std::error_code ec;
  return fs::exists(stream::DetachedSignaturePath(json_path), ec) ||
         fs::exists(stream::SelfContainedPath(json_path), ec);
}

// Signs (or strips) one document and queues it for publishing.
bool QueueDocument(const fs::path& json_path, std::string content, const SyncOptions& options,
                   SyncResult& result, Error& error) {
  stream::DocumentWrite document;
  document.json_path = json_path;
  document.content = std::move(content);

  if (options.signer != nullptr) {
    SignedForms forms;
    if (!options.signer->Sign(document.content, forms, error)) {
      return false;
    }
    document.detached_signature = std::move(forms.detached);
    document.self_contained = std::move(forms.self_contained);
    result.signed_documents.push_back(json_path);
  } else if (HasSignatureFiles(json_path)) {
    result.signatures_removed.push_back(json_path);
  }

  result.request.documents.push_back(std::move(document));
  return true;
}

bool ListDocuments(const fs::path& base_dir, std::vector<fs::path>& documents, Error& error) {
  documents.clear();
  const fs::path streams_dir = stream::StreamsDir(base_dir);
  std::error_code ec;
  if (!fs::is_directory(streams_dir, ec)) {
    return true;
  }
  for (const auto& entry : fs::directory_iterator(streams_dir, ec)) {
    if (entry.is_regular_file(ec) && entry.path().extension() == ".json") {
      documents.push_back(entry.path());
    }
  }
  if (ec) {
    return error.Set(ErrorKind::kIoFailure,
                     "failed to list '" + streams_dir.string() + "': " + ec.message());
  }
  std::sort(documents.begin(), documents.end());
  return true;
}

// Empty `problem` means the document's signatures are present and valid.
bool CheckDocument(const fs::path& json_path, ISigner& signer, bool require_signatures,
                   std::string& problem, Error& error) {
  problem.clear();

  const fs::path detached_path = stream::DetachedSignaturePath(json_path);
  const fs::path self_contained_path = stream::SelfContainedPath(json_path);
  std::error_code ec;
  const bool has_detached = fs::exists(detached_path, ec);
  const bool has_self_contained = fs::exists(self_contained_path, ec);
  if (!has_detached && !has_self_contained) {
    if (require_signatures) {
      problem = "no signatures";
    }
    return true;
  }
  if (!has_detached || !has_self_contained) {
    problem = has_detached ? "missing .sjson" : "missing .json.gpg";
    return true;
  }

  std::string content;
  std::string detached;
  std::string self_contained;
  std::string io_error;
  if (!core::ReadFileBytes(json_path, content, io_error) ||
      !core::ReadFileBytes(detached_path, detached, io_error) ||
      !core::ReadFileBytes(self_contained_path, self_contained, io_error)) {
    return error.Set(ErrorKind::kIoFailure, io_error);
  }

  bool valid = false;
  if (!signer.Verify(content, detached, valid, error)) {
    return false;
  }
  if (!valid) {
    problem = "detached signature does not verify";
    return true;
  }

  std::string embedded;
  std::string embedded_signature;
  std::string split_error;
  if (!SplitSelfContained(self_contained, embedded, embedded_signature, split_error)) {
    problem = "unreadable .sjson: " + split_error;
    return true;
  }
  if (embedded != content) {
    problem = ".sjson content differs from .json";
    return true;
  }
  if (!signer.Verify(embedded, embedded_signature, valid, error)) {
    return false;
  }
  if (!valid) {
    problem = ".sjson signature does not verify";
  }
  return true;
}

} // namespace

bool SynchronizeStream(stream::Stream& stream, const std::set<std::string>& changed_ids,
                       const SyncOptions& options, SyncResult& result, Error& error) {
  result = SyncResult{};
  const std::string now = core::FormatStreamTimestamp(options.clock());

  for (const auto& content_id : changed_ids) {
    const auto it = stream.product_files.find(content_id);
    if (it == stream.product_files.end()) {
      return error.Set(ErrorKind::kUnknownProduct,
                       "changed product file '" + content_id + "' is not part of the stream");
    }

    const fs::path json_path = stream.base_dir / stream::ProductFileRelativePath(content_id);
    bool differs = false;
    if (!stream::DiffersFromPublished(json_path, stream::SerializeProductFile(it->second),
                                      differs, error)) {
      return false;
    }
    if (!differs) {
      LogDebug(options.logger, "product file unchanged", {{"content_id", content_id}});
      continue;
    }

    it->second.updated = now;
    if (!QueueDocument(json_path, stream::SerializeProductFile(it->second), options, result,
                       error)) {
      return false;
    }
    LogDebug(options.logger, "product file regenerated", {{"content_id", content_id}});
  }

  for (const auto& [content_id, product_file] : stream.product_files) {
    stream::IndexEntry fresh = stream::BuildIndexEntry(product_file);
    auto existing = stream.index.entries.find(content_id);
    if (existing != stream.index.entries.end() && !EntryNeedsRecompute(existing->second, fresh)) {
      continue;
    }
    fresh.updated = now;
    stream.index.entries[content_id] = std::move(fresh);
    LogDebug(options.logger, "index entry recomputed", {{"content_id", content_id}});
  }

  const fs::path index_path = stream::IndexPath(stream.base_dir);
  bool index_differs = false;
  if (!stream::DiffersFromPublished(index_path, stream::SerializeIndex(stream.index),
                                    index_differs, error)) {
    return false;
  }
  if (index_differs) {
    stream.index.updated = now;
    if (!QueueDocument(index_path, stream::SerializeIndex(stream.index), options, result,
                       error)) {
      return false;
    }
  }

  LogInfo(options.logger, "synchronized stream documents",
          {{"documents", std::to_string(result.request.documents.size())},
           {"signed", std::to_string(result.signed_documents.size())},
           {"signatures_removed", std::to_string(result.signatures_removed.size())}});
  return true;
}

bool VerifyStreamSignatures(const fs::path& base_dir, ISigner& signer, bool require_signatures,
                            SignatureVerifyReport& report, Error& error) {
  report = SignatureVerifyReport{};

  std::vector<fs::path> documents;
  if (!ListDocuments(base_dir, documents, error)) {
    return false;
  }

  for (const auto& document : documents) {
    std::string problem;
    if (!CheckDocument(document, signer, require_signatures, problem, error)) {
      return false;
    }
    ++report.checked_documents;
    if (!problem.empty()) {
      report.findings.push_back(SignatureFinding{.document = document, .problem = problem});
    }
  }

  if (!report.findings.empty()) {
    const SignatureFinding& first = report.findings.front();
    return error.Set(ErrorKind::kSignatureMismatch,
                     first.document.string() + ": " + first.problem +
                         (report.findings.size() > 1
                              ? " (and " + std::to_string(report.findings.size() - 1) + " more)"
                              : std::string()));
  }
  return true;
}

bool SignStream(const fs::path& base_dir, ISigner& signer, const core::Clock& clock,
                core::logging::Logger* logger, SyncResult& result, Error& error) {
  stream::Stream stream;
  if (!stream::LoadStreamFromProductFiles(base_dir, stream, error)) {
    return false;
  }

  std::set<std::string> all_ids;
  for (const auto& [content_id, product_file] : stream.product_files) {
    all_ids.insert(content_id);
  }

  SyncOptions options;
  options.signer = &signer;
  options.clock = clock;
  options.logger = logger;
  if (!SynchronizeStream(stream, all_ids, options, result, error)) {
    return false;
  }

  std::set<fs::path> queued;
  for (const auto& document : result.request.documents) {
    queued.insert(document.json_path);
  }

  // Documents whose content is current but whose signatures are missing or
  // stale get fresh signatures over their published bytes.
  std::vector<fs::path> documents;
  if (!ListDocuments(base_dir, documents, error)) {
    return false;
  }
  std::vector<stream::DocumentWrite> resigned;
  for (const auto& document : documents) {
    if (queued.count(document) != 0) {
      continue;
    }
    std::string problem;
    if (!CheckDocument(document, signer, true, problem, error)) {
      return false;
    }
    if (problem.empty()) {
      continue;
    }

    std::string content;
    std::string io_error;
    if (!core::ReadFileBytes(document, content, io_error)) {
      return error.Set(ErrorKind::kIoFailure, io_error);
    }
    SignedForms forms;
    if (!signer.Sign(content, forms, error)) {
      return false;
    }
    LogInfo(logger, "re-signing document", {{"path", document.string()}, {"reason", problem}});
    resigned.push_back(stream::DocumentWrite{
        .json_path = document,
        .content = std::move(content),
        .detached_signature = std::move(forms.detached),
        .self_contained = std::move(forms.self_contained),
    });
    result.signed_documents.push_back(document);
  }

  // Keep the index last in the batch.
  auto& queued_documents = result.request.documents;
  const fs::path index_path = stream::IndexPath(base_dir);
  auto index_it = std::find_if(queued_documents.begin(), queued_documents.end(),
                               [&](const stream::DocumentWrite& document) {
                                 return document.json_path == index_path;
                               });
  std::optional<stream::DocumentWrite> index_document;
  if (index_it != queued_documents.end()) {
    index_document = std::move(*index_it);
    queued_documents.erase(index_it);
  }
  for (auto& document : resigned) {
    if (document.json_path == index_path) {
      index_document = std::move(document);
      continue;
    }
    queued_documents.push_back(std::move(document));
  }
  if (index_document.has_value()) {
    queued_documents.push_back(std::move(*index_document));
  }
  return true;
}

} // namespace bootstream::signing
