#include "stream/store.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace bootstream::stream {

namespace {

using core::errors::Error;
using core::errors::ErrorKind;
using JsonValue = core::json::Value;

constexpr std::string_view kJournalFileName = ".publish-journal";

bool ParseDocument(const fs::path& path, ErrorKind kind, JsonValue& root, Error& error) {
  std::string text;
  std::string io_error;
  if (!core::ReadFileBytes(path, text, io_error)) {
    return error.Set(kind, io_error);
  }
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error)) {
    return error.Set(kind, "invalid JSON in '" + path.string() + "': " + parse_error);
  }
  return true;
}

bool LoadProductFile(const fs::path& path, ProductFile& product_file, Error& error) {
  JsonValue root;
  if (!ParseDocument(path, ErrorKind::kMalformedProduct, root, error)) {
    return false;
  }
  if (!ProductFileFromJson(root, product_file, error)) {
    error.message = path.string() + ": " + error.message;
    return false;
  }
  return true;
}

bool CheckNoPendingJournal(const fs::path& base_dir, Error& error) {
  if (core::HasPendingJournal(JournalPath(base_dir))) {
    return error.Set(ErrorKind::kPartialWriteDetected,
                     "interrupted publish journal found at '" + JournalPath(base_dir).string() +
                         "'; run recover first");
  }
  return true;
}

bool LoadReferencedFiles(const fs::path& base_dir, Stream& stream, Error& error) {
  for (const auto& [content_id, entry] : stream.index.entries) {
    if (entry.format != kProductsFormat) {
      return error.Set(ErrorKind::kCorruptIndex, "index entry '" + content_id +
                                                     "' has unsupported format '" +
                                                     entry.format + "'");
    }
    if (entry.path != ProductFileRelativePath(content_id)) {
      return error.Set(ErrorKind::kCorruptIndex,
                       "index entry '" + content_id + "' path '" + entry.path +
                           "' does not match '" + ProductFileRelativePath(content_id) + "'");
    }

    const fs::path product_path = base_dir / entry.path;
    std::error_code ec;
    if (!fs::is_regular_file(product_path, ec) || ec) {
      return error.Set(ErrorKind::kMissingProductFile,
                       "product file referenced by index is missing: " + product_path.string());
    }

    ProductFile product_file;
    if (!LoadProductFile(product_path, product_file, error)) {
      return false;
    }
    if (product_file.content_id != content_id) {
      return error.Set(ErrorKind::kMalformedProduct,
                       product_path.string() + ": content_id '" + product_file.content_id +
                           "' does not match index key '" + content_id + "'");
    }
    for (const auto& product_id : entry.products) {
      if (product_file.products.find(product_id) == product_file.products.end()) {
        return error.Set(ErrorKind::kCorruptIndex, "index lists product '" + product_id +
                                                       "' which is absent from " +
                                                       product_path.string());
      }
    }

    stream.product_files.emplace(content_id, std::move(product_file));
  }
  return true;
}

bool HasProductDocuments(const fs::path& streams_dir) {
  std::error_code ec;
  if (!fs::is_directory(streams_dir, ec)) {
    return false;
  }
  for (const auto& entry : fs::directory_iterator(streams_dir, ec)) {
    if (entry.path().extension() == ".json") {
      return true;
    }
  }
  return false;
}

void StageDocument(const DocumentWrite& document, core::PublishBatch& batch) {
  batch.StageContent(document.json_path, document.content);

  const fs::path detached = DetachedSignaturePath(document.json_path);
  const fs::path self_contained = SelfContainedPath(document.json_path);
  if (!document.detached_signature.empty()) {
    batch.StageContent(detached, document.detached_signature);
    batch.StageContent(self_contained, document.self_contained);
    return;
  }

  std::error_code ec;
  if (fs::exists(detached, ec)) {
    batch.StageRemoval(detached);
  }
  if (fs::exists(self_contained, ec)) {
    batch.StageRemoval(self_contained);
  }
}

} // namespace

fs::path DetachedSignaturePath(const fs::path& json_path) {
  return fs::path(json_path.string() + ".gpg");
}

fs::path SelfContainedPath(const fs::path& json_path) {
  fs::path path = json_path;
  path.replace_extension(".sjson");
  return path;
}

fs::path JournalPath(const fs::path& base_dir) {
  return StreamsDir(base_dir) / std::string(kJournalFileName);
}

bool LoadStream(const fs::path& base_dir, Stream& stream, Error& error) {
  stream = Stream{};
  stream.base_dir = base_dir;

  if (!CheckNoPendingJournal(base_dir, error)) {
    return false;
  }

  const fs::path index_path = IndexPath(base_dir);
  std::error_code ec;
  if (!fs::is_regular_file(index_path, ec) || ec) {
    return error.Set(ErrorKind::kCorruptIndex, "index is missing: " + index_path.string());
  }

  JsonValue root;
  if (!ParseDocument(index_path, ErrorKind::kCorruptIndex, root, error) ||
      !IndexFromJson(root, stream.index, error) || !LoadReferencedFiles(base_dir, stream, error)) {
    stream = Stream{};
    stream.base_dir = base_dir;
    return false;
  }
  return true;
}

bool LoadOrCreateStream(const fs::path& base_dir, Stream& stream, Error& error) {
  std::error_code ec;
  if (!fs::exists(IndexPath(base_dir), ec) && !HasProductDocuments(StreamsDir(base_dir))) {
    if (!CheckNoPendingJournal(base_dir, error)) {
      return false;
    }
    stream = Stream{};
    stream.base_dir = base_dir;
    return true;
  }
  return LoadStream(base_dir, stream, error);
}

bool LoadStreamFromProductFiles(const fs::path& base_dir, Stream& stream, Error& error) {
  stream = Stream{};
  stream.base_dir = base_dir;

  if (!CheckNoPendingJournal(base_dir, error)) {
    return false;
  }

  // Keep the previous index entries; the synchronizer recomputes the stale
  // ones and adds the missing ones.
  Index previous;
  std::error_code ec;
  if (fs::is_regular_file(IndexPath(base_dir), ec)) {
    JsonValue root;
    Error ignored;
    if (ParseDocument(IndexPath(base_dir), ErrorKind::kCorruptIndex, root, ignored) &&
        IndexFromJson(root, previous, ignored)) {
      stream.index.updated = previous.updated;
    }
  }

  const fs::path streams_dir = StreamsDir(base_dir);
  std::vector<fs::path> documents;
  if (fs::is_directory(streams_dir, ec)) {
    for (const auto& entry : fs::directory_iterator(streams_dir, ec)) {
      if (entry.path().extension() == ".json" &&
          entry.path().filename() != std::string(kIndexFileName)) {
        documents.push_back(entry.path());
      }
    }
  }
  if (ec) {
    return error.Set(ErrorKind::kIoFailure,
                     "failed to list '" + streams_dir.string() + "': " + ec.message());
  }
  std::sort(documents.begin(), documents.end());

  for (const auto& path : documents) {
    ProductFile product_file;
    if (!LoadProductFile(path, product_file, error)) {
      stream = Stream{};
      stream.base_dir = base_dir;
      return false;
    }
    if (path.filename().string() != product_file.content_id + ".json") {
      stream = Stream{};
      stream.base_dir = base_dir;
      return error.Set(ErrorKind::kMalformedProduct,
                       path.string() + ": file name does not match content_id '" +
                           product_file.content_id + "'");
    }

    const auto previous_entry = previous.entries.find(product_file.content_id);
    if (previous_entry != previous.entries.end()) {
      stream.index.entries[product_file.content_id] = previous_entry->second;
    }
    stream.product_files.emplace(product_file.content_id, std::move(product_file));
  }
  return true;
}

bool DiffersFromPublished(const fs::path& path, const std::string& content, bool& differs,
                          Error& error) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    differs = true;
    return true;
  }
  std::string published;
  std::string io_error;
  if (!core::ReadFileBytes(path, published, io_error)) {
    return error.Set(ErrorKind::kIoFailure, io_error);
  }
  differs = published != content;
  return true;
}

bool SaveDocuments(const fs::path& base_dir, const SaveRequest& request,
                   const core::PublishHooks& hooks, SaveResult& result, Error& error) {
  result = SaveResult{};

  core::PublishBatch batch(JournalPath(base_dir));
  for (const auto& duplicate : request.duplicates) {
    batch.StageCopy(duplicate.source, duplicate.target);
  }
  for (const auto& document : request.documents) {
    StageDocument(document, batch);
  }

  core::PublishResult published;
  if (!core::Publish(batch, hooks, published, error)) {
    return false;
  }
  result.written = std::move(published.replaced);
  result.removed = std::move(published.removed);
  return true;
}

bool SaveStream(const Stream& stream, const std::set<std::string>& changed_ids,
                const core::PublishHooks& hooks, SaveResult& result, Error& error) {
  SaveRequest request;
  for (const auto& content_id : changed_ids) {
    const auto it = stream.product_files.find(content_id);
    if (it == stream.product_files.end()) {
      return error.Set(ErrorKind::kUnknownProduct,
                       "changed product file '" + content_id + "' is not part of the stream");
    }
    DocumentWrite document;
    document.json_path = stream.base_dir / ProductFileRelativePath(content_id);
    document.content = SerializeProductFile(it->second);
    bool differs = false;
    if (!DiffersFromPublished(document.json_path, document.content, differs, error)) {
      return false;
    }
    if (differs) {
      request.documents.push_back(std::move(document));
    }
  }

  DocumentWrite index_document;
  index_document.json_path = IndexPath(stream.base_dir);
  index_document.content = SerializeIndex(stream.index);
  bool index_differs = false;
  if (!DiffersFromPublished(index_document.json_path, index_document.content, index_differs,
                            error)) {
    return false;
  }
  if (index_differs) {
    request.documents.push_back(std::move(index_document));
  }

  return SaveDocuments(stream.base_dir, request, hooks, result, error);
}

} // namespace bootstream::stream
