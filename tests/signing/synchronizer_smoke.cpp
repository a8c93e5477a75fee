#include "common/assertions.hpp"
#include "common/stream_fixtures.hpp"
#include "common/temp_dir.hpp"
#include "signing/synchronizer.hpp"
#include "stream/store.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;
namespace common = bootstream::tests::common;
namespace signing = bootstream::signing;
namespace stream = bootstream::stream;
using bootstream::core::PublishHooks;
using bootstream::core::errors::Describe;
using bootstream::core::errors::Error;
using bootstream::core::errors::ErrorKind;

namespace {

stream::Stream LoadOrFail(const fs::path& root) {
  stream::Stream loaded;
  Error error;
  if (!stream::LoadStream(root, loaded, error)) {
    common::Fail("load failed: " + Describe(error));
  }
  return loaded;
}

void SaveOrFail(const fs::path& root, const signing::SyncResult& result) {
  stream::SaveResult saved;
  Error error;
  if (!stream::SaveDocuments(root, result.request, PublishHooks{}, saved, error)) {
    common::Fail("save failed: " + Describe(error));
  }
}

} // namespace

int main() {
  const fs::path root = common::CreateUniqueTempDir("bootstream-synchronizer");
  common::BuildFixtureStream(root);
  std::unique_ptr<signing::Ed25519Signer> signer = common::CreateKeyring(root / "keyring.pem");

  const std::string primary(common::kPrimaryContentId);
  const std::string secondary(common::kSecondaryContentId);
  const fs::path primary_json = root / stream::ProductFileRelativePath(primary);
  const fs::path secondary_json = root / stream::ProductFileRelativePath(secondary);
  const fs::path index_json = stream::IndexPath(root);

  // Syncing an untouched stream queues nothing.
  {
    stream::Stream tree = LoadOrFail(root);
    signing::SyncOptions options;
    options.signer = signer.get();
    options.clock = common::PinnedClock();
    signing::SyncResult result;
    Error error;
    if (!signing::SynchronizeStream(tree, {primary, secondary}, options, result, error)) {
      common::Fail("sync failed: " + Describe(error));
    }
    common::Expect(result.request.documents.empty(), "unchanged stream must not be re-stamped");
  }

  // A new version re-stamps and signs only its product file. The index entry
  // keeps its product set, so the index bytes stay the same.
  {
    stream::Stream tree = LoadOrFail(root);
    auto& product = tree.product_files.at(primary).products.at("com.example:18.04:amd64");
    product.versions["20191022"] = product.versions.at("20191004");

    signing::SyncOptions options;
    options.signer = signer.get();
    options.clock = common::PinnedClock();
    signing::SyncResult result;
    Error error;
    if (!signing::SynchronizeStream(tree, {primary, secondary}, options, result, error)) {
      common::Fail("sync failed: " + Describe(error));
    }
    common::Expect(result.request.documents.size() == 1, "only the primary file should change");
    common::Expect(result.request.documents.front().json_path == primary_json,
                   "wrong document queued");
    common::Expect(tree.product_files.at(primary).updated == common::kPinnedStamp,
                   "changed file must carry the new stamp");
    common::Expect(tree.product_files.at(secondary).updated == common::kFixtureStamp,
                   "untouched file must keep its stamp");
    common::Expect(tree.index.entries.at(primary).updated == common::kFixtureStamp,
                   "index entry with the same product set must keep its stamp");
    SaveOrFail(root, result);
  }
  common::Expect(fs::exists(stream::DetachedSignaturePath(primary_json)), "missing .json.gpg");
  common::Expect(fs::exists(stream::SelfContainedPath(primary_json)), "missing .sjson");
  common::AssertContains(common::ReadFileToString(stream::SelfContainedPath(primary_json)),
                         "-----BEGIN BOOTSTREAM SIGNED MESSAGE-----");

  signing::SignatureVerifyReport report;
  Error error;
  if (!signing::VerifyStreamSignatures(root, *signer, false, report, error)) {
    common::Fail("partially signed stream should verify leniently: " + Describe(error));
  }
  common::Expect(report.checked_documents == 3, "expected three documents");
  common::Expect(!signing::VerifyStreamSignatures(root, *signer, true, report, error),
                 "strict verify must reject unsigned documents");
  common::Expect(error.kind == ErrorKind::kSignatureMismatch, "expected SignatureMismatch");
  common::Expect(report.findings.size() == 2, "secondary file and index are unsigned");

  // sign covers the remaining documents, index last.
  signing::SyncResult sign_result;
  if (!signing::SignStream(root, *signer, common::PinnedClock(), nullptr, sign_result, error)) {
    common::Fail("sign failed: " + Describe(error));
  }
  common::Expect(sign_result.request.documents.size() == 2, "expected two documents to sign");
  common::Expect(sign_result.request.documents.back().json_path == index_json,
                 "index must be published last");
  const std::string index_before_sign = common::ReadFileToString(index_json);
  SaveOrFail(root, sign_result);
  common::Expect(common::ReadFileToString(index_json) == index_before_sign,
                 "signing must not change document bytes");
  if (!signing::VerifyStreamSignatures(root, *signer, true, report, error)) {
    common::Fail("fully signed stream should verify: " + Describe(error));
  }

  // A second sign run has nothing to do.
  if (!signing::SignStream(root, *signer, common::PinnedClock(), nullptr, sign_result, error)) {
    common::Fail("second sign failed: " + Describe(error));
  }
  common::Expect(sign_result.request.documents.empty(), "signed stream needs no re-signing");

  // A verifier holding a different key rejects the stream.
  {
    std::unique_ptr<signing::Ed25519Signer> stranger;
    if (!signing::Ed25519Signer::Generate(stranger, error)) {
      common::Fail("keygen failed: " + Describe(error));
    }
    common::Expect(!signing::VerifyStreamSignatures(root, *stranger, true, report, error),
                   "foreign key must not verify");
    common::Expect(report.findings.size() == 3, "every document should be reported");
  }

  // Tampering is detected and verification writes nothing.
  {
    std::string secondary_bytes = common::ReadFileToString(secondary_json);
    const std::string original = secondary_bytes;
    const auto pos = secondary_bytes.find("trusty");
    common::Expect(pos != std::string::npos, "fixture should mention trusty");
    secondary_bytes.replace(pos, 6, "trustx");
    common::WriteStringToFile(secondary_json, secondary_bytes);

    const auto before = common::SnapshotTree(root);
    common::Expect(!signing::VerifyStreamSignatures(root, *signer, true, report, error),
                   "tampered document must not verify");
    common::Expect(error.kind == ErrorKind::kSignatureMismatch, "expected SignatureMismatch");
    common::Expect(report.findings.size() == 1, "only the tampered file should be reported");
    common::Expect(report.findings.front().document == secondary_json, "wrong document reported");
    common::AssertTreeUnchanged(before, root, "verify");
    common::WriteStringToFile(secondary_json, original);
  }

  // Publishing unsigned drops the stale signatures of rewritten documents.
  {
    stream::Stream tree = LoadOrFail(root);
    tree.product_files.at(primary)
        .products.at("com.example:18.04:amd64")
        .versions.erase("20191022");
    signing::SyncOptions options;
    options.clock = common::PinnedClock();
    signing::SyncResult result;
    if (!signing::SynchronizeStream(tree, {primary}, options, result, error)) {
      common::Fail("unsigned sync failed: " + Describe(error));
    }
    common::Expect(result.signatures_removed.size() == 1, "primary signatures should be dropped");
    SaveOrFail(root, result);
  }
  common::Expect(!fs::exists(stream::DetachedSignaturePath(primary_json)),
                 ".json.gpg should be removed");
  common::Expect(!fs::exists(stream::SelfContainedPath(primary_json)), ".sjson should be removed");
  common::Expect(fs::exists(stream::DetachedSignaturePath(secondary_json)),
                 "untouched document keeps its signature");
  if (!signing::VerifyStreamSignatures(root, *signer, false, report, error)) {
    common::Fail("lenient verify after unsigned publish failed: " + Describe(error));
  }

  common::RemovePathBestEffort(root);
  return 0;
}
