#include "common/assertions.hpp"
#include "common/stream_fixtures.hpp"
#include "common/temp_dir.hpp"
#include "ops/version_ops.hpp"
#include "stream/store.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
namespace common = bootstream::tests::common;
namespace ops = bootstream::ops;
namespace stream = bootstream::stream;
using bootstream::core::EngineConfig;
using bootstream::core::errors::Describe;
using bootstream::core::errors::Error;
using bootstream::core::errors::ErrorKind;

namespace {

constexpr const char* kBootContentId = "com.example:v1:boot";
constexpr const char* kBootProductId = "com.example:boot:24.04:amd64:ga-24.04";

EngineConfig UnsignedConfig(const fs::path& root) {
  EngineConfig config;
  config.base_dir = root;
  config.sign = false;
  config.clock = common::PinnedClock();
  return config;
}

ops::CreateItem ItemFor(const fs::path& root, const std::string& relative,
                        const std::string& content, const std::string& ftype) {
  const stream::Artifact artifact = common::WriteArtifact(root, relative, content, ftype);
  ops::CreateItem item;
  item.source = (root / relative).string();
  item.sha256 = artifact.sha256;
  item.size = artifact.size;
  item.ftype = ftype;
  return item;
}

ops::CreateVersionRequest BootRequest(const fs::path& root, const std::string& version_id) {
  const std::string dir = "noble/amd64/ga-24.04/" + version_id + "/";
  ops::CreateVersionRequest request;
  request.content_id = kBootContentId;
  request.product_id = kBootProductId;
  request.version_id = version_id;
  request.attributes = {{"release", "noble"}, {"arch", "amd64"}, {"kflavor", "generic"}};
  request.items["boot-kernel"] = ItemFor(root, dir + "boot-kernel", "kernel " + version_id,
                                         "boot-kernel");
  request.items["boot-initrd"] = ItemFor(root, dir + "boot-initrd", "initrd " + version_id,
                                         "boot-initrd");
  request.items["squashfs"] = ItemFor(root, dir + "squashfs", "squashfs " + version_id,
                                      "squashfs");
  request.items["boot-kernel"].extra["kpackage"] = "linux-generic";
  return request;
}

void ExpectCreateFailure(ops::VersionEngine& engine, const ops::CreateVersionRequest& request,
                         const fs::path& root, ErrorKind expected, const std::string& context) {
  const auto before = common::SnapshotTree(root);
  ops::OperationReport report;
  Error error;
  common::Expect(!engine.CreateVersion(request, report, error), context + ": should fail");
  common::Expect(error.kind == expected, context + ": unexpected " + Describe(error));
  common::Expect(report.phase == ops::OperationPhase::kAborted, context + ": not aborted");
  common::Expect(report.error.kind == expected, context + ": report lacks the error");
  common::AssertTreeUnchanged(before, root, context);
}

} // namespace

int main() {
  const fs::path root = common::CreateUniqueTempDir("bootstream-create-version");
  ops::VersionEngine engine(UnsignedConfig(root));

  // First build of an empty tree.
  ops::OperationReport report;
  Error error;
  if (!engine.CreateVersion(BootRequest(root, "20260217"), report, error)) {
    common::Fail("create failed: " + Describe(error));
  }
  common::Expect(report.phase == ops::OperationPhase::kApplied, "expected Applied");
  common::Expect(report.decisions.size() == 1 &&
                     report.decisions.front().kind == ops::DecisionKind::kAdded,
                 "expected one added decision");

  stream::Stream tree;
  if (!stream::LoadStream(root, tree, error)) {
    common::Fail("created tree does not load: " + Describe(error));
  }
  common::Expect(tree.index.entries.size() == 1 && tree.index.entries.count(kBootContentId) == 1,
                 "index should list the boot product file");
  common::Expect(tree.index.entries.at(kBootContentId).products ==
                     std::vector<std::string>{kBootProductId},
                 "index entry should list the product");
  common::Expect(tree.index.updated == common::kPinnedStamp, "index stamp");
  const stream::Product& product = tree.product_files.at(kBootContentId).products.at(kBootProductId);
  common::Expect(product.versions.size() == 1 && product.versions.count("20260217") == 1,
                 "expected exactly one version");
  const stream::Version& version = product.versions.at("20260217");
  common::Expect(version.items.size() == 3, "expected three items");
  common::Expect(version.items.at("squashfs").path == "noble/amd64/ga-24.04/20260217/squashfs",
                 "absolute sources must be stored relative to the base directory");
  common::Expect(version.items.at("boot-kernel").extra.at("kpackage") == "linux-generic",
                 "item extras must pass through");
  common::Expect(product.attributes.at("kflavor") == "generic", "product attributes");
  common::Expect(!fs::exists(stream::DetachedSignaturePath(stream::IndexPath(root))),
                 "unsigned run must not write signatures");

  // Rebuilding the same version replaces it.
  ops::CreateVersionRequest rebuild = BootRequest(root, "20260217");
  rebuild.version_extra["label"] = "rebuild";
  if (!engine.CreateVersion(rebuild, report, error)) {
    common::Fail("replace failed: " + Describe(error));
  }
  common::Expect(report.decisions.front().kind == ops::DecisionKind::kReplaced,
                 "expected replaced decision");

  // A content id the catalog has never seen starts a new product file, even
  // though the tree is already populated.
  ops::CreateVersionRequest daily = BootRequest(root, "20260218");
  daily.content_id = "com.example:v1:boot-daily";
  daily.product_id = "com.example:boot-daily:24.04:amd64:ga-24.04";
  if (!engine.CreateVersion(daily, report, error)) {
    common::Fail("create in a new product file failed: " + Describe(error));
  }
  common::Expect(report.decisions.front().kind == ops::DecisionKind::kAdded,
                 "expected added decision for the new product file");
  stream::Stream grown;
  if (!stream::LoadStream(root, grown, error)) {
    common::Fail("grown tree does not load: " + Describe(error));
  }
  common::Expect(grown.index.entries.size() == 2, "index should list both product files");
  common::Expect(grown.product_files.at(daily.content_id).datatype ==
                     std::string(stream::kDefaultDatatype),
                 "new product file takes the default datatype");

  // Failures leave the tree untouched.
  ops::CreateVersionRequest unknown = BootRequest(root, "20260301");
  unknown.product_id = "com.example:boot:24.04:arm64:ga-24.04";
  ExpectCreateFailure(engine, unknown, root, ErrorKind::kUnknownProduct,
                      "new product in a populated file");

  ops::CreateVersionRequest elsewhere = BootRequest(root, "20260301");
  elsewhere.content_id = "com.example:v1:other";
  ExpectCreateFailure(engine, elsewhere, root, ErrorKind::kUnknownProduct,
                      "product owned by another file");

  ops::CreateVersionRequest bad_sum = BootRequest(root, "20260301");
  bad_sum.items["squashfs"].size += 1;
  ExpectCreateFailure(engine, bad_sum, root, ErrorKind::kChecksumMismatch, "wrong size");

  ops::CreateVersionRequest missing = BootRequest(root, "20260301");
  missing.items["squashfs"].source = "noble/amd64/ga-24.04/20260301/absent";
  ExpectCreateFailure(engine, missing, root, ErrorKind::kMissingArtifactFile, "missing item");

  ops::CreateVersionRequest outside = BootRequest(root, "20260301");
  outside.items["squashfs"].source = (root.parent_path() / "squashfs").string();
  ExpectCreateFailure(engine, outside, root, ErrorKind::kMissingArtifactFile,
                      "source outside the tree");

  ops::CreateVersionRequest bad_version = BootRequest(root, "20260301");
  bad_version.version_id = "2026/03";
  ExpectCreateFailure(engine, bad_version, root, ErrorKind::kMalformedProduct, "bad version id");

  // Signing is on by default and needs a keyring.
  {
    EngineConfig signed_config = UnsignedConfig(root);
    signed_config.sign = true;
    ops::VersionEngine no_keyring(signed_config);
    ExpectCreateFailure(no_keyring, BootRequest(root, "20260301"), root,
                        ErrorKind::kKeyringUnavailable, "sign without keyring");

    const fs::path keyring = root.parent_path() / (root.filename().string() + "-key.pem");
    common::CreateKeyring(keyring);
    signed_config.keyring_path = keyring;
    ops::VersionEngine with_keyring(signed_config);
    if (!with_keyring.CreateVersion(BootRequest(root, "20260301"), report, error)) {
      common::Fail("signed create failed: " + Describe(error));
    }
    common::Expect(report.signed_documents.size() == 1,
                   "only the product file changes when a version is added");
    common::RemovePathBestEffort(keyring);
  }

  // Build-pipeline request documents.
  {
    const ops::CreateVersionRequest expected = BootRequest(root, "20260315");
    std::string items;
    for (const auto& [name, item] : expected.items) {
      if (!items.empty()) {
        items += ",";
      }
      items += "\"" + name + "\": {\"path\": \"" + item.source + "\", \"sha256\": \"" +
               item.sha256 + "\", \"size\": " + std::to_string(item.size) +
               ", \"ftype\": \"" + item.ftype + "\"}";
    }
    const fs::path request_path = root.parent_path() / (root.filename().string() + "-req.json");
    common::WriteStringToFile(
        request_path, "{\"content_id\": \"com.example:v1:boot\", \"product_id\": \"" +
                          std::string(kBootProductId) +
                          "\", \"version\": \"20260315\", \"version_attributes\": "
                          "{\"label\": \"daily\"}, \"items\": {" +
                          items + "}}");
    ops::CreateVersionRequest loaded;
    if (!ops::LoadCreateVersionRequest(request_path, loaded, error)) {
      common::Fail("request load failed: " + Describe(error));
    }
    common::Expect(loaded.version_id == "20260315" && loaded.items.size() == 3,
                   "request fields");
    common::Expect(loaded.version_extra.at("label") == "daily", "version attributes");
    common::Expect(loaded.datatype == stream::kDefaultDatatype, "default datatype");

    common::WriteStringToFile(request_path, "{\"content_id\": \"x\", \"items\": {}}");
    common::Expect(!ops::LoadCreateVersionRequest(request_path, loaded, error),
                   "incomplete request should be rejected");
    common::Expect(error.kind == ErrorKind::kMalformedProduct, "expected MalformedProduct");
    common::RemovePathBestEffort(request_path);
  }

  common::RemovePathBestEffort(root);
  return 0;
}
