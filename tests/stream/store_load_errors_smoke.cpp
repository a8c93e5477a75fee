#include "common/assertions.hpp"
#include "common/stream_fixtures.hpp"
#include "common/temp_dir.hpp"
#include "stream/store.hpp"

#include <filesystem>
#include <functional>
#include <string>

namespace fs = std::filesystem;
namespace common = bootstream::tests::common;
namespace stream = bootstream::stream;
using bootstream::core::errors::Error;
using bootstream::core::errors::ErrorKind;

namespace {

std::string Replace(std::string text, const std::string& from, const std::string& to) {
  const auto pos = text.find(from);
  if (pos == std::string::npos) {
    common::Fail("fixture text not found: " + from);
  }
  text.replace(pos, from.size(), to);
  return text;
}

// Builds a fresh fixture, applies `damage`, and expects LoadStream to fail
// with `expected` and an empty stream.
void ExpectLoadFailure(const std::string& name, ErrorKind expected,
                       const std::function<void(const fs::path&)>& damage) {
  const fs::path root = common::CreateUniqueTempDir("bootstream-store-errors-" + name);
  common::BuildFixtureStream(root);
  damage(root);

  stream::Stream loaded;
  Error error;
  if (stream::LoadStream(root, loaded, error)) {
    common::Fail(name + ": load should have failed");
  }
  if (error.kind != expected) {
    common::Fail(name + ": expected " + bootstream::core::errors::ToString(expected) + ", got " +
                 bootstream::core::errors::Describe(error));
  }
  common::Expect(loaded.product_files.empty() && loaded.index.entries.empty(),
                 name + ": failed load must not expose partial state");
  common::RemovePathBestEffort(root);
}

fs::path PrimaryPath(const fs::path& root) {
  return root / stream::ProductFileRelativePath(common::kPrimaryContentId);
}

} // namespace

int main() {
  ExpectLoadFailure("missing-index", ErrorKind::kCorruptIndex,
                    [](const fs::path& root) { fs::remove(stream::IndexPath(root)); });

  ExpectLoadFailure("unparsable-index", ErrorKind::kCorruptIndex, [](const fs::path& root) {
    common::WriteStringToFile(stream::IndexPath(root), "{\"format\": ");
  });

  ExpectLoadFailure("index-lists-absent-product", ErrorKind::kCorruptIndex,
                    [](const fs::path& root) {
                      const auto text = common::ReadFileToString(stream::IndexPath(root));
                      common::WriteStringToFile(
                          stream::IndexPath(root),
                          Replace(text, "\"com.example:18.04:amd64\"", "\"com.example:ghost\""));
                    });

  ExpectLoadFailure("missing-product-file", ErrorKind::kMissingProductFile,
                    [](const fs::path& root) { fs::remove(PrimaryPath(root)); });

  ExpectLoadFailure("malformed-product", ErrorKind::kMalformedProduct, [](const fs::path& root) {
    const auto text = common::ReadFileToString(PrimaryPath(root));
    common::WriteStringToFile(PrimaryPath(root), Replace(text, "\"ftype\"", "\"ftyp\""));
  });

  ExpectLoadFailure("content-id-mismatch", ErrorKind::kMalformedProduct,
                    [](const fs::path& root) {
                      const auto text = common::ReadFileToString(PrimaryPath(root));
                      common::WriteStringToFile(
                          PrimaryPath(root),
                          Replace(text, "\"content_id\": \"com.example:v1:download\"",
                                  "\"content_id\": \"com.example:v1:other\""));
                    });

  ExpectLoadFailure("pending-journal", ErrorKind::kPartialWriteDetected,
                    [](const fs::path& root) {
                      common::WriteStringToFile(stream::JournalPath(root),
                                                "bootstream-publish-journal 1\n");
                    });

  return 0;
}
