#pragma once

#include "core/config.hpp"
#include "core/errors/error.hpp"
#include "core/logging/logger.hpp"
#include "core/publish.hpp"
#include "ops/report.hpp"
#include "signing/signer.hpp"
#include "stream/model.hpp"
#include "stream/store.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace bootstream::ops {

// One item supplied by the build pipeline. `source` is either absolute (and
// must live under the stream base directory) or already stream-relative.
struct CreateItem {
  std::string source;
  std::string sha256;
  std::uint64_t size = 0;
  std::string ftype;
  stream::AttributeMap extra;
};

struct CreateVersionRequest {
  std::string content_id;
  std::string product_id;
  std::string version_id;
  // Used when the product (or its product file) is created.
  stream::AttributeMap attributes;
  std::string datatype = std::string(stream::kDefaultDatatype);
  std::map<std::string, CreateItem> items;
  stream::AttributeMap version_extra;
};

// Parses a build-pipeline request document:
//
// {
//   "content_id": "com.example:v1:download",
//   "product_id": "com.example:24.04:amd64",
//   "version": "20240201",
//   "datatype": "image-downloads",
//   "attributes": {"release": "noble", "arch": "amd64"},
//   "version_attributes": {"label": "daily"},
//   "items": {"root-image.gz": {"path": "/srv/tree/noble/...", "sha256": "...",
//                               "size": 1234, "ftype": "root-image.gz"}}
// }
//
// Failures are kMalformedProduct.
bool LoadCreateVersionRequest(const std::filesystem::path& request_path,
                              CreateVersionRequest& request, core::errors::Error& error);

// Plans and applies version mutations over one stream.
//
// Every operation walks Validated -> Planned -> (Applied | Aborted) and
// records the phase in its report. The complete next state of every affected
// product file is computed before anything is written; a failure before the
// publish leaves the tree byte-identical.
class VersionEngine {
public:
  explicit VersionEngine(core::EngineConfig config, core::logging::Logger* logger = nullptr);

  // Overrides the keyring-backed signer. The engine does not take ownership.
  void SetSigner(signing::ISigner* signer);
  void SetPublishHooks(core::PublishHooks hooks);

  const core::EngineConfig& Config() const;

  bool CreateVersion(const CreateVersionRequest& request, OperationReport& report,
                     core::errors::Error& error);

  bool CopyVersion(std::string_view from_version, std::string_view to_version,
                   const std::vector<std::string>& filters, OperationReport& report,
                   core::errors::Error& error);

  bool RemoveVersion(std::string_view version, const std::vector<std::string>& filters,
                     OperationReport& report, core::errors::Error& error);

private:
  struct Plan {
    stream::Stream next;
    std::set<std::string> changed_ids;
    std::vector<stream::FileDuplicate> duplicates;
    signing::ISigner* signer = nullptr;
  };

  void BeginReport(std::string_view operation, OperationReport& report) const;
  bool Abort(OperationReport& report, core::errors::Error& error) const;
  bool AcquireSigner(signing::ISigner*& signer, core::errors::Error& error);
  // Commit mode only: resolves the signer and checks the published
  // signatures before the catalog is parsed.
  bool Preflight(Plan& plan, core::errors::Error& error);
  bool Apply(Plan& plan, OperationReport& report, core::errors::Error& error);

  core::EngineConfig config_;
  core::logging::Logger* logger_ = nullptr;
  signing::ISigner* injected_signer_ = nullptr;
  std::unique_ptr<signing::ISigner> keyring_signer_;
  core::PublishHooks hooks_;
};

} // namespace bootstream::ops
