#ifndef BOOTSTREAM_CORE_CONFIG_HPP_
#define BOOTSTREAM_CORE_CONFIG_HPP_

#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace bootstream::core {

// What copy-version does with the bytes behind a copied version.
enum class ArtifactCopyPolicy {
  // New version references the same physical files (default).
  kShareReference,
  // Path segments equal to the source version id are rewritten to the target
  // id and the bytes are duplicated at the new paths.
  kDuplicateFiles,
};

const char* ToString(ArtifactCopyPolicy policy);
bool ParseArtifactCopyPolicy(std::string_view text, ArtifactCopyPolicy& policy);

// The one configuration value threaded through every engine call. Nothing in
// the engine consults the environment or the working directory.
struct EngineConfig {
  std::filesystem::path base_dir;
  // PEM file holding the Ed25519 key. Empty means "no keyring configured".
  std::filesystem::path keyring_path;
  bool sign = true;
  bool commit = true;
  ArtifactCopyPolicy copy_policy = ArtifactCopyPolicy::kShareReference;
  Clock clock = SystemClock();
};

// Values an operator may pin in a JSON config file. Unset fields leave the
// CLI defaults alone; explicit flags override any of them.
//
// {
//   "keyring": "/etc/bootstream/signing-key.pem",
//   "sign": true,
//   "log_level": "info",
//   "copy_policy": "share"
// }
struct ConfigFileValues {
  std::optional<std::filesystem::path> keyring_path;
  std::optional<bool> sign;
  std::optional<logging::LogLevel> log_level;
  std::optional<ArtifactCopyPolicy> copy_policy;
};

// Contract:
// - unknown keys are rejected so typos do not silently fall back to defaults
// - relative keyring paths are resolved against the config file's directory
bool LoadConfigFile(const std::filesystem::path& config_path, ConfigFileValues& values,
                    std::string& error);

} // namespace bootstream::core

#endif // BOOTSTREAM_CORE_CONFIG_HPP_
