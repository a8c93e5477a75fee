#include "core/config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

namespace fs = std::filesystem;

namespace bootstream::core {

namespace {

using JsonValue = json::Value;

bool RequireString(const std::string& key, const JsonValue& value, std::string& error) {
  if (value.type != JsonValue::Type::kString) {
    error = "config field '" + key + "' must be a string";
    return false;
  }
  return true;
}

} // namespace

const char* ToString(ArtifactCopyPolicy policy) {
  switch (policy) {
  case ArtifactCopyPolicy::kShareReference:
    return "share";
  case ArtifactCopyPolicy::kDuplicateFiles:
    return "duplicate";
  }
  return "share";
}

bool ParseArtifactCopyPolicy(std::string_view text, ArtifactCopyPolicy& policy) {
  if (text == "share") {
    policy = ArtifactCopyPolicy::kShareReference;
    return true;
  }
  if (text == "duplicate") {
    policy = ArtifactCopyPolicy::kDuplicateFiles;
    return true;
  }
  return false;
}

bool LoadConfigFile(const fs::path& config_path, ConfigFileValues& values, std::string& error) {
  values = ConfigFileValues{};

  std::string text;
  if (!ReadFileBytes(config_path, text, error)) {
    return false;
  }

  JsonValue root;
  std::string parse_error;
  if (!json::Parse(text, root, parse_error)) {
    error = "invalid config JSON '" + config_path.string() + "': " + parse_error;
    return false;
  }
  if (!root.IsObject()) {
    error = "config root must be a JSON object: " + config_path.string();
    return false;
  }

  for (const auto& [key, value] : root.object_value) {
    if (key == "keyring") {
      if (!RequireString(key, value, error)) {
        return false;
      }
      fs::path keyring(value.string_value);
      if (keyring.is_relative()) {
        keyring = config_path.parent_path() / keyring;
      }
      values.keyring_path = keyring;
      continue;
    }
    if (key == "sign") {
      if (value.type != JsonValue::Type::kBool) {
        error = "config field 'sign' must be a boolean";
        return false;
      }
      values.sign = value.bool_value;
      continue;
    }
    if (key == "log_level") {
      if (!RequireString(key, value, error)) {
        return false;
      }
      logging::LogLevel level = logging::LogLevel::kInfo;
      if (!logging::ParseLogLevel(value.string_value, level, error)) {
        return false;
      }
      values.log_level = level;
      continue;
    }
    if (key == "copy_policy") {
      if (!RequireString(key, value, error)) {
        return false;
      }
      ArtifactCopyPolicy policy = ArtifactCopyPolicy::kShareReference;
      if (!ParseArtifactCopyPolicy(value.string_value, policy)) {
        error = "config field 'copy_policy' must be 'share' or 'duplicate'";
        return false;
      }
      values.copy_policy = policy;
      continue;
    }

    error = "unknown config field '" + key + "' in " + config_path.string();
    return false;
  }

  return true;
}

} // namespace bootstream::core
