#include "stream/model.hpp"

#include "core/json_writer.hpp"

#include <cctype>
#include <cmath>
#include <initializer_list>
#include <limits>

namespace fs = std::filesystem;

namespace bootstream::stream {

namespace {

using core::errors::Error;
using core::errors::ErrorKind;
using JsonValue = core::json::Value;

constexpr std::string_view kVersionsKey = "versions";
constexpr std::string_view kItemsKey = "items";
constexpr std::string_view kUpdatedKey = "updated";

bool TryGetNonNegativeInteger(const JsonValue& value, std::uint64_t& out) {
  if (value.type != JsonValue::Type::kNumber) {
    return false;
  }
  if (!std::isfinite(value.number_value) || value.number_value < 0.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value) {
    return false;
  }
  if (floored > static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
    return false;
  }
  out = static_cast<std::uint64_t>(floored);
  return true;
}

bool IsHexDigest(std::string_view text) {
  if (text.size() != 64U) {
    return false;
  }
  for (const char c : text) {
    if (std::isxdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return true;
}

bool RequireString(const JsonValue& object, std::string_view key, const std::string& where,
                   ErrorKind kind, std::string& out, Error& error) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    return error.Set(kind, where + "." + std::string(key) + " is required");
  }
  if (!field->IsString()) {
    return error.Set(kind, where + "." + std::string(key) + " must be a string");
  }
  out = field->string_value;
  return true;
}

// Copies every string field not in `skip` into `extra`; any other scalar or
// container type is rejected.
bool CollectExtraStrings(const JsonValue& object, std::initializer_list<std::string_view> skip,
                         const std::string& where, AttributeMap& extra, Error& error) {
  for (const auto& [key, value] : object.object_value) {
    bool skipped = false;
    for (const auto& name : skip) {
      if (key == name) {
        skipped = true;
        break;
      }
    }
    if (skipped) {
      continue;
    }
    if (!value.IsString()) {
      return error.Set(ErrorKind::kMalformedProduct,
                       where + "." + key + " must be a string attribute");
    }
    extra[key] = value.string_value;
  }
  return true;
}

bool ArtifactFromJson(const JsonValue& value, const std::string& where, Artifact& artifact,
                      Error& error) {
  if (!value.IsObject()) {
    return error.Set(ErrorKind::kMalformedProduct, where + " must be an object");
  }
  if (!RequireString(value, "path", where, ErrorKind::kMalformedProduct, artifact.path, error) ||
      !RequireString(value, "sha256", where, ErrorKind::kMalformedProduct, artifact.sha256,
                     error) ||
      !RequireString(value, "ftype", where, ErrorKind::kMalformedProduct, artifact.ftype,
                     error)) {
    return false;
  }
  if (artifact.path.empty()) {
    return error.Set(ErrorKind::kMalformedProduct, where + ".path must not be empty");
  }
  if (!IsHexDigest(artifact.sha256)) {
    return error.Set(ErrorKind::kMalformedProduct,
                     where + ".sha256 must be a 64 character hex digest");
  }

  const JsonValue* size = value.Find("size");
  if (size == nullptr) {
    return error.Set(ErrorKind::kMalformedProduct, where + ".size is required");
  }
  if (!TryGetNonNegativeInteger(*size, artifact.size)) {
    return error.Set(ErrorKind::kMalformedProduct, where + ".size must be a non-negative integer");
  }

  return CollectExtraStrings(value, {"path", "sha256", "size", "ftype"}, where, artifact.extra,
                             error);
}

bool VersionFromJson(const JsonValue& value, const std::string& where, Version& version,
                     Error& error) {
  if (!value.IsObject()) {
    return error.Set(ErrorKind::kMalformedProduct, where + " must be an object");
  }
  const JsonValue* items = value.Find(kItemsKey);
  if (items == nullptr || !items->IsObject()) {
    return error.Set(ErrorKind::kMalformedProduct, where + ".items must be an object");
  }
  for (const auto& [item_name, item_value] : items->object_value) {
    Artifact artifact;
    if (!ArtifactFromJson(item_value, where + ".items." + item_name, artifact, error)) {
      return false;
    }
    version.items.emplace(item_name, std::move(artifact));
  }

  if (const JsonValue* updated = value.Find(kUpdatedKey); updated != nullptr) {
    if (!updated->IsString()) {
      return error.Set(ErrorKind::kMalformedProduct, where + ".updated must be a string");
    }
    version.updated = updated->string_value;
  }

  return CollectExtraStrings(value, {kItemsKey, kUpdatedKey}, where, version.extra, error);
}

bool ProductFromJson(const JsonValue& value, const std::string& where, Product& product,
                     Error& error) {
  if (!value.IsObject()) {
    return error.Set(ErrorKind::kMalformedProduct, where + " must be an object");
  }
  const JsonValue* versions = value.Find(kVersionsKey);
  if (versions == nullptr || !versions->IsObject()) {
    return error.Set(ErrorKind::kMalformedProduct, where + ".versions must be an object");
  }
  for (const auto& [version_id, version_value] : versions->object_value) {
    Version version;
    if (!VersionFromJson(version_value, where + ".versions." + version_id, version, error)) {
      return false;
    }
    product.versions.emplace(version_id, std::move(version));
  }
  return CollectExtraStrings(value, {kVersionsKey}, where, product.attributes, error);
}

JsonValue ToJsonValue(const AttributeMap& attributes) {
  JsonValue object = JsonValue::MakeObject();
  for (const auto& [key, value] : attributes) {
    object.object_value[key] = JsonValue::String(value);
  }
  return object;
}

JsonValue ToJsonValue(const Artifact& artifact) {
  JsonValue object = ToJsonValue(artifact.extra);
  object.object_value["path"] = JsonValue::String(artifact.path);
  object.object_value["sha256"] = JsonValue::String(artifact.sha256);
  object.object_value["size"] = JsonValue::Number(static_cast<double>(artifact.size));
  object.object_value["ftype"] = JsonValue::String(artifact.ftype);
  return object;
}

JsonValue ToJsonValue(const Version& version) {
  JsonValue object = ToJsonValue(version.extra);
  JsonValue items = JsonValue::MakeObject();
  for (const auto& [item_name, artifact] : version.items) {
    items.object_value[item_name] = ToJsonValue(artifact);
  }
  object.object_value[std::string(kItemsKey)] = std::move(items);
  if (!version.updated.empty()) {
    object.object_value[std::string(kUpdatedKey)] = JsonValue::String(version.updated);
  }
  return object;
}

JsonValue ToJsonValue(const Product& product) {
  JsonValue object = ToJsonValue(product.attributes);
  JsonValue versions = JsonValue::MakeObject();
  for (const auto& [version_id, version] : product.versions) {
    versions.object_value[version_id] = ToJsonValue(version);
  }
  object.object_value[std::string(kVersionsKey)] = std::move(versions);
  return object;
}

} // namespace

std::string ProductFileRelativePath(std::string_view content_id) {
  return std::string(kStreamsDir) + "/" + std::string(content_id) + ".json";
}

fs::path StreamsDir(const fs::path& base_dir) {
  return base_dir / std::string(kStreamsDir);
}

fs::path IndexPath(const fs::path& base_dir) {
  return StreamsDir(base_dir) / std::string(kIndexFileName);
}

bool IsValidContentId(std::string_view content_id) {
  if (content_id.empty() || content_id.front() == '.') {
    return false;
  }
  for (const char c : content_id) {
    if (c == '/' || c == '\\' || static_cast<unsigned char>(c) < 0x20U) {
      return false;
    }
  }
  return content_id != "index";
}

IndexEntry BuildIndexEntry(const ProductFile& product_file) {
  IndexEntry entry;
  entry.datatype = product_file.datatype;
  entry.format = product_file.format;
  entry.path = ProductFileRelativePath(product_file.content_id);
  entry.products.reserve(product_file.products.size());
  for (const auto& [product_id, product] : product_file.products) {
    entry.products.push_back(product_id);
  }
  return entry;
}

const ProductFile* FindOwningFile(const Stream& stream, std::string_view product_id) {
  for (const auto& [content_id, product_file] : stream.product_files) {
    if (product_file.products.find(std::string(product_id)) != product_file.products.end()) {
      return &product_file;
    }
  }
  return nullptr;
}

JsonValue ToJsonValue(const ProductFile& product_file) {
  JsonValue root = ToJsonValue(product_file.extra);
  root.object_value["format"] = JsonValue::String(product_file.format);
  root.object_value["datatype"] = JsonValue::String(product_file.datatype);
  root.object_value["content_id"] = JsonValue::String(product_file.content_id);
  if (!product_file.updated.empty()) {
    root.object_value["updated"] = JsonValue::String(product_file.updated);
  }
  JsonValue products = JsonValue::MakeObject();
  for (const auto& [product_id, product] : product_file.products) {
    products.object_value[product_id] = ToJsonValue(product);
  }
  root.object_value["products"] = std::move(products);
  return root;
}

JsonValue ToJsonValue(const Index& index) {
  JsonValue root = JsonValue::MakeObject();
  root.object_value["format"] = JsonValue::String(index.format);
  if (!index.updated.empty()) {
    root.object_value["updated"] = JsonValue::String(index.updated);
  }
  JsonValue entries = JsonValue::MakeObject();
  for (const auto& [content_id, entry] : index.entries) {
    JsonValue object = JsonValue::MakeObject();
    object.object_value["datatype"] = JsonValue::String(entry.datatype);
    object.object_value["format"] = JsonValue::String(entry.format);
    object.object_value["path"] = JsonValue::String(entry.path);
    JsonValue products = JsonValue::MakeArray();
    for (const auto& product_id : entry.products) {
      products.array_value.push_back(JsonValue::String(product_id));
    }
    object.object_value["products"] = std::move(products);
    if (!entry.updated.empty()) {
      object.object_value["updated"] = JsonValue::String(entry.updated);
    }
    entries.object_value[content_id] = std::move(object);
  }
  root.object_value["index"] = std::move(entries);
  return root;
}

std::string SerializeDocument(const JsonValue& document) {
  return core::json::Serialize(document, 1) + "\n";
}

std::string SerializeProductFile(const ProductFile& product_file) {
  return SerializeDocument(ToJsonValue(product_file));
}

std::string SerializeIndex(const Index& index) {
  return SerializeDocument(ToJsonValue(index));
}

bool ProductFileFromJson(const JsonValue& root, ProductFile& product_file, Error& error) {
  product_file = ProductFile{};
  if (!root.IsObject()) {
    return error.Set(ErrorKind::kMalformedProduct, "product document root must be an object");
  }

  const std::string where = "$";
  if (!RequireString(root, "format", where, ErrorKind::kMalformedProduct, product_file.format,
                     error) ||
      !RequireString(root, "content_id", where, ErrorKind::kMalformedProduct,
                     product_file.content_id, error) ||
      !RequireString(root, "datatype", where, ErrorKind::kMalformedProduct,
                     product_file.datatype, error)) {
    return false;
  }
  if (product_file.format != kProductsFormat) {
    return error.Set(ErrorKind::kMalformedProduct,
                     "$.format must be '" + std::string(kProductsFormat) + "', found '" +
                         product_file.format + "'");
  }
  if (const JsonValue* updated = root.Find("updated"); updated != nullptr) {
    if (!updated->IsString()) {
      return error.Set(ErrorKind::kMalformedProduct, "$.updated must be a string");
    }
    product_file.updated = updated->string_value;
  }

  const JsonValue* products = root.Find("products");
  if (products == nullptr || !products->IsObject()) {
    return error.Set(ErrorKind::kMalformedProduct, "$.products must be an object");
  }
  for (const auto& [product_id, product_value] : products->object_value) {
    Product product;
    if (!ProductFromJson(product_value, "$.products." + product_id, product, error)) {
      return false;
    }
    product_file.products.emplace(product_id, std::move(product));
  }

  return CollectExtraStrings(root, {"format", "content_id", "datatype", "updated", "products"},
                             where, product_file.extra, error);
}

bool IndexFromJson(const JsonValue& root, Index& index, Error& error) {
  index = Index{};
  if (!root.IsObject()) {
    return error.Set(ErrorKind::kCorruptIndex, "index root must be an object");
  }
  if (!RequireString(root, "format", "$", ErrorKind::kCorruptIndex, index.format, error)) {
    return false;
  }
  if (index.format != kIndexFormat) {
    return error.Set(ErrorKind::kCorruptIndex, "$.format must be '" + std::string(kIndexFormat) +
                                                   "', found '" + index.format + "'");
  }
  if (const JsonValue* updated = root.Find("updated"); updated != nullptr) {
    if (!updated->IsString()) {
      return error.Set(ErrorKind::kCorruptIndex, "$.updated must be a string");
    }
    index.updated = updated->string_value;
  }

  const JsonValue* entries = root.Find("index");
  if (entries == nullptr || !entries->IsObject()) {
    return error.Set(ErrorKind::kCorruptIndex, "$.index must be an object");
  }

  for (const auto& [content_id, value] : entries->object_value) {
    const std::string where = "$.index." + content_id;
    if (!IsValidContentId(content_id)) {
      return error.Set(ErrorKind::kCorruptIndex, where + " is not a valid content id");
    }
    if (!value.IsObject()) {
      return error.Set(ErrorKind::kCorruptIndex, where + " must be an object");
    }

    IndexEntry entry;
    if (!RequireString(value, "datatype", where, ErrorKind::kCorruptIndex, entry.datatype,
                       error) ||
        !RequireString(value, "format", where, ErrorKind::kCorruptIndex, entry.format, error) ||
        !RequireString(value, "path", where, ErrorKind::kCorruptIndex, entry.path, error)) {
      return false;
    }
    if (const JsonValue* updated = value.Find("updated"); updated != nullptr) {
      if (!updated->IsString()) {
        return error.Set(ErrorKind::kCorruptIndex, where + ".updated must be a string");
      }
      entry.updated = updated->string_value;
    }

    const JsonValue* products = value.Find("products");
    if (products == nullptr || products->type != JsonValue::Type::kArray) {
      return error.Set(ErrorKind::kCorruptIndex, where + ".products must be an array");
    }
    for (const auto& product_id : products->array_value) {
      if (!product_id.IsString()) {
        return error.Set(ErrorKind::kCorruptIndex, where + ".products must list strings");
      }
      entry.products.push_back(product_id.string_value);
    }

    index.entries.emplace(content_id, std::move(entry));
  }

  return true;
}

} // namespace bootstream::stream
