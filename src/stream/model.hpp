#pragma once

#include "core/errors/error.hpp"
#include "core/json_dom.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace bootstream::stream {

inline constexpr std::string_view kIndexFormat = "index:1.0";
inline constexpr std::string_view kProductsFormat = "products:1.0";
inline constexpr std::string_view kDefaultDatatype = "image-downloads";
inline constexpr std::string_view kStreamsDir = "streams/v1";
inline constexpr std::string_view kIndexFileName = "index.json";

// Open attribute bag. Keys the engine does not know pass through unmodified.
using AttributeMap = std::map<std::string, std::string>;

// One physical file referenced by a version. `path` is relative to the stream
// base directory; several versions may share the same path.
struct Artifact {
  std::string path;
  std::string sha256;
  std::uint64_t size = 0;
  std::string ftype;
  AttributeMap extra;

  bool operator==(const Artifact&) const = default;
};

struct Version {
  std::map<std::string, Artifact> items;
  // Empty when the source document carried no version-level stamp.
  std::string updated;
  AttributeMap extra;

  bool operator==(const Version&) const = default;
};

struct Product {
  AttributeMap attributes;
  std::map<std::string, Version> versions;

  bool operator==(const Product&) const = default;
};

// One `streams/v1/<content_id>.json` document.
struct ProductFile {
  std::string content_id;
  std::string datatype = std::string(kDefaultDatatype);
  std::string format = std::string(kProductsFormat);
  std::string updated;
  AttributeMap extra;
  std::map<std::string, Product> products;

  bool operator==(const ProductFile&) const = default;
};

struct IndexEntry {
  std::string datatype;
  std::string format;
  std::string path;
  // Product ids contained in the referenced file. Written sorted; compared
  // as a set.
  std::vector<std::string> products;
  std::string updated;

  bool operator==(const IndexEntry&) const = default;
};

struct Index {
  std::string format = std::string(kIndexFormat);
  std::string updated;
  std::map<std::string, IndexEntry> entries;

  bool operator==(const Index&) const = default;
};

// Whole catalog rooted at one base directory, fully validated.
struct Stream {
  std::filesystem::path base_dir;
  Index index;
  std::map<std::string, ProductFile> product_files;
};

// "streams/v1/<content_id>.json", relative to the base directory.
std::string ProductFileRelativePath(std::string_view content_id);
std::filesystem::path IndexPath(const std::filesystem::path& base_dir);
std::filesystem::path StreamsDir(const std::filesystem::path& base_dir);

// Content ids become file names; reject separators and dot-leading names.
bool IsValidContentId(std::string_view content_id);

// Index entry derived from a product file's current content. `updated` is left
// empty for the synchronizer to stamp.
IndexEntry BuildIndexEntry(const ProductFile& product_file);

// Returns the product file owning `product_id`, or nullptr.
const ProductFile* FindOwningFile(const Stream& stream, std::string_view product_id);

core::json::Value ToJsonValue(const ProductFile& product_file);
core::json::Value ToJsonValue(const Index& index);

// Canonical on-disk bytes: sorted keys, one-space indent, trailing newline.
std::string SerializeDocument(const core::json::Value& document);
std::string SerializeProductFile(const ProductFile& product_file);
std::string SerializeIndex(const Index& index);

// Structural decoders. Failures are kMalformedProduct / kCorruptIndex with a
// JSON-path style location in the message.
bool ProductFileFromJson(const core::json::Value& root, ProductFile& product_file,
                         core::errors::Error& error);
bool IndexFromJson(const core::json::Value& root, Index& index, core::errors::Error& error);

} // namespace bootstream::stream
