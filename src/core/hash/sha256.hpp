#ifndef BOOTSTREAM_CORE_HASH_SHA256_HPP_
#define BOOTSTREAM_CORE_HASH_SHA256_HPP_

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace bootstream::core::hash {

// Lowercase hex SHA-256 of an in-memory buffer.
bool Sha256Hex(std::string_view payload, std::string& hex_digest, std::string& error);

// Streams a file through SHA-256 in fixed-size chunks and reports its size.
//
// Contract:
// - returns false and populates `error` when the file cannot be opened/read
// - `size_bytes` is the number of bytes actually hashed
bool Sha256File(const std::filesystem::path& file_path, std::string& hex_digest,
                std::uintmax_t& size_bytes, std::string& error);

// Last queued OpenSSL error as text, for composing failure messages.
std::string LastOpenSslError();

} // namespace bootstream::core::hash

#endif // BOOTSTREAM_CORE_HASH_SHA256_HPP_
