#include "core/hash/sha256.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace bootstream::core::hash {

namespace {

constexpr std::size_t kReadChunkBytes = 1U << 20U;

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string ToHex(const unsigned char* bytes, unsigned int length) {
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < length; ++i) {
    out << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return out.str();
}

bool BeginDigest(MdCtxPtr& ctx, std::string& error) {
  ctx.reset(EVP_MD_CTX_new());
  if (!ctx) {
    error = "EVP_MD_CTX_new failed: " + LastOpenSslError();
    return false;
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    error = "EVP_DigestInit_ex(sha256) failed: " + LastOpenSslError();
    return false;
  }
  return true;
}

bool FinishDigest(MdCtxPtr& ctx, std::string& hex_digest, std::string& error) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_length) != 1) {
    error = "EVP_DigestFinal_ex failed: " + LastOpenSslError();
    return false;
  }
  hex_digest = ToHex(digest.data(), digest_length);
  return true;
}

} // namespace

std::string LastOpenSslError() {
  const unsigned long code = ERR_get_error();
  if (code == 0) {
    return "no OpenSSL error queued";
  }
  std::array<char, 256> buffer{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  return std::string(buffer.data());
}

bool Sha256Hex(std::string_view payload, std::string& hex_digest, std::string& error) {
  MdCtxPtr ctx;
  if (!BeginDigest(ctx, error)) {
    return false;
  }
  if (EVP_DigestUpdate(ctx.get(), payload.data(), payload.size()) != 1) {
    error = "EVP_DigestUpdate failed: " + LastOpenSslError();
    return false;
  }
  return FinishDigest(ctx, hex_digest, error);
}

bool Sha256File(const std::filesystem::path& file_path, std::string& hex_digest,
                std::uintmax_t& size_bytes, std::string& error) {
  std::ifstream in_file(file_path, std::ios::binary);
  if (!in_file) {
    error = "failed to open file for hashing: " + file_path.string();
    return false;
  }

  MdCtxPtr ctx;
  if (!BeginDigest(ctx, error)) {
    return false;
  }

  size_bytes = 0;
  std::string buffer(kReadChunkBytes, '\0');
  while (in_file.good()) {
    in_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize read_count = in_file.gcount();
    if (read_count <= 0) {
      continue;
    }
    if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(read_count)) != 1) {
      error = "EVP_DigestUpdate failed: " + LastOpenSslError();
      return false;
    }
    size_bytes += static_cast<std::uintmax_t>(read_count);
  }

  if (!in_file.eof()) {
    error = "failed while reading file for hashing: " + file_path.string();
    return false;
  }

  return FinishDigest(ctx, hex_digest, error);
}

} // namespace bootstream::core::hash
