#include "signing/ed25519_signer.hpp"

#include "core/fs_utils.hpp"
#include "core/hash/sha256.hpp"
#include "signing/armor.hpp"

#include <openssl/bio.h>
#include <openssl/pem.h>

#include <array>

namespace fs = std::filesystem;

namespace bootstream::signing {

namespace {

using core::errors::Error;
using core::errors::ErrorKind;

constexpr std::size_t kEd25519SignatureBytes = 64;
constexpr std::size_t kKeyIdHexChars = 16;

struct BioDeleter {
  void operator()(BIO* bio) const {
    BIO_free_all(bio);
  }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const {
    EVP_PKEY_CTX_free(ctx);
  }
};
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

BioPtr MemoryBio(const std::string& bytes) {
  return BioPtr(BIO_new_mem_buf(bytes.data(), static_cast<int>(bytes.size())));
}

bool ReadBio(BIO* bio, std::string& text) {
  char* data = nullptr;
  const long length = BIO_get_mem_data(bio, &data);
  if (length < 0 || data == nullptr) {
    return false;
  }
  text.assign(data, static_cast<std::size_t>(length));
  return true;
}

} // namespace

Ed25519Signer::Ed25519Signer(ConstructionTag, PkeyPtr key, bool has_private, std::string key_id)
    : key_(std::move(key)), has_private_(has_private), key_id_(std::move(key_id)) {}

bool Ed25519Signer::ComputeKeyId(EVP_PKEY* key, std::string& key_id, Error& error) {
  std::array<unsigned char, 32> raw_public{};
  std::size_t raw_length = raw_public.size();
  if (EVP_PKEY_get_raw_public_key(key, raw_public.data(), &raw_length) != 1) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "unable to read raw public key: " + core::hash::LastOpenSslError());
  }

  std::string digest;
  std::string hash_error;
  if (!core::hash::Sha256Hex(
          std::string_view(reinterpret_cast<const char*>(raw_public.data()), raw_length), digest,
          hash_error)) {
    return error.Set(ErrorKind::kKeyringUnavailable, hash_error);
  }
  key_id = digest.substr(0, kKeyIdHexChars);
  return true;
}

bool Ed25519Signer::LoadFromPemFile(const fs::path& pem_path,
                                    std::unique_ptr<Ed25519Signer>& signer, Error& error) {
  std::string pem;
  std::string io_error;
  if (!core::ReadFileBytes(pem_path, pem, io_error)) {
    return error.Set(ErrorKind::kKeyringUnavailable, "keyring unavailable: " + io_error);
  }

  bool has_private = true;
  BioPtr bio = MemoryBio(pem);
  if (!bio) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "BIO_new_mem_buf failed: " + core::hash::LastOpenSslError());
  }
  PkeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
  if (!key) {
    has_private = false;
    bio = MemoryBio(pem);
    if (bio) {
      key.reset(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    }
  }
  if (!key) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "keyring '" + pem_path.string() + "' holds no readable PEM key: " +
                         core::hash::LastOpenSslError());
  }
  if (EVP_PKEY_id(key.get()) != EVP_PKEY_ED25519) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "keyring '" + pem_path.string() + "' is not an Ed25519 key");
  }

  std::string key_id;
  if (!ComputeKeyId(key.get(), key_id, error)) {
    return false;
  }
  signer = std::make_unique<Ed25519Signer>(ConstructionTag{}, std::move(key), has_private,
                                           std::move(key_id));
  return true;
}

bool Ed25519Signer::Generate(std::unique_ptr<Ed25519Signer>& signer, Error& error) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
  if (!ctx) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "EVP_PKEY_CTX_new_id failed: " + core::hash::LastOpenSslError());
  }
  if (EVP_PKEY_keygen_init(ctx.get()) != 1) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "EVP_PKEY_keygen_init failed: " + core::hash::LastOpenSslError());
  }
  EVP_PKEY* raw_key = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw_key) != 1) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "EVP_PKEY_keygen failed: " + core::hash::LastOpenSslError());
  }
  PkeyPtr key(raw_key);

  std::string key_id;
  if (!ComputeKeyId(key.get(), key_id, error)) {
    return false;
  }
  signer = std::make_unique<Ed25519Signer>(ConstructionTag{}, std::move(key), true,
                                           std::move(key_id));
  return true;
}

bool Ed25519Signer::Sign(std::string_view content, SignedForms& forms, Error& error) {
  if (!has_private_) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "keyring " + key_id_ + " holds only a public key; cannot sign");
  }

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "EVP_MD_CTX_new failed: " + core::hash::LastOpenSslError());
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "EVP_DigestSignInit failed: " + core::hash::LastOpenSslError());
  }

  std::array<unsigned char, kEd25519SignatureBytes> raw_signature{};
  std::size_t signature_length = raw_signature.size();
  if (EVP_DigestSign(ctx.get(), raw_signature.data(), &signature_length,
                     reinterpret_cast<const unsigned char*>(content.data()),
                     content.size()) != 1) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "EVP_DigestSign failed: " + core::hash::LastOpenSslError());
  }

  std::string detached;
  std::string armor_error;
  if (!ArmorSignature(
          key_id_, kEd25519Algorithm,
          std::string_view(reinterpret_cast<const char*>(raw_signature.data()), signature_length),
          detached, armor_error)) {
    return error.Set(ErrorKind::kKeyringUnavailable, armor_error);
  }

  forms.self_contained = BuildSelfContained(key_id_, content, detached);
  forms.detached = std::move(detached);
  return true;
}

bool Ed25519Signer::Verify(std::string_view content, std::string_view detached, bool& valid,
                           Error& error) {
  valid = false;

  ArmoredSignature signature;
  std::string parse_error;
  if (!ParseArmoredSignature(detached, signature, parse_error)) {
    return true;
  }
  if (signature.key_id != key_id_ || signature.algorithm != kEd25519Algorithm ||
      signature.raw_signature.size() != kEd25519SignatureBytes) {
    return true;
  }

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "EVP_MD_CTX_new failed: " + core::hash::LastOpenSslError());
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "EVP_DigestVerifyInit failed: " + core::hash::LastOpenSslError());
  }

  valid = EVP_DigestVerify(ctx.get(),
                           reinterpret_cast<const unsigned char*>(signature.raw_signature.data()),
                           signature.raw_signature.size(),
                           reinterpret_cast<const unsigned char*>(content.data()),
                           content.size()) == 1;
  return true;
}

std::string Ed25519Signer::KeyId() const {
  return key_id_;
}

bool Ed25519Signer::CanSign() const {
  return has_private_;
}

bool Ed25519Signer::WritePrivateKeyPem(const fs::path& pem_path, Error& error) const {
  if (!has_private_) {
    return error.Set(ErrorKind::kKeyringUnavailable, "no private key to export");
  }
  BioPtr bio(BIO_new(BIO_s_mem()));
  std::string pem;
  if (!bio ||
      PEM_write_bio_PrivateKey(bio.get(), key_.get(), nullptr, nullptr, 0, nullptr, nullptr) !=
          1 ||
      !ReadBio(bio.get(), pem)) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "PEM_write_bio_PrivateKey failed: " + core::hash::LastOpenSslError());
  }
  std::string io_error;
  if (!core::WriteTextFileAtomic(pem_path, pem, io_error)) {
    return error.Set(ErrorKind::kIoFailure, io_error);
  }
  return true;
}

bool Ed25519Signer::WritePublicKeyPem(const fs::path& pem_path, Error& error) const {
  BioPtr bio(BIO_new(BIO_s_mem()));
  std::string pem;
  if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1 || !ReadBio(bio.get(), pem)) {
    return error.Set(ErrorKind::kKeyringUnavailable,
                     "PEM_write_bio_PUBKEY failed: " + core::hash::LastOpenSslError());
  }
  std::string io_error;
  if (!core::WriteTextFileAtomic(pem_path, pem, io_error)) {
    return error.Set(ErrorKind::kIoFailure, io_error);
  }
  return true;
}

} // namespace bootstream::signing
