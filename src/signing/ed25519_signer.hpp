#ifndef BOOTSTREAM_SIGNING_ED25519_SIGNER_HPP_
#define BOOTSTREAM_SIGNING_ED25519_SIGNER_HPP_

#include "signing/signer.hpp"

#include <openssl/evp.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace bootstream::signing {

inline constexpr std::string_view kEd25519Algorithm = "ed25519";

// In-process Ed25519 signer backed by OpenSSL.
//
// The keyring is a single PEM file. A private key both signs and verifies; a
// public key only verifies, and Sign() then fails with kKeyringUnavailable.
class Ed25519Signer final : public ISigner {
  struct ConstructionTag {
    explicit ConstructionTag() = default;
  };

  struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const {
      EVP_PKEY_free(key);
    }
  };
  using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

public:
  // Only reachable through LoadFromPemFile() and Generate().
  Ed25519Signer(ConstructionTag, PkeyPtr key, bool has_private, std::string key_id);

  // kKeyringUnavailable when the file is missing, unreadable, not PEM or not
  // an Ed25519 key.
  static bool LoadFromPemFile(const std::filesystem::path& pem_path,
                              std::unique_ptr<Ed25519Signer>& signer,
                              core::errors::Error& error);

  // Fresh private key; used to provision keyrings in tests and tooling.
  static bool Generate(std::unique_ptr<Ed25519Signer>& signer, core::errors::Error& error);

  bool Sign(std::string_view content, SignedForms& forms, core::errors::Error& error) override;
  bool Verify(std::string_view content, std::string_view detached, bool& valid,
              core::errors::Error& error) override;
  std::string KeyId() const override;

  bool CanSign() const;

  bool WritePrivateKeyPem(const std::filesystem::path& pem_path,
                          core::errors::Error& error) const;
  bool WritePublicKeyPem(const std::filesystem::path& pem_path,
                         core::errors::Error& error) const;

private:
  static bool ComputeKeyId(EVP_PKEY* key, std::string& key_id, core::errors::Error& error);

  PkeyPtr key_;
  bool has_private_ = false;
  std::string key_id_;
};

} // namespace bootstream::signing

#endif // BOOTSTREAM_SIGNING_ED25519_SIGNER_HPP_
