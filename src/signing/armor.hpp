#pragma once

#include <string>
#include <string_view>

namespace bootstream::signing {

inline constexpr std::string_view kSignatureBegin = "-----BEGIN BOOTSTREAM SIGNATURE-----";
inline constexpr std::string_view kSignatureEnd = "-----END BOOTSTREAM SIGNATURE-----";
inline constexpr std::string_view kSignedMessageBegin = "-----BEGIN BOOTSTREAM SIGNED MESSAGE-----";

// Decoded detached signature block.
struct ArmoredSignature {
  std::string key_id;
  std::string algorithm;
  std::string raw_signature;
};

// -----BEGIN BOOTSTREAM SIGNATURE-----
// Key-Id: 0123456789abcdef
// Algorithm: ed25519
//
// <base64>
// -----END BOOTSTREAM SIGNATURE-----
bool ArmorSignature(std::string_view key_id, std::string_view algorithm,
                    std::string_view raw_signature, std::string& armored, std::string& error);

bool ParseArmoredSignature(std::string_view text, ArmoredSignature& signature,
                           std::string& error);

// Signed-message header (Key-Id, Content-Length), a blank line, the exact
// content, then the armored signature. A '\n' is inserted before the
// signature block when the content does not end with one; Content-Length lets
// SplitSelfContained recover the exact bytes either way.
std::string BuildSelfContained(std::string_view key_id, std::string_view content,
                               std::string_view armored_signature);

// Inverse of BuildSelfContained.
bool SplitSelfContained(std::string_view text, std::string& content,
                        std::string& armored_signature, std::string& error);

bool EncodeBase64(std::string_view raw, std::string& encoded, std::string& error);
bool DecodeBase64(std::string_view encoded, std::string& raw, std::string& error);

} // namespace bootstream::signing
