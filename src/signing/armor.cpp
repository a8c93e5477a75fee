#include "signing/armor.hpp"

#include "core/hash/sha256.hpp"

#include <openssl/evp.h>

#include <charconv>
#include <vector>

namespace bootstream::signing {

namespace {

constexpr std::string_view kKeyIdHeader = "Key-Id: ";
constexpr std::string_view kAlgorithmHeader = "Algorithm: ";
constexpr std::string_view kContentLengthHeader = "Content-Length: ";

// Pops one '\n'-terminated line (without the terminator) from `text`.
bool NextLine(std::string_view& text, std::string_view& line) {
  if (text.empty()) {
    return false;
  }
  const std::size_t end = text.find('\n');
  if (end == std::string_view::npos) {
    line = text;
    text = {};
    return true;
  }
  line = text.substr(0, end);
  text.remove_prefix(end + 1);
  return true;
}

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}

} // namespace

bool EncodeBase64(std::string_view raw, std::string& encoded, std::string& error) {
  std::vector<unsigned char> buffer(4 * ((raw.size() + 2) / 3) + 1, 0);
  const int written = EVP_EncodeBlock(buffer.data(),
                                      reinterpret_cast<const unsigned char*>(raw.data()),
                                      static_cast<int>(raw.size()));
  if (written < 0) {
    error = "EVP_EncodeBlock failed: " + core::hash::LastOpenSslError();
    return false;
  }
  encoded.assign(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(written));
  return true;
}

bool DecodeBase64(std::string_view encoded, std::string& raw, std::string& error) {
  std::string compact;
  compact.reserve(encoded.size());
  for (const char c : encoded) {
    if (c != '\n' && c != '\r' && c != ' ' && c != '\t') {
      compact.push_back(c);
    }
  }
  if (compact.empty() || compact.size() % 4 != 0) {
    error = "base64 payload has invalid length";
    return false;
  }

  std::vector<unsigned char> buffer(compact.size() / 4 * 3, 0);
  const int decoded = EVP_DecodeBlock(buffer.data(),
                                      reinterpret_cast<const unsigned char*>(compact.data()),
                                      static_cast<int>(compact.size()));
  if (decoded < 0) {
    error = "base64 payload is not valid";
    return false;
  }

  std::size_t padding = 0;
  if (compact.back() == '=') {
    ++padding;
    if (compact[compact.size() - 2] == '=') {
      ++padding;
    }
  }
  raw.assign(reinterpret_cast<const char*>(buffer.data()),
             static_cast<std::size_t>(decoded) - padding);
  return true;
}

bool ArmorSignature(std::string_view key_id, std::string_view algorithm,
                    std::string_view raw_signature, std::string& armored, std::string& error) {
  std::string encoded;
  if (!EncodeBase64(raw_signature, encoded, error)) {
    return false;
  }

  armored.clear();
  armored.append(kSignatureBegin).append("\n");
  armored.append(kKeyIdHeader).append(key_id).append("\n");
  armored.append(kAlgorithmHeader).append(algorithm).append("\n");
  armored.append("\n");
  armored.append(encoded).append("\n");
  armored.append(kSignatureEnd).append("\n");
  return true;
}

bool ParseArmoredSignature(std::string_view text, ArmoredSignature& signature,
                           std::string& error) {
  std::string_view line;
  if (!NextLine(text, line) || line != kSignatureBegin) {
    error = "missing signature begin marker";
    return false;
  }

  ArmoredSignature parsed;
  while (NextLine(text, line) && !line.empty()) {
    if (StartsWith(line, kKeyIdHeader)) {
      parsed.key_id = std::string(line.substr(kKeyIdHeader.size()));
    } else if (StartsWith(line, kAlgorithmHeader)) {
      parsed.algorithm = std::string(line.substr(kAlgorithmHeader.size()));
    } else {
      error = "unexpected signature header '" + std::string(line) + "'";
      return false;
    }
  }
  if (parsed.key_id.empty()) {
    error = "signature has no Key-Id header";
    return false;
  }

  std::string encoded;
  bool terminated = false;
  while (NextLine(text, line)) {
    if (line == kSignatureEnd) {
      terminated = true;
      break;
    }
    encoded.append(line);
  }
  if (!terminated) {
    error = "missing signature end marker";
    return false;
  }
  if (!DecodeBase64(encoded, parsed.raw_signature, error)) {
    return false;
  }

  signature = std::move(parsed);
  return true;
}

std::string BuildSelfContained(std::string_view key_id, std::string_view content,
                               std::string_view armored_signature) {
  std::string envelope;
  envelope.append(kSignedMessageBegin).append("\n");
  envelope.append(kKeyIdHeader).append(key_id).append("\n");
  envelope.append(kContentLengthHeader).append(std::to_string(content.size())).append("\n");
  envelope.append("\n");
  envelope.append(content);
  if (content.empty() || content.back() != '\n') {
    envelope.append("\n");
  }
  envelope.append(armored_signature);
  return envelope;
}

bool SplitSelfContained(std::string_view text, std::string& content,
                        std::string& armored_signature, std::string& error) {
  std::string_view line;
  if (!NextLine(text, line) || line != kSignedMessageBegin) {
    error = "missing signed message begin marker";
    return false;
  }

  std::size_t content_length = 0;
  bool has_length = false;
  while (NextLine(text, line) && !line.empty()) {
    if (StartsWith(line, kContentLengthHeader)) {
      const std::string_view digits = line.substr(kContentLengthHeader.size());
      const auto [ptr, ec] =
          std::from_chars(digits.data(), digits.data() + digits.size(), content_length);
      if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        error = "invalid Content-Length header";
        return false;
      }
      has_length = true;
    } else if (!StartsWith(line, kKeyIdHeader)) {
      error = "unexpected signed message header '" + std::string(line) + "'";
      return false;
    }
  }
  if (!has_length || content_length > text.size()) {
    error = "signed message has no usable Content-Length";
    return false;
  }

  content = std::string(text.substr(0, content_length));
  text.remove_prefix(content_length);
  if (content.empty() || content.back() != '\n') {
    if (text.empty() || text.front() != '\n') {
      error = "signed message content is not terminated";
      return false;
    }
    text.remove_prefix(1);
  }
  if (!StartsWith(text, kSignatureBegin)) {
    error = "signed message has no signature block";
    return false;
  }
  armored_signature = std::string(text);
  return true;
}

} // namespace bootstream::signing
