#pragma once

#include "core/errors/error.hpp"

#include <string>
#include <string_view>

namespace bootstream::signing {

// The two published signature forms of one document.
struct SignedForms {
  // `.sjson`: clear-signed envelope embedding the exact document bytes.
  std::string self_contained;
  // `.json.gpg`: armored detached signature over the exact document bytes.
  std::string detached;
};

// Signing contract used by the synchronizer and the verify command.
//
// Contract goals:
// - signatures are over exact bytes, never over a re-serialization
// - key problems surface as kKeyringUnavailable
// - a signature that does not verify is reported through `valid`, not `error`
class ISigner {
public:
  virtual ~ISigner() = default;

  virtual bool Sign(std::string_view content, SignedForms& forms, core::errors::Error& error) = 0;

  virtual bool Verify(std::string_view content, std::string_view detached, bool& valid,
                      core::errors::Error& error) = 0;

  // Short stable identifier written into every signature header.
  virtual std::string KeyId() const = 0;
};

} // namespace bootstream::signing
