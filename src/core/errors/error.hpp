#ifndef BOOTSTREAM_CORE_ERRORS_ERROR_HPP_
#define BOOTSTREAM_CORE_ERRORS_ERROR_HPP_

#include "core/errors/exit_codes.hpp"

#include <string>
#include <utility>

namespace bootstream::core::errors {

// Failure taxonomy shared by the store, resolver, filters, engine and signer.
// Per-product "not applicable" outcomes are decisions, never errors.
enum class ErrorKind {
  kNone,
  kIoFailure,
  kCorruptIndex,
  kMissingProductFile,
  kMalformedProduct,
  kMissingArtifactFile,
  kChecksumMismatch,
  kFilterSyntaxError,
  kUnknownProduct,
  kSignatureMismatch,
  kKeyringUnavailable,
  kPartialWriteDetected,
};

struct Error {
  ErrorKind kind = ErrorKind::kNone;
  std::string message;

  bool Set(ErrorKind new_kind, std::string new_message) {
    kind = new_kind;
    message = std::move(new_message);
    return false;
  }

  void Clear() {
    kind = ErrorKind::kNone;
    message.clear();
  }
};

inline const char* ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "None";
  case ErrorKind::kIoFailure:
    return "IoFailure";
  case ErrorKind::kCorruptIndex:
    return "CorruptIndex";
  case ErrorKind::kMissingProductFile:
    return "MissingProductFile";
  case ErrorKind::kMalformedProduct:
    return "MalformedProduct";
  case ErrorKind::kMissingArtifactFile:
    return "MissingArtifactFile";
  case ErrorKind::kChecksumMismatch:
    return "ChecksumMismatch";
  case ErrorKind::kFilterSyntaxError:
    return "FilterSyntaxError";
  case ErrorKind::kUnknownProduct:
    return "UnknownProduct";
  case ErrorKind::kSignatureMismatch:
    return "SignatureMismatch";
  case ErrorKind::kKeyringUnavailable:
    return "KeyringUnavailable";
  case ErrorKind::kPartialWriteDetected:
    return "PartialWriteDetected";
  }
  return "IoFailure";
}

inline ExitCode ToExitCode(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return ExitCode::kSuccess;
  case ErrorKind::kCorruptIndex:
  case ErrorKind::kMissingProductFile:
  case ErrorKind::kMalformedProduct:
  case ErrorKind::kPartialWriteDetected:
    return ExitCode::kCatalogInvalid;
  case ErrorKind::kFilterSyntaxError:
    return ExitCode::kFilterSyntax;
  case ErrorKind::kMissingArtifactFile:
  case ErrorKind::kChecksumMismatch:
    return ExitCode::kArtifactInvalid;
  case ErrorKind::kUnknownProduct:
    return ExitCode::kUnknownProduct;
  case ErrorKind::kSignatureMismatch:
    return ExitCode::kSignatureMismatch;
  case ErrorKind::kKeyringUnavailable:
    return ExitCode::kKeyringUnavailable;
  case ErrorKind::kIoFailure:
    return ExitCode::kFailure;
  }
  return ExitCode::kFailure;
}

// "<Kind>: <message>" for CLI output and log fields.
inline std::string Describe(const Error& error) {
  return std::string(ToString(error.kind)) + ": " + error.message;
}

} // namespace bootstream::core::errors

#endif // BOOTSTREAM_CORE_ERRORS_ERROR_HPP_
