#pragma once

#include <stdexcept>
#include <string>

namespace confq {

/// Base of every error surfaced by the acquisition, execution, and pagination layers.
/// MUST carry a stable kind name and the underlying message, never a generic failure.
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& message) : std::runtime_error(message) {}
  virtual const char* kind_name() const noexcept = 0;
};

/// Host OS/arch combination has no published binary. Fatal, never retried.
class UnsupportedPlatformError : public Error {
 public:
  using Error::Error;
  const char* kind_name() const noexcept override { return "UnsupportedPlatform"; }
};

/// No numeric version token found in a version string.
/// Callers MUST treat the candidate as unusable, never as newest.
class VersionParseError : public Error {
 public:
  using Error::Error;
  const char* kind_name() const noexcept override { return "VersionParse"; }
};

/// Downloaded artifact hash differs from its pinned record.
class ChecksumVerificationError : public Error {
 public:
  using Error::Error;
  const char* kind_name() const noexcept override { return "ChecksumVerification"; }
};

/// Download failed after the bounded retry budget; message holds the last cause.
class BinaryFetchError : public Error {
 public:
  using Error::Error;
  const char* kind_name() const noexcept override { return "BinaryFetch"; }
};

/// Raised by Downloader implementations for a single failed transfer.
/// The fetcher converts exhaustion of these into BinaryFetchError.
class NetworkError : public Error {
 public:
  using Error::Error;
  const char* kind_name() const noexcept override { return "Network"; }
};

/// Child process could not be started (missing file, not executable, fork failure).
class ProcessSpawnError : public Error {
 public:
  using Error::Error;
  const char* kind_name() const noexcept override { return "ProcessSpawn"; }
};

/// Failure classification for a query subprocess.
enum class QueryErrorKind {
  BinaryMissing,
  Timeout,
  NonZeroExit,
  MalformedExpression,
  UnsupportedFormat,
};

const char* query_error_kind_name(QueryErrorKind kind);

/// Classified failure of a query execution.
/// MUST keep stderr verbatim so callers can decide on fallbacks themselves.
class QueryExecutionError : public Error {
 public:
  QueryExecutionError(QueryErrorKind kind,
                      const std::string& message,
                      std::string stderr_text = "",
                      int exit_code = -1);

  QueryErrorKind kind() const noexcept { return kind_; }
  const std::string& stderr_text() const noexcept { return stderr_text_; }
  int exit_code() const noexcept { return exit_code_; }
  const char* kind_name() const noexcept override { return query_error_kind_name(kind_); }

 private:
  QueryErrorKind kind_;
  std::string stderr_text_;
  int exit_code_;
};

/// Cursor token is malformed or its offset lies outside [0, total_size].
class InvalidCursorError : public Error {
 public:
  using Error::Error;
  const char* kind_name() const noexcept override { return "InvalidCursor"; }
};

/// Cursor was issued for data of a different size; pagination must restart at zero.
class StaleCursorError : public Error {
 public:
  using Error::Error;
  const char* kind_name() const noexcept override { return "StaleCursor"; }
};

}  // namespace confq
