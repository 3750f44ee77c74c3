#include "confq/errors.h"

#include <utility>

namespace confq {

const char* query_error_kind_name(QueryErrorKind kind) {
  switch (kind) {
    case QueryErrorKind::BinaryMissing:
      return "BinaryMissing";
    case QueryErrorKind::Timeout:
      return "Timeout";
    case QueryErrorKind::NonZeroExit:
      return "NonZeroExit";
    case QueryErrorKind::MalformedExpression:
      return "MalformedExpression";
    case QueryErrorKind::UnsupportedFormat:
      return "UnsupportedFormat";
  }
  return "Unknown";
}

QueryExecutionError::QueryExecutionError(QueryErrorKind kind,
                                         const std::string& message,
                                         std::string stderr_text,
                                         int exit_code)
    : Error(message),
      kind_(kind),
      stderr_text_(std::move(stderr_text)),
      exit_code_(exit_code) {}

}  // namespace confq
