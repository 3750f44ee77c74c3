#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "confq/query_backend.h"

namespace confq::cli {

struct ResponseOptions {
  std::optional<std::string> cursor_token;
  size_t page_size = 10000;
  bool summary = false;
  int summary_depth = 1;
  bool full_keys = false;
  bool keys = false;
};

/// Builds the success envelope for one query: decoded JSON output (or raw text for other
/// formats), paged when larger than the page size or when a cursor is given.
/// MUST throw InvalidCursorError/StaleCursorError for unusable cursors and
/// std::invalid_argument when a summary is requested for non-JSON output.
nlohmann::json build_query_response(const FallbackResult& outcome,
                                    const std::string& source,
                                    const ResponseOptions& options);

/// {"error":{"kind":kind,"message":message}}
nlohmann::json error_envelope(const std::string& kind, const std::string& message);

}  // namespace confq::cli
