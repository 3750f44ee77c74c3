#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace confq {

constexpr size_t kDefaultPageSize = 10000;
/// Results spanning more pages than this get an advisory.
constexpr size_t kAdvisoryPageThreshold = 2;
constexpr size_t kMaxPrimitiveDisplayLength = 100;
constexpr int kCursorFormatVersion = 1;

/// Resume position in one serialized result.
/// offset is a byte offset that always lies on a UTF-8 character boundary.
struct Cursor {
  size_t offset = 0;
  size_t total_size = 0;
  int format_version = kCursorFormatVersion;
};

bool operator==(const Cursor& a, const Cursor& b);
bool operator!=(const Cursor& a, const Cursor& b);

struct PageResult {
  std::string chunk_bytes;
  std::optional<Cursor> next_cursor;
  bool is_last = true;
  size_t total_size = 0;
};

/// Opaque token: base64 of {"v":1,"offset":N,"total":M}.
std::string encode_cursor(const Cursor& cursor);
/// MUST throw InvalidCursorError for bad base64, non-JSON payloads, missing or
/// non-integer fields, negative values, unknown versions, and offset > total.
Cursor decode_cursor(const std::string& token);

/// Two-space indented JSON; the form every page and cursor refers to.
std::string canonical_serialization(const nlohmann::json& data);

/// Slices the canonical serialization of data. See paginate_text.
PageResult paginate(const nlohmann::json& data,
                    const std::optional<Cursor>& cursor,
                    size_t page_size = kDefaultPageSize);

/// Returns the page starting at the cursor (or at 0) of at most page_size bytes, ending
/// on a UTF-8 boundary. A single character wider than the page is returned whole.
/// A cursor at the very end yields an empty last page.
/// MUST throw StaleCursorError when cursor->total_size != text.size(),
/// InvalidCursorError when the offset is out of range or splits a character, and
/// std::invalid_argument when page_size is 0.
PageResult paginate_text(const std::string& text,
                         const std::optional<Cursor>& cursor,
                         size_t page_size = kDefaultPageSize);

/// Number of pages a result of total_size bytes spans, at least 1.
size_t page_count(size_t total_size, size_t page_size = kDefaultPageSize);

/// Object keys, or array indices; an empty array for scalars.
nlohmann::json top_level_keys(const nlohmann::json& data);

/// Shape of data with leaf values shortened. Containers deeper than max_depth collapse to
/// keys and type names. full_keys_mode ignores max_depth and reports every key with type
/// names only; arrays are represented by their first element.
nlohmann::json summarize_structure(const nlohmann::json& data,
                                   int max_depth = 1,
                                   bool full_keys_mode = false);

/// Suggests a narrowing expression for arrays and objects.
std::optional<std::string> pagination_hint(const nlohmann::json& data);

/// Advice for results spanning more than kAdvisoryPageThreshold pages, else nullopt.
std::optional<std::string> pagination_advisory(size_t total_size,
                                               size_t page_size,
                                               const std::optional<std::string>& hint);

}  // namespace confq
