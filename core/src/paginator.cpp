#include "confq/paginator.h"

#include <stdexcept>

#include "confq/errors.h"
#include "util/base64.h"

namespace confq {

namespace {

using nlohmann::json;

bool is_continuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

/// Reads a non-negative integer field of a cursor payload.
size_t cursor_field(const json& payload, const char* name) {
  auto it = payload.find(name);
  if (it == payload.end()) {
    throw InvalidCursorError(std::string("Invalid cursor: missing '") + name + "'");
  }
  if (!it->is_number_integer()) {
    throw InvalidCursorError(std::string("Invalid cursor: '") + name + "' must be an integer");
  }
  if (it->is_number_unsigned()) {
    return it->get<size_t>();
  }
  long long value = it->get<long long>();
  if (value < 0) {
    throw InvalidCursorError(std::string("Invalid cursor: '") + name +
                             "' must be non-negative");
  }
  return static_cast<size_t>(value);
}

std::string truncate_display(const std::string& s) {
  if (s.size() <= kMaxPrimitiveDisplayLength) return s;
  size_t cut = kMaxPrimitiveDisplayLength - 3;
  while (cut > 0 && is_continuation(static_cast<unsigned char>(s[cut]))) --cut;
  return s.substr(0, cut) + "...";
}

std::string list_summary(size_t size) {
  return "<list with " + std::to_string(size) + " items>";
}

json summarize_depth_exceeded(const json& data) {
  if (data.is_object()) {
    json out = json::object();
    for (auto it = data.begin(); it != data.end(); ++it) {
      out[it.key()] = summarize_depth_exceeded(it.value());
    }
    return out;
  }
  if (data.is_array()) return list_summary(data.size());
  return data.type_name();
}

json summarize_at(const json& data, int depth, int max_depth, bool full_keys_mode) {
  if (!full_keys_mode && depth > max_depth) {
    return summarize_depth_exceeded(data);
  }
  if (data.is_object()) {
    json out = json::object();
    for (auto it = data.begin(); it != data.end(); ++it) {
      out[it.key()] = summarize_at(it.value(), depth + 1, max_depth, full_keys_mode);
    }
    return out;
  }
  if (data.is_array()) {
    if (data.empty()) return json::array();
    const json& first = data.front();
    if (full_keys_mode) {
      if (first.is_structured()) {
        return json::array({summarize_at(first, depth + 1, max_depth, full_keys_mode)});
      }
      return json::array({first.type_name()});
    }
    json out = json::object();
    out["__summary__"] = list_summary(data.size());
    out["first_item_sample"] = summarize_at(first, depth + 1, max_depth, full_keys_mode);
    return out;
  }
  if (full_keys_mode) return data.type_name();
  return truncate_display(data.is_string() ? data.get<std::string>() : data.dump());
}

}  // namespace

bool operator==(const Cursor& a, const Cursor& b) {
  return a.offset == b.offset && a.total_size == b.total_size &&
         a.format_version == b.format_version;
}

bool operator!=(const Cursor& a, const Cursor& b) {
  return !(a == b);
}

std::string encode_cursor(const Cursor& cursor) {
  json payload = {{"v", cursor.format_version},
                  {"offset", cursor.offset},
                  {"total", cursor.total_size}};
  return util::base64_encode(payload.dump());
}

Cursor decode_cursor(const std::string& token) {
  std::optional<std::string> raw = util::base64_decode(token);
  if (!raw.has_value()) {
    throw InvalidCursorError("Invalid cursor format: not base64");
  }
  json payload = json::parse(*raw, nullptr, false);
  if (payload.is_discarded() || !payload.is_object()) {
    throw InvalidCursorError("Invalid cursor format: payload is not a JSON object");
  }
  Cursor cursor;
  auto version = payload.find("v");
  if (version == payload.end() || !version->is_number_integer() ||
      version->get<long long>() != kCursorFormatVersion) {
    throw InvalidCursorError("Invalid cursor: unsupported cursor version");
  }
  cursor.format_version = kCursorFormatVersion;
  cursor.offset = cursor_field(payload, "offset");
  cursor.total_size = cursor_field(payload, "total");
  if (cursor.offset > cursor.total_size) {
    throw InvalidCursorError("Invalid cursor: offset " + std::to_string(cursor.offset) +
                             " exceeds result size " + std::to_string(cursor.total_size));
  }
  return cursor;
}

std::string canonical_serialization(const json& data) {
  return data.dump(2);
}

PageResult paginate(const json& data, const std::optional<Cursor>& cursor, size_t page_size) {
  return paginate_text(canonical_serialization(data), cursor, page_size);
}

PageResult paginate_text(const std::string& text,
                         const std::optional<Cursor>& cursor,
                         size_t page_size) {
  if (page_size == 0) {
    throw std::invalid_argument("Page size must be positive");
  }
  const size_t total = text.size();
  size_t offset = 0;
  if (cursor.has_value()) {
    if (cursor->format_version != kCursorFormatVersion) {
      throw InvalidCursorError("Invalid cursor: unsupported cursor version");
    }
    if (cursor->total_size != total) {
      throw StaleCursorError("Cursor was issued for a result of " +
                             std::to_string(cursor->total_size) + " bytes but the result is now " +
                             std::to_string(total) + " bytes; restart pagination");
    }
    if (cursor->offset > total) {
      throw InvalidCursorError("Cursor offset " + std::to_string(cursor->offset) +
                               " exceeds result size " + std::to_string(total));
    }
    offset = cursor->offset;
    if (offset < total && is_continuation(static_cast<unsigned char>(text[offset]))) {
      throw InvalidCursorError("Cursor offset " + std::to_string(offset) +
                               " is not on a character boundary");
    }
  }

  size_t end = offset + page_size < total ? offset + page_size : total;
  if (end < total) {
    while (end > offset && is_continuation(static_cast<unsigned char>(text[end]))) --end;
    if (end == offset) {
      end = offset + 1;
      while (end < total && is_continuation(static_cast<unsigned char>(text[end]))) ++end;
    }
  }

  PageResult page;
  page.total_size = total;
  page.chunk_bytes = text.substr(offset, end - offset);
  if (end < total) {
    page.next_cursor = Cursor{end, total, kCursorFormatVersion};
    page.is_last = false;
  }
  return page;
}

size_t page_count(size_t total_size, size_t page_size) {
  if (page_size == 0 || total_size == 0) return 1;
  return (total_size + page_size - 1) / page_size;
}

json top_level_keys(const json& data) {
  json keys = json::array();
  if (data.is_object()) {
    for (auto it = data.begin(); it != data.end(); ++it) keys.push_back(it.key());
  } else if (data.is_array()) {
    for (size_t i = 0; i < data.size(); ++i) keys.push_back(i);
  }
  return keys;
}

json summarize_structure(const json& data, int max_depth, bool full_keys_mode) {
  return summarize_at(data, 0, max_depth, full_keys_mode);
}

std::optional<std::string> pagination_hint(const json& data) {
  if (data.is_array()) {
    return std::string("Result is a list. Use '.[start:end]' to slice or '. | length' to count.");
  }
  if (data.is_object()) {
    return std::string("Result is an object. Use '.key' to select or '. | keys' to list keys.");
  }
  return std::nullopt;
}

std::optional<std::string> pagination_advisory(size_t total_size,
                                               size_t page_size,
                                               const std::optional<std::string>& hint) {
  const size_t pages = page_count(total_size, page_size);
  if (pages <= kAdvisoryPageThreshold) return std::nullopt;
  std::string advisory = "Result spans " + std::to_string(pages) + " pages (" +
                         std::to_string(total_size) +
                         " bytes). Consider querying for specific keys (e.g., '.data | keys') "
                         "or counts (e.g., '.items | length') to reduce result size.";
  if (hint.has_value()) advisory += " " + *hint;
  return advisory;
}

}  // namespace confq
