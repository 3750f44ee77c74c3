#include "confq/tool_version.h"

#include <cctype>
#include <climits>

#include "confq/errors.h"

namespace confq {

namespace {

bool is_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/// Reads a run of digits starting at pos. Returns false on overflow.
bool read_component(const std::string& raw, size_t& pos, int& out) {
  long long value = 0;
  size_t start = pos;
  while (pos < raw.size() && is_digit(raw[pos])) {
    value = value * 10 + (raw[pos] - '0');
    if (value > INT_MAX) return false;
    ++pos;
  }
  if (pos == start) return false;
  out = static_cast<int>(value);
  return true;
}

}  // namespace

bool operator==(const Version& a, const Version& b) {
  return a.major == b.major && a.minor == b.minor && a.patch == b.patch;
}

bool operator!=(const Version& a, const Version& b) {
  return !(a == b);
}

bool operator<(const Version& a, const Version& b) {
  if (a.major != b.major) return a.major < b.major;
  if (a.minor != b.minor) return a.minor < b.minor;
  return a.patch < b.patch;
}

Version parse_version(const std::string& raw) {
  for (size_t i = 0; i < raw.size(); ++i) {
    if (!is_digit(raw[i])) continue;
    // A digit glued to a word ("x86", "sha256") is not a version token.
    if (i > 0) {
      char prev = raw[i - 1];
      bool prev_ok = prev == 'v' || prev == 'V' || !std::isalnum(static_cast<unsigned char>(prev));
      if (!prev_ok) {
        while (i + 1 < raw.size() && is_digit(raw[i + 1])) ++i;
        continue;
      }
      if ((prev == 'v' || prev == 'V') && i > 1 &&
          std::isalnum(static_cast<unsigned char>(raw[i - 2]))) {
        while (i + 1 < raw.size() && is_digit(raw[i + 1])) ++i;
        continue;
      }
    }
    Version v;
    size_t pos = i;
    if (!read_component(raw, pos, v.major)) {
      throw VersionParseError("Version component out of range in: " + raw);
    }
    if (pos + 1 < raw.size() && raw[pos] == '.' && is_digit(raw[pos + 1])) {
      ++pos;
      if (!read_component(raw, pos, v.minor)) {
        throw VersionParseError("Version component out of range in: " + raw);
      }
      if (pos + 1 < raw.size() && raw[pos] == '.' && is_digit(raw[pos + 1])) {
        ++pos;
        if (!read_component(raw, pos, v.patch)) {
          throw VersionParseError("Version component out of range in: " + raw);
        }
      }
    }
    return v;
  }
  throw VersionParseError("No version number found in: '" + raw + "'");
}

bool meets_minimum(const Version& v, const Version& min) {
  return !(v < min);
}

std::string to_string(const Version& v) {
  return "v" + std::to_string(v.major) + "." + std::to_string(v.minor) + "." +
         std::to_string(v.patch);
}

}  // namespace confq
