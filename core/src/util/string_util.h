#pragma once

#include <string>
#include <vector>

namespace confq::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep parsing deterministic.
std::string to_lower(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(const std::string& s);
/// Splits on a delimiter, trimming each piece and dropping empty pieces.
std::vector<std::string> split_trimmed(const std::string& s, char delim);
/// Splits on runs of ASCII whitespace.
std::vector<std::string> split_ws(const std::string& s);
/// Returns true for 1/true/yes/on (case-insensitive).
bool is_truthy(const std::string& s);
/// Lowercase hex encoding of raw bytes.
std::string hex_encode(const unsigned char* data, size_t size);

}  // namespace confq::util
