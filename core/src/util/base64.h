#pragma once

#include <optional>
#include <string>

namespace confq::util {

/// Standard base64 with '=' padding.
std::string base64_encode(const std::string& bytes);
/// Decodes standard base64. Returns nullopt on bad characters, bad padding,
/// or a length that is not a multiple of four.
std::optional<std::string> base64_decode(const std::string& text);

}  // namespace confq::util
