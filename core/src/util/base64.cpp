#include "base64.h"

#include <cstdint>

namespace confq::util {

namespace {

constexpr const char* kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

}  // namespace

std::string base64_encode(const std::string& bytes) {
  std::string out;
  out.reserve(((bytes.size() + 2) / 3) * 4);
  size_t i = 0;
  while (i + 3 <= bytes.size()) {
    uint32_t n = (static_cast<uint32_t>(static_cast<unsigned char>(bytes[i])) << 16U) |
                 (static_cast<uint32_t>(static_cast<unsigned char>(bytes[i + 1])) << 8U) |
                 static_cast<uint32_t>(static_cast<unsigned char>(bytes[i + 2]));
    out.push_back(kAlphabet[(n >> 18U) & 0x3fU]);
    out.push_back(kAlphabet[(n >> 12U) & 0x3fU]);
    out.push_back(kAlphabet[(n >> 6U) & 0x3fU]);
    out.push_back(kAlphabet[n & 0x3fU]);
    i += 3;
  }
  size_t rest = bytes.size() - i;
  if (rest == 1) {
    uint32_t n = static_cast<uint32_t>(static_cast<unsigned char>(bytes[i])) << 16U;
    out.push_back(kAlphabet[(n >> 18U) & 0x3fU]);
    out.push_back(kAlphabet[(n >> 12U) & 0x3fU]);
    out += "==";
  } else if (rest == 2) {
    uint32_t n = (static_cast<uint32_t>(static_cast<unsigned char>(bytes[i])) << 16U) |
                 (static_cast<uint32_t>(static_cast<unsigned char>(bytes[i + 1])) << 8U);
    out.push_back(kAlphabet[(n >> 18U) & 0x3fU]);
    out.push_back(kAlphabet[(n >> 12U) & 0x3fU]);
    out.push_back(kAlphabet[(n >> 6U) & 0x3fU]);
    out.push_back('=');
  }
  return out;
}

std::optional<std::string> base64_decode(const std::string& text) {
  if (text.size() % 4 != 0) return std::nullopt;
  std::string out;
  out.reserve(text.size() / 4 * 3);
  for (size_t i = 0; i < text.size(); i += 4) {
    const bool last = i + 4 == text.size();
    int v[4];
    int pad = 0;
    for (size_t j = 0; j < 4; ++j) {
      char c = text[i + j];
      if (c == '=') {
        // Padding only in the final quad, only in the last two slots.
        if (!last || j < 2) return std::nullopt;
        v[j] = 0;
        ++pad;
        continue;
      }
      if (pad > 0) return std::nullopt;
      v[j] = decode_char(c);
      if (v[j] < 0) return std::nullopt;
    }
    uint32_t n = (static_cast<uint32_t>(v[0]) << 18U) | (static_cast<uint32_t>(v[1]) << 12U) |
                 (static_cast<uint32_t>(v[2]) << 6U) | static_cast<uint32_t>(v[3]);
    out.push_back(static_cast<char>((n >> 16U) & 0xffU));
    if (pad < 2) out.push_back(static_cast<char>((n >> 8U) & 0xffU));
    if (pad < 1) out.push_back(static_cast<char>(n & 0xffU));
  }
  return out;
}

}  // namespace confq::util
