#include "confq/sha256.h"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <stdexcept>

#include "util/string_util.h"

namespace confq {

namespace {

constexpr std::array<uint32_t, 64> kK = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

inline uint32_t rotr(uint32_t value, uint32_t shift) {
  return (value >> shift) | (value << (32U - shift));
}

}  // namespace

Sha256::Sha256()
    : state_{0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
             0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19} {}

void Sha256::compress(const uint8_t* block) {
  uint32_t w[64];
  for (size_t i = 0; i < 16; ++i) {
    w[i] = (static_cast<uint32_t>(block[i * 4]) << 24U) |
           (static_cast<uint32_t>(block[i * 4 + 1]) << 16U) |
           (static_cast<uint32_t>(block[i * 4 + 2]) << 8U) |
           static_cast<uint32_t>(block[i * 4 + 3]);
  }
  for (size_t i = 16; i < 64; ++i) {
    uint32_t s0 = rotr(w[i - 15], 7U) ^ rotr(w[i - 15], 18U) ^ (w[i - 15] >> 3U);
    uint32_t s1 = rotr(w[i - 2], 17U) ^ rotr(w[i - 2], 19U) ^ (w[i - 2] >> 10U);
    w[i] = w[i - 16] + s0 + w[i - 7] + s1;
  }

  std::array<uint32_t, 8> v = state_;
  for (size_t i = 0; i < 64; ++i) {
    uint32_t e = v[4];
    uint32_t a = v[0];
    uint32_t t1 = v[7] + (rotr(e, 6U) ^ rotr(e, 11U) ^ rotr(e, 25U)) +
                  ((e & v[5]) ^ (~e & v[6])) + kK[i] + w[i];
    uint32_t t2 = (rotr(a, 2U) ^ rotr(a, 13U) ^ rotr(a, 22U)) +
                  ((a & v[1]) ^ (a & v[2]) ^ (v[1] & v[2]));
    v[7] = v[6];
    v[6] = v[5];
    v[5] = v[4];
    v[4] = v[3] + t1;
    v[3] = v[2];
    v[2] = v[1];
    v[1] = v[0];
    v[0] = t1 + t2;
  }
  for (size_t i = 0; i < 8; ++i) {
    state_[i] += v[i];
  }
}

void Sha256::update(const void* data, size_t size) {
  const auto* bytes = static_cast<const uint8_t*>(data);
  total_bytes_ += size;
  if (buffered_ > 0) {
    size_t take = std::min(size, buffer_.size() - buffered_);
    std::memcpy(buffer_.data() + buffered_, bytes, take);
    buffered_ += take;
    bytes += take;
    size -= take;
    if (buffered_ < buffer_.size()) return;
    compress(buffer_.data());
    buffered_ = 0;
  }
  while (size >= 64) {
    compress(bytes);
    bytes += 64;
    size -= 64;
  }
  if (size > 0) {
    std::memcpy(buffer_.data(), bytes, size);
    buffered_ = size;
  }
}

std::string Sha256::finish_hex() {
  const uint64_t bit_length = total_bytes_ * 8ULL;
  uint8_t pad[72] = {0x80};
  size_t pad_len = (buffered_ < 56) ? (56 - buffered_) : (120 - buffered_);
  uint8_t length_be[8];
  for (int i = 0; i < 8; ++i) {
    length_be[i] = static_cast<uint8_t>((bit_length >> ((7 - i) * 8)) & 0xffULL);
  }
  update(pad, pad_len);
  update(length_be, sizeof(length_be));

  uint8_t digest[32];
  for (size_t i = 0; i < 8; ++i) {
    digest[i * 4] = static_cast<uint8_t>(state_[i] >> 24U);
    digest[i * 4 + 1] = static_cast<uint8_t>(state_[i] >> 16U);
    digest[i * 4 + 2] = static_cast<uint8_t>(state_[i] >> 8U);
    digest[i * 4 + 3] = static_cast<uint8_t>(state_[i]);
  }
  return util::hex_encode(digest, sizeof(digest));
}

std::string sha256_hex(const std::string& bytes) {
  Sha256 hasher;
  hasher.update(bytes);
  return hasher.finish_hex();
}

std::string sha256_file_hex(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file for hashing: " + path);
  }
  Sha256 hasher;
  char chunk[64 * 1024];
  while (file) {
    file.read(chunk, sizeof(chunk));
    std::streamsize got = file.gcount();
    if (got > 0) hasher.update(chunk, static_cast<size_t>(got));
  }
  if (file.bad()) {
    throw std::runtime_error("Failed to read file for hashing: " + path);
  }
  return hasher.finish_hex();
}

}  // namespace confq
