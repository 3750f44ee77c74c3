#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace confq {

/// Incremental SHA-256 so large artifacts can be hashed without loading them whole.
class Sha256 {
 public:
  Sha256();
  void update(const void* data, size_t size);
  void update(const std::string& bytes) { update(bytes.data(), bytes.size()); }
  /// Finishes the digest and returns it as 64 lowercase hex characters.
  /// The hasher MUST NOT be updated afterwards.
  std::string finish_hex();

 private:
  void compress(const uint8_t* block);

  std::array<uint32_t, 8> state_;
  std::array<uint8_t, 64> buffer_{};
  size_t buffered_ = 0;
  uint64_t total_bytes_ = 0;
};

/// Hex digest of an in-memory buffer.
std::string sha256_hex(const std::string& bytes);
/// Hex digest of a file's contents.
/// MUST throw std::runtime_error when the file cannot be read.
std::string sha256_file_hex(const std::string& path);

}  // namespace confq
