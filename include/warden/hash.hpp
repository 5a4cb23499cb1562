#pragma once

// warden/hash.hpp — BLAKE3 hashing, keyed digests and randomness.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the sole hash primitive.
//   2. Plain digests are domain-separated by prefix ("audit:", "cfg:") so a
//      digest computed for one purpose can never be replayed as another.
//   3. Token digests use BLAKE3 keyed mode with a 32-byte signing key. Without
//      the key a holder cannot recompute a valid digest after editing a field.
//   4. Digest comparison is constant-time.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace warden {

constexpr std::size_t kSigningKeyBytes = 32;
using SigningKey = std::array<uint8_t, kSigningKeyBytes>;

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

std::string blake3_hex(std::string_view payload);
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string keyed_digest_hex(const SigningKey& key, std::string_view payload);

// Stream-hash a file with a 64 KB buffer. Returns "" if the file cannot be read.
std::string hash_file_blake3_hex(const std::string& path);

bool digest_equal(std::string_view a, std::string_view b);

// Random bytes from std::random_device, hex encoded (2 chars per byte).
std::string random_hex(std::size_t bytes);

SigningKey generate_signing_key();
bool signing_key_from_hex(const std::string& hex, SigningKey* out);

}  // namespace warden
