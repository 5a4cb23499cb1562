#include "warden/hash.hpp"

#include <fstream>
#include <random>

extern "C" {
#include <blake3.h>
}

namespace warden {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

// Returns 0xFF on invalid character.
inline uint8_t hex_nibble(char c) {
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
  return 0xFF;
}

std::string finalize_hex(blake3_hasher& hasher) {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version   = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string keyed_digest_hex(const SigningKey& key, std::string_view payload) {
  static_assert(kSigningKeyBytes == BLAKE3_KEY_LEN, "signing key must match BLAKE3 key size");
  blake3_hasher hasher;
  blake3_hasher_init_keyed(&hasher, key.data());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_file_blake3_hex(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return {};
  }

  blake3_hasher hasher;
  blake3_hasher_init(&hasher);

  constexpr std::size_t buffer_size = 65536;
  std::array<char, buffer_size> buffer{};
  while (file.good()) {
    file.read(buffer.data(), buffer_size);
    std::streamsize count = file.gcount();
    if (count > 0) {
      blake3_hasher_update(&hasher, buffer.data(), static_cast<size_t>(count));
    }
  }
  return finalize_hex(hasher);
}

bool digest_equal(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  unsigned char diff = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<unsigned char>(a[i] ^ b[i]);
  }
  return diff == 0;
}

std::string random_hex(std::size_t bytes) {
  std::random_device rd;
  std::string raw(bytes, '\0');
  for (std::size_t i = 0; i < bytes; i += 4) {
    const uint32_t word = rd();
    for (std::size_t j = 0; j < 4 && i + j < bytes; ++j) {
      raw[i + j] = static_cast<char>((word >> (8 * j)) & 0xff);
    }
  }
  return to_hex(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
}

SigningKey generate_signing_key() {
  SigningKey key{};
  std::random_device rd;
  for (std::size_t i = 0; i < key.size(); i += 4) {
    const uint32_t word = rd();
    for (std::size_t j = 0; j < 4; ++j) {
      key[i + j] = static_cast<uint8_t>((word >> (8 * j)) & 0xff);
    }
  }
  return key;
}

bool signing_key_from_hex(const std::string& hex, SigningKey* out) {
  if (!out || hex.size() != kSigningKeyBytes * 2) return false;
  SigningKey key{};
  for (std::size_t i = 0; i < kSigningKeyBytes; ++i) {
    const uint8_t hi = hex_nibble(hex[i * 2]);
    const uint8_t lo = hex_nibble(hex[i * 2 + 1]);
    if (hi == 0xFF || lo == 0xFF) return false;
    key[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  *out = key;
  return true;
}

}  // namespace warden
