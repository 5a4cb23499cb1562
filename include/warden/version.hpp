#pragma once

// warden/version.hpp — Version manifest for every persisted or transported format.
//
// PURPOSE:
//   Tokens cross process boundaries in encoded form, policies and audit events
//   are persisted by storage adapters. Each of those formats carries a version
//   constant from this header so a reader never silently accepts a layout it
//   was not compiled against.
//
// INVARIANT:
//   All version constants are compile-time. The token decoder rejects any
//   other "v" before reading the remaining fields. The policy decoder rejects a
//   mismatched "v" and accepts an absent one (hand-written config). Audit
//   events carry AUDIT_LOG_VERSION inside the chained JSON, so a reader built
//   against another layout fails verify_chain rather than misreading events.

#include <cstdint>
#include <string>

namespace warden {
namespace version {

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256 (keyed mode for token digests, plain mode with domain
// prefixes for audit chaining and config pinning).
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// TOKEN_FORMAT_VERSION
// Encoded capability token layout: compact JSON {v,p,a,c,o,n,e,d}.
// Changing the digest input encoding or any field name requires a bump.
// Version 2 binds the granted action ("o") into the digest.
// ---------------------------------------------------------------------------
constexpr uint32_t TOKEN_FORMAT_VERSION = 2;

// ---------------------------------------------------------------------------
// POLICY_SCHEMA_VERSION
// JSON wire form of boolean and vector policies (see policy_codec.hpp),
// written as the top-level "v" of every encoded policy.
// ---------------------------------------------------------------------------
constexpr uint32_t POLICY_SCHEMA_VERSION = 1;

// ---------------------------------------------------------------------------
// AUDIT_LOG_VERSION
// Audit event record: sequence + previous digest chain over compact JSON.
// ---------------------------------------------------------------------------
constexpr uint32_t AUDIT_LOG_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t token_format{TOKEN_FORMAT_VERSION};
  uint32_t policy_schema{POLICY_SCHEMA_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  std::string semver;          // e.g. "0.3.0" from the CMake project version
  std::string hash_primitive;  // "blake3"
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace warden
