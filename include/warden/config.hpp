#pragma once

// warden/config.hpp — Broker configuration.
//
// Sources, later wins:
//   1. Built-in defaults.
//   2. JSON file named by the path argument or WARDEN_CONFIG.
//   3. Environment: WARDEN_DB_PATH, WARDEN_CACHE_TTL_MS, WARDEN_TOKEN_LIFETIME_S,
//      WARDEN_EVENT_LOG, WARDEN_SIGNING_KEY.
//
// Bootstrap pinning: when an expected digest is given (argument or
// WARDEN_CONFIG_DIGEST), the file's BLAKE3 hex digest must equal it or loading
// fails with config_invalid. A pinned config with no file is also rejected.
//
// File format:
//   {
//     "db_path": "warden.db",
//     "cache_ttl_ms": 300000,
//     "token_lifetime_s": 60,
//     "event_log": "/var/log/warden/events.jsonl",
//     "signing_key": "<64 hex chars>",
//     "owner_categories": ["reports", "users"],
//     "vector_maps": {"roles": {"admin": 3, "viewer": 1}},
//     "connections": [{"logical_name": "...", "protocol": "...", "address": "...",
//                      "credential_ref": "...", "policy": <policy JSON>}]
//   }

#include <cstdint>
#include <string>
#include <vector>

#include "warden/registry.hpp"
#include "warden/resource.hpp"
#include "warden/types.hpp"

namespace warden {

struct BrokerConfig {
  std::string db_path{"warden.db"};
  uint64_t cache_ttl_ms{5 * 60 * 1000};
  uint64_t token_lifetime_s{60};        // 1..CapabilityToken::kMaxLifetimeSeconds
  std::string event_log_path;
  std::string signing_key_hex;          // empty => ephemeral per-process key
  std::vector<std::string> owner_categories;
  VectorMaps vector_maps;
  std::vector<ResourceDefinition> connections;   // seeded by `warden register --all`
  std::string source_digest;            // BLAKE3 of the file, "" when no file
};

struct ConfigLoadResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  BrokerConfig config;
};

// Parses file content only; no environment, no pinning.
ConfigLoadResult parse_config(const std::string& json);

// path/expected_digest empty => fall back to WARDEN_CONFIG / WARDEN_CONFIG_DIGEST.
ConfigLoadResult load_config(const std::string& path = "",
                             const std::string& expected_digest = "");

Registry make_registry(const BrokerConfig& config);

}  // namespace warden
