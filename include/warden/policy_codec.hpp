#pragma once

// warden/policy_codec.hpp — JSON wire form for policies and claims.
//
// Boolean nodes:
//   leaf       {"action":"read","resourceType":"report"}
//   condition  "isOwner"
//   composite  {"operator":"AND"|"OR","clauses":[...]}
// A boolean policy may be wrapped as {"kind":"boolean","rule":<node>}.
//
// Vector policies:
//   {"kind":"vector","dimensions":[{"name":"role","type":"categorical","map":"roles"}],
//    "position":[3,1,1],"threshold":0.99}
// A bare object carrying "position" is read as a vector policy.
//
// encode_policy() always writes "kind" and "v" (version::POLICY_SCHEMA_VERSION).
// A top-level "v" that does not match is a decode error; an absent one is
// accepted so hand-written config stays terse.
//
// Decoding is strict about shape but lenient about operators: an operator name
// this build does not know decodes to UnknownOperator so it can be persisted and
// later denied with a descriptive reason instead of failing the whole load.

#include <string>
#include <vector>

#include "warden/jsonlite.hpp"
#include "warden/resource.hpp"

namespace warden {

struct PolicyDecodeResult {
  bool ok{false};
  std::string error;
  AccessPolicy policy;
};

struct NodeDecodeResult {
  bool ok{false};
  std::string error;
  PolicyNode node;
};

struct ClaimsDecodeResult {
  bool ok{false};
  std::string error;
  std::vector<Claim> claims;
};

PolicyDecodeResult decode_policy(const std::string& json);
PolicyDecodeResult decode_policy_value(const jsonlite::Value& value);
std::string encode_policy(const AccessPolicy& policy);

NodeDecodeResult decode_node(const jsonlite::Value& value);
jsonlite::Value encode_node(const PolicyNode& node);

// [{"action":"read","resourceType":"report","conditions":"isOwner"}, ...]
ClaimsDecodeResult decode_claims(const std::string& json);
ClaimsDecodeResult decode_claims_value(const jsonlite::Value& value);
std::string encode_claim(const Claim& claim);

// {"roles":{"admin":3,"viewer":1}, ...}. Non-numeric entries are skipped.
VectorMaps decode_vector_maps(const jsonlite::Object& obj);

}  // namespace warden
