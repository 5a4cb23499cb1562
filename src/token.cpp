#include "warden/token.hpp"
#include "warden/jsonlite.hpp"
#include "warden/version.hpp"

#include <limits>
#include <utility>

namespace warden {

namespace {

constexpr uint64_t kWireVersion = version::TOKEN_FORMAT_VERSION;

}  // namespace

std::string CapabilityToken::compute_digest(const SigningKey& key,
                                            const ConnectionDescriptor& descriptor,
                                            const std::string& action,
                                            const std::string& nonce,
                                            uint64_t expires_at_unix_ms) {
  jsonlite::Object o;
  o["action"]         = jsonlite::Value{action};
  o["protocol"]       = jsonlite::Value{descriptor.protocol};
  o["address"]        = jsonlite::Value{descriptor.address};
  o["credential_ref"] = jsonlite::Value{descriptor.credential_ref};
  o["nonce"]          = jsonlite::Value{nonce};
  o["expires"]        = jsonlite::Value{expires_at_unix_ms};
  return keyed_digest_hex(key, jsonlite::to_json(jsonlite::Value{std::move(o)}));
}

CapabilityToken CapabilityToken::issue(const ConnectionDescriptor& descriptor,
                                       std::string action,
                                       std::shared_ptr<const SigningKey> key,
                                       Clock clock,
                                       uint64_t lifetime_seconds) {
  if (lifetime_seconds > kMaxLifetimeSeconds) lifetime_seconds = kMaxLifetimeSeconds;
  const uint64_t now      = clock();
  const uint64_t lifetime = lifetime_seconds * 1000;
  const uint64_t ceiling  = std::numeric_limits<uint64_t>::max();

  CapabilityToken t;
  t.descriptor_         = descriptor;
  t.action_             = std::move(action);
  t.nonce_              = random_hex(16);
  t.expires_at_unix_ms_ = (now > ceiling - lifetime) ? ceiling : now + lifetime;
  t.digest_ = compute_digest(*key, t.descriptor_, t.action_, t.nonce_, t.expires_at_unix_ms_);
  t.key_                = std::move(key);
  t.clock_              = std::move(clock);
  return t;
}

ValidationResult CapabilityToken::validate() const {
  if (!key_ || !clock_) {
    return ValidationResult{false, ErrorCode::token_integrity_failed,
                            "Pointer integrity check failed. Token has no verifying key."};
  }
  return verify(*key_, clock_());
}

ValidationResult CapabilityToken::verify(const SigningKey& key, uint64_t now_unix_ms) const {
  const std::string expected =
      compute_digest(key, descriptor_, action_, nonce_, expires_at_unix_ms_);
  if (!digest_equal(expected, digest_)) {
    return ValidationResult{false, ErrorCode::token_integrity_failed,
                            "Pointer integrity check failed. Possible tampering detected."};
  }
  if (now_unix_ms > expires_at_unix_ms_) {
    return ValidationResult{false, ErrorCode::token_expired, "Pointer has expired."};
  }
  return ValidationResult{true, ErrorCode::none, ""};
}

std::string CapabilityToken::encode() const {
  jsonlite::Object o;
  o["v"] = jsonlite::Value{kWireVersion};
  o["p"] = jsonlite::Value{descriptor_.protocol};
  o["a"] = jsonlite::Value{descriptor_.address};
  o["c"] = jsonlite::Value{descriptor_.credential_ref};
  o["o"] = jsonlite::Value{action_};
  o["n"] = jsonlite::Value{nonce_};
  o["e"] = jsonlite::Value{expires_at_unix_ms_};
  o["d"] = jsonlite::Value{digest_};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

TokenDecodeResult CapabilityToken::decode(const std::string& wire,
                                          std::shared_ptr<const SigningKey> key,
                                          Clock clock) {
  TokenDecodeResult r;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(wire, &err);
  if (err) {
    r.error = err->code + ": " + err->message;
    return r;
  }

  const auto expires = o.find("e");
  if (jsonlite::get_u64(o, "v") != kWireVersion) {
    r.error = "unsupported token version";
    return r;
  }
  if (expires == o.end() || !std::holds_alternative<uint64_t>(expires->second.v)) {
    r.error = "token expiry missing or not an integer";
    return r;
  }
  for (const char* field : {"p", "a", "c", "o", "n", "d"}) {
    const auto it = o.find(field);
    if (it == o.end() || !std::holds_alternative<std::string>(it->second.v)) {
      r.error = std::string("token field '") + field + "' missing or not a string";
      return r;
    }
  }
  if (!key) {
    r.error = "no verifying key";
    return r;
  }

  CapabilityToken t;
  t.descriptor_.protocol       = jsonlite::get_string(o, "p");
  t.descriptor_.address        = jsonlite::get_string(o, "a");
  t.descriptor_.credential_ref = jsonlite::get_string(o, "c");
  t.action_                    = jsonlite::get_string(o, "o");
  t.nonce_                     = jsonlite::get_string(o, "n");
  t.expires_at_unix_ms_        = std::get<uint64_t>(expires->second.v);
  t.digest_                    = jsonlite::get_string(o, "d");
  t.key_                       = std::move(key);
  t.clock_                     = std::move(clock);

  r.ok    = true;
  r.token = std::move(t);
  return r;
}

// ---------------------------------------------------------------------------
// Capabilities
// ---------------------------------------------------------------------------

std::optional<Capability> make_capability(const std::string& action,
                                          const ConnectionDescriptor& descriptor) {
  if (action == "read") return Capability{ReadCapability{descriptor}};
  if (action == "write") return Capability{WriteCapability{descriptor}};
  if (action == "delete") return Capability{DeleteCapability{descriptor}};
  if (action == "search") return Capability{SearchCapability{descriptor}};
  return std::nullopt;
}

std::string capability_action(const Capability& capability) {
  switch (capability.index()) {
    case 0: return "read";
    case 1: return "write";
    case 2: return "delete";
    case 3: return "search";
  }
  return "";
}

const ConnectionDescriptor& capability_target(const Capability& capability) {
  return std::visit([](const auto& c) -> const ConnectionDescriptor& { return c.target; },
                    capability);
}

}  // namespace warden
