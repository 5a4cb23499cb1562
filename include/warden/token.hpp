#pragma once

// warden/token.hpp — Short-lived, tamper-evident capability tokens.
//
// DESIGN:
//   A CapabilityToken binds a connection descriptor, the action the resolver
//   granted, a random nonce and an expiry instant under a BLAKE3 keyed digest.
//   The signing key is held by the resolver that issued the token; holders
//   cannot recompute a valid digest after editing any field.
//
//   Digest input is the canonical (key-sorted) JSON of
//     {action, address, credential_ref, expires, nonce, protocol}.
//   jsonlite::escape() gives every byte its own rendering, so distinct field
//   values never share a digest input.
//
// INVARIANTS:
//   - validate() checks integrity before expiry: a tampered and expired token
//     reports integrity_check_failed, not pointer_expired.
//   - Expired means now > expires_at. A token is still valid at exactly its
//     expiry instant.
//   - Lifetimes are clamped to kMaxLifetimeSeconds and the expiry saturates,
//     so no lifetime wraps around to an earlier instant.
//   - descriptor() returns a copy. Nothing a holder does to it affects the token.
//   - Tokens carry no shared mutable state and are safe to read from any thread.
//   - Never throws.
//
// Replay protection is not a token property: the issuing Resolver records
// redeemed nonces and rejects a second redemption within the token lifetime.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "warden/hash.hpp"
#include "warden/types.hpp"

namespace warden {

struct ValidationResult {
  bool valid{false};
  ErrorCode error{ErrorCode::none};
  std::string reason;
};

struct TokenDecodeResult;

class CapabilityToken {
 public:
  static constexpr uint64_t kDefaultLifetimeSeconds = 60;
  static constexpr uint64_t kMaxLifetimeSeconds = 24 * 60 * 60;

  static CapabilityToken issue(const ConnectionDescriptor& descriptor,
                               std::string action,
                               std::shared_ptr<const SigningKey> key,
                               Clock clock = wall_clock(),
                               uint64_t lifetime_seconds = kDefaultLifetimeSeconds);

  // Integrity against the embedded key, then expiry against the embedded clock.
  ValidationResult validate() const;

  // Same checks against an explicit key and instant.
  ValidationResult verify(const SigningKey& key, uint64_t now_unix_ms) const;

  ConnectionDescriptor descriptor() const { return descriptor_; }
  // The only action this token can be redeemed for.
  const std::string& action() const { return action_; }
  const std::string& nonce() const { return nonce_; }
  uint64_t expires_at_unix_ms() const { return expires_at_unix_ms_; }
  const std::string& digest() const { return digest_; }

  // Compact JSON transport form: {"a","c","d","e","n","o","p","v"}.
  std::string encode() const;

  // Parses the transport form and binds it to the verifying key and clock.
  // Does not validate; call validate() on the result.
  static TokenDecodeResult decode(const std::string& wire,
                                  std::shared_ptr<const SigningKey> key,
                                  Clock clock = wall_clock());

 private:
  CapabilityToken() = default;

  static std::string compute_digest(const SigningKey& key,
                                    const ConnectionDescriptor& descriptor,
                                    const std::string& action,
                                    const std::string& nonce,
                                    uint64_t expires_at_unix_ms);

  ConnectionDescriptor descriptor_;
  std::string action_;
  std::string nonce_;
  uint64_t expires_at_unix_ms_{0};
  std::string digest_;
  std::shared_ptr<const SigningKey> key_;
  Clock clock_;
};

struct TokenDecodeResult {
  bool ok{false};
  std::string error;
  std::optional<CapabilityToken> token;
};

// ---------------------------------------------------------------------------
// Typed capabilities handed to the downstream dispatcher
// ---------------------------------------------------------------------------
struct ReadCapability   { ConnectionDescriptor target; };
struct WriteCapability  { ConnectionDescriptor target; };
struct DeleteCapability { ConnectionDescriptor target; };
struct SearchCapability { ConnectionDescriptor target; };

using Capability = std::variant<ReadCapability, WriteCapability, DeleteCapability, SearchCapability>;

// Granted when a policy names no action.
inline constexpr const char* kDefaultGrantedAction = "read";
// Ambient attribute a vector policy may declare as a dimension to grant more.
inline constexpr const char* kActionAttribute = "action";

// "read" | "write" | "delete" | "search"; nullopt for anything else.
std::optional<Capability> make_capability(const std::string& action,
                                          const ConnectionDescriptor& descriptor);

std::string capability_action(const Capability& capability);
const ConnectionDescriptor& capability_target(const Capability& capability);

}  // namespace warden
