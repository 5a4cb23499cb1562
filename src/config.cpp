#include "warden/config.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/policy_codec.hpp"
#include "warden/token.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <stdexcept>
#include <utility>

namespace warden {

namespace {

ConfigLoadResult invalid(std::string detail) {
  ConfigLoadResult r;
  r.error  = ErrorCode::config_invalid;
  r.detail = std::move(detail);
  return r;
}

std::string env_or_empty(const char* name) {
  const char* v = std::getenv(name);
  return (v && v[0]) ? std::string(v) : std::string();
}

bool parse_u64(const std::string& text, uint64_t* out) {
  if (text.empty() || text[0] == '-') return false;
  try {
    std::size_t used = 0;
    const unsigned long long v = std::stoull(text, &used, 10);
    if (used != text.size()) return false;
    *out = static_cast<uint64_t>(v);
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

bool read_file(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  *out = ss.str();
  return true;
}

}  // namespace

ConfigLoadResult parse_config(const std::string& json) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(json, &err);
  if (err) return invalid("config: " + err->code + ": " + err->message);

  ConfigLoadResult r;
  BrokerConfig& c = r.config;
  c.db_path          = jsonlite::get_string(o, "db_path", c.db_path);
  c.cache_ttl_ms     = jsonlite::get_u64(o, "cache_ttl_ms", c.cache_ttl_ms);
  c.token_lifetime_s = jsonlite::get_u64(o, "token_lifetime_s", c.token_lifetime_s);
  c.event_log_path   = jsonlite::get_string(o, "event_log");
  c.signing_key_hex  = jsonlite::get_string(o, "signing_key");
  c.owner_categories = jsonlite::get_string_array(o, "owner_categories");
  if (const auto* maps = jsonlite::get_object(o, "vector_maps")) {
    c.vector_maps = decode_vector_maps(*maps);
  }

  if (const auto* conns = jsonlite::get_array(o, "connections")) {
    for (const auto& item : *conns) {
      const auto* co = std::get_if<jsonlite::Object>(&item.v);
      if (!co) return invalid("config: connection entry must be an object");

      ResourceDefinition def;
      def.logical_name              = jsonlite::get_string(*co, "logical_name");
      def.connection.protocol       = jsonlite::get_string(*co, "protocol");
      def.connection.address        = jsonlite::get_string(*co, "address");
      def.connection.credential_ref = jsonlite::get_string(*co, "credential_ref");
      if (def.logical_name.empty() || def.connection.protocol.empty()) {
        return invalid("config: connection requires logical_name and protocol");
      }

      const auto policy = co->find("policy");
      if (policy == co->end()) {
        return invalid("config: connection '" + def.logical_name + "' has no policy");
      }
      auto decoded = decode_policy_value(policy->second);
      if (!decoded.ok) {
        return invalid("config: connection '" + def.logical_name + "': " + decoded.error);
      }
      def.policy = std::move(decoded.policy);
      c.connections.push_back(std::move(def));
    }
  }

  r.ok = true;
  return r;
}

ConfigLoadResult load_config(const std::string& path, const std::string& expected_digest) {
  const std::string file   = path.empty() ? env_or_empty("WARDEN_CONFIG") : path;
  const std::string pinned = expected_digest.empty() ? env_or_empty("WARDEN_CONFIG_DIGEST")
                                                     : expected_digest;

  ConfigLoadResult r;
  r.ok = true;

  if (!file.empty()) {
    std::string content;
    if (!read_file(file, &content)) return invalid("config: cannot read " + file);

    const std::string digest = blake3_hex(content);
    if (!pinned.empty() && !digest_equal(digest, pinned)) {
      return invalid("config: digest mismatch for " + file +
                     ". The file may have been tampered with.");
    }
    r = parse_config(content);
    if (!r.ok) return r;
    r.config.source_digest = digest;
  } else if (!pinned.empty()) {
    return invalid("config: digest pinned but no config file given");
  }

  BrokerConfig& c = r.config;
  if (auto v = env_or_empty("WARDEN_DB_PATH"); !v.empty()) c.db_path = v;
  if (auto v = env_or_empty("WARDEN_EVENT_LOG"); !v.empty()) c.event_log_path = v;
  if (auto v = env_or_empty("WARDEN_SIGNING_KEY"); !v.empty()) c.signing_key_hex = v;
  if (auto v = env_or_empty("WARDEN_CACHE_TTL_MS"); !v.empty()) {
    if (!parse_u64(v, &c.cache_ttl_ms)) return invalid("WARDEN_CACHE_TTL_MS is not an integer");
  }
  if (auto v = env_or_empty("WARDEN_TOKEN_LIFETIME_S"); !v.empty()) {
    if (!parse_u64(v, &c.token_lifetime_s)) {
      return invalid("WARDEN_TOKEN_LIFETIME_S is not an integer");
    }
  }

  if (!c.signing_key_hex.empty()) {
    SigningKey key{};
    if (!signing_key_from_hex(c.signing_key_hex, &key)) {
      return invalid("signing key must be 64 hex characters");
    }
  }
  if (c.token_lifetime_s == 0) return invalid("token lifetime must be positive");
  if (c.token_lifetime_s > CapabilityToken::kMaxLifetimeSeconds) {
    return invalid("token lifetime exceeds " +
                   std::to_string(CapabilityToken::kMaxLifetimeSeconds) + " seconds");
  }
  return r;
}

Registry make_registry(const BrokerConfig& config) {
  Registry reg;
  reg.owner_categories = config.owner_categories;
  reg.vector_maps      = config.vector_maps;
  return reg;
}

}  // namespace warden
