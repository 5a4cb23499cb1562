#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "warden/audit.hpp"
#include "warden/config.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"
#include "warden/policy_codec.hpp"
#include "warden/resolver.hpp"
#include "warden/storage.hpp"
#include "warden/token.hpp"
#include "warden/version.hpp"

namespace {

std::string read_file(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

// "@path" reads the file, anything else is taken literally.
std::string inline_or_file(const std::string &arg) {
  if (!arg.empty() && arg[0] == '@')
    return read_file(arg.substr(1));
  return arg;
}

std::string flag(int argc, char **argv, const std::string &name,
                 const std::string &def = "") {
  for (int i = 2; i < argc; ++i)
    if (std::string(argv[i]) == name && i + 1 < argc)
      return argv[i + 1];
  return def;
}

bool has_flag(int argc, char **argv, const std::string &name) {
  for (int i = 2; i < argc; ++i)
    if (std::string(argv[i]) == name)
      return true;
  return false;
}

std::vector<std::string> flags(int argc, char **argv, const std::string &name) {
  std::vector<std::string> out;
  for (int i = 2; i < argc; ++i)
    if (std::string(argv[i]) == name && i + 1 < argc)
      out.push_back(argv[++i]);
  return out;
}

int print_error(const std::string &code, const std::string &detail,
                int exit_code) {
  std::cout << "{\"ok\":false,\"error\":\"" << warden::jsonlite::escape(code)
            << "\",\"detail\":\"" << warden::jsonlite::escape(detail)
            << "\"}\n";
  return exit_code;
}

bool parse_int(const std::string &s, long long *out) {
  if (s.empty())
    return false;
  char *end = nullptr;
  const long long v = std::strtoll(s.c_str(), &end, 10);
  if (!end || *end != '\0')
    return false;
  *out = v;
  return true;
}

// --lifetime S, else the configured default. False when S is out of range.
bool lifetime_flag(int argc, char **argv, uint64_t fallback, uint64_t *out) {
  const std::string raw = flag(argc, argv, "--lifetime");
  *out = fallback;
  if (raw.empty())
    return true;
  long long n = 0;
  if (!parse_int(raw, &n) || n <= 0 ||
      static_cast<uint64_t>(n) > warden::CapabilityToken::kMaxLifetimeSeconds)
    return false;
  *out = static_cast<uint64_t>(n);
  return true;
}

int lifetime_error() {
  return print_error("usage",
                     "--lifetime must be 1.." +
                         std::to_string(warden::CapabilityToken::kMaxLifetimeSeconds),
                     1);
}

// key=value. "true"/"false" become bools, full numeric parses become doubles.
bool parse_attribute(const std::string &kv, std::string *key,
                     warden::AttributeValue *value) {
  const auto eq = kv.find('=');
  if (eq == std::string::npos || eq == 0)
    return false;
  *key = kv.substr(0, eq);
  const std::string raw = kv.substr(eq + 1);
  if (raw == "true" || raw == "false") {
    *value = (raw == "true");
    return true;
  }
  char *end = nullptr;
  const double d = std::strtod(raw.c_str(), &end);
  if (!raw.empty() && end && *end == '\0') {
    *value = d;
  } else {
    *value = raw;
  }
  return true;
}

// Everything a command needs after configuration succeeded.
struct Broker {
  warden::BrokerConfig config;
  warden::Registry registry;
  std::unique_ptr<warden::SqliteStorage> storage;
  std::unique_ptr<warden::EventLog> ops;
  std::unique_ptr<warden::AuditLogger> audit;
  std::unique_ptr<warden::Resolver> resolver;
  bool ephemeral_key{false};
};

// Returns 0 on success, otherwise the exit code after printing the error.
int open_broker(int argc, char **argv, Broker *b) {
  const auto loaded = warden::load_config(flag(argc, argv, "--config"),
                                          flag(argc, argv, "--config-digest"));
  if (!loaded.ok)
    return print_error(warden::to_string(loaded.error), loaded.detail, 2);
  b->config = loaded.config;
  const std::string db = flag(argc, argv, "--db");
  if (!db.empty())
    b->config.db_path = db;

  b->registry = warden::make_registry(b->config);
  b->ops = std::make_unique<warden::EventLog>(b->config.event_log_path);
  b->storage = std::make_unique<warden::SqliteStorage>(b->config.db_path);
  const auto st = b->storage->init();
  if (!st.ok)
    return print_error("storage_unavailable", st.error, 2);
  b->audit = std::make_unique<warden::AuditLogger>(*b->storage, b->ops.get());

  warden::ResolverOptions opts;
  opts.cache_ttl_ms = b->config.cache_ttl_ms;
  if (!b->config.signing_key_hex.empty()) {
    warden::SigningKey key{};
    if (!warden::signing_key_from_hex(b->config.signing_key_hex, &key))
      return print_error("config_invalid", "signing key must be 64 hex characters", 2);
    opts.signing_key = std::make_shared<const warden::SigningKey>(key);
  } else {
    b->ephemeral_key = true;
  }
  b->resolver = std::make_unique<warden::Resolver>(
      *b->storage, *b->audit, b->registry, *b->ops, std::move(opts));
  return 0;
}

void usage() {
  std::cerr
      << "usage: warden <command> [flags]\n"
         "  health\n"
         "  version\n"
         "  digest   --in <file>\n"
         "  register --name <logical> --protocol <p> --address <a> "
         "[--credential <ref>] --policy <json|@file>\n"
         "  register --all                  (connections from --config)\n"
         "  resolve  --name <logical> --caller <id> --claims <json|@file>\n"
         "           [--hour H] [--weekday W] [--on-call] [--attr k=v]...\n"
         "           [--timeout-ms T] [--sign] [--lifetime S]\n"
         "  sign     --protocol <p> --address <a> [--credential <ref>] "
         "[--action <a>] [--lifetime S]\n"
         "  redeem   --token <json|@file> --action <a> --caller <id>\n"
         "  audit    [--limit N] [--verify]\n"
         "common: --config <file> --config-digest <hex> --db <path>\n";
}

} // namespace

int main(int argc, char **argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0)
      continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty() || cmd == "help") {
    usage();
    return cmd.empty() ? 1 : 0;
  }

  if (cmd == "health") {
    const auto h = warden::hash_runtime_info();
    const bool vectors_ok =
        warden::blake3_hex("") ==
        "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262";
    std::cout << "{\"ok\":" << (vectors_ok ? "true" : "false")
              << ",\"hash_primitive\":\"" << h.primitive
              << "\",\"hash_version\":\"" << h.version
              << "\",\"hash_vectors\":" << (vectors_ok ? "true" : "false")
              << "}\n";
    return vectors_ok ? 0 : 2;
  }

  if (cmd == "version") {
    std::cout << warden::version::manifest_to_json(
                     warden::version::current_manifest())
              << "\n";
    return 0;
  }

  if (cmd == "digest") {
    const std::string in = flag(argc, argv, "--in");
    const std::string digest = warden::hash_file_blake3_hex(in);
    if (digest.empty())
      return print_error("not_found", "cannot read " + in, 1);
    std::cout << "{\"ok\":true,\"path\":\"" << warden::jsonlite::escape(in)
              << "\",\"blake3\":\"" << digest << "\"}\n";
    return 0;
  }

  Broker broker;
  if (const int rc = open_broker(argc, argv, &broker); rc != 0)
    return rc;

  if (cmd == "register") {
    std::vector<warden::ResourceDefinition> defs;
    if (has_flag(argc, argv, "--all")) {
      defs = broker.config.connections;
    } else {
      warden::ResourceDefinition def;
      def.logical_name = flag(argc, argv, "--name");
      def.connection.protocol = flag(argc, argv, "--protocol");
      def.connection.address = flag(argc, argv, "--address");
      def.connection.credential_ref = flag(argc, argv, "--credential");
      if (def.logical_name.empty() || def.connection.protocol.empty())
        return print_error("usage", "--name and --protocol are required", 1);
      auto decoded =
          warden::decode_policy(inline_or_file(flag(argc, argv, "--policy")));
      if (!decoded.ok)
        return print_error("malformed_policy", decoded.error, 1);
      def.policy = std::move(decoded.policy);
      defs.push_back(std::move(def));
    }

    std::string registered;
    for (const auto &def : defs) {
      const auto st = broker.resolver->register_connection(def);
      if (!st.ok)
        return print_error("storage_unavailable",
                           def.logical_name + ": " + st.error, 2);
      if (!registered.empty())
        registered += ",";
      registered += "{\"logical_name\":\"" +
                    warden::jsonlite::escape(def.logical_name) +
                    "\",\"policy_kind\":\"" +
                    warden::policy_kind(def.policy) + "\"}";
    }
    std::cout << "{\"ok\":true,\"registered\":[" << registered << "]}\n";
    return 0;
  }

  if (cmd == "resolve") {
    warden::SecurityContext ctx;
    ctx.caller_id = flag(argc, argv, "--caller");
    const std::string claims_arg = flag(argc, argv, "--claims", "[]");
    auto claims = warden::decode_claims(inline_or_file(claims_arg));
    if (!claims.ok)
      return print_error("malformed_policy", claims.error, 1);
    ctx.claims = std::move(claims.claims);

    long long n = 0;
    if (parse_int(flag(argc, argv, "--hour"), &n))
      ctx.ambient.hour = static_cast<int>(n);
    if (parse_int(flag(argc, argv, "--weekday"), &n))
      ctx.ambient.weekday = static_cast<int>(n);
    ctx.ambient.on_call = has_flag(argc, argv, "--on-call");
    for (const auto &kv : flags(argc, argv, "--attr")) {
      std::string key;
      warden::AttributeValue value;
      if (!parse_attribute(kv, &key, &value))
        return print_error("usage", "--attr expects key=value: " + kv, 1);
      ctx.ambient.custom[key] = value;
    }

    warden::ResolveOptions opts;
    if (parse_int(flag(argc, argv, "--timeout-ms"), &n) && n > 0)
      opts.deadline = warden::deadline_after(std::chrono::milliseconds(n));

    const auto result =
        broker.resolver->resolve(flag(argc, argv, "--name"), ctx, opts);
    if (!result.ok || !has_flag(argc, argv, "--sign")) {
      std::cout << result.to_json() << "\n";
      return result.ok ? 0 : 2;
    }

    uint64_t lifetime = 0;
    if (!lifetime_flag(argc, argv, broker.config.token_lifetime_s, &lifetime))
      return lifetime_error();
    const auto token =
        broker.resolver->sign(*result.descriptor, result.granted_action, lifetime);
    std::cout << "{\"resolution\":" << result.to_json()
              << ",\"token\":" << token.encode()
              << ",\"ephemeral_key\":"
              << (broker.ephemeral_key ? "true" : "false") << "}\n";
    return 0;
  }

  if (cmd == "sign") {
    warden::ConnectionDescriptor d;
    d.protocol = flag(argc, argv, "--protocol");
    d.address = flag(argc, argv, "--address");
    d.credential_ref = flag(argc, argv, "--credential");
    if (d.protocol.empty() || d.address.empty())
      return print_error("usage", "--protocol and --address are required", 1);
    std::string action = flag(argc, argv, "--action");
    if (action.empty())
      action = warden::kDefaultGrantedAction;
    if (!warden::make_capability(action, d))
      return print_error("usage", "unsupported --action '" + action + "'", 1);
    uint64_t lifetime = 0;
    if (!lifetime_flag(argc, argv, broker.config.token_lifetime_s, &lifetime))
      return lifetime_error();
    std::cout << broker.resolver->sign(d, action, lifetime).encode() << "\n";
    return 0;
  }

  if (cmd == "redeem") {
    if (broker.ephemeral_key)
      return print_error("config_invalid",
                         "redeem needs a persistent signing key "
                         "(WARDEN_SIGNING_KEY or signing_key in --config)",
                         2);
    auto decoded = broker.resolver->decode_token(
        inline_or_file(flag(argc, argv, "--token")));
    if (!decoded.ok)
      return print_error(warden::to_string(
                             warden::ErrorCode::token_integrity_failed),
                         decoded.error, 2);
    const auto r = broker.resolver->redeem(*decoded.token,
                                           flag(argc, argv, "--action"),
                                           flag(argc, argv, "--caller"));
    if (!r.ok)
      return print_error(warden::to_string(r.error), r.reason, 2);
    std::cout << "{\"ok\":true,\"capability\":\""
              << warden::capability_action(*r.capability)
              << "\",\"target\":"
              << warden::physical_resource_json(
                     warden::capability_target(*r.capability))
              << "}\n";
    return 0;
  }

  if (cmd == "audit") {
    long long n = 0;
    std::size_t limit = 50;
    if (parse_int(flag(argc, argv, "--limit"), &n) && n >= 0)
      limit = static_cast<std::size_t>(n);
    const bool verify = has_flag(argc, argv, "--verify");

    // Newest first from storage; the chain is checked oldest first.
    auto events = broker.storage->read_audit_log(verify ? 0 : limit);
    std::cout << "{\"ok\":true";
    if (verify) {
      std::reverse(events.begin(), events.end());
      const std::size_t broken = warden::verify_chain(events);
      std::cout << ",\"chain_intact\":"
                << (broken == events.size() ? "true" : "false")
                << ",\"checked\":" << events.size();
      if (broken != events.size())
        std::cout << ",\"first_broken_index\":" << broken;
      std::cout << "}\n";
      return broken == events.size() ? 0 : 2;
    }
    std::cout << ",\"events\":[";
    for (std::size_t i = 0; i < events.size(); ++i) {
      if (i > 0)
        std::cout << ",";
      std::cout << warden::audit_event_to_json(events[i]);
    }
    std::cout << "]}\n";
    return 0;
  }

  usage();
  return 1;
}
