#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <sqlite3.h>

#include "warden/audit.hpp"
#include "warden/cache.hpp"
#include "warden/config.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"
#include "warden/policy.hpp"
#include "warden/policy_codec.hpp"
#include "warden/resolver.hpp"
#include "warden/storage.hpp"
#include "warden/token.hpp"
#include "warden/vector_policy.hpp"
#include "warden/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// Tue 2023-11-14 22:13:20 UTC. Tests that depend on the time of day pass hour
// and weekday explicitly.
constexpr uint64_t kT0 = 1700000000000ULL;

// ----------------------------------------------------------------------------
// Fixtures
// ----------------------------------------------------------------------------

warden::ResolverOptions make_options(warden::Clock clock, uint64_t ttl_ms) {
  warden::ResolverOptions o;
  o.cache_ttl_ms = ttl_ms;
  o.clock = std::move(clock);
  return o;
}

// A resolver over in-memory storage (or a supplied backend) with a manual clock
// and the operational log captured in memory.
struct TestBroker {
  std::shared_ptr<std::atomic<uint64_t>> now;
  warden::Clock clock;
  warden::MemoryStorage memory;
  warden::IStorageAdapter& storage;
  warden::EventLog ops;
  mutable std::mutex ops_mu;
  std::vector<std::string> ops_lines;
  warden::AuditLogger audit;
  warden::Registry registry;
  warden::Resolver resolver;

  explicit TestBroker(warden::Registry reg = {},
                      warden::IStorageAdapter* backend = nullptr,
                      uint64_t ttl_ms = warden::DefinitionCache::kDefaultTtlMs)
      : now(std::make_shared<std::atomic<uint64_t>>(kT0)),
        clock([n = now] { return n->load(); }),
        storage(backend ? *backend : static_cast<warden::IStorageAdapter&>(memory)),
        audit(storage, &ops, clock),
        registry(std::move(reg)),
        resolver(storage, audit, registry, ops, make_options(clock, ttl_ms)) {
    ops.set_hook([this](const std::string& line) {
      std::lock_guard<std::mutex> lk(ops_mu);
      ops_lines.push_back(line);
    });
  }

  void advance_ms(uint64_t ms) { now->fetch_add(ms); }

  bool ops_logged(const std::string& kind) const {
    std::lock_guard<std::mutex> lk(ops_mu);
    for (const auto& line : ops_lines)
      if (contains(line, "\"kind\":\"" + kind + "\"")) return true;
    return false;
  }
};

warden::Registry reports_registry() {
  warden::Registry reg;
  reg.owner_categories = {"reports"};
  return reg;
}

warden::ResourceDefinition owner_report_definition() {
  warden::ResourceDefinition def;
  def.logical_name = "reports/acct-42";
  def.connection.protocol = "file";
  def.connection.address = "file:///data/reports/{ownerId}.csv";
  def.connection.credential_ref = "enc:v1:SECRET-CRED";
  def.policy = warden::BooleanPolicy{warden::all_of(
      {warden::require("read", "report"), warden::condition("isOwner")})};
  return def;
}

warden::SecurityContext caller(const std::string& id,
                               std::vector<warden::Claim> claims) {
  warden::SecurityContext ctx;
  ctx.caller_id = id;
  ctx.claims = std::move(claims);
  ctx.ambient.hour = 10;
  ctx.ambient.weekday = 2;
  return ctx;
}

warden::Claim claim(const std::string& action, const std::string& resource_type) {
  warden::Claim c;
  c.action = action;
  c.resource_type = resource_type;
  return c;
}

warden::EvaluationContext eval_context(const std::string& caller_id,
                                       const std::string& owner_id) {
  warden::EvaluationContext ctx;
  ctx.caller_id = caller_id;
  ctx.owner_id = owner_id;
  ctx.hour = 10;
  ctx.weekday = 2;
  return ctx;
}

// Storage whose reads always fail. Audit events are kept.
class UnreachableStorage : public warden::IStorageAdapter {
 public:
  warden::StorageStatus init() override { return {true, ""}; }
  warden::StorageStatus register_connection(const warden::ResourceDefinition&,
                                            warden::Deadline) override {
    return {false, "connection refused"};
  }
  warden::LookupResult get_connection(const std::string&, warden::Deadline) override {
    warden::LookupResult r;
    r.error = "connection refused";
    return r;
  }
  warden::StorageStatus log_event(const warden::AuditEvent& e, warden::Deadline) override {
    std::lock_guard<std::mutex> lk(mu);
    events.push_back(e);
    return {true, ""};
  }
  void close() override {}
  std::string backend_id() const override { return "unreachable"; }

  std::mutex mu;
  std::vector<warden::AuditEvent> events;
};

// Definitions work, audit appends fail.
class AuditRejectingStorage : public warden::MemoryStorage {
 public:
  warden::StorageStatus log_event(const warden::AuditEvent&, warden::Deadline) override {
    return {false, "disk full"};
  }
};

// Counts fetches and holds each one for a while so concurrent lookups overlap.
class SlowCountingStorage : public warden::MemoryStorage {
 public:
  warden::LookupResult get_connection(const std::string& name, warden::Deadline d) override {
    fetches.fetch_add(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    return warden::MemoryStorage::get_connection(name, d);
  }
  std::atomic<int> fetches{0};
};

// ============================================================================
// Boolean policy evaluation
// ============================================================================

void test_claim_field_matching() {
  bool malformed = false;
  expect(warden::claim_field_matches("report", "report", &malformed), "literal match");
  expect(!warden::claim_field_matches("report", "ledger", &malformed), "literal mismatch");
  expect(warden::claim_field_matches("*", "anything", &malformed), "wildcard matches");
  expect(warden::claim_field_matches("regex:rep.*", "report", &malformed), "regex full match");
  expect(!warden::claim_field_matches("regex:rep", "report", &malformed),
         "regex must match the whole value");
  expect(!malformed, "valid patterns are not malformed");

  expect(!warden::claim_field_matches("regex:[", "report", &malformed),
         "malformed regex never matches");
  expect(malformed, "malformed regex is flagged");
}

void test_check_permission_first_satisfied_claim() {
  warden::Claim gated = claim("read", "report");
  gated.condition = warden::condition("isOnCall");
  const warden::Claim plain = claim("*", "regex:rep.*");

  const auto ctx = eval_context("u1", "");
  const auto r = warden::check_permission({"read", "report"}, {gated, plain}, ctx);
  expect(r.met, "second claim satisfies");
  expect(r.claim && r.claim->action == "*", "claim with failed condition is skipped");

  const auto denied = warden::check_permission({"delete", "ledger"}, {gated, plain}, ctx);
  expect(!denied.met, "no claim matches delete/ledger");
  expect(denied.reason ==
             "No claim satisfied requirement: {\"action\":\"delete\",\"resourceType\":\"ledger\"}",
         "denial names the requirement: " + denied.reason);
}

void test_and_reason_names_failed_clause() {
  const auto policy =
      warden::all_of({warden::require("read", "X"), warden::condition("isOwner")});
  const auto r = warden::evaluate_conditions(policy, eval_context("acct-99", "acct-42"),
                                             {claim("read", "X")});
  expect(!r.met, "non-owner denied");
  expect(!r.malformed, "ordinary denial is not malformed");
  expect(r.reason == "AND clause failed: Condition 'isOwner' failed", "reason: " + r.reason);
  expect(!contains(r.reason, "No claim satisfied"), "satisfied clause is not blamed");
}

void test_or_lists_every_reason() {
  const auto policy =
      warden::any_of({warden::require("write", "report"), warden::condition("isOnCall")});
  const auto r = warden::evaluate_conditions(policy, eval_context("u1", ""),
                                             {claim("read", "report")});
  expect(!r.met, "both branches fail");
  expect(r.reason ==
             "OR block failed: [No claim satisfied requirement: "
             "{\"action\":\"write\",\"resourceType\":\"report\"}, "
             "Condition 'isOnCall' failed]",
         "reason: " + r.reason);

  auto on_call = eval_context("u1", "");
  on_call.on_call = true;
  const auto ok = warden::evaluate_conditions(policy, on_call, {claim("read", "report")});
  expect(ok.met, "second branch satisfies OR");
}

void test_unknown_tags_fail_closed() {
  const auto ctx = eval_context("u1", "u1");
  const auto cond = warden::evaluate_conditions(warden::condition("isFullMoon"), ctx, {});
  expect(!cond.met && cond.malformed, "unknown condition denies as malformed");
  expect(cond.reason == "Unknown condition 'isFullMoon'", "reason: " + cond.reason);

  const warden::PolicyNode op{warden::UnknownOperator{"XOR"}};
  const auto r = warden::evaluate_conditions(op, ctx, {});
  expect(!r.met && r.malformed, "unknown operator denies as malformed");
  expect(r.reason == "Unknown operator 'XOR'", "reason: " + r.reason);

  const auto empty_and = warden::evaluate_conditions(warden::all_of({}), ctx, {});
  expect(!empty_and.met && empty_and.malformed, "empty AND is malformed, not vacuous");
  const auto empty_or = warden::evaluate_conditions(warden::any_of({}), ctx, {});
  expect(!empty_or.met && empty_or.malformed, "empty OR is malformed");
}

void test_business_hours() {
  const auto node = warden::condition("isBusinessHours");
  auto ctx = eval_context("u1", "");

  ctx.weekday = 1; ctx.hour = 9;
  expect(warden::evaluate_conditions(node, ctx, {}).met, "Monday 09:00 is business hours");
  ctx.hour = 16;
  expect(warden::evaluate_conditions(node, ctx, {}).met, "16:xx is business hours");
  ctx.hour = 17;
  expect(!warden::evaluate_conditions(node, ctx, {}).met, "17:00 is after hours");
  ctx.weekday = 6; ctx.hour = 10;
  expect(!warden::evaluate_conditions(node, ctx, {}).met, "Saturday is not a business day");
  ctx.weekday = 0;
  expect(!warden::evaluate_conditions(node, ctx, {}).met, "Sunday is not a business day");
}

void test_nesting_limit() {
  warden::PolicyNode node = warden::condition("isOnCall");
  for (int i = 0; i < 40; ++i) node = warden::all_of({node});
  auto ctx = eval_context("u1", "");
  ctx.on_call = true;
  const auto r = warden::evaluate_conditions(node, ctx, {});
  expect(!r.met && r.malformed, "over-deep policy fails closed");

  const std::optional<warden::PolicyNode> none;
  expect(warden::evaluate_conditions(none, ctx, {}).met, "absent policy is vacuously met");
}

// ============================================================================
// Vector policy evaluation
// ============================================================================

warden::VectorPolicy role_vector_policy() {
  warden::VectorPolicy p;
  p.dimensions = {{"role", warden::DimensionKind::categorical, "roles"},
                  {"clearance", warden::DimensionKind::numeric, ""},
                  {"tenure", warden::DimensionKind::numeric, ""}};
  p.position = {3, 1, 1};
  p.threshold = 0.99;
  return p;
}

warden::VectorMaps role_maps() {
  return {{"roles", {{"admin", 3.0}, {"viewer", 1.0}}}};
}

void test_vector_similarity_threshold() {
  auto ctx = eval_context("u1", "");
  ctx.attributes = {{"role", std::string("admin")}, {"clearance", 1.0}, {"tenure", 1.0}};

  const auto same = warden::evaluate_vector_policy(role_vector_policy(), ctx, role_maps());
  expect(same.met, "identical vector granted");
  expect(warden::format_similarity(same.similarity) == "1.000", "similarity 1.000");
  expect(same.reason == "Similarity 1.000 meets threshold 0.99", "reason: " + same.reason);

  ctx.attributes["clearance"] = 2.0;
  const auto near = warden::evaluate_vector_policy(role_vector_policy(), ctx, role_maps());
  expect(!near.met && !near.malformed, "[3,2,1] denied");
  expect(near.similarity < 0.99, "similarity below threshold");
  expect(near.reason == "Similarity 0.967 is below threshold 0.99", "reason: " + near.reason);
}

void test_vector_edge_cases() {
  expect(warden::cosine_similarity({0, 0}, {1, 1}) == 0.0, "zero magnitude => 0");
  expect(warden::cosine_similarity({1, 2}, {1, 2, 3}) == 0.0, "length mismatch => 0");

  auto ctx = eval_context("u1", "");
  ctx.attributes = {{"role", std::string("intern")}, {"on_call", true}};
  const auto projected = warden::project_context(
      {{"role", warden::DimensionKind::categorical, "roles"},
       {"on_call", warden::DimensionKind::numeric, ""},
       {"missing", warden::DimensionKind::numeric, ""}},
      ctx.attributes, role_maps());
  expect(projected.ok, "projection succeeds");
  expect(projected.vector == std::vector<double>({0.0, 1.0, 0.0}),
         "unmapped category and missing attribute are 0, bool counts 1");

  auto mismatch = role_vector_policy();
  mismatch.position = {3, 1};
  const auto r = warden::evaluate_vector_policy(mismatch, ctx, role_maps());
  expect(!r.met && !r.malformed, "dimension mismatch is a plain denial");
  expect(r.reason == "Vector dimension mismatch. Expected 2, got 3.", "reason: " + r.reason);

  const auto unknown_map = warden::evaluate_vector_policy(role_vector_policy(), ctx, {});
  expect(!unknown_map.met && unknown_map.malformed, "unknown value map fails closed");
}

// ============================================================================
// Policy wire form
// ============================================================================

void test_policy_decode() {
  const auto boolean = warden::decode_policy(
      R"({"operator":"AND","clauses":[{"action":"read","resourceType":"report"},"isOwner"]})");
  expect(boolean.ok, "boolean policy decodes: " + boolean.error);
  const auto* bp = std::get_if<warden::BooleanPolicy>(&boolean.policy);
  expect(bp != nullptr, "decoded as boolean");
  const auto* all = std::get_if<warden::AllOf>(&bp->rule.v);
  expect(all && all->clauses.size() == 2, "AND with two clauses");

  const auto reencoded = warden::decode_policy(warden::encode_policy(boolean.policy));
  expect(reencoded.ok &&
             warden::encode_policy(reencoded.policy) == warden::encode_policy(boolean.policy),
         "encoding is stable");

  const auto xor_policy =
      warden::decode_policy(R"({"kind":"boolean","rule":{"operator":"XOR","clauses":["isOwner"]}})");
  expect(xor_policy.ok, "unknown operator still decodes");
  const auto& rule = std::get<warden::BooleanPolicy>(xor_policy.policy).rule;
  expect(std::holds_alternative<warden::UnknownOperator>(rule.v), "XOR is UnknownOperator");

  const auto vec = warden::decode_policy(
      R"({"dimensions":["clearance",{"name":"role","type":"categorical","map":"roles"}],"position":[1,3],"threshold":0.5})");
  expect(vec.ok, "bare vector policy decodes: " + vec.error);
  const auto* vp = std::get_if<warden::VectorPolicy>(&vec.policy);
  expect(vp && vp->dimensions.size() == 2 && vp->threshold == 0.5, "vector fields");
  expect(vp->dimensions[1].kind == warden::DimensionKind::categorical, "categorical dimension");

  expect(!warden::decode_policy("{").ok, "truncated JSON rejected");
  expect(!warden::decode_policy(R"({"kind":"vector","position":[1]})").ok,
         "vector without dimensions rejected");
  expect(!warden::decode_policy("42").ok, "number is not a policy");
}

void test_claims_decode() {
  const auto r = warden::decode_claims(
      R"([{"action":"read","resourceType":"report","conditions":"isOnCall"},{"action":"*","resourceType":"*"}])");
  expect(r.ok, "claims decode: " + r.error);
  expect(r.claims.size() == 2, "two claims");
  expect(r.claims[0].condition.has_value(), "first claim has a condition");
  expect(warden::describe_claim(r.claims[0]) ==
             R"({"action":"read","conditions":"isOnCall","resourceType":"report"})",
         "describe_claim: " + warden::describe_claim(r.claims[0]));
  expect(!warden::decode_claims(R"([{"action":"read"}])").ok, "claim without resourceType");
}

void test_json_string_escapes() {
  namespace json = warden::jsonlite;
  expect(json::escape("a\x01" "b") == "a\\u0001b", "control byte escaped as \\u0001");
  expect(json::escape("a\x1f" "b") == "a\\u001fb", "unit separator escaped");
  expect(json::escape("tab\there") == "tab\\there", "tab keeps its short escape");

  std::optional<json::JsonError> err;
  const auto ctl = json::parse_value(R"("a\u0001b")", &err);
  expect(!err && std::get<std::string>(ctl.v) == "a\x01" "b", "\\u0001 decoded");
  const auto accented = json::parse_value(R"("caf\u00e9")", &err);
  expect(!err && std::get<std::string>(accented.v) == "caf\xc3\xa9", "BMP escape to UTF-8");
  const auto emoji = json::parse_value(R"("\ud83d\ude00")", &err);
  expect(!err && std::get<std::string>(emoji.v) == "\xf0\x9f\x98\x80", "surrogate pair joined");

  err.reset();
  json::parse_value(R"("\ud83d")", &err);
  expect(err.has_value(), "unpaired surrogate rejected");
  err.reset();
  json::parse_value("\"a\x01" "b\"", &err);
  expect(err.has_value(), "raw control byte rejected");
  err.reset();
  json::parse_value(R"("\q")", &err);
  expect(err.has_value(), "unknown escape rejected");
}

void test_json_number_precision() {
  namespace json = warden::jsonlite;
  expect(json::format_double(1.0) == "1.0", "integral double stays a double");
  expect(json::format_double(0.99) == "0.99", "shortest form");
  for (double d : {1e-7, 3e-7, 1e60, 0.9999999, 0.1 + 0.2}) {
    std::optional<json::JsonError> err;
    const auto v = json::parse_value(json::format_double(d), &err);
    expect(!err && std::get<double>(v.v) == d, "double survives: " + json::format_double(d));
  }
}

void test_policy_schema_version() {
  const std::string wire = warden::encode_policy(role_vector_policy());
  expect(contains(wire, "\"v\":1"), "schema version written: " + wire);
  expect(warden::decode_policy(wire).ok, "own version decodes");

  std::string future = wire;
  future.replace(future.find("\"v\":1"), 5, "\"v\":99");
  const auto r = warden::decode_policy(future);
  expect(!r.ok && contains(r.error, "schema version"), "other version rejected: " + r.error);
}

// ============================================================================
// Capability tokens
// ============================================================================

std::shared_ptr<const warden::SigningKey> test_key() {
  return std::make_shared<const warden::SigningKey>(warden::generate_signing_key());
}

warden::ConnectionDescriptor sample_descriptor() {
  return {"https", "https://api.internal/v1/reports/acct-42", "enc:v1:SECRET-CRED"};
}

void test_token_lifetime() {
  auto now = std::make_shared<std::atomic<uint64_t>>(kT0);
  warden::Clock clock = [now] { return now->load(); };
  const auto token =
      warden::CapabilityToken::issue(sample_descriptor(), "read", test_key(), clock, 60);

  expect(token.validate().valid, "valid immediately");
  expect(token.expires_at_unix_ms() == kT0 + 60000, "expiry = issue + lifetime");
  now->store(kT0 + 60000);
  expect(token.validate().valid, "still valid at the expiry instant");

  now->store(kT0 + 60001);
  const auto first = token.validate();
  const auto second = token.validate();
  expect(!first.valid && first.error == warden::ErrorCode::token_expired, "expired after");
  expect(!second.valid && second.error == first.error && second.reason == first.reason,
         "repeated validation after expiry is stable");
  expect(warden::to_string(first.error) == "pointer_expired", "expiry code name");
}

void test_token_descriptor_is_a_copy() {
  const auto token = warden::CapabilityToken::issue(sample_descriptor(), "read", test_key());
  auto d = token.descriptor();
  d.address = "https://evil.example/";
  expect(token.validate().valid, "mutating the copy does not affect the token");
  expect(token.descriptor().address == sample_descriptor().address, "token address unchanged");
  expect(token.nonce().size() == 32, "128-bit nonce");
}

void test_token_tamper_detection() {
  auto now = std::make_shared<std::atomic<uint64_t>>(kT0);
  warden::Clock clock = [now] { return now->load(); };
  const auto key = test_key();
  const auto token = warden::CapabilityToken::issue(sample_descriptor(), "read", key, clock, 60);

  std::string wire = token.encode();
  const std::string from = "api.internal/v1/reports/acct-42";
  wire.replace(wire.find(from), from.size(), "api.internal/v1/reports/acct-99");

  const auto decoded = warden::CapabilityToken::decode(wire, key, clock);
  expect(decoded.ok, "edited token still parses: " + decoded.error);
  const auto r = decoded.token->validate();
  expect(!r.valid && r.error == warden::ErrorCode::token_integrity_failed,
         "edited address fails integrity");

  now->store(kT0 + 3600 * 1000);
  const auto late = decoded.token->validate();
  expect(late.error == warden::ErrorCode::token_integrity_failed,
         "integrity is checked before expiry");

  now->store(kT0);
  const auto intact = warden::CapabilityToken::decode(token.encode(), key, clock);
  expect(intact.ok && intact.token->validate().valid, "unedited round trip validates");

  const auto other_key = warden::CapabilityToken::decode(token.encode(), test_key(), clock);
  expect(other_key.ok && other_key.token->validate().error ==
                             warden::ErrorCode::token_integrity_failed,
         "token does not verify under another key");

  expect(!warden::CapabilityToken::decode("not json", key, clock).ok, "garbage rejected");
  expect(!warden::CapabilityToken::decode(R"({"v":1,"p":"x"})", key, clock).ok,
         "missing fields rejected");
}

void test_token_binds_action() {
  const auto key = test_key();
  warden::Clock clock = [] { return kT0; };
  const auto token = warden::CapabilityToken::issue(sample_descriptor(), "read", key, clock, 60);
  expect(token.action() == "read", "granted action carried");

  std::string wire = token.encode();
  expect(contains(wire, "\"o\":\"read\""), "action on the wire");
  wire.replace(wire.find("\"o\":\"read\""), 10, "\"o\":\"delete\"");
  const auto decoded = warden::CapabilityToken::decode(wire, key, clock);
  expect(decoded.ok && decoded.token->action() == "delete", "edited action parses");
  expect(decoded.token->validate().error == warden::ErrorCode::token_integrity_failed,
         "edited action fails integrity");
}

void test_token_lifetime_capped() {
  const uint64_t max_ms = warden::CapabilityToken::kMaxLifetimeSeconds * 1000;
  warden::Clock clock = [] { return kT0; };
  const auto huge =
      warden::CapabilityToken::issue(sample_descriptor(), "read", test_key(), clock, 1ULL << 62);
  expect(huge.expires_at_unix_ms() == kT0 + max_ms, "lifetime clamped to the maximum");
  expect(huge.validate().valid, "clamped token is valid now");

  const uint64_t late = std::numeric_limits<uint64_t>::max() - 10;
  warden::Clock late_clock = [late] { return late; };
  const auto saturated =
      warden::CapabilityToken::issue(sample_descriptor(), "read", test_key(), late_clock, 60);
  expect(saturated.expires_at_unix_ms() == std::numeric_limits<uint64_t>::max(),
         "expiry saturates instead of wrapping");
  expect(saturated.validate().valid, "saturated token is not born expired");
}

void test_token_control_characters() {
  const auto key = test_key();
  warden::Clock clock = [] { return kT0; };
  warden::ConnectionDescriptor spaced{"file", "file:///srv/a b.csv", ""};
  const auto token = warden::CapabilityToken::issue(spaced, "read", key, clock, 60);

  std::string wire = token.encode();
  wire.replace(wire.find("a b.csv"), 7, "a\\u0001b.csv");
  const auto edited = warden::CapabilityToken::decode(wire, key, clock);
  expect(edited.ok, "escaped control character decodes: " + edited.error);
  expect(edited.token->descriptor().address == "file:///srv/a\x01" "b.csv",
         "escape decoded to the control byte");
  expect(edited.token->validate().error == warden::ErrorCode::token_integrity_failed,
         "space and control byte sign differently");

  std::string raw = token.encode();
  raw.replace(raw.find("a b.csv"), 7, "a\x01" "b.csv");
  expect(!warden::CapabilityToken::decode(raw, key, clock).ok, "raw control byte rejected");

  warden::ConnectionDescriptor ctl{"file", "file:///srv/a\x01" "b.csv", ""};
  const auto with_ctl = warden::CapabilityToken::issue(ctl, "read", key, clock, 60);
  const auto back = warden::CapabilityToken::decode(with_ctl.encode(), key, clock);
  expect(back.ok && back.token->validate().valid, "control byte survives the wire form");
  expect(back.token->descriptor() == ctl, "descriptor unchanged");
}

void test_capability_variant() {
  const auto d = sample_descriptor();
  const auto del = warden::make_capability("delete", d);
  expect(del && std::holds_alternative<warden::DeleteCapability>(*del), "delete capability");
  expect(warden::capability_action(*del) == "delete", "action name");
  expect(warden::capability_target(*del) == d, "carries the descriptor");
  expect(!warden::make_capability("execute", d).has_value(), "unknown action has no capability");
}

// ============================================================================
// Resolver
// ============================================================================

void test_owner_scenario() {
  TestBroker b(reports_registry());
  expect(b.resolver.register_connection(owner_report_definition()).ok, "register");

  const auto granted =
      b.resolver.resolve("reports/acct-42", caller("acct-42", {claim("read", "report")}));
  expect(granted.ok, "owner granted: " + granted.reason);
  expect(granted.descriptor->address == "file:///data/reports/acct-42.csv",
         "owner id substituted: " + granted.descriptor->address);
  expect(granted.granted_action == "read", "granted action");
  expect(granted.policy_kind == "boolean", "policy kind");
  expect(!granted.trace_id.empty(), "trace id generated");

  const auto denied =
      b.resolver.resolve("reports/acct-42", caller("acct-99", {claim("read", "report")}));
  expect(!denied.ok && denied.error == warden::ErrorCode::policy_denied, "non-owner denied");
  expect(contains(denied.reason, "isOwner"), "reason mentions isOwner: " + denied.reason);
  expect(!denied.descriptor.has_value(), "no descriptor on denial");

  const auto events = b.memory.audit_events();
  expect(events.size() == 2, "one audit event per resolution");
  expect(events[0].kind == warden::AuditEventKind::handshake_success, "grant audited");
  expect(events[1].kind == warden::AuditEventKind::handshake_failure, "denial audited");
  expect(events[1].reason == denied.reason, "audit carries the denial reason");
}

void test_no_matching_claim_denies() {
  TestBroker b(reports_registry());
  b.resolver.register_connection(owner_report_definition());

  const auto r =
      b.resolver.resolve("reports/acct-42", caller("acct-42", {claim("write", "ledger")}));
  expect(!r.ok && r.error == warden::ErrorCode::policy_denied, "no claim => denied");
  expect(contains(r.reason, "No claim satisfied requirement"), "reason: " + r.reason);
  expect(!r.descriptor.has_value(), "nothing to sign on denial");
  expect(b.resolver.stats().tokens_issued.load() == 0, "no token produced");
}

void test_not_found_audits_once() {
  TestBroker b;
  for (int i = 1; i <= 2; ++i) {
    const auto r = b.resolver.resolve("nothing/here", caller("u1", {claim("*", "*")}));
    expect(!r.ok && r.error == warden::ErrorCode::not_found, "unknown name => not_found");
    const auto events = b.memory.audit_events();
    expect(events.size() == static_cast<size_t>(i), "exactly one audit event per call");
    expect(events.back().reason == "not_found", "reason is not_found");
    expect(events.back().kind == warden::AuditEventKind::handshake_failure, "failure event");
  }
  expect(b.resolver.stats().not_found.load() == 2, "not_found counted");
}

void test_storage_failure_is_not_not_found() {
  UnreachableStorage down;
  TestBroker b({}, &down);
  const auto r = b.resolver.resolve("reports/acct-42", caller("u1", {claim("*", "*")}));
  expect(!r.ok && r.error == warden::ErrorCode::storage_unavailable, "storage_unavailable");
  expect(down.events.size() == 1 && down.events[0].reason == "storage_unavailable",
         "audited as storage_unavailable");
  expect(b.ops_logged("storage_unavailable"), "reported on the operational log");
  expect(b.resolver.cache_metrics().misses == 1, "miss counted");

  b.resolver.resolve("reports/acct-42", caller("u1", {claim("*", "*")}));
  expect(b.resolver.cache_metrics().misses == 2, "errors are not cached");
}

void test_audit_failure_does_not_flip_grant() {
  AuditRejectingStorage store;
  TestBroker b(reports_registry(), &store);
  b.resolver.register_connection(owner_report_definition());

  const auto r =
      b.resolver.resolve("reports/acct-42", caller("acct-42", {claim("read", "report")}));
  expect(r.ok, "grant stands when the audit write fails");
  expect(b.audit.failure_count() == 1, "audit failure counted");
  expect(b.resolver.stats().audit_failures.load() == 1, "resolver counts it too");
  expect(b.ops_logged("audit_write_failure"), "failure reported to operators");

  const auto d =
      b.resolver.resolve("reports/acct-42", caller("acct-99", {claim("read", "report")}));
  expect(!d.ok && d.error == warden::ErrorCode::policy_denied, "denial stands too");
}

void test_malformed_policy_reported() {
  TestBroker b;
  warden::ResourceDefinition def;
  def.logical_name = "ops/runbook";
  def.connection = {"https", "https://wiki/runbook", ""};
  def.policy = warden::BooleanPolicy{warden::PolicyNode{warden::UnknownOperator{"XOR"}}};
  b.resolver.register_connection(def);

  const auto r = b.resolver.resolve("ops/runbook", caller("u1", {claim("*", "*")}));
  expect(!r.ok && r.error == warden::ErrorCode::malformed_policy, "malformed_policy");
  expect(r.reason == "Unknown operator 'XOR'", "reason: " + r.reason);
  expect(b.ops_logged("malformed_policy"), "operators told");
}

void test_vector_policy_resolution() {
  warden::Registry reg;
  reg.vector_maps = role_maps();
  TestBroker b(reg);

  warden::ResourceDefinition def;
  def.logical_name = "vault/keys";
  def.connection = {"https", "https://vault/keys", "enc:v1:k"};
  def.policy = role_vector_policy();
  b.resolver.register_connection(def);

  auto ctx = caller("u1", {});
  ctx.ambient.custom = {{"role", std::string("admin")}, {"clearance", 1.0}, {"tenure", 1.0}};
  const auto ok = b.resolver.resolve("vault/keys", ctx);
  expect(ok.ok, "vector policy grants: " + ok.reason);
  expect(ok.policy_kind == "vector", "policy kind");
  expect(ok.granted_by == "Similarity 1.000 meets threshold 0.99", "grant basis");

  ctx.ambient.custom["clearance"] = 2.0;
  const auto no = b.resolver.resolve("vault/keys", ctx);
  expect(!no.ok && no.error == warden::ErrorCode::policy_denied, "vector policy denies");
  expect(contains(no.reason, "0.967"), "similarity reported: " + no.reason);
}

void test_vector_grant_action() {
  warden::Registry reg;
  reg.vector_maps = role_maps();
  reg.vector_maps["actions"] = {{"read", 1.0}, {"delete", 2.0}};
  TestBroker b(reg);

  warden::ResourceDefinition plain;
  plain.logical_name = "vault/keys";
  plain.connection = {"https", "https://vault/keys", "enc:v1:k"};
  plain.policy = role_vector_policy();
  b.resolver.register_connection(plain);

  warden::VectorPolicy by_action;
  by_action.dimensions = {{"role", warden::DimensionKind::categorical, "roles"},
                          {"action", warden::DimensionKind::categorical, "actions"}};
  by_action.position = {3, 2};
  by_action.threshold = 0.99;
  warden::ResourceDefinition purge = plain;
  purge.logical_name = "vault/purge";
  purge.policy = by_action;
  b.resolver.register_connection(purge);

  auto ctx = caller("u1", {});
  ctx.ambient.custom = {{"role", std::string("admin")}, {"clearance", 1.0}, {"tenure", 1.0},
                        {"action", std::string("delete")}};
  const auto r = b.resolver.resolve("vault/keys", ctx);
  expect(r.ok && r.granted_action == "read", "no action dimension grants read only");

  const auto d = b.resolver.resolve("vault/purge", ctx);
  expect(d.ok, "action dimension matches: " + d.reason);
  expect(d.granted_action == "delete", "action dimension grants the projected action");
  const auto token = b.resolver.sign(*d.descriptor, d.granted_action);
  expect(b.resolver.redeem(token, "delete", "u1").ok, "delete pointer redeems as delete");
}

void test_deadline_exceeded() {
  TestBroker b(reports_registry());
  b.resolver.register_connection(owner_report_definition());

  warden::ResolveOptions opts;
  opts.trace_id = "trace-deadline";
  opts.deadline = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
  const auto r = b.resolver.resolve(
      "reports/acct-42", caller("acct-42", {claim("read", "report")}), opts);
  expect(!r.ok && r.error == warden::ErrorCode::deadline_exceeded, "deadline_exceeded");
  expect(r.trace_id == "trace-deadline", "caller trace id kept");
  expect(b.resolver.stats().deadline_exceeded.load() == 1, "counted");
}

void test_independent_registries() {
  warden::MemoryStorage shared;
  TestBroker by_reports(reports_registry(), &shared);
  warden::Registry users;
  users.owner_categories = {"users"};
  TestBroker by_users(users, &shared);

  by_reports.resolver.register_connection(owner_report_definition());
  const auto ctx = caller("acct-42", {claim("read", "report")});
  expect(by_reports.resolver.resolve("reports/acct-42", ctx).ok, "reports registry derives owner");
  expect(!by_users.resolver.resolve("reports/acct-42", ctx).ok,
         "users registry derives no owner for reports/");
}

void test_resolve_result_json() {
  TestBroker b(reports_registry());
  b.resolver.register_connection(owner_report_definition());
  expect(b.memory.connection_count() == 1, "definition stored");

  const auto r =
      b.resolver.resolve("reports/acct-42", caller("acct-42", {claim("read", "report")}));
  const std::string json = r.to_json();
  expect(!contains(json, "SECRET-CRED"), "credential reference is not rendered");

  std::optional<warden::jsonlite::JsonError> err;
  const auto obj = warden::jsonlite::parse(json, &err);
  expect(!err, "result is JSON");
  expect(warden::jsonlite::get_bool(obj, "ok"), "ok flag");
  const auto* d = warden::jsonlite::get_object(obj, "descriptor");
  expect(d && warden::jsonlite::get_string(*d, "address") == "file:///data/reports/acct-42.csv",
         "descriptor address");
  expect(b.audit.entry_count() == 1, "one audit entry");
}

// ============================================================================
// Redemption
// ============================================================================

void test_redeem_success_and_replay() {
  TestBroker b;
  const auto token = b.resolver.sign(sample_descriptor(), "read");
  expect(b.resolver.stats().tokens_issued.load() == 1, "issue counted");

  const auto first = b.resolver.redeem(token, "read", "acct-42");
  expect(first.ok, "first redemption: " + first.reason);
  expect(std::holds_alternative<warden::ReadCapability>(*first.capability), "read capability");
  expect(warden::capability_target(*first.capability) == sample_descriptor(), "target");

  const auto again = b.resolver.redeem(token, "read", "acct-42");
  expect(!again.ok && again.error == warden::ErrorCode::token_replayed, "replay rejected");
  const auto events = b.memory.audit_events();
  expect(events.size() == 1, "only the failure is audited");
  expect(events[0].kind == warden::AuditEventKind::pointer_validation_failure, "pointer failure");
  expect(events[0].severity == warden::Severity::critical, "replay is critical");
}

void test_redeem_failures_audited() {
  TestBroker b;
  const auto expired = b.resolver.sign(sample_descriptor(), "read", 1);
  b.advance_ms(1001);
  const auto e = b.resolver.redeem(expired, "read", "u1");
  expect(!e.ok && e.error == warden::ErrorCode::token_expired, "expired");

  std::string wire = b.resolver.sign(sample_descriptor(), "read").encode();
  const std::string from = "\"p\":\"https\"";
  wire.replace(wire.find(from), from.size(), "\"p\":\"sql\"");
  const auto tampered = b.resolver.decode_token(wire);
  expect(tampered.ok, "tampered token parses");
  const auto t = b.resolver.redeem(*tampered.token, "read", "u1");
  expect(!t.ok && t.error == warden::ErrorCode::token_integrity_failed, "integrity failure");

  const auto u = b.resolver.redeem(b.resolver.sign(sample_descriptor(), "read"), "execute", "u1");
  expect(!u.ok && u.error == warden::ErrorCode::unsupported_action, "unsupported action");

  const auto events = b.memory.audit_events();
  expect(events.size() == 3, "three pointer failures audited");
  expect(events[0].severity == warden::Severity::warning, "expiry is a warning");
  expect(events[1].severity == warden::Severity::critical, "integrity failure is critical");
  expect(b.ops_logged("security_incident"), "integrity incident reported");
  expect(b.resolver.stats().integrity_failures.load() == 1, "counted");
}

void test_redeem_rejects_other_action() {
  TestBroker b;
  const auto token = b.resolver.sign(sample_descriptor(), "read");

  const auto escalated = b.resolver.redeem(token, "delete", "u1", "trace-escalate");
  expect(!escalated.ok && escalated.error == warden::ErrorCode::unsupported_action,
         "read pointer cannot delete");
  expect(!escalated.capability.has_value(), "no capability handed out");
  expect(contains(escalated.reason, "'read'") && contains(escalated.reason, "'delete'"),
         "reason names both actions: " + escalated.reason);

  const auto events = b.memory.audit_events();
  expect(events.size() == 1, "mismatch audited");
  expect(events[0].kind == warden::AuditEventKind::pointer_validation_failure, "pointer failure");
  expect(events[0].trace_id == "trace-escalate", "trace id kept");
  expect(events[0].severity == warden::Severity::critical, "escalation is critical");
  expect(b.ops_logged("security_incident"), "escalation reported to operators");

  const auto read = b.resolver.redeem(token, "read", "u1");
  expect(read.ok && std::holds_alternative<warden::ReadCapability>(*read.capability),
         "rejected attempt does not burn the pointer");
}

// ============================================================================
// Cache
// ============================================================================

void test_cache_hits_and_ttl() {
  TestBroker b(reports_registry(), nullptr, 1000);
  b.resolver.register_connection(owner_report_definition());
  const auto ctx = caller("acct-42", {claim("read", "report")});

  expect(!b.resolver.resolve("reports/acct-42", ctx).cache_hit, "cold lookup misses");
  expect(b.resolver.resolve("reports/acct-42", ctx).cache_hit, "warm lookup hits");
  b.advance_ms(1001);
  expect(!b.resolver.resolve("reports/acct-42", ctx).cache_hit, "expired entry misses");

  const auto m = b.resolver.cache_metrics();
  expect(m.hits == 1 && m.misses == 2, "counters: " + m.to_json());
}

void test_register_invalidates_under_readers() {
  TestBroker b(reports_registry());
  b.resolver.register_connection(owner_report_definition());
  const auto ctx = caller("acct-42", {claim("read", "report")});
  expect(b.resolver.resolve("reports/acct-42", ctx).ok, "cached");

  std::atomic<bool> stop{false};
  std::vector<std::thread> readers;
  for (int i = 0; i < 4; ++i) {
    readers.emplace_back([&] {
      while (!stop.load()) b.resolver.resolve("reports/acct-42", ctx);
    });
  }

  auto updated = owner_report_definition();
  updated.connection.address = "file:///archive/{ownerId}.csv";
  expect(b.resolver.register_connection(updated).ok, "update");
  const auto after = b.resolver.resolve("reports/acct-42", ctx);

  stop.store(true);
  for (auto& t : readers) t.join();

  expect(after.ok && after.descriptor->address == "file:///archive/acct-42.csv",
         "read after write sees the new definition");
  expect(b.resolver.resolve("reports/acct-42", ctx).descriptor->address ==
             "file:///archive/acct-42.csv",
         "no reader repopulated the old definition");
}

void test_single_flight() {
  SlowCountingStorage store;
  TestBroker b(reports_registry(), &store);
  store.register_connection(owner_report_definition());
  const auto ctx = caller("acct-42", {claim("read", "report")});

  std::atomic<int> granted{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (b.resolver.resolve("reports/acct-42", ctx).ok) granted.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();

  expect(granted.load() == 8, "all concurrent lookups granted");
  expect(store.fetches.load() == 1, "one storage fetch for concurrent cold lookups");
}

void test_stale_fill_dropped() {
  warden::DefinitionCache cache(60000, 4);
  auto old_def = owner_report_definition();
  auto new_def = owner_report_definition();
  new_def.connection.address = "file:///new";

  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::promise<void> started;

  std::thread slow([&] {
    cache.get_or_fetch(old_def.logical_name, [&](const std::string&) {
      started.set_value();
      gate.wait();
      return warden::FetchOutcome{true, old_def, ""};
    });
  });

  started.get_future().wait();
  cache.invalidate(old_def.logical_name);
  release.set_value();
  slow.join();

  expect(cache.metrics().stale_fills_dropped == 1, "fill from before invalidation dropped");
  const auto fresh = cache.get_or_fetch(old_def.logical_name, [&](const std::string&) {
    return warden::FetchOutcome{true, new_def, ""};
  });
  expect(!fresh.hit && fresh.definition->connection.address == "file:///new",
         "next lookup fetches the new definition");
}

void test_fetcher_exception_fulfils_waiters() {
  warden::DefinitionCache cache(60000, 4);
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::promise<void> started;

  warden::CacheLookup leader_result;
  std::thread leader([&] {
    leader_result =
        cache.get_or_fetch("reports/acct-42", [&](const std::string&) -> warden::FetchOutcome {
          started.set_value();
          gate.wait();
          throw 7;
        });
  });
  started.get_future().wait();

  auto follower = std::async(std::launch::async, [&] {
    return cache.get_or_fetch("reports/acct-42", [](const std::string&) {
      return warden::FetchOutcome{true, std::nullopt, ""};
    });
  });
  while (cache.metrics().coalesced_waits == 0) std::this_thread::yield();
  release.set_value();
  leader.join();
  const auto waited = follower.get();

  expect(!leader_result.ok && contains(leader_result.error, "unknown exception"),
         "leader sees the failure: " + leader_result.error);
  expect(!waited.ok && waited.error == leader_result.error, "follower gets the same outcome");
  expect(cache.metrics().coalesced_waits == 1, "one coalesced waiter");

  const auto retry = cache.get_or_fetch("reports/acct-42", [](const std::string&) {
    return warden::FetchOutcome{true, owner_report_definition(), ""};
  });
  expect(retry.ok && retry.definition, "failure is not cached");
}

// ============================================================================
// Audit trail
// ============================================================================

void test_audit_chain() {
  TestBroker b(reports_registry());
  b.resolver.register_connection(owner_report_definition());
  for (int i = 0; i < 3; ++i)
    b.resolver.resolve("reports/acct-42", caller("acct-42", {claim("read", "report")}));
  b.resolver.resolve("missing", caller("acct-42", {}));

  auto events = b.memory.audit_events();
  expect(events.size() == 4, "four events");
  for (size_t i = 0; i < events.size(); ++i)
    expect(events[i].sequence == i + 1, "sequence is contiguous from 1");
  expect(events[0].previous_digest == warden::kGenesisDigest, "chain starts at genesis");
  expect(warden::verify_chain(events) == events.size(), "chain intact");
  expect(b.audit.last_digest() ==
             warden::hash_domain("audit:", warden::audit_event_to_json(events.back())),
         "head digest matches the last event");

  events[1].reason = "Granted by nobody";
  expect(warden::verify_chain(events) == 2, "edit detected at the following event");
}

void test_credentials_never_logged() {
  TestBroker b(reports_registry());
  b.resolver.register_connection(owner_report_definition());
  b.resolver.resolve("reports/acct-42", caller("acct-42", {claim("read", "report")}));
  b.resolver.resolve("reports/acct-42", caller("acct-99", {claim("read", "report")}));

  std::string wire = b.resolver.sign(sample_descriptor(), "read").encode();
  wire.replace(wire.find("acct-42"), 7, "acct-77");
  b.resolver.redeem(*b.resolver.decode_token(wire).token, "read", "u1");

  for (const auto& e : b.memory.audit_events())
    expect(!contains(warden::audit_event_to_json(e), "SECRET-CRED"), "audit is redacted");
  for (const auto& line : b.ops_lines)
    expect(!contains(line, "SECRET-CRED"), "operational log is redacted");
}

// ============================================================================
// SQLite persistence
// ============================================================================

void test_sqlite_round_trip() {
  const fs::path tmp = fs::temp_directory_path() / "warden_sqlite_test";
  fs::remove_all(tmp);
  fs::create_directories(tmp);
  const std::string db = (tmp / "warden.db").string();

  {
    warden::SqliteStorage store(db);
    expect(store.init().ok, "init");
    expect(store.init().ok, "init is idempotent");

    expect(store.register_connection(owner_report_definition()).ok, "insert boolean");
    warden::ResourceDefinition vec;
    vec.logical_name = "vault/keys";
    vec.connection = {"https", "https://vault/keys", "enc:v1:k"};
    vec.policy = role_vector_policy();
    expect(store.register_connection(vec).ok, "insert vector");

    const auto got = store.get_connection("reports/acct-42");
    expect(got.ok && got.definition, "boolean definition found");
    expect(got.definition->connection == owner_report_definition().connection, "descriptor");
    const auto ctx = eval_context("acct-42", "acct-42");
    const auto& rule = std::get<warden::BooleanPolicy>(got.definition->policy).rule;
    expect(warden::evaluate_conditions(rule, ctx, {claim("read", "report")}).met,
           "persisted boolean policy evaluates the same");

    const auto v = store.get_connection("vault/keys");
    const auto* vp = std::get_if<warden::VectorPolicy>(&v.definition->policy);
    expect(vp && vp->position == std::vector<double>({3, 1, 1}) && vp->threshold == 0.99,
           "vector policy persisted");

    vec.connection.address = "https://vault/v2/keys";
    expect(store.register_connection(vec).ok, "upsert");
    expect(store.get_connection("vault/keys").definition->connection.address ==
               "https://vault/v2/keys",
           "upsert replaced the row");

    const auto missing = store.get_connection("nope");
    expect(missing.ok && !missing.definition, "missing row is ok + empty");

    warden::AuditLogger audit(store, nullptr);
    expect(audit.log_handshake_success("t1", "reports/acct-42", "acct-42", "claim"), "append 1");
    expect(audit.log_handshake_failure("t2", "reports/acct-42", "acct-99", "denied"), "append 2");
    auto events = store.read_audit_log();
    expect(events.size() == 2 && events[0].sequence == 2, "newest first");
    std::reverse(events.begin(), events.end());
    expect(warden::verify_chain(events) == 2, "persisted chain verifies");
    expect(events[1].caller_id == "acct-99" && events[1].reason == "denied", "fields persisted");
  }

  {
    // A row written by something else with a policy this build cannot read.
    sqlite3* raw = nullptr;
    expect(sqlite3_open(db.c_str(), &raw) == SQLITE_OK, "raw open");
    expect(sqlite3_exec(raw,
                        "UPDATE connections SET required_permission = '{\"bogus\":1}' "
                        "WHERE logical_name = 'reports/acct-42';",
                        nullptr, nullptr, nullptr) == SQLITE_OK,
           "raw update");
    sqlite3_close(raw);

    warden::SqliteStorage store(db);
    expect(store.init().ok, "reopen");
    const auto got = store.get_connection("reports/acct-42");
    expect(got.ok && got.definition, "row still returned");
    const auto& rule = std::get<warden::BooleanPolicy>(got.definition->policy).rule;
    const auto r = warden::evaluate_conditions(rule, eval_context("acct-42", "acct-42"),
                                               {claim("*", "*")});
    expect(!r.met && r.malformed, "undecodable stored policy fails closed");
  }

  fs::remove_all(tmp);
}

void test_sqlite_vector_precision() {
  const fs::path tmp = fs::temp_directory_path() / "warden_sqlite_precision";
  fs::remove_all(tmp);
  fs::create_directories(tmp);
  warden::SqliteStorage store((tmp / "warden.db").string());
  expect(store.init().ok, "init");

  auto ctx = eval_context("u1", "");
  ctx.attributes = {{"role", std::string("admin")}, {"clearance", 1.0}, {"tenure", 1.0}};

  const std::vector<std::vector<double>> positions = {{3e-7, 1e-7, 1e-7}, {1e60, 1, 1}};
  for (const auto& position : positions) {
    auto policy = role_vector_policy();
    policy.position = position;
    policy.threshold = 0.9999999;
    warden::ResourceDefinition def;
    def.logical_name = "vault/precise";
    def.connection = {"https", "https://vault/keys", ""};
    def.policy = policy;
    expect(store.register_connection(def).ok, "store");

    const auto got = store.get_connection("vault/precise");
    const auto* vp = std::get_if<warden::VectorPolicy>(&got.definition->policy);
    expect(vp && vp->position == position, "position stored exactly");
    expect(vp->threshold == 0.9999999, "threshold stored exactly");
    const auto before = warden::evaluate_vector_policy(policy, ctx, role_maps());
    const auto after = warden::evaluate_vector_policy(*vp, ctx, role_maps());
    expect(before.met == after.met && before.similarity == after.similarity,
           "persisted policy decides the same");
  }
  store.close();
  fs::remove_all(tmp);
}

// ============================================================================
// Configuration
// ============================================================================

const char* kConfigJson = R"({
  "db_path": "/var/lib/warden/warden.db",
  "cache_ttl_ms": 1000,
  "owner_categories": ["reports"],
  "vector_maps": {"roles": {"admin": 3, "viewer": 1, "bad": "x"}},
  "connections": [
    {"logical_name": "reports/acct-42", "protocol": "file",
     "address": "file:///data/reports/{ownerId}.csv", "credential_ref": "enc:v1:c",
     "policy": {"operator": "AND", "clauses": [{"action": "read", "resourceType": "report"}, "isOwner"]}}
  ]
})";

void test_config_load_and_pinning() {
  const fs::path tmp = fs::temp_directory_path() / "warden_config_test.json";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    ofs << kConfigJson;
  }
  const std::string digest = warden::hash_file_blake3_hex(tmp.string());
  expect(digest == warden::blake3_hex(kConfigJson), "file digest matches content digest");

  const auto ok = warden::load_config(tmp.string(), digest);
  expect(ok.ok, "pinned config loads: " + ok.detail);
  expect(ok.config.db_path == "/var/lib/warden/warden.db", "db path");
  expect(ok.config.cache_ttl_ms == 1000, "ttl");
  expect(ok.config.token_lifetime_s == 60, "default lifetime");
  expect(ok.config.source_digest == digest, "source digest recorded");
  expect(ok.config.connections.size() == 1, "seed connection parsed");
  const auto reg = warden::make_registry(ok.config);
  expect(reg.derive_owner_id("reports/acct-42") == std::optional<std::string>("acct-42"),
         "registry derives owners");
  expect(!reg.derive_owner_id("users/acct-42"), "other categories have no owner");
  expect(reg.vector_maps.at("roles").size() == 2, "non-numeric map entries skipped");

  const auto tampered = warden::load_config(tmp.string(), std::string(64, '0'));
  expect(!tampered.ok && tampered.error == warden::ErrorCode::config_invalid,
         "digest mismatch rejected");

  expect(warden::load_config((tmp.string() + ".missing"), "").error ==
             warden::ErrorCode::config_invalid,
         "unreadable file rejected");
  fs::remove(tmp);
}

void test_config_env_overrides() {
  setenv("WARDEN_CACHE_TTL_MS", "1234", 1);
  setenv("WARDEN_DB_PATH", "/tmp/override.db", 1);
  const auto r = warden::load_config("", "");
  expect(r.ok, "env-only config loads: " + r.detail);
  expect(r.config.cache_ttl_ms == 1234 && r.config.db_path == "/tmp/override.db",
         "env overrides applied");

  setenv("WARDEN_CACHE_TTL_MS", "soon", 1);
  expect(warden::load_config("", "").error == warden::ErrorCode::config_invalid,
         "non-numeric override rejected");
  unsetenv("WARDEN_CACHE_TTL_MS");
  unsetenv("WARDEN_DB_PATH");

  setenv("WARDEN_SIGNING_KEY", "abc", 1);
  expect(warden::load_config("", "").error == warden::ErrorCode::config_invalid,
         "short signing key rejected");
  unsetenv("WARDEN_SIGNING_KEY");

  const auto bad = warden::parse_config(R"({"connections":[{"logical_name":"x","protocol":"file"}]})");
  expect(!bad.ok && bad.error == warden::ErrorCode::config_invalid, "connection needs a policy");
}

void test_config_lifetime_bounds() {
  setenv("WARDEN_TOKEN_LIFETIME_S", "18446744073709552", 1);
  const auto overflow = warden::load_config("", "");
  expect(!overflow.ok && overflow.error == warden::ErrorCode::config_invalid,
         "lifetime that overflows milliseconds rejected");

  setenv("WARDEN_TOKEN_LIFETIME_S",
         std::to_string(warden::CapabilityToken::kMaxLifetimeSeconds).c_str(), 1);
  const auto max = warden::load_config("", "");
  expect(max.ok && max.config.token_lifetime_s == warden::CapabilityToken::kMaxLifetimeSeconds,
         "maximum lifetime accepted: " + max.detail);

  setenv("WARDEN_TOKEN_LIFETIME_S",
         std::to_string(warden::CapabilityToken::kMaxLifetimeSeconds + 1).c_str(), 1);
  expect(warden::load_config("", "").error == warden::ErrorCode::config_invalid,
         "one past the maximum rejected");
  unsetenv("WARDEN_TOKEN_LIFETIME_S");
}

// ============================================================================
// Observability
// ============================================================================

void test_event_log_jsonl() {
  const fs::path tmp = fs::temp_directory_path() / "warden_events_test.jsonl";
  fs::remove(tmp);

  warden::EventLog log(tmp.string());
  warden::jsonlite::Object fields;
  fields["logical_name"] = warden::jsonlite::Value{std::string("reports/acct-42")};
  log.emit(warden::Severity::warning, "storage_unavailable", fields);
  log.emit(warden::Severity::info, "resolution", {});
  expect(log.emitted() == 2 && log.write_failures() == 0, "two lines written");

  std::ifstream ifs(tmp.string());
  std::string line1, line2;
  std::getline(ifs, line1);
  std::getline(ifs, line2);
  std::optional<warden::jsonlite::JsonError> err;
  const auto obj = warden::jsonlite::parse(line1, &err);
  expect(!err, "line is JSON");
  expect(warden::jsonlite::get_string(obj, "kind") == "storage_unavailable", "kind");
  expect(warden::jsonlite::get_string(obj, "severity") == "warning", "severity");
  expect(warden::jsonlite::get_u64(obj, "ts_unix_ms") > 0, "timestamp");
  expect(contains(line2, "\"kind\":\"resolution\""), "second line");
  fs::remove(tmp);
}

void test_resolver_stats_json() {
  TestBroker b(reports_registry());
  b.resolver.register_connection(owner_report_definition());
  b.resolver.resolve("reports/acct-42", caller("acct-42", {claim("read", "report")}));
  b.resolver.resolve("reports/acct-42", caller("acct-99", {claim("read", "report")}));

  const auto& s = b.resolver.stats();
  expect(s.resolutions.load() == 2 && s.granted.load() == 1 && s.denied.load() == 1, "counters");
  expect(s.latency_histogram.count() == 2, "latency recorded");

  std::optional<warden::jsonlite::JsonError> err;
  const auto obj = warden::jsonlite::parse(s.to_json(), &err);
  expect(!err, "stats serialize as JSON");
  expect(warden::jsonlite::get_object(obj, "resolutions") != nullptr, "resolutions section");
  expect(b.ops_logged("resolution"), "resolution events emitted");
}

void test_event_log_hook_failures() {
  warden::EventLog log;
  log.set_hook([](const std::string&) { throw std::runtime_error("collector down"); });
  log.emit(warden::Severity::warning, "storage_unavailable", {});
  expect(log.emitted() == 1 && log.write_failures() == 1, "throwing hook counted");

  std::vector<std::string> lines;
  log.set_hook([&](const std::string& line) {
    lines.push_back(line);
    if (lines.size() == 1) log.emit(warden::Severity::info, "nested", {});
  });
  log.emit(warden::Severity::info, "outer", {});
  expect(lines.size() == 2, "re-entrant emit completes");
  expect(contains(lines[0], "\"kind\":\"outer\"") && contains(lines[1], "\"kind\":\"nested\""),
         "nested line delivered after the outer one");

  TestBroker b(reports_registry());
  b.resolver.register_connection(owner_report_definition());
  b.ops.set_hook([](const std::string&) { throw 1; });
  const auto r =
      b.resolver.resolve("reports/acct-42", caller("acct-42", {claim("read", "report")}));
  expect(r.ok, "resolution unaffected by a failing log hook");
  expect(b.ops.write_failures() >= 1, "hook failure counted");
}

void test_latency_histogram_buckets() {
  warden::LatencyHistogram h;
  expect(h.percentile_us(0.5) == 0, "empty histogram");

  h.record(40 * 1000);          // 40us
  h.record(90 * 1000);          // 90us
  h.record(2 * 1000 * 1000);    // 2ms
  h.record(3000ULL * 1000 * 1000);  // 3s
  expect(h.count() == 4 && h.max_us() == 3000000, "count and max");
  expect(h.bucket_count(0) == 1 && h.bucket_count(1) == 1, "sub-millisecond buckets");
  expect(h.bucket_count(5) == 1, "2ms lands in the 2.5ms bucket");
  expect(h.bucket_count(warden::LatencyHistogram::kBuckets - 1) == 1, "overflow bucket");
  expect(h.percentile_us(0.5) == 100, "median is the 100us bound");
  expect(h.percentile_us(0.75) == 2500, "p75 is the 2.5ms bound");
  expect(h.percentile_us(1.0) == 3000000, "overflow reports the largest sample");

  const std::string json = h.to_json();
  std::optional<warden::jsonlite::JsonError> err;
  const auto obj = warden::jsonlite::parse(json, &err);
  expect(!err, "histogram is JSON: " + json);
  const auto* buckets = warden::jsonlite::get_object(obj, "buckets");
  expect(buckets && warden::jsonlite::get_u64(*buckets, "le_50") == 1 &&
             warden::jsonlite::get_u64(*buckets, "inf") == 1,
         "per-bucket counts");
}

void test_version_manifest() {
  const auto m = warden::version::current_manifest();
  expect(m.hash_primitive == "blake3", "hash primitive");
  std::optional<warden::jsonlite::JsonError> err;
  const auto obj = warden::jsonlite::parse(warden::version::manifest_to_json(m), &err);
  expect(!err, "manifest is JSON");
  expect(warden::jsonlite::get_u64(obj, "token_format") == warden::version::TOKEN_FORMAT_VERSION,
         "token format version");
}

}  // namespace

int main() {
  std::cout << "=== Warden Test Suite ===\n";

  std::cout << "\n[Boolean policy]\n";
  run_test("claim field matching", test_claim_field_matching);
  run_test("first satisfied claim", test_check_permission_first_satisfied_claim);
  run_test("AND names the failed clause", test_and_reason_names_failed_clause);
  run_test("OR lists every reason", test_or_lists_every_reason);
  run_test("unknown tags fail closed", test_unknown_tags_fail_closed);
  run_test("business hours", test_business_hours);
  run_test("nesting limit", test_nesting_limit);

  std::cout << "\n[Vector policy]\n";
  run_test("similarity threshold", test_vector_similarity_threshold);
  run_test("projection and edge cases", test_vector_edge_cases);

  std::cout << "\n[Policy wire form]\n";
  run_test("policy decode", test_policy_decode);
  run_test("claims decode", test_claims_decode);
  run_test("JSON string escapes", test_json_string_escapes);
  run_test("JSON number precision", test_json_number_precision);
  run_test("policy schema version", test_policy_schema_version);

  std::cout << "\n[Capability tokens]\n";
  run_test("lifetime", test_token_lifetime);
  run_test("descriptor is a copy", test_token_descriptor_is_a_copy);
  run_test("tamper detection", test_token_tamper_detection);
  run_test("binds the granted action", test_token_binds_action);
  run_test("lifetime capped", test_token_lifetime_capped);
  run_test("control characters", test_token_control_characters);
  run_test("capability variant", test_capability_variant);

  std::cout << "\n[Resolver]\n";
  run_test("owner scenario", test_owner_scenario);
  run_test("no matching claim denies", test_no_matching_claim_denies);
  run_test("not_found audits once", test_not_found_audits_once);
  run_test("storage failure is not not_found", test_storage_failure_is_not_not_found);
  run_test("audit failure does not flip grant", test_audit_failure_does_not_flip_grant);
  run_test("malformed policy reported", test_malformed_policy_reported);
  run_test("vector policy resolution", test_vector_policy_resolution);
  run_test("vector grant action", test_vector_grant_action);
  run_test("deadline exceeded", test_deadline_exceeded);
  run_test("independent registries", test_independent_registries);
  run_test("result JSON", test_resolve_result_json);

  std::cout << "\n[Redemption]\n";
  run_test("success and replay", test_redeem_success_and_replay);
  run_test("failures audited", test_redeem_failures_audited);
  run_test("other action rejected", test_redeem_rejects_other_action);

  std::cout << "\n[Cache]\n";
  run_test("hits and TTL", test_cache_hits_and_ttl);
  run_test("register invalidates under readers", test_register_invalidates_under_readers);
  run_test("single flight (8 threads)", test_single_flight);
  run_test("stale fill dropped", test_stale_fill_dropped);
  run_test("fetcher exception fulfils waiters", test_fetcher_exception_fulfils_waiters);

  std::cout << "\n[Audit trail]\n";
  run_test("hash chain", test_audit_chain);
  run_test("credentials never logged", test_credentials_never_logged);

  std::cout << "\n[Persistence]\n";
  run_test("sqlite round trip", test_sqlite_round_trip);
  run_test("sqlite vector precision", test_sqlite_vector_precision);

  std::cout << "\n[Configuration]\n";
  run_test("load and pinning", test_config_load_and_pinning);
  run_test("environment overrides", test_config_env_overrides);
  run_test("lifetime bounds", test_config_lifetime_bounds);

  std::cout << "\n[Observability]\n";
  run_test("event log JSONL", test_event_log_jsonl);
  run_test("resolver stats JSON", test_resolver_stats_json);
  run_test("hook failures", test_event_log_hook_failures);
  run_test("latency histogram buckets", test_latency_histogram_buckets);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
