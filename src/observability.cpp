#include "warden/observability.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace warden {

namespace {

size_t bucket_for_us(uint64_t duration_us) {
  const auto& bounds = LatencyHistogram::kUpperBoundsUs;
  return static_cast<size_t>(std::lower_bound(bounds.begin(), bounds.end(), duration_us) -
                             bounds.begin());
}

void append_kv(std::string& out, const char* key, uint64_t value, bool first = false) {
  if (!first) out += ',';
  out += '"';
  out += key;
  out += "\":";
  out += std::to_string(value);
}

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);

  uint64_t seen = max_us_.load(std::memory_order_relaxed);
  while (us > seen && !max_us_.compare_exchange_weak(seen, us, std::memory_order_relaxed)) {
  }
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count();
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us()) / static_cast<double>(n);
}

uint64_t LatencyHistogram::percentile_us(double p) const {
  const uint64_t n = count();
  if (n == 0) return 0;

  // Rank of the p-th sample, 1-based.
  uint64_t rank = static_cast<uint64_t>(p * static_cast<double>(n) + 0.999999);
  rank = std::clamp<uint64_t>(rank, 1, n);

  uint64_t cumulative = 0;
  for (size_t i = 0; i < kUpperBoundsUs.size(); ++i) {
    cumulative += bucket_count(i);
    if (cumulative >= rank) return kUpperBoundsUs[i];
  }
  return max_us();
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(384);
  char buf[32];
  out += '{';
  append_kv(out, "count", count(), true);
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += ",\"mean_us\":";
  out += buf;
  append_kv(out, "max_us", max_us());
  append_kv(out, "p50_us", percentile_us(0.50));
  append_kv(out, "p95_us", percentile_us(0.95));
  append_kv(out, "p99_us", percentile_us(0.99));
  out += ",\"buckets\":{";
  for (size_t i = 0; i < kUpperBoundsUs.size(); ++i) {
    const std::string key = "le_" + std::to_string(kUpperBoundsUs[i]);
    append_kv(out, key.c_str(), bucket_count(i), i == 0);
  }
  append_kv(out, "inf", bucket_count(kBuckets - 1));
  out += "}}";
  return out;
}

// ---------------------------------------------------------------------------
// ResolverStats
// ---------------------------------------------------------------------------

void ResolverStats::record_resolution(const ResolutionEvent& ev) {
  resolutions.fetch_add(1, std::memory_order_relaxed);
  switch (ev.error) {
    case ErrorCode::none:
      granted.fetch_add(1, std::memory_order_relaxed);
      break;
    case ErrorCode::policy_denied:
      denied.fetch_add(1, std::memory_order_relaxed);
      break;
    case ErrorCode::malformed_policy:
      malformed.fetch_add(1, std::memory_order_relaxed);
      break;
    case ErrorCode::not_found:
      not_found.fetch_add(1, std::memory_order_relaxed);
      break;
    case ErrorCode::storage_unavailable:
      storage_failures.fetch_add(1, std::memory_order_relaxed);
      break;
    case ErrorCode::deadline_exceeded:
      deadline_exceeded.fetch_add(1, std::memory_order_relaxed);
      break;
    default:
      break;
  }
  latency_histogram.record(ev.duration_ns);
}

std::string ResolverStats::to_json() const {
  const auto ld = [](const std::atomic<uint64_t>& a) { return a.load(std::memory_order_relaxed); };

  std::string out;
  out.reserve(512);
  out += "{\"resolutions\":{";
  append_kv(out, "total", ld(resolutions), true);
  append_kv(out, "granted", ld(granted));
  append_kv(out, "denied", ld(denied));
  append_kv(out, "malformed", ld(malformed));
  append_kv(out, "not_found", ld(not_found));
  append_kv(out, "storage_unavailable", ld(storage_failures));
  append_kv(out, "deadline_exceeded", ld(deadline_exceeded));
  out += "},\"tokens\":{";
  append_kv(out, "issued", ld(tokens_issued), true);
  append_kv(out, "redeemed", ld(redemptions));
  append_kv(out, "integrity_failures", ld(integrity_failures));
  append_kv(out, "expired", ld(expired));
  append_kv(out, "replayed", ld(replayed));
  out += '}';
  append_kv(out, "audit_failures", ld(audit_failures));
  out += ",\"latency\":";
  out += latency_histogram.to_json();
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EventLog
// ---------------------------------------------------------------------------

EventLog::EventLog(std::string path) : path_(std::move(path)) {}

void EventLog::set_hook(Hook hook) {
  std::lock_guard<std::mutex> lk(mu_);
  hook_ = std::move(hook);
}

void EventLog::emit(Severity severity, const std::string& kind, jsonlite::Object fields) {
  jsonlite::Object o;
  o["ts_unix_ms"] = jsonlite::Value{system_now_unix_ms()};
  o["severity"]   = jsonlite::Value{to_string(severity)};
  o["kind"]       = jsonlite::Value{kind};
  o["fields"]     = jsonlite::Value{std::move(fields)};
  const std::string line = jsonlite::to_json(jsonlite::Value{std::move(o)});

  emitted_.fetch_add(1, std::memory_order_relaxed);

  Hook hook;
  {
    std::lock_guard<std::mutex> lk(mu_);
    hook = hook_;
  }
  if (hook) {
    try {
      hook(line);
    } catch (...) {
      write_failures_.fetch_add(1, std::memory_order_relaxed);
    }
    return;
  }

  std::lock_guard<std::mutex> lk(mu_);

  if (path_.empty()) {
    if (severity != Severity::info) std::fprintf(stderr, "%s\n", line.c_str());
    return;
  }

  // Open per line so external rotation is picked up without a signal.
  FILE* f = std::fopen(path_.c_str(), "a");
  if (!f) {
    write_failures_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  const std::string framed = line + "\n";
  if (std::fwrite(framed.data(), 1, framed.size(), f) != framed.size()) {
    write_failures_.fetch_add(1, std::memory_order_relaxed);
  }
  std::fclose(f);
}

void EventLog::emit_resolution(const ResolutionEvent& ev) {
  jsonlite::Object fields;
  fields["trace_id"]     = jsonlite::Value{ev.trace_id};
  fields["logical_name"] = jsonlite::Value{ev.logical_name};
  fields["caller_id"]    = jsonlite::Value{ev.caller_id};
  fields["policy_kind"]  = jsonlite::Value{ev.policy_kind};
  fields["ok"]           = jsonlite::Value{ev.ok};
  fields["error_code"]   = jsonlite::Value{to_string(ev.error)};
  fields["cache_hit"]    = jsonlite::Value{ev.cache_hit};
  fields["duration_ns"]  = jsonlite::Value{ev.duration_ns};
  emit(Severity::info, "resolution", std::move(fields));
}

}  // namespace warden
