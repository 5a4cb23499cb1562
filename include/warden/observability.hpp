#pragma once

// warden/observability.hpp — Operational event log and resolver statistics.
//
// DESIGN:
//   Two separate streams leave the broker:
//     - the audit trail (audit.hpp): security record, hash-chained, persisted
//       through the storage adapter;
//     - the operational event log (this file): JSONL lines for operators, e.g.
//       audit write failures, integrity incidents, storage outages.
//   The event log never influences an authorization decision and never carries
//   credential references.
//
//   Nothing here is a process-wide singleton. A Resolver owns its ResolverStats
//   and receives its EventLog by reference, so several brokers can coexist.
//
// EXTENSION_POINT: exporter
//   Current: JSONL appended to a file (WARDEN_EVENT_LOG) or passed to a hook.
//   Upgrade: a hook that batches lines to a collector. Invariant: emit() must
//   never block a resolution on a slow sink for longer than one fwrite.

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "warden/jsonlite.hpp"
#include "warden/types.hpp"

namespace warden {

// ---------------------------------------------------------------------------
// ResolutionEvent — one per resolve() call
// ---------------------------------------------------------------------------
struct ResolutionEvent {
  std::string trace_id;
  std::string logical_name;
  std::string caller_id;
  std::string policy_kind;      // "boolean" | "vector" | "" when no definition
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  bool cache_hit{false};
  uint64_t duration_ns{0};
};

// ---------------------------------------------------------------------------
// LatencyHistogram — fixed-bound resolution latency histogram
// ---------------------------------------------------------------------------
// Bucket i counts durations <= kUpperBoundsUs[i] that missed bucket i-1. The
// last bucket is unbounded and reports the largest duration seen.
class LatencyHistogram {
 public:
  static constexpr std::array<uint64_t, 14> kUpperBoundsUs{
      50, 100, 250, 500, 1000, 2500, 5000, 10000, 25000, 50000,
      100000, 250000, 500000, 1000000};
  static constexpr size_t kBuckets = kUpperBoundsUs.size() + 1;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]. Upper bound of the bucket holding the p-th sample, in
  // microseconds; 0 with no samples.
  uint64_t percentile_us(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  uint64_t max_us() const { return max_us_.load(std::memory_order_relaxed); }
  uint64_t bucket_count(size_t bucket) const {
    return buckets_[bucket].load(std::memory_order_relaxed);
  }
  double mean_us() const;

  // {"count","mean_us","max_us","p50_us","p95_us","p99_us","buckets":{"le_50":n,...,"inf":n}}
  std::string to_json() const;

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_us_{0};
  std::atomic<uint64_t> max_us_{0};
};

// ---------------------------------------------------------------------------
// ResolverStats — per-resolver counters
// ---------------------------------------------------------------------------
// Thread-safe. All counters are atomic and relaxed; to_json() is a best-effort
// snapshot, not a consistent cut.
class ResolverStats {
 public:
  void record_resolution(const ResolutionEvent& ev);
  std::string to_json() const;

  std::atomic<uint64_t> resolutions{0};
  std::atomic<uint64_t> granted{0};
  std::atomic<uint64_t> denied{0};
  std::atomic<uint64_t> malformed{0};
  std::atomic<uint64_t> not_found{0};
  std::atomic<uint64_t> storage_failures{0};
  std::atomic<uint64_t> deadline_exceeded{0};

  std::atomic<uint64_t> audit_failures{0};

  std::atomic<uint64_t> tokens_issued{0};
  std::atomic<uint64_t> redemptions{0};
  std::atomic<uint64_t> integrity_failures{0};
  std::atomic<uint64_t> expired{0};
  std::atomic<uint64_t> replayed{0};

  LatencyHistogram latency_histogram;
};

// ---------------------------------------------------------------------------
// EventLog — JSONL operational log
// ---------------------------------------------------------------------------
// Each line: {"fields":{...},"kind":"...","severity":"...","ts_unix_ms":N}
// With neither a path nor a hook configured, warning and critical lines go to
// stderr and info lines are dropped.
class EventLog {
 public:
  using Hook = std::function<void(const std::string& line)>;

  explicit EventLog(std::string path = "");

  // Replaces file output. Called with the line, no trailing newline, outside
  // the log's lock. A hook that throws is counted in write_failures().
  void set_hook(Hook hook);

  void emit(Severity severity, const std::string& kind, jsonlite::Object fields);
  void emit_resolution(const ResolutionEvent& ev);

  uint64_t emitted() const { return emitted_.load(std::memory_order_relaxed); }
  uint64_t write_failures() const { return write_failures_.load(std::memory_order_relaxed); }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  Hook hook_;
  mutable std::mutex mu_;
  std::atomic<uint64_t> emitted_{0};
  std::atomic<uint64_t> write_failures_{0};
};

}  // namespace warden
