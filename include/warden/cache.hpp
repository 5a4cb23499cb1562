#pragma once

// warden/cache.hpp — Sharded read-through cache of resource definitions.
//
// DESIGN:
//   Keys hash to one of N shards; each shard has its own mutex, so lookups of
//   unrelated names never contend. Entries are immutable shared_ptr<const>
//   values: a reader holding an entry keeps a consistent definition even while
//   a writer replaces it.
//
//   Single flight: the first cold lookup of a name installs an in-flight record
//   and performs the fetch outside the shard lock. Concurrent lookups of the
//   same name wait on that record's shared_future instead of fetching again.
//
// INVARIANTS:
//   - A fill whose fetch began before an invalidation of the same shard is
//     dropped. The shard epoch is captured when the fetch starts and compared
//     when it completes; invalidate() bumps it.
//   - Only definitions are cached. "Not found" and errors are never cached, so a
//     later registration becomes visible without waiting for a TTL.
//   - Never throws. A fetcher that throws std::exception becomes an error.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "warden/resource.hpp"
#include "warden/types.hpp"

namespace warden {

struct CacheEntry {
  ResourceDefinition definition;
  uint64_t expires_at_unix_ms{0};
};

struct FetchOutcome {
  bool ok{false};
  std::optional<ResourceDefinition> definition;   // empty + ok => not registered
  std::string error;
};

struct CacheLookup {
  bool ok{false};
  std::shared_ptr<const ResourceDefinition> definition;   // null + ok => not registered
  bool hit{false};
  bool deadline_exceeded{false};
  std::string error;
};

struct CacheMetrics {
  uint64_t hits{0};
  uint64_t misses{0};
  uint64_t invalidations{0};
  uint64_t stale_fills_dropped{0};
  uint64_t coalesced_waits{0};

  std::string to_json() const;
};

class DefinitionCache {
 public:
  using Fetcher = std::function<FetchOutcome(const std::string& name)>;

  static constexpr std::size_t kDefaultShards = 16;
  static constexpr uint64_t kDefaultTtlMs = 5 * 60 * 1000;

  explicit DefinitionCache(uint64_t ttl_ms = kDefaultTtlMs,
                           std::size_t shards = kDefaultShards,
                           Clock clock = wall_clock());

  DefinitionCache(const DefinitionCache&) = delete;
  DefinitionCache& operator=(const DefinitionCache&) = delete;

  // Cached definition if fresh, otherwise one shared fetch per name.
  CacheLookup get_or_fetch(const std::string& name,
                           const Fetcher& fetcher,
                           Deadline deadline = no_deadline());

  void invalidate(const std::string& name);

  CacheMetrics metrics() const;
  std::size_t size() const;
  uint64_t ttl_ms() const { return ttl_ms_; }

 private:
  struct Inflight {
    std::shared_future<FetchOutcome> result;
  };

  struct Shard {
    mutable std::mutex mu;
    std::map<std::string, std::shared_ptr<const CacheEntry>> entries;
    std::map<std::string, std::shared_ptr<Inflight>> inflight;
    uint64_t epoch{0};
  };

  Shard& shard_for(const std::string& name);

  uint64_t ttl_ms_;
  Clock clock_;
  std::vector<std::unique_ptr<Shard>> shards_;

  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};
  std::atomic<uint64_t> invalidations_{0};
  std::atomic<uint64_t> stale_fills_dropped_{0};
  std::atomic<uint64_t> coalesced_waits_{0};
};

}  // namespace warden
