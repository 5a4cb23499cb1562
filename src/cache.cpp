#include "warden/cache.hpp"

#include <exception>
#include <utility>

namespace warden {

namespace {

CacheLookup from_outcome(const FetchOutcome& outcome) {
  CacheLookup r;
  r.ok    = outcome.ok;
  r.error = outcome.error;
  if (outcome.ok && outcome.definition) {
    r.definition = std::make_shared<const ResourceDefinition>(*outcome.definition);
  }
  return r;
}

}  // namespace

std::string CacheMetrics::to_json() const {
  std::string out;
  out.reserve(128);
  out += "{\"hits\":";
  out += std::to_string(hits);
  out += ",\"misses\":";
  out += std::to_string(misses);
  out += ",\"invalidations\":";
  out += std::to_string(invalidations);
  out += ",\"stale_fills_dropped\":";
  out += std::to_string(stale_fills_dropped);
  out += ",\"coalesced_waits\":";
  out += std::to_string(coalesced_waits);
  out += '}';
  return out;
}

DefinitionCache::DefinitionCache(uint64_t ttl_ms, std::size_t shards, Clock clock)
    : ttl_ms_(ttl_ms), clock_(std::move(clock)) {
  if (shards == 0) shards = 1;
  shards_.reserve(shards);
  for (std::size_t i = 0; i < shards; ++i) shards_.push_back(std::make_unique<Shard>());
}

DefinitionCache::Shard& DefinitionCache::shard_for(const std::string& name) {
  return *shards_[std::hash<std::string>{}(name) % shards_.size()];
}

CacheLookup DefinitionCache::get_or_fetch(const std::string& name,
                                          const Fetcher& fetcher,
                                          Deadline deadline) {
  Shard& shard = shard_for(name);

  std::shared_ptr<Inflight> flight;
  std::promise<FetchOutcome> promise;
  bool leader = false;
  uint64_t epoch = 0;

  {
    std::lock_guard<std::mutex> lk(shard.mu);
    const auto it = shard.entries.find(name);
    if (it != shard.entries.end()) {
      if (clock_() < it->second->expires_at_unix_ms) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        CacheLookup r;
        r.ok  = true;
        r.hit = true;
        // Aliasing constructor: shares ownership of the immutable entry.
        r.definition = std::shared_ptr<const ResourceDefinition>(it->second, &it->second->definition);
        return r;
      }
      shard.entries.erase(it);
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    const auto running = shard.inflight.find(name);
    if (running != shard.inflight.end()) {
      flight = running->second;
    } else {
      flight = std::make_shared<Inflight>();
      flight->result = promise.get_future().share();
      shard.inflight.emplace(name, flight);
      leader = true;
      epoch  = shard.epoch;
    }
  }

  if (!leader) {
    coalesced_waits_.fetch_add(1, std::memory_order_relaxed);
    if (deadline != no_deadline() &&
        flight->result.wait_until(deadline) != std::future_status::ready) {
      CacheLookup r;
      r.deadline_exceeded = true;
      r.error = "deadline exceeded waiting for in-flight fetch";
      return r;
    }
    return from_outcome(flight->result.get());
  }

  FetchOutcome outcome;
  try {
    outcome = fetcher(name);
  } catch (const std::exception& e) {
    outcome = FetchOutcome{false, std::nullopt, std::string("fetch failed: ") + e.what()};
  } catch (...) {
    // Followers block on the promise; it must be fulfilled on every path.
    outcome = FetchOutcome{false, std::nullopt, "fetch failed: unknown exception"};
  }

  {
    std::lock_guard<std::mutex> lk(shard.mu);
    const auto running = shard.inflight.find(name);
    if (running != shard.inflight.end() && running->second == flight) {
      shard.inflight.erase(running);
    }
    if (outcome.ok && outcome.definition) {
      if (shard.epoch == epoch) {
        auto entry = std::make_shared<CacheEntry>();
        entry->definition         = *outcome.definition;
        entry->expires_at_unix_ms = clock_() + ttl_ms_;
        shard.entries.insert_or_assign(name, std::shared_ptr<const CacheEntry>(std::move(entry)));
      } else {
        stale_fills_dropped_.fetch_add(1, std::memory_order_relaxed);
      }
    }
  }

  CacheLookup r = from_outcome(outcome);
  promise.set_value(std::move(outcome));
  return r;
}

void DefinitionCache::invalidate(const std::string& name) {
  Shard& shard = shard_for(name);
  std::lock_guard<std::mutex> lk(shard.mu);
  ++shard.epoch;
  shard.entries.erase(name);
  // Waiters keep their own reference to the record; new lookups start fresh.
  shard.inflight.erase(name);
  invalidations_.fetch_add(1, std::memory_order_relaxed);
}

CacheMetrics DefinitionCache::metrics() const {
  CacheMetrics m;
  m.hits                = hits_.load(std::memory_order_relaxed);
  m.misses              = misses_.load(std::memory_order_relaxed);
  m.invalidations       = invalidations_.load(std::memory_order_relaxed);
  m.stale_fills_dropped = stale_fills_dropped_.load(std::memory_order_relaxed);
  m.coalesced_waits     = coalesced_waits_.load(std::memory_order_relaxed);
  return m;
}

std::size_t DefinitionCache::size() const {
  std::size_t n = 0;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lk(shard->mu);
    n += shard->entries.size();
  }
  return n;
}

}  // namespace warden
