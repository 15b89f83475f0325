#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "chains/analyzer/v1.hpp"

namespace chains::cache {

struct CacheStats {
  std::uint64_t hits    = 0;
  std::uint64_t misses  = 0;
  std::uint64_t entries = 0;
};

/*
  Compute-once store of serialized chains keyed by input identity.

  Concurrent callers asking for the same key share one computation.
  Failed computations are not kept: every caller waiting on them sees
  the exception, and the next caller computes again. With max_entries
  set, the oldest completed entries are evicted first.
*/
class ChainCache {
 public:
  using Value   = std::shared_ptr<const chains::analyzer::v1::CriticalRequestChains>;
  using Compute = std::function<chains::analyzer::v1::CriticalRequestChains()>;

  struct Lookup {
    Value value;
    bool  hit = false;
  };

  explicit ChainCache(std::size_t max_entries = 0);

  Lookup GetOrCompute(const std::string& key, const Compute& compute);

  CacheStats  Stats() const;
  std::size_t Size() const;
  void        Clear();

  // cache_key when the caller set one, else the request's deterministic encoding.
  static std::string KeyFor(const chains::analyzer::v1::ComputeChainsRequest& request);

 private:
  void EvictLocked();

  std::size_t max_entries_;

  mutable std::mutex                                         mutex_;
  std::unordered_map<std::string, std::shared_future<Value>> entries_;
  std::deque<std::string>                                    completed_;

  std::uint64_t hits_   = 0;
  std::uint64_t misses_ = 0;
};

} // namespace chains::cache
