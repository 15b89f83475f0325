#include "internal/cache/chain_cache.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include <exception>
#include <utility>

#include "internal/util/errors.hpp"

namespace chains::cache {

namespace v1 = chains::analyzer::v1;

ChainCache::ChainCache(std::size_t max_entries) : max_entries_(max_entries) {
}

// ------------------------------------------------------------
// GetOrCompute
// ------------------------------------------------------------

ChainCache::Lookup ChainCache::GetOrCompute(const std::string& key, const Compute& compute) {
  std::promise<Value>       promise;
  std::shared_future<Value> pending;

  {
    std::lock_guard lock(mutex_);
    if (auto it = entries_.find(key); it != entries_.end()) {
      ++hits_;
      pending = it->second;
    } else {
      ++misses_;
      entries_.emplace(key, promise.get_future().share());
    }
  }

  if (pending.valid()) {
    return {pending.get(), true};
  }

  Value value;
  try {
    value = std::make_shared<const v1::CriticalRequestChains>(compute());
  } catch (...) {
    {
      std::lock_guard lock(mutex_);
      entries_.erase(key);
    }
    promise.set_exception(std::current_exception());
    throw;
  }

  {
    std::lock_guard lock(mutex_);
    completed_.push_back(key);
    EvictLocked();
  }
  promise.set_value(value);

  return {std::move(value), false};
}

void ChainCache::EvictLocked() {
  if (max_entries_ == 0) {
    return;
  }

  while (completed_.size() > max_entries_) {
    entries_.erase(completed_.front());
    completed_.pop_front();
  }
}

// ------------------------------------------------------------
// Introspection
// ------------------------------------------------------------

CacheStats ChainCache::Stats() const {
  std::lock_guard lock(mutex_);
  return CacheStats{hits_, misses_, static_cast<std::uint64_t>(completed_.size())};
}

std::size_t ChainCache::Size() const {
  std::lock_guard lock(mutex_);
  return completed_.size();
}

void ChainCache::Clear() {
  std::lock_guard lock(mutex_);

  // In-flight computations stay registered so their waiters still share them.
  for (const auto& key : completed_) {
    entries_.erase(key);
  }
  completed_.clear();
}

std::string ChainCache::KeyFor(const v1::ComputeChainsRequest& request) {
  if (!request.cache_key().empty()) {
    return "key:" + request.cache_key();
  }

  std::string bytes;
  {
    google::protobuf::io::StringOutputStream stream(&bytes);
    google::protobuf::io::CodedOutputStream  coded(&stream);
    coded.SetSerializationDeterministic(true);
    if (!request.SerializeToCodedStream(&coded)) {
      throw util::InvalidArgument("compute request cannot be encoded as a cache key");
    }
  }
  return "req:" + bytes;
}

} // namespace chains::cache
