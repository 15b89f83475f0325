#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

namespace chains::core { class ChainAnalyzer; }
namespace chains::cache { class ChainCache; }

namespace chains::service {

// Process-wide counters reported by AdminService.Stats.
struct ComputeStats {
  std::atomic<std::uint64_t> computations{0};
  std::atomic<std::uint64_t> failed_computations{0};
};

/*
  Dependency container shared by all services.

  cache is null when caching is disabled.
*/
struct ServiceContext {
  std::shared_ptr<chains::core::ChainAnalyzer> analyzer;
  std::shared_ptr<chains::cache::ChainCache> cache;
  std::shared_ptr<ComputeStats> stats;
};

}
