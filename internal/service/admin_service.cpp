#include "admin_service.hpp"

#include <utility>

#include "internal/cache/chain_cache.hpp"
#include "observe_rpc.hpp"

namespace chains::service {

using namespace chains::analyzer::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", [&](chains::observability::CallSpan&) {
    StatsResponse resp;

    if (ctx_.stats) {
      resp.set_computations(ctx_.stats->computations.load(std::memory_order_relaxed));
      resp.set_failed_computations(ctx_.stats->failed_computations.load(std::memory_order_relaxed));
    }

    if (ctx_.cache) {
      const auto cache_stats = ctx_.cache->Stats();
      resp.set_cache_hits(cache_stats.hits);
      resp.set_cache_misses(cache_stats.misses);
      resp.set_cache_entries(cache_stats.entries);
    }

    return resp;
  });
}

} // namespace chains::service
