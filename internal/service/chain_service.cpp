#include "chain_service.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/cache/chain_cache.hpp"
#include "internal/core/chain_analyzer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "observe_rpc.hpp"

namespace chains::service {

using namespace chains::analyzer::v1;

namespace {

std::uint64_t CountNodes(const google::protobuf::Map<std::string, ChainNode>& nodes) {
  std::uint64_t count = 0;
  for (const auto& [id, node] : nodes) {
    count += 1 + CountNodes(node.children());
  }
  return count;
}

} // namespace

ChainService::ChainService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.analyzer) {
    throw std::invalid_argument("ChainService requires an analyzer");
  }
  if (!ctx_.stats) {
    ctx_.stats = std::make_shared<ComputeStats>();
  }
}

ComputeChainsResponse ChainService::ComputeChains(const ComputeChainsRequest& req) {
  return ObserveRpc("ChainService.ComputeChains", [&](chains::observability::CallSpan& span) {
    span.SetRecordCount(req.records_size());
    ComputeChainsResponse resp;

    if (!ctx_.cache) {
      *resp.mutable_chains() = Compute(req);
      return resp;
    }

    auto lookup = ctx_.cache->GetOrCompute(cache::ChainCache::KeyFor(req), [&] { return Compute(req); });
    chains::observability::ChainMetrics::Instance().RecordCacheLookup(lookup.hit);

    *resp.mutable_chains() = *lookup.value;
    resp.set_from_cache(lookup.hit);
    return resp;
  });
}

CriticalRequestChains ChainService::Compute(const ComputeChainsRequest& req) {
  ctx_.stats->computations.fetch_add(1, std::memory_order_relaxed);

  try {
    auto result = ctx_.analyzer->Compute(req);
    chains::observability::ChainMetrics::Instance().RecordForest(CountNodes(result.chains()));
    CHAINS_LOG_DEBUG("chains computed", {chains::observability::IntField("records", req.records_size()),
                                         chains::observability::IntField("roots", result.chains_size())});
    return result;
  } catch (const std::exception&) {
    ctx_.stats->failed_computations.fetch_add(1, std::memory_order_relaxed);
    throw;
  }
}

} // namespace chains::service
