#pragma once

#include "chains/analyzer/v1.hpp"
#include "service_context.hpp"

namespace chains::service {

class ChainService {
public:
  explicit ChainService(ServiceContext ctx);

  chains::analyzer::v1::ComputeChainsResponse
  ComputeChains(const chains::analyzer::v1::ComputeChainsRequest& req);

private:
  chains::analyzer::v1::CriticalRequestChains Compute(const chains::analyzer::v1::ComputeChainsRequest& req);

  ServiceContext ctx_;
};

}
