#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "chains/analyzer/services/v1/chain_service.grpc.pb.h"
#include "internal/service/chain_service.hpp"

namespace chains::grpc {

class ChainServer final : public chains::analyzer::services::v1::CriticalChainService::Service {
public:
  explicit ChainServer(std::shared_ptr<chains::service::ChainService> svc);

  ::grpc::Status ComputeChains(::grpc::ServerContext*,
                               const chains::analyzer::services::v1::ComputeChainsRequest*,
                               chains::analyzer::services::v1::ComputeChainsResponse*) override;

private:
  std::shared_ptr<chains::service::ChainService> service_;
};

}
