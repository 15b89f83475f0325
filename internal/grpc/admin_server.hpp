#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "chains/analyzer/services/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace chains::grpc {

class AdminServer final : public chains::analyzer::services::v1::ChainAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<chains::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*,
                       const chains::analyzer::services::v1::StatsRequest*,
                       chains::analyzer::services::v1::StatsResponse*) override;

private:
  std::shared_ptr<chains::service::AdminService> service_;
};

}
