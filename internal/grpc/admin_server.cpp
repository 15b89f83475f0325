#include "admin_server.hpp"

#include <utility>

#include "grpc_error.hpp"

namespace chains::grpc {

AdminServer::AdminServer(std::shared_ptr<chains::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const chains::analyzer::services::v1::StatsRequest* req,
                                  chains::analyzer::services::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace chains::grpc
