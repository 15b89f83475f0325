#include "chain_server.hpp"

#include <utility>

#include "grpc_error.hpp"

namespace chains::grpc {

using namespace chains::analyzer::services::v1;

ChainServer::ChainServer(std::shared_ptr<chains::service::ChainService> svc) : service_(std::move(svc)) {
}

::grpc::Status ChainServer::ComputeChains(::grpc::ServerContext*, const ComputeChainsRequest* req, ComputeChainsResponse* resp) {
  try {
    *resp = service_->ComputeChains(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace chains::grpc
