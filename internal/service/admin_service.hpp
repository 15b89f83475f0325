#pragma once

#include "chains/analyzer/v1.hpp"
#include "service_context.hpp"

namespace chains::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  chains::analyzer::v1::StatsResponse
  Stats(const chains::analyzer::v1::StatsRequest& req);

private:
  ServiceContext ctx_;
};

}
