#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/service/service_context.hpp"

namespace chains::factory {

/*
  Everything the server needs, built from one runtime config.

  Lives for the lifetime of the process.
*/
struct Application {
  chains::service::ServiceContext context;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Composition root of the application: the only place that wires
  concrete components together.
*/
Application Build(const chains::runtime::config::RuntimeConfig& config);

} // namespace chains::factory
