#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace chains::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace chains::util;

  if (dynamic_cast<const PreconditionViolation*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace chains::grpc
