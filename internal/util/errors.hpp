#pragma once

#include <stdexcept>
#include <string>

namespace chains::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Malformed request list: ambiguous or invalid root, duplicate ids,
// redirect cycles. Not recoverable by the caller retrying.
class PreconditionViolation : public std::runtime_error {
 public:
  explicit PreconditionViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace chains::util
