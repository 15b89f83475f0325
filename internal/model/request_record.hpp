#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/priority.hpp"
#include "internal/model/resource_type.hpp"

namespace chains::model {

enum class InitiatorKind : std::uint8_t {
  kUnspecified = 0,
  kParser = 1,
  kScript = 2,
  kPreload = 3,
  kSignedExchange = 4,
  kPreflight = 5,
  kOther = 6,
  kUnknown = 255,
};

struct Initiator {
  InitiatorKind kind = InitiatorKind::kUnspecified;
  std::string url;
};

/*
  Forward reference of a redirect hop.

  request_id names the next recorded hop; the other fields describe the
  destination for when that hop is not part of the input.
*/
struct RedirectTarget {
  std::string request_id;
  ResourceType resource_type = ResourceType::kUnspecified;
  Priority priority = Priority::kUnspecified;
  std::string frame_id;
  std::string url;
};

struct RequestRecord {
  std::string id;
  std::string url;

  ResourceType resource_type = ResourceType::kUnspecified;
  Priority priority = Priority::kUnspecified;
  std::string frame_id;

  std::optional<Initiator> initiator;

  double start_time = 0;
  double response_received_time = 0;
  double end_time = 0;

  std::int32_t status_code = 0;
  std::string mime_type;

  std::optional<RedirectTarget> redirect_destination;

  bool is_link_preload = false;
  bool finished = false;
};

} // namespace chains::model
