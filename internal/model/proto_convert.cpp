#include "internal/model/proto_convert.hpp"

namespace chains::model {

namespace v1 = chains::analyzer::v1;

ResourceType FromProto(v1::ResourceType type) {
  switch (type) {
    case v1::RESOURCE_TYPE_UNSPECIFIED:
      return ResourceType::kUnspecified;
    case v1::RESOURCE_TYPE_DOCUMENT:
      return ResourceType::kDocument;
    case v1::RESOURCE_TYPE_STYLESHEET:
      return ResourceType::kStylesheet;
    case v1::RESOURCE_TYPE_IMAGE:
      return ResourceType::kImage;
    case v1::RESOURCE_TYPE_MEDIA:
      return ResourceType::kMedia;
    case v1::RESOURCE_TYPE_FONT:
      return ResourceType::kFont;
    case v1::RESOURCE_TYPE_SCRIPT:
      return ResourceType::kScript;
    case v1::RESOURCE_TYPE_TEXT_TRACK:
      return ResourceType::kTextTrack;
    case v1::RESOURCE_TYPE_XHR:
      return ResourceType::kXhr;
    case v1::RESOURCE_TYPE_FETCH:
      return ResourceType::kFetch;
    case v1::RESOURCE_TYPE_EVENT_SOURCE:
      return ResourceType::kEventSource;
    case v1::RESOURCE_TYPE_WEB_SOCKET:
      return ResourceType::kWebSocket;
    case v1::RESOURCE_TYPE_MANIFEST:
      return ResourceType::kManifest;
    case v1::RESOURCE_TYPE_SIGNED_EXCHANGE:
      return ResourceType::kSignedExchange;
    case v1::RESOURCE_TYPE_PING:
      return ResourceType::kPing;
    case v1::RESOURCE_TYPE_CSP_VIOLATION_REPORT:
      return ResourceType::kCspViolationReport;
    case v1::RESOURCE_TYPE_OTHER:
      return ResourceType::kOther;
    default:
      return ResourceType::kUnknown;
  }
}

Priority FromProto(v1::ResourcePriority priority) {
  switch (priority) {
    case v1::RESOURCE_PRIORITY_UNSPECIFIED:
      return Priority::kUnspecified;
    case v1::RESOURCE_PRIORITY_VERY_LOW:
      return Priority::kVeryLow;
    case v1::RESOURCE_PRIORITY_LOW:
      return Priority::kLow;
    case v1::RESOURCE_PRIORITY_MEDIUM:
      return Priority::kMedium;
    case v1::RESOURCE_PRIORITY_HIGH:
      return Priority::kHigh;
    case v1::RESOURCE_PRIORITY_VERY_HIGH:
      return Priority::kVeryHigh;
    default:
      return Priority::kUnknown;
  }
}

InitiatorKind FromProto(v1::InitiatorType type) {
  switch (type) {
    case v1::INITIATOR_TYPE_UNSPECIFIED:
      return InitiatorKind::kUnspecified;
    case v1::INITIATOR_TYPE_PARSER:
      return InitiatorKind::kParser;
    case v1::INITIATOR_TYPE_SCRIPT:
      return InitiatorKind::kScript;
    case v1::INITIATOR_TYPE_PRELOAD:
      return InitiatorKind::kPreload;
    case v1::INITIATOR_TYPE_SIGNED_EXCHANGE:
      return InitiatorKind::kSignedExchange;
    case v1::INITIATOR_TYPE_PREFLIGHT:
      return InitiatorKind::kPreflight;
    case v1::INITIATOR_TYPE_OTHER:
      return InitiatorKind::kOther;
    default:
      return InitiatorKind::kUnknown;
  }
}

v1::ResourceType ToProto(ResourceType type) {
  if (type == ResourceType::kUnknown) {
    return v1::RESOURCE_TYPE_UNSPECIFIED;
  }
  return static_cast<v1::ResourceType>(static_cast<int>(type));
}

v1::ResourcePriority ToProto(Priority priority) {
  if (priority == Priority::kUnknown) {
    return v1::RESOURCE_PRIORITY_UNSPECIFIED;
  }
  return static_cast<v1::ResourcePriority>(static_cast<int>(priority));
}

v1::InitiatorType ToProto(InitiatorKind kind) {
  if (kind == InitiatorKind::kUnknown) {
    return v1::INITIATOR_TYPE_UNSPECIFIED;
  }
  return static_cast<v1::InitiatorType>(static_cast<int>(kind));
}

// ------------------------------------------------------------
// NetworkRequest <-> RequestRecord
// ------------------------------------------------------------

RequestRecord FromProto(const v1::NetworkRequest& request) {
  RequestRecord record;
  record.id = request.request_id();
  record.url = request.url();
  record.resource_type = FromProto(request.resource_type());
  record.priority = FromProto(request.priority());
  record.frame_id = request.frame_id();

  if (request.has_initiator()) {
    Initiator initiator;
    initiator.kind = FromProto(request.initiator().type());
    initiator.url = request.initiator().url();
    record.initiator = std::move(initiator);
  }

  record.start_time = request.start_time();
  record.response_received_time = request.response_received_time();
  record.end_time = request.end_time();
  record.status_code = request.status_code();
  record.mime_type = request.mime_type();

  if (request.has_redirect_destination()) {
    const auto& destination = request.redirect_destination();
    RedirectTarget target;
    target.request_id = destination.request_id();
    target.resource_type = FromProto(destination.resource_type());
    target.priority = FromProto(destination.priority());
    target.frame_id = destination.frame_id();
    target.url = destination.url();
    record.redirect_destination = std::move(target);
  }

  record.is_link_preload = request.is_link_preload();
  record.finished = request.finished();
  return record;
}

v1::NetworkRequest ToProto(const RequestRecord& record) {
  v1::NetworkRequest request;
  request.set_request_id(record.id);
  request.set_url(record.url);
  request.set_resource_type(ToProto(record.resource_type));
  request.set_priority(ToProto(record.priority));
  request.set_frame_id(record.frame_id);

  if (record.initiator) {
    auto* initiator = request.mutable_initiator();
    initiator->set_type(ToProto(record.initiator->kind));
    initiator->set_url(record.initiator->url);
  }

  request.set_start_time(record.start_time);
  request.set_response_received_time(record.response_received_time);
  request.set_end_time(record.end_time);
  request.set_status_code(record.status_code);
  request.set_mime_type(record.mime_type);

  if (record.redirect_destination) {
    auto* destination = request.mutable_redirect_destination();
    destination->set_request_id(record.redirect_destination->request_id);
    destination->set_resource_type(ToProto(record.redirect_destination->resource_type));
    destination->set_priority(ToProto(record.redirect_destination->priority));
    destination->set_frame_id(record.redirect_destination->frame_id);
    destination->set_url(record.redirect_destination->url);
  }

  request.set_is_link_preload(record.is_link_preload);
  request.set_finished(record.finished);
  return request;
}

} // namespace chains::model
