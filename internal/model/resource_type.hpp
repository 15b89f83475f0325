#pragma once

#include <cstdint>
#include <string_view>

namespace chains::model {

// kUnspecified: the recorder did not report a type (redirect hops).
// kUnknown: a value this build does not recognize.
enum class ResourceType : std::uint8_t {
  kUnspecified = 0,
  kDocument = 1,
  kStylesheet = 2,
  kImage = 3,
  kMedia = 4,
  kFont = 5,
  kScript = 6,
  kTextTrack = 7,
  kXhr = 8,
  kFetch = 9,
  kEventSource = 10,
  kWebSocket = 11,
  kManifest = 12,
  kSignedExchange = 13,
  kPing = 14,
  kCspViolationReport = 15,
  kOther = 16,
  kUnknown = 255,
};

constexpr std::string_view ToString(ResourceType type) {
  switch (type) {
    case ResourceType::kDocument:
      return "Document";
    case ResourceType::kStylesheet:
      return "Stylesheet";
    case ResourceType::kImage:
      return "Image";
    case ResourceType::kMedia:
      return "Media";
    case ResourceType::kFont:
      return "Font";
    case ResourceType::kScript:
      return "Script";
    case ResourceType::kTextTrack:
      return "TextTrack";
    case ResourceType::kXhr:
      return "XHR";
    case ResourceType::kFetch:
      return "Fetch";
    case ResourceType::kEventSource:
      return "EventSource";
    case ResourceType::kWebSocket:
      return "WebSocket";
    case ResourceType::kManifest:
      return "Manifest";
    case ResourceType::kSignedExchange:
      return "SignedExchange";
    case ResourceType::kPing:
      return "Ping";
    case ResourceType::kCspViolationReport:
      return "CSPViolationReport";
    case ResourceType::kOther:
      return "Other";
    case ResourceType::kUnknown:
      return "unknown";
    case ResourceType::kUnspecified:
    default:
      return "unspecified";
  }
}

constexpr bool IsDeclared(ResourceType type) {
  return type != ResourceType::kUnspecified;
}

} // namespace chains::model
