#pragma once

#include <cstdint>
#include <string_view>

namespace chains::model {

enum class Priority : std::uint8_t {
  kUnspecified = 0,
  kVeryLow = 1,
  kLow = 2,
  kMedium = 3,
  kHigh = 4,
  kVeryHigh = 5,
  kUnknown = 255,
};

constexpr bool IsDeclared(Priority priority) {
  return priority != Priority::kUnspecified;
}

constexpr bool IsRanked(Priority priority) {
  return priority >= Priority::kVeryLow && priority <= Priority::kVeryHigh;
}

// Unranked priorities never satisfy a threshold.
constexpr bool IsAtLeast(Priority priority, Priority threshold) {
  if (!IsRanked(priority) || !IsRanked(threshold)) {
    return false;
  }
  return static_cast<std::uint8_t>(priority) >= static_cast<std::uint8_t>(threshold);
}

constexpr std::string_view ToString(Priority priority) {
  switch (priority) {
    case Priority::kVeryLow:
      return "VeryLow";
    case Priority::kLow:
      return "Low";
    case Priority::kMedium:
      return "Medium";
    case Priority::kHigh:
      return "High";
    case Priority::kVeryHigh:
      return "VeryHigh";
    case Priority::kUnknown:
      return "unknown";
    case Priority::kUnspecified:
    default:
      return "unspecified";
  }
}

} // namespace chains::model
