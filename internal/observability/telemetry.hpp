#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace chains::runtime::config {
class ObservabilityConfig;
} // namespace chains::runtime::config

namespace chains::observability {

/*
  OTLP/gRPC export of call spans and chain metrics.

  Start* return false and install nothing when the matching switch in
  ObservabilityConfig is off or the binary was built without ENABLE_OTEL.
  Spans and metrics recorded before Start* go to the no-op providers.
*/

bool StartTracing(const chains::runtime::config::ObservabilityConfig& config);
bool StartMetrics(const chains::runtime::config::ObservabilityConfig& config);
void StopTracing();
void StopMetrics();

// One span per service call, active for the lifetime of the object.
class CallSpan {
 public:
  explicit CallSpan(std::string_view route);
  ~CallSpan();

  CallSpan(const CallSpan&)            = delete;
  CallSpan& operator=(const CallSpan&) = delete;

  void SetRecordCount(std::int64_t records);
  void Fail(std::string_view error);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class ChainMetrics {
 public:
  static ChainMetrics& Instance();

  void RecordCall(std::string_view route, bool ok, double latency_ms);
  void RecordCacheLookup(bool hit);
  void RecordForest(std::uint64_t nodes);

 private:
  ChainMetrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool StartTracing(const chains::runtime::config::ObservabilityConfig&) {
  return false;
}

inline bool StartMetrics(const chains::runtime::config::ObservabilityConfig&) {
  return false;
}

inline void StopTracing() {
}

inline void StopMetrics() {
}

inline CallSpan::CallSpan(std::string_view) {
}

inline CallSpan::~CallSpan() {
}

inline void CallSpan::SetRecordCount(std::int64_t) {
}

inline void CallSpan::Fail(std::string_view) {
}

inline ChainMetrics::ChainMetrics() {
}

inline ChainMetrics& ChainMetrics::Instance() {
  static ChainMetrics instance;
  return instance;
}

inline void ChainMetrics::RecordCall(std::string_view, bool, double) {
}

inline void ChainMetrics::RecordCacheLookup(bool) {
}

inline void ChainMetrics::RecordForest(std::uint64_t) {
}
#endif

} // namespace chains::observability
