#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/model/workflow_state.hpp"

namespace workflow::runtime::config {
class RuntimeConfig;
}

namespace workflow::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"workflow-manager"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const workflow::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-level counters.

  Durable per-item samples go through events::EventEmitter; these are
  exporter-side aggregates only. Without WORKFLOW_ENABLE_OTEL every
  call compiles to a no-op.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordTransition(model::WorkflowState from, model::WorkflowState to);
  void RecordRetry(std::int32_t retry_count);
  void RecordDeadLetter(bool permanent);
  void RecordQuotaExceeded(std::string_view service_name);
  void RecordLeaseDenied();
  void ObserveClaimLatencyMs(double latency_ms);

 private:
  Metrics();
#ifdef WORKFLOW_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef WORKFLOW_ENABLE_OTEL
inline bool InitializeMetrics(const workflow::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordTransition(model::WorkflowState, model::WorkflowState) {
}

inline void Metrics::RecordRetry(std::int32_t) {
}

inline void Metrics::RecordDeadLetter(bool) {
}

inline void Metrics::RecordQuotaExceeded(std::string_view) {
}

inline void Metrics::RecordLeaseDenied() {
}

inline void Metrics::ObserveClaimLatencyMs(double) {
}
#endif

} // namespace workflow::observability
