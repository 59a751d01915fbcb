#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace relay::runtime::config {
class RuntimeConfig;
}

namespace relay::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"dqm-relay"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const relay::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Pipeline counters exported over OTLP.

  Without ENABLE_OTEL every call is an inline no-op, so call sites never
  need to guard.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordReceive(std::string_view subsystem, bool success);
  void RecordTransferAttempt(std::string_view destination, bool success);
  void RecordTerminalFailure(std::string_view destination);
  void ObserveTransferDurationMs(std::string_view destination, double duration_ms);
  void SetStagedPayloads(std::string_view location, std::uint64_t count);

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const relay::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordReceive(std::string_view, bool) {
}

inline void Metrics::RecordTransferAttempt(std::string_view, bool) {
}

inline void Metrics::RecordTerminalFailure(std::string_view) {
}

inline void Metrics::ObserveTransferDurationMs(std::string_view, double) {
}

inline void Metrics::SetStagedPayloads(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}
#endif

} // namespace relay::observability
