#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace scribe::runtime::config {
class RuntimeConfig;
}

namespace scribe::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"mediascribe"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t collection_interval_ms{1000};
};

bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeMetrics(const scribe::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Batch metrics. Every call is a no-op unless built with ENABLE_OTEL and
  metrics were initialized.
*/
class Metrics {
 public:
  static Metrics& Instance();

  // outcome: success, failed, skipped, cancelled
  void RecordTask(std::string_view outcome, std::string_view error_kind = {});
  void ObserveTaskDurationMs(double duration_ms);
  void ObserveRealtimeFactor(double rtf);
  void ObserveEngineDurationMs(std::string_view engine, double duration_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const scribe::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordTask(std::string_view, std::string_view) {
}

inline void Metrics::ObserveTaskDurationMs(double) {
}

inline void Metrics::ObserveRealtimeFactor(double) {
}

inline void Metrics::ObserveEngineDurationMs(std::string_view, double) {
}
#endif

} // namespace scribe::observability
