#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace pipeline::runtime::config {
class RuntimeConfig;
}

namespace pipeline::observability {

/*
  Tracing and metrics for store operations.

  Built with ENABLE_OTEL the calls export over OTLP; without it every
  call below is an inline no-op and no OpenTelemetry header is pulled in.
*/

bool InitializeTracing(const pipeline::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const pipeline::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

#ifdef ENABLE_OTEL
enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpConfig {
  std::string   service_name{"pipeline-store"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{1000};

  // resource attributes identifying the store being observed
  std::string workspace_id{};
  std::string store_backend{};
};

// Endpoint precedence: config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
OtlpConfig ResolveOtlpConfig(const pipeline::runtime::config::RuntimeConfig& config, OtlpSignal signal);
#endif

// One span per store operation, active for the scope's lifetime.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // one count per store operation, labelled op + success
  void RecordOperation(std::string_view op, bool success);
  void ObserveOperationLatencyMs(std::string_view op, double latency_ms);

  // outcome: submitted, claimed, completed, retried, dead_lettered, lease_expired
  void RecordJobOutcome(std::string_view kind, std::string_view outcome);

  // persistence conflicts that forced a retry
  void RecordPersistenceConflict(std::string_view backend);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const pipeline::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const pipeline::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordOperation(std::string_view, bool) {
}

inline void Metrics::ObserveOperationLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordJobOutcome(std::string_view, std::string_view) {
}

inline void Metrics::RecordPersistenceConflict(std::string_view) {
}
#endif

} // namespace pipeline::observability
