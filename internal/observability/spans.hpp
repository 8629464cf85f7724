#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace scout::runtime::config {
class RuntimeConfig;
}

namespace scout::observability {

/*
  Tracing and metrics facade.

  Backed by OpenTelemetry with OTLP exporters when built with ENABLE_OTEL,
  inline no-ops otherwise, so call sites never need an #ifdef.
*/

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"device-scout"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

OtlpConfig ToOtlpConfig(const scout::runtime::config::RuntimeConfig& config);

bool InitializeTracing(const scout::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const scout::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
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

  // status is the probe summary status name ("completed", "timed_out", ...).
  void RecordProbeRun(std::string_view probe, std::string_view status);
  void ObserveProbeDurationMs(std::string_view probe, double duration_ms);
  void AddProbeResults(std::string_view probe, std::uint64_t results);
  void ObserveRunDurationMs(double duration_ms);
  void SetDevicesFound(std::uint64_t relevant, std::uint64_t total);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline OtlpConfig ToOtlpConfig(const scout::runtime::config::RuntimeConfig&) {
  return {};
}

inline bool InitializeTracing(const scout::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const scout::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordProbeRun(std::string_view, std::string_view) {
}

inline void Metrics::ObserveProbeDurationMs(std::string_view, double) {
}

inline void Metrics::AddProbeResults(std::string_view, std::uint64_t) {
}

inline void Metrics::ObserveRunDurationMs(double) {
}

inline void Metrics::SetDevicesFound(std::uint64_t, std::uint64_t) {
}
#endif

} // namespace scout::observability
