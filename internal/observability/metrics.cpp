#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define SCOUT_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define SCOUT_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace scout::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> probe_runs;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> probe_results;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      probe_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      run_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   devices_gauge;

  std::atomic<std::int64_t> devices_relevant{0};
  std::atomic<std::int64_t> devices_total{0};
};

bool InitializeMetrics(const scout::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  auto otlp_config = ToOtlpConfig(config);
  auto endpoint    = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000);
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

#ifdef SCOUT_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  auto                         res   = resource::Resource::Create(attrs);
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  ConfigureResource(*g_provider, res);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("device-scout", "0.1.0");

  impl_->probe_runs        = impl_->meter->CreateUInt64Counter("scout.probe.runs", "Probe runs by outcome", "1");
  impl_->probe_results     = impl_->meter->CreateUInt64Counter("scout.probe.results", "Probe results streamed into the merger", "1");
  impl_->probe_duration_ms = impl_->meter->CreateDoubleHistogram("scout.probe.duration_ms", "Wall time spent inside each probe", "ms");
  impl_->run_duration_ms   = impl_->meter->CreateDoubleHistogram("scout.run.duration_ms", "End-to-end discovery run duration", "ms");
  impl_->devices_gauge     = impl_->meter->CreateInt64ObservableGauge("scout.devices", "Devices found by the last run", "1");
  impl_->devices_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        const std::initializer_list<AttributePair> relevant = {{"set", "relevant"}};
        const std::initializer_list<AttributePair> total    = {{"set", "merged"}};
        int_result->Observe(impl->devices_relevant.load(), relevant);
        int_result->Observe(impl->devices_total.load(), total);
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordProbeRun(std::string_view probe, std::string_view status) {
  if (!impl_ || !impl_->probe_runs) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"probe", std::string(probe)}, {"status", std::string(status)}};
  AddWithAttributes(impl_->probe_runs, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveProbeDurationMs(std::string_view probe, double duration_ms) {
  if (!impl_ || !impl_->probe_duration_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"probe", std::string(probe)}};
  RecordWithAttributes(impl_->probe_duration_ms, duration_ms, attributes);
}

void Metrics::AddProbeResults(std::string_view probe, std::uint64_t results) {
  if (!impl_ || !impl_->probe_results || results == 0) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"probe", std::string(probe)}};
  AddWithAttributes(impl_->probe_results, results, attributes);
}

void Metrics::ObserveRunDurationMs(double duration_ms) {
  if (!impl_ || !impl_->run_duration_ms) {
    return;
  }
  RecordWithAttributes(impl_->run_duration_ms, duration_ms, std::initializer_list<AttributePair>{});
}

void Metrics::SetDevicesFound(std::uint64_t relevant, std::uint64_t total) {
  if (!impl_) {
    return;
  }
  impl_->devices_relevant = static_cast<std::int64_t>(relevant);
  impl_->devices_total    = static_cast<std::int64_t>(total);
}

} // namespace scout::observability

#endif
