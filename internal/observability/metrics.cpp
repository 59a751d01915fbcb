#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define RELAY_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define RELAY_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace relay::observability {
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

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> receive_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> transfer_attempts;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> terminal_failures;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      transfer_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   staged_gauge;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;

  std::mutex                                    staged_mutex;
  std::unordered_map<std::string, std::int64_t> staged_values;
};

bool InitializeMetrics(const relay::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == relay::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  auto endpoint = ResolveEndpoint(otlp_config);

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

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
#ifdef RELAY_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
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
  impl_->meter  = provider->GetMeter("dqm-relay", "0.1.0");

  impl_->receive_count        = impl_->meter->CreateUInt64Counter("relay.receive.count", "1", "Payloads offered to the receiver");
  impl_->transfer_attempts    = impl_->meter->CreateUInt64Counter("relay.transfer.attempts", "1", "Delivery attempts per destination");
  impl_->terminal_failures    = impl_->meter->CreateUInt64Counter("relay.transfer.terminal_failures", "1", "Deliveries given up on");
  impl_->transfer_duration_ms = impl_->meter->CreateDoubleHistogram("relay.transfer.duration_ms", "ms", "Delivery attempt duration in milliseconds");
  impl_->staged_gauge         = impl_->meter->CreateInt64ObservableGauge("relay.staging.payloads", "Payloads held in staging", "1");
  impl_->request_count        = impl_->meter->CreateUInt64Counter("relay.rpc.requests", "1", "Operator and ingest RPCs");
  impl_->request_latency_ms   = impl_->meter->CreateDoubleHistogram("relay.rpc.latency_ms", "ms", "RPC latency in milliseconds");
  impl_->staged_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->staged_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [location, count] : impl->staged_values) {
          const std::initializer_list<AttributePair> attributes = {{"location", location}};
          int_result->Observe(count, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordReceive(std::string_view subsystem, bool success) {
  if (!impl_ || !impl_->receive_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"subsystem", opentelemetry::nostd::string_view(subsystem.data(), subsystem.size())}, {"success", success}};
  AddWithAttributes(impl_->receive_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordTransferAttempt(std::string_view destination, bool success) {
  if (!impl_ || !impl_->transfer_attempts) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"destination", opentelemetry::nostd::string_view(destination.data(), destination.size())}, {"success", success}};
  AddWithAttributes(impl_->transfer_attempts, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordTerminalFailure(std::string_view destination) {
  if (!impl_ || !impl_->terminal_failures) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"destination", opentelemetry::nostd::string_view(destination.data(), destination.size())}};
  AddWithAttributes(impl_->terminal_failures, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveTransferDurationMs(std::string_view destination, double duration_ms) {
  if (!impl_ || !impl_->transfer_duration_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"destination", opentelemetry::nostd::string_view(destination.data(), destination.size())}};
  RecordWithAttributes(impl_->transfer_duration_ms, duration_ms, attributes);
}

void Metrics::SetStagedPayloads(std::string_view location, std::uint64_t count) {
  if (!impl_ || !impl_->staged_gauge) {
    return;
  }
  std::lock_guard<std::mutex> lock(impl_->staged_mutex);
  impl_->staged_values[std::string(location)] = static_cast<std::int64_t>(count);
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", opentelemetry::nostd::string_view(route.data(), route.size())}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", opentelemetry::nostd::string_view(route.data(), route.size())}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

} // namespace relay::observability

#endif
