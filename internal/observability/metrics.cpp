#include "internal/observability/spans.hpp"

#ifdef ELEVATOR_ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "config/config.pb.h"

namespace elevator::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

using elevator::runtime::config::ObservabilityConfig;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

constexpr const char* kServiceName = "elevator-dispatch";

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const ObservabilityConfig& config) {
  std::string endpoint = config.otlp_endpoint();
  if (endpoint.empty()) {
    if (const char* env = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
      endpoint = env;
    } else if (const char* env = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
      endpoint = env;
    }
  }

  if (config.transport() == elevator::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint.empty() ? "http://localhost:4318/v1/metrics" : endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint.empty() ? "localhost:4317" : endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
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

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> heal_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      tick_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   pending_stops_gauge;

  std::mutex                                    pending_stops_mutex;
  std::unordered_map<std::string, std::int64_t> pending_stops;
};

bool InitializeMetrics(const elevator::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(config.observability()), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", kServiceName}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

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
  impl_->meter  = provider->GetMeter(kServiceName, "0.1.0");

  impl_->request_count       = impl_->meter->CreateUInt64Counter("elevator.request.count", "1", "Total number of service requests");
  impl_->heal_count          = impl_->meter->CreateUInt64Counter("elevator.engine.heal.count", "1", "Units healed back to idle by the movement engine");
  impl_->request_latency_ms  = impl_->meter->CreateDoubleHistogram("elevator.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->tick_duration_ms    = impl_->meter->CreateDoubleHistogram("elevator.engine.tick_duration_ms", "ms", "Time spent handling one movement tick");
  impl_->pending_stops_gauge = impl_->meter->CreateInt64ObservableGauge("elevator.queue.pending_stops", "Stops waiting per unit", "1");
  impl_->pending_stops_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->pending_stops_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [elevator_id, stops] : impl->pending_stops) {
          const std::initializer_list<AttributePair> attributes = {{"elevator_id", elevator_id}};
          int_result->Observe(stops, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success, double latency_ms) {
  if (!impl_->request_count) return;

  const std::initializer_list<AttributePair> counted = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), counted);

  const std::initializer_list<AttributePair> timed = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, timed);
}

void Metrics::RecordTick(std::string_view phase, double duration_ms) {
  if (!impl_->tick_duration_ms) return;

  const std::initializer_list<AttributePair> attributes = {{"phase", std::string(phase)}};
  RecordWithAttributes(impl_->tick_duration_ms, duration_ms, attributes);
}

void Metrics::RecordHeal(std::string_view kind) {
  if (!impl_->heal_count) return;

  const std::initializer_list<AttributePair> attributes = {{"kind", std::string(kind)}};
  AddWithAttributes(impl_->heal_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::SetPendingStops(std::string_view elevator_id, std::size_t stops) {
  if (!impl_->pending_stops_gauge) return;

  std::lock_guard<std::mutex> lock(impl_->pending_stops_mutex);
  impl_->pending_stops[std::string(elevator_id)] = static_cast<std::int64_t>(stops);
}

} // namespace elevator::observability

#endif
