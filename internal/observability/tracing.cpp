#include "internal/observability/spans.hpp"

#ifdef ELEVATOR_ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace elevator::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

using elevator::runtime::config::ObservabilityConfig;

namespace {
constexpr const char* kServiceName   = "elevator-dispatch";
constexpr const char* kTracerVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

bool UsesHttp(const ObservabilityConfig& config) {
  return config.transport() == elevator::runtime::config::OTLP_TRANSPORT_HTTP;
}

std::string TracesEndpoint(const ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) return config.otlp_endpoint();
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT")) return endpoint;
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) return endpoint;
  return UsesHttp(config) ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> BuildExporter(const ObservabilityConfig& config) {
  if (UsesHttp(config)) {
    otlp::OtlpHttpExporterOptions options;
    options.url = TracesEndpoint(config);
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = TracesEndpoint(config);
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const elevator::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(BuildExporter(config.observability()), sdktrace::BatchSpanProcessorOptions{});
  resource::ResourceAttributes attrs = {{"service.name", kServiceName}};

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs)));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kServiceName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  // no tracer until InitializeTracing; spans are dropped
  if (!g_tracer) return;

  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_->span) impl_->span->End();
}

void SpanScope::TagUnit(std::string_view elevator_id, std::string_view state, int floor) {
  if (!impl_->span) return;
  impl_->span->SetAttribute("elevator.id", std::string(elevator_id));
  impl_->span->SetAttribute("elevator.state", std::string(state));
  impl_->span->SetAttribute("elevator.floor", static_cast<int64_t>(floor));
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_->span) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace elevator::observability

#endif
