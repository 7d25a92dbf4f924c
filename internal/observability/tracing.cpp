#include "internal/observability/spans.hpp"

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <mutex>
#include <utility>
#endif

namespace convtree::observability {

namespace {

std::string BackendName(const convtree::runtime::config::DatabaseConfig& database) {
  switch (database.backend_case()) {
    case convtree::runtime::config::DatabaseConfig::kSqlite:
      return "sqlite";
    case convtree::runtime::config::DatabaseConfig::kPostgres:
      return "postgresql";
    default:
      return "memory";
  }
}

} // namespace

bool InitializeTracing(const convtree::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  TracingOptions options;
  options.backend  = BackendName(config.database());
  options.endpoint = observability.otlp_endpoint();
  options.use_http = observability.transport() == convtree::runtime::config::OTLP_TRANSPORT_HTTP;
  return InitializeTracing(options);
}

#ifdef ENABLE_OTEL

namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kInstrumentationName    = "convtree.tree";
constexpr const char* kInstrumentationVersion = "0.1.0";

struct TracingState {
  std::mutex                                          mutex;
  std::shared_ptr<sdktrace::TracerProvider>           provider;
  opentelemetry::nostd::shared_ptr<trace_api::Tracer> tracer;
};

TracingState& State() {
  static TracingState state;
  return state;
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  auto&            state = State();
  std::scoped_lock lock(state.mutex);
  return state.tracer;
}

std::string Endpoint(const TracingOptions& options) {
  if (!options.endpoint.empty()) return options.endpoint;

  for (const char* name : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(name); value != nullptr && *value != '\0') {
      return value;
    }
  }
  return options.use_http ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const TracingOptions& options) {
  if (options.use_http) {
    otlp::OtlpHttpExporterOptions http;
    http.url = Endpoint(options);
    return otlp::OtlpHttpExporterFactory::Create(http);
  }

  otlp::OtlpGrpcExporterOptions grpc;
  grpc.endpoint            = Endpoint(options);
  grpc.use_ssl_credentials = !options.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(grpc);
}

} // namespace

bool InitializeTracing(const TracingOptions& options) {
  resource::ResourceAttributes attributes{
      {"service.name", options.service_name},
      {"service.version", std::string(kInstrumentationVersion)},
  };
  if (!options.backend.empty()) attributes.SetAttribute("db.system", opentelemetry::nostd::string_view(options.backend));

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(options), sdktrace::BatchSpanProcessorOptions{});
  std::shared_ptr<sdktrace::TracerProvider> provider =
      sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attributes));

  auto&            state = State();
  std::scoped_lock lock(state.mutex);
  state.provider = provider;
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(provider));
  state.tracer = provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
  return static_cast<bool>(state.tracer);
}

void ShutdownTracing() {
  auto&            state = State();
  std::scoped_lock lock(state.mutex);
  if (!state.provider) return;

  state.provider->ForceFlush();
  state.provider->Shutdown();
  state.provider.reset();
  state.tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> s) : span(s), scope(s) {
  }
};

SpanScope::SpanScope(std::string_view name) {
  if (auto tracer = CurrentTracer()) {
    impl_ = std::make_unique<Impl>(tracer->StartSpan(std::string(name)));
  }
}

SpanScope::~SpanScope() {
  if (impl_) impl_->span->End();
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_) impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordException(std::string_view what) {
  if (!impl_) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(what)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(what));
}

#else // !ENABLE_OTEL

bool InitializeTracing(const TracingOptions&) {
  return false;
}

void ShutdownTracing() {
}

struct SpanScope::Impl {};

SpanScope::SpanScope(std::string_view) {
}

SpanScope::~SpanScope() = default;

void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

void SpanScope::AddEvent(std::string_view) {
}

void SpanScope::RecordException(std::string_view) {
}

#endif

} // namespace convtree::observability
