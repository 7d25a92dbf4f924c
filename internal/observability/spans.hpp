#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace convtree::runtime::config {
class RuntimeConfig;
}

namespace convtree::observability {

struct TracingOptions {
  std::string service_name = "convtree";
  std::string backend; // resource attribute db.system; empty => omitted

  // Empty => OTEL_EXPORTER_OTLP_TRACES_ENDPOINT / OTEL_EXPORTER_OTLP_ENDPOINT,
  // then the collector default for the transport.
  std::string endpoint;
  bool        use_http = false;
  bool        insecure = true;
};

// Returns false when tracing is disabled or compiled out.
bool InitializeTracing(const TracingOptions& options);
bool InitializeTracing(const convtree::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  SpanScope

  Starts a span and makes it current until destruction. Without
  ENABLE_OTEL, or before InitializeTracing, every method does nothing.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);

  // Marks the span as failed.
  void RecordException(std::string_view what);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace convtree::observability
