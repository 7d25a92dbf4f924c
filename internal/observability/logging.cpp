#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/span_id.h>
#include <opentelemetry/trace/trace_id.h>
#endif

namespace convtree::observability {
namespace {

constexpr const char* kLoggerName     = "convtree";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

struct LoggingOptions {
  std::string level   = "info";
  std::string pattern = kDefaultPattern;
  bool        include_trace_context = false;
};

bool g_include_trace_context = false;

// stdout carries CLI output, so even lines logged before
// InitializeLogging() go to stderr.
std::shared_ptr<spdlog::logger> Logger() {
  static std::mutex           mutex;
  std::lock_guard<std::mutex> lock(mutex);

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_pattern(kDefaultPattern);
    logger->flush_on(spdlog::level::warn);
  }
  return logger;
}

// Environment wins over the config file.
LoggingOptions ResolveOptions(const convtree::runtime::config::LoggingConfig& config) {
  LoggingOptions options;
  if (!config.level().empty()) options.level = config.level();
  if (!config.pattern().empty()) options.pattern = config.pattern();
  options.include_trace_context = config.include_trace_context();

  if (const char* level = std::getenv("CONVTREE_LOG_LEVEL"); level && *level) {
    options.level = level;
  }
  if (const char* pattern = std::getenv("CONVTREE_LOG_PATTERN"); pattern && *pattern) {
    options.pattern = pattern;
  }
  if (const char* trace = std::getenv("CONVTREE_LOG_INCLUDE_TRACE_CONTEXT"); trace && *trace) {
    const std::string value(trace);
    options.include_trace_context = value == "1" || value == "true";
  }
  return options;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("unknown log level: " + name);
  }
  return level;
}

bool NeedsQuotes(std::string_view value) {
  if (value.empty()) return true;
  return value.find_first_of(" \t\n\"=") != std::string_view::npos;
}

void AppendValue(std::string& line, std::string_view value) {
  if (!NeedsQuotes(value)) {
    line += value;
    return;
  }
  line += '"';
  for (const char c : value) {
    if (c == '"' || c == '\\') line += '\\';
    if (c == '\n') {
      line += "\\n";
      continue;
    }
    line += c;
  }
  line += '"';
}

void AppendTraceContext(std::string& line) {
#ifdef ENABLE_OTEL
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;
  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  char trace_id[2 * opentelemetry::trace::TraceId::kSize];
  char span_id[2 * opentelemetry::trace::SpanId::kSize];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);

  line += " trace_id=";
  line.append(trace_id, sizeof(trace_id));
  line += " span_id=";
  line.append(span_id, sizeof(span_id));
#else
  (void)line;
#endif
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const convtree::runtime::config::RuntimeConfig& config) {
  const auto options = ResolveOptions(config.logging());
  const auto level   = ParseLevel(options.level);

  auto logger = Logger();
  logger->set_pattern(options.pattern);
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);

  g_include_trace_context = options.include_trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = Logger();
  if (!logger->should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    AppendValue(line, field.value);
  }
  AppendTraceContext(line);
  logger->log(level, "{}", line);
}

} // namespace convtree::observability
