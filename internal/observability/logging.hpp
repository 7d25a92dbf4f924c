#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace convtree::runtime::config {
class RuntimeConfig;
}

namespace convtree::observability {

/*
  Structured logging on top of spdlog.

  Lines read `message key=value key="value with spaces"`. Level, pattern
  and trace-context injection come from the `logging` config section,
  overridden by CONVTREE_LOG_LEVEL / CONVTREE_LOG_PATTERN /
  CONVTREE_LOG_INCLUDE_TRACE_CONTEXT.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Throws std::invalid_argument on an unknown level name.
void InitializeLogging(const convtree::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace convtree::observability

#define CONVTREE_LOG_INFO(message, ...) ::convtree::observability::Log(spdlog::level::info, (message), ##__VA_ARGS__)
#define CONVTREE_LOG_WARN(message, ...) ::convtree::observability::Log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define CONVTREE_LOG_ERROR(message, ...) ::convtree::observability::Log(spdlog::level::err, (message), ##__VA_ARGS__)
