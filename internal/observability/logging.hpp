#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace pipeline::runtime::config {
class RuntimeConfig;
}

namespace pipeline::observability {

/*
  Structured store logging on top of spdlog.

  Each line is the message followed by key=value fields:

    job lease expired workspace_id=ws_default job_id=job-7 attempt_count=2

  The configured workspace id is stamped on every line unless a field
  already names one. Values holding spaces, quotes or '=' are quoted.
  With include_trace_context set, trace_id/span_id of the active span
  follow the fields. Output goes to stderr; stdout is left to pipelinectl.

  Level, pattern and trace stamping come from RuntimeConfig.logging and
  may be overridden by PIPELINE_LOG_LEVEL, PIPELINE_LOG_PATTERN and
  PIPELINE_LOG_INCLUDE_TRACE_CONTEXT.
*/

struct LogField {
  std::string key;
  std::string value;
};

using LogFields = std::initializer_list<LogField>;

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
// Revisions and counters.
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// Safe to call again; later calls replace the settings.
void InitializeLogging(const pipeline::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, LogFields fields = {});

inline void LogInfo(std::string_view message, LogFields fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, LogFields fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, LogFields fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace pipeline::observability

#define PIPELINE_LOG_INFO(message, ...) ::pipeline::observability::LogInfo((message), ##__VA_ARGS__)
#define PIPELINE_LOG_WARN(message, ...) ::pipeline::observability::LogWarn((message), ##__VA_ARGS__)
#define PIPELINE_LOG_ERROR(message, ...) ::pipeline::observability::LogError((message), ##__VA_ARGS__)
