#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <mutex>
#include <optional>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace pipeline::observability {
namespace {

constexpr const char* kLoggerName     = "pipeline-store";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Environment beats the config file; the config file beats the defaults.
struct LogSettings {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string               pattern{kDefaultPattern};
  bool                      include_trace_context = false;
  std::string               workspace_id;
};

std::optional<std::string> Env(const char* name) {
  const char* value = std::getenv(name);
  if (!value || !*value) return std::nullopt;
  return std::string(value);
}

LogSettings ResolveSettings(const pipeline::runtime::config::RuntimeConfig& config) {
  LogSettings settings;

  auto level = Env("PIPELINE_LOG_LEVEL");
  if (!level && !config.logging().level().empty()) level = config.logging().level();
  if (level) settings.level = spdlog::level::from_str(*level);

  if (auto pattern = Env("PIPELINE_LOG_PATTERN")) {
    settings.pattern = *pattern;
  } else if (!config.logging().pattern().empty()) {
    settings.pattern = config.logging().pattern();
  }

  if (auto trace = Env("PIPELINE_LOG_INCLUDE_TRACE_CONTEXT")) {
    settings.include_trace_context = *trace == "1" || *trace == "true";
  } else {
    settings.include_trace_context = config.logging().include_trace_context();
  }

  settings.workspace_id = config.workspace_id();
  return settings;
}

std::mutex  g_settings_mutex;
LogSettings g_settings;

// key=value, with values holding spaces or quotes wrapped in double quotes
void AppendField(std::string& out, std::string_view key, std::string_view value) {
  if (!out.empty()) out.push_back(' ');
  out.append(key);
  out.push_back('=');

  if (value.find_first_of(" \"=") == std::string_view::npos && !value.empty()) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::string& out) {
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  AppendField(out, "trace_id", HexId(trace_bytes, 16));
  AppendField(out, "span_id", HexId(span_bytes, 8));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const pipeline::runtime::config::RuntimeConfig& config) {
  auto settings = ResolveSettings(config);

  // stdout carries command output
  auto logger = spdlog::get(kLoggerName);
  if (!logger) logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  std::lock_guard lock(g_settings_mutex);
  g_settings = std::move(settings);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, LogFields fields) {
  if (!spdlog::should_log(level)) return;

  bool has_workspace = false;
  for (const auto& field : fields) {
    has_workspace = has_workspace || field.key == "workspace_id";
  }

  std::string suffix;
  bool        include_trace = false;
  {
    std::lock_guard lock(g_settings_mutex);
    if (!has_workspace && !g_settings.workspace_id.empty()) AppendField(suffix, "workspace_id", g_settings.workspace_id);
    include_trace = g_settings.include_trace_context;
  }
  for (const auto& field : fields) {
    AppendField(suffix, field.key, field.value);
  }
  if (include_trace) AppendTraceContext(suffix);

  if (suffix.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, suffix);
}

} // namespace pipeline::observability
