#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace {

namespace obs = pipeline::observability;

// Routes the default logger into `out` with a bare "%v" pattern.
void Capture(std::ostringstream& out) {
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = std::make_shared<spdlog::logger>("capture", sink);
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::info);
  spdlog::set_default_logger(logger);
}

void TestFieldsAndWorkspaceStamp() {
  pipeline::runtime::config::RuntimeConfig config;
  config.set_workspace_id("ws_log");
  obs::InitializeLogging(config);

  std::ostringstream out;
  Capture(out);

  PIPELINE_LOG_INFO("job claimed", {obs::StringField("job_id", "job-3"), obs::UintField("revision", UINT64_MAX),
                                    obs::IntField("attempt_count", -1), obs::BoolField("retry", true)});
  assert(out.str() == "job claimed workspace_id=ws_log job_id=job-3 revision=18446744073709551615 attempt_count=-1 retry=true\n");

  out.str("");
  PIPELINE_LOG_WARN("state rejected", {obs::StringField("workspace_id", "ws_other"), obs::StringField("error", "bad \"doc\"")});
  assert(out.str() == "state rejected workspace_id=ws_other error=\"bad \\\"doc\\\"\"\n");

  out.str("");
  PIPELINE_LOG_INFO("empty", {obs::StringField("note", "")});
  assert(out.str() == "empty workspace_id=ws_log note=\"\"\n");
}

void TestLevelFilter() {
  std::ostringstream out;
  Capture(out);
  spdlog::default_logger()->set_level(spdlog::level::warn);

  PIPELINE_LOG_INFO("hidden");
  PIPELINE_LOG_ERROR("shown");
  assert(out.str() == "shown workspace_id=ws_log\n");
}

} // namespace

int main() {
  TestFieldsAndWorkspaceStamp();
  TestLevelFilter();

  obs::ShutdownLogging();
  std::cout << "logging_test: pass\n";
  return 0;
}
