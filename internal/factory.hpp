#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/service/project_stream_service.hpp"
#include "internal/store/pipeline_store.hpp"
#include "internal/util/time.hpp"

namespace pipeline::factory {

/*
  Application

  Long-lived objects built from one RuntimeConfig.
*/
struct Application {
  std::shared_ptr<store::PipelineStore>          store;
  std::shared_ptr<service::ProjectStreamService> stream_service;
};

/*
  Build

  Composition root: the only place that knows concrete store and
  database types. `clock` defaults to the system clock.
*/
Application Build(const pipeline::runtime::config::RuntimeConfig& config, std::shared_ptr<util::ClockSource> clock = nullptr);

std::shared_ptr<store::PipelineStore> BuildStore(const pipeline::runtime::config::RuntimeConfig& config,
                                                 std::shared_ptr<util::ClockSource> clock = nullptr);

} // namespace pipeline::factory
