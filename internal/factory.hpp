#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/discovery_orchestrator.hpp"
#include "internal/registry/registry_writer.hpp"

namespace scout::factory {

/*
  Application

  Everything one discovery invocation needs. The orchestrator owns the
  probes and the capability answers resolved while it was built.
*/
struct Application {
  std::unique_ptr<core::DiscoveryOrchestrator> orchestrator;
  core::DiscoveryRequest                       request;
  registry::WriteOptions                       output;
};

/*
  Build

  Constructs the probes, scorer, classifier and orchestrator from runtime
  config. This is the composition root: the only place that knows the
  concrete probe types.
*/
Application Build(const scout::runtime::config::RuntimeConfig& config);

} // namespace scout::factory
