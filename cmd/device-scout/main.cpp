#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "api/scout/discovery/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/probe_kind.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/registry_writer.hpp"
#include "internal/util/errors.hpp"

using scout::observability::DoubleField;
using scout::observability::IntField;
using scout::observability::StringField;

namespace {

struct CommandLine {
  std::string              config_path;
  std::string              range;
  double                   timeout_seconds = 0;
  std::vector<std::string> disabled;
  std::string              output;
};

void PrintUsage() {
  std::cerr << "Usage: device-scout [--config <config.yaml>] [--range <cidr>] [--timeout <seconds>]\n"
               "                    [--disable <probe>]... [--output <path>]\n"
               "Probes: active_scan, mdns, upnp, vendor_passive, fingerprint"
            << std::endl;
}

CommandLine ParseCommandLine(int argc, char** argv) {
  CommandLine cli;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto              next = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw scout::util::InvalidArgument("missing value for " + arg);
      }
      return argv[++i];
    };

    if (arg == "--config") {
      cli.config_path = next();
    } else if (arg == "--range") {
      cli.range = next();
    } else if (arg == "--timeout") {
      const auto text = next();
      char*      end  = nullptr;
      cli.timeout_seconds = std::strtod(text.c_str(), &end);
      if (text.empty() || *end != '\0' || cli.timeout_seconds <= 0) {
        throw scout::util::InvalidArgument("--timeout expects a positive number of seconds");
      }
    } else if (arg == "--disable") {
      cli.disabled.push_back(next());
    } else if (arg == "--output") {
      cli.output = next();
    } else {
      throw scout::util::InvalidArgument("unknown argument " + arg);
    }
  }
  return cli;
}

} // namespace

int main(int argc, char** argv) {
  if (argc == 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
    PrintUsage();
    return 0;
  }

  try {
    auto cli = ParseCommandLine(argc, argv);

    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    scout::discovery::v1::RuntimeConfig config;
    if (!cli.config_path.empty()) {
      config = scout::config::ConfigLoader::LoadFromYaml(cli.config_path);
    }
    if (!cli.range.empty()) {
      config.mutable_discovery()->set_network_range(cli.range);
    }
    if (cli.timeout_seconds > 0) {
      config.mutable_discovery()->set_timeout_seconds(cli.timeout_seconds);
    }
    if (!cli.output.empty()) {
      config.mutable_output()->set_registry_path(cli.output);
    }
    scout::config::ConfigLoader::Validate(config);
    if (config.discovery().network_range().empty()) {
      PrintUsage();
      throw scout::util::InvalidArgument("no network range given (discovery.network_range or --range)");
    }

    scout::observability::InitializeTracing(config);
    scout::observability::InitializeMetrics(config);
    scout::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = scout::factory::Build(config);
    for (const auto& name : cli.disabled) {
      auto kind = scout::model::ParseProbeKind(name);
      if (!kind) {
        throw scout::util::InvalidArgument("unknown probe " + name);
      }
      app.request.disabled.insert(*kind);
    }

    SCOUT_LOG_INFO("discovery started",
                   {StringField("range", app.request.network_range), IntField("timeout_ms", app.request.timeout.count())});

    // ------------------------------------------------------------
    // Run and export
    // ------------------------------------------------------------
    auto outcome = app.orchestrator->Run(app.request);
    auto report  = scout::registry::BuildReport(outcome);
    scout::registry::WriteRegistry(report, app.output);

    for (const auto& [address, record] : outcome.devices) {
      SCOUT_LOG_INFO("device", {StringField("address", address), StringField("manufacturer", record.derived.manufacturer.value),
                                StringField("device_type", record.derived.device_type.value),
                                DoubleField("confidence", record.confidence_score)});
    }
    SCOUT_LOG_INFO("discovery summary", {IntField("total_found", static_cast<std::int64_t>(outcome.devices.size())),
                                         IntField("high_confidence", static_cast<std::int64_t>(outcome.HighConfidenceCount())),
                                         StringField("registry", app.output.path)});

    // Joins any probe thread still finishing up, while logging is still available.
    app.orchestrator.reset();

    scout::observability::ShutdownLogging();
    scout::observability::ShutdownMetrics();
    scout::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    SCOUT_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    scout::observability::ShutdownLogging();
    scout::observability::ShutdownMetrics();
    scout::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
