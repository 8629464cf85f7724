#pragma once

#include <string>

#include "internal/core/discovery_orchestrator.hpp"
#include "internal/model/device_record.hpp"
#include "api/scout/discovery/v1.hpp"

namespace scout::registry {

/*
  Export of discovery results.

  DiscoveredDevice / DiscoveryReport are the only shapes the rest of the
  world sees; evidence lists and precedence ranks stay internal.
*/

scout::discovery::v1::DiscoveredDevice ToProto(const model::DeviceRecord& record);
scout::discovery::v1::ProbeStatus      ToProto(core::ProbeStatus status);
scout::discovery::v1::RunState         ToProto(model::RunState state);

scout::discovery::v1::DiscoveryReport BuildReport(const core::DiscoveryOutcome& outcome);

struct WriteOptions {
  std::string path{"devices/discovered_devices.json"};
  bool        pretty = true;
};

std::string ToJson(const scout::discovery::v1::DiscoveryReport& report, bool pretty);

// Creates missing parent directories. Throws util::InvalidState on I/O failure.
void WriteRegistry(const scout::discovery::v1::DiscoveryReport& report, const WriteOptions& options);

} // namespace scout::registry
