#pragma once

#include <chrono>
#include <string>

#include "internal/net/ssdp.hpp"
#include "internal/net/upnp_description.hpp"
#include "probe.hpp"

namespace scout::probe {

struct DeviceDescriptionOptions {
  std::chrono::milliseconds search_window{5000};
  std::chrono::milliseconds fetch_timeout{3000};
  int                       mx_seconds    = 2;
  std::string               search_target = "ssdp:all";
  std::size_t               max_description_bytes = 256 * 1024;

  // Where M-SEARCH goes. A unicast address searches a single device.
  std::string   search_address = net::kSsdpGroup;
  std::uint16_t search_port    = net::kSsdpPort;
};

/*
  UPnP discovery: multicast M-SEARCH, then fetch and parse the device
  description behind every distinct LOCATION.

  A description that cannot be fetched or parsed only loses its own
  fields; the SSDP observation is still reported. Once the deadline
  passes, the remaining locations are reported without fetching.
*/
class DeviceDescriptionProbe : public Probe {
 public:
  explicit DeviceDescriptionProbe(DeviceDescriptionOptions options = {});

  model::ProbeKind Kind() const override {
    return model::ProbeKind::kDeviceDescription;
  }

  Capability CheckCapability() override;

  void Run(const ProbeTarget& target, const util::Deadline& deadline, ResultSink& sink) override;

  // Builds the result for one SSDP response and its (optional) description document.
  static model::ProbeResult Describe(const std::string& sender, const net::SsdpMessage& response, const net::DeviceDescription* description);

 private:
  model::ProbeResult Fetch(const std::string& sender, const net::SsdpMessage& response, const util::Deadline& deadline) const;

  DeviceDescriptionOptions options_;
};

} // namespace scout::probe
