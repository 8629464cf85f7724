#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "probe.hpp"

namespace scout::probe {

struct ActiveScanOptions {
  std::vector<std::uint16_t> ports = {22, 80, 443, 554, 1400, 5000, 8008, 8080, 8443, 39500};

  std::chrono::milliseconds connect_timeout{1000};
  std::size_t               max_in_flight = 128;
  std::size_t               max_hosts     = 1024;

  std::string neighbour_table_path = "/proc/net/arp";

  bool                      resolve_hostnames = true;
  std::string               resolver;  // empty: first nameserver in resolv_conf_path
  std::uint16_t             resolver_port    = 53;
  std::string               resolv_conf_path = "/etc/resolv.conf";
  std::chrono::milliseconds lookup_timeout{2000};
};

/*
  Seeds the host set.

  Sweeps the range with non-blocking TCP connects. A completed handshake
  or an immediate refusal both prove the host is up. Hosts with a
  complete entry in the kernel neighbour table are also reported live,
  since a firewalled device still answers ARP.

  Each live host gets MAC address and vendor, open ports and the
  liveness method in extras. Hostnames come from one batch of PTR
  queries bounded by lookup_timeout and the deadline; when the deadline
  has already passed the lookups are skipped. Every live host found
  before the deadline is reported either way.
*/
class ActiveScanProbe : public Probe {
 public:
  explicit ActiveScanProbe(ActiveScanOptions options = {});

  model::ProbeKind Kind() const override {
    return model::ProbeKind::kActiveScan;
  }

  Capability CheckCapability() override;

  void Run(const ProbeTarget& target, const util::Deadline& deadline, ResultSink& sink) override;

  bool SeedsHostSet() const override {
    return true;
  }

 private:
  ActiveScanOptions options_;
};

} // namespace scout::probe
