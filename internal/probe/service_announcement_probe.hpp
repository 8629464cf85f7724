#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/net/dns_message.hpp"
#include "internal/net/socket.hpp"
#include "probe.hpp"

namespace scout::probe {

// One mDNS service type we know how to interpret.
struct ServiceCatalogEntry {
  std::string service_type;  // "_hue._tcp"
  std::string service_name;  // reported in services, e.g. "hue"
  std::string manufacturer;  // empty when the ecosystem spans vendors
  std::string default_device_type;
  std::string txt_device_type_key;  // TXT key overriding the device type, if any
};

const std::vector<ServiceCatalogEntry>& DefaultServiceCatalog();

struct ServiceAnnouncementOptions {
  std::chrono::milliseconds listen_window{8000};
  std::string               interface_address;
  std::string               group = "224.0.0.251";
  std::uint16_t             port  = 5353;

  // Multicast one PTR query per catalog type when listening starts.
  bool send_queries = true;

  std::vector<ServiceCatalogEntry> catalog = DefaultServiceCatalog();
};

/*
  Listens on the mDNS group (224.0.0.251:5353 by default) for the
  listen window. Results stream out as instances complete, so a window
  cut short by the deadline keeps everything already resolved.

  Announcements are collected across packets: PTR records name service
  instances, SRV gives host and port, TXT carries model hints, A/AAAA
  resolve the host. An instance is reported once it maps to an address,
  and only when its type is in the catalog.
*/
class ServiceAnnouncementProbe : public Probe {
 public:
  explicit ServiceAnnouncementProbe(ServiceAnnouncementOptions options = {});

  model::ProbeKind Kind() const override {
    return model::ProbeKind::kServiceAnnouncement;
  }

  // Binds and joins the group; the socket is kept for Run().
  Capability CheckCapability() override;

  void Run(const ProbeTarget& target, const util::Deadline& deadline, ResultSink& sink) override;

  /*
    Accumulates announcement state across packets and turns completed
    instances into results. Separated from the socket loop so captured
    traffic can be replayed through it.
  */
  class Collector {
   public:
    explicit Collector(const std::vector<ServiceCatalogEntry>& catalog);

    // sender is the packet's source address, used when no A record names the host.
    std::vector<model::ProbeResult> Add(const net::DnsMessage& message, const std::string& sender);

   private:
    struct Instance {
      std::string                        host;
      std::uint16_t                      port = 0;
      std::map<std::string, std::string> txt;
      std::string                        sender;
    };

    const ServiceCatalogEntry* CatalogFor(const std::string& instance) const;
    std::optional<model::ProbeResult> Resolve(const std::string& name, const Instance& instance) const;

    const std::vector<ServiceCatalogEntry>& catalog_;
    std::map<std::string, Instance>          instances_;
    std::map<std::string, std::string>       host_addresses_;
    std::map<std::string, std::string>       reported_;  // instance -> fingerprint of what was emitted
  };

 private:
  ServiceAnnouncementOptions options_;
  net::Socket                socket_;
};

} // namespace scout::probe
