#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "internal/net/socket.hpp"
#include "probe.hpp"

namespace scout::probe {

enum class QueryTransport {
  kSsdp,
  kMdns,
};

/*
  A vendor family and how to ask for it.

  query is an SSDP search target or an mDNS service name, depending on
  transport. Markers are lowercase substrings looked for in the reply.
*/
struct VendorFamily {
  std::string              name;
  QueryTransport           transport;
  std::string              query;
  std::vector<std::string> markers;
  std::string              manufacturer;
  std::string              device_type;
};

// smartthings, philips_hue, sonos, google_cast, apple_tv, roku.
const std::vector<VendorFamily>& DefaultVendorFamilies();

struct VendorPassiveOptions {
  std::chrono::milliseconds window{5000};

  // Empty means every family in the catalog.
  std::vector<std::string> families;

  std::vector<VendorFamily> catalog = DefaultVendorFamilies();
};

/*
  Targeted per-vendor discovery.

  Sends one query per enabled family (SSDP search targets, or legacy
  unicast mDNS PTR queries answered straight back to our port) and
  matches every reply against each family's markers. Hints are coarse:
  manufacturer and device type per family, nothing finer.
*/
class VendorPassiveProbe : public Probe {
 public:
  explicit VendorPassiveProbe(VendorPassiveOptions options = {});

  model::ProbeKind Kind() const override {
    return model::ProbeKind::kVendorPassive;
  }

  Capability CheckCapability() override;

  void Run(const ProbeTarget& target, const util::Deadline& deadline, ResultSink& sink) override;

  // Families whose markers occur in a reply received over transport.
  std::vector<const VendorFamily*> Match(QueryTransport transport, const std::string& reply_text) const;

  const std::vector<VendorFamily>& EnabledFamilies() const {
    return enabled_;
  }

 private:
  VendorPassiveOptions      options_;
  std::vector<VendorFamily> enabled_;
};

// Lowercase text of an mDNS reply: record names, targets and TXT entries.
std::string MdnsReplyText(const std::string& payload);

} // namespace scout::probe
