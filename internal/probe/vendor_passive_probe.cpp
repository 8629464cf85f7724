#include "vendor_passive_probe.hpp"

#include <algorithm>
#include <set>

#include "internal/net/dns_message.hpp"
#include "internal/net/ssdp.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace scout::probe {

using observability::StringField;

namespace {

constexpr const char*   kMdnsGroup = "224.0.0.251";
constexpr std::uint16_t kMdnsPort  = 5353;

} // namespace

const std::vector<VendorFamily>& DefaultVendorFamilies() {
  static const std::vector<VendorFamily> kFamilies = {
      {"smartthings", QueryTransport::kMdns, "_smartthings._tcp.local", {"smartthings"}, "Samsung SmartThings", "SmartThings Hub"},
      {"philips_hue", QueryTransport::kSsdp, "urn:schemas-upnp-org:device:basic:1", {"ipbridge", "hue-bridgeid"}, "Philips", "Hue Bridge"},
      {"sonos", QueryTransport::kSsdp, "urn:schemas-upnp-org:device:ZonePlayer:1", {"sonos", "zoneplayer"}, "Sonos", "smart_speaker"},
      {"google_cast", QueryTransport::kMdns, "_googlecast._tcp.local", {"_googlecast", "chromecast"}, "Google", "Chromecast"},
      {"apple_tv", QueryTransport::kMdns, "_airplay._tcp.local", {"appletv"}, "Apple", "Apple TV"},
      {"roku", QueryTransport::kSsdp, "roku:ecp", {"roku"}, "Roku", "streaming_player"},
  };
  return kFamilies;
}

VendorPassiveProbe::VendorPassiveProbe(VendorPassiveOptions options) : options_(std::move(options)) {
  for (const auto& family : options_.catalog) {
    const auto& wanted = options_.families;
    if (wanted.empty() || std::find(wanted.begin(), wanted.end(), family.name) != wanted.end()) {
      enabled_.push_back(family);
    }
  }
  for (const auto& name : options_.families) {
    const bool known = std::any_of(options_.catalog.begin(), options_.catalog.end(), [&](const VendorFamily& f) { return f.name == name; });
    if (!known) {
      throw util::InvalidArgument("unknown vendor family: " + name);
    }
  }
}

Capability VendorPassiveProbe::CheckCapability() {
  if (enabled_.empty()) {
    return Capability::Unavailable("no vendor families enabled");
  }
  auto sock = net::OpenUdpSocket();
  if (!sock.Valid()) {
    return Capability::Unavailable("cannot create UDP socket");
  }
  return Capability::Available();
}

std::string MdnsReplyText(const std::string& payload) {
  auto        message = net::ParseDnsMessage(payload);
  std::string text;
  for (const auto& record : message.records) {
    text += record.name + ' ' + record.target + ' ';
    for (const auto& [key, value] : record.txt) {
      text += key + '=' + value + ' ';
    }
  }
  return util::ToLower(text);
}

std::vector<const VendorFamily*> VendorPassiveProbe::Match(QueryTransport transport, const std::string& reply_text) const {
  const auto                       lowered = util::ToLower(reply_text);
  std::vector<const VendorFamily*> matched;
  for (const auto& family : enabled_) {
    if (family.transport != transport) {
      continue;
    }
    for (const auto& marker : family.markers) {
      if (lowered.find(marker) != std::string::npos) {
        matched.push_back(&family);
        break;
      }
    }
  }
  return matched;
}

void VendorPassiveProbe::Run(const ProbeTarget&, const util::Deadline& deadline, ResultSink& sink) {
  auto sock = net::OpenUdpSocket();
  if (!sock.Valid()) {
    throw util::CapabilityUnavailable("cannot create UDP socket");
  }

  for (const auto& family : enabled_) {
    bool sent = false;
    if (family.transport == QueryTransport::kSsdp) {
      sent = net::SendDatagram(sock.Get(), net::kSsdpGroup, net::kSsdpPort, net::BuildMSearch(family.query, 1));
    } else {
      // Sent from an ephemeral port, so responders answer by legacy unicast.
      sent = net::SendDatagram(sock.Get(), kMdnsGroup, kMdnsPort, net::BuildPtrQuery(family.query, true));
    }
    if (!sent) {
      SCOUT_LOG_DEBUG("vendor query send failed", {StringField("family", family.name)});
    }
  }

  const auto                                   window = util::Deadline::After(options_.window).Min(deadline);
  std::set<std::pair<std::string, std::string>> reported;  // (address, family)

  while (!window.Expired()) {
    auto datagram = net::ReceiveDatagram(sock.Get(), window.Clamp(std::chrono::milliseconds(250)));
    if (!datagram) {
      continue;
    }

    QueryTransport transport;
    std::string    text;
    if (datagram->sender_port == kMdnsPort) {
      transport = QueryTransport::kMdns;
      try {
        text = MdnsReplyText(datagram->payload);
      } catch (const util::MalformedEvidence& e) {
        SCOUT_LOG_DEBUG("dropping malformed mdns reply", {StringField("sender", datagram->sender), StringField("error", e.what())});
        continue;
      }
    } else {
      transport = QueryTransport::kSsdp;
      text      = datagram->payload;
    }

    for (const auto* family : Match(transport, text)) {
      if (!reported.emplace(datagram->sender, family->name).second) {
        continue;
      }
      auto result         = model::MakeProbeResult(model::ProbeKind::kVendorPassive, datagram->sender);
      result.manufacturer = family->manufacturer;
      result.device_type  = family->device_type;
      result.services.insert(family->name);
      result.extras["vendor_family"] = family->name;
      result.extras["matched_via"]   = transport == QueryTransport::kSsdp ? "ssdp" : "mdns";
      sink.Emit(std::move(result));
    }
  }
}

} // namespace scout::probe
