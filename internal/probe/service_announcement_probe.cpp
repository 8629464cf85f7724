#include "service_announcement_probe.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace scout::probe {

namespace {

std::string FirstLabel(const std::string& name) {
  const auto dot = name.find("._");
  return dot == std::string::npos ? name : name.substr(0, dot);
}

} // namespace

const std::vector<ServiceCatalogEntry>& DefaultServiceCatalog() {
  static const std::vector<ServiceCatalogEntry> kCatalog = {
      {"_smartthings._tcp", "smartthings", "Samsung SmartThings", "SmartThings Hub", "deviceType"},
      {"_hue._tcp", "hue", "Philips", "Hue Bridge", ""},
      {"_hap._tcp", "homekit", "Apple HomeKit Compatible", "HomeKit Device", "md"},
      {"_matter._tcp", "matter", "", "", ""},
      {"_googlecast._tcp", "googlecast", "Google", "", "md"},
      {"_sonos._tcp", "sonos", "Sonos", "smart_speaker", ""},
      {"_airplay._tcp", "airplay", "", "", "model"},
      {"_ipp._tcp", "ipp", "", "printer", "ty"},
      {"_spotify-connect._tcp", "spotify-connect", "", "", ""},
      {"_http._tcp", "http", "", "", ""},
  };
  return kCatalog;
}

ServiceAnnouncementProbe::ServiceAnnouncementProbe(ServiceAnnouncementOptions options) : options_(std::move(options)) {
}

Capability ServiceAnnouncementProbe::CheckCapability() {
  auto sock = net::OpenUdpSocket();
  if (!sock.Valid()) {
    return Capability::Unavailable("cannot create UDP socket");
  }
  if (!net::BindReusable(sock.Get(), options_.port)) {
    return Capability::Unavailable("cannot bind UDP " + std::to_string(options_.port) + " with address reuse");
  }
  if (!net::JoinMulticastGroup(sock.Get(), options_.group, options_.interface_address)) {
    return Capability::Unavailable("cannot join mDNS group " + options_.group);
  }
  socket_ = std::move(sock);
  return Capability::Available();
}

void ServiceAnnouncementProbe::Run(const ProbeTarget&, const util::Deadline& deadline, ResultSink& sink) {
  if (!socket_.Valid()) {
    throw util::CapabilityUnavailable("mdns socket not open");
  }

  if (options_.send_queries) {
    for (const auto& entry : options_.catalog) {
      const auto query = net::BuildPtrQuery(entry.service_type + ".local", false);
      if (!net::SendDatagram(socket_.Get(), options_.group, options_.port, query)) {
        SCOUT_LOG_DEBUG("mdns query send failed", {observability::StringField("service", entry.service_type)});
      }
    }
  }

  const auto window = util::Deadline::After(options_.listen_window).Min(deadline);
  Collector  collector(options_.catalog);
  std::size_t packets = 0;

  while (!window.Expired()) {
    auto datagram = net::ReceiveDatagram(socket_.Get(), window.Clamp(std::chrono::milliseconds(250)));
    if (!datagram) {
      continue;
    }
    ++packets;

    net::DnsMessage message;
    try {
      message = net::ParseDnsMessage(datagram->payload);
    } catch (const util::MalformedEvidence& e) {
      SCOUT_LOG_DEBUG("dropping malformed mdns packet", {observability::StringField("sender", datagram->sender), observability::StringField("error", e.what())});
      continue;
    }
    if (message.skipped_records > 0) {
      SCOUT_LOG_DEBUG("mdns records dropped", {observability::StringField("sender", datagram->sender),
                                               observability::IntField("records", static_cast<std::int64_t>(message.skipped_records))});
    }
    if (!message.IsResponse()) {
      continue;
    }
    for (auto& result : collector.Add(message, datagram->sender)) {
      sink.Emit(std::move(result));
    }
  }

  SCOUT_LOG_DEBUG("mdns listen window closed", {observability::IntField("packets", static_cast<std::int64_t>(packets))});
}

// ------------------------------------------------------------
// Collector
// ------------------------------------------------------------

ServiceAnnouncementProbe::Collector::Collector(const std::vector<ServiceCatalogEntry>& catalog) : catalog_(catalog) {
}

const ServiceCatalogEntry* ServiceAnnouncementProbe::Collector::CatalogFor(const std::string& instance) const {
  for (const auto& entry : catalog_) {
    const auto suffix = "." + util::ToLower(entry.service_type) + ".local";
    if (instance.size() > suffix.size() && instance.compare(instance.size() - suffix.size(), suffix.size(), suffix) == 0) {
      return &entry;
    }
  }
  return nullptr;
}

std::vector<model::ProbeResult> ServiceAnnouncementProbe::Collector::Add(const net::DnsMessage& message, const std::string& sender) {
  std::set<std::string> touched;

  for (const auto& record : message.records) {
    const auto name = net::CanonicalName(record.name);
    switch (static_cast<net::DnsType>(record.type)) {
      case net::DnsType::kPtr: {
        const auto instance = net::CanonicalName(record.target);
        if (CatalogFor(instance)) {
          instances_[instance].sender = sender;
          touched.insert(instance);
        }
        break;
      }
      case net::DnsType::kSrv:
        if (CatalogFor(name)) {
          auto& instance  = instances_[name];
          instance.host   = net::CanonicalName(record.target);
          instance.port   = record.port;
          instance.sender = sender;
          touched.insert(name);
        }
        break;
      case net::DnsType::kTxt:
        if (CatalogFor(name)) {
          auto& instance  = instances_[name];
          instance.txt    = record.txt;
          instance.sender = sender;
          touched.insert(name);
        }
        break;
      case net::DnsType::kA:
      case net::DnsType::kAaaa:
        if (!record.address.empty()) {
          // Prefer IPv4 for the join key; only fall back to IPv6 when nothing else is known.
          auto& address = host_addresses_[name];
          if (address.empty() || record.type == static_cast<std::uint16_t>(net::DnsType::kA)) {
            address = record.address;
          }
          for (const auto& [instance_name, instance] : instances_) {
            if (instance.host == name) touched.insert(instance_name);
          }
        }
        break;
      default:
        break;
    }
  }

  std::vector<model::ProbeResult> out;
  for (const auto& name : touched) {
    auto result = Resolve(name, instances_[name]);
    if (!result) {
      continue;
    }
    // Re-emit only when something new was learned about the instance.
    auto fingerprint = result->address + "|" + result->hostname + "|" + result->device_type + "|" + std::to_string(result->extras.size());
    auto& previous   = reported_[name];
    if (previous == fingerprint) {
      continue;
    }
    previous = std::move(fingerprint);
    out.push_back(std::move(*result));
  }
  return out;
}

std::optional<model::ProbeResult> ServiceAnnouncementProbe::Collector::Resolve(const std::string& name, const Instance& instance) const {
  const auto* entry = CatalogFor(name);
  if (!entry) {
    return std::nullopt;
  }

  std::string address;
  if (auto it = host_addresses_.find(instance.host); it != host_addresses_.end()) {
    address = it->second;
  } else {
    address = instance.sender;
  }
  if (address.empty()) {
    return std::nullopt;
  }

  auto result = model::MakeProbeResult(model::ProbeKind::kServiceAnnouncement, address);
  result.services.insert(entry->service_name);
  result.manufacturer  = entry->manufacturer;
  result.device_type   = entry->default_device_type;
  result.friendly_name = FirstLabel(name);
  if (!instance.host.empty()) {
    result.hostname = instance.host;
  }
  if (instance.port != 0) {
    result.open_ports.insert(instance.port);
  }
  if (!entry->txt_device_type_key.empty()) {
    if (auto it = instance.txt.find(entry->txt_device_type_key); it != instance.txt.end() && !it->second.empty()) {
      result.device_type = it->second;
    }
  }
  if (auto it = instance.txt.find("md"); it != instance.txt.end()) {
    result.model_name = it->second;
  }

  result.extras["mdns_instance"] = name;
  for (const auto& [key, value] : instance.txt) {
    result.extras["txt." + key] = value;
  }
  return result;
}

} // namespace scout::probe
