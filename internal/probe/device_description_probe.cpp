#include "device_description_probe.hpp"

#include <sys/socket.h>

#include <algorithm>
#include <map>

#include "internal/net/http_client.hpp"
#include "internal/net/socket.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace scout::probe {

using observability::StringField;

namespace {

bool IsNumericAddress(const std::string& host) {
  sockaddr_storage storage{};
  socklen_t        length = 0;
  return net::ToSockaddr(host, 0, &storage, &length);
}

} // namespace

DeviceDescriptionProbe::DeviceDescriptionProbe(DeviceDescriptionOptions options) : options_(std::move(options)) {
}

Capability DeviceDescriptionProbe::CheckCapability() {
  auto sock = net::OpenUdpSocket();
  if (!sock.Valid()) {
    return Capability::Unavailable("cannot create UDP socket");
  }
  return Capability::Available();
}

void DeviceDescriptionProbe::Run(const ProbeTarget&, const util::Deadline& deadline, ResultSink& sink) {
  auto sock = net::OpenUdpSocket();
  if (!sock.Valid()) {
    throw util::CapabilityUnavailable("cannot create UDP socket");
  }

  const auto request = net::BuildMSearch(options_.search_target, options_.mx_seconds);
  // Sent twice: M-SEARCH is plain UDP and the first copy is often lost.
  for (int i = 0; i < 2; ++i) {
    if (!net::SendDatagram(sock.Get(), options_.search_address, options_.search_port, request)) {
      SCOUT_LOG_WARN("ssdp search send failed");
      return;
    }
  }

  // Leave at least half of what remains for fetching descriptions.
  const auto listen_budget = std::min(options_.search_window, deadline.Remaining() / 2);
  const auto window        = util::Deadline::After(listen_budget).Min(deadline);

  std::map<std::string, std::pair<std::string, net::SsdpMessage>> by_location;
  while (!window.Expired()) {
    auto datagram = net::ReceiveDatagram(sock.Get(), window.Clamp(std::chrono::milliseconds(250)));
    if (!datagram) {
      continue;
    }
    auto response = net::ParseSsdpMessage(datagram->payload);
    if (!response || response->Location().empty()) {
      continue;
    }
    by_location.try_emplace(response->Location(), datagram->sender, std::move(*response));
  }

  std::size_t unfetched = 0;
  for (const auto& [location, entry] : by_location) {
    if (deadline.Expired()) {
      ++unfetched;
      sink.Emit(Describe(entry.first, entry.second, nullptr));
      continue;
    }
    sink.Emit(Fetch(entry.first, entry.second, deadline));
  }

  SCOUT_LOG_DEBUG("ssdp search finished", {observability::IntField("locations", static_cast<std::int64_t>(by_location.size())),
                                            observability::IntField("unfetched", static_cast<std::int64_t>(unfetched))});
}

model::ProbeResult DeviceDescriptionProbe::Fetch(const std::string& sender, const net::SsdpMessage& response, const util::Deadline& deadline) const {
  const auto url = net::Url::Parse(response.Location());
  if (!url) {
    return Describe(sender, response, nullptr);
  }

  net::HttpRequestOptions request;
  request.connect_timeout    = options_.fetch_timeout;
  request.io_timeout         = options_.fetch_timeout;
  request.max_response_bytes = options_.max_description_bytes;

  try {
    auto http = net::HttpGet(url->host, url->port, url->path, request, deadline);
    if (!http || http->status != 200) {
      return Describe(sender, response, nullptr);
    }
    auto description = net::ParseDeviceDescription(http->body);
    return Describe(sender, response, &description);
  } catch (const util::MalformedEvidence& e) {
    SCOUT_LOG_DEBUG("device description dropped", {StringField("location", response.Location()), StringField("error", e.what())});
    return Describe(sender, response, nullptr);
  }
}

model::ProbeResult DeviceDescriptionProbe::Describe(const std::string& sender, const net::SsdpMessage& response, const net::DeviceDescription* description) {
  // The LOCATION host is the device itself; the sender can be a proxy on multi-homed hosts.
  std::string address = sender;
  if (auto url = net::Url::Parse(response.Location()); url && IsNumericAddress(url->host)) {
    address = url->host;
  }

  auto result = model::MakeProbeResult(model::ProbeKind::kDeviceDescription, address);
  result.extras["ssdp_location"] = response.Location();
  if (!response.Server().empty()) result.extras["ssdp_server"] = response.Server();
  if (!response.SearchTarget().empty()) result.extras["ssdp_st"] = response.SearchTarget();
  if (!response.Usn().empty()) result.extras["ssdp_usn"] = response.Usn();
  result.services.insert("upnp");

  if (!description) {
    return result;
  }

  result.manufacturer  = description->manufacturer;
  result.model_name    = description->model_name;
  result.friendly_name = description->friendly_name;
  result.device_type   = net::ShortUpnpType(description->device_type);
  for (const auto& service : description->service_types) {
    result.services.insert(net::ShortUpnpType(service));
  }
  if (!description->model_description.empty()) result.extras["upnp_model_description"] = description->model_description;
  if (!description->udn.empty()) result.extras["upnp_udn"] = description->udn;

  if (util::ContainsIgnoreCase(description->manufacturer, "samsung") && util::ContainsIgnoreCase(description->model_name, "smartthings")) {
    result.device_type              = "SmartThings Hub";
    result.extras["identified_as"] = "Samsung SmartThings Hub";
  }
  return result;
}

} // namespace scout::probe
