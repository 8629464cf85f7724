#include "active_scan_probe.hpp"

#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <deque>
#include <map>
#include <set>

#include "internal/net/neighbour_table.hpp"
#include "internal/net/oui_table.hpp"
#include "internal/net/reverse_dns.hpp"
#include "internal/net/socket.hpp"
#include "internal/observability/logging.hpp"

namespace scout::probe {

namespace {

struct Attempt {
  std::string     host;
  std::uint16_t   port = 0;
  net::Socket     socket;
  util::Deadline  expires;
};

struct HostState {
  std::set<std::uint16_t> open_ports;
  std::string             method;
};

void MarkLive(std::map<std::string, HostState>& hosts, const std::string& host, const char* method) {
  auto& state = hosts[host];
  if (state.method.empty()) {
    state.method = method;
  }
}

} // namespace

ActiveScanProbe::ActiveScanProbe(ActiveScanOptions options) : options_(std::move(options)) {
  if (options_.max_in_flight == 0) {
    options_.max_in_flight = 1;
  }
}

Capability ActiveScanProbe::CheckCapability() {
  net::Socket probe_socket(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!probe_socket.Valid()) {
    return Capability::Unavailable("cannot create TCP socket");
  }
  return Capability::Available();
}

void ActiveScanProbe::Run(const ProbeTarget& target, const util::Deadline& deadline, ResultSink& sink) {
  const auto hosts = target.range.Hosts(options_.max_hosts);
  if (target.range.HostCount() > hosts.size()) {
    SCOUT_LOG_WARN("active scan truncated to max_hosts",
                   {observability::StringField("range", target.range.Expression()), observability::IntField("max_hosts", static_cast<std::int64_t>(options_.max_hosts))});
  }

  std::deque<std::pair<std::string, std::uint16_t>> queue;
  for (const auto& host : hosts) {
    for (auto port : options_.ports) {
      queue.emplace_back(host, port);
    }
  }

  std::map<std::string, HostState> live;
  std::vector<Attempt>             in_flight;

  // ------------------------------------------------------------
  // Connect sweep
  // ------------------------------------------------------------
  while ((!queue.empty() || !in_flight.empty()) && !deadline.Expired()) {
    while (!queue.empty() && in_flight.size() < options_.max_in_flight && !deadline.Expired()) {
      auto [host, port] = queue.front();
      queue.pop_front();

      auto started = net::StartConnect(host, port);
      switch (started.status) {
        case net::ConnectStatus::kConnected:
          MarkLive(live, host, "tcp_connect");
          live[host].open_ports.insert(port);
          break;
        case net::ConnectStatus::kRefused:
          MarkLive(live, host, "tcp_refused");
          break;
        case net::ConnectStatus::kInProgress:
          in_flight.push_back({host, port, std::move(started.socket), util::Deadline::After(options_.connect_timeout)});
          break;
        default:
          break;
      }
    }
    if (in_flight.empty()) {
      continue;
    }

    std::vector<pollfd> fds;
    fds.reserve(in_flight.size());
    for (const auto& attempt : in_flight) {
      fds.push_back({attempt.socket.Get(), POLLOUT, 0});
    }
    const auto wait = deadline.Clamp(std::chrono::milliseconds(50));
    const int  rc   = ::poll(fds.data(), fds.size(), static_cast<int>(wait.count()));
    if (rc < 0 && errno != EINTR) {
      SCOUT_LOG_WARN("active scan poll failed", {observability::IntField("errno", errno)});
      break;
    }

    std::vector<Attempt> still_pending;
    for (std::size_t i = 0; i < in_flight.size(); ++i) {
      auto& attempt = in_flight[i];
      if (fds[i].revents != 0) {
        const auto status = net::FinishConnect(attempt.socket.Get());
        if (status == net::ConnectStatus::kConnected) {
          MarkLive(live, attempt.host, "tcp_connect");
          live[attempt.host].open_ports.insert(attempt.port);
        } else if (status == net::ConnectStatus::kRefused) {
          MarkLive(live, attempt.host, "tcp_refused");
        }
        continue;
      }
      if (!attempt.expires.Expired()) {
        still_pending.push_back(std::move(attempt));
      }
    }
    in_flight.swap(still_pending);
  }

  // ------------------------------------------------------------
  // Neighbour table: MAC addresses and ARP-only liveness
  // ------------------------------------------------------------
  const auto neighbours = net::ReadNeighbourTable(options_.neighbour_table_path);
  for (const auto& [address, mac] : neighbours) {
    if (target.range.Contains(address)) {
      MarkLive(live, address, "neighbour_table");
    }
  }

  // ------------------------------------------------------------
  // Hostnames
  // ------------------------------------------------------------
  std::map<std::string, std::string> hostnames;
  if (options_.resolve_hostnames && !live.empty() && !deadline.Expired()) {
    const auto resolver = options_.resolver.empty() ? net::ReadNameserver(options_.resolv_conf_path) : options_.resolver;
    std::vector<std::string> addresses;
    addresses.reserve(live.size());
    for (const auto& [address, state] : live) {
      addresses.push_back(address);
    }
    hostnames = net::ReverseResolve(addresses, resolver, options_.resolver_port, util::Deadline::After(options_.lookup_timeout).Min(deadline));
  }

  // Reported even when the deadline cut the sweep or the lookups short.
  for (const auto& [address, state] : live) {
    auto result       = model::MakeProbeResult(model::ProbeKind::kActiveScan, address);
    result.open_ports = state.open_ports;
    result.extras["liveness"] = state.method;

    auto mac = neighbours.find(address);
    if (mac != neighbours.end()) {
      result.mac_address = mac->second;
      result.mac_vendor  = net::LookupMacVendor(mac->second);
    }
    if (auto name = hostnames.find(address); name != hostnames.end()) {
      result.hostname = name->second;
    }
    sink.Emit(std::move(result));
  }

  SCOUT_LOG_DEBUG("active scan finished",
                  {observability::IntField("hosts_probed", static_cast<std::int64_t>(hosts.size())),
                   observability::IntField("live", static_cast<std::int64_t>(live.size())),
                   observability::IntField("named", static_cast<std::int64_t>(hostnames.size())),
                   observability::IntField("not_attempted", static_cast<std::int64_t>(queue.size()))});
}

} // namespace scout::probe
