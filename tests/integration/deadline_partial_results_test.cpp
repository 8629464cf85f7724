#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/net/dns_message.hpp"
#include "internal/net/socket.hpp"
#include "internal/probe/active_scan_probe.hpp"
#include "internal/probe/device_description_probe.hpp"
#include "internal/probe/service_announcement_probe.hpp"

namespace {

using scout::model::ProbeKind;
using scout::probe::CollectingSink;
using scout::probe::ProbeTarget;
using scout::util::Deadline;
using std::chrono::milliseconds;

using Clock = std::chrono::steady_clock;

std::uint16_t LocalPort(int fd) {
  sockaddr_in address{};
  socklen_t   length = sizeof(address);
  assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&address), &length) == 0);
  return ntohs(address.sin_port);
}

void BindLoopback(int fd) {
  sockaddr_in address{};
  address.sin_family      = AF_INET;
  address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  assert(::bind(fd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) == 0);
}

// A loopback port nothing listens on.
std::uint16_t ClosedTcpPort() {
  scout::net::Socket sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  BindLoopback(sock.Get());
  return LocalPort(sock.Get());
}

std::uint16_t FreeUdpPort() {
  auto sock = scout::net::OpenUdpSocket();
  BindLoopback(sock.Get());
  return LocalPort(sock.Get());
}

ProbeTarget TargetFor(const std::string& cidr) {
  ProbeTarget target;
  target.range = scout::net::NetworkRange::Parse(cidr);
  return target;
}

/*
  Loopback UDP endpoint. Every datagram goes through the handler; a
  returned payload is sent back to the sender.
*/
class UdpResponder {
 public:
  using Handler = std::function<std::optional<std::string>(const scout::net::Datagram&)>;

  explicit UdpResponder(Handler handler) : handler_(std::move(handler)), socket_(scout::net::OpenUdpSocket()) {
    assert(socket_.Valid());
    BindLoopback(socket_.Get());
    port_   = LocalPort(socket_.Get());
    thread_ = std::thread([this] { Serve(); });
  }

  ~UdpResponder() {
    stop_ = true;
    thread_.join();
  }

  std::uint16_t Port() const {
    return port_;
  }

  int Received() const {
    return received_.load();
  }

 private:
  void Serve() {
    while (!stop_.load()) {
      auto datagram = scout::net::ReceiveDatagram(socket_.Get(), milliseconds(20));
      if (!datagram) {
        continue;
      }
      ++received_;
      if (auto reply = handler_(*datagram)) {
        scout::net::SendDatagram(socket_.Get(), datagram->sender, datagram->sender_port, *reply);
      }
    }
  }

  Handler            handler_;
  scout::net::Socket socket_;
  std::uint16_t      port_ = 0;
  std::atomic<bool>  stop_{false};
  std::atomic<int>   received_{0};
  std::thread        thread_;
};

// Accepts TCP connections and never answers them.
class StallingServer {
 public:
  StallingServer() {
    listener_.Reset(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    BindLoopback(listener_.Get());
    assert(::listen(listener_.Get(), 16) == 0);
    port_   = LocalPort(listener_.Get());
    thread_ = std::thread([this] {
      while (!stop_.load()) {
        pollfd pfd{listener_.Get(), POLLIN, 0};
        if (::poll(&pfd, 1, 20) <= 0) {
          continue;
        }
        scout::net::Socket client(::accept(listener_.Get(), nullptr, nullptr));
        if (client.Valid()) {
          held_.push_back(std::move(client));
        }
      }
    });
  }

  ~StallingServer() {
    stop_ = true;
    thread_.join();
  }

  std::uint16_t Port() const {
    return port_;
  }

 private:
  scout::net::Socket              listener_;
  std::uint16_t                   port_ = 0;
  std::vector<scout::net::Socket> held_;
  std::atomic<bool>               stop_{false};
  std::thread                     thread_;
};

// ------------------------------------------------------------
// DNS packet building
// ------------------------------------------------------------

void PutU16(std::string& out, std::uint16_t value) {
  out.push_back(static_cast<char>(value >> 8));
  out.push_back(static_cast<char>(value & 0xFF));
}

void PutName(std::string& out, std::initializer_list<const char*> labels) {
  for (const char* label : labels) {
    out.push_back(static_cast<char>(std::char_traits<char>::length(label)));
    out.append(label);
  }
  out.push_back('\0');
}

void PutRecordHead(std::string& out, scout::net::DnsType type, std::uint16_t rdlength) {
  PutU16(out, static_cast<std::uint16_t>(type));
  PutU16(out, 0x0001);
  PutU16(out, 0);
  PutU16(out, 120);
  PutU16(out, rdlength);
}

// PTR answer to a reverse query: echoes the question, names the host "host-<last octet>.lan".
std::optional<std::string> AnswerReverseQuery(const scout::net::Datagram& datagram) {
  const auto& query = datagram.payload;
  if (query.size() < 12) {
    return std::nullopt;
  }
  const auto question = scout::net::ParseDnsMessage(query).questions.at(0);
  const auto octet    = question.substr(0, question.find('.'));

  std::string reply = query.substr(0, 2);
  PutU16(reply, 0x8180);
  PutU16(reply, 1);
  PutU16(reply, 1);
  PutU16(reply, 0);
  PutU16(reply, 0);
  reply += query.substr(12);

  std::string target;
  const auto  label = "host-" + octet;
  target.push_back(static_cast<char>(label.size()));
  target += label;
  PutName(target, {"lan"});

  reply.push_back(static_cast<char>(0xC0));
  reply.push_back(12);
  PutRecordHead(reply, scout::net::DnsType::kPtr, static_cast<std::uint16_t>(target.size()));
  reply += target;
  return reply;
}

// Hue announcement carrying one SRV record with unusable RDATA next to valid PTR, SRV and A records.
std::string HueAnnouncementWithBadRecord() {
  using scout::net::DnsType;

  std::string packet;
  PutU16(packet, 0);
  PutU16(packet, 0x8400);
  PutU16(packet, 0);
  PutU16(packet, 4);
  PutU16(packet, 0);
  PutU16(packet, 0);

  std::string instance;
  PutName(instance, {"bridge", "_hue", "_tcp", "local"});

  PutName(packet, {"_hue", "_tcp", "local"});
  PutRecordHead(packet, DnsType::kPtr, static_cast<std::uint16_t>(instance.size()));
  packet += instance;

  PutName(packet, {"other", "_hue", "_tcp", "local"});
  PutRecordHead(packet, DnsType::kSrv, 3);
  packet.append("\x00\x01\x02", 3);

  std::string srv;
  PutU16(srv, 0);
  PutU16(srv, 0);
  PutU16(srv, 443);
  PutName(srv, {"hue", "local"});
  PutName(packet, {"bridge", "_hue", "_tcp", "local"});
  PutRecordHead(packet, DnsType::kSrv, static_cast<std::uint16_t>(srv.size()));
  packet += srv;

  PutName(packet, {"hue", "local"});
  PutRecordHead(packet, DnsType::kA, 4);
  packet.append("\xc0\xa8\x01\x14", 4);
  return packet;
}

// ------------------------------------------------------------
// Tests
// ------------------------------------------------------------

void TestActiveScanKeepsHostsFoundBeforeDeadline() {
  scout::probe::ActiveScanOptions options;
  options.ports.clear();
  for (std::uint16_t port = 20000; port < 20040; ++port) {
    options.ports.push_back(port);
  }
  options.max_in_flight        = 1;
  options.connect_timeout      = milliseconds(200);
  options.neighbour_table_path = "/nonexistent/arp";
  options.resolve_hostnames    = true;
  options.resolver             = "127.0.0.1";
  options.resolver_port        = FreeUdpPort();

  scout::probe::ActiveScanProbe scan(options);
  CollectingSink                sink;

  const auto started = Clock::now();
  scan.Run(TargetFor("127.0.0.0/24"), Deadline::After(milliseconds(100)), sink);
  assert(Clock::now() - started < milliseconds(1000));

  const auto results = sink.Results();
  assert(!results.empty());
  assert(results.size() <= 254);
  for (const auto& result : results) {
    assert(result.kind == ProbeKind::kActiveScan);
    assert(result.address.rfind("127.0.0.", 0) == 0);
    assert(!result.extras.at("liveness").empty());
    assert(result.hostname.empty());
  }
}

void TestSilentResolverDoesNotHoldUpResults() {
  // Swallows every query.
  UdpResponder resolver([](const scout::net::Datagram&) { return std::nullopt; });

  scout::probe::ActiveScanOptions options;
  options.ports                = {ClosedTcpPort()};
  options.neighbour_table_path = "/nonexistent/arp";
  options.resolver             = "127.0.0.1";
  options.resolver_port        = resolver.Port();
  options.lookup_timeout       = milliseconds(10000);

  scout::probe::ActiveScanProbe scan(options);
  CollectingSink                sink;

  const auto started = Clock::now();
  scan.Run(TargetFor("127.0.0.0/29"), Deadline::After(milliseconds(400)), sink);
  assert(Clock::now() - started < milliseconds(1500));

  assert(sink.Results().size() == 6);
  assert(resolver.Received() == 6);
  for (const auto& result : sink.Results()) {
    assert(result.hostname.empty());
  }
}

void TestReverseLookupFillsHostnames() {
  UdpResponder resolver(AnswerReverseQuery);

  scout::probe::ActiveScanOptions options;
  options.ports                = {ClosedTcpPort()};
  options.neighbour_table_path = "/nonexistent/arp";
  options.resolver             = "127.0.0.1";
  options.resolver_port        = resolver.Port();

  scout::probe::ActiveScanProbe scan(options);
  CollectingSink                sink;
  scan.Run(TargetFor("127.0.0.0/30"), Deadline::After(milliseconds(2000)), sink);

  const auto results = sink.Results();
  assert(results.size() == 2);
  for (const auto& result : results) {
    const auto octet = result.address.substr(result.address.rfind('.') + 1);
    assert(result.hostname == "host-" + octet + ".lan");
  }
}

void TestUnfetchedDescriptionsAreStillReported() {
  StallingServer   http;
  const auto       port = std::to_string(http.Port());
  std::atomic<int> searches{0};

  // The search is sent twice; each copy is answered with a different
  // description document on the same stalled server.
  UdpResponder ssdp([&port, &searches](const scout::net::Datagram& datagram) -> std::optional<std::string> {
    if (datagram.payload.rfind("M-SEARCH", 0) != 0) {
      return std::nullopt;
    }
    const auto path = ++searches == 1 ? "/description.xml" : "/other.xml";
    return "HTTP/1.1 200 OK\r\nLOCATION: http://127.0.0.1:" + port + path +
           "\r\nSERVER: Linux UPnP/1.0 Sonos/70.3\r\nST: upnp:rootdevice\r\nUSN: uuid:RINCON_1::upnp:rootdevice\r\n\r\n";
  });

  scout::probe::DeviceDescriptionOptions options;
  options.search_address = "127.0.0.1";
  options.search_port    = ssdp.Port();
  options.search_window  = milliseconds(2000);
  options.fetch_timeout  = milliseconds(5000);

  scout::probe::DeviceDescriptionProbe upnp(options);
  assert(upnp.CheckCapability().available);

  CollectingSink sink;
  const auto     started = Clock::now();
  upnp.Run(ProbeTarget{}, Deadline::After(milliseconds(600)), sink);
  assert(Clock::now() - started < milliseconds(1500));

  // The first fetch stalls until the deadline; the second location is never fetched.
  const auto results = sink.Results();
  assert(searches.load() == 2);
  assert(results.size() == 2);
  for (const auto& result : results) {
    assert(result.kind == ProbeKind::kDeviceDescription);
    assert(result.address == "127.0.0.1");
    assert(result.manufacturer.empty());
    assert(result.services.count("upnp") == 1);
    assert(result.extras.at("ssdp_location").find(port) != std::string::npos);
  }
}

void TestMdnsWindowCutShortKeepsResolvedInstances() {
  scout::probe::ServiceAnnouncementOptions options;
  options.port              = FreeUdpPort();
  options.send_queries      = false;
  options.listen_window     = milliseconds(8000);
  options.interface_address = "127.0.0.1";

  scout::probe::ServiceAnnouncementProbe mdns(options);
  const auto                             capability = mdns.CheckCapability();
  if (!capability.available) {
    // No multicast on this host's loopback; the parsing side is covered by unit tests.
    std::cout << "mdns window test skipped: " << capability.reason << "\n";
    return;
  }

  auto sender = scout::net::OpenUdpSocket();
  assert(scout::net::SendDatagram(sender.Get(), "127.0.0.1", options.port, HueAnnouncementWithBadRecord()));

  CollectingSink sink;
  const auto     started = Clock::now();
  mdns.Run(ProbeTarget{}, Deadline::After(milliseconds(300)), sink);
  assert(Clock::now() - started < milliseconds(1000));

  const auto results = sink.Results();
  assert(results.size() == 1);
  assert(results[0].kind == ProbeKind::kServiceAnnouncement);
  assert(results[0].address == "192.168.1.20");
  assert(results[0].manufacturer == "Philips");
  assert(results[0].services.count("hue") == 1);
}

} // namespace

int main() {
  TestActiveScanKeepsHostsFoundBeforeDeadline();
  TestSilentResolverDoesNotHoldUpResults();
  TestReverseLookupFillsHostnames();
  TestUnfetchedDescriptionsAreStillReported();
  TestMdnsWindowCutShortKeepsResolvedInstances();

  std::cout << "device_scout_integration_deadline_partial_results: pass\n";
  return 0;
}
