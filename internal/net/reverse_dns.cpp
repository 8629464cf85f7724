#include "reverse_dns.hpp"

#include <arpa/inet.h>

#include <fstream>
#include <sstream>

#include "dns_message.hpp"
#include "internal/util/errors.hpp"
#include "socket.hpp"

namespace scout::net {

namespace {

constexpr std::uint16_t kRcodeMask = 0x000F;

bool IsIpv4(const std::string& text) {
  in_addr parsed{};
  return inet_pton(AF_INET, text.c_str(), &parsed) == 1;
}

} // namespace

std::string ParseNameserver(std::istream& in) {
  std::string line;
  while (std::getline(in, line)) {
    std::istringstream fields(line);
    std::string        keyword, address;
    fields >> keyword >> address;
    if (keyword == "nameserver" && IsIpv4(address)) {
      return address;
    }
  }
  return {};
}

std::string ReadNameserver(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return {};
  }
  return ParseNameserver(in);
}

std::map<std::string, std::string> ReverseResolve(const std::vector<std::string>& addresses, const std::string& resolver, std::uint16_t port,
                                                  const util::Deadline& deadline) {
  std::map<std::string, std::string> names;
  if (addresses.empty() || resolver.empty() || deadline.Expired()) {
    return names;
  }

  auto sock = OpenUdpSocket();
  if (!sock.Valid()) {
    return names;
  }

  // Ids are offsets from a per-call base so stale answers from an earlier call don't match.
  const auto base = static_cast<std::uint16_t>(util::SteadyNow().time_since_epoch().count());

  std::map<std::uint16_t, std::string> pending;
  for (std::size_t i = 0; i < addresses.size() && i < 0xFFFF; ++i) {
    const auto id    = static_cast<std::uint16_t>(base + i);
    const auto query = BuildReverseQuery(addresses[i], id);
    if (query.empty()) {
      continue;
    }
    if (SendDatagram(sock.Get(), resolver, port, query)) {
      pending.emplace(id, addresses[i]);
    }
  }

  while (!pending.empty() && !deadline.Expired()) {
    auto datagram = ReceiveDatagram(sock.Get(), deadline.Clamp(std::chrono::milliseconds(250)));
    if (!datagram || datagram->sender != resolver) {
      continue;
    }

    DnsMessage reply;
    try {
      reply = ParseDnsMessage(datagram->payload);
    } catch (const util::MalformedEvidence&) {
      continue;
    }
    auto it = pending.find(reply.id);
    if (!reply.IsResponse() || it == pending.end()) {
      continue;
    }

    const auto question = ReverseQueryName(it->second);
    if ((reply.flags & kRcodeMask) == 0) {
      for (const auto& record : reply.records) {
        if (record.type == static_cast<std::uint16_t>(DnsType::kPtr) && CanonicalName(record.name) == question && !record.target.empty()) {
          names.emplace(it->second, CanonicalName(record.target));
          break;
        }
      }
    }
    pending.erase(it);
  }
  return names;
}

} // namespace scout::net
