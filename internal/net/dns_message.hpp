#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace scout::net {

/*
  Just enough of the DNS wire format (RFC 1035 / RFC 6762) to read
  multicast DNS announcements and to send PTR queries.
*/

enum class DnsType : std::uint16_t {
  kA    = 1,
  kPtr  = 12,
  kTxt  = 16,
  kAaaa = 28,
  kSrv  = 33,
  kAny  = 255,
};

struct DnsRecord {
  std::string   name;
  std::uint16_t type  = 0;
  std::uint16_t klass = 0;
  std::uint32_t ttl   = 0;

  // Decoded RDATA for the types we understand; raw otherwise.
  std::string                        target;  // PTR target or SRV target
  std::uint16_t                      port = 0;  // SRV
  std::string                        address;   // A / AAAA in text form
  std::map<std::string, std::string> txt;
};

struct DnsMessage {
  std::uint16_t            id    = 0;
  std::uint16_t            flags = 0;
  std::vector<std::string> questions;
  std::vector<DnsRecord>   records;  // answers, authority and additional, in order

  // Records whose RDATA could not be decoded. They are left out of records.
  std::size_t skipped_records = 0;

  bool IsResponse() const {
    return (flags & 0x8000) != 0;
  }
};

/*
  Throws util::MalformedEvidence when the message structure is unusable:
  a truncated header, question or record header, or a looping owner name.
  A record whose RDATA alone is bad is skipped and counted instead.
*/
DnsMessage ParseDnsMessage(std::string_view packet);

// One-question PTR query. unicast_response sets the mDNS QU bit.
std::string BuildPtrQuery(std::string_view name, bool unicast_response);

// "192.168.1.20" -> "20.1.168.192.in-addr.arpa"; empty for anything but IPv4.
std::string ReverseQueryName(std::string_view ipv4);

// Recursive unicast PTR query for an IPv4 address. Empty when the address does not parse.
std::string BuildReverseQuery(std::string_view ipv4, std::uint16_t id);

// Lowercased, trailing dot removed: "_hue._tcp.local." -> "_hue._tcp.local"
std::string CanonicalName(std::string_view name);

} // namespace scout::net
