#include "internal/net/dns_message.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using scout::net::CanonicalName;
using scout::net::DnsType;
using scout::net::ParseDnsMessage;

void PutU16(std::string& out, std::uint16_t value) {
  out.push_back(static_cast<char>(value >> 8));
  out.push_back(static_cast<char>(value & 0xFF));
}

void PutU32(std::string& out, std::uint32_t value) {
  PutU16(out, static_cast<std::uint16_t>(value >> 16));
  PutU16(out, static_cast<std::uint16_t>(value & 0xFFFF));
}

void PutName(std::string& out, std::initializer_list<const char*> labels) {
  for (const char* label : labels) {
    out.push_back(static_cast<char>(std::char_traits<char>::length(label)));
    out.append(label);
  }
  out.push_back('\0');
}

void PutHeader(std::string& out, std::uint16_t flags, std::uint16_t answers) {
  PutU16(out, 0);
  PutU16(out, flags);
  PutU16(out, 0);
  PutU16(out, answers);
  PutU16(out, 0);
  PutU16(out, 0);
}

void PutRecordHead(std::string& out, DnsType type, std::uint16_t rdlength) {
  PutU16(out, static_cast<std::uint16_t>(type));
  PutU16(out, 0x8001);  // IN with cache-flush
  PutU32(out, 120);
  PutU16(out, rdlength);
}

// Announcement for "bridge._hue._tcp.local" on host "hue.local" at 192.168.1.20.
std::string HueAnnouncement() {
  std::string packet;
  PutHeader(packet, 0x8400, 4);

  // PTR _hue._tcp.local -> bridge._hue._tcp.local (target compressed against the owner name)
  const auto service_offset = packet.size();
  PutName(packet, {"_hue", "_tcp", "local"});
  PutRecordHead(packet, DnsType::kPtr, 9);
  const auto instance_offset = packet.size();
  packet.push_back(6);
  packet.append("bridge");
  packet.push_back(static_cast<char>(0xC0));
  packet.push_back(static_cast<char>(service_offset));

  // SRV bridge._hue._tcp.local -> hue.local:443
  packet.push_back(static_cast<char>(0xC0));
  packet.push_back(static_cast<char>(instance_offset));
  std::string srv;
  PutU16(srv, 0);
  PutU16(srv, 0);
  PutU16(srv, 443);
  PutName(srv, {"hue", "local"});
  PutRecordHead(packet, DnsType::kSrv, static_cast<std::uint16_t>(srv.size()));
  packet += srv;

  // TXT bridgeid=001788fffe, modelid=BSB002, flag
  packet.push_back(static_cast<char>(0xC0));
  packet.push_back(static_cast<char>(instance_offset));
  std::string txt;
  for (std::string entry : {"bridgeid=001788fffe", "modelid=BSB002", "flag"}) {
    txt.push_back(static_cast<char>(entry.size()));
    txt += entry;
  }
  PutRecordHead(packet, DnsType::kTxt, static_cast<std::uint16_t>(txt.size()));
  packet += txt;

  // A hue.local -> 192.168.1.20
  PutName(packet, {"hue", "local"});
  PutRecordHead(packet, DnsType::kA, 4);
  packet.push_back(static_cast<char>(192));
  packet.push_back(static_cast<char>(168));
  packet.push_back(1);
  packet.push_back(20);
  return packet;
}

void TestParsesAnnouncementWithCompression() {
  auto message = ParseDnsMessage(HueAnnouncement());
  assert(message.IsResponse());
  assert(message.records.size() == 4);

  const auto& ptr = message.records[0];
  assert(ptr.type == static_cast<std::uint16_t>(DnsType::kPtr));
  assert(ptr.klass == 1);
  assert(CanonicalName(ptr.name) == "_hue._tcp.local");
  assert(CanonicalName(ptr.target) == "bridge._hue._tcp.local");

  const auto& srv = message.records[1];
  assert(CanonicalName(srv.name) == "bridge._hue._tcp.local");
  assert(srv.port == 443);
  assert(CanonicalName(srv.target) == "hue.local");

  const auto& txt = message.records[2];
  assert(txt.txt.at("bridgeid") == "001788fffe");
  assert(txt.txt.at("modelid") == "BSB002");
  assert(txt.txt.count("flag") == 1);

  const auto& a = message.records[3];
  assert(a.address == "192.168.1.20");
}

void TestTruncatedPacketIsMalformed() {
  auto packet = HueAnnouncement();
  packet.resize(packet.size() - 3);
  bool threw = false;
  try {
    ParseDnsMessage(packet);
  } catch (const scout::util::MalformedEvidence&) {
    threw = true;
  }
  assert(threw);
}

void TestCompressionLoopIsMalformed() {
  std::string packet;
  PutHeader(packet, 0x8400, 1);
  // Name is a pointer to itself.
  packet.push_back(static_cast<char>(0xC0));
  packet.push_back(12);
  PutRecordHead(packet, DnsType::kA, 4);
  packet.append(4, '\0');

  bool threw = false;
  try {
    ParseDnsMessage(packet);
  } catch (const scout::util::MalformedEvidence&) {
    threw = true;
  }
  assert(threw);
}

void TestBadSrvDropsOnlyThatRecord() {
  std::string packet;
  PutHeader(packet, 0x8400, 3);

  // SRV with 3 bytes of RDATA.
  PutName(packet, {"hub", "_smartthings", "_tcp", "local"});
  PutRecordHead(packet, DnsType::kSrv, 3);
  packet.append("\x00\x01\x02", 3);

  // PTR whose target points past the end of the packet.
  PutName(packet, {"_hue", "_tcp", "local"});
  PutRecordHead(packet, DnsType::kPtr, 2);
  packet.push_back(static_cast<char>(0xC0 | 0x3F));
  packet.push_back(static_cast<char>(0xFF));

  // A hub.local -> 192.168.1.20
  PutName(packet, {"hub", "local"});
  PutRecordHead(packet, DnsType::kA, 4);
  packet.push_back(static_cast<char>(192));
  packet.push_back(static_cast<char>(168));
  packet.push_back(1);
  packet.push_back(20);

  auto message = ParseDnsMessage(packet);
  assert(message.skipped_records == 2);
  assert(message.records.size() == 1);
  assert(CanonicalName(message.records[0].name) == "hub.local");
  assert(message.records[0].address == "192.168.1.20");
}

void TestWrongSizedAddressIsSkipped() {
  std::string packet;
  PutHeader(packet, 0x8400, 2);
  PutName(packet, {"odd", "local"});
  PutRecordHead(packet, DnsType::kA, 3);
  packet.append(3, '\x01');
  PutName(packet, {"hue", "local"});
  PutRecordHead(packet, DnsType::kA, 4);
  packet.append("\x0a\x00\x00\x07", 4);

  auto message = ParseDnsMessage(packet);
  assert(message.skipped_records == 1);
  assert(message.records.size() == 1);
  assert(message.records[0].address == "10.0.0.7");
}

void TestReverseQuery() {
  assert(scout::net::ReverseQueryName("192.168.1.20") == "20.1.168.192.in-addr.arpa");
  assert(scout::net::ReverseQueryName("fe80::1").empty());
  assert(scout::net::BuildReverseQuery("not-an-address", 1).empty());

  auto query   = scout::net::BuildReverseQuery("10.0.0.7", 0x1234);
  auto message = ParseDnsMessage(query);
  assert(message.id == 0x1234);
  assert(!message.IsResponse());
  assert((message.flags & 0x0100) != 0);
  assert(CanonicalName(message.questions.at(0)) == "7.0.0.10.in-addr.arpa");
}

void TestPtrQueryRoundTrip() {
  auto query   = scout::net::BuildPtrQuery("_smartthings._tcp.local", true);
  auto message = ParseDnsMessage(query);
  assert(!message.IsResponse());
  assert(message.questions.size() == 1);
  assert(CanonicalName(message.questions[0]) == "_smartthings._tcp.local");
  // QU bit set on the question class.
  assert(static_cast<std::uint8_t>(query[query.size() - 2]) == 0x80);
}

void TestCanonicalName() {
  assert(CanonicalName("Living-Room._HAP._tcp.local.") == "living-room._hap._tcp.local");
  assert(CanonicalName("") == "");
}

} // namespace

int main() {
  TestParsesAnnouncementWithCompression();
  TestTruncatedPacketIsMalformed();
  TestCompressionLoopIsMalformed();
  TestBadSrvDropsOnlyThatRecord();
  TestWrongSizedAddressIsSkipped();
  TestReverseQuery();
  TestPtrQueryRoundTrip();
  TestCanonicalName();

  std::cout << "device_scout_unit_dns_message: pass\n";
  return 0;
}
