#include "dns_message.hpp"

#include <arpa/inet.h>
#include <sys/socket.h>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace scout::net {

namespace {

constexpr std::size_t kHeaderSize      = 12;
constexpr int         kMaxPointerJumps = 32;

class Reader {
 public:
  explicit Reader(std::string_view packet) : packet_(packet) {
  }

  std::uint8_t U8() {
    Need(1);
    return static_cast<std::uint8_t>(packet_[pos_++]);
  }

  std::uint16_t U16() {
    Need(2);
    const auto value = static_cast<std::uint16_t>((Byte(pos_) << 8) | Byte(pos_ + 1));
    pos_ += 2;
    return value;
  }

  std::uint32_t U32() {
    const std::uint32_t high = U16();
    return (high << 16) | U16();
  }

  std::string Name() {
    auto name = NameAt(pos_, &pos_);
    return name;
  }

  // Decodes a possibly compressed name starting at offset; next receives the
  // position after the name in the original stream.
  std::string NameAt(std::size_t offset, std::size_t* next) const {
    std::string name;
    std::size_t cursor = offset;
    bool        jumped = false;
    int         jumps  = 0;

    for (;;) {
      if (cursor >= packet_.size()) {
        throw util::MalformedEvidence("dns name runs past end of packet");
      }
      const auto length = Byte(cursor);
      if (length == 0) {
        if (!jumped) {
          *next = cursor + 1;
        }
        break;
      }
      if ((length & 0xC0) == 0xC0) {
        if (cursor + 1 >= packet_.size()) {
          throw util::MalformedEvidence("truncated dns compression pointer");
        }
        if (++jumps > kMaxPointerJumps) {
          throw util::MalformedEvidence("dns compression loop");
        }
        const std::size_t target = ((length & 0x3F) << 8) | Byte(cursor + 1);
        if (!jumped) {
          *next = cursor + 2;
        }
        jumped = true;
        cursor = target;
        continue;
      }
      if (cursor + 1 + length > packet_.size()) {
        throw util::MalformedEvidence("dns label runs past end of packet");
      }
      name.append(packet_.substr(cursor + 1, length));
      name.push_back('.');
      cursor += 1 + length;
    }
    return name;
  }

  std::string_view Bytes(std::size_t count) {
    Need(count);
    auto view = packet_.substr(pos_, count);
    pos_ += count;
    return view;
  }

  std::size_t Position() const {
    return pos_;
  }

 private:
  void Need(std::size_t count) const {
    if (pos_ + count > packet_.size()) {
      throw util::MalformedEvidence("truncated dns message");
    }
  }

  unsigned Byte(std::size_t at) const {
    return static_cast<std::uint8_t>(packet_[at]);
  }

  std::string_view packet_;
  std::size_t      pos_ = 0;
};

std::map<std::string, std::string> ParseTxt(std::string_view rdata) {
  std::map<std::string, std::string> entries;
  std::size_t                        pos = 0;
  while (pos < rdata.size()) {
    const auto length = static_cast<std::uint8_t>(rdata[pos]);
    if (pos + 1 + length > rdata.size()) {
      break;
    }
    const auto entry = rdata.substr(pos + 1, length);
    pos += 1 + length;
    if (entry.empty()) {
      continue;
    }
    const auto eq = entry.find('=');
    if (eq == std::string_view::npos) {
      entries.emplace(std::string(entry), "");
    } else {
      entries.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
    }
  }
  return entries;
}

void DecodeRdata(const Reader& reader, std::string_view rdata, std::size_t rdata_at, DnsRecord& record) {
  std::size_t ignored = 0;
  switch (static_cast<DnsType>(record.type)) {
    case DnsType::kPtr:
      record.target = reader.NameAt(rdata_at, &ignored);
      break;
    case DnsType::kSrv:
      if (rdata.size() < 7) {
        throw util::MalformedEvidence("short SRV record");
      }
      record.port   = static_cast<std::uint16_t>((static_cast<std::uint8_t>(rdata[4]) << 8) | static_cast<std::uint8_t>(rdata[5]));
      record.target = reader.NameAt(rdata_at + 6, &ignored);
      break;
    case DnsType::kTxt:
      record.txt = ParseTxt(rdata);
      break;
    case DnsType::kA:
      if (rdata.size() != 4) {
        throw util::MalformedEvidence("A record is not 4 bytes");
      }
      {
        char text[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, rdata.data(), text, sizeof(text));
        record.address = text;
      }
      break;
    case DnsType::kAaaa:
      if (rdata.size() != 16) {
        throw util::MalformedEvidence("AAAA record is not 16 bytes");
      }
      {
        char text[INET6_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET6, rdata.data(), text, sizeof(text));
        record.address = text;
      }
      break;
    default:
      break;
  }
}

void AppendName(std::string& out, std::string_view name) {
  for (const auto& label : util::Split(name, '.')) {
    if (label.empty()) {
      continue;
    }
    out.push_back(static_cast<char>(label.size()));
    out.append(label);
  }
  out.push_back('\0');
}

void AppendU16(std::string& out, std::uint16_t value) {
  out.push_back(static_cast<char>(value >> 8));
  out.push_back(static_cast<char>(value & 0xFF));
}

} // namespace

DnsMessage ParseDnsMessage(std::string_view packet) {
  if (packet.size() < kHeaderSize) {
    throw util::MalformedEvidence("dns message shorter than header");
  }

  Reader     reader(packet);
  DnsMessage message;
  message.id         = reader.U16();
  message.flags      = reader.U16();
  const auto qdcount = reader.U16();
  const auto ancount = reader.U16();
  const auto nscount = reader.U16();
  const auto arcount = reader.U16();

  for (unsigned i = 0; i < qdcount; ++i) {
    message.questions.push_back(reader.Name());
    reader.U16();  // qtype
    reader.U16();  // qclass
  }

  const unsigned record_count = static_cast<unsigned>(ancount) + nscount + arcount;
  for (unsigned i = 0; i < record_count; ++i) {
    DnsRecord record;
    record.name         = reader.Name();
    record.type         = reader.U16();
    record.klass        = reader.U16() & 0x7FFF;  // strip mDNS cache-flush bit
    record.ttl          = reader.U32();
    const auto rdlength = reader.U16();
    const auto rdata_at = reader.Position();
    const auto rdata    = reader.Bytes(rdlength);

    // The record boundary is known from rdlength, so unusable RDATA only costs this record.
    try {
      DecodeRdata(reader, rdata, rdata_at, record);
    } catch (const util::MalformedEvidence&) {
      ++message.skipped_records;
      continue;
    }
    message.records.push_back(std::move(record));
  }
  return message;
}

std::string ReverseQueryName(std::string_view ipv4) {
  in_addr parsed{};
  const std::string text(ipv4);
  if (inet_pton(AF_INET, text.c_str(), &parsed) != 1) {
    return {};
  }
  const auto* octets = reinterpret_cast<const std::uint8_t*>(&parsed.s_addr);
  return std::to_string(octets[3]) + "." + std::to_string(octets[2]) + "." + std::to_string(octets[1]) + "." + std::to_string(octets[0]) +
         ".in-addr.arpa";
}

std::string BuildReverseQuery(std::string_view ipv4, std::uint16_t id) {
  const auto name = ReverseQueryName(ipv4);
  if (name.empty()) {
    return {};
  }
  std::string packet;
  AppendU16(packet, id);
  AppendU16(packet, 0x0100);  // recursion desired
  AppendU16(packet, 1);
  AppendU16(packet, 0);
  AppendU16(packet, 0);
  AppendU16(packet, 0);
  AppendName(packet, name);
  AppendU16(packet, static_cast<std::uint16_t>(DnsType::kPtr));
  AppendU16(packet, 0x0001);
  return packet;
}

std::string BuildPtrQuery(std::string_view name, bool unicast_response) {
  std::string packet;
  AppendU16(packet, 0);  // id
  AppendU16(packet, 0);  // flags: standard query
  AppendU16(packet, 1);  // qdcount
  AppendU16(packet, 0);
  AppendU16(packet, 0);
  AppendU16(packet, 0);
  AppendName(packet, name);
  AppendU16(packet, static_cast<std::uint16_t>(DnsType::kPtr));
  AppendU16(packet, unicast_response ? 0x8001 : 0x0001);
  return packet;
}

std::string CanonicalName(std::string_view name) {
  auto lowered = util::ToLower(name);
  while (!lowered.empty() && lowered.back() == '.') {
    lowered.pop_back();
  }
  return lowered;
}

} // namespace scout::net
