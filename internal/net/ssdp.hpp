#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace scout::net {

inline constexpr const char*   kSsdpGroup = "239.255.255.250";
inline constexpr std::uint16_t kSsdpPort  = 1900;

// M-SEARCH request for one search target ("ssdp:all", "urn:...", ...).
std::string BuildMSearch(std::string_view search_target, int mx_seconds);

/*
  An SSDP search response or NOTIFY, header names uppercased.
*/
struct SsdpMessage {
  std::string                        start_line;
  std::map<std::string, std::string> headers;

  std::string Header(std::string_view name) const;

  std::string Location() const {
    return Header("LOCATION");
  }
  std::string Server() const {
    return Header("SERVER");
  }
  std::string SearchTarget() const;
  std::string Usn() const {
    return Header("USN");
  }
};

// nullopt when the datagram is not an HTTP-over-UDP response or NOTIFY.
std::optional<SsdpMessage> ParseSsdpMessage(std::string_view datagram);

} // namespace scout::net
