#include "ssdp.hpp"

#include <cctype>
#include <sstream>

#include "internal/util/strings.hpp"

namespace scout::net {

std::string BuildMSearch(std::string_view search_target, int mx_seconds) {
  std::ostringstream request;
  request << "M-SEARCH * HTTP/1.1\r\n"
          << "HOST: " << kSsdpGroup << ":" << kSsdpPort << "\r\n"
          << "MAN: \"ssdp:discover\"\r\n"
          << "MX: " << mx_seconds << "\r\n"
          << "ST: " << search_target << "\r\n"
          << "USER-AGENT: device-scout/0.1 UPnP/1.1\r\n"
          << "\r\n";
  return request.str();
}

std::string SsdpMessage::Header(std::string_view name) const {
  auto it = headers.find(std::string(name));
  return it == headers.end() ? std::string() : it->second;
}

std::string SsdpMessage::SearchTarget() const {
  // Search responses carry ST, NOTIFY carries NT.
  auto st = Header("ST");
  return st.empty() ? Header("NT") : st;
}

std::optional<SsdpMessage> ParseSsdpMessage(std::string_view datagram) {
  SsdpMessage message;
  bool        first = true;

  for (auto& raw_line : util::Split(datagram, '\n')) {
    auto line = util::Trim(raw_line);
    if (first) {
      if (!util::StartsWith(line, "HTTP/1.") && !util::StartsWith(line, "NOTIFY ")) {
        return std::nullopt;
      }
      message.start_line = line;
      first              = false;
      continue;
    }
    if (line.empty()) {
      break;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    auto key = util::Trim(line.substr(0, colon));
    for (auto& c : key) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    message.headers[key] = util::Trim(line.substr(colon + 1));
  }

  if (first) {
    return std::nullopt;
  }
  return message;
}

} // namespace scout::net
