#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scout::probe {

/*
  Substring markers identifying a device family from an HTTP response.

  Markers are lowercase. A signature matches when any header marker
  occurs in the "name:value" header text or any body marker occurs in
  the body preview. Refinements pick a more specific device type from
  the body once the signature matched.
*/
struct HttpSignature {
  std::string              name;
  std::string              manufacturer;
  std::vector<std::string> header_markers;
  std::vector<std::string> body_markers;

  std::vector<std::pair<std::string, std::string>> refinements;  // body marker -> device type
};

struct SignatureMatch {
  std::string name;
  std::string manufacturer;
  std::string device_type;
};

// smartthings, philips_hue, sonos, nest, in that order.
const std::vector<HttpSignature>& DefaultHttpSignatures();

// First signature in table order wins.
std::optional<SignatureMatch> MatchHttpSignature(const std::vector<HttpSignature>& table, std::string_view header_text, std::string_view body);

} // namespace scout::probe
