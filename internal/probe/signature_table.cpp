#include "signature_table.hpp"

#include "internal/util/strings.hpp"

namespace scout::probe {

const std::vector<HttpSignature>& DefaultHttpSignatures() {
  static const std::vector<HttpSignature> kSignatures = {
      {"smartthings",
       "Samsung SmartThings",
       {"smartthings", "samsung"},
       {"smartthings", "hub"},
       {{"washer", "washing_machine"}, {"washing", "washing_machine"}, {"thermostat", "thermostat"}}},
      {"philips_hue", "Philips", {"philips", "hue"}, {"philips", "hue", "bridge"}, {}},
      {"sonos", "Sonos", {"sonos"}, {}, {{"speaker", "smart_speaker"}, {"zoneplayer", "smart_speaker"}}},
      {"nest", "Google Nest", {"nest", "google"}, {}, {{"thermostat", "thermostat"}}},
  };
  return kSignatures;
}

std::optional<SignatureMatch> MatchHttpSignature(const std::vector<HttpSignature>& table, std::string_view header_text, std::string_view body) {
  const auto headers = util::ToLower(header_text);
  const auto content = util::ToLower(body);

  for (const auto& signature : table) {
    bool matched = false;
    for (const auto& marker : signature.header_markers) {
      if (!marker.empty() && headers.find(marker) != std::string::npos) {
        matched = true;
        break;
      }
    }
    if (!matched && !content.empty()) {
      for (const auto& marker : signature.body_markers) {
        if (!marker.empty() && content.find(marker) != std::string::npos) {
          matched = true;
          break;
        }
      }
    }
    if (!matched) {
      continue;
    }

    SignatureMatch match{signature.name, signature.manufacturer, signature.name};
    for (const auto& [marker, device_type] : signature.refinements) {
      if (content.find(marker) != std::string::npos) {
        match.device_type = device_type;
        break;
      }
    }
    return match;
  }
  return std::nullopt;
}

} // namespace scout::probe
