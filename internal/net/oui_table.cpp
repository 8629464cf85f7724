#include "oui_table.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace scout::net {

namespace {

// Registered prefixes of vendors whose devices we expect on home networks.
// Names are the short brand, so they appear inside the manufacturer strings devices report.
constexpr std::array<std::pair<std::string_view, std::string_view>, 35> kOuiVendors = {{
    {"000393", "Apple"},
    {"00121b", "Sonos"},
    {"0012fb", "Samsung"},
    {"001632", "Samsung"},
    {"001788", "Philips"},
    {"001b63", "Apple"},
    {"000e58", "Sonos"},
    {"0000f0", "Samsung"},
    {"18b430", "Nest"},
    {"240ac4", "Espressif"},
    {"286d97", "Samsung"},
    {"28cfe9", "Apple"},
    {"30aea4", "Espressif"},
    {"347e5c", "Sonos"},
    {"44650d", "Amazon"},
    {"48a6b8", "Sonos"},
    {"50c7bf", "TP-Link"},
    {"546009", "Google"},
    {"5caafd", "Sonos"},
    {"641666", "Nest"},
    {"74c246", "Amazon"},
    {"949f3e", "Sonos"},
    {"a4cf12", "Espressif"},
    {"acbc32", "Apple"},
    {"b0a737", "Roku"},
    {"b827eb", "Raspberry Pi"},
    {"cc6da0", "Roku"},
    {"d052a8", "Samsung"},
    {"d8eb46", "Google"},
    {"dca632", "Raspberry Pi"},
    {"ecb5fa", "Philips"},
    {"f0272d", "Amazon"},
    {"f01898", "Apple"},
    {"f4f5d8", "Google"},
    {"fcf152", "Sony"},
}};

} // namespace

std::string LookupMacVendor(std::string_view mac) {
  std::string prefix;
  for (char c : mac) {
    if (std::isxdigit(static_cast<unsigned char>(c))) {
      prefix.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
      if (prefix.size() == 6) {
        break;
      }
    } else if (c != ':' && c != '-' && c != '.') {
      return {};
    }
  }
  if (prefix.size() != 6) {
    return {};
  }
  for (const auto& [oui, vendor] : kOuiVendors) {
    if (oui == prefix) {
      return std::string(vendor);
    }
  }
  return {};
}

} // namespace scout::net
