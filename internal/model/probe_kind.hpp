#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace scout::model {

enum class ProbeKind : std::uint8_t {
  kActiveScan          = 0,
  kServiceAnnouncement = 1,
  kDeviceDescription   = 2,
  kVendorPassive       = 3,
  kProtocolFingerprint = 4,
};

inline constexpr std::array<ProbeKind, 5> kAllProbeKinds = {
    ProbeKind::kActiveScan,    ProbeKind::kServiceAnnouncement, ProbeKind::kDeviceDescription,
    ProbeKind::kVendorPassive, ProbeKind::kProtocolFingerprint,
};

// Stable names used in logs, metrics labels and the exported discovery_methods list.
constexpr std::string_view Name(ProbeKind kind) {
  switch (kind) {
    case ProbeKind::kActiveScan:
      return "active_scan";
    case ProbeKind::kServiceAnnouncement:
      return "mdns";
    case ProbeKind::kDeviceDescription:
      return "upnp";
    case ProbeKind::kVendorPassive:
      return "vendor_passive";
    case ProbeKind::kProtocolFingerprint:
      return "fingerprint";
  }
  return "unknown";
}

// Accepts the stable names plus the config-file spellings.
constexpr std::optional<ProbeKind> ParseProbeKind(std::string_view name) {
  for (auto kind : kAllProbeKinds) {
    if (Name(kind) == name) {
      return kind;
    }
  }
  if (name == "service_announcement") return ProbeKind::kServiceAnnouncement;
  if (name == "device_description") return ProbeKind::kDeviceDescription;
  if (name == "protocol_fingerprint") return ProbeKind::kProtocolFingerprint;
  return std::nullopt;
}

/*
  Merge precedence, higher wins:
    ServiceAnnouncement = ProtocolFingerprint > DeviceDescription > VendorPassive > ActiveScan
*/
constexpr int PrecedenceRank(ProbeKind kind) {
  switch (kind) {
    case ProbeKind::kServiceAnnouncement:
    case ProbeKind::kProtocolFingerprint:
      return 4;
    case ProbeKind::kDeviceDescription:
      return 3;
    case ProbeKind::kVendorPassive:
      return 2;
    case ProbeKind::kActiveScan:
      return 1;
  }
  return 0;
}

// ActiveScan establishes liveness only; every other kind can identify a device.
constexpr bool IsIdentifying(ProbeKind kind) {
  return kind != ProbeKind::kActiveScan;
}

} // namespace scout::model
