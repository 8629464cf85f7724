#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>

#include "probe_kind.hpp"

namespace scout::model {

/*
  One unit of evidence produced by one probe for one address.

  Decision-relevant observations are typed fields. Anything else a probe
  wants to keep for diagnostics (raw headers, SSDP location, TXT records)
  goes into extras, which nothing downstream decides on.

  A result is shared as ProbeResultPtr once handed to a sink and is never
  modified afterwards.
*/
struct ProbeResult {
  std::string address;
  ProbeKind   kind{ProbeKind::kActiveScan};

  std::string hostname;
  std::string mac_address;
  std::string mac_vendor;
  std::string manufacturer;
  std::string device_type;
  std::string model_name;
  std::string friendly_name;

  std::set<std::uint16_t> open_ports;
  std::set<std::string>   services;

  // Fingerprint only: a signature positively identified the device.
  bool signature_matched = false;
  int  http_status       = 0;

  std::map<std::string, std::string> extras;

  // Diagnostics only. Never used to order or break ties.
  std::chrono::steady_clock::time_point observed_at{};
};

using ProbeResultPtr = std::shared_ptr<const ProbeResult>;

ProbeResult MakeProbeResult(ProbeKind kind, std::string address);

// Field-wise equality and ordering ignoring observed_at.
bool SameEvidence(const ProbeResult& a, const ProbeResult& b);
bool EvidenceLess(const ProbeResult& a, const ProbeResult& b);

} // namespace scout::model
