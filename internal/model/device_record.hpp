#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "probe_kind.hpp"
#include "probe_result.hpp"

namespace scout::model {

// A derived scalar plus the precedence rank of the probe that wrote it.
struct DerivedField {
  std::string value;
  int         rank = 0;

  bool empty() const {
    return value.empty();
  }
};

struct DerivedFields {
  DerivedField manufacturer;
  DerivedField device_type;
  DerivedField mac_address;
  DerivedField mac_vendor;
  DerivedField hostname;

  std::set<std::uint16_t> open_ports;
  std::set<std::string>   services;
};

using EvidenceMap = std::map<ProbeKind, std::vector<ProbeResultPtr>>;

/*
  Merged, per-address aggregate of one discovery run.

  Created on the first result for an address, mutated only through the
  EvidenceMerger, sealed once by the orchestrator when scored.
*/
struct DeviceRecord {
  std::string address;

  EvidenceMap   evidence;
  DerivedFields derived;

  double                    confidence_score = 0.0;
  std::chrono::milliseconds discovery_elapsed{0};
  bool                      sealed = false;

  bool HasEvidence(ProbeKind kind) const;
  const std::vector<ProbeResultPtr>& EvidenceFor(ProbeKind kind) const;

  // Kinds with at least one result, in enum order.
  std::vector<ProbeKind> ContributingKinds() const;
};

} // namespace scout::model
