#include "confidence_scorer.hpp"

#include <algorithm>

#include "internal/util/strings.hpp"

namespace scout::scoring {

using model::DeviceRecord;
using model::ProbeKind;
using model::ProbeResultPtr;

namespace {

// Whether a result may speak to the device's identity (manufacturer / type).
bool Identifies(const model::ProbeResult& result) {
  return result.kind != ProbeKind::kProtocolFingerprint || result.signature_matched;
}

bool AnyResult(const DeviceRecord& record, ProbeKind kind, bool (*predicate)(const model::ProbeResult&)) {
  const auto& results = record.EvidenceFor(kind);
  return std::any_of(results.begin(), results.end(), [&](const ProbeResultPtr& r) { return predicate(*r); });
}

bool HasManufacturer(const model::ProbeResult& r) {
  return !r.manufacturer.empty();
}

bool IsSignatureMatch(const model::ProbeResult& r) {
  return r.signature_matched;
}

} // namespace

ConfidenceScorer::ConfidenceScorer(ScoringWeights weights) : weights_(std::move(weights)) {
}

std::vector<ProbeKind> ConfidenceScorer::AgreeingKinds(const DeviceRecord& record) {
  std::vector<ProbeKind> kinds;
  for (auto kind : record.ContributingKinds()) {
    if (!model::IsIdentifying(kind)) {
      continue;
    }
    // An answer without a signature match says nothing about identity.
    if (kind == ProbeKind::kProtocolFingerprint && !AnyResult(record, kind, IsSignatureMatch)) {
      continue;
    }
    kinds.push_back(kind);
  }
  return kinds;
}

bool ConfidenceScorer::MacVendorMatches(const DeviceRecord& record) const {
  std::vector<std::string> vendors;
  std::vector<std::string> manufacturers;
  for (const auto& [kind, results] : record.evidence) {
    for (const auto& r : results) {
      if (!r->mac_vendor.empty()) {
        vendors.push_back(r->mac_vendor);
      }
      if (!r->manufacturer.empty() && Identifies(*r)) {
        manufacturers.push_back(r->manufacturer);
      }
    }
  }
  for (const auto& vendor : vendors) {
    for (const auto& manufacturer : manufacturers) {
      if (util::ContainsIgnoreCase(manufacturer, vendor)) {
        return true;
      }
    }
  }
  return false;
}

bool ConfidenceScorer::HasRecognizedType(const DeviceRecord& record) const {
  for (const auto& [kind, results] : record.evidence) {
    for (const auto& r : results) {
      if (r->device_type.empty() || !Identifies(*r)) {
        continue;
      }
      const auto& known = weights_.recognized_device_types;
      if (std::find(known.begin(), known.end(), r->device_type) != known.end()) {
        return true;
      }
    }
  }
  return false;
}

double ConfidenceScorer::Score(const DeviceRecord& record) const {
  if (record.evidence.empty()) {
    return 0.0;
  }

  double score = weights_.base_presence;

  if (MacVendorMatches(record)) {
    score += weights_.mac_vendor_match;
  }
  if (record.HasEvidence(ProbeKind::kServiceAnnouncement)) {
    score += weights_.service_announcement;
  }
  if (AnyResult(record, ProbeKind::kDeviceDescription, HasManufacturer)) {
    score += weights_.device_description;
  }
  if (AnyResult(record, ProbeKind::kProtocolFingerprint, IsSignatureMatch)) {
    score += weights_.protocol_fingerprint;
  }
  if (record.HasEvidence(ProbeKind::kVendorPassive)) {
    score += weights_.vendor_passive;
  }
  if (AgreeingKinds(record).size() >= 2) {
    score += weights_.agreement_bonus;
  }
  if (HasRecognizedType(record)) {
    score += weights_.recognized_device_type;
  }

  return std::clamp(score, 0.0, 1.0);
}

} // namespace scout::scoring
