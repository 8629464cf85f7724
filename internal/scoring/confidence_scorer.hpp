#pragma once

#include <string>
#include <vector>

#include "internal/model/device_record.hpp"

namespace scout::scoring {

/*
  Additive weights, clamped to 1.0 after summing.

  The values are the empirically chosen defaults; every one can be
  overridden from configuration.
*/
struct ScoringWeights {
  double base_presence          = 0.1;
  double mac_vendor_match       = 0.2;
  double service_announcement   = 0.4;
  double device_description     = 0.3;
  double protocol_fingerprint   = 0.5;
  double vendor_passive         = 0.3;
  double agreement_bonus        = 0.2;
  double recognized_device_type = 0.1;

  std::vector<std::string> recognized_device_types = {"washing_machine", "thermostat", "smart_speaker", "SmartThings Hub"};
};

/*
  Confidence in [0,1] for a merged record.

  Every term is an "any evidence shows X" test, so adding a result can
  only switch terms on: the score never drops as evidence accumulates.
  The vendor match and recognized type terms look at every value any
  probe reported, not only the one that won the merge.
*/
class ConfidenceScorer {
 public:
  explicit ConfidenceScorer(ScoringWeights weights = {});

  double Score(const model::DeviceRecord& record) const;

  // Identifying kinds that count towards the agreement bonus.
  static std::vector<model::ProbeKind> AgreeingKinds(const model::DeviceRecord& record);

  const ScoringWeights& Weights() const {
    return weights_;
  }

 private:
  bool MacVendorMatches(const model::DeviceRecord& record) const;
  bool HasRecognizedType(const model::DeviceRecord& record) const;

  ScoringWeights weights_;
};

} // namespace scout::scoring
