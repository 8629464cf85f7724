#pragma once

#include <string>
#include <vector>

#include "internal/model/device_record.hpp"

namespace scout::classify {

struct ClassifierOptions {
  double relevance_threshold = 0.6;

  std::vector<std::string> manufacturer_fragments = {"samsung", "philips", "sonos", "nest", "google", "amazon", "apple"};
  std::vector<std::string> service_fragments      = {"smartthings", "hue", "homekit", "matter", "airplay", "googlecast"};
};

/*
  Decides which merged records are reported.

  A record is relevant when ANY of the tests passes. Callers triage
  further by confidence_score.
*/
class IotClassifier {
 public:
  explicit IotClassifier(ClassifierOptions options = {});

  bool IsRelevant(const model::DeviceRecord& record) const;

  // Name of the first test that passed, empty when none did. For logs.
  std::string Reason(const model::DeviceRecord& record) const;

 private:
  ClassifierOptions options_;
};

} // namespace scout::classify
