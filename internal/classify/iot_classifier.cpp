#include "iot_classifier.hpp"

#include "internal/util/strings.hpp"

namespace scout::classify {

using model::ProbeKind;

IotClassifier::IotClassifier(ClassifierOptions options) : options_(std::move(options)) {
}

std::string IotClassifier::Reason(const model::DeviceRecord& record) const {
  if (record.confidence_score >= options_.relevance_threshold) {
    return "confidence";
  }
  for (auto kind : {ProbeKind::kServiceAnnouncement, ProbeKind::kDeviceDescription, ProbeKind::kVendorPassive}) {
    if (record.HasEvidence(kind)) {
      return std::string(model::Name(kind)) + "_evidence";
    }
  }
  if (util::ContainsAnyIgnoreCase(record.derived.manufacturer.value, options_.manufacturer_fragments)) {
    return "manufacturer";
  }
  for (const auto& service : record.derived.services) {
    if (util::ContainsAnyIgnoreCase(service, options_.service_fragments)) {
      return "service";
    }
  }
  return {};
}

bool IotClassifier::IsRelevant(const model::DeviceRecord& record) const {
  return !Reason(record).empty();
}

} // namespace scout::classify
