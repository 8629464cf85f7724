#include "device_record.hpp"

namespace scout::model {

bool DeviceRecord::HasEvidence(ProbeKind kind) const {
  auto it = evidence.find(kind);
  return it != evidence.end() && !it->second.empty();
}

const std::vector<ProbeResultPtr>& DeviceRecord::EvidenceFor(ProbeKind kind) const {
  static const std::vector<ProbeResultPtr> kEmpty;
  auto                                     it = evidence.find(kind);
  return it == evidence.end() ? kEmpty : it->second;
}

std::vector<ProbeKind> DeviceRecord::ContributingKinds() const {
  std::vector<ProbeKind> kinds;
  for (const auto& [kind, results] : evidence) {
    if (!results.empty()) {
      kinds.push_back(kind);
    }
  }
  return kinds;
}

} // namespace scout::model
