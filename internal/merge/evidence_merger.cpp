#include "evidence_merger.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace scout::merge {

using model::DerivedField;
using model::DeviceRecord;
using model::ProbeKind;
using model::ProbeResult;
using model::ProbeResultPtr;

namespace {

void Offer(DerivedField& field, const std::string& value, int rank) {
  if (value.empty()) {
    return;
  }
  const bool wins = field.empty() || rank > field.rank || (rank == field.rank && value < field.value);
  if (wins) {
    field.value = value;
    field.rank  = rank;
  }
}

bool WritesIdentity(const ProbeResult& result) {
  return result.kind != ProbeKind::kProtocolFingerprint || result.signature_matched;
}

void Validate(const DeviceRecord& record, const ProbeResultPtr& incoming) {
  if (!incoming) {
    throw util::InvalidArgument("merge: null probe result");
  }
  if (record.sealed) {
    throw util::InvalidState("merge: record " + record.address + " is sealed");
  }
  if (!record.address.empty() && record.address != incoming->address) {
    throw util::InvalidArgument("merge: result for " + incoming->address + " offered to record " + record.address);
  }
}

} // namespace

DeviceRecord EvidenceMerger::Merge(std::optional<DeviceRecord> existing, const ProbeResultPtr& incoming) {
  DeviceRecord record = existing ? std::move(*existing) : DeviceRecord{};
  MergeInto(record, incoming);
  return record;
}

void EvidenceMerger::MergeInto(DeviceRecord& record, const ProbeResultPtr& incoming) {
  Validate(record, incoming);
  if (record.address.empty()) {
    record.address = incoming->address;
  }

  // Evidence: sorted, duplicates collapsed.
  auto& list = record.evidence[incoming->kind];
  auto  less = [](const ProbeResultPtr& a, const ProbeResultPtr& b) { return model::EvidenceLess(*a, *b); };
  auto  pos  = std::lower_bound(list.begin(), list.end(), incoming, less);
  if (pos != list.end() && model::SameEvidence(**pos, *incoming)) {
    return;
  }
  list.insert(pos, incoming);

  const ProbeResult& r       = *incoming;
  const int          rank    = model::PrecedenceRank(r.kind);
  auto&              derived = record.derived;

  if (WritesIdentity(r)) {
    Offer(derived.manufacturer, r.manufacturer, rank);
    Offer(derived.device_type, r.device_type, rank);
  }
  Offer(derived.mac_address, r.mac_address, rank);
  Offer(derived.mac_vendor, r.mac_vendor, rank);
  Offer(derived.hostname, r.hostname, rank);

  derived.open_ports.insert(r.open_ports.begin(), r.open_ports.end());
  derived.services.insert(r.services.begin(), r.services.end());
}

} // namespace scout::merge
