#pragma once

#include <optional>

#include "internal/model/device_record.hpp"
#include "internal/model/probe_result.hpp"

namespace scout::merge {

/*
  Folds ProbeResults into DeviceRecords.

  Every result is kept as evidence under its probe kind, in canonical
  order. Two results from the same probe that agree on every field but
  observed_at are one piece of evidence and are stored once, which is
  what makes re-merging a result a no-op. A probe that legitimately
  reports the same thing twice therefore still counts once. Scalar derived fields are
  first-writer-wins under the probe precedence order: a value is
  written when the field is unset or when the incoming probe ranks
  strictly higher than the one that wrote it. Two probes of equal rank
  that disagree settle on the lexicographically smaller value, so the
  final record is the same whatever order results arrive in. Ports and
  services are set unions.

  Fingerprint results only write manufacturer and device type when a
  signature matched.
*/
class EvidenceMerger {
 public:
  // Throws util::InvalidState if existing is sealed, util::InvalidArgument on
  // a null result or an address mismatch.
  static model::DeviceRecord Merge(std::optional<model::DeviceRecord> existing, const model::ProbeResultPtr& incoming);

  // In-place form used under the device table's shard lock.
  static void MergeInto(model::DeviceRecord& record, const model::ProbeResultPtr& incoming);
};

} // namespace scout::merge
