#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/device_record.hpp"
#include "internal/model/probe_result.hpp"

namespace scout::merge {

/*
  Address -> DeviceRecord for one discovery run.

  Records are spread over shards, each guarded by its own lock, so probes
  reporting different hosts do not contend. All writes go through
  EvidenceMerger under the owning shard's lock.
*/
class DeviceTable {
 public:
  explicit DeviceTable(std::size_t shard_count = 16);

  // Merges one result. Throws util::InvalidState once the record is sealed.
  void Apply(const model::ProbeResultPtr& result);

  std::optional<model::DeviceRecord> Get(const std::string& address) const;

  // Sorted.
  std::vector<std::string> Addresses() const;

  std::size_t Size() const;

  // Runs fn on every record under its shard's exclusive lock.
  void ForEach(const std::function<void(model::DeviceRecord&)>& fn);

  std::map<std::string, model::DeviceRecord> Snapshot() const;

 private:
  struct Shard {
    mutable std::shared_mutex                             mutex;
    std::unordered_map<std::string, model::DeviceRecord> records;
  };

  Shard&       ShardFor(const std::string& address);
  const Shard& ShardFor(const std::string& address) const;

  std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace scout::merge
