#include "device_table.hpp"

#include <algorithm>
#include <mutex>

#include "evidence_merger.hpp"
#include "internal/util/errors.hpp"

namespace scout::merge {

DeviceTable::DeviceTable(std::size_t shard_count) {
  shards_.reserve(std::max<std::size_t>(shard_count, 1));
  for (std::size_t i = 0; i < std::max<std::size_t>(shard_count, 1); ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

DeviceTable::Shard& DeviceTable::ShardFor(const std::string& address) {
  return *shards_[std::hash<std::string>{}(address) % shards_.size()];
}

const DeviceTable::Shard& DeviceTable::ShardFor(const std::string& address) const {
  return *shards_[std::hash<std::string>{}(address) % shards_.size()];
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

void DeviceTable::Apply(const model::ProbeResultPtr& result) {
  if (!result) {
    throw util::InvalidArgument("device table: null probe result");
  }
  auto&            shard = ShardFor(result->address);
  std::unique_lock lock(shard.mutex);

  auto it = shard.records.find(result->address);
  if (it == shard.records.end()) {
    shard.records.emplace(result->address, EvidenceMerger::Merge(std::nullopt, result));
    return;
  }
  EvidenceMerger::MergeInto(it->second, result);
}

void DeviceTable::ForEach(const std::function<void(model::DeviceRecord&)>& fn) {
  for (auto& shard : shards_) {
    std::unique_lock lock(shard->mutex);
    for (auto& [address, record] : shard->records) {
      fn(record);
    }
  }
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::optional<model::DeviceRecord> DeviceTable::Get(const std::string& address) const {
  const auto&      shard = ShardFor(address);
  std::shared_lock lock(shard.mutex);
  auto             it = shard.records.find(address);
  if (it == shard.records.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> DeviceTable::Addresses() const {
  std::vector<std::string> out;
  for (const auto& shard : shards_) {
    std::shared_lock lock(shard->mutex);
    for (const auto& [address, record] : shard->records) {
      out.push_back(address);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t DeviceTable::Size() const {
  std::size_t total = 0;
  for (const auto& shard : shards_) {
    std::shared_lock lock(shard->mutex);
    total += shard->records.size();
  }
  return total;
}

std::map<std::string, model::DeviceRecord> DeviceTable::Snapshot() const {
  std::map<std::string, model::DeviceRecord> out;
  for (const auto& shard : shards_) {
    std::shared_lock lock(shard->mutex);
    out.insert(shard->records.begin(), shard->records.end());
  }
  return out;
}

} // namespace scout::merge
