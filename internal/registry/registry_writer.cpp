#include "registry_writer.hpp"

#include <google/protobuf/util/json_util.h>

#include <filesystem>
#include <fstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace scout::registry {

namespace v1 = scout::discovery::v1;

v1::DiscoveredDevice ToProto(const model::DeviceRecord& record) {
  v1::DiscoveredDevice device;
  device.set_address(record.address);
  device.set_hostname(record.derived.hostname.value);
  device.set_manufacturer(record.derived.manufacturer.value);
  device.set_device_type(record.derived.device_type.value);
  device.set_mac_address(record.derived.mac_address.value);
  device.set_mac_vendor(record.derived.mac_vendor.value);
  device.set_confidence_score(record.confidence_score);

  for (auto kind : record.ContributingKinds()) {
    device.add_discovery_methods(std::string(model::Name(kind)));
  }
  for (auto port : record.derived.open_ports) {
    device.add_open_ports(port);
  }
  for (const auto& service : record.derived.services) {
    device.add_services(service);
  }
  device.set_discovery_elapsed_ms(static_cast<std::uint64_t>(record.discovery_elapsed.count()));
  return device;
}

v1::ProbeStatus ToProto(core::ProbeStatus status) {
  switch (status) {
    case core::ProbeStatus::kCompleted:
      return v1::PROBE_STATUS_COMPLETED;
    case core::ProbeStatus::kTimedOut:
      return v1::PROBE_STATUS_TIMED_OUT;
    case core::ProbeStatus::kUnavailable:
      return v1::PROBE_STATUS_UNAVAILABLE;
    case core::ProbeStatus::kDisabled:
      return v1::PROBE_STATUS_DISABLED;
    case core::ProbeStatus::kFailed:
      return v1::PROBE_STATUS_FAILED;
  }
  return v1::PROBE_STATUS_UNSPECIFIED;
}

v1::RunState ToProto(model::RunState state) {
  // Wire values are offset by one to keep 0 as UNSPECIFIED.
  return static_cast<v1::RunState>(static_cast<int>(state) + 1);
}

v1::DiscoveryReport BuildReport(const core::DiscoveryOutcome& outcome) {
  v1::DiscoveryReport report;
  report.set_scan_range(outcome.scan_range);
  *report.mutable_started_at()  = util::ToProto(outcome.started_at);
  *report.mutable_finished_at() = util::ToProto(outcome.finished_at);
  report.set_final_state(ToProto(outcome.final_state));
  report.set_total_hosts(static_cast<std::uint32_t>(outcome.total_records));
  report.set_total_found(static_cast<std::uint32_t>(outcome.devices.size()));
  report.set_high_confidence_devices(static_cast<std::uint32_t>(outcome.HighConfidenceCount()));

  for (const auto& [address, record] : outcome.devices) {
    *report.add_devices() = ToProto(record);
  }
  for (const auto& summary : outcome.probes) {
    auto* probe = report.add_probes();
    probe->set_name(summary.name);
    probe->set_status(ToProto(summary.status));
    probe->set_results(static_cast<std::uint32_t>(summary.results));
    probe->set_elapsed_ms(static_cast<std::uint64_t>(summary.elapsed.count()));
    probe->set_detail(summary.detail);
  }
  return report;
}

std::string ToJson(const v1::DiscoveryReport& report, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = pretty;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(report, &json, options);
  if (!status.ok()) {
    throw util::InvalidState("failed to serialize discovery report: " + std::string(status.message()));
  }
  return json;
}

void WriteRegistry(const v1::DiscoveryReport& report, const WriteOptions& options) {
  const std::filesystem::path path(options.path);
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw util::InvalidState("cannot create " + path.parent_path().string() + ": " + ec.message());
    }
  }

  const auto json = ToJson(report, options.pretty);

  // Written to a sibling file first so a reader never sees a half-written registry.
  auto          tmp = path;
  tmp += ".tmp";
  std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw util::InvalidState("cannot open " + tmp.string() + " for writing");
  }
  out << json << '\n';
  out.close();
  if (!out) {
    throw util::InvalidState("failed writing " + tmp.string());
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    throw util::InvalidState("cannot replace " + path.string() + ": " + ec.message());
  }

  SCOUT_LOG_INFO("device registry written",
                 {observability::StringField("path", path.string()), observability::IntField("devices", report.devices_size())});
}

} // namespace scout::registry
