#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/classify/iot_classifier.hpp"
#include "internal/probe/active_scan_probe.hpp"
#include "internal/probe/device_description_probe.hpp"
#include "internal/probe/protocol_fingerprint_probe.hpp"
#include "internal/probe/service_announcement_probe.hpp"
#include "internal/probe/vendor_passive_probe.hpp"
#include "internal/scoring/confidence_scorer.hpp"

namespace scout::factory {

using scout::runtime::config::RuntimeConfig;
using std::chrono::milliseconds;

namespace {

constexpr double kDefaultTimeoutSeconds = 30.0;

// Zero in a proto3 scalar means "not configured".
template <typename Target, typename Source>
void Override(Target& target, Source value) {
  if (value != Source{}) {
    target = static_cast<Target>(value);
  }
}

void OverrideMillis(milliseconds& target, std::uint32_t value) {
  if (value != 0) {
    target = milliseconds(value);
  }
}

std::vector<std::uint16_t> ToPorts(const google::protobuf::RepeatedField<std::uint32_t>& ports) {
  std::vector<std::uint16_t> out;
  out.reserve(ports.size());
  for (auto port : ports) {
    out.push_back(static_cast<std::uint16_t>(port));
  }
  return out;
}

probe::ActiveScanOptions ActiveScanFrom(const scout::runtime::config::ActiveScanConfig& config) {
  probe::ActiveScanOptions options;
  if (config.ports_size() > 0) {
    options.ports = ToPorts(config.ports());
  }
  OverrideMillis(options.connect_timeout, config.connect_timeout_ms());
  Override(options.max_in_flight, config.max_in_flight());
  Override(options.max_hosts, config.max_hosts());
  Override(options.neighbour_table_path, config.neighbour_table_path());
  if (config.has_resolve_hostnames()) {
    options.resolve_hostnames = config.resolve_hostnames();
  }
  Override(options.resolver, config.resolver());
  Override(options.resolv_conf_path, config.resolv_conf_path());
  OverrideMillis(options.lookup_timeout, config.lookup_timeout_ms());
  return options;
}

probe::ServiceAnnouncementOptions ServiceAnnouncementFrom(const scout::runtime::config::ServiceAnnouncementConfig& config) {
  probe::ServiceAnnouncementOptions options;
  OverrideMillis(options.listen_window, config.listen_window_ms());
  options.interface_address = config.interface_address();
  return options;
}

probe::DeviceDescriptionOptions DeviceDescriptionFrom(const scout::runtime::config::DeviceDescriptionConfig& config) {
  probe::DeviceDescriptionOptions options;
  OverrideMillis(options.search_window, config.search_window_ms());
  OverrideMillis(options.fetch_timeout, config.fetch_timeout_ms());
  Override(options.mx_seconds, config.mx_seconds());
  Override(options.search_target, config.search_target());
  Override(options.max_description_bytes, config.max_description_bytes());
  Override(options.search_address, config.search_address());
  Override(options.search_port, config.search_port());
  return options;
}

probe::VendorPassiveOptions VendorPassiveFrom(const scout::runtime::config::VendorPassiveConfig& config) {
  probe::VendorPassiveOptions options;
  OverrideMillis(options.window, config.window_ms());
  options.families.assign(config.families().begin(), config.families().end());
  return options;
}

probe::ProtocolFingerprintOptions ProtocolFingerprintFrom(const scout::runtime::config::ProtocolFingerprintConfig& config) {
  probe::ProtocolFingerprintOptions options;
  Override(options.workers, config.workers());
  OverrideMillis(options.per_address_timeout, config.per_address_timeout_ms());
  OverrideMillis(options.operation_timeout, config.operation_timeout_ms());
  if (config.http_ports_size() > 0) {
    options.http_ports = ToPorts(config.http_ports());
  }
  if (config.http_paths_size() > 0) {
    options.http_paths.assign(config.http_paths().begin(), config.http_paths().end());
  }
  if (config.has_modbus_enabled()) {
    options.modbus_enabled = config.modbus_enabled();
  }
  Override(options.modbus_port, config.modbus_port());
  Override(options.body_preview_bytes, config.body_preview_bytes());
  return options;
}

scoring::ScoringWeights WeightsFrom(const scout::runtime::config::ScoringConfig& config) {
  scoring::ScoringWeights weights;
  if (config.has_base_presence()) weights.base_presence = config.base_presence();
  if (config.has_mac_vendor_match()) weights.mac_vendor_match = config.mac_vendor_match();
  if (config.has_service_announcement()) weights.service_announcement = config.service_announcement();
  if (config.has_device_description()) weights.device_description = config.device_description();
  if (config.has_protocol_fingerprint()) weights.protocol_fingerprint = config.protocol_fingerprint();
  if (config.has_vendor_passive()) weights.vendor_passive = config.vendor_passive();
  if (config.has_agreement_bonus()) weights.agreement_bonus = config.agreement_bonus();
  if (config.has_recognized_device_type()) weights.recognized_device_type = config.recognized_device_type();
  if (config.recognized_device_types_size() > 0) {
    weights.recognized_device_types.assign(config.recognized_device_types().begin(), config.recognized_device_types().end());
  }
  return weights;
}

classify::ClassifierOptions ClassifierFrom(const scout::runtime::config::ClassifierConfig& config) {
  classify::ClassifierOptions options;
  if (config.has_relevance_threshold()) {
    options.relevance_threshold = config.relevance_threshold();
  }
  if (config.manufacturer_fragments_size() > 0) {
    options.manufacturer_fragments.assign(config.manufacturer_fragments().begin(), config.manufacturer_fragments().end());
  }
  if (config.service_fragments_size() > 0) {
    options.service_fragments.assign(config.service_fragments().begin(), config.service_fragments().end());
  }
  return options;
}

core::BudgetPolicy PolicyFrom(const scout::runtime::config::DiscoveryConfig& config) {
  core::BudgetPolicy policy;
  if (config.has_seed_share()) {
    policy.seed_share = config.seed_share();
  }
  if (config.has_fingerprint_share()) {
    policy.fingerprint_share = config.fingerprint_share();
  }
  OverrideMillis(policy.overrun_grace, config.overrun_grace_ms());
  return policy;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;
  const auto& probes = config.probes();

  // ------------------------------------------------------------------
  // Probes
  // ------------------------------------------------------------------
  std::vector<std::shared_ptr<probe::Probe>> all;
  all.push_back(std::make_shared<probe::ActiveScanProbe>(ActiveScanFrom(probes.active_scan())));
  all.push_back(std::make_shared<probe::ServiceAnnouncementProbe>(ServiceAnnouncementFrom(probes.service_announcement())));
  all.push_back(std::make_shared<probe::DeviceDescriptionProbe>(DeviceDescriptionFrom(probes.device_description())));
  all.push_back(std::make_shared<probe::VendorPassiveProbe>(VendorPassiveFrom(probes.vendor_passive())));
  all.push_back(std::make_shared<probe::ProtocolFingerprintProbe>(ProtocolFingerprintFrom(probes.protocol_fingerprint())));

  // ------------------------------------------------------------------
  // Request
  // ------------------------------------------------------------------
  const auto&  discovery         = config.discovery();
  const double timeout           = discovery.timeout_seconds() > 0 ? discovery.timeout_seconds() : kDefaultTimeoutSeconds;
  app.request.network_range     = discovery.network_range();
  app.request.timeout           = milliseconds(static_cast<std::int64_t>(timeout * 1000.0));
  app.request.restrict_to_range = discovery.restrict_to_range();

  // Disabled probes stay registered so the report can say so.
  if (probes.active_scan().has_enabled() && !probes.active_scan().enabled()) {
    app.request.disabled.insert(model::ProbeKind::kActiveScan);
  }
  if (probes.service_announcement().has_enabled() && !probes.service_announcement().enabled()) {
    app.request.disabled.insert(model::ProbeKind::kServiceAnnouncement);
  }
  if (probes.device_description().has_enabled() && !probes.device_description().enabled()) {
    app.request.disabled.insert(model::ProbeKind::kDeviceDescription);
  }
  if (probes.vendor_passive().has_enabled() && !probes.vendor_passive().enabled()) {
    app.request.disabled.insert(model::ProbeKind::kVendorPassive);
  }
  if (probes.protocol_fingerprint().has_enabled() && !probes.protocol_fingerprint().enabled()) {
    app.request.disabled.insert(model::ProbeKind::kProtocolFingerprint);
  }

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  app.orchestrator = std::make_unique<core::DiscoveryOrchestrator>(std::move(all), scoring::ConfidenceScorer(WeightsFrom(config.scoring())),
                                                                   classify::IotClassifier(ClassifierFrom(config.classifier())),
                                                                   PolicyFrom(discovery));

  // ------------------------------------------------------------------
  // Output
  // ------------------------------------------------------------------
  if (!config.output().registry_path().empty()) {
    app.output.path = config.output().registry_path();
  }
  app.output.pretty = config.output().pretty();

  return app;
}

} // namespace scout::factory
