#include "probe_result.hpp"

#include <tuple>

namespace scout::model {

namespace {

auto Tie(const ProbeResult& r) {
  return std::tie(r.address, r.kind, r.hostname, r.mac_address, r.mac_vendor, r.manufacturer, r.device_type, r.model_name, r.friendly_name,
                  r.open_ports, r.services, r.signature_matched, r.http_status, r.extras);
}

} // namespace

ProbeResult MakeProbeResult(ProbeKind kind, std::string address) {
  ProbeResult result;
  result.kind        = kind;
  result.address     = std::move(address);
  result.observed_at = std::chrono::steady_clock::now();
  return result;
}

bool SameEvidence(const ProbeResult& a, const ProbeResult& b) {
  return Tie(a) == Tie(b);
}

bool EvidenceLess(const ProbeResult& a, const ProbeResult& b) {
  return Tie(a) < Tie(b);
}

} // namespace scout::model
