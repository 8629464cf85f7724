#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "probe.hpp"
#include "signature_table.hpp"

namespace scout::probe {

struct ProtocolFingerprintOptions {
  std::size_t               workers = 10;
  std::chrono::milliseconds per_address_timeout{5000};
  std::chrono::milliseconds operation_timeout{3000};

  std::vector<std::uint16_t> http_ports = {80, 8080, 1400, 8008, 39500};
  std::vector<std::string>   http_paths = {"/", "/description.xml"};
  std::size_t                body_preview_bytes = 4096;
  std::size_t                max_response_bytes = 64 * 1024;

  bool          modbus_enabled = true;
  std::uint16_t modbus_port    = 502;

  std::vector<HttpSignature> signatures = DefaultHttpSignatures();
};

/*
  Actively fingerprints every known address through a bounded worker pool.

  HTTP responses are matched against the signature table; a Modbus/TCP
  register read identifies industrial and energy devices. The first
  positive match wins. A host that answered HTTP without matching still
  yields a result carrying the status, with signature_matched unset.
*/
class ProtocolFingerprintProbe : public Probe {
 public:
  explicit ProtocolFingerprintProbe(ProtocolFingerprintOptions options = {});

  model::ProbeKind Kind() const override {
    return model::ProbeKind::kProtocolFingerprint;
  }

  Capability CheckCapability() override;

  void Run(const ProbeTarget& target, const util::Deadline& deadline, ResultSink& sink) override;

  bool RequiresKnownHosts() const override {
    return true;
  }

  // One address, synchronously. Exposed for the worker tasks and tests.
  void FingerprintAddress(const std::string& address, const util::Deadline& deadline, ResultSink& sink) const;

 private:
  bool ProbeModbus(const std::string& address, const util::Deadline& deadline) const;

  ProtocolFingerprintOptions options_;
};

} // namespace scout::probe
