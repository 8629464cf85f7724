#include "protocol_fingerprint_probe.hpp"

#include <sys/socket.h>

#include "internal/net/http_client.hpp"
#include "internal/net/modbus.hpp"
#include "internal/net/socket.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/worker/worker_pool.hpp"

namespace scout::probe {

using observability::IntField;
using observability::StringField;

ProtocolFingerprintProbe::ProtocolFingerprintProbe(ProtocolFingerprintOptions options) : options_(std::move(options)) {
}

Capability ProtocolFingerprintProbe::CheckCapability() {
  net::Socket probe_socket(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!probe_socket.Valid()) {
    return Capability::Unavailable("cannot create TCP socket");
  }
  return Capability::Available();
}

// ------------------------------------------------------------
// Run
// ------------------------------------------------------------

void ProtocolFingerprintProbe::Run(const ProbeTarget& target, const util::Deadline& deadline, ResultSink& sink) {
  if (target.known_addresses.empty()) {
    return;
  }

  worker::WorkerPool pool(options_.workers);
  pool.Start();
  for (const auto& address : target.known_addresses) {
    pool.Submit([this, address, &deadline, &sink] {
      if (deadline.Expired()) {
        return;
      }
      const auto address_deadline = util::Deadline::After(options_.per_address_timeout).Min(deadline);
      FingerprintAddress(address, address_deadline, sink);
    });
  }

  if (!pool.WaitIdle(deadline)) {
    const auto dropped = pool.DiscardPending();
    SCOUT_LOG_INFO("fingerprint budget expired", {IntField("addresses", static_cast<std::int64_t>(target.known_addresses.size())),
                                                  IntField("not_started", static_cast<std::int64_t>(dropped))});
  }
  pool.Stop();
}

// ------------------------------------------------------------
// Per address
// ------------------------------------------------------------

void ProtocolFingerprintProbe::FingerprintAddress(const std::string& address, const util::Deadline& deadline, ResultSink& sink) const {
  net::HttpRequestOptions request;
  request.connect_timeout    = options_.operation_timeout;
  request.io_timeout         = options_.operation_timeout;
  request.max_response_bytes = options_.max_response_bytes;

  auto unmatched       = model::MakeProbeResult(model::ProbeKind::kProtocolFingerprint, address);
  bool answered_at_all = false;

  for (auto port : options_.http_ports) {
    for (const auto& path : options_.http_paths) {
      if (deadline.Expired()) {
        break;
      }

      std::optional<net::HttpResponse> response;
      try {
        response = net::HttpGet(address, port, path, request, deadline);
      } catch (const util::MalformedEvidence& e) {
        SCOUT_LOG_DEBUG("unparseable http response", {StringField("address", address), IntField("port", port), StringField("error", e.what())});
        continue;
      }
      if (!response) {
        break;  // port closed or silent; other paths won't fare better
      }

      if (!answered_at_all) {
        unmatched.http_status           = response->status;
        unmatched.extras["http_port"]   = std::to_string(port);
        unmatched.extras["http_server"] = response->Header("Server");
      }
      answered_at_all = true;
      unmatched.open_ports.insert(port);

      const auto body  = std::string_view(response->body).substr(0, options_.body_preview_bytes);
      auto       match = MatchHttpSignature(options_.signatures, response->HeaderText(), body);
      if (!match) {
        continue;
      }

      auto result              = model::MakeProbeResult(model::ProbeKind::kProtocolFingerprint, address);
      result.signature_matched = true;
      result.manufacturer      = match->manufacturer;
      result.device_type       = match->device_type;
      result.http_status       = response->status;
      result.open_ports        = {port};
      result.services          = {"http"};
      result.extras["signature"] = match->name;
      result.extras["http_path"] = path;
      if (auto server = response->Header("Server"); !server.empty()) {
        result.extras["http_server"] = server;
      }
      sink.Emit(std::move(result));
      return;
    }
  }

  if (options_.modbus_enabled && !deadline.Expired() && ProbeModbus(address, deadline)) {
    auto result              = model::MakeProbeResult(model::ProbeKind::kProtocolFingerprint, address);
    result.signature_matched = true;
    result.device_type       = "modbus_device";
    result.open_ports        = {options_.modbus_port};
    result.services          = {"modbus"};
    result.extras["signature"] = "modbus_tcp";
    sink.Emit(std::move(result));
    return;
  }

  if (answered_at_all) {
    sink.Emit(std::move(unmatched));
  }
}

bool ProtocolFingerprintProbe::ProbeModbus(const std::string& address, const util::Deadline& deadline) const {
  auto connection = net::ConnectTcp(address, options_.modbus_port, deadline.Clamp(options_.operation_timeout));
  if (connection.status != net::ConnectStatus::kConnected) {
    return false;
  }

  constexpr std::uint16_t kTransaction = 0x5343;
  const auto              op_deadline  = util::Deadline::After(options_.operation_timeout).Min(deadline);
  if (!net::SendAll(connection.socket.Get(), net::BuildReadHoldingRegisters(kTransaction, 1, 0, 1), op_deadline)) {
    return false;
  }

  // MBAP header, function code and one more byte are enough to decide; the
  // server keeps the connection open, so don't wait for the full frame.
  auto frame = net::ReceiveAll(connection.socket.Get(), 9, op_deadline);
  auto reply = net::ParseModbusReply(frame);
  return reply && reply->transaction_id == kTransaction && reply->function == 0x03;
}

} // namespace scout::probe
