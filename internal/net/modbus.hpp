#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace scout::net {

inline constexpr std::uint16_t kModbusPort = 502;

// Modbus/TCP "read holding registers" (function 0x03) request frame.
std::string BuildReadHoldingRegisters(std::uint16_t transaction_id, std::uint8_t unit_id, std::uint16_t start, std::uint16_t count);

struct ModbusReply {
  std::uint16_t transaction_id = 0;
  std::uint8_t  unit_id        = 0;
  std::uint8_t  function       = 0;
  bool          exception      = false;
  std::uint8_t  exception_code = 0;
};

// nullopt unless the bytes form an MBAP header plus at least a function code.
std::optional<ModbusReply> ParseModbusReply(std::string_view frame);

} // namespace scout::net
