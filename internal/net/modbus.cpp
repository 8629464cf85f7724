#include "modbus.hpp"

namespace scout::net {

namespace {

constexpr std::size_t kMbapHeaderSize = 7;

void PutU16(std::string& out, std::uint16_t value) {
  out.push_back(static_cast<char>(value >> 8));
  out.push_back(static_cast<char>(value & 0xFF));
}

std::uint16_t GetU16(std::string_view in, std::size_t at) {
  return static_cast<std::uint16_t>((static_cast<std::uint8_t>(in[at]) << 8) | static_cast<std::uint8_t>(in[at + 1]));
}

} // namespace

std::string BuildReadHoldingRegisters(std::uint16_t transaction_id, std::uint8_t unit_id, std::uint16_t start, std::uint16_t count) {
  std::string frame;
  PutU16(frame, transaction_id);
  PutU16(frame, 0);  // protocol id
  PutU16(frame, 6);  // unit id + PDU
  frame.push_back(static_cast<char>(unit_id));
  frame.push_back(static_cast<char>(0x03));
  PutU16(frame, start);
  PutU16(frame, count);
  return frame;
}

std::optional<ModbusReply> ParseModbusReply(std::string_view frame) {
  if (frame.size() < kMbapHeaderSize + 1) {
    return std::nullopt;
  }
  if (GetU16(frame, 2) != 0) {
    return std::nullopt;
  }
  const auto length = GetU16(frame, 4);
  if (length < 2 || length > 254) {
    return std::nullopt;
  }

  ModbusReply reply;
  reply.transaction_id = GetU16(frame, 0);
  reply.unit_id        = static_cast<std::uint8_t>(frame[6]);
  const auto function  = static_cast<std::uint8_t>(frame[7]);
  reply.exception      = (function & 0x80) != 0;
  reply.function       = static_cast<std::uint8_t>(function & 0x7F);
  if (reply.exception && frame.size() > kMbapHeaderSize + 1) {
    reply.exception_code = static_cast<std::uint8_t>(frame[8]);
  }
  return reply;
}

} // namespace scout::net
