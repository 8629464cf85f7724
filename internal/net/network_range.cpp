#include "network_range.hpp"

#include <arpa/inet.h>
#include <sys/socket.h>

#include <algorithm>
#include <charconv>
#include <limits>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace scout::net {

namespace {

bool ParseAddress(const std::string& text, int* family, std::array<std::uint8_t, 16>* bytes) {
  bytes->fill(0);
  if (inet_pton(AF_INET, text.c_str(), bytes->data()) == 1) {
    *family = AF_INET;
    return true;
  }
  if (inet_pton(AF_INET6, text.c_str(), bytes->data()) == 1) {
    *family = AF_INET6;
    return true;
  }
  return false;
}

std::string FormatAddress(int family, const std::array<std::uint8_t, 16>& bytes) {
  char buffer[INET6_ADDRSTRLEN] = {0};
  if (!inet_ntop(family, bytes.data(), buffer, sizeof(buffer))) {
    return {};
  }
  return buffer;
}

void Increment(std::array<std::uint8_t, 16>& bytes, std::size_t length) {
  for (std::size_t i = length; i-- > 0;) {
    if (++bytes[i] != 0) {
      return;
    }
  }
}

} // namespace

NetworkRange NetworkRange::Parse(std::string_view expression) {
  const auto trimmed = util::Trim(expression);
  if (trimmed.empty()) {
    throw util::InvalidArgument("empty network range");
  }

  NetworkRange range;
  range.expression_ = trimmed;

  const auto  slash        = trimmed.find('/');
  std::string address_part = trimmed.substr(0, slash);

  if (!ParseAddress(address_part, &range.family_, &range.network_)) {
    throw util::InvalidArgument("invalid network address: " + address_part);
  }

  const int max_prefix = range.family_ == AF_INET ? 32 : 128;
  range.prefix_length_ = max_prefix;

  if (slash != std::string::npos) {
    const auto prefix_text = std::string_view(trimmed).substr(slash + 1);
    int        prefix      = -1;
    auto [ptr, ec]         = std::from_chars(prefix_text.data(), prefix_text.data() + prefix_text.size(), prefix);
    if (ec != std::errc() || ptr != prefix_text.data() + prefix_text.size() || prefix < 0 || prefix > max_prefix) {
      throw util::InvalidArgument("invalid prefix length in network range: " + trimmed);
    }
    range.prefix_length_ = prefix;
  }

  // Clear host bits so "192.168.1.17/24" means 192.168.1.0/24.
  const auto length = range.AddressBytes();
  for (std::size_t i = 0; i < length; ++i) {
    const int bit_start = static_cast<int>(i) * 8;
    if (bit_start >= range.prefix_length_) {
      range.network_[i] = 0;
    } else if (bit_start + 8 > range.prefix_length_) {
      const int keep    = range.prefix_length_ - bit_start;
      range.network_[i] = static_cast<std::uint8_t>(range.network_[i] & (0xFF << (8 - keep)));
    }
  }

  return range;
}

std::size_t NetworkRange::AddressBytes() const {
  return family_ == AF_INET ? 4 : 16;
}

bool NetworkRange::SkipsEdges() const {
  return family_ == AF_INET && prefix_length_ < 31;
}

std::uint64_t NetworkRange::HostCount() const {
  const int host_bits = static_cast<int>(AddressBytes() * 8) - prefix_length_;
  if (host_bits >= 64) {
    return std::numeric_limits<std::uint64_t>::max();
  }
  std::uint64_t count = std::uint64_t{1} << host_bits;
  if (SkipsEdges()) {
    count -= 2;
  }
  return count;
}

std::vector<std::string> NetworkRange::Hosts(std::size_t limit) const {
  std::vector<std::string> hosts;
  const auto               total = HostCount();
  if (total == 0 || limit == 0) {
    return hosts;
  }

  auto current = network_;
  if (SkipsEdges()) {
    Increment(current, AddressBytes());
  }

  const auto wanted = std::min<std::uint64_t>(total, limit);
  hosts.reserve(static_cast<std::size_t>(wanted));
  for (std::uint64_t i = 0; i < wanted; ++i) {
    hosts.push_back(FormatAddress(family_, current));
    Increment(current, AddressBytes());
  }
  return hosts;
}

bool NetworkRange::Contains(std::string_view address) const {
  int                           family = 0;
  std::array<std::uint8_t, 16> bytes{};
  if (!ParseAddress(std::string(address), &family, &bytes) || family != family_) {
    return false;
  }

  int remaining = prefix_length_;
  for (std::size_t i = 0; i < AddressBytes() && remaining > 0; ++i) {
    const int     bits = remaining >= 8 ? 8 : remaining;
    const auto    mask = static_cast<std::uint8_t>(0xFF << (8 - bits));
    if ((bytes[i] & mask) != (network_[i] & mask)) {
      return false;
    }
    remaining -= bits;
  }
  return true;
}

} // namespace scout::net
