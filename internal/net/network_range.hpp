#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace scout::net {

/*
  A parsed CIDR expression ("192.168.1.0/24", "fd00::/120", "10.0.0.7").

  A bare address is treated as a single-host range.
  Parse() throws util::InvalidArgument on malformed input.
*/
class NetworkRange {
 public:
  static NetworkRange Parse(std::string_view expression);

  const std::string& Expression() const {
    return expression_;
  }

  int Family() const {
    return family_;
  }

  int PrefixLength() const {
    return prefix_length_;
  }

  // Number of addresses enumerated by Hosts(); saturates at UINT64_MAX.
  std::uint64_t HostCount() const;

  /*
    Host addresses in ascending order, at most limit of them.

    For IPv4 prefixes shorter than /31 the network and broadcast
    addresses are skipped.
  */
  std::vector<std::string> Hosts(std::size_t limit) const;

  bool Contains(std::string_view address) const;

 private:
  using Bytes = std::array<std::uint8_t, 16>;

  std::size_t AddressBytes() const;
  bool        SkipsEdges() const;

  std::string expression_;
  int         family_        = 0;
  int         prefix_length_ = 0;
  Bytes       network_{};
};

} // namespace scout::net
