#pragma once

#include <cstdint>
#include <istream>
#include <map>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace scout::net {

inline constexpr std::uint16_t kDnsPort = 53;

/*
  First IPv4 "nameserver" line of a resolv.conf style file:

    # comment
    nameserver 192.168.1.1

  Empty when there is none.
*/
std::string ParseNameserver(std::istream& in);

// Empty when the file cannot be read.
std::string ReadNameserver(const std::string& path);

/*
  PTR lookups for many IPv4 addresses over one UDP socket.

  All queries are sent up front; answers are matched by query id until
  every address has answered or the deadline expires. Addresses without
  a name, or whose answer did not arrive in time, are absent from the
  result. Never blocks past the deadline.
*/
std::map<std::string, std::string> ReverseResolve(const std::vector<std::string>& addresses, const std::string& resolver, std::uint16_t port,
                                                  const util::Deadline& deadline);

} // namespace scout::net
