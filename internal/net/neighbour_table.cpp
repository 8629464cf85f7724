#include "neighbour_table.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

#include "internal/util/strings.hpp"

namespace scout::net {

namespace {

constexpr const char* kZeroMac = "00:00:00:00:00:00";

bool LooksLikeMac(const std::string& value) {
  if (value.size() != 17) {
    return false;
  }
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (i % 3 == 2) {
      if (value[i] != ':') {
        return false;
      }
    } else if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
      return false;
    }
  }
  return true;
}

} // namespace

NeighbourTable ParseNeighbourTable(std::istream& in) {
  NeighbourTable table;
  std::string    line;

  bool header = true;
  while (std::getline(in, line)) {
    if (header) {
      header = false;
      if (util::StartsWith(line, "IP address")) {
        continue;
      }
    }

    std::istringstream fields(line);
    std::string        ip, hw_type, flags, mac;
    if (!(fields >> ip >> hw_type >> flags >> mac)) {
      continue;
    }
    mac = util::ToLower(mac);
    if (flags == "0x0" || mac == kZeroMac || !LooksLikeMac(mac)) {
      continue;
    }
    table[ip] = mac;
  }
  return table;
}

NeighbourTable ReadNeighbourTable(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return {};
  }
  return ParseNeighbourTable(in);
}

} // namespace scout::net
