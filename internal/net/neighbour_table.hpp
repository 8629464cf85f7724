#pragma once

#include <istream>
#include <map>
#include <string>

namespace scout::net {

// IP address -> lowercase MAC ("aa:bb:cc:dd:ee:ff").
using NeighbourTable = std::map<std::string, std::string>;

/*
  Parses the kernel ARP table format (/proc/net/arp):

    IP address  HW type  Flags  HW address         Mask  Device
    192.168.1.1 0x1      0x2    aa:bb:cc:dd:ee:ff  *     eth0

  Incomplete entries (flags 0x0) and all-zero addresses are skipped.
*/
NeighbourTable ParseNeighbourTable(std::istream& in);

// Empty when the file cannot be read.
NeighbourTable ReadNeighbourTable(const std::string& path);

} // namespace scout::net
