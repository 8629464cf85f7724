#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "internal/net/neighbour_table.hpp"
#include "internal/net/oui_table.hpp"

namespace {

using scout::net::LookupMacVendor;

void TestParsesKernelArpTable() {
  std::istringstream in(
      "IP address       HW type     Flags       HW address            Mask     Device\n"
      "192.168.1.1      0x1         0x2         AA:BB:CC:00:11:22     *        eth0\n"
      "192.168.1.20     0x1         0x2         00:17:88:01:02:03     *        eth0\n"
      "192.168.1.21     0x1         0x0         00:00:00:00:00:00     *        eth0\n"
      "192.168.1.22     0x1         0x2         00:00:00:00:00:00     *        eth0\n"
      "192.168.1.23     0x1         0x2         incomplete            *        eth0\n"
      "garbage\n");
  auto table = scout::net::ParseNeighbourTable(in);
  assert(table.size() == 2);
  assert(table.at("192.168.1.1") == "aa:bb:cc:00:11:22");
  assert(table.at("192.168.1.20") == "00:17:88:01:02:03");
}

void TestMissingFileIsEmpty() {
  auto table = scout::net::ReadNeighbourTable("/nonexistent/device-scout/arp");
  assert(table.empty());
}

void TestReadsFromFile() {
  const auto path = std::filesystem::temp_directory_path() / "device_scout_arp_test";
  {
    std::ofstream out(path);
    out << "IP address HW type Flags HW address Mask Device\n"
        << "10.0.0.5 0x1 0x2 b8:27:eb:aa:bb:cc * wlan0\n";
  }
  auto table = scout::net::ReadNeighbourTable(path.string());
  assert(table.size() == 1);
  assert(table.at("10.0.0.5") == "b8:27:eb:aa:bb:cc");
  std::filesystem::remove(path);
}

void TestOuiLookup() {
  assert(LookupMacVendor("00:17:88:01:02:03") == "Philips");
  assert(LookupMacVendor("D0-52-A8-11-22-33") == "Samsung");
  assert(LookupMacVendor("00:0e:58:aa:bb:cc") == "Sonos");
  assert(LookupMacVendor("02:00:00:00:00:01").empty());
  assert(LookupMacVendor("00:17").empty());
  assert(LookupMacVendor("zz:17:88:01:02:03").empty());
}

} // namespace

int main() {
  TestParsesKernelArpTable();
  TestMissingFileIsEmpty();
  TestReadsFromFile();
  TestOuiLookup();

  std::cout << "device_scout_unit_neighbour_oui: pass\n";
  return 0;
}
