#include "internal/net/reverse_dns.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <sstream>

namespace {

using scout::net::ParseNameserver;

void TestFirstIpv4NameserverWins() {
  std::istringstream in(
      "# generated by NetworkManager\n"
      "search lan\n"
      "nameserver fe80::1%eth0\n"
      "nameserver 192.168.1.1\n"
      "nameserver 8.8.8.8\n");
  assert(ParseNameserver(in) == "192.168.1.1");
}

void TestNoNameserver() {
  std::istringstream empty("");
  assert(ParseNameserver(empty).empty());

  std::istringstream garbage("nameserver\nnameserver not-an-address\noptions ndots:1\n");
  assert(ParseNameserver(garbage).empty());

  assert(scout::net::ReadNameserver("/nonexistent/resolv.conf").empty());
}

void TestNothingToResolve() {
  const auto deadline = scout::util::Deadline::After(std::chrono::milliseconds(200));
  assert(scout::net::ReverseResolve({}, "127.0.0.1", 53, deadline).empty());
  // No resolver configured: returns at once instead of waiting out the deadline.
  const auto started = std::chrono::steady_clock::now();
  assert(scout::net::ReverseResolve({"10.0.0.1"}, "", 53, deadline).empty());
  assert(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(100));
}

} // namespace

int main() {
  TestFirstIpv4NameserverWins();
  TestNoNameserver();
  TestNothingToResolve();

  std::cout << "device_scout_unit_reverse_dns: pass\n";
  return 0;
}
