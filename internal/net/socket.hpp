#pragma once

#include <sys/socket.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace scout::net {

/*
  Owning file descriptor. Closes on destruction, move-only.
*/
class Socket {
 public:
  Socket() = default;
  explicit Socket(int fd) : fd_(fd) {
  }
  ~Socket();

  Socket(Socket&& other) noexcept;
  Socket& operator=(Socket&& other) noexcept;

  Socket(const Socket&)            = delete;
  Socket& operator=(const Socket&) = delete;

  int Get() const {
    return fd_;
  }

  bool Valid() const {
    return fd_ >= 0;
  }

  void Reset(int fd = -1);

 private:
  int fd_ = -1;
};

// Numeric host only; no name resolution happens here.
bool ToSockaddr(const std::string& host, std::uint16_t port, sockaddr_storage* out, socklen_t* out_len);
std::string   AddressToString(const sockaddr* address);
std::uint16_t PortOf(const sockaddr* address);

bool SetNonBlocking(int fd);

// poll() for the given events; false on timeout or error.
bool WaitFor(int fd, short events, std::chrono::milliseconds timeout);

// ------------------------------------------------------------
// TCP
// ------------------------------------------------------------

enum class ConnectStatus {
  kConnected,
  kInProgress,
  kRefused,
  kTimedOut,
  kFailed,
};

struct ConnectResult {
  Socket        socket;
  ConnectStatus status = ConnectStatus::kFailed;
  int           error  = 0;
};

// Non-blocking connect; status is kInProgress unless it resolved immediately.
ConnectResult StartConnect(const std::string& host, std::uint16_t port);

// Outcome of a connect that became writable.
ConnectStatus FinishConnect(int fd, int* error = nullptr);

// Blocking-style connect bounded by timeout.
ConnectResult ConnectTcp(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout);

bool SendAll(int fd, std::string_view data, const util::Deadline& deadline);

// Reads until the peer closes, max_bytes are buffered or the deadline expires.
std::string ReceiveAll(int fd, std::size_t max_bytes, const util::Deadline& deadline);

// ------------------------------------------------------------
// UDP
// ------------------------------------------------------------

struct Datagram {
  std::string   sender;
  std::uint16_t sender_port = 0;
  std::string   payload;
};

Socket OpenUdpSocket();

// Bind 0.0.0.0:port with address/port reuse so other responders can share it.
bool BindReusable(int fd, std::uint16_t port);

bool JoinMulticastGroup(int fd, const std::string& group, const std::string& interface_address);

bool SendDatagram(int fd, const std::string& host, std::uint16_t port, std::string_view payload);

std::optional<Datagram> ReceiveDatagram(int fd, std::chrono::milliseconds timeout);

} // namespace scout::net
