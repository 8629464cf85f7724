#include "socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace scout::net {

namespace {

constexpr std::size_t kMaxDatagramBytes = 9000;

int PollTimeout(std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) {
    return 0;
  }
  if (timeout.count() > 60'000) {
    return 60'000;
  }
  return static_cast<int>(timeout.count());
}

} // namespace

Socket::~Socket() {
  Reset();
}

Socket::Socket(Socket&& other) noexcept : fd_(other.fd_) {
  other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
  if (this != &other) {
    Reset(other.fd_);
    other.fd_ = -1;
  }
  return *this;
}

void Socket::Reset(int fd) {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = fd;
}

bool ToSockaddr(const std::string& host, std::uint16_t port, sockaddr_storage* out, socklen_t* out_len) {
  std::memset(out, 0, sizeof(*out));

  auto* v4 = reinterpret_cast<sockaddr_in*>(out);
  if (inet_pton(AF_INET, host.c_str(), &v4->sin_addr) == 1) {
    v4->sin_family = AF_INET;
    v4->sin_port   = htons(port);
    *out_len       = sizeof(sockaddr_in);
    return true;
  }

  auto* v6 = reinterpret_cast<sockaddr_in6*>(out);
  if (inet_pton(AF_INET6, host.c_str(), &v6->sin6_addr) == 1) {
    v6->sin6_family = AF_INET6;
    v6->sin6_port   = htons(port);
    *out_len        = sizeof(sockaddr_in6);
    return true;
  }
  return false;
}

std::string AddressToString(const sockaddr* address) {
  char buffer[INET6_ADDRSTRLEN] = {0};
  if (address->sa_family == AF_INET) {
    inet_ntop(AF_INET, &reinterpret_cast<const sockaddr_in*>(address)->sin_addr, buffer, sizeof(buffer));
  } else if (address->sa_family == AF_INET6) {
    inet_ntop(AF_INET6, &reinterpret_cast<const sockaddr_in6*>(address)->sin6_addr, buffer, sizeof(buffer));
  }
  return buffer;
}

std::uint16_t PortOf(const sockaddr* address) {
  if (address->sa_family == AF_INET) {
    return ntohs(reinterpret_cast<const sockaddr_in*>(address)->sin_port);
  }
  if (address->sa_family == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(address)->sin6_port);
  }
  return 0;
}

bool SetNonBlocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool WaitFor(int fd, short events, std::chrono::milliseconds timeout) {
  pollfd pfd{};
  pfd.fd     = fd;
  pfd.events = events;
  for (;;) {
    const int rc = ::poll(&pfd, 1, PollTimeout(timeout));
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    return rc > 0 && (pfd.revents & (events | POLLERR | POLLHUP)) != 0;
  }
}

// ------------------------------------------------------------
// TCP
// ------------------------------------------------------------

ConnectResult StartConnect(const std::string& host, std::uint16_t port) {
  ConnectResult result;

  sockaddr_storage address{};
  socklen_t        length = 0;
  if (!ToSockaddr(host, port, &address, &length)) {
    result.error = EINVAL;
    return result;
  }

  Socket sock(::socket(address.ss_family, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!sock.Valid()) {
    result.error = errno;
    return result;
  }
  if (!SetNonBlocking(sock.Get())) {
    result.error = errno;
    return result;
  }

  const int rc = ::connect(sock.Get(), reinterpret_cast<const sockaddr*>(&address), length);
  if (rc == 0) {
    result.status = ConnectStatus::kConnected;
  } else if (errno == EINPROGRESS) {
    result.status = ConnectStatus::kInProgress;
  } else if (errno == ECONNREFUSED) {
    result.status = ConnectStatus::kRefused;
    result.error  = errno;
  } else {
    result.status = ConnectStatus::kFailed;
    result.error  = errno;
  }
  result.socket = std::move(sock);
  return result;
}

ConnectStatus FinishConnect(int fd, int* error) {
  int       so_error = 0;
  socklen_t length   = sizeof(so_error);
  if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &length) != 0) {
    so_error = errno;
  }
  if (error) {
    *error = so_error;
  }
  if (so_error == 0) {
    return ConnectStatus::kConnected;
  }
  if (so_error == ECONNREFUSED) {
    return ConnectStatus::kRefused;
  }
  if (so_error == ETIMEDOUT) {
    return ConnectStatus::kTimedOut;
  }
  return ConnectStatus::kFailed;
}

ConnectResult ConnectTcp(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) {
  auto result = StartConnect(host, port);
  if (result.status != ConnectStatus::kInProgress) {
    return result;
  }

  if (!WaitFor(result.socket.Get(), POLLOUT, timeout)) {
    result.status = ConnectStatus::kTimedOut;
    result.socket.Reset();
    return result;
  }

  result.status = FinishConnect(result.socket.Get(), &result.error);
  if (result.status != ConnectStatus::kConnected) {
    result.socket.Reset();
  }
  return result;
}

bool SendAll(int fd, std::string_view data, const util::Deadline& deadline) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const auto n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<std::size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (deadline.Expired() || !WaitFor(fd, POLLOUT, deadline.Remaining())) {
        return false;
      }
      continue;
    }
    return false;
  }
  return true;
}

std::string ReceiveAll(int fd, std::size_t max_bytes, const util::Deadline& deadline) {
  std::string out;
  char        buffer[4096];
  while (out.size() < max_bytes) {
    if (deadline.Expired() || !WaitFor(fd, POLLIN, deadline.Remaining())) {
      break;
    }
    const auto n = ::recv(fd, buffer, sizeof(buffer), 0);
    if (n > 0) {
      out.append(buffer, static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
      continue;
    }
    break;
  }
  if (out.size() > max_bytes) {
    out.resize(max_bytes);
  }
  return out;
}

// ------------------------------------------------------------
// UDP
// ------------------------------------------------------------

Socket OpenUdpSocket() {
  Socket sock(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
  if (sock.Valid()) {
    SetNonBlocking(sock.Get());
  }
  return sock;
}

bool BindReusable(int fd, std::uint16_t port) {
  int yes = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0) {
    return false;
  }
#ifdef SO_REUSEPORT
  // Not fatal: some kernels refuse it for multicast sockets.
  setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &yes, sizeof(yes));
#endif

  sockaddr_in address{};
  address.sin_family      = AF_INET;
  address.sin_port        = htons(port);
  address.sin_addr.s_addr = htonl(INADDR_ANY);
  return ::bind(fd, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) == 0;
}

bool JoinMulticastGroup(int fd, const std::string& group, const std::string& interface_address) {
  ip_mreq request{};
  if (inet_pton(AF_INET, group.c_str(), &request.imr_multiaddr) != 1) {
    return false;
  }
  request.imr_interface.s_addr = htonl(INADDR_ANY);
  if (!interface_address.empty() && inet_pton(AF_INET, interface_address.c_str(), &request.imr_interface) != 1) {
    return false;
  }
  return setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &request, sizeof(request)) == 0;
}

bool SendDatagram(int fd, const std::string& host, std::uint16_t port, std::string_view payload) {
  sockaddr_storage address{};
  socklen_t        length = 0;
  if (!ToSockaddr(host, port, &address, &length)) {
    return false;
  }
  const auto n = ::sendto(fd, payload.data(), payload.size(), 0, reinterpret_cast<const sockaddr*>(&address), length);
  return n == static_cast<ssize_t>(payload.size());
}

std::optional<Datagram> ReceiveDatagram(int fd, std::chrono::milliseconds timeout) {
  if (!WaitFor(fd, POLLIN, timeout)) {
    return std::nullopt;
  }

  char             buffer[kMaxDatagramBytes];
  sockaddr_storage sender{};
  socklen_t        sender_length = sizeof(sender);
  const auto       n = ::recvfrom(fd, buffer, sizeof(buffer), 0, reinterpret_cast<sockaddr*>(&sender), &sender_length);
  if (n < 0) {
    return std::nullopt;
  }

  Datagram datagram;
  datagram.sender      = AddressToString(reinterpret_cast<const sockaddr*>(&sender));
  datagram.sender_port = PortOf(reinterpret_cast<const sockaddr*>(&sender));
  datagram.payload.assign(buffer, static_cast<std::size_t>(n));
  return datagram;
}

} // namespace scout::net
