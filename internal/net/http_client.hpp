#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/util/time.hpp"

namespace scout::net {

struct HttpResponse {
  int         status = 0;
  std::string reason;

  // Header order is preserved as received.
  std::vector<std::pair<std::string, std::string>> headers;
  std::string                                      body;

  // Case-insensitive lookup; empty when absent.
  std::string Header(std::string_view name) const;

  // "name:value" pairs joined by spaces, the text signatures match against.
  std::string HeaderText() const;
};

struct Url {
  std::string   host;
  std::uint16_t port = 80;
  std::string   path = "/";

  // http:// URLs with a numeric or named host. https is rejected.
  static std::optional<Url> Parse(std::string_view text);
};

/*
  Parses a raw HTTP/1.x response (status line, headers, body).

  Chunked transfer encoding is decoded. Throws util::MalformedEvidence
  when the status line or header block is unusable.
*/
HttpResponse ParseHttpResponse(std::string_view raw);

struct HttpRequestOptions {
  std::chrono::milliseconds connect_timeout{3000};
  std::chrono::milliseconds io_timeout{3000};
  std::size_t               max_response_bytes = 64 * 1024;
};

/*
  Minimal HTTP/1.0 GET over a plain TCP socket.

  Returns nullopt when the host cannot be reached or nothing came back
  before the deadline. A response that arrives but cannot be parsed
  throws util::MalformedEvidence.
*/
std::optional<HttpResponse> HttpGet(const std::string& host, std::uint16_t port, const std::string& path, const HttpRequestOptions& options,
                                    const util::Deadline& deadline);

} // namespace scout::net
