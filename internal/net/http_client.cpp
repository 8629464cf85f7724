#include "http_client.hpp"

#include <charconv>
#include <sstream>

#include "internal/net/socket.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace scout::net {

namespace {

constexpr std::string_view kUserAgent = "device-scout/0.1";

std::string DecodeChunked(std::string_view body) {
  std::string out;
  std::size_t pos = 0;
  while (pos < body.size()) {
    const auto line_end = body.find("\r\n", pos);
    if (line_end == std::string_view::npos) {
      break;
    }
    auto size_text = body.substr(pos, line_end - pos);
    if (auto semi = size_text.find(';'); semi != std::string_view::npos) {
      size_text = size_text.substr(0, semi);
    }
    std::size_t chunk_size = 0;
    auto [ptr, ec]         = std::from_chars(size_text.data(), size_text.data() + size_text.size(), chunk_size, 16);
    if (ec != std::errc()) {
      throw util::MalformedEvidence("invalid chunk size");
    }
    if (chunk_size == 0) {
      break;
    }
    pos = line_end + 2;
    // Truncated bodies keep what arrived.
    out.append(body.substr(pos, chunk_size));
    pos += chunk_size + 2;
  }
  return out;
}

} // namespace

std::string HttpResponse::Header(std::string_view name) const {
  for (const auto& [key, value] : headers) {
    if (util::EqualsIgnoreCase(key, name)) {
      return value;
    }
  }
  return {};
}

std::string HttpResponse::HeaderText() const {
  std::string text;
  for (const auto& [key, value] : headers) {
    if (!text.empty()) {
      text.push_back(' ');
    }
    text += key;
    text.push_back(':');
    text += value;
  }
  return text;
}

std::optional<Url> Url::Parse(std::string_view text) {
  constexpr std::string_view kScheme = "http://";
  const auto                 trimmed = util::Trim(text);
  if (!util::StartsWith(util::ToLower(trimmed), kScheme)) {
    return std::nullopt;
  }

  std::string_view rest  = std::string_view(trimmed).substr(kScheme.size());
  const auto       slash = rest.find('/');
  std::string_view authority = rest.substr(0, slash);
  Url              url;
  url.path = slash == std::string_view::npos ? "/" : std::string(rest.substr(slash));

  if (auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority = authority.substr(at + 1);
  }

  std::string_view port_text;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return std::nullopt;
    }
    url.host = std::string(authority.substr(1, close - 1));
    if (close + 1 < authority.size() && authority[close + 1] == ':') {
      port_text = authority.substr(close + 2);
    }
  } else {
    const auto colon = authority.rfind(':');
    url.host         = std::string(authority.substr(0, colon));
    if (colon != std::string_view::npos) {
      port_text = authority.substr(colon + 1);
    }
  }

  if (url.host.empty()) {
    return std::nullopt;
  }
  if (!port_text.empty()) {
    unsigned port  = 0;
    auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc() || port == 0 || port > 65535) {
      return std::nullopt;
    }
    url.port = static_cast<std::uint16_t>(port);
  }
  return url;
}

HttpResponse ParseHttpResponse(std::string_view raw) {
  const auto header_end = raw.find("\r\n\r\n");
  const auto head       = header_end == std::string_view::npos ? raw : raw.substr(0, header_end);

  const auto status_end  = head.find("\r\n");
  const auto status_line = head.substr(0, status_end);
  if (!util::StartsWith(status_line, "HTTP/")) {
    throw util::MalformedEvidence("response does not start with an HTTP status line");
  }

  HttpResponse response;

  const auto first_space = status_line.find(' ');
  if (first_space == std::string_view::npos) {
    throw util::MalformedEvidence("status line without status code");
  }
  const auto code_text = status_line.substr(first_space + 1, 3);
  auto [ptr, ec]       = std::from_chars(code_text.data(), code_text.data() + code_text.size(), response.status);
  if (ec != std::errc() || response.status < 100 || response.status > 999) {
    throw util::MalformedEvidence("invalid HTTP status code");
  }
  if (first_space + 5 < status_line.size()) {
    response.reason = util::Trim(status_line.substr(first_space + 5));
  }

  if (status_end != std::string_view::npos) {
    std::size_t pos = status_end + 2;
    while (pos < head.size()) {
      auto line_end = head.find("\r\n", pos);
      if (line_end == std::string_view::npos) {
        line_end = head.size();
      }
      const auto line  = head.substr(pos, line_end - pos);
      const auto colon = line.find(':');
      // Header lines without a colon are dropped; the rest of the response is still usable.
      if (colon != std::string_view::npos) {
        response.headers.emplace_back(util::Trim(line.substr(0, colon)), util::Trim(line.substr(colon + 1)));
      }
      pos = line_end + 2;
    }
  }

  if (header_end != std::string_view::npos) {
    const auto body = raw.substr(header_end + 4);
    if (util::ContainsIgnoreCase(response.Header("Transfer-Encoding"), "chunked")) {
      response.body = DecodeChunked(body);
    } else {
      response.body = std::string(body);
    }
  }
  return response;
}

std::optional<HttpResponse> HttpGet(const std::string& host, std::uint16_t port, const std::string& path, const HttpRequestOptions& options,
                                    const util::Deadline& deadline) {
  if (deadline.Expired()) {
    return std::nullopt;
  }

  auto connection = ConnectTcp(host, port, deadline.Clamp(options.connect_timeout));
  if (connection.status != ConnectStatus::kConnected) {
    return std::nullopt;
  }

  const bool        ipv6 = host.find(':') != std::string::npos;
  std::ostringstream request;
  request << "GET " << (path.empty() ? "/" : path) << " HTTP/1.0\r\n"
          << "Host: " << (ipv6 ? "[" + host + "]" : host) << ':' << port << "\r\n"
          << "User-Agent: " << kUserAgent << "\r\n"
          << "Accept: */*\r\n"
          << "Connection: close\r\n\r\n";

  const auto io_deadline = deadline.Min(util::Deadline::After(options.io_timeout));
  if (!SendAll(connection.socket.Get(), request.str(), io_deadline)) {
    return std::nullopt;
  }

  const auto raw = ReceiveAll(connection.socket.Get(), options.max_response_bytes, io_deadline);
  if (raw.empty()) {
    return std::nullopt;
  }
  return ParseHttpResponse(raw);
}

} // namespace scout::net
