#pragma once

#include "fixloop/client/http/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace fixloop::http {

struct HttpClientConfig {
  std::chrono::milliseconds connect_timeout{30000};
  std::chrono::milliseconds read_timeout{30000};
  std::size_t max_response_size{10 * 1024 * 1024};  // 10MB
};

enum class HttpError : std::uint8_t {
  ConnectFailed,
  TlsFailed,
  SendFailed,
  RecvFailed,
  Timeout,
  ParseError,
  ResponseTooLarge,
};

[[nodiscard]] constexpr auto to_string_view(HttpError error) noexcept
    -> std::string_view {
  switch (error) {
    case HttpError::ConnectFailed: return "connect failed";
    case HttpError::TlsFailed: return "TLS handshake failed";
    case HttpError::SendFailed: return "send failed";
    case HttpError::RecvFailed: return "receive failed";
    case HttpError::Timeout: return "timeout";
    case HttpError::ParseError: return "malformed response";
    case HttpError::ResponseTooLarge: return "response too large";
  }
  return "unknown error";
}

template <typename T>
using HttpResult = std::expected<T, HttpError>;

struct Endpoint {
  enum class Kind : std::uint8_t { Tcp, Tls, Unix };

  Kind kind{Kind::Tcp};
  std::string host;
  std::uint16_t port{0};
  std::string socket_path;

  [[nodiscard]] static auto unix_socket(std::string_view path) -> Endpoint;
  [[nodiscard]] static auto from_url(const Url& url) -> Endpoint;
};

// Blocking HTTP/1.1 client. Each request opens its own connection, so one
// instance may be shared by several threads.
class HttpClient {
public:
  explicit HttpClient(Endpoint endpoint, HttpClientConfig config = {});
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  auto operator=(const HttpClient&) -> HttpClient& = delete;
  HttpClient(HttpClient&&) noexcept;
  auto operator=(HttpClient&&) noexcept -> HttpClient&;

  [[nodiscard]] auto request(const HttpRequest& req) const
      -> HttpResult<HttpResponse>;

  // Same as request() with a per-call read timeout.
  [[nodiscard]] auto request(const HttpRequest& req,
                             std::chrono::milliseconds read_timeout) const
      -> HttpResult<HttpResponse>;

  [[nodiscard]] auto get(std::string_view path,
                         const HttpHeaders& headers = {}) const
      -> HttpResult<HttpResponse>;

  [[nodiscard]] auto post(std::string_view path, std::string body = {},
                          const HttpHeaders& headers = {}) const
      -> HttpResult<HttpResponse>;

  [[nodiscard]] auto post_json(std::string_view path, std::string json,
                               HttpHeaders headers = {}) const
      -> HttpResult<HttpResponse>;

  [[nodiscard]] auto delete_(std::string_view path,
                             const HttpHeaders& headers = {}) const
      -> HttpResult<HttpResponse>;

  [[nodiscard]] auto endpoint() const noexcept -> const Endpoint&;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace fixloop::http
