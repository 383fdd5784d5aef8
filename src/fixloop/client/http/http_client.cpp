#include "fixloop/client/http/http_client.hpp"

#include "fixloop/client/http/http_parser.hpp"
#include "fixloop/core/constants.hpp"
#include "fixloop/util/log.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <sys/socket.h>
#include <sys/un.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

#include <netdb.h>
#include <poll.h>
#include <unistd.h>

namespace fixloop::http {

namespace {

using SteadyClock = std::chrono::steady_clock;

auto remaining_ms(SteadyClock::time_point deadline) -> int {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - SteadyClock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

auto wait_fd(int fd, short events, SteadyClock::time_point deadline)
    -> HttpResult<void> {
  while (true) {
    int ms = remaining_ms(deadline);
    if (ms <= 0) {
      return std::unexpected(HttpError::Timeout);
    }
    pollfd p{fd, events, 0};
    int rc = poll(&p, 1, ms);
    if (rc > 0) {
      return {};
    }
    if (rc == 0) {
      return std::unexpected(HttpError::Timeout);
    }
    if (errno != EINTR) {
      return std::unexpected(HttpError::RecvFailed);
    }
  }
}

struct SslCtxDeleter {
  void operator()(SSL_CTX* ctx) const {
    SSL_CTX_free(ctx);
  }
};

struct SslDeleter {
  void operator()(SSL* ssl) const {
    SSL_free(ssl);
  }
};

// Waits for the direction OpenSSL asked for; false for a hard error.
auto wait_ssl(SSL* ssl, int fd, int rc, SteadyClock::time_point deadline,
              HttpError hard_error) -> HttpResult<void> {
  switch (SSL_get_error(ssl, rc)) {
    case SSL_ERROR_WANT_READ: return wait_fd(fd, POLLIN, deadline);
    case SSL_ERROR_WANT_WRITE: return wait_fd(fd, POLLOUT, deadline);
    default: return std::unexpected(hard_error);
  }
}

class Connection {
public:
  explicit Connection(int fd) : fd_(fd) {
  }
  ~Connection() {
    ssl_.reset();
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  Connection(Connection&& other) noexcept
      : fd_(std::exchange(other.fd_, -1)), ssl_(std::move(other.ssl_)) {
  }
  Connection(const Connection&) = delete;
  auto operator=(const Connection&) -> Connection& = delete;
  auto operator=(Connection&&) -> Connection& = delete;

  auto start_tls(SSL_CTX* ctx, const std::string& host,
                 SteadyClock::time_point deadline) -> HttpResult<void> {
    ssl_.reset(SSL_new(ctx));
    if (!ssl_ || SSL_set_fd(ssl_.get(), fd_) != 1 ||
        SSL_set_tlsext_host_name(ssl_.get(), host.c_str()) != 1 ||
        SSL_set1_host(ssl_.get(), host.c_str()) != 1) {
      return std::unexpected(HttpError::TlsFailed);
    }
    while (true) {
      int rc = SSL_connect(ssl_.get());
      if (rc == 1) {
        return {};
      }
      if (auto r = wait_ssl(ssl_.get(), fd_, rc, deadline, HttpError::TlsFailed);
          !r) {
        const char* reason = ERR_reason_error_string(ERR_get_error());
        log::error("TLS handshake with {} failed: {}", host,
                   reason ? reason : to_string_view(r.error()));
        return r;
      }
    }
  }

  auto send_all(std::string_view data, SteadyClock::time_point deadline)
      -> HttpResult<void> {
    while (!data.empty()) {
      ssize_t n;
      if (ssl_) {
        n = SSL_write(ssl_.get(), data.data(), static_cast<int>(data.size()));
        if (n <= 0) {
          if (auto r = wait_ssl(ssl_.get(), fd_, static_cast<int>(n), deadline,
                                HttpError::SendFailed);
              !r) {
            return r;
          }
          continue;
        }
      } else {
        n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0) {
          if (errno == EINTR) {
            continue;
          }
          if (errno != EAGAIN && errno != EWOULDBLOCK) {
            return std::unexpected(HttpError::SendFailed);
          }
          if (auto r = wait_fd(fd_, POLLOUT, deadline); !r) {
            return r;
          }
          continue;
        }
      }
      data.remove_prefix(static_cast<std::size_t>(n));
    }
    return {};
  }

  // Returns 0 at end of stream.
  auto recv_some(char* buf, std::size_t size, SteadyClock::time_point deadline)
      -> HttpResult<std::size_t> {
    while (true) {
      if (ssl_) {
        int n = SSL_read(ssl_.get(), buf, static_cast<int>(size));
        if (n > 0) {
          return static_cast<std::size_t>(n);
        }
        int err = SSL_get_error(ssl_.get(), n);
        if (err == SSL_ERROR_ZERO_RETURN) {
          return std::size_t{0};
        }
        if (auto r = wait_ssl(ssl_.get(), fd_, n, deadline,
                              HttpError::RecvFailed);
            !r) {
          return std::unexpected(r.error());
        }
        continue;
      }

      ssize_t n = ::recv(fd_, buf, size, 0);
      if (n >= 0) {
        return static_cast<std::size_t>(n);
      }
      if (errno == EINTR) {
        continue;
      }
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        return std::unexpected(HttpError::RecvFailed);
      }
      if (auto r = wait_fd(fd_, POLLIN, deadline); !r) {
        return std::unexpected(r.error());
      }
    }
  }

private:
  int fd_{-1};
  std::unique_ptr<SSL, SslDeleter> ssl_;
};

auto finish_connect(int fd, SteadyClock::time_point deadline)
    -> HttpResult<void> {
  if (auto r = wait_fd(fd, POLLOUT, deadline); !r) {
    return r;
  }
  int so_error = 0;
  socklen_t len = sizeof(so_error);
  if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 ||
      so_error != 0) {
    return std::unexpected(HttpError::ConnectFailed);
  }
  return {};
}

auto connect_tcp(const std::string& host, std::uint16_t port,
                 SteadyClock::time_point deadline) -> HttpResult<Connection> {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* addrs = nullptr;
  auto service = std::to_string(port);
  if (int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &addrs);
      rc != 0) {
    log::error("Cannot resolve {}: {}", host, gai_strerror(rc));
    return std::unexpected(HttpError::ConnectFailed);
  }
  std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(addrs,
                                                           &freeaddrinfo);

  for (auto* ai = addrs; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC,
                      ai->ai_protocol);
    if (fd < 0) {
      continue;
    }
    Connection conn(fd);
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      return conn;
    }
    if (errno == EINPROGRESS && finish_connect(fd, deadline)) {
      return conn;
    }
  }
  log::error("Cannot connect to {}:{}", host, port);
  return std::unexpected(HttpError::ConnectFailed);
}

auto connect_unix(const std::string& path, SteadyClock::time_point deadline)
    -> HttpResult<Connection> {
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (path.size() >= sizeof(addr.sun_path)) {
    log::error("Socket path too long: {}", path);
    return std::unexpected(HttpError::ConnectFailed);
  }
  std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return std::unexpected(HttpError::ConnectFailed);
  }
  Connection conn(fd);
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
    return conn;
  }
  if ((errno == EINPROGRESS || errno == EAGAIN) &&
      finish_connect(fd, deadline)) {
    return conn;
  }
  log::debug("Cannot connect to {}: {}", path, strerror(errno));
  return std::unexpected(HttpError::ConnectFailed);
}

}  // namespace

auto Endpoint::unix_socket(std::string_view path) -> Endpoint {
  return Endpoint{.kind = Kind::Unix,
                  .host = "localhost",
                  .port = 0,
                  .socket_path = std::string(path)};
}

auto Endpoint::from_url(const Url& url) -> Endpoint {
  return Endpoint{.kind = url.scheme == "https" ? Kind::Tls : Kind::Tcp,
                  .host = url.host,
                  .port = url.port,
                  .socket_path = {}};
}

struct HttpClient::Impl {
  Endpoint endpoint;
  HttpClientConfig config;
  std::unique_ptr<SSL_CTX, SslCtxDeleter> ssl_ctx;

  auto open(SteadyClock::time_point deadline) const -> HttpResult<Connection> {
    if (endpoint.kind == Endpoint::Kind::Unix) {
      return connect_unix(endpoint.socket_path, deadline);
    }
    auto conn = connect_tcp(endpoint.host, endpoint.port, deadline);
    if (!conn || endpoint.kind == Endpoint::Kind::Tcp) {
      return conn;
    }
    if (!ssl_ctx) {
      return std::unexpected(HttpError::TlsFailed);
    }
    if (auto r = conn->start_tls(ssl_ctx.get(), endpoint.host, deadline); !r) {
      return std::unexpected(r.error());
    }
    return conn;
  }
};

HttpClient::HttpClient(Endpoint endpoint, HttpClientConfig config)
    : impl_(std::make_unique<Impl>()) {
  impl_->endpoint = std::move(endpoint);
  impl_->config = config;
  if (impl_->endpoint.kind == Endpoint::Kind::Tls) {
    impl_->ssl_ctx.reset(SSL_CTX_new(TLS_client_method()));
    if (impl_->ssl_ctx) {
      SSL_CTX_set_default_verify_paths(impl_->ssl_ctx.get());
      SSL_CTX_set_verify(impl_->ssl_ctx.get(), SSL_VERIFY_PEER, nullptr);
      SSL_CTX_set_min_proto_version(impl_->ssl_ctx.get(), TLS1_2_VERSION);
    } else {
      log::error("Failed to create TLS context");
    }
  }
}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
auto HttpClient::operator=(HttpClient&&) noexcept -> HttpClient& = default;

auto HttpClient::endpoint() const noexcept -> const Endpoint& {
  return impl_->endpoint;
}

auto HttpClient::request(const HttpRequest& req) const
    -> HttpResult<HttpResponse> {
  return request(req, impl_->config.read_timeout);
}

auto HttpClient::request(const HttpRequest& req,
                         std::chrono::milliseconds read_timeout) const
    -> HttpResult<HttpResponse> {
  auto conn = impl_->open(SteadyClock::now() + impl_->config.connect_timeout);
  if (!conn) {
    return std::unexpected(conn.error());
  }

  auto deadline = SteadyClock::now() + read_timeout;
  if (auto r = conn->send_all(req.serialize(impl_->endpoint.host), deadline);
      !r) {
    return std::unexpected(r.error());
  }

  HttpResponseParser parser;
  std::array<char, io::kReadBufferSize> buffer;
  std::size_t total = 0;
  while (true) {
    auto n = conn->recv_some(buffer.data(), buffer.size(), deadline);
    if (!n) {
      return std::unexpected(n.error());
    }
    if (*n == 0) {
      if (auto resp = parser.finish()) {
        return std::move(*resp);
      }
      return std::unexpected(HttpError::ParseError);
    }
    total += *n;
    if (total > impl_->config.max_response_size) {
      return std::unexpected(HttpError::ResponseTooLarge);
    }
    if (auto resp = parser.parse(std::string_view(buffer.data(), *n))) {
      return std::move(*resp);
    }
    if (parser.failed()) {
      return std::unexpected(HttpError::ParseError);
    }
  }
}

auto HttpClient::get(std::string_view path, const HttpHeaders& headers) const
    -> HttpResult<HttpResponse> {
  return request(HttpRequest{.method = HttpMethod::GET,
                             .path = std::string(path),
                             .headers = headers,
                             .body = {}});
}

auto HttpClient::post(std::string_view path, std::string body,
                      const HttpHeaders& headers) const
    -> HttpResult<HttpResponse> {
  return request(HttpRequest{.method = HttpMethod::POST,
                             .path = std::string(path),
                             .headers = headers,
                             .body = std::move(body)});
}

auto HttpClient::post_json(std::string_view path, std::string json,
                           HttpHeaders headers) const
    -> HttpResult<HttpResponse> {
  headers["Content-Type"] = "application/json";
  return post(path, std::move(json), headers);
}

auto HttpClient::delete_(std::string_view path,
                         const HttpHeaders& headers) const
    -> HttpResult<HttpResponse> {
  return request(HttpRequest{.method = HttpMethod::DELETE,
                             .path = std::string(path),
                             .headers = headers,
                             .body = {}});
}

}  // namespace fixloop::http
