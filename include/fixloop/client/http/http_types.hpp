#pragma once

#include "fixloop/core/error.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fixloop::http {

enum class HttpMethod : std::uint8_t {
  GET,
  POST,
  PUT,
  DELETE,
  HEAD,
};

using HttpHeaders = std::unordered_map<std::string, std::string,
                                       fixloop::StringHash, fixloop::StringEqual>;

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string path{"/"};
  HttpHeaders headers;
  std::string body;

  // Adds Host, Content-Length and Connection: close when missing.
  [[nodiscard]] auto serialize(std::string_view host) const -> std::string;
};

struct HttpResponse {
  int status{0};
  HttpHeaders headers;
  std::string body;

  // Case-insensitive lookup
  [[nodiscard]] auto header(std::string_view key) const
      -> std::optional<std::string>;
  [[nodiscard]] auto is_success() const noexcept -> bool {
    return status >= 200 && status < 300;
  }
};

struct Url {
  std::string scheme;
  std::string host;
  std::uint16_t port{0};
  std::string path;
};

// Accepts http:// and https:// URLs; the port defaults per scheme.
[[nodiscard]] auto parse_url(std::string_view url) -> std::optional<Url>;

}  // namespace fixloop::http

template <>
struct std::formatter<fixloop::http::HttpMethod>
    : std::formatter<std::string_view> {
  auto format(fixloop::http::HttpMethod method, auto& ctx) const {
    using enum fixloop::http::HttpMethod;
    std::string_view name = [method] {
      switch (method) {
        case GET: return "GET";
        case POST: return "POST";
        case PUT: return "PUT";
        case DELETE: return "DELETE";
        case HEAD: return "HEAD";
      }
      return "UNKNOWN";
    }();
    return std::formatter<std::string_view>::format(name, ctx);
  }
};
