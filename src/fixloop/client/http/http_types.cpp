#include "fixloop/client/http/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>

namespace fixloop::http {

namespace {

auto iequals(std::string_view a, std::string_view b) -> bool {
  return std::ranges::equal(a, b, [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

auto has_header(const HttpHeaders& headers, std::string_view key) -> bool {
  return std::ranges::any_of(
      headers, [key](const auto& kv) { return iequals(kv.first, key); });
}

}  // namespace

auto HttpRequest::serialize(std::string_view host) const -> std::string {
  std::string result;
  result.reserve(256 + body.size());

  std::format_to(std::back_inserter(result), "{} {} HTTP/1.1\r\n", method,
                 path);
  for (const auto& [key, value] : headers) {
    std::format_to(std::back_inserter(result), "{}: {}\r\n", key, value);
  }
  if (!has_header(headers, "Host")) {
    std::format_to(std::back_inserter(result), "Host: {}\r\n", host);
  }
  if (!has_header(headers, "Content-Length") &&
      (!body.empty() || method == HttpMethod::POST ||
       method == HttpMethod::PUT)) {
    std::format_to(std::back_inserter(result), "Content-Length: {}\r\n",
                   body.size());
  }
  // One request per connection keeps the client free of pooling state.
  if (!has_header(headers, "Connection")) {
    result += "Connection: close\r\n";
  }
  result += "\r\n";
  result += body;
  return result;
}

auto HttpResponse::header(std::string_view key) const
    -> std::optional<std::string> {
  for (const auto& [k, v] : headers) {
    if (iequals(k, key)) {
      return v;
    }
  }
  return std::nullopt;
}

auto parse_url(std::string_view url) -> std::optional<Url> {
  Url out;
  auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos) {
    return std::nullopt;
  }
  out.scheme = std::string(url.substr(0, scheme_end));
  if (out.scheme == "http") {
    out.port = 80;
  } else if (out.scheme == "https") {
    out.port = 443;
  } else {
    return std::nullopt;
  }

  auto rest = url.substr(scheme_end + 3);
  auto path_start = rest.find('/');
  auto authority = rest.substr(0, path_start);
  out.path = path_start == std::string_view::npos
                 ? std::string{}
                 : std::string(rest.substr(path_start));

  if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
    auto port_text = authority.substr(colon + 1);
    std::uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(
        port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc{} || ptr != port_text.data() + port_text.size() ||
        port == 0) {
      return std::nullopt;
    }
    out.port = port;
    authority = authority.substr(0, colon);
  }
  if (authority.empty()) {
    return std::nullopt;
  }
  out.host = std::string(authority);
  return out;
}

}  // namespace fixloop::http
