#pragma once

#include "fixloop/client/http/http_types.hpp"

#include <llhttp.h>

#include <memory>
#include <optional>
#include <string_view>

namespace fixloop::http {

// Incremental response parser. Feed bytes as they arrive; a complete
// response is returned once the message ends.
class HttpResponseParser {
public:
  HttpResponseParser();
  ~HttpResponseParser();

  HttpResponseParser(const HttpResponseParser&) = delete;
  auto operator=(const HttpResponseParser&) -> HttpResponseParser& = delete;

  auto parse(std::string_view data) -> std::optional<HttpResponse>;

  // Signals EOF; completes responses delimited by connection close.
  auto finish() -> std::optional<HttpResponse>;

  [[nodiscard]] auto failed() const noexcept -> bool;
  auto reset() -> void;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace fixloop::http
