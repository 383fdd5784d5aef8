#include "fixloop/client/http/http_parser.hpp"

#include "fixloop/util/log.hpp"

namespace fixloop::http {

struct HttpResponseParser::Impl {
  llhttp_t parser;
  llhttp_settings_t settings;
  HttpResponse current_response;
  bool response_complete = false;
  bool failed = false;
  std::string current_header_field;
  std::string current_header_value;
  bool in_header_field = false;

  auto flush_header() -> void {
    if (!current_header_field.empty()) {
      current_response.headers[current_header_field] = current_header_value;
      current_header_field.clear();
      current_header_value.clear();
    }
  }

  static auto on_header_field(llhttp_t* parser, const char* at, size_t length)
      -> int {
    auto* impl = static_cast<Impl*>(parser->data);
    if (!impl->in_header_field) {
      impl->flush_header();
    }
    impl->current_header_field.append(at, length);
    impl->in_header_field = true;
    return 0;
  }

  static auto on_header_value(llhttp_t* parser, const char* at, size_t length)
      -> int {
    auto* impl = static_cast<Impl*>(parser->data);
    impl->current_header_value.append(at, length);
    impl->in_header_field = false;
    return 0;
  }

  static auto on_headers_complete(llhttp_t* parser) -> int {
    auto* impl = static_cast<Impl*>(parser->data);
    impl->flush_header();
    impl->current_response.status = llhttp_get_status_code(&impl->parser);
    return 0;
  }

  static auto on_body(llhttp_t* parser, const char* at, size_t length) -> int {
    auto* impl = static_cast<Impl*>(parser->data);
    impl->current_response.body.append(at, length);
    return 0;
  }

  static auto on_message_complete(llhttp_t* parser) -> int {
    auto* impl = static_cast<Impl*>(parser->data);
    impl->response_complete = true;
    return HPE_PAUSED;
  }

  auto init() -> void {
    llhttp_init(&parser, HTTP_RESPONSE, &settings);
    parser.data = this;
  }

  auto take() -> std::optional<HttpResponse> {
    if (!response_complete) {
      return std::nullopt;
    }
    auto resp = std::move(current_response);
    current_response = HttpResponse{};
    response_complete = false;
    return resp;
  }
};

HttpResponseParser::HttpResponseParser() : impl_(std::make_unique<Impl>()) {
  llhttp_settings_init(&impl_->settings);
  impl_->settings.on_header_field = Impl::on_header_field;
  impl_->settings.on_header_value = Impl::on_header_value;
  impl_->settings.on_headers_complete = Impl::on_headers_complete;
  impl_->settings.on_body = Impl::on_body;
  impl_->settings.on_message_complete = Impl::on_message_complete;
  impl_->init();
}

HttpResponseParser::~HttpResponseParser() = default;

auto HttpResponseParser::parse(std::string_view data)
    -> std::optional<HttpResponse> {
  if (impl_->failed) {
    return std::nullopt;
  }
  enum llhttp_errno err =
      llhttp_execute(&impl_->parser, data.data(), data.size());

  // Paused by on_message_complete; trailing bytes are ignored since each
  // connection carries a single response.
  if (err != HPE_OK && err != HPE_PAUSED) {
    const char* reason = llhttp_get_error_reason(&impl_->parser);
    log::warn("HTTP response parse error: {} (reason: {})",
              llhttp_errno_name(err), reason ? reason : "");
    impl_->failed = true;
    return std::nullopt;
  }
  return impl_->take();
}

auto HttpResponseParser::finish() -> std::optional<HttpResponse> {
  if (impl_->failed) {
    return std::nullopt;
  }
  if (!impl_->response_complete) {
    enum llhttp_errno err = llhttp_finish(&impl_->parser);
    if (err != HPE_OK && err != HPE_PAUSED) {
      impl_->failed = true;
      return std::nullopt;
    }
  }
  return impl_->take();
}

auto HttpResponseParser::failed() const noexcept -> bool {
  return impl_->failed;
}

auto HttpResponseParser::reset() -> void {
  impl_->current_response = HttpResponse{};
  impl_->response_complete = false;
  impl_->failed = false;
  impl_->current_header_field.clear();
  impl_->current_header_value.clear();
  impl_->in_header_field = false;
  impl_->init();
}

}  // namespace fixloop::http
