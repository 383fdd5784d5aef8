#include "fixloop/generation/http_generator.hpp"

#include "fixloop/client/http/http_client.hpp"
#include "fixloop/core/constants.hpp"
#include "fixloop/util/log.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <optional>

namespace fixloop {

namespace {

auto system_message(Role role) -> std::string_view {
  switch (role) {
    case Role::Manager: return "You are an expert bug analyzer.";
    case Role::Coder:
      return "You are an expert programmer who writes clean, secure code.";
    case Role::Reviewer:
      return "You are a meticulous code reviewer focused on security and "
             "quality.";
  }
  return "";
}

}  // namespace

auto classify_provider_status(int status) -> Result<void> {
  if (status >= 200 && status < 300) {
    return ok();
  }
  if (status == 429 || status >= 500) {
    return fail(Error::TransientProvider);
  }
  return fail(Error::ProviderFailed);
}

auto parse_chat_completion(std::string_view body) -> Result<Generation> {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return fail(Error::ProviderFailed);
  }
  auto choices = j.find("choices");
  if (choices == j.end() || !choices->is_array() || choices->empty()) {
    return fail(Error::ProviderFailed);
  }
  const auto& message = (*choices)[0].value("message", nlohmann::json::object());
  auto content = message.find("content");
  if (content == message.end() || !content->is_string()) {
    return fail(Error::ProviderFailed);
  }

  Generation gen;
  gen.content = content->get<std::string>();
  if (auto usage = j.find("usage"); usage != j.end() && usage->is_object()) {
    gen.tokens_used = usage->value("total_tokens", std::int64_t{0});
  }
  return ok(std::move(gen));
}

struct HttpGenerator::Impl {
  GenerationConfig config;
  std::optional<http::HttpClient> client;
  std::string api_key;
};

HttpGenerator::HttpGenerator(GenerationConfig config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = std::move(config);
  if (const char* key = std::getenv(impl_->config.api_key_env.c_str())) {
    impl_->api_key = key;
  }
  if (auto url = http::parse_url(impl_->config.base_url)) {
    auto timeout = std::chrono::seconds(impl_->config.timeout_sec);
    impl_->client.emplace(
        http::Endpoint::from_url(*url),
        http::HttpClientConfig{.connect_timeout = std::chrono::seconds(30),
                               .read_timeout = timeout});
  } else {
    log::error("Invalid generation base_url: {}", impl_->config.base_url);
  }
}

HttpGenerator::~HttpGenerator() = default;

auto HttpGenerator::check() const -> Result<void> {
  if (!impl_->client) {
    return fail(Error::ProviderFailed);
  }
  if (impl_->api_key.empty()) {
    log::error("Generation API key not set (env {})", impl_->config.api_key_env);
    return fail(Error::ProviderFailed);
  }
  return ok();
}

auto HttpGenerator::generate(Role role, std::string_view prompt,
                             std::string_view context) -> Result<Generation> {
  if (auto r = check(); !r) {
    return fail(r.error());
  }

  std::string user_content{prompt};
  if (!context.empty()) {
    user_content.append("\n\n").append(context);
  }

  nlohmann::json body = {
      {"model", impl_->config.model},
      {"temperature", impl_->config.temperature},
      {"messages",
       nlohmann::json::array(
           {{{"role", "system"}, {"content", system_message(role)}},
            {{"role", "user"}, {"content", user_content}}})},
  };

  http::HttpHeaders headers;
  headers["Authorization"] = std::format("Bearer {}", impl_->api_key);

  log::debug("Generation request ({}): {}", role_name(role),
             std::string_view(user_content)
                 .substr(0, limits::kPromptLogPreview));

  auto resp = impl_->client->post_json(impl_->config.path, body.dump(),
                                       std::move(headers));
  if (!resp) {
    log::warn("Generation request failed: {}", http::to_string_view(resp.error()));
    switch (resp.error()) {
      case http::HttpError::ConnectFailed:
      case http::HttpError::Timeout:
      case http::HttpError::SendFailed:
      case http::HttpError::RecvFailed:
        return fail(Error::TransientProvider);
      default:
        return fail(Error::ProviderFailed);
    }
  }

  if (auto status = classify_provider_status(resp->status); !status) {
    log::warn("Generation provider returned HTTP {}", resp->status);
    return fail(status.error());
  }
  return parse_chat_completion(resp->body);
}

}  // namespace fixloop
