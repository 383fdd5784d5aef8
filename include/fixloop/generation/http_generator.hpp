#pragma once

#include "fixloop/config/system_config.hpp"
#include "fixloop/generation/generator.hpp"

#include <memory>
#include <string>

namespace fixloop {

// OpenAI-compatible chat completions client.
class HttpGenerator : public IGenerator {
public:
  // The API key is read from the environment variable named in config.
  explicit HttpGenerator(GenerationConfig config);
  ~HttpGenerator() override;

  HttpGenerator(const HttpGenerator&) = delete;
  auto operator=(const HttpGenerator&) -> HttpGenerator& = delete;

  [[nodiscard]] auto generate(Role role, std::string_view prompt,
                              std::string_view context)
      -> Result<Generation> override;

  // ProviderFailed when the base url is unusable or the key is missing.
  [[nodiscard]] auto check() const -> Result<void>;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Maps an HTTP status to the generator error taxonomy; 2xx is success.
[[nodiscard]] auto classify_provider_status(int status) -> Result<void>;

// Extracts {content, tokens_used} from a chat completions response body.
[[nodiscard]] auto parse_chat_completion(std::string_view body)
    -> Result<Generation>;

}  // namespace fixloop
