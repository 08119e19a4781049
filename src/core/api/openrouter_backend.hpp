#pragma once

#include "api/completion_backend.hpp"

#include <string>

// OpenAI-compatible chat completions endpoint (OpenRouter by default).
class OpenRouterBackend : public CompletionBackend {
public:
    OpenRouterBackend(std::string endpoint, std::string api_key, long timeout_s = 30);
    ~OpenRouterBackend() override;

    std::expected<std::string, ApiError>
        complete(const std::string& model, const std::vector<WireMessage>& messages) override;

    // Maps an HTTP status and body to the assistant content or an ApiError.
    static std::expected<std::string, ApiError> parse_response(long http_status,
                                                               const std::string& body);

private:
    std::string endpoint_;
    std::string api_key_;
    long timeout_s_;
};
