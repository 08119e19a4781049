#pragma once

#include "chat/message_builder.hpp"
#include "errors.hpp"

#include <expected>
#include <string>
#include <vector>

class CompletionBackend {
public:
    virtual ~CompletionBackend() = default;

    // One blocking, non-streaming completion. Returns the assistant's text.
    virtual std::expected<std::string, ApiError>
        complete(const std::string& model, const std::vector<WireMessage>& messages) = 0;
};
