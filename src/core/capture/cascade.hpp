#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

// One way of obtaining a value. An empty optional means "absent, try the next one".
struct Capability {
    std::string name;
    std::function<std::optional<std::string>()> attempt;
};

using Cascade = std::vector<Capability>;

struct CascadeResult {
    std::string value;
    std::string source; // name of the capability that produced value
};

// Tries each capability in order and returns the first value that accept()
// approves. Later capabilities are never invoked once one succeeds.
template <typename Accept, typename OnReject>
std::optional<CascadeResult> first_available(const Cascade& cascade, Accept&& accept,
                                             OnReject&& on_reject) {
    for (const auto& cap : cascade) {
        auto value = cap.attempt ? cap.attempt() : std::nullopt;
        if (value && accept(*value)) {
            return CascadeResult{std::move(*value), cap.name};
        }
        on_reject(cap.name, value);
    }
    return std::nullopt;
}
