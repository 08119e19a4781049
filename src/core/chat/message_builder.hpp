#pragma once

#include "session.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct WireMessage {
    Role role = Role::User;
    MessageContent content;
};

namespace wire {

// Projects stored history into completion API messages. When the session has
// a screenshot URL, the seed message (the first stored message, if it is a
// user message carrying the seed text) becomes [text part, image part]. The
// stored session is never modified.
std::vector<WireMessage> build_messages(const Session& session);

nlohmann::json to_json(const std::vector<WireMessage>& messages);

// {"model": ..., "messages": [...], "stream": false}
nlohmann::json make_request(const std::string& model, const std::vector<WireMessage>& messages);

// make_request() as a JSON string. Invalid UTF-8 in any text becomes U+FFFD.
std::string serialize_request(const std::string& model, const std::vector<WireMessage>& messages);

} // namespace wire
