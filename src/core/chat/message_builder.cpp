#include "chat/message_builder.hpp"

namespace wire {

namespace {

bool is_seed(const Message& msg) {
    if (msg.role != Role::User) return false;
    auto* text = msg.text();
    return text && is_seed_content(*text);
}

} // namespace

std::vector<WireMessage> build_messages(const Session& session) {
    std::vector<WireMessage> out;
    out.reserve(session.messages.size());

    for (const auto& msg : session.messages) {
        out.push_back(WireMessage{.role = msg.role, .content = msg.content});
    }

    const auto& url = session.captured.screenshot_url;
    if (url && !url->empty() && !session.messages.empty() && is_seed(session.messages.front())) {
        out.front().content = MultimodalContent{
            ContentPart::make_text(*session.messages.front().text()),
            ContentPart::make_image(*url),
        };
    }

    return out;
}

nlohmann::json to_json(const std::vector<WireMessage>& messages) {
    auto arr = nlohmann::json::array();
    for (const auto& m : messages) {
        arr.push_back({{"role", role_name(m.role)}, {"content", content_to_json(m.content)}});
    }
    return arr;
}

nlohmann::json make_request(const std::string& model, const std::vector<WireMessage>& messages) {
    return {
        {"model", model},
        {"messages", to_json(messages)},
        {"stream", false},
    };
}

std::string serialize_request(const std::string& model, const std::vector<WireMessage>& messages) {
    return make_request(model, messages).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace wire
