#include "session.hpp"

#include <cmath>
#include <cstdio>
#include <format>

using json = nlohmann::json;

ContentPart ContentPart::make_text(std::string text) {
    ContentPart p;
    p.kind = Kind::Text;
    p.text = std::move(text);
    return p;
}

ContentPart ContentPart::make_image(std::string url) {
    ContentPart p;
    p.kind = Kind::Image;
    p.url = std::move(url);
    return p;
}

std::string make_seed_message(const std::string& captured_text) {
    return std::string(kSeedMarker) + " \"" + captured_text + "\"\n\n"
           "I also took a screenshot of my current screen (if available).\n\n"
           "Please help me understand or discuss this content. You can ask me questions "
           "about it, explain it, or help me with any related tasks. I'll be asking you "
           "questions about this content.";
}

bool is_seed_content(std::string_view content) {
    return content.starts_with(kSeedMarker);
}

std::string role_name(Role role) {
    switch (role) {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::System: return "system";
    }
    return "user";
}

std::optional<Role> parse_role(std::string_view name) {
    if (name == "user") return Role::User;
    if (name == "assistant") return Role::Assistant;
    if (name == "system") return Role::System;
    return std::nullopt;
}

std::string format_timestamp(Timestamp ts) {
    return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(ts));
}

std::optional<Timestamp> parse_timestamp(const json& value) {
    using namespace std::chrono;

    if (value.is_number()) {
        auto secs = value.get<double>();
        if (!std::isfinite(secs)) return std::nullopt;
        return Timestamp(duration_cast<system_clock::duration>(duration<double>(secs)));
    }
    if (!value.is_string()) return std::nullopt;

    auto s = value.get<std::string>();
    int y, mo, d, h, mi, sec;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &y, &mo, &d, &h, &mi, &sec, &consumed) != 6) {
        return std::nullopt;
    }

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;

    auto tp = sys_days{ymd} + hours{h} + minutes{mi} + seconds{sec};

    // Skip fractional seconds
    size_t pos = static_cast<size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') ++pos;
    }

    if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        int oh = 0, om = 0;
        if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) return std::nullopt;
        auto offset = hours{oh} + minutes{om};
        tp = s[pos] == '+' ? tp - offset : tp + offset;
    }

    return Timestamp(tp);
}

std::string content_text(const MessageContent& content) {
    if (auto* s = std::get_if<std::string>(&content)) return *s;

    std::string out;
    for (const auto& part : std::get<MultimodalContent>(content)) {
        if (!out.empty()) out += "\n";
        if (part.kind == ContentPart::Kind::Text) {
            out += part.text;
        } else {
            out += "[image: " + part.url + "]";
        }
    }
    return out;
}

json content_to_json(const MessageContent& content) {
    if (auto* s = std::get_if<std::string>(&content)) return *s;

    json parts = json::array();
    for (const auto& part : std::get<MultimodalContent>(content)) {
        if (part.kind == ContentPart::Kind::Text) {
            parts.push_back({{"type", "text"}, {"text", part.text}});
        } else {
            parts.push_back({{"type", "image_url"}, {"image_url", {{"url", part.url}}}});
        }
    }
    return parts;
}

std::expected<MessageContent, std::string> content_from_json(const json& j) {
    if (j.is_string()) return j.get<std::string>();
    if (!j.is_array()) return std::unexpected("content is neither a string nor an array");

    MultimodalContent parts;
    for (const auto& p : j) {
        if (!p.is_object()) return std::unexpected("content part is not an object");
        auto type = p.value("type", "");
        if (type == "text" && p.contains("text") && p["text"].is_string()) {
            parts.push_back(ContentPart::make_text(p["text"].get<std::string>()));
        } else if (type == "image_url" && p.contains("image_url") &&
                   p["image_url"].is_object() && p["image_url"].value("url", "") != "") {
            parts.push_back(ContentPart::make_image(p["image_url"]["url"].get<std::string>()));
        } else {
            return std::unexpected("unsupported content part: " + p.dump());
        }
    }
    return parts;
}

json to_json(const Message& msg) {
    return {
        {"role", role_name(msg.role)},
        {"content", content_to_json(msg.content)},
        {"timestamp", format_timestamp(msg.timestamp)},
    };
}

std::expected<Message, std::string> message_from_json(const json& j) {
    if (!j.is_object()) return std::unexpected("message is not an object");

    auto role = parse_role(j.value("role", ""));
    if (!role) return std::unexpected("unknown role in message: " + j.value("role", ""));

    if (!j.contains("content")) return std::unexpected("message has no content");
    auto content = content_from_json(j["content"]);
    if (!content) return std::unexpected(content.error());

    Message msg;
    msg.role = *role;
    msg.content = std::move(*content);
    if (j.contains("timestamp")) {
        if (auto ts = parse_timestamp(j["timestamp"])) msg.timestamp = *ts;
    }
    return msg;
}

json to_json(const Session& session) {
    json messages = json::array();
    for (const auto& m : session.messages) {
        messages.push_back(to_json(m));
    }

    const auto& cap = session.captured;
    return {
        {"session_id", session.session_id},
        {"timestamp", format_timestamp(session.created_at)},
        {"selected_text", cap.text},
        {"screenshot", cap.screenshot_path.value_or("")},
        {"screenshot_url", cap.screenshot_url.value_or("")},
        {"messages", std::move(messages)},
    };
}

std::expected<Session, std::string> session_from_json(const json& j) {
    if (!j.is_object()) return std::unexpected("record is not an object");

    auto id = j.value("session_id", "");
    if (id.empty()) return std::unexpected("record has no session_id");

    Session session;
    session.session_id = id;
    if (j.contains("timestamp")) {
        if (auto ts = parse_timestamp(j["timestamp"])) session.created_at = *ts;
    }

    try {
        session.captured.text = j.value("selected_text", "");
        auto shot = j.value("screenshot", "");
        auto url = j.value("screenshot_url", "");
        if (!shot.empty()) session.captured.screenshot_path = shot;
        if (!url.empty() && !shot.empty()) session.captured.screenshot_url = url;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("bad capture fields: ") + e.what());
    }

    if (j.contains("messages")) {
        if (!j["messages"].is_array()) return std::unexpected("messages is not an array");
        for (const auto& m : j["messages"]) {
            auto msg = message_from_json(m);
            if (!msg) return std::unexpected(msg.error());
            session.messages.push_back(std::move(*msg));
        }
    }
    return session;
}
