#pragma once

#include <chrono>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using Timestamp = std::chrono::system_clock::time_point;

enum class Role { User, Assistant, System };

struct ContentPart {
    enum class Kind { Text, Image };

    Kind kind = Kind::Text;
    std::string text; // Kind::Text
    std::string url;  // Kind::Image

    static ContentPart make_text(std::string text);
    static ContentPart make_image(std::string url);

    bool operator==(const ContentPart&) const = default;
};

using MultimodalContent = std::vector<ContentPart>;
using MessageContent = std::variant<std::string, MultimodalContent>;

struct Message {
    Role role = Role::User;
    MessageContent content;
    Timestamp timestamp;

    // Plain string content, or nullptr for multimodal content.
    const std::string* text() const { return std::get_if<std::string>(&content); }
};

// What the user pointed at when the session started. Immutable after capture.
struct CapturedContent {
    std::string text;
    std::optional<std::string> screenshot_path;
    std::optional<std::string> screenshot_url; // only set together with screenshot_path
};

struct Session {
    std::string session_id;
    Timestamp created_at;
    CapturedContent captured;
    std::vector<Message> messages;
};

// Leading text of every seed message.
inline constexpr std::string_view kSeedMarker = "I have selected the following text:";

std::string make_seed_message(const std::string& captured_text);
bool is_seed_content(std::string_view content);

std::string role_name(Role role);
std::optional<Role> parse_role(std::string_view name);

// ISO-8601 in UTC with second precision, e.g. "2025-09-14T10:22:31Z".
std::string format_timestamp(Timestamp ts);
// Accepts ISO-8601 strings (Z or +HH:MM offset) and numeric epoch seconds.
std::optional<Timestamp> parse_timestamp(const nlohmann::json& value);

// Flattens content for display: text parts joined, images as "[image: URL]".
std::string content_text(const MessageContent& content);

nlohmann::json content_to_json(const MessageContent& content);
std::expected<MessageContent, std::string> content_from_json(const nlohmann::json& j);

nlohmann::json to_json(const Message& msg);
std::expected<Message, std::string> message_from_json(const nlohmann::json& j);

nlohmann::json to_json(const Session& session);
std::expected<Session, std::string> session_from_json(const nlohmann::json& j);
