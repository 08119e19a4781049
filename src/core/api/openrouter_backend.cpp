#include "api/openrouter_backend.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Pulls "error.message" (or a string "error") out of a provider error body.
static std::string provider_error(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.is_object() && j.contains("error")) {
            auto& e = j["error"];
            if (e.is_string()) return e.get<std::string>();
            if (e.is_object() && e.contains("message") && e["message"].is_string()) {
                return e["message"].get<std::string>();
            }
        }
    } catch (const json::exception&) {
    }
    return body.substr(0, 200);
}

OpenRouterBackend::OpenRouterBackend(std::string endpoint, std::string api_key, long timeout_s)
    : endpoint_(std::move(endpoint)), api_key_(std::move(api_key)), timeout_s_(timeout_s) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

OpenRouterBackend::~OpenRouterBackend() {
    curl_global_cleanup();
}

std::expected<std::string, ApiError>
OpenRouterBackend::complete(const std::string& model, const std::vector<WireMessage>& messages) {
    auto payload = wire::serialize_request(model, messages);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(ApiError{.kind = ApiErrorKind::TransportFailure,
                                        .message = "curl_easy_init failed"});
    }

    auto auth = "Authorization: Bearer " + api_key_;
    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, auth.c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json");

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(ApiError{.kind = ApiErrorKind::TransportFailure,
                                        .message = std::string("curl error: ") + curl_easy_strerror(res)});
    }

    return parse_response(status, response_body);
}

std::expected<std::string, ApiError>
OpenRouterBackend::parse_response(long http_status, const std::string& body) {
    if (http_status == 401 || http_status == 403) {
        return std::unexpected(ApiError{.kind = ApiErrorKind::Unauthorized,
                                        .message = provider_error(body)});
    }
    if (http_status < 200 || http_status >= 300) {
        return std::unexpected(ApiError{
            .kind = ApiErrorKind::TransportFailure,
            .message = "HTTP " + std::to_string(http_status) + ": " + provider_error(body)});
    }

    auto malformed = [](std::string msg) {
        return std::unexpected(ApiError{.kind = ApiErrorKind::MalformedResponse,
                                        .message = std::move(msg)});
    };

    try {
        auto j = json::parse(body);
        if (!j.is_object()) return malformed("response is not an object");

        if (j.contains("error")) return malformed("provider error: " + provider_error(body));

        if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
            return malformed("response has no choices");
        }
        auto& first = j["choices"][0];
        if (!first.is_object() || !first.contains("message") || !first["message"].is_object()) {
            return malformed("first choice has no message");
        }
        auto& content = first["message"]["content"];
        if (!content.is_string()) {
            return malformed("message content is missing or not a string");
        }

        auto text = content.get<std::string>();
        if (text.empty()) return malformed("message content is empty");
        return text;
    } catch (const json::exception& e) {
        return malformed(std::string("JSON parse error: ") + e.what());
    }
}
