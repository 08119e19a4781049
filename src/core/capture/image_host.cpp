#include "capture/image_host.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::vector<ImageHost> default_image_hosts() {
    return {
        {"0x0.st", "https://0x0.st", extract_plain_url},
        {"file.io", "https://file.io", extract_fileio_link},
        {"tmpfiles.org", "https://tmpfiles.org/api/v1/upload", extract_tmpfiles_url},
    };
}

std::optional<std::string> extract_plain_url(const std::string& body) {
    auto url = trim(body);
    if (url.empty()) return std::nullopt;
    return url;
}

std::optional<std::string> extract_fileio_link(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object() || !j.contains("link") || !j["link"].is_string()) return std::nullopt;
        auto link = j["link"].get<std::string>();
        if (link.empty()) return std::nullopt;
        return link;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::optional<std::string> extract_tmpfiles_url(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object() || !j.contains("data") || !j["data"].is_object()) return std::nullopt;
        auto& data = j["data"];
        if (!data.contains("url") || !data["url"].is_string()) return std::nullopt;

        auto url = data["url"].get<std::string>();
        if (url.empty()) return std::nullopt;
        if (url.starts_with("http://")) {
            url.replace(0, 7, "https://");
        }
        return url;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

ImageHostUploader::ImageHostUploader(long timeout_s)
    : timeout_s_(timeout_s) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

ImageHostUploader::~ImageHostUploader() {
    curl_global_cleanup();
}

std::expected<std::string, std::string>
ImageHostUploader::upload(const ImageHost& host, const std::string& path) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    if (curl_mime_filedata(part, path.c_str()) != CURLE_OK) {
        curl_mime_free(mime);
        curl_easy_cleanup(curl);
        return std::unexpected("cannot read " + path);
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, host.endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "copyq-chat/0.1");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (status < 200 || status >= 300) {
        return std::unexpected(host.name + " returned HTTP " + std::to_string(status));
    }

    auto url = host.extract(response_body);
    if (!url) {
        return std::unexpected("no URL in " + host.name + " response: " + trim(response_body));
    }
    return *url;
}
