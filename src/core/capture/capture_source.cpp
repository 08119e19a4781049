#include "capture/capture_source.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <print>

namespace fs = std::filesystem;

namespace {

bool non_blank(const std::string& s) {
    return std::ranges::any_of(s, [](unsigned char c) { return !std::isspace(c); });
}

bool non_empty_file(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return !ec && size > 0;
}

} // namespace

CaptureSource::CaptureSource(Capabilities caps, NoticeCallback notice, bool verbose)
    : caps_(std::move(caps)), notice_(std::move(notice)), verbose_(verbose) {}

std::expected<CapturedContent, CaptureError>
CaptureSource::resolve(const std::string& screenshot_path) {
    notice("Capturing context...", Severity::Info);

    auto text = resolve_text();
    if (!text) {
        return std::unexpected(CaptureError{
            .kind = CaptureErrorKind::NoTextAvailable,
            .message = "No text selected or clipboard empty. "
                       "Please select some text and try again.",
        });
    }

    CapturedContent content;
    content.text = std::move(*text);

    if (screenshot_path.empty()) return content;

    notice("Taking screenshot...", Severity::Info);
    content.screenshot_path = resolve_screenshot(screenshot_path);
    if (!content.screenshot_path) {
        log(to_string(CaptureWarningKind::ScreenshotUnavailable));
        notice("Could not take screenshot, continuing with text only", Severity::Warning);
        return content;
    }

    notice("Uploading screenshot...", Severity::Info);
    content.screenshot_url = resolve_upload(*content.screenshot_path);
    if (!content.screenshot_url) {
        log(to_string(CaptureWarningKind::UploadUnavailable));
        notice("Could not upload screenshot, continuing with text only", Severity::Warning);
    } else {
        notice("Screenshot uploaded successfully: " + content.screenshot_url->substr(0, 50) + "...",
               Severity::Info);
    }
    return content;
}

std::optional<std::string> CaptureSource::resolve_text() {
    auto found = first_available(
        caps_.text, non_blank,
        [this](const std::string& name, const std::optional<std::string>&) {
            log("text source " + name + " returned nothing");
        });
    if (!found) return std::nullopt;

    log("text captured from " + found->source);
    return std::move(found->value);
}

std::optional<std::string> CaptureSource::resolve_screenshot(const std::string& path) {
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);

    Cascade cascade;
    for (const auto& m : caps_.screenshot) {
        cascade.push_back({m.name, [&m, &path]() -> std::optional<std::string> {
            if (!m.capture || !m.capture(path)) return std::nullopt;
            return path;
        }});
    }

    auto found = first_available(
        cascade, non_empty_file,
        [this](const std::string& name, const std::optional<std::string>&) {
            log("screenshot method " + name + " failed");
        });
    if (!found) return std::nullopt;

    log("screenshot taken with " + found->source);
    return std::move(found->value);
}

std::optional<std::string> CaptureSource::resolve_upload(const std::string& path) {
    if (!non_empty_file(path)) return std::nullopt;

    Cascade cascade;
    for (const auto& u : caps_.upload) {
        cascade.push_back({u.name, [&u, &path]() -> std::optional<std::string> {
            if (!u.upload) return std::nullopt;
            return u.upload(path);
        }});
    }

    auto found = first_available(
        cascade, is_valid_upload_url,
        [this](const std::string& name, const std::optional<std::string>& value) {
            log("upload to " + name + " rejected" + (value ? ": " + *value : ""));
        });
    if (!found) return std::nullopt;

    log("screenshot uploaded to " + found->source);
    return std::move(found->value);
}

bool CaptureSource::is_valid_upload_url(const std::string& url) {
    if (url.empty() || url == "null") return false;

    std::string lower = url;
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower.find("error") != std::string::npos) return false;

    return lower.starts_with("http://") || lower.starts_with("https://");
}

void CaptureSource::notice(const std::string& msg, Severity severity) {
    if (notice_) notice_(msg, severity);
}

void CaptureSource::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[copyq-chat] capture: {}", msg);
    }
}
