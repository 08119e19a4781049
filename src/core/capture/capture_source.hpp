#pragma once

#include "capture/cascade.hpp"
#include "errors.hpp"
#include "notice.hpp"
#include "session.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <string>

class CaptureSource {
public:
    using ScreenshotMethod = std::function<bool(const std::string& path)>;
    using ImageUploader = std::function<std::optional<std::string>(const std::string& path)>;

    struct NamedScreenshotMethod {
        std::string name;
        ScreenshotMethod capture;
    };

    struct NamedUploader {
        std::string name;
        ImageUploader upload;
    };

    struct Capabilities {
        Cascade text;                                  // tried in order
        std::vector<NamedScreenshotMethod> screenshot; // tried in order
        std::vector<NamedUploader> upload;             // tried in order
    };

    CaptureSource(Capabilities caps, NoticeCallback notice, bool verbose = false);

    // Text is mandatory; screenshot and upload degrade to unset fields with a
    // warning notice. An empty screenshot_path skips the screenshot cascade.
    std::expected<CapturedContent, CaptureError> resolve(const std::string& screenshot_path);

    std::optional<std::string> resolve_text();
    // Returns path if some method left a non-empty file there.
    std::optional<std::string> resolve_screenshot(const std::string& path);
    std::optional<std::string> resolve_upload(const std::string& path);

    // Non-null, no error marker, starts with a URL scheme.
    static bool is_valid_upload_url(const std::string& url);

private:
    void notice(const std::string& msg, Severity severity);
    void log(const std::string& msg);

    Capabilities caps_;
    NoticeCallback notice_;
    bool verbose_;
};
