#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

struct ImageHost {
    std::string name;
    std::string endpoint;
    // Pulls the public URL out of the response body, nullopt if there is none.
    std::optional<std::string> (*extract)(const std::string& body);
};

// 0x0.st, file.io, tmpfiles.org, in that order.
std::vector<ImageHost> default_image_hosts();

std::optional<std::string> extract_plain_url(const std::string& body);
std::optional<std::string> extract_fileio_link(const std::string& body);
std::optional<std::string> extract_tmpfiles_url(const std::string& body);

// Multipart POST of a local file (form field "file") to temporary image hosts.
class ImageHostUploader {
public:
    explicit ImageHostUploader(long timeout_s = 10);
    ~ImageHostUploader();

    ImageHostUploader(const ImageHostUploader&) = delete;
    ImageHostUploader& operator=(const ImageHostUploader&) = delete;

    std::expected<std::string, std::string> upload(const ImageHost& host,
                                                   const std::string& path) const;

private:
    long timeout_s_;
};
