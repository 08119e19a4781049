#include "errors.hpp"

std::string to_string(CaptureErrorKind kind) {
    switch (kind) {
        case CaptureErrorKind::NoTextAvailable: return "no text available";
    }
    return "unknown capture error";
}

std::string to_string(CaptureWarningKind kind) {
    switch (kind) {
        case CaptureWarningKind::ScreenshotUnavailable: return "screenshot unavailable";
        case CaptureWarningKind::UploadUnavailable: return "upload unavailable";
    }
    return "unknown capture warning";
}

std::string to_string(ApiErrorKind kind) {
    switch (kind) {
        case ApiErrorKind::MalformedResponse: return "malformed response";
        case ApiErrorKind::TransportFailure: return "transport failure";
        case ApiErrorKind::Unauthorized: return "unauthorized";
    }
    return "unknown api error";
}

std::string to_string(StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::NotFound: return "not found";
        case StoreErrorKind::WriteFailure: return "write failure";
        case StoreErrorKind::Corrupt: return "corrupt record";
    }
    return "unknown store error";
}

std::string describe(const ApiError& err) {
    if (err.message.empty()) return to_string(err.kind);
    return to_string(err.kind) + ": " + err.message;
}

std::string describe(const StoreError& err) {
    if (err.message.empty()) return to_string(err.kind);
    return to_string(err.kind) + ": " + err.message;
}
