#pragma once

#include <string>

enum class CaptureErrorKind { NoTextAvailable };
enum class CaptureWarningKind { ScreenshotUnavailable, UploadUnavailable };
enum class ApiErrorKind { MalformedResponse, TransportFailure, Unauthorized };
enum class StoreErrorKind { NotFound, WriteFailure, Corrupt };

struct CaptureError {
    CaptureErrorKind kind = CaptureErrorKind::NoTextAvailable;
    std::string message;
};

struct ApiError {
    ApiErrorKind kind = ApiErrorKind::TransportFailure;
    std::string message;
};

struct StoreError {
    StoreErrorKind kind = StoreErrorKind::WriteFailure;
    std::string message;
};

std::string to_string(CaptureErrorKind kind);
std::string to_string(CaptureWarningKind kind);
std::string to_string(ApiErrorKind kind);
std::string to_string(StoreErrorKind kind);

// "<kind>: <message>", or just the kind when there is no message.
std::string describe(const ApiError& err);
std::string describe(const StoreError& err);
