#pragma once

#include <optional>
#include <string>

enum class ErrorKind {
    None,
    Network,             // connect/reset/timeout
    RateLimited,         // HTTP 429 after the retry budget
    ClientError,         // other 4xx
    ServerError,         // 5xx
    Schema,              // body is not the expected JSON shape
    NoEndpoint,          // polling/probing exhausted
    ZombieUnrecoverable, // force-stop/restart rounds exhausted
    Cancelled,
};

const char* to_string(ErrorKind kind);

struct ApiError {
    ErrorKind kind = ErrorKind::None;
    int status = 0;
    std::string message;
    std::string body_preview;
    std::optional<double> retry_after_sec;

    /// Message and body preview joined, for signature matching.
    std::string text() const;

    /// Case-insensitive substring search over text().
    bool mentions(const std::string& needle) const;
};
