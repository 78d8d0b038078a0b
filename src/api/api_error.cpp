#include "api/api_error.hpp"

#include <algorithm>
#include <cctype>

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "none";
        case ErrorKind::Network:             return "network";
        case ErrorKind::RateLimited:         return "rate-limited";
        case ErrorKind::ClientError:         return "client-error";
        case ErrorKind::ServerError:         return "server-error";
        case ErrorKind::Schema:              return "schema";
        case ErrorKind::NoEndpoint:          return "no-endpoint";
        case ErrorKind::ZombieUnrecoverable: return "zombie-unrecoverable";
        case ErrorKind::Cancelled:           return "cancelled";
    }
    return "unknown";
}

std::string ApiError::text() const {
    if (body_preview.empty()) return message;
    return message + " " + body_preview;
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ApiError::mentions(const std::string& needle) const {
    return lowercase(text()).find(lowercase(needle)) != std::string::npos;
}
