#pragma once

#include <optional>
#include <string>

/// A confirmed remote-debugging endpoint of a running profile.
/// Only constructible with a port in 1..65535.
class ResolvedEndpoint {
public:
    /// Throws std::invalid_argument on an out-of-range port.
    ResolvedEndpoint(std::string profile_id, int port,
                     std::optional<std::string> ws_endpoint = std::nullopt);

    const std::string& profile_id() const { return profile_id_; }
    int port() const { return port_; }
    const std::optional<std::string>& ws_endpoint() const { return ws_endpoint_; }

    static bool valid_port(long long port) { return port > 0 && port <= 65535; }

private:
    std::string profile_id_;
    int port_;
    std::optional<std::string> ws_endpoint_;
};
