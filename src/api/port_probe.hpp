#pragma once

#include "api/resolved_endpoint.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct ProbeOptions {
    std::string host = "127.0.0.1";
    int connect_timeout_ms = 100;
    int http_timeout_ms = 2000;
};

/// Read-only liveness checks against local remote-debugging ports.
class PortProbe {
public:
    explicit PortProbe(ProbeOptions options = {});

    /// TCP connect with a bounded wait.
    bool tcp_connect(int port, int timeout_ms) const;

    /// GET /json/version -> webSocketDebuggerUrl. No TCP pre-check.
    std::optional<std::string> fetch_ws_endpoint(int port) const;

    /// TCP connect followed by /json/version; the websocket address if live.
    std::optional<std::string> live_ws_endpoint(int port, int connect_timeout_ms) const;

    bool is_live_debug_port(int port) const;

    /// Walks `ports` in order and stops at the first live debug endpoint.
    std::optional<ResolvedEndpoint> scan_range(const std::vector<int>& ports,
                                               int per_port_timeout_ms,
                                               const std::string& profile_id,
                                               const std::atomic<bool>* cancel = nullptr) const;

    /// 52000-53200 first, then 9222-9350.
    static std::vector<int> default_candidates();
    static std::vector<int> expand_ranges(const std::vector<std::pair<int, int>>& ranges);

    const ProbeOptions& options() const { return options_; }

    /// Invoked with each port before it is probed during a scan
    std::function<void(int port)> on_probe;

private:
    ProbeOptions options_;
};
