#include "api/port_probe.hpp"
#include "api/backoff.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using json = nlohmann::json;

PortProbe::PortProbe(ProbeOptions options) : options_(std::move(options)) {}

bool PortProbe::tcp_connect(int port, int timeout_ms) const {
    if (!ResolvedEndpoint::valid_port(port)) return false;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* addrs = nullptr;
    std::string service = std::to_string(port);
    if (getaddrinfo(options_.host.c_str(), service.c_str(), &hints, &addrs) != 0 || !addrs) {
        return false;
    }

    int fd = socket(addrs->ai_family, addrs->ai_socktype, addrs->ai_protocol);
    if (fd < 0) {
        freeaddrinfo(addrs);
        return false;
    }

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    bool connected = false;
    int rc = connect(fd, addrs->ai_addr, addrs->ai_addrlen);
    if (rc == 0) {
        connected = true;
    } else if (errno == EINPROGRESS) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        if (poll(&pfd, 1, timeout_ms) > 0) {
            int err = 0;
            socklen_t len = sizeof(err);
            connected = getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0;
        }
    }

    close(fd);
    freeaddrinfo(addrs);
    return connected;
}

std::optional<std::string> PortProbe::fetch_ws_endpoint(int port) const {
    if (!ResolvedEndpoint::valid_port(port)) return std::nullopt;
    try {
        httplib::Client cli(options_.host, port);
        time_t sec = options_.http_timeout_ms / 1000;
        time_t usec = (options_.http_timeout_ms % 1000) * 1000;
        cli.set_connection_timeout(sec, usec);
        cli.set_read_timeout(sec, usec);

        auto res = cli.Get("/json/version");
        if (!res || res->status != 200) return std::nullopt;

        auto j = json::parse(res->body, nullptr, false);
        if (!j.is_object()) return std::nullopt;
        auto ws = j.find("webSocketDebuggerUrl");
        if (ws == j.end() || !ws->is_string()) return std::nullopt;
        std::string url = ws->get<std::string>();
        if (url.empty()) return std::nullopt;
        return url;
    } catch (const std::exception& e) {
        spdlog::debug("Could not fetch /json/version on port {}: {}", port, e.what());
        return std::nullopt;
    }
}

std::optional<std::string> PortProbe::live_ws_endpoint(int port, int connect_timeout_ms) const {
    if (!tcp_connect(port, connect_timeout_ms)) return std::nullopt;
    return fetch_ws_endpoint(port);
}

bool PortProbe::is_live_debug_port(int port) const {
    return live_ws_endpoint(port, options_.connect_timeout_ms).has_value();
}

std::optional<ResolvedEndpoint> PortProbe::scan_range(const std::vector<int>& ports,
                                                      int per_port_timeout_ms,
                                                      const std::string& profile_id,
                                                      const std::atomic<bool>* cancel) const {
    if (!ports.empty()) {
        spdlog::info("Scanning {} candidate ports for a debug endpoint ({}..{})",
                     ports.size(), ports.front(), ports.back());
    }
    for (int port : ports) {
        if (is_cancelled(cancel)) return std::nullopt;
        if (on_probe) on_probe(port);

        auto ws = live_ws_endpoint(port, per_port_timeout_ms);
        if (ws) {
            spdlog::info("Found debug endpoint on port {}", port);
            return ResolvedEndpoint(profile_id, port, ws);
        }
    }
    return std::nullopt;
}

std::vector<int> PortProbe::expand_ranges(const std::vector<std::pair<int, int>>& ranges) {
    std::vector<int> ports;
    for (const auto& [lo, hi] : ranges) {
        for (int p = lo; p <= hi; ++p) {
            if (ResolvedEndpoint::valid_port(p)) ports.push_back(p);
        }
    }
    return ports;
}

std::vector<int> PortProbe::default_candidates() {
    // Octo hands out 52xxx ports; 92xx is the Chrome convention.
    return expand_ranges({{52000, 53200}, {9222, 9350}});
}
