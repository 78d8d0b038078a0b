#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <thread>

/// Serves GET /json/version on 127.0.0.1:<port> like a browser's
/// remote-debugging endpoint.
class DebugEndpointServer {
public:
    explicit DebugEndpointServer(int port) : port_(port) {
        server_.Get("/json/version", [port](const httplib::Request&, httplib::Response& res) {
            nlohmann::json body = {
                {"Browser", "Chrome/120.0"},
                {"webSocketDebuggerUrl",
                 "ws://127.0.0.1:" + std::to_string(port) + "/devtools/browser/test"},
            };
            res.set_content(body.dump(), "application/json");
        });
    }

    ~DebugEndpointServer() { stop(); }

    bool start() {
        if (!server_.bind_to_port("127.0.0.1", port_)) return false;
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        for (int i = 0; i < 100 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return server_.is_running();
    }

    void stop() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    std::string ws_url() const {
        return "ws://127.0.0.1:" + std::to_string(port_) + "/devtools/browser/test";
    }

private:
    int port_;
    httplib::Server server_;
    std::thread thread_;
};
