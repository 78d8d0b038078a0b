#pragma once

#include "api/api_error.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using ProfileHandle = std::string;

struct ProfileSpec {
    std::string title;
    std::string os_name = "android";      // "android", "ios", "win", "mac"
    std::string os_version = "13";        // empty = let the service choose
    std::string user_agent;
    std::vector<std::string> tags;
    nlohmann::json overrides = nlohmann::json::object();  // deep-merged last
};

struct StartOptions {
    bool headless = false;
    std::vector<std::string> flags;
    bool allow_port_scan = false;
    std::optional<int> debug_port;        // operator-supplied port
};

struct ProxySpec {
    std::string host;
    int port = 0;
    std::string login;
    std::string password;
    std::string type = "http";
};

struct CreateResult {
    bool success = false;
    ProfileHandle uuid;
    ApiError error;
};
