#pragma once

#include "api/port_probe.hpp"
#include "api/transport.hpp"
#include "core/endpoint_resolver.hpp"
#include "core/profile_types.hpp"

#include <string>
#include <utility>
#include <vector>

struct AppConfig {
    // Control API
    std::string local_url = "http://127.0.0.1:58888";
    std::string cloud_url = "https://app.octobrowser.net";
    std::string api_token;
    int api_timeout_ms = 30000;
    int api_max_retries = 3;

    // Endpoint resolution
    bool allow_port_scan = false;
    int debug_port = 0;            // 0 = none
    ResolverPolicy resolver;

    // Port probe
    std::string probe_host = "127.0.0.1";
    int probe_connect_timeout_ms = 100;
    int probe_http_timeout_ms = 2000;
    std::vector<std::pair<int, int>> probe_ranges = {{52000, 53200}, {9222, 9350}};

    // New profiles
    std::string profile_os = "android";
    std::string profile_os_version = "13";
    bool headless = false;
    std::vector<std::string> flags;

    // Logging
    std::string log_level = "info";
    std::string log_file;
};

class Config {
public:
    Config();
    ~Config();

    bool load();
    bool save();

    /// OCTO_API_KEY, OCTO_LOCAL_API_URL, OCTO_CLOUD_API_URL.
    void apply_env_overrides();

    AppConfig& data();
    const AppConfig& data() const;

    TransportOptions transport_options() const;
    ProbeOptions probe_options() const;
    /// Resolver policy with the scan list expanded from probe ranges.
    ResolverPolicy resolver_policy() const;
    StartOptions start_options() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};
