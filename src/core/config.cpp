#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/octoscan-cpp";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/octoscan-cpp";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

bool Config::load() {
    std::string path = config_path();
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);

        if (auto api = root["api"]) {
            config_.local_url = api["local_url"].as<std::string>(config_.local_url);
            config_.cloud_url = api["cloud_url"].as<std::string>(config_.cloud_url);
            config_.api_token = api["token"].as<std::string>(config_.api_token);
            config_.api_timeout_ms = api["timeout_ms"].as<int>(config_.api_timeout_ms);
            config_.api_max_retries = api["max_retries"].as<int>(config_.api_max_retries);
        }

        if (auto res = root["resolver"]) {
            ResolverPolicy& p = config_.resolver;
            config_.allow_port_scan = res["allow_port_scan"].as<bool>(config_.allow_port_scan);
            config_.debug_port = res["debug_port"].as<int>(config_.debug_port);
            p.server_timeout_sec = res["server_timeout_sec"].as<int>(p.server_timeout_sec);
            p.poll_attempts = res["poll_attempts"].as<int>(p.poll_attempts);
            p.poll_step_ms = res["poll_step_ms"].as<int>(p.poll_step_ms);
            p.zombie_rounds = res["zombie_rounds"].as<int>(p.zombie_rounds);
            p.settle_base_ms = res["settle_base_ms"].as<int>(p.settle_base_ms);
            p.settle_step_ms = res["settle_step_ms"].as<int>(p.settle_step_ms);
            p.force_stop_retries = res["force_stop_retries"].as<int>(p.force_stop_retries);
            p.force_stop_wait_ms = res["force_stop_wait_ms"].as<int>(p.force_stop_wait_ms);
            p.not_found_retries = res["not_found_retries"].as<int>(p.not_found_retries);
            p.not_found_wait_ms = res["not_found_wait_ms"].as<int>(p.not_found_wait_ms);
        }

        if (auto probe = root["probe"]) {
            config_.probe_host = probe["host"].as<std::string>(config_.probe_host);
            config_.probe_connect_timeout_ms =
                probe["connect_timeout_ms"].as<int>(config_.probe_connect_timeout_ms);
            config_.probe_http_timeout_ms =
                probe["http_timeout_ms"].as<int>(config_.probe_http_timeout_ms);
            if (auto ranges = probe["ranges"]) {
                config_.probe_ranges.clear();
                for (const auto& range : ranges) {
                    if (!range.IsSequence() || range.size() != 2) continue;
                    config_.probe_ranges.emplace_back(range[0].as<int>(), range[1].as<int>());
                }
            }
        }

        if (auto profile = root["profile"]) {
            config_.profile_os = profile["os"].as<std::string>(config_.profile_os);
            config_.profile_os_version =
                profile["os_version"].as<std::string>(config_.profile_os_version);
            config_.headless = profile["headless"].as<bool>(config_.headless);
            if (auto flags = profile["flags"]) {
                config_.flags.clear();
                for (const auto& flag : flags) {
                    config_.flags.push_back(flag.as<std::string>());
                }
            }
        }

        if (auto logging = root["logging"]) {
            config_.log_level = logging["level"].as<std::string>(config_.log_level);
            config_.log_file = logging["file"].as<std::string>(config_.log_file);
        }

        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Could not parse {}: {}", path, e.what());
        return false;
    }
}

bool Config::save() {
    std::string dir = config_dir();
    std::string path = config_path();
    if (dir.empty() || path.empty()) return false;

    try {
        fs::create_directories(dir);

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "api" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "local_url" << YAML::Value << config_.local_url;
        out << YAML::Key << "cloud_url" << YAML::Value << config_.cloud_url;
        out << YAML::Key << "token" << YAML::Value << config_.api_token;
        out << YAML::Key << "timeout_ms" << YAML::Value << config_.api_timeout_ms;
        out << YAML::Key << "max_retries" << YAML::Value << config_.api_max_retries;
        out << YAML::EndMap;

        const ResolverPolicy& p = config_.resolver;
        out << YAML::Key << "resolver" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "allow_port_scan" << YAML::Value << config_.allow_port_scan;
        out << YAML::Key << "debug_port" << YAML::Value << config_.debug_port;
        out << YAML::Key << "server_timeout_sec" << YAML::Value << p.server_timeout_sec;
        out << YAML::Key << "poll_attempts" << YAML::Value << p.poll_attempts;
        out << YAML::Key << "poll_step_ms" << YAML::Value << p.poll_step_ms;
        out << YAML::Key << "zombie_rounds" << YAML::Value << p.zombie_rounds;
        out << YAML::Key << "settle_base_ms" << YAML::Value << p.settle_base_ms;
        out << YAML::Key << "settle_step_ms" << YAML::Value << p.settle_step_ms;
        out << YAML::Key << "force_stop_retries" << YAML::Value << p.force_stop_retries;
        out << YAML::Key << "force_stop_wait_ms" << YAML::Value << p.force_stop_wait_ms;
        out << YAML::Key << "not_found_retries" << YAML::Value << p.not_found_retries;
        out << YAML::Key << "not_found_wait_ms" << YAML::Value << p.not_found_wait_ms;
        out << YAML::EndMap;

        out << YAML::Key << "probe" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "host" << YAML::Value << config_.probe_host;
        out << YAML::Key << "connect_timeout_ms" << YAML::Value << config_.probe_connect_timeout_ms;
        out << YAML::Key << "http_timeout_ms" << YAML::Value << config_.probe_http_timeout_ms;
        out << YAML::Key << "ranges" << YAML::Value << YAML::BeginSeq;
        for (const auto& [lo, hi] : config_.probe_ranges) {
            out << YAML::Flow << YAML::BeginSeq << lo << hi << YAML::EndSeq;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;

        out << YAML::Key << "profile" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "os" << YAML::Value << config_.profile_os;
        out << YAML::Key << "os_version" << YAML::Value << config_.profile_os_version;
        out << YAML::Key << "headless" << YAML::Value << config_.headless;
        out << YAML::Key << "flags" << YAML::Value << YAML::BeginSeq;
        for (const auto& flag : config_.flags) out << flag;
        out << YAML::EndSeq;
        out << YAML::EndMap;

        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config_.log_level;
        out << YAML::Key << "file" << YAML::Value << config_.log_file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << out.c_str();
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Could not write {}: {}", path, e.what());
        return false;
    }
}

void Config::apply_env_overrides() {
    if (const char* key = std::getenv("OCTO_API_KEY")) config_.api_token = key;
    if (const char* url = std::getenv("OCTO_LOCAL_API_URL")) config_.local_url = url;
    if (const char* url = std::getenv("OCTO_CLOUD_API_URL")) config_.cloud_url = url;
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }

TransportOptions Config::transport_options() const {
    TransportOptions opts;
    opts.local_url = config_.local_url;
    opts.cloud_url = config_.cloud_url;
    opts.api_token = config_.api_token;
    opts.timeout_ms = config_.api_timeout_ms;
    opts.max_retries = config_.api_max_retries;
    return opts;
}

ProbeOptions Config::probe_options() const {
    ProbeOptions opts;
    opts.host = config_.probe_host;
    opts.connect_timeout_ms = config_.probe_connect_timeout_ms;
    opts.http_timeout_ms = config_.probe_http_timeout_ms;
    return opts;
}

ResolverPolicy Config::resolver_policy() const {
    ResolverPolicy policy = config_.resolver;
    policy.scan_port_timeout_ms = config_.probe_connect_timeout_ms;
    policy.scan_ports = PortProbe::expand_ranges(config_.probe_ranges);
    return policy;
}

StartOptions Config::start_options() const {
    StartOptions opts;
    opts.headless = config_.headless;
    opts.flags = config_.flags;
    opts.allow_port_scan = config_.allow_port_scan;
    if (config_.debug_port > 0) opts.debug_port = config_.debug_port;
    return opts;
}
