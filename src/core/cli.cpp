#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/diagnostics.hpp"
#include "core/logging.hpp"
#include "core/profile_lifecycle.hpp"
#include "ui/diagnose_view.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

namespace {

Config load_config() {
    Config config;
    config.load();
    config.apply_env_overrides();
    init_logging(config.data().log_level, config.data().log_file);
    return config;
}

// Everything a lifecycle command needs, wired from one config.
struct Services {
    Config config;
    Transport transport;
    PortProbe probe;
    ProfileLifecycle lifecycle;

    explicit Services(Config cfg)
        : config(std::move(cfg)),
          transport(config.transport_options()),
          probe(config.probe_options()),
          lifecycle(transport, probe, EndpointCatalog::defaults(), config.resolver_policy()) {}
};

void print_error(const ApiError& err) {
    std::cerr << "Error (" << to_string(err.kind) << "): " << err.message << "\n";
    if (!err.body_preview.empty()) {
        std::cerr << "  " << err.body_preview << "\n";
    }
}

} // namespace

bool CLI::parse_int(const char* text, int& out) {
    if (!text || !*text) return false;
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || value < INT_MIN || value > INT_MAX) return false;
    out = static_cast<int>(value);
    return true;
}

int CLI::usage(const std::string& message) {
    std::cerr << message << "\n";
    std::cerr << "Run 'octoscan-cpp help' for usage.\n";
    return 2;
}

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[], const std::atomic<bool>* cancel) {
    if (argc < 2) {
        cmd_help();
        return 2;
    }

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "diagnose") == 0) {
        return cmd_diagnose(cancel);
    }
    if (std::strcmp(cmd, "start") == 0) {
        return cmd_start(argc, argv, cancel);
    }
    if (std::strcmp(cmd, "stop") == 0) {
        return cmd_stop(argc, argv, false, cancel);
    }
    if (std::strcmp(cmd, "force-stop") == 0) {
        return cmd_stop(argc, argv, true, cancel);
    }
    if (std::strcmp(cmd, "stop-all") == 0) {
        return cmd_stop_all(cancel);
    }
    if (std::strcmp(cmd, "create") == 0) {
        return cmd_create(argc, argv, cancel);
    }
    if (std::strcmp(cmd, "delete") == 0) {
        return cmd_delete(argc, argv);
    }
    if (std::strcmp(cmd, "proxy-create") == 0) {
        return cmd_proxy_create(argc, argv);
    }

    return usage(std::string("Unknown command: ") + cmd);
}

// ── help / version ──────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "octoscan-cpp - Octo Browser profile control and debug endpoint resolution\n"
        "\n"
        "Usage:\n"
        "  octoscan-cpp diagnose                 Check local/cloud API and debug ports\n"
        "  octoscan-cpp start <uuid> [options]   Start a profile, print its debug endpoint\n"
        "      --headless                        Start without a window\n"
        "      --allow-port-scan                 Scan local ports if the API reports none\n"
        "      --debug-port N                    Use and verify a known debug port\n"
        "  octoscan-cpp stop <uuid>              Stop a profile (best effort)\n"
        "  octoscan-cpp force-stop <uuid>        Force-stop a profile with retries\n"
        "  octoscan-cpp stop-all                 Force-stop every running profile\n"
        "  octoscan-cpp create <title> [options] Create a profile, print its uuid\n"
        "      --os OS                           android (default), ios, win, mac\n"
        "      --os-version V                    Fingerprint OS version\n"
        "      --ua UA                           User agent\n"
        "  octoscan-cpp delete <uuid>...         Delete profiles (cloud API)\n"
        "  octoscan-cpp proxy-create <host> <port> [--login L] [--password P] [--type T]\n"
        "  octoscan-cpp version                  Show version\n"
        "  octoscan-cpp help                     Show this help\n"
        "\n"
        "Configuration: ~/.config/octoscan-cpp/config.yaml\n"
        "Environment:   OCTO_API_KEY, OCTO_LOCAL_API_URL, OCTO_CLOUD_API_URL\n";
    return 0;
}

int CLI::cmd_version() {
    std::cout << "octoscan-cpp " << APP_VERSION << "\n";
    return 0;
}

// ── diagnose ────────────────────────────────────────────────

int CLI::cmd_diagnose(const std::atomic<bool>* cancel) {
    Config config = load_config();

    // One try per path; diagnose reports state rather than waiting it out.
    TransportOptions opts = config.transport_options();
    opts.max_retries = 0;
    opts.timeout_ms = 10000;
    Transport transport(opts);

    ProbeOptions probe_opts = config.probe_options();
    probe_opts.http_timeout_ms = 500;
    PortProbe probe(probe_opts);

    std::cout << "Checking " << opts.local_url << " and " << opts.cloud_url << " ...\n";
    DiagnoseReport report = run_diagnostics(transport, probe, diagnostic_ports(), cancel);
    std::cout << DiagnoseView(report).to_string() << "\n";
    return report.exit_code();
}

// ── start ───────────────────────────────────────────────────

int CLI::cmd_start(int argc, char* argv[], const std::atomic<bool>* cancel) {
    if (argc < 3) return usage("Usage: octoscan-cpp start <uuid> [--headless] [--allow-port-scan] [--debug-port N]");

    std::string uuid = argv[2];
    bool headless = false;
    bool allow_scan = false;
    int debug_port = 0;
    for (int i = 3; i < argc; ++i) {
        if (std::strcmp(argv[i], "--headless") == 0) {
            headless = true;
        } else if (std::strcmp(argv[i], "--allow-port-scan") == 0) {
            allow_scan = true;
        } else if (std::strcmp(argv[i], "--debug-port") == 0) {
            if (i + 1 >= argc || !parse_int(argv[i + 1], debug_port) ||
                !ResolvedEndpoint::valid_port(debug_port)) {
                return usage("--debug-port needs a port in 1..65535");
            }
            ++i;
        } else {
            return usage(std::string("Unknown option for start: ") + argv[i]);
        }
    }

    Services services(load_config());
    StartOptions options = services.config.start_options();
    if (headless) options.headless = true;
    if (allow_scan) options.allow_port_scan = true;
    if (debug_port > 0) options.debug_port = debug_port;

    ResolveResult result = services.lifecycle.start(uuid, options, cancel);
    if (!result.ok()) {
        print_error(result.error);
        if (result.is_operator_actionable()) {
            std::cerr << "Hint: rerun with --allow-port-scan or --debug-port N\n";
        }
        std::cerr << "Tried: " << result.attempt.tried.size() << " strategies, "
                  << result.attempt.start_attempts << " start calls, waited "
                  << result.attempt.waited.count() / 1000 << "s\n";
        return 1;
    }

    const ResolvedEndpoint& ep = *result.endpoint;
    std::cout << "uuid=" << ep.profile_id() << "\n";
    std::cout << "port=" << ep.port() << "\n";
    if (ep.ws_endpoint()) std::cout << "ws=" << *ep.ws_endpoint() << "\n";
    return 0;
}

// ── stop / force-stop / stop-all ────────────────────────────

int CLI::cmd_stop(int argc, char* argv[], bool force, const std::atomic<bool>* cancel) {
    if (argc < 3) return usage(force ? "Usage: octoscan-cpp force-stop <uuid>"
                                     : "Usage: octoscan-cpp stop <uuid>");
    std::string uuid = argv[2];

    Services services(load_config());
    if (!force) {
        services.lifecycle.stop(uuid);
        return 0;
    }

    const ResolverPolicy& policy = services.lifecycle.policy();
    bool ok = services.lifecycle.force_stop(uuid, policy.force_stop_retries,
                                            std::chrono::milliseconds(policy.force_stop_wait_ms),
                                            cancel);
    if (!ok) {
        std::cerr << "Force-stop of " << uuid << " failed\n";
        return 1;
    }
    std::cout << "Stopped " << uuid << "\n";
    return 0;
}

int CLI::cmd_stop_all(const std::atomic<bool>* cancel) {
    Services services(load_config());
    auto result = services.lifecycle.stop_all(cancel);
    std::cout << "Stopped: " << result.stopped << ", failed: " << result.failed << "\n";
    return result.failed == 0 ? 0 : 1;
}

// ── create / delete / proxy-create ──────────────────────────

int CLI::cmd_create(int argc, char* argv[], const std::atomic<bool>* cancel) {
    if (argc < 3) return usage("Usage: octoscan-cpp create <title> [--os OS] [--os-version V] [--ua UA]");

    ProfileSpec spec;
    spec.title = argv[2];
    std::string os, os_version, ua;
    bool have_os = false, have_version = false;
    for (int i = 3; i < argc; ++i) {
        bool has_value = i + 1 < argc;
        if (std::strcmp(argv[i], "--os") == 0 && has_value) {
            os = argv[++i];
            have_os = true;
        } else if (std::strcmp(argv[i], "--os-version") == 0 && has_value) {
            os_version = argv[++i];
            have_version = true;
        } else if (std::strcmp(argv[i], "--ua") == 0 && has_value) {
            ua = argv[++i];
        } else {
            return usage(std::string("Bad option for create: ") + argv[i]);
        }
    }

    Services services(load_config());
    spec.os_name = have_os ? os : services.config.data().profile_os;
    spec.os_version = have_version ? os_version : services.config.data().profile_os_version;
    spec.user_agent = ua;

    CreateResult result = services.lifecycle.create(spec, cancel);
    if (!result.success) {
        print_error(result.error);
        return 1;
    }
    std::cout << result.uuid << "\n";
    return 0;
}

int CLI::cmd_delete(int argc, char* argv[]) {
    if (argc < 3) return usage("Usage: octoscan-cpp delete <uuid>...");

    std::vector<ProfileHandle> uuids(argv + 2, argv + argc);
    Services services(load_config());
    if (!services.lifecycle.delete_profiles(uuids)) {
        std::cerr << "Delete failed\n";
        return 1;
    }
    std::cout << "Deleted " << uuids.size() << " profiles\n";
    return 0;
}

int CLI::cmd_proxy_create(int argc, char* argv[]) {
    const char* usage_line =
        "Usage: octoscan-cpp proxy-create <host> <port> [--login L] [--password P] [--type T]";
    if (argc < 4) return usage(usage_line);

    ProxySpec spec;
    spec.host = argv[2];
    if (!parse_int(argv[3], spec.port) || !ResolvedEndpoint::valid_port(spec.port)) {
        return usage(usage_line);
    }
    for (int i = 4; i < argc; ++i) {
        bool has_value = i + 1 < argc;
        if (std::strcmp(argv[i], "--login") == 0 && has_value) {
            spec.login = argv[++i];
        } else if (std::strcmp(argv[i], "--password") == 0 && has_value) {
            spec.password = argv[++i];
        } else if (std::strcmp(argv[i], "--type") == 0 && has_value) {
            spec.type = argv[++i];
        } else {
            return usage(std::string("Bad option for proxy-create: ") + argv[i]);
        }
    }

    Services services(load_config());
    CreateResult result = services.lifecycle.create_proxy(spec);
    if (!result.success) {
        print_error(result.error);
        return 1;
    }
    std::cout << result.uuid << "\n";
    return 0;
}
