#include "core/diagnostics.hpp"

#include <spdlog/spdlog.h>

bool DiagnoseReport::local_ok() const {
    for (const auto& check : local_checks) {
        if (check.reachable) return true;
    }
    return false;
}

bool DiagnoseReport::cloud_ok() const {
    return cloud_check.reachable;
}

int DiagnoseReport::exit_code() const {
    if (!local_ok()) return 2;
    if (!cloud_ok()) return 1;
    return 0;
}

std::vector<int> diagnostic_ports() {
    return PortProbe::expand_ranges({{52000, 52100}, {9222, 9232}});
}

// Any HTTP answer proves the API is up; a 4xx usually means a bad token.
static EndpointCheck check_path(const Transport& transport, ApiBase base,
                                const std::string& name, const std::string& path,
                                const std::atomic<bool>* cancel) {
    EndpointCheck check;
    check.name = name;
    check.url = transport.base_url(base) + path;

    auto out = transport.send(HttpMethod::Get, base, path, std::nullopt, true, cancel);
    check.status = out.error.status;
    switch (out.error.kind) {
        case ErrorKind::None:
            check.reachable = true;
            check.status = 200;
            check.detail = out.body.dump().substr(0, 200);
            break;
        case ErrorKind::ClientError:
        case ErrorKind::Schema:
            check.reachable = true;
            check.detail = out.error.message;
            break;
        default:
            check.detail = out.error.message;
            break;
    }
    spdlog::debug("{} {} -> {} ({})", name, check.url,
                  check.reachable ? "reachable" : "unreachable", check.detail);
    return check;
}

DiagnoseReport run_diagnostics(const Transport& transport, const PortProbe& probe,
                               const std::vector<int>& ports,
                               const std::atomic<bool>* cancel) {
    DiagnoseReport report;

    static const std::pair<const char*, const char*> local_paths[] = {
        {"Local API: profiles", "/api/profiles"},
        {"Local API: v2 profiles", "/api/v2/automation/profiles"},
        {"Local API: active profiles", "/api/profiles/active"},
        {"Local API: root", "/"},
    };
    for (const auto& [name, path] : local_paths) {
        if (is_cancelled(cancel)) {
            report.cancelled = true;
            return report;
        }
        report.local_checks.push_back(check_path(transport, ApiBase::Local, name, path, cancel));
        if (report.local_checks.back().reachable) break;
    }

    if (is_cancelled(cancel)) {
        report.cancelled = true;
        return report;
    }
    report.cloud_check = check_path(transport, ApiBase::Cloud, "Cloud API: v2 profiles",
                                    "/api/v2/automation/profiles", cancel);

    for (int port : ports) {
        if (is_cancelled(cancel)) {
            report.cancelled = true;
            break;
        }
        report.ports_scanned++;
        if (probe.is_live_debug_port(port)) {
            spdlog::info("Live debug port {}", port);
            report.live_ports.push_back(port);
        }
    }
    return report;
}
