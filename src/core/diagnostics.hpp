#pragma once

#include "api/port_probe.hpp"
#include "api/transport.hpp"

#include <atomic>
#include <string>
#include <vector>

struct EndpointCheck {
    std::string name;
    std::string url;
    bool reachable = false;
    int status = 0;
    std::string detail;
};

struct DiagnoseReport {
    std::vector<EndpointCheck> local_checks;  // stops at the first reachable path
    EndpointCheck cloud_check;
    std::vector<int> live_ports;
    size_t ports_scanned = 0;
    bool cancelled = false;

    bool local_ok() const;
    bool cloud_ok() const;

    /// 0 both APIs reachable, 1 local only, 2 local unreachable.
    int exit_code() const;
};

/// 52000-52100 and 9222-9232.
std::vector<int> diagnostic_ports();

/// Checks the local and cloud control APIs and lists every live debug port
/// among `ports`.
DiagnoseReport run_diagnostics(const Transport& transport, const PortProbe& probe,
                               const std::vector<int>& ports,
                               const std::atomic<bool>* cancel = nullptr);
