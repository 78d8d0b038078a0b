#pragma once

#include "api/api_error.hpp"
#include "api/backoff.hpp"
#include "api/port_probe.hpp"
#include "api/resolved_endpoint.hpp"
#include "api/shape_resolver.hpp"
#include "api/transport.hpp"
#include "core/endpoint_catalog.hpp"
#include "core/profile_types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/// Timing and attempt budgets of one resolution.
struct ResolverPolicy {
    int server_timeout_sec = 120;  // `timeout` sent with the start call
    int poll_attempts = 5;
    int poll_step_ms = 2000;       // round n waits n * step
    int zombie_rounds = 3;         // outer start attempts
    int settle_base_ms = 12000;
    int settle_step_ms = 3000;
    int force_stop_retries = 3;
    int force_stop_wait_ms = 3000;
    int not_found_retries = 5;
    int not_found_wait_ms = 2000;
    int scan_port_timeout_ms = 100;
    std::vector<int> scan_ports;   // empty = PortProbe::default_candidates()
};

struct ResolutionAttempt {
    int start_attempts = 0;
    int zombie_rounds = 0;
    int poll_rounds = 0;
    std::chrono::milliseconds waited{0};
    ApiError last_error;
    std::vector<std::string> tried;  // strategy names, in order
};

struct ResolveResult {
    std::optional<ResolvedEndpoint> endpoint;
    ApiError error;
    ResolutionAttempt attempt;

    bool ok() const { return endpoint.has_value(); }

    /// True when an operator can unblock the run by allowing a port scan
    /// or supplying a debug port.
    bool is_operator_actionable() const { return error.kind == ErrorKind::NoEndpoint; }
};

/// Turns "start this profile" into a confirmed debug endpoint:
/// start, poll the read catalog, probe ports, and recover zombie profiles
/// through force-stop and restart.
class EndpointResolver {
public:
    using ForceStopFn = std::function<bool(const std::string& uuid,
                                           const std::atomic<bool>* cancel)>;

    EndpointResolver(const Transport& transport, const PortProbe& probe,
                     const EndpointCatalog& catalog, ResolverPolicy policy,
                     ForceStopFn force_stop, SleepFn sleep = interruptible_sleep);

    ResolveResult resolve(const std::string& uuid, const StartOptions& options,
                          const std::atomic<bool>* cancel = nullptr) const;

    static nlohmann::json build_start_payload(const std::string& uuid,
                                              const StartOptions& options,
                                              int server_timeout_sec);

private:
    struct Run;
    enum class StartStep { Resolved, Ambiguous, AlreadyRunning, Zombie, NotVisible, Failed };

    StartStep start_once(Run& run, const Route& route) const;
    StartStep start_with_lag(Run& run) const;
    bool poll(Run& run) const;
    bool search(Run& run, const std::vector<Route>& routes) const;
    bool probe_fallback(Run& run) const;
    void resolve_with(Run& run, const EndpointFields& fields, const std::string& strategy) const;
    bool wait(Run& run, std::chrono::milliseconds duration) const;
    bool cancelled(Run& run) const;

    const Transport& transport_;
    const PortProbe& probe_;
    const EndpointCatalog& catalog_;
    ResolverPolicy policy_;
    ForceStopFn force_stop_;
    SleepFn sleep_;
};
