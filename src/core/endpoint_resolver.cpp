#include "core/endpoint_resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

// ── Run context ────────────────────────────────────────────

struct EndpointResolver::Run {
    const std::string& uuid;
    const StartOptions& options;
    const std::atomic<bool>* cancel;
    ResolveResult result;

    ResolutionAttempt& attempt() { return result.attempt; }

    void fail(ErrorKind kind, const std::string& message) {
        ApiError err;
        err.kind = kind;
        err.message = message;
        fail_with(err);
    }

    void fail_with(const ApiError& err) {
        result.endpoint.reset();
        result.error = err;
        result.attempt.last_error = err;
    }
};

static bool mentions_any(const ApiError& err, const std::vector<std::string>& markers) {
    return std::any_of(markers.begin(), markers.end(),
                       [&](const std::string& m) { return err.mentions(m); });
}

static bool probing_allowed(const StartOptions& options) {
    return options.allow_port_scan || options.debug_port.has_value();
}

/// 2xx start answers may still carry `success: false` with the reason in
/// `error`, `msg` or `message`.
static std::optional<ApiError> explicit_failure(const json& body) {
    if (!body.is_object()) return std::nullopt;
    auto it = body.find("success");
    if (it == body.end() || !it->is_boolean() || it->get<bool>()) return std::nullopt;

    ApiError err;
    err.kind = ErrorKind::ClientError;
    err.message = "start reported success=false";
    for (const char* key : {"error", "msg", "message"}) {
        auto m = body.find(key);
        if (m != body.end() && m->is_string()) {
            err.message += ": " + m->get<std::string>();
            break;
        }
    }
    err.body_preview = body.dump();
    return err;
}

// ── EndpointResolver ───────────────────────────────────────

EndpointResolver::EndpointResolver(const Transport& transport, const PortProbe& probe,
                                   const EndpointCatalog& catalog, ResolverPolicy policy,
                                   ForceStopFn force_stop, SleepFn sleep)
    : transport_(transport), probe_(probe), catalog_(catalog),
      policy_(std::move(policy)), force_stop_(std::move(force_stop)),
      sleep_(std::move(sleep)) {
    if (!sleep_) sleep_ = interruptible_sleep;
}

json EndpointResolver::build_start_payload(const std::string& uuid,
                                           const StartOptions& options,
                                           int server_timeout_sec) {
    json payload = {
        {"uuid", uuid},
        {"headless", options.headless},
        {"timeout", server_timeout_sec},
        {"only_local", true},
        {"flags", options.flags},
    };
    if (options.debug_port) {
        payload["debug_port"] = *options.debug_port;
    } else {
        payload["debug_port"] = true;
    }
    return payload;
}

ResolveResult EndpointResolver::resolve(const std::string& uuid, const StartOptions& options,
                                        const std::atomic<bool>* cancel) const {
    Run run{uuid, options, cancel, {}};

    if (options.debug_port && !ResolvedEndpoint::valid_port(*options.debug_port)) {
        run.fail(ErrorKind::NoEndpoint,
                 "manual debug port " + std::to_string(*options.debug_port) + " is out of range");
        return run.result;
    }

    spdlog::info("Resolving debug endpoint for profile {}", uuid);

    const int rounds = std::max(1, policy_.zombie_rounds);
    for (int round = 0; round < rounds; ++round) {
        StartStep step = start_with_lag(run);
        if (step == StartStep::Resolved || step == StartStep::Failed) {
            return run.result;
        }
        if (step == StartStep::Ambiguous) {
            poll(run);
            return run.result;
        }
        // Zombie answers are looked up too; a listing may still carry the port.
        spdlog::info("Profile {} is already running{}, looking it up", uuid,
                     step == StartStep::Zombie ? " without a reported endpoint" : "");
        std::vector<Route> routes = catalog_.running_listings;
        routes.insert(routes.end(), catalog_.profile_info.begin(), catalog_.profile_info.end());
        if (search(run, routes)) return run.result;
        if (run.result.error.kind == ErrorKind::Cancelled) return run.result;

        run.attempt().zombie_rounds++;
        if (round + 1 >= rounds) break;

        spdlog::warn("Profile {} runs without a debug endpoint, force-stopping (round {}/{})",
                     uuid, round + 1, rounds);
        if (cancelled(run)) return run.result;
        run.attempt().tried.push_back("force-stop");
        if (force_stop_ && !force_stop_(uuid, cancel)) {
            spdlog::warn("Force-stop of {} did not confirm, restarting anyway", uuid);
        }
        auto settle = std::chrono::milliseconds(policy_.settle_base_ms +
                                                policy_.settle_step_ms * round);
        if (!wait(run, settle)) return run.result;
    }

    if (probing_allowed(options)) {
        spdlog::warn("Profile {} stayed a zombie, falling back to port probing", uuid);
        if (probe_fallback(run)) return run.result;
        if (run.result.error.kind == ErrorKind::Cancelled) return run.result;
    }

    run.fail(ErrorKind::ZombieUnrecoverable,
             "profile " + uuid + " stayed running without a debug endpoint after " +
             std::to_string(run.attempt().start_attempts) + " start attempts and " +
             std::to_string(run.attempt().zombie_rounds) + " zombie rounds");
    spdlog::error("{}", run.result.error.message);
    return run.result;
}

// ── Starting ───────────────────────────────────────────────

EndpointResolver::StartStep EndpointResolver::start_once(Run& run, const Route& route) const {
    if (cancelled(run)) return StartStep::Failed;

    run.attempt().start_attempts++;
    run.attempt().tried.push_back(route.name);

    json payload = build_start_payload(run.uuid, run.options, policy_.server_timeout_sec);
    auto out = transport_.send(route.method, route.base, route.expand(run.uuid), payload,
                               false, run.cancel);

    ApiError err = out.error;
    if (out.ok()) {
        EndpointFields fields = ShapeResolver::extract_endpoint(out.body);
        if (fields.port) {
            resolve_with(run, fields, route.name);
            return StartStep::Resolved;
        }
        auto failure = explicit_failure(out.body);
        if (!failure) {
            spdlog::info("Start of {} via {} succeeded without an endpoint", run.uuid, route.name);
            return StartStep::Ambiguous;
        }
        err = *failure;
    }

    if (err.kind == ErrorKind::Cancelled) {
        run.fail_with(err);
        return StartStep::Failed;
    }

    run.attempt().last_error = err;
    spdlog::debug("Start of {} via {} failed: {}", run.uuid, route.name, err.text());

    if (mentions_any(err, catalog_.already_running_markers)) {
        json detail = json::parse(err.body_preview, nullptr, false);
        if (!detail.is_discarded()) {
            EndpointFields fields = ShapeResolver::extract_endpoint(detail);
            if (fields.port) {
                resolve_with(run, fields, route.name + "/already-running");
                return StartStep::Resolved;
            }
        }
        return mentions_any(err, catalog_.zombie_markers) ? StartStep::Zombie
                                                          : StartStep::AlreadyRunning;
    }
    if (err.kind == ErrorKind::ClientError && err.status == 404) {
        return StartStep::NotVisible;
    }
    run.fail_with(err);
    return StartStep::Failed;
}

// A 404 right after create is the cloud record not having reached the
// local store yet.
EndpointResolver::StartStep EndpointResolver::start_with_lag(Run& run) const {
    const int tries = std::max(1, policy_.not_found_retries);
    for (int i = 0;; ++i) {
        StartStep step = start_once(run, catalog_.start);
        if (step != StartStep::NotVisible) return step;

        if (i + 1 >= tries) {
            spdlog::error("Profile {} still not visible to the local API after {} tries",
                          run.uuid, tries);
            run.fail_with(run.attempt().last_error);
            return StartStep::Failed;
        }
        spdlog::debug("Profile {} not yet visible, retrying ({}/{})", run.uuid, i + 1, tries);
        if (!wait(run, std::chrono::milliseconds(policy_.not_found_wait_ms))) {
            return StartStep::Failed;
        }
    }
}

// ── Polling ────────────────────────────────────────────────

bool EndpointResolver::poll(Run& run) const {
    const int rounds = std::max(1, policy_.poll_attempts);
    std::vector<Route> read_routes = catalog_.profile_info;
    read_routes.insert(read_routes.end(), catalog_.running_listings.begin(),
                       catalog_.running_listings.end());

    for (int n = 1; n <= rounds; ++n) {
        run.attempt().poll_rounds = n;
        if (!wait(run, std::chrono::milliseconds(policy_.poll_step_ms * n))) return false;

        StartStep step = start_once(run, catalog_.start);
        if (step == StartStep::Resolved) return true;
        if (run.result.error.kind == ErrorKind::Cancelled) return false;
        run.result.error = ApiError{};

        if (n == rounds && step != StartStep::Ambiguous) {
            step = start_once(run, catalog_.start_cloud_fallback);
            if (step == StartStep::Resolved) return true;
            if (run.result.error.kind == ErrorKind::Cancelled) return false;
            run.result.error = ApiError{};
        }

        if (search(run, read_routes)) return true;
        if (run.result.error.kind == ErrorKind::Cancelled) return false;
        spdlog::debug("Poll round {}/{} for {} found no endpoint", n, rounds, run.uuid);
    }

    if (!probing_allowed(run.options)) {
        run.fail(ErrorKind::NoEndpoint,
                 "no debug endpoint reported for profile " + run.uuid + " after " +
                 std::to_string(rounds) +
                 " polling rounds; allow port scanning or supply a debug port");
        spdlog::warn("{}", run.result.error.message);
        return false;
    }
    return probe_fallback(run);
}

bool EndpointResolver::search(Run& run, const std::vector<Route>& routes) const {
    std::string strategy;
    auto found = first_match<EndpointFields>(routes, [&](const Route& route)
                                                         -> std::optional<EndpointFields> {
        if (is_cancelled(run.cancel)) return std::nullopt;
        run.attempt().tried.push_back(route.name);

        auto out = transport_.send(route.method, route.base, route.expand(run.uuid),
                                   std::nullopt, route.listing, run.cancel);
        if (!out.ok()) {
            spdlog::debug("{} for {}: {}", route.name, run.uuid, out.error.text());
            return std::nullopt;
        }

        const json* record = &out.body;
        if (route.listing) {
            record = ShapeResolver::find_in_listing(out.body, run.uuid);
            if (!record) return std::nullopt;
        }
        EndpointFields fields = ShapeResolver::extract_endpoint(*record);
        if (!fields.port) return std::nullopt;
        strategy = route.name;
        return fields;
    });

    if (cancelled(run)) return false;
    if (!found) return false;
    resolve_with(run, *found, strategy);
    return true;
}

// ── Probing ────────────────────────────────────────────────

bool EndpointResolver::probe_fallback(Run& run) const {
    if (cancelled(run)) return false;

    if (run.options.debug_port) {
        int port = *run.options.debug_port;
        run.attempt().tried.push_back("probe/manual-port");
        auto ws = probe_.live_ws_endpoint(port, probe_.options().connect_timeout_ms);
        if (ws) {
            run.result.endpoint = ResolvedEndpoint(run.uuid, port, ws);
            run.result.error = ApiError{};
            spdlog::info("Resolved profile {} via manual port {}", run.uuid, port);
            return true;
        }
        run.fail(ErrorKind::NoEndpoint,
                 "manual debug port " + std::to_string(port) + " is not a live debug endpoint");
        spdlog::warn("{}", run.result.error.message);
        return false;
    }

    run.attempt().tried.push_back("probe/scan");
    const std::vector<int> ports =
        policy_.scan_ports.empty() ? PortProbe::default_candidates() : policy_.scan_ports;
    auto found = probe_.scan_range(ports, policy_.scan_port_timeout_ms, run.uuid, run.cancel);
    if (found) {
        run.result.endpoint = *found;
        run.result.error = ApiError{};
        return true;
    }
    if (cancelled(run)) return false;

    run.fail(ErrorKind::NoEndpoint,
             "port scan over " + std::to_string(ports.size()) +
             " candidates found no live debug endpoint for profile " + run.uuid);
    spdlog::warn("{}", run.result.error.message);
    return false;
}

// ── Helpers ────────────────────────────────────────────────

void EndpointResolver::resolve_with(Run& run, const EndpointFields& fields,
                                    const std::string& strategy) const {
    int port = *fields.port;
    std::optional<std::string> ws = fields.ws_endpoint;
    if (!ws) {
        ws = probe_.fetch_ws_endpoint(port);
        if (!ws) {
            spdlog::warn("Port {} of {} did not answer /json/version", port, run.uuid);
        }
    }
    run.result.endpoint = ResolvedEndpoint(run.uuid, port, ws);
    run.result.error = ApiError{};
    spdlog::info("Resolved profile {} via {}: port {}", run.uuid, strategy, port);
}

bool EndpointResolver::wait(Run& run, std::chrono::milliseconds duration) const {
    if (cancelled(run)) return false;
    run.attempt().waited += duration;
    if (!sleep_(duration, run.cancel)) {
        run.fail(ErrorKind::Cancelled, "resolution of " + run.uuid + " cancelled");
        return false;
    }
    return true;
}

bool EndpointResolver::cancelled(Run& run) const {
    if (!is_cancelled(run.cancel)) return false;
    run.fail(ErrorKind::Cancelled, "resolution of " + run.uuid + " cancelled");
    return true;
}
