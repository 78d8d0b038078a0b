#pragma once

#include "api/backoff.hpp"
#include "api/port_probe.hpp"
#include "api/transport.hpp"
#include "core/endpoint_catalog.hpp"
#include "core/endpoint_resolver.hpp"
#include "core/profile_types.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/// Create/start/stop/delete of Octo profiles over the local and cloud bases.
class ProfileLifecycle {
public:
    ProfileLifecycle(const Transport& transport, const PortProbe& probe,
                     EndpointCatalog catalog = EndpointCatalog::defaults(),
                     ResolverPolicy policy = {}, SleepFn sleep = interruptible_sleep);

    /// Local base first, then the cloud base with waits of 0, 3, 6 and 10s.
    CreateResult create(const ProfileSpec& spec, const std::atomic<bool>* cancel = nullptr);

    /// Runs the endpoint resolution for `uuid`.
    ResolveResult start(const ProfileHandle& uuid, const StartOptions& options,
                        const std::atomic<bool>* cancel = nullptr);

    /// Best effort: walks the stop routes until one answers. Never fails.
    void stop(const ProfileHandle& uuid);

    /// Force-stop routes with `initial_wait * 2^attempt` between attempts;
    /// the final attempt also tries the cloud stop path.
    bool force_stop(const ProfileHandle& uuid, int retries,
                    std::chrono::milliseconds initial_wait,
                    const std::atomic<bool>* cancel = nullptr);

    /// DELETE on the cloud base. Returns false on error (logged).
    bool delete_profiles(const std::vector<ProfileHandle>& uuids);

    CreateResult create_proxy(const ProxySpec& spec);

    /// Identifiers from the first active-profile listing that answers.
    std::vector<ProfileHandle> list_running();

    struct StopAllResult { int stopped = 0; int failed = 0; };
    StopAllResult stop_all(const std::atomic<bool>* cancel = nullptr);

    const EndpointCatalog& catalog() const { return catalog_; }
    const ResolverPolicy& policy() const { return policy_; }

    static nlohmann::json build_create_payload(const ProfileSpec& spec);

    /// Objects merge recursively; any other value in `patch` replaces.
    static nlohmann::json deep_merge(nlohmann::json base, const nlohmann::json& patch);

    /// Copy of `payload` with every "password" value masked.
    static nlohmann::json redact_secrets(const nlohmann::json& payload);

    /// Identifiers currently holding a serialisation lock.
    size_t lock_count() const;

private:
    class ProfileLock;

    std::shared_ptr<std::mutex> lock_for(const ProfileHandle& uuid);
    void release_lock(const ProfileHandle& uuid);

    const Transport& transport_;
    const PortProbe& probe_;
    EndpointCatalog catalog_;
    ResolverPolicy policy_;
    SleepFn sleep_;

    mutable std::mutex locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> locks_;
};
