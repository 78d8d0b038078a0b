#include "core/profile_lifecycle.hpp"
#include "api/shape_resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

ProfileLifecycle::ProfileLifecycle(const Transport& transport, const PortProbe& probe,
                                   EndpointCatalog catalog, ResolverPolicy policy, SleepFn sleep)
    : transport_(transport), probe_(probe), catalog_(std::move(catalog)),
      policy_(std::move(policy)), sleep_(std::move(sleep)) {
    if (!sleep_) sleep_ = interruptible_sleep;
}

std::shared_ptr<std::mutex> ProfileLifecycle::lock_for(const ProfileHandle& uuid) {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    auto& slot = locks_[uuid];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

// Drops the entry once no caller holds or waits on it.
void ProfileLifecycle::release_lock(const ProfileHandle& uuid) {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    auto it = locks_.find(uuid);
    if (it != locks_.end() && it->second.use_count() == 1) locks_.erase(it);
}

size_t ProfileLifecycle::lock_count() const {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    return locks_.size();
}

/// Holds the per-identifier mutex for one stop or force-stop.
class ProfileLifecycle::ProfileLock {
public:
    ProfileLock(ProfileLifecycle& owner, const ProfileHandle& uuid)
        : owner_(owner), uuid_(uuid), mutex_(owner.lock_for(uuid)), guard_(*mutex_) {}

    ~ProfileLock() {
        guard_.unlock();
        mutex_.reset();
        owner_.release_lock(uuid_);
    }

    ProfileLock(const ProfileLock&) = delete;
    ProfileLock& operator=(const ProfileLock&) = delete;

private:
    ProfileLifecycle& owner_;
    ProfileHandle uuid_;
    std::shared_ptr<std::mutex> mutex_;
    std::unique_lock<std::mutex> guard_;
};

// ── Payloads ───────────────────────────────────────────────

json ProfileLifecycle::deep_merge(json base, const json& patch) {
    if (!base.is_object() || !patch.is_object()) return patch;
    for (auto it = patch.begin(); it != patch.end(); ++it) {
        auto existing = base.find(it.key());
        if (existing != base.end() && existing->is_object() && it->is_object()) {
            *existing = deep_merge(*existing, *it);
        } else {
            base[it.key()] = *it;
        }
    }
    return base;
}

json ProfileLifecycle::build_create_payload(const ProfileSpec& spec) {
    json fingerprint = {{"os", spec.os_name}};
    if (!spec.os_version.empty()) fingerprint["os_version"] = spec.os_version;

    json payload = {{"title", spec.title}, {"fingerprint", fingerprint}};
    if (!spec.user_agent.empty()) payload["userAgent"] = spec.user_agent;
    if (!spec.tags.empty()) payload["tags"] = spec.tags;

    if (spec.overrides.is_object() && !spec.overrides.empty()) {
        payload = deep_merge(payload, spec.overrides);
    }
    return payload;
}

static bool is_password_key(const std::string& key) {
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "password";
}

json ProfileLifecycle::redact_secrets(const json& payload) {
    if (payload.is_array()) {
        json out = json::array();
        for (const auto& item : payload) out.push_back(redact_secrets(item));
        return out;
    }
    if (!payload.is_object()) return payload;

    json out = json::object();
    for (auto it = payload.begin(); it != payload.end(); ++it) {
        if (is_password_key(it.key()) && it->is_string()) {
            out[it.key()] = "***";
        } else {
            out[it.key()] = redact_secrets(*it);
        }
    }
    return out;
}

// ── Create ─────────────────────────────────────────────────

static bool is_retryable_create_error(const ApiError& err) {
    return err.mentions("limit_reached") || err.mentions("Maximum profiles") ||
           err.mentions("rate_limited") || err.kind == ErrorKind::RateLimited ||
           err.status == 429;
}

CreateResult ProfileLifecycle::create(const ProfileSpec& spec, const std::atomic<bool>* cancel) {
    CreateResult result;
    json payload = build_create_payload(spec);
    spdlog::debug("Creating profile with payload: {}", redact_secrets(payload).dump());

    auto out = transport_.send(catalog_.create_local.method, catalog_.create_local.base,
                               catalog_.create_local.path, payload, false, cancel);
    if (!out.ok()) {
        if (out.error.kind == ErrorKind::Cancelled) {
            result.error = out.error;
            return result;
        }
        spdlog::debug("Local create failed ({}), using the cloud API", out.error.text());

        static const int waits_ms[] = {0, 3000, 6000, 10000};
        const size_t tries = sizeof(waits_ms) / sizeof(waits_ms[0]);
        size_t attempt = 0;
        bool retry_now = false;
        while (attempt < tries) {
            if (!retry_now && waits_ms[attempt] > 0 &&
                !sleep_(std::chrono::milliseconds(waits_ms[attempt]), cancel)) {
                result.error.kind = ErrorKind::Cancelled;
                result.error.message = "create cancelled";
                return result;
            }

            out = transport_.send(catalog_.create_cloud.method, catalog_.create_cloud.base,
                                  catalog_.create_cloud.path, payload, false, cancel);
            if (out.ok() || out.error.kind == ErrorKind::Cancelled) break;

            const ApiError& err = out.error;
            if (err.mentions("extra_forbidden") && err.mentions("userAgent") &&
                payload.contains("userAgent")) {
                spdlog::warn("Cloud API rejects userAgent, retrying create without it");
                payload.erase("userAgent");
                retry_now = true;
                continue;
            }
            retry_now = false;
            if (is_retryable_create_error(err) && attempt + 1 < tries) {
                spdlog::warn("Cloud create throttled, attempt {}/{}: {}", attempt + 1, tries,
                             err.message);
                ++attempt;
                continue;
            }
            break;
        }
    }

    if (!out.ok()) {
        spdlog::error("Profile create failed: {}", out.error.text());
        result.error = out.error;
        return result;
    }

    auto uuid = ShapeResolver::extract_identifier(out.body);
    if (!uuid) {
        result.error.kind = ErrorKind::Schema;
        result.error.message = "create response carries no profile identifier";
        result.error.body_preview = out.body.dump();
        spdlog::error("{}", result.error.message);
        return result;
    }

    spdlog::info("Created profile {} (os={}, os_version={})", *uuid, spec.os_name,
                 spec.os_version);
    result.success = true;
    result.uuid = *uuid;
    return result;
}

// ── Start / stop ───────────────────────────────────────────

ResolveResult ProfileLifecycle::start(const ProfileHandle& uuid, const StartOptions& options,
                                      const std::atomic<bool>* cancel) {
    EndpointResolver resolver(
        transport_, probe_, catalog_, policy_,
        [this](const std::string& id, const std::atomic<bool>* c) {
            return force_stop(id, policy_.force_stop_retries,
                              std::chrono::milliseconds(policy_.force_stop_wait_ms), c);
        },
        sleep_);
    return resolver.resolve(uuid, options, cancel);
}

void ProfileLifecycle::stop(const ProfileHandle& uuid) {
    ProfileLock lock(*this, uuid);

    json body = {{"uuid", uuid}};
    for (const auto& route : catalog_.stop) {
        auto out = transport_.send(route.method, route.base, route.expand(uuid), body);
        if (out.ok()) {
            spdlog::info("Stopped profile {} via {}", uuid, route.name);
            return;
        }
        spdlog::debug("{} for {}: {}", route.name, uuid, out.error.text());
    }
    spdlog::info("No stop route accepted profile {}; treating it as stopped", uuid);
}

bool ProfileLifecycle::force_stop(const ProfileHandle& uuid, int retries,
                                  std::chrono::milliseconds initial_wait,
                                  const std::atomic<bool>* cancel) {
    ProfileLock lock(*this, uuid);

    json body = {{"uuid", uuid}};
    const int attempts = std::max(1, retries);
    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (attempt > 0) {
            auto wait = initial_wait * (1LL << attempt);
            spdlog::debug("Force-stop retry {}/{} for {}, waiting {}ms", attempt, attempts, uuid,
                          wait.count());
            if (!sleep_(wait, cancel)) return false;
        }

        for (const auto& route : catalog_.force_stop) {
            if (is_cancelled(cancel)) return false;
            auto out = transport_.send(route.method, route.base, route.expand(uuid), body,
                                       false, cancel);
            if (out.ok()) {
                spdlog::info("Force-stopped profile {} via {} (attempt {})", uuid, route.name,
                             attempt + 1);
                return true;
            }
            spdlog::debug("{} for {} failed (attempt {}): {}", route.name, uuid, attempt + 1,
                          out.error.text());
        }

        if (attempt == attempts - 1) {
            const Route& cloud = catalog_.force_stop_cloud;
            auto out = transport_.send(cloud.method, cloud.base, cloud.expand(uuid), body,
                                       false, cancel);
            if (out.ok()) {
                spdlog::info("Force-stopped profile {} via {}", uuid, cloud.name);
                return true;
            }
            spdlog::debug("{} for {} failed: {}", cloud.name, uuid, out.error.text());
        }
    }

    spdlog::warn("Force-stop of profile {} failed after {} attempts", uuid, attempts);
    return false;
}

// ── Delete / proxies ───────────────────────────────────────

bool ProfileLifecycle::delete_profiles(const std::vector<ProfileHandle>& uuids) {
    if (uuids.empty()) return true;

    const Route& route = catalog_.delete_profiles;
    auto out = transport_.send(route.method, route.base, route.path, json{{"uuid", uuids}});
    if (!out.ok()) {
        spdlog::warn("Deleting {} profiles failed: {}", uuids.size(), out.error.text());
        return false;
    }
    spdlog::info("Deleted {} profiles", uuids.size());
    return true;
}

CreateResult ProfileLifecycle::create_proxy(const ProxySpec& spec) {
    CreateResult result;
    if (spec.host.empty() || !ResolvedEndpoint::valid_port(spec.port)) {
        result.error.kind = ErrorKind::ClientError;
        result.error.message = "proxy needs a host and a port in 1..65535";
        return result;
    }

    std::string type = spec.type;
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    json payload = {
        {"title", "Proxy_" + spec.host + "_" + std::to_string(spec.port)},
        {"host", spec.host},
        {"port", spec.port},
        {"type", type},
    };
    if (!spec.login.empty()) payload["login"] = spec.login;
    if (!spec.password.empty()) payload["password"] = spec.password;
    spdlog::debug("Creating proxy: {}", redact_secrets(payload).dump());

    const Route& route = catalog_.create_proxy;
    auto out = transport_.send(route.method, route.base, route.path, payload);
    if (!out.ok()) {
        spdlog::error("Proxy create failed: {}", out.error.text());
        result.error = out.error;
        return result;
    }

    auto uuid = ShapeResolver::extract_identifier(out.body);
    if (!uuid) {
        result.error.kind = ErrorKind::Schema;
        result.error.message = "proxy response carries no identifier";
        result.error.body_preview = out.body.dump();
        return result;
    }
    spdlog::info("Created proxy {} for {}:{}", *uuid, spec.host, spec.port);
    result.success = true;
    result.uuid = *uuid;
    return result;
}

// ── Bulk ───────────────────────────────────────────────────

std::vector<ProfileHandle> ProfileLifecycle::list_running() {
    std::vector<ProfileHandle> ids;
    for (const auto& route : catalog_.active_listings) {
        auto out = transport_.send(route.method, route.base, route.path, std::nullopt, true);
        if (!out.ok()) {
            spdlog::debug("{}: {}", route.name, out.error.text());
            continue;
        }
        const json* entries = ShapeResolver::listing_entries(out.body);
        if (!entries) return ids;

        for (const auto& entry : *entries) {
            if (entry.is_string()) {
                if (!entry.get<std::string>().empty()) ids.push_back(entry.get<std::string>());
            } else if (auto id = ShapeResolver::extract_identifier(entry)) {
                ids.push_back(*id);
            }
        }
        spdlog::info("{} running profiles listed via {}", ids.size(), route.name);
        return ids;
    }
    spdlog::warn("No profile listing answered");
    return ids;
}

ProfileLifecycle::StopAllResult ProfileLifecycle::stop_all(const std::atomic<bool>* cancel) {
    StopAllResult result;
    for (const auto& uuid : list_running()) {
        if (is_cancelled(cancel)) break;
        if (force_stop(uuid, 3, std::chrono::milliseconds(2000), cancel)) {
            result.stopped++;
        } else {
            result.failed++;
        }
    }
    return result;
}
