#include "core/endpoint_catalog.hpp"

std::string Route::expand(const std::string& uuid) const {
    static const std::string placeholder = "{uuid}";
    std::string out = path;
    size_t pos;
    while ((pos = out.find(placeholder)) != std::string::npos) {
        out.replace(pos, placeholder.size(), uuid);
    }
    return out;
}

static Route get(const char* name, ApiBase base, const char* path, bool listing = false) {
    return Route{name, HttpMethod::Get, base, path, listing};
}

static Route post(const char* name, ApiBase base, const char* path) {
    return Route{name, HttpMethod::Post, base, path, false};
}

EndpointCatalog EndpointCatalog::defaults() {
    const auto L = ApiBase::Local;
    const auto C = ApiBase::Cloud;

    EndpointCatalog c;
    c.create_local = post("create/local", L, "/api/v2/automation/profiles");
    c.create_cloud = post("create/cloud", C, "/api/v2/automation/profiles");

    // Raw {uuid, ws_endpoint, debug_port} answer; the v2 path often answers
    // {success, data: null}.
    c.start = post("start", L, "/api/profiles/start");
    c.start_cloud_fallback = post("start/cloud-v2", C, "/api/v2/automation/profiles/{uuid}/start");

    c.profile_info = {
        get("info/local-v2-automation", L, "/api/v2/automation/profiles/{uuid}"),
        get("info/local-v2", L, "/api/v2/profiles/{uuid}"),
        get("info/local-v2-automation-status", L, "/api/v2/automation/profiles/{uuid}/status"),
        get("info/local-v2-status", L, "/api/v2/profiles/{uuid}/status"),
        get("info/local", L, "/api/profiles/{uuid}"),
        get("info/cloud-v2-automation", C, "/api/v2/automation/profiles/{uuid}"),
    };

    c.running_listings = {
        get("list/active", L, "/api/profiles/active", true),
        get("list/all", L, "/api/profiles", true),
        get("list/v2-automation-active", L, "/api/v2/automation/profiles/active", true),
        get("list/v2-active", L, "/api/v2/profiles/active", true),
        get("list/v2-automation-running", L, "/api/v2/automation/profiles?status=running", true),
        get("list/v2-automation", L, "/api/v2/automation/profiles", true),
        get("list/v2", L, "/api/v2/profiles", true),
    };

    c.active_listings = {
        get("list/active", L, "/api/profiles/active", true),
        get("list/all", L, "/api/profiles", true),
    };

    c.stop = {
        post("stop", L, "/api/profiles/stop"),
        post("force-stop", L, "/api/profiles/force_stop"),
        post("stop/v2-automation", L, "/api/v2/automation/profiles/{uuid}/stop"),
        post("stop/by-id", L, "/api/profiles/{uuid}/stop"),
    };

    c.force_stop = {
        post("force-stop", L, "/api/profiles/force_stop"),
        post("stop", L, "/api/profiles/stop"),
        post("stop/v2-automation", L, "/api/v2/automation/profiles/{uuid}/stop"),
    };
    c.force_stop_cloud = post("stop/cloud-v2", C, "/api/v2/automation/profiles/{uuid}/stop");

    c.delete_profiles = Route{"delete", HttpMethod::Delete, C, "/api/v2/automation/profiles", false};
    c.create_proxy = post("proxy/create", C, "/api/v2/automation/proxies");

    c.already_running_markers = {"already_started", "already started", "already running"};
    c.zombie_markers = {"zombie", "no debug port", "without debug"};
    return c;
}
