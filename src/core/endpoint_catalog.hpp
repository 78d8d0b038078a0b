#pragma once

#include "api/transport.hpp"

#include <optional>
#include <string>
#include <vector>

/// One named call against the control API. `path` may carry a `{uuid}`
/// placeholder.
struct Route {
    std::string name;
    HttpMethod method = HttpMethod::Get;
    ApiBase base = ApiBase::Local;
    std::string path;
    bool listing = false;  // response is a profile list, not a single record

    std::string expand(const std::string& uuid) const;
};

/// The endpoint families known to work on some Octo release, in the order
/// they are tried.
struct EndpointCatalog {
    Route create_local;
    Route create_cloud;
    Route start;
    Route start_cloud_fallback;
    std::vector<Route> profile_info;
    std::vector<Route> running_listings;
    std::vector<Route> active_listings;
    std::vector<Route> stop;
    std::vector<Route> force_stop;
    Route force_stop_cloud;
    Route delete_profiles;
    Route create_proxy;

    std::vector<std::string> already_running_markers;
    std::vector<std::string> zombie_markers;

    static EndpointCatalog defaults();
};

/// Evaluates routes in order and returns the first non-empty result.
template <typename T, typename Fn>
std::optional<T> first_match(const std::vector<Route>& routes, Fn&& fn) {
    for (const auto& route : routes) {
        std::optional<T> found = fn(route);
        if (found) return found;
    }
    return std::nullopt;
}
