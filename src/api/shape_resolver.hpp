#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct EndpointFields {
    std::optional<int> port;
    std::optional<std::string> ws_endpoint;
};

/// Field extraction over the service's varying response envelopes.
/// Every lookup walks a fixed, priority-ordered key list; nothing is
/// defaulted when no key matches.
class ShapeResolver {
public:
    static const std::vector<std::string>& identifier_keys();
    static const std::vector<std::string>& port_keys();
    static const std::vector<std::string>& ws_keys();

    /// Integer, bare numeric string, or "host:port" string -> port.
    static std::optional<int> parse_port(const nlohmann::json& value);

    /// ws://127.0.0.1:53215/devtools/browser/... -> 53215
    static std::optional<int> port_from_ws_url(const std::string& url);

    /// Identifier from the top level, then from `data`.
    static std::optional<std::string> extract_identifier(const nlohmann::json& body);

    /// Port and websocket address from one object (no envelope handling).
    static EndpointFields extract_from_object(const nlohmann::json& object);

    /// Checks the top-level object, then its `data` object. The first
    /// source yielding a port wins; its websocket address goes with it.
    static EndpointFields extract_endpoint(const nlohmann::json& body);

    /// The profile array of a listing: a bare array, or the `data`,
    /// `profiles` or `list` member of an object. nullptr if none.
    static const nlohmann::json* listing_entries(const nlohmann::json& listing);

    /// Entry whose `uuid` (or `data.uuid`) equals `uuid`, or nullptr.
    static const nlohmann::json* find_in_listing(const nlohmann::json& listing,
                                                 const std::string& uuid);

    /// `success: true` with `data` missing, null or empty.
    static bool is_ambiguous_success(const nlohmann::json& body);
};
