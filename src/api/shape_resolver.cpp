#include "api/shape_resolver.hpp"
#include "api/resolved_endpoint.hpp"

#include <cctype>
#include <cmath>

using json = nlohmann::json;

const std::vector<std::string>& ShapeResolver::identifier_keys() {
    static const std::vector<std::string> keys = {"uuid", "id"};
    return keys;
}

const std::vector<std::string>& ShapeResolver::port_keys() {
    static const std::vector<std::string> keys = {
        "debug_port", "debugPort", "selenium_port", "port", "webdriver_port",
    };
    return keys;
}

const std::vector<std::string>& ShapeResolver::ws_keys() {
    static const std::vector<std::string> keys = {
        "ws_endpoint", "wsEndpoint", "webSocketDebuggerUrl", "webdriver",
    };
    return keys;
}

static std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

static std::optional<int> parse_digits(const std::string& digits) {
    if (digits.empty() || digits.size() > 5) return std::nullopt;
    long long value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        value = value * 10 + (c - '0');
    }
    if (!ResolvedEndpoint::valid_port(value)) return std::nullopt;
    return static_cast<int>(value);
}

std::optional<int> ShapeResolver::parse_port(const json& value) {
    if (value.is_number_integer()) {
        auto n = value.get<long long>();
        if (ResolvedEndpoint::valid_port(n)) return static_cast<int>(n);
        return std::nullopt;
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (std::floor(d) == d && ResolvedEndpoint::valid_port(static_cast<long long>(d))) {
            return static_cast<int>(d);
        }
        return std::nullopt;
    }
    if (value.is_string()) {
        std::string s = trim(value.get<std::string>());
        auto colon = s.rfind(':');
        if (colon != std::string::npos) s = s.substr(colon + 1);
        return parse_digits(s);
    }
    return std::nullopt;
}

std::optional<int> ShapeResolver::port_from_ws_url(const std::string& url) {
    std::string s = trim(url);
    auto scheme = s.find("://");
    if (scheme == std::string::npos) return std::nullopt;

    std::string authority = s.substr(scheme + 3);
    auto slash = authority.find('/');
    if (slash != std::string::npos) authority = authority.substr(0, slash);
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    // [::1]:9222
    auto bracket = authority.rfind(']');
    auto colon = authority.rfind(':');
    if (colon == std::string::npos) return std::nullopt;
    if (bracket != std::string::npos && colon < bracket) return std::nullopt;
    return parse_digits(authority.substr(colon + 1));
}

static std::optional<std::string> string_field(const json& object, const std::string& key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return std::nullopt;
    std::string value = trim(it->get<std::string>());
    if (value.empty()) return std::nullopt;
    return value;
}

std::optional<std::string> ShapeResolver::extract_identifier(const json& body) {
    if (!body.is_object()) return std::nullopt;
    for (const json* source : {&body, body.contains("data") ? &body["data"] : nullptr}) {
        if (!source || !source->is_object()) continue;
        for (const auto& key : identifier_keys()) {
            if (auto id = string_field(*source, key)) return id;
        }
    }
    return std::nullopt;
}

EndpointFields ShapeResolver::extract_from_object(const json& object) {
    EndpointFields fields;
    if (!object.is_object()) return fields;

    for (const auto& key : ws_keys()) {
        if (auto ws = string_field(object, key)) {
            fields.ws_endpoint = ws;
            break;
        }
    }

    for (const auto& key : port_keys()) {
        auto it = object.find(key);
        if (it == object.end()) continue;
        if (auto port = parse_port(*it)) {
            fields.port = port;
            return fields;
        }
    }

    // Older builds nest the driver port: {"ws": {"selenium": "127.0.0.1:52341"}}
    auto ws = object.find("ws");
    if (ws != object.end() && ws->is_object()) {
        auto selenium = ws->find("selenium");
        if (selenium != ws->end()) {
            if (auto port = parse_port(*selenium)) {
                fields.port = port;
                return fields;
            }
        }
    }

    if (fields.ws_endpoint) {
        fields.port = port_from_ws_url(*fields.ws_endpoint);
    }
    return fields;
}

EndpointFields ShapeResolver::extract_endpoint(const json& body) {
    if (!body.is_object()) return {};

    EndpointFields top = extract_from_object(body);
    if (top.port) return top;

    auto data = body.find("data");
    if (data != body.end() && data->is_object()) {
        EndpointFields nested = extract_from_object(*data);
        if (nested.port) return nested;
    }
    return {};
}

const json* ShapeResolver::listing_entries(const json& listing) {
    if (listing.is_array()) return &listing;
    if (!listing.is_object()) return nullptr;
    for (const char* key : {"data", "profiles", "list"}) {
        auto it = listing.find(key);
        if (it != listing.end() && it->is_array() && !it->empty()) return &*it;
    }
    return nullptr;
}

const json* ShapeResolver::find_in_listing(const json& listing, const std::string& uuid) {
    const json* entries = listing_entries(listing);
    if (!entries) return nullptr;

    for (const auto& entry : *entries) {
        if (!entry.is_object()) continue;
        auto id = string_field(entry, "uuid");
        if (!id) {
            auto data = entry.find("data");
            if (data != entry.end() && data->is_object()) id = string_field(*data, "uuid");
        }
        if (id && *id == uuid) return &entry;
    }
    return nullptr;
}

bool ShapeResolver::is_ambiguous_success(const json& body) {
    if (!body.is_object()) return false;
    auto success = body.find("success");
    if (success == body.end() || !success->is_boolean() || !success->get<bool>()) return false;
    auto data = body.find("data");
    return data == body.end() || data->is_null() || data->empty();
}
