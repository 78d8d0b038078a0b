#pragma once

#include "api/api_error.hpp"
#include "api/backoff.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class ApiBase { Local, Cloud };

enum class HttpMethod { Get, Post, Put, Patch, Delete };

const char* to_string(ApiBase base);
const char* to_string(HttpMethod method);

struct TransportOptions {
    std::string local_url = "http://127.0.0.1:58888";
    std::string cloud_url = "https://app.octobrowser.net";
    std::string api_token;
    int timeout_ms = 30000;
    int max_retries = 3;          // retries beyond the first try
    int backoff_base_ms = 1000;
    int backoff_cap_ms = 8000;
    int rate_limit_default_ms = 1000;
    int rate_limit_floor_ms = 500;
    int rate_limit_ceiling_ms = 300000;
    size_t preview_limit = 2000;
};

struct RequestOutcome {
    nlohmann::json body;
    ApiError error;

    bool ok() const { return error.kind == ErrorKind::None; }
};

/// One HTTP exchange as handed to the exchange function.
struct RawRequest {
    HttpMethod method = HttpMethod::Get;
    ApiBase base = ApiBase::Local;
    std::string base_url;
    std::string path;
    std::string body;  // empty = no body
    std::vector<std::pair<std::string, std::string>> headers;
    int timeout_ms = 0;
};

struct RawResponse {
    bool connected = false;   // false = network-level failure, see error
    int status = 0;
    std::string body;
    std::string retry_after;  // raw Retry-After header, may be empty
    std::string error;
};

using ExchangeFn = std::function<RawResponse(const RawRequest&)>;

/// Octo control API transport: base selection, retry/backoff and JSON
/// decoding. Holds no per-request state, so one instance may serve
/// concurrent callers once configured.
class Transport {
public:
    explicit Transport(TransportOptions options);
    ~Transport();

    RequestOutcome send(HttpMethod method, ApiBase base, const std::string& path,
                        const std::optional<nlohmann::json>& body = std::nullopt,
                        bool allow_list = false,
                        const std::atomic<bool>* cancel = nullptr) const;

    const TransportOptions& options() const;
    std::string base_url(ApiBase base) const;

    /// Replace the single-exchange function (default: cpp-httplib).
    /// Must be called before the transport is shared between threads.
    void set_exchange(ExchangeFn exchange);
    void set_sleep(SleepFn sleep);

    /// Default exchange over cpp-httplib.
    static RawResponse http_exchange(const RawRequest& request);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
