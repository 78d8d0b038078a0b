#include "api/transport.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <chrono>

using json = nlohmann::json;

const char* to_string(ApiBase base) {
    return base == ApiBase::Cloud ? "cloud" : "local";
}

const char* to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Put:    return "PUT";
        case HttpMethod::Patch:  return "PATCH";
        case HttpMethod::Delete: return "DELETE";
    }
    return "GET";
}

static std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

struct Transport::Impl {
    TransportOptions options;
    ExchangeFn exchange = &Transport::http_exchange;
    SleepFn sleep = &interruptible_sleep;

    std::string preview(const std::string& body) const {
        if (body.size() <= options.preview_limit) return body;
        return body.substr(0, options.preview_limit);
    }

    std::chrono::milliseconds rate_limit_wait(const std::string& retry_after) const {
        double wait_ms = options.rate_limit_default_ms;
        if (auto sec = parse_retry_after(retry_after)) wait_ms = *sec * 1000.0;
        wait_ms = std::max(wait_ms, static_cast<double>(options.rate_limit_floor_ms));
        wait_ms = std::min(wait_ms, static_cast<double>(options.rate_limit_ceiling_ms));
        return std::chrono::milliseconds(static_cast<long long>(wait_ms));
    }

    /// Seconds, only when the whole header is a finite number.
    /// HTTP-dates and garbage yield nullopt.
    static std::optional<double> parse_retry_after(const std::string& value) {
        size_t begin = value.find_first_not_of(" \t");
        if (begin == std::string::npos) return std::nullopt;
        size_t end = value.find_last_not_of(" \t");
        std::string trimmed = value.substr(begin, end - begin + 1);
        try {
            size_t idx = 0;
            double sec = std::stod(trimmed, &idx);
            if (idx != trimmed.size() || !std::isfinite(sec)) return std::nullopt;
            return sec;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
};

Transport::Transport(TransportOptions options)
    : impl_(std::make_unique<Impl>()) {
    options.local_url = strip_trailing_slash(options.local_url);
    options.cloud_url = strip_trailing_slash(options.cloud_url);
    impl_->options = std::move(options);
}

Transport::~Transport() = default;

const TransportOptions& Transport::options() const {
    return impl_->options;
}

std::string Transport::base_url(ApiBase base) const {
    return base == ApiBase::Cloud ? impl_->options.cloud_url : impl_->options.local_url;
}

void Transport::set_exchange(ExchangeFn exchange) {
    impl_->exchange = std::move(exchange);
}

void Transport::set_sleep(SleepFn sleep) {
    impl_->sleep = std::move(sleep);
}

// ── Single exchange ─────────────────────────────────────────

RawResponse Transport::http_exchange(const RawRequest& request) {
    RawResponse out;
    try {
        httplib::Client cli(request.base_url);
        time_t sec = request.timeout_ms / 1000;
        time_t usec = (request.timeout_ms % 1000) * 1000;
        cli.set_connection_timeout(sec, usec);
        cli.set_read_timeout(sec, usec);
        cli.set_write_timeout(sec, usec);

        httplib::Headers headers;
        for (const auto& [name, value] : request.headers) {
            headers.emplace(name, value);
        }

        const char* content_type = "application/json";
        auto res = [&]() -> httplib::Result {
            switch (request.method) {
                case HttpMethod::Post:
                    return cli.Post(request.path, headers, request.body, content_type);
                case HttpMethod::Put:
                    return cli.Put(request.path, headers, request.body, content_type);
                case HttpMethod::Patch:
                    return cli.Patch(request.path, headers, request.body, content_type);
                case HttpMethod::Delete:
                    return cli.Delete(request.path, headers, request.body, content_type);
                case HttpMethod::Get:
                default:
                    return cli.Get(request.path, headers);
            }
        }();

        if (!res) {
            out.error = httplib::to_string(res.error());
            return out;
        }
        out.connected = true;
        out.status = res->status;
        out.body = res->body;
        out.retry_after = res->get_header_value("Retry-After");
    } catch (const std::exception& e) {
        out.connected = false;
        out.error = e.what();
    }
    return out;
}

// ── Retry loop ──────────────────────────────────────────────

RequestOutcome Transport::send(HttpMethod method, ApiBase base, const std::string& path,
                               const std::optional<json>& body, bool allow_list,
                               const std::atomic<bool>* cancel) const {
    const auto& opts = impl_->options;

    RawRequest request;
    request.method = method;
    request.base = base;
    request.base_url = base_url(base);
    request.path = path;
    request.timeout_ms = opts.timeout_ms;
    request.headers.emplace_back("Content-Type", "application/json");
    if (!opts.api_token.empty()) {
        request.headers.emplace_back("X-Octo-Api-Token", opts.api_token);
    }
    if (body) request.body = body->dump();

    const std::string target = std::string(to_string(method)) + " " + request.base_url + path;

    RequestOutcome outcome;
    auto fail = [&](ErrorKind kind, std::string message) {
        outcome.error.kind = kind;
        outcome.error.message = std::move(message);
        return outcome;
    };
    auto cancelled = [&]() {
        return fail(ErrorKind::Cancelled, "Cancelled: " + target);
    };

    RawResponse raw;
    for (int attempt = 0; attempt <= opts.max_retries; ++attempt) {
        if (is_cancelled(cancel)) return cancelled();

        raw = impl_->exchange(request);
        bool last = attempt == opts.max_retries;

        if (!raw.connected) {
            if (!last) {
                auto wait = exponential_backoff(attempt, opts.backoff_base_ms, opts.backoff_cap_ms);
                spdlog::debug("{} failed ({}), retry {}/{} in {}ms", target, raw.error,
                              attempt + 1, opts.max_retries, wait.count());
                if (!impl_->sleep(wait, cancel)) return cancelled();
                continue;
            }
            return fail(ErrorKind::Network,
                        "Octo API request failed: " + target + " (" + raw.error + ")");
        }

        if (raw.status == 429) {
            auto wait = impl_->rate_limit_wait(raw.retry_after);
            if (!last) {
                spdlog::debug("{} rate limited, waiting {}ms", target, wait.count());
                if (!impl_->sleep(wait, cancel)) return cancelled();
                continue;
            }
            outcome.error.status = 429;
            outcome.error.body_preview = impl_->preview(raw.body);
            outcome.error.retry_after_sec = wait.count() / 1000.0;
            return fail(ErrorKind::RateLimited,
                        "Octo API rate limited: " + target + " -> HTTP 429");
        }

        if (raw.status == 502 || raw.status == 503 || raw.status == 504) {
            if (!last) {
                auto wait = exponential_backoff(attempt, opts.backoff_base_ms, opts.backoff_cap_ms);
                spdlog::debug("{} -> HTTP {}, retry {}/{} in {}ms", target, raw.status,
                              attempt + 1, opts.max_retries, wait.count());
                if (!impl_->sleep(wait, cancel)) return cancelled();
                continue;
            }
        }

        if (raw.status < 200 || raw.status >= 300) {
            outcome.error.status = raw.status;
            outcome.error.body_preview = impl_->preview(raw.body);
            auto kind = raw.status >= 500 ? ErrorKind::ServerError : ErrorKind::ClientError;
            return fail(kind, "Octo API error: " + target + " -> HTTP " +
                                  std::to_string(raw.status));
        }
        break;
    }

    if (raw.body.empty()) {
        outcome.body = json::object();
        return outcome;
    }

    auto parsed = json::parse(raw.body, nullptr, false);
    if (parsed.is_discarded()) {
        outcome.error.status = raw.status;
        outcome.error.body_preview = impl_->preview(raw.body);
        return fail(ErrorKind::Schema, "Octo API returned non-JSON response: " + target);
    }
    if (parsed.is_object() || (allow_list && parsed.is_array())) {
        outcome.body = std::move(parsed);
        return outcome;
    }

    outcome.error.status = raw.status;
    outcome.error.body_preview = impl_->preview(raw.body);
    return fail(ErrorKind::Schema, std::string("Octo API returned unexpected JSON type: ") +
                                       parsed.type_name() + " (" + target + ")");
}
