#pragma once
// ============================================================================
// SPICEDECK - REST Client
// ============================================================================
// Blocking HTTPS client for the GitHub REST API
// Features: per-client rate limiting, token auth, redirect following.
// Redirects to the same host spend budget; the token only travels over
// https to the host it was issued for.
// ============================================================================

#include "spicedeck/core/types.hpp"
#include "spicedeck/network/rate_limiter.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace spicedeck::network {

// ============================================================================
// HTTP Types
// ============================================================================

enum class HttpMethod {
    GET
};

/// Parsed absolute URL
struct Url {
    std::string scheme;   // "https" or "http"
    std::string host;
    std::string port;     // Defaults to 443 / 80
    std::string target;   // Path plus query, at least "/"

    [[nodiscard]] bool is_tls() const { return scheme == "https"; }
};

/// Split an absolute http(s) URL. Returns nullopt for other schemes or an empty host.
[[nodiscard]] std::optional<Url> parse_url(std::string_view url);

/// Resolve a redirect Location (absolute URL, absolute path or relative path)
/// against the URL that answered with it. A non-default port is kept.
[[nodiscard]] std::string resolve_location(const Url& base, std::string_view location);

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;
};

struct HttpResponse {
    int status_code = 0;
    std::string reason;
    std::map<std::string, std::string> headers;  // Lower-case names
    std::string body;
    Timestamp received_at;

    // GitHub budget headers, -1 when absent
    int rate_limit_remaining = -1;
    int rate_limit_limit = -1;

    [[nodiscard]] bool is_success() const { return status_code >= 200 && status_code < 300; }
    [[nodiscard]] bool is_transport_error() const { return status_code < 0; }
    [[nodiscard]] bool is_rate_limited() const {
        return status_code == 429 || (status_code == 403 && rate_limit_remaining == 0);
    }

    /// Header value by case-insensitive name
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;

    /// "404 Not Found" style summary for error messages
    [[nodiscard]] std::string status_line() const;
};

/// One exchange as it goes on the wire: the resolved URL and the final header
/// set (User-Agent, Accept, Authorization when allowed, caller headers)
struct WireRequest {
    HttpMethod method = HttpMethod::GET;
    Url url;
    std::map<std::string, std::string> headers;
};

/// Performs exactly one exchange and never follows redirects. Response header
/// names must be lower-case; failures come back as status_code -1.
using HttpTransport = std::function<HttpResponse(const WireRequest&)>;

// ============================================================================
// REST Client Configuration
// ============================================================================

struct RestClientConfig {
    std::string user_agent = "SpiceDeck/1.0";
    std::string accept = "application/vnd.github+json";

    /// GitHub personal access token, sent as "Authorization: token <pat>"
    std::string token;

    // Connection settings
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds request_timeout{30};
    int max_redirects = 3;
    bool verify_peer = true;

    // Rate limiting (GitHub unauthenticated budget)
    bool rate_limit_enabled = true;
    int rate_limit_capacity = 60;
    Seconds rate_limit_window{3600.0};
};

// ============================================================================
// REST Client Interface
// ============================================================================

class IRestClient {
public:
    virtual ~IRestClient() = default;

    /// Execute request synchronously (blocking). Transport failures come back
    /// as status_code -1 with the error text in body.
    [[nodiscard]] virtual HttpResponse request(const HttpRequest& request) = 0;

    /// Convenience GET
    [[nodiscard]] virtual HttpResponse get(std::string_view url,
                                           const std::map<std::string, std::string>& headers = {}) {
        HttpRequest req;
        req.method = HttpMethod::GET;
        req.url = std::string(url);
        req.headers = headers;
        return request(req);
    }

    /// Remaining GitHub budget reported by the last response, -1 if unknown
    [[nodiscard]] virtual int get_rate_limit_remaining() const = 0;
};

// ============================================================================
// REST Client Implementation
// ============================================================================

class RestClient : public IRestClient {
public:
    /// Throws std::invalid_argument if the rate limit settings are invalid
    explicit RestClient(const RestClientConfig& config);
    RestClient(const RestClientConfig& config, std::unique_ptr<RateLimiter> limiter);

    /// Replaces the Boost.Beast exchange; throws std::invalid_argument if empty
    RestClient(const RestClientConfig& config, std::unique_ptr<RateLimiter> limiter,
               HttpTransport transport);
    ~RestClient() override;

    // Non-copyable
    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    [[nodiscard]] HttpResponse request(const HttpRequest& request) override;

    [[nodiscard]] int get_rate_limit_remaining() const override;

    void set_token(std::string token);

    /// Limiter guarding this client, null when limiting is disabled
    [[nodiscard]] RateLimiter* rate_limiter() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace spicedeck::network
