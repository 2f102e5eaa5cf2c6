// ============================================================================
// SPICEDECK - REST Client Implementation
// ============================================================================
// Boost.Beast HTTP client over OpenSSL, one connection per request
// ============================================================================

#include "spicedeck/network/rest_client.hpp"
#include "spicedeck/utils/logger.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace spicedeck::network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

// ============================================================================
// Helpers
// ============================================================================

static std::string to_lower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static int parse_int_header(const std::map<std::string, std::string>& headers,
                            const std::string& name) {
    auto it = headers.find(name);
    if (it == headers.end()) {
        return -1;
    }
    try {
        return std::stoi(it->second);
    } catch (const std::exception&) {
        return -1;
    }
}

static bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::optional<Url> parse_url(std::string_view url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::nullopt;
    }

    Url out;
    out.scheme = to_lower(url.substr(0, scheme_end));
    if (out.scheme != "https" && out.scheme != "http") {
        return std::nullopt;
    }

    auto rest = url.substr(scheme_end + 3);
    const auto path_start = rest.find_first_of("/?#");
    auto authority = rest.substr(0, path_start);
    out.target = path_start == std::string_view::npos ? "/" : std::string(rest.substr(path_start));

    // Fragments never go over the wire
    if (auto hash = out.target.find('#'); hash != std::string::npos) {
        out.target.erase(hash);
    }
    if (out.target.empty() || out.target.front() != '/') {
        out.target.insert(out.target.begin(), '/');
    }

    if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        out.port = std::string(authority.substr(colon + 1));
        authority = authority.substr(0, colon);
        if (out.port.empty() ||
            !std::all_of(out.port.begin(), out.port.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
    } else {
        out.port = out.is_tls() ? "443" : "80";
    }

    out.host = to_lower(authority);
    if (out.host.empty()) {
        return std::nullopt;
    }
    return out;
}

std::string resolve_location(const Url& base, std::string_view location) {
    if (parse_url(location)) {
        return std::string(location);
    }
    std::string prefix = base.scheme + "://" + base.host;
    const bool default_port = (base.is_tls() && base.port == "443") ||
                              (!base.is_tls() && base.port == "80");
    if (!default_port) {
        prefix += ":" + base.port;
    }
    if (!location.empty() && location.front() == '/') {
        return prefix + std::string(location);
    }
    auto dir = base.target.substr(0, base.target.rfind('/') + 1);
    return prefix + dir + std::string(location);
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string HttpResponse::status_line() const {
    if (status_code < 0) {
        return body;
    }
    return reason.empty() ? std::to_string(status_code)
                          : std::to_string(status_code) + " " + reason;
}

// Header names are case-insensitive; a caller header replaces a default one
static void set_header(std::map<std::string, std::string>& headers,
                       const std::string& name, const std::string& value) {
    const auto lowered = to_lower(name);
    for (auto it = headers.begin(); it != headers.end();) {
        if (to_lower(it->first) == lowered) {
            it = headers.erase(it);
        } else {
            ++it;
        }
    }
    headers[name] = value;
}

static HttpResponse transport_error(std::string message) {
    HttpResponse error_response;
    error_response.status_code = -1;
    error_response.body = std::move(message);
    error_response.received_at = now();
    return error_response;
}

// ============================================================================
// RestClient::Impl
// ============================================================================

struct RestClient::Impl {
    Impl(const RestClientConfig& config, std::unique_ptr<RateLimiter> limiter,
         HttpTransport transport)
        : config_(config)
        , ssl_context_(ssl::context::tls_client)
        , limiter_(std::move(limiter))
        , transport_(std::move(transport)) {

        ssl_context_.set_default_verify_paths();
        ssl_context_.set_verify_mode(config_.verify_peer ? ssl::verify_peer : ssl::verify_none);

        if (!transport_) {
            transport_ = [this](const WireRequest& wire) { return perform(wire); };
        }
    }

    HttpResponse request(const HttpRequest& req) {
        if (limiter_) {
            limiter_->acquire();
        }

        std::string url = req.url;
        std::optional<Url> origin;

        for (int hop = 0; hop <= config_.max_redirects; ++hop) {
            auto parsed = parse_url(url);
            if (!parsed) {
                return transport_error("Invalid URL: " + url);
            }
            if (!origin) {
                origin = parsed;
            } else if (limiter_ && parsed->host == origin->host) {
                // A hop back to the API host is another call against its budget
                limiter_->acquire();
            }

            // Credentials stay with the host they were issued for, over TLS only
            const bool send_token = parsed->is_tls() && parsed->host == origin->host;

            HttpResponse response = transport_(make_wire_request(req, *parsed, send_token));
            record_budget(response);
            if (!response.is_transport_error()) {
                LOG_DEBUG("GET {}{} -> {}", parsed->host, parsed->target, response.status_line());
            }

            if (!is_redirect(response.status_code)) {
                return response;
            }

            auto location = response.header("location");
            if (!location || location->empty()) {
                return response;
            }
            LOG_DEBUG("Redirect {} -> {}", url, *location);
            url = resolve_location(*parsed, *location);
        }

        LOG_WARN("Gave up on {} after {} redirects", req.url, config_.max_redirects);
        return transport_error("Too many redirects for " + req.url);
    }

    WireRequest make_wire_request(const HttpRequest& req, const Url& url, bool send_token) {
        WireRequest wire;
        wire.method = req.method;
        wire.url = url;
        wire.headers["User-Agent"] = config_.user_agent;
        wire.headers["Accept"] = config_.accept;

        std::string token;
        {
            std::lock_guard<std::mutex> lock(token_mutex_);
            token = config_.token;
        }
        if (send_token && !token.empty()) {
            wire.headers["Authorization"] = "token " + token;
        }

        for (const auto& [name, value] : req.headers) {
            set_header(wire.headers, name, value);
        }
        return wire;
    }

    void record_budget(HttpResponse& response) {
        response.rate_limit_remaining = parse_int_header(response.headers, "x-ratelimit-remaining");
        response.rate_limit_limit = parse_int_header(response.headers, "x-ratelimit-limit");
        if (response.rate_limit_remaining >= 0) {
            rate_limit_remaining_ = response.rate_limit_remaining;
        }
    }

    HttpResponse perform(const WireRequest& wire) {
        const Url& url = wire.url;
        try {
            http::request<http::empty_body> http_req;
            http_req.version(11);
            switch (wire.method) {
                case HttpMethod::GET: http_req.method(http::verb::get); break;
            }
            http_req.target(url.target);
            http_req.set(http::field::host, url.host);
            for (const auto& [name, value] : wire.headers) {
                http_req.set(name, value);
            }

            net::io_context io_context;
            tcp::resolver resolver(io_context);
            auto results = resolver.resolve(url.host, url.port);

            http::response<http::string_body> http_res;
            beast::flat_buffer buffer;

            if (url.is_tls()) {
                beast::ssl_stream<beast::tcp_stream> stream(io_context, ssl_context_);

                if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
                    throw std::runtime_error("Failed to set SNI hostname");
                }
                if (config_.verify_peer) {
                    stream.set_verify_callback(ssl::host_name_verification(url.host));
                }

                beast::get_lowest_layer(stream).expires_after(config_.connect_timeout);
                beast::get_lowest_layer(stream).connect(results);
                stream.handshake(ssl::stream_base::client);

                beast::get_lowest_layer(stream).expires_after(config_.request_timeout);
                http::write(stream, http_req);
                http::read(stream, buffer, http_res);

                beast::error_code ec;
                stream.shutdown(ec);
                // Servers routinely drop TLS without close_notify; nothing to recover
                if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
                    LOG_TRACE("TLS shutdown for {}: {}", url.host, ec.message());
                }
            } else {
                beast::tcp_stream stream(io_context);
                stream.expires_after(config_.connect_timeout);
                stream.connect(results);

                stream.expires_after(config_.request_timeout);
                http::write(stream, http_req);
                http::read(stream, buffer, http_res);

                beast::error_code ec;
                stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            }

            HttpResponse response;
            response.status_code = static_cast<int>(http_res.result_int());
            response.reason = std::string(http_res.reason());
            response.body = std::move(http_res.body());
            response.received_at = now();

            for (const auto& field : http_res) {
                response.headers[to_lower(std::string(field.name_string()))] = std::string(field.value());
            }
            return response;

        } catch (const std::exception& e) {
            LOG_WARN("Request to {} failed: {}", url.host, e.what());
            return transport_error(e.what());
        }
    }

    // Members
    RestClientConfig config_;
    std::mutex token_mutex_;
    ssl::context ssl_context_;
    std::unique_ptr<RateLimiter> limiter_;
    HttpTransport transport_;
    std::atomic<int> rate_limit_remaining_{-1};
};

// ============================================================================
// RestClient Public Interface
// ============================================================================

static std::unique_ptr<RateLimiter> make_limiter(const RestClientConfig& config) {
    if (!config.rate_limit_enabled) {
        return nullptr;
    }
    return std::make_unique<RateLimiter>(config.rate_limit_capacity, config.rate_limit_window);
}

RestClient::RestClient(const RestClientConfig& config)
    : RestClient(config, make_limiter(config)) {}

RestClient::RestClient(const RestClientConfig& config, std::unique_ptr<RateLimiter> limiter)
    : impl_(std::make_unique<Impl>(config, std::move(limiter), nullptr)) {}

RestClient::RestClient(const RestClientConfig& config, std::unique_ptr<RateLimiter> limiter,
                       HttpTransport transport) {
    if (!transport) {
        throw std::invalid_argument("rest client transport must be callable");
    }
    impl_ = std::make_unique<Impl>(config, std::move(limiter), std::move(transport));
}

RestClient::~RestClient() = default;

HttpResponse RestClient::request(const HttpRequest& request) {
    return impl_->request(request);
}

int RestClient::get_rate_limit_remaining() const {
    return impl_->rate_limit_remaining_.load();
}

void RestClient::set_token(std::string token) {
    std::lock_guard<std::mutex> lock(impl_->token_mutex_);
    impl_->config_.token = std::move(token);
}

RateLimiter* RestClient::rate_limiter() noexcept {
    return impl_->limiter_.get();
}

}  // namespace spicedeck::network
