// ============================================================================
// SPICEDECK - REST Client Unit Tests
// ============================================================================
// Offline checks only: URL handling, response helpers, limiter wiring and
// the redirect loop driven through an in-memory transport

#include "spicedeck/network/rest_client.hpp"

#include <gtest/gtest.h>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace spicedeck;
using namespace spicedeck::network;

// ============================================================================
// parse_url
// ============================================================================

TEST(ParseUrlTest, HttpsWithPath) {
    auto url = parse_url("https://api.github.com/repos/spicetify/spicetify-cli/releases/latest");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "https");
    EXPECT_EQ(url->host, "api.github.com");
    EXPECT_EQ(url->port, "443");
    EXPECT_EQ(url->target, "/repos/spicetify/spicetify-cli/releases/latest");
    EXPECT_TRUE(url->is_tls());
}

TEST(ParseUrlTest, ExplicitPortAndQuery) {
    auto url = parse_url("http://localhost:8080/contents?ref=main#readme");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "http");
    EXPECT_EQ(url->host, "localhost");
    EXPECT_EQ(url->port, "8080");
    EXPECT_EQ(url->target, "/contents?ref=main");
    EXPECT_FALSE(url->is_tls());
}

TEST(ParseUrlTest, BareHostGetsRootTarget) {
    auto url = parse_url("HTTPS://Raw.GitHubUserContent.com");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "raw.githubusercontent.com");
    EXPECT_EQ(url->target, "/");
}

TEST(ParseUrlTest, QueryWithoutPath) {
    auto url = parse_url("https://example.com?x=1");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "example.com");
    EXPECT_EQ(url->target, "/?x=1");
}

TEST(ParseUrlTest, RejectsUnsupported) {
    EXPECT_FALSE(parse_url("ftp://example.com/file").has_value());
    EXPECT_FALSE(parse_url("example.com/no-scheme").has_value());
    EXPECT_FALSE(parse_url("https:///path-only").has_value());
    EXPECT_FALSE(parse_url("https://example.com:/x").has_value());
    EXPECT_FALSE(parse_url("https://example.com:44a/x").has_value());
}

// ============================================================================
// resolve_location
// ============================================================================

TEST(ResolveLocationTest, AbsoluteUrlIsTakenAsIs) {
    auto base = parse_url("https://api.github.com/repos/a/b");
    ASSERT_TRUE(base.has_value());
    EXPECT_EQ(resolve_location(*base, "https://codeload.github.com/a/b/zip"),
              "https://codeload.github.com/a/b/zip");
}

TEST(ResolveLocationTest, AbsolutePathKeepsSchemeAndHost) {
    auto base = parse_url("https://api.github.com/repos/old/name/contents");
    ASSERT_TRUE(base.has_value());
    EXPECT_EQ(resolve_location(*base, "/repositories/1234/contents"),
              "https://api.github.com/repositories/1234/contents");
}

TEST(ResolveLocationTest, RelativePathResolvesAgainstDirectory) {
    auto base = parse_url("https://api.github.com/repos/a/b/contents?ref=main");
    ASSERT_TRUE(base.has_value());
    EXPECT_EQ(resolve_location(*base, "readme"), "https://api.github.com/repos/a/b/readme");

    auto root = parse_url("https://example.com");
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(resolve_location(*root, "file.js"), "https://example.com/file.js");
}

TEST(ResolveLocationTest, NonDefaultPortIsKept) {
    auto tls = parse_url("https://localhost:8443/a/b");
    ASSERT_TRUE(tls.has_value());
    EXPECT_EQ(resolve_location(*tls, "/c"), "https://localhost:8443/c");
    EXPECT_EQ(resolve_location(*tls, "d"), "https://localhost:8443/a/d");

    auto plain = parse_url("http://localhost:80/a");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(resolve_location(*plain, "/b"), "http://localhost/b");
}

// ============================================================================
// HttpResponse
// ============================================================================

TEST(HttpResponseTest, HeaderLookupIgnoresCase) {
    HttpResponse response;
    response.headers["x-ratelimit-remaining"] = "42";
    auto value = response.header("X-RateLimit-Remaining");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "42");
    EXPECT_FALSE(response.header("location").has_value());
}

TEST(HttpResponseTest, StatusClassification) {
    HttpResponse ok;
    ok.status_code = 200;
    EXPECT_TRUE(ok.is_success());
    EXPECT_FALSE(ok.is_rate_limited());

    HttpResponse exhausted;
    exhausted.status_code = 403;
    exhausted.rate_limit_remaining = 0;
    EXPECT_TRUE(exhausted.is_rate_limited());

    HttpResponse forbidden;
    forbidden.status_code = 403;
    forbidden.rate_limit_remaining = 12;
    EXPECT_FALSE(forbidden.is_rate_limited());

    HttpResponse too_many;
    too_many.status_code = 429;
    EXPECT_TRUE(too_many.is_rate_limited());
}

TEST(HttpResponseTest, StatusLine) {
    HttpResponse response;
    response.status_code = 404;
    response.reason = "Not Found";
    EXPECT_EQ(response.status_line(), "404 Not Found");

    HttpResponse failed;
    failed.status_code = -1;
    failed.body = "connection refused";
    EXPECT_TRUE(failed.is_transport_error());
    EXPECT_EQ(failed.status_line(), "connection refused");
}

// ============================================================================
// RestClient
// ============================================================================

TEST(RestClientTest, InvalidRateLimitFailsFast) {
    RestClientConfig config;
    config.rate_limit_capacity = 0;
    EXPECT_THROW(RestClient client(config), std::invalid_argument);

    config.rate_limit_capacity = 60;
    config.rate_limit_window = Seconds{-1.0};
    EXPECT_THROW(RestClient client(config), std::invalid_argument);
}

TEST(RestClientTest, DisabledLimiterIsAbsent) {
    RestClientConfig config;
    config.rate_limit_enabled = false;
    config.rate_limit_capacity = 0;  // Ignored when disabled
    RestClient client(config);
    EXPECT_EQ(client.rate_limiter(), nullptr);
}

TEST(RestClientTest, InvalidUrlIsTransportError) {
    RestClientConfig config;
    config.rate_limit_enabled = false;
    RestClient client(config);

    auto response = client.get("gopher://example.com/");
    EXPECT_EQ(response.status_code, -1);
    EXPECT_TRUE(response.is_transport_error());
    EXPECT_NE(response.body.find("Invalid URL"), std::string::npos);
}

TEST(RestClientTest, EveryRequestPassesThroughLimiter) {
    RestClientConfig config;
    RestClient client(config, std::make_unique<RateLimiter>(3, Seconds{3600}));
    ASSERT_NE(client.rate_limiter(), nullptr);
    EXPECT_EQ(client.rate_limiter()->remaining(), 3);

    (void)client.get("not a url");
    (void)client.get("still not a url");
    EXPECT_EQ(client.rate_limiter()->remaining(), 1);
    EXPECT_EQ(client.get_rate_limit_remaining(), -1);
}

TEST(RestClientTest, EmptyTransportIsRejected) {
    RestClientConfig config;
    config.rate_limit_enabled = false;
    EXPECT_THROW(RestClient(config, nullptr, HttpTransport{}), std::invalid_argument);
}

// ============================================================================
// Redirect handling
// ============================================================================

// Serves canned responses keyed by "scheme://host:port/target" and records
// every exchange handed to it
class RestClientRedirectTest : public ::testing::Test {
protected:
    std::map<std::string, HttpResponse> routes_;
    std::vector<WireRequest> sent_;

    static std::string key(const Url& url) {
        return url.scheme + "://" + url.host + ":" + url.port + url.target;
    }

    void respond(const std::string& url, int status, std::string body = "") {
        auto parsed = parse_url(url);
        ASSERT_TRUE(parsed.has_value()) << url;
        HttpResponse response;
        response.status_code = status;
        response.body = std::move(body);
        routes_[key(*parsed)] = response;
    }

    void redirect(const std::string& url, const std::string& location, int status = 302) {
        respond(url, status);
        auto parsed = parse_url(url);
        routes_[key(*parsed)].headers["location"] = location;
    }

    HttpTransport transport() {
        return [this](const WireRequest& wire) {
            sent_.push_back(wire);
            auto it = routes_.find(key(wire.url));
            if (it == routes_.end()) {
                HttpResponse missing;
                missing.status_code = 404;
                missing.reason = "Not Found";
                return missing;
            }
            return it->second;
        };
    }

    RestClientConfig config(const std::string& token = "") {
        RestClientConfig cfg;
        cfg.rate_limit_enabled = false;
        cfg.token = token;
        return cfg;
    }

    static bool has_authorization(const WireRequest& wire) {
        return wire.headers.count("Authorization") > 0;
    }
};

TEST_F(RestClientRedirectTest, FollowsRelativeAbsolutePathAndAbsoluteLocations) {
    redirect("https://api.github.com/a/b", "c");
    redirect("https://api.github.com/a/c", "/d");
    redirect("https://api.github.com/d", "https://api.github.com/e", 301);
    respond("https://api.github.com/e", 200, "done");

    RestClient client(config(), nullptr, transport());
    auto response = client.get("https://api.github.com/a/b");

    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body, "done");
    ASSERT_EQ(sent_.size(), 4u);
    EXPECT_EQ(sent_[1].url.target, "/a/c");
    EXPECT_EQ(sent_[2].url.target, "/d");
    EXPECT_EQ(sent_[3].url.target, "/e");
}

TEST_F(RestClientRedirectTest, KeepsNonDefaultPortAcrossHops) {
    redirect("https://localhost:8443/start", "/next");
    respond("https://localhost:8443/next", 200);

    RestClient client(config(), nullptr, transport());
    auto response = client.get("https://localhost:8443/start");

    EXPECT_EQ(response.status_code, 200);
    ASSERT_EQ(sent_.size(), 2u);
    EXPECT_EQ(sent_[1].url.host, "localhost");
    EXPECT_EQ(sent_[1].url.port, "8443");
}

TEST_F(RestClientRedirectTest, TokenIsDroppedOnCrossHostHop) {
    redirect("https://api.github.com/repos/a/b/zipball",
             "https://codeload.github.com/a/b/legacy.zip");
    respond("https://codeload.github.com/a/b/legacy.zip", 200);

    RestClient client(config("ghp_secret"), nullptr, transport());
    (void)client.get("https://api.github.com/repos/a/b/zipball");

    ASSERT_EQ(sent_.size(), 2u);
    ASSERT_TRUE(has_authorization(sent_[0]));
    EXPECT_EQ(sent_[0].headers.at("Authorization"), "token ghp_secret");
    EXPECT_FALSE(has_authorization(sent_[1]));
}

TEST_F(RestClientRedirectTest, TokenIsDroppedOnDowngradeToPlainHttp) {
    redirect("https://api.github.com/x", "http://api.github.com/y");
    respond("http://api.github.com/y", 200);

    RestClient client(config("ghp_secret"), nullptr, transport());
    (void)client.get("https://api.github.com/x");

    ASSERT_EQ(sent_.size(), 2u);
    EXPECT_TRUE(has_authorization(sent_[0]));
    EXPECT_FALSE(has_authorization(sent_[1]));
}

TEST_F(RestClientRedirectTest, TokenIsNeverSentOverPlainHttp) {
    respond("http://api.github.com/x", 200);

    RestClient client(config("ghp_secret"), nullptr, transport());
    (void)client.get("http://api.github.com/x");

    ASSERT_EQ(sent_.size(), 1u);
    EXPECT_FALSE(has_authorization(sent_[0]));
}

TEST_F(RestClientRedirectTest, TooManyRedirectsIsTransportError) {
    redirect("https://api.github.com/loop", "/loop");

    RestClient client(config(), nullptr, transport());
    auto response = client.get("https://api.github.com/loop");

    EXPECT_TRUE(response.is_transport_error());
    EXPECT_NE(response.body.find("Too many redirects"), std::string::npos);
    EXPECT_EQ(sent_.size(), 4u);  // First request plus three redirects
}

TEST_F(RestClientRedirectTest, RedirectWithoutLocationIsReturned) {
    respond("https://api.github.com/moved", 301);

    RestClient client(config(), nullptr, transport());
    auto response = client.get("https://api.github.com/moved");

    EXPECT_EQ(response.status_code, 301);
    EXPECT_EQ(sent_.size(), 1u);
}

TEST_F(RestClientRedirectTest, SameHostHopsSpendBudget) {
    redirect("https://api.github.com/repos/old/name", "https://api.github.com/repositories/7", 301);
    respond("https://api.github.com/repositories/7", 200);
    redirect("https://api.github.com/download", "https://objects.githubusercontent.com/blob");
    respond("https://objects.githubusercontent.com/blob", 200);

    RestClient client(config(), std::make_unique<RateLimiter>(10, Seconds{3600}), transport());

    (void)client.get("https://api.github.com/repos/old/name");
    EXPECT_EQ(client.rate_limiter()->remaining(), 8);

    // The hop to another host is not charged to the API budget
    (void)client.get("https://api.github.com/download");
    EXPECT_EQ(client.rate_limiter()->remaining(), 7);
}

TEST_F(RestClientRedirectTest, BudgetHeadersAreRecorded) {
    respond("https://api.github.com/rate", 200);
    auto parsed = parse_url("https://api.github.com/rate");
    routes_[key(*parsed)].headers["x-ratelimit-remaining"] = "57";
    routes_[key(*parsed)].headers["x-ratelimit-limit"] = "60";

    RestClient client(config(), nullptr, transport());
    auto response = client.get("https://api.github.com/rate");

    EXPECT_EQ(response.rate_limit_remaining, 57);
    EXPECT_EQ(response.rate_limit_limit, 60);
    EXPECT_EQ(client.get_rate_limit_remaining(), 57);
}

TEST_F(RestClientRedirectTest, CallerHeadersReplaceDefaults) {
    respond("https://api.github.com/raw", 200);

    RestClient client(config(), nullptr, transport());
    (void)client.get("https://api.github.com/raw", {{"accept", "application/vnd.github.raw"}});

    ASSERT_EQ(sent_.size(), 1u);
    EXPECT_EQ(sent_[0].headers.count("Accept"), 0u);
    EXPECT_EQ(sent_[0].headers.at("accept"), "application/vnd.github.raw");
    EXPECT_EQ(sent_[0].headers.at("User-Agent"), "SpiceDeck/1.0");
}
