#pragma once
// ============================================================================
// SPICEDECK - Update Checker
// ============================================================================
// Compares installed versions with the latest GitHub release
// ============================================================================

#include "spicedeck/core/types.hpp"
#include "spicedeck/network/rest_client.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace spicedeck::github {

struct ReleaseInfo {
    std::string tag;       // Raw tag_name, e.g. "v2.38.5"
    std::string version;   // Tag with surrounding 'v' removed
    std::string html_url;  // Release page
};

struct UpdateNotice {
    Component component = Component::CliTool;
    std::string current_version;
    std::string latest_version;
    std::string url;
    bool update_available = false;

    /// One-line human message
    [[nodiscard]] std::string message() const;
};

/// Extract "N.N.N" from the CLI tool's version output ("spicetify v2.36.11").
/// Falls back to the trimmed output without surrounding 'v', or "0.0.0" if empty.
[[nodiscard]] std::string parse_cli_version(std::string_view output);

/// Strip whitespace, then leading and trailing 'v' characters
[[nodiscard]] std::string normalize_version(std::string_view tag);

/// Parse a releases/latest payload. Requires tag_name; html_url may be absent.
[[nodiscard]] std::optional<ReleaseInfo> parse_release(std::string_view json);

class UpdateChecker {
public:
    explicit UpdateChecker(network::IRestClient& client, std::string api_host = "api.github.com");

    /// GET /repos/<owner>/<name>/releases/latest
    [[nodiscard]] std::optional<ReleaseInfo> fetch_latest_release(std::string_view repo);

    /// Compare `current_version` with the latest release of `repo`
    [[nodiscard]] std::optional<UpdateNotice> check(Component component,
                                                    std::string_view current_version,
                                                    std::string_view repo);

    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }

private:
    network::IRestClient& client_;
    std::string api_host_;
    std::string last_error_;
};

}  // namespace spicedeck::github
