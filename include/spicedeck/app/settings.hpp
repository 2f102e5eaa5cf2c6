#pragma once
// ============================================================================
// SPICEDECK - Application Settings
// ============================================================================
// YAML-backed user settings: UI preferences, marketplace repositories,
// the CLI tool's config location, the encrypted GitHub token, rate limit
// budget and logging
// ============================================================================

#include "spicedeck/network/rest_client.hpp"
#include "spicedeck/utils/logger.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace spicedeck::app {

/// Tabs of the manager, in display order
inline const std::vector<std::string>& tab_names() {
    static const std::vector<std::string> names = {
        "Extensions", "Themes", "Custom Apps", "Marketplace", "Advanced Settings", "Settings"};
    return names;
}

struct AppSettings {
    // UI
    std::string theme = "Dark";
    std::map<std::string, bool> visible_tabs = {
        {"Extensions", true},
        {"Themes", true},
        {"Custom Apps", true},
        {"Marketplace", true},
        {"Advanced Settings", true},
        {"Settings", false},
    };

    // Marketplace
    std::vector<std::string> custom_repos;

    // The CLI tool's config.ini; empty means look in the usual places
    std::string spicetify_config;

    // GitHub
    std::string api_host = "api.github.com";
    std::string user_agent = "SpiceDeck/1.0";
    std::string encrypted_token;

    // Rate limit (unauthenticated GitHub budget)
    int rate_limit_capacity = 60;
    double rate_limit_window_seconds = 3600.0;

    // Updates
    std::string cli_repo = "spicetify/spicetify-cli";
    std::string app_repo = "spicedeck/spicedeck";
    std::string app_version = "1.0.0";

    // Logging
    std::string log_level = "info";
    std::string log_file = "spicedeck.log";
};

/// Load settings; missing keys keep their defaults. A missing or malformed
/// file is logged and yields defaults.
[[nodiscard]] AppSettings load_settings(const std::filesystem::path& path);

/// Write the full settings document. Returns false (logged) on failure.
[[nodiscard]] bool save_settings(const std::filesystem::path& path, const AppSettings& settings);

/// Add a repository URL. Returns false if it is already listed or empty.
bool add_custom_repo(AppSettings& settings, std::string_view url);

/// Remove a repository URL. Returns false if it was not listed.
bool remove_custom_repo(AppSettings& settings, std::string_view url);

[[nodiscard]] network::RestClientConfig to_rest_config(const AppSettings& settings);
[[nodiscard]] utils::LogConfig to_log_config(const AppSettings& settings);

}  // namespace spicedeck::app
