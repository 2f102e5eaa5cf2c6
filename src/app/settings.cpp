// ============================================================================
// SPICEDECK - Application Settings Implementation
// ============================================================================

#include "spicedeck/app/settings.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace spicedeck::app {

AppSettings load_settings(const std::filesystem::path& path) {
    AppSettings settings;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_INFO("No settings at {}, using defaults", path.string());
        return settings;
    }

    try {
        YAML::Node yaml = YAML::LoadFile(path.string());

        // UI
        if (yaml["ui"]) {
            auto ui = yaml["ui"];
            settings.theme = ui["theme"].as<std::string>(settings.theme);
            if (ui["visible_tabs"] && ui["visible_tabs"].IsMap()) {
                for (const auto& tab : ui["visible_tabs"]) {
                    settings.visible_tabs[tab.first.as<std::string>()] = tab.second.as<bool>(true);
                }
            }
        }

        // Marketplace
        if (yaml["marketplace"] && yaml["marketplace"]["custom_repos"]) {
            for (const auto& repo : yaml["marketplace"]["custom_repos"]) {
                add_custom_repo(settings, repo.as<std::string>(""));
            }
        }

        if (yaml["spicetify"]) {
            settings.spicetify_config = yaml["spicetify"]["config_path"].as<std::string>("");
        }

        // GitHub
        if (yaml["github"]) {
            auto gh = yaml["github"];
            settings.api_host = gh["api_host"].as<std::string>(settings.api_host);
            settings.user_agent = gh["user_agent"].as<std::string>(settings.user_agent);
            settings.encrypted_token = gh["encrypted_token"].as<std::string>("");
        }

        // Rate limit
        if (yaml["rate_limit"]) {
            auto rl = yaml["rate_limit"];
            settings.rate_limit_capacity = rl["capacity"].as<int>(settings.rate_limit_capacity);
            settings.rate_limit_window_seconds =
                rl["window_seconds"].as<double>(settings.rate_limit_window_seconds);
        }

        // Updates
        if (yaml["updates"]) {
            auto up = yaml["updates"];
            settings.cli_repo = up["cli_repo"].as<std::string>(settings.cli_repo);
            settings.app_repo = up["app_repo"].as<std::string>(settings.app_repo);
            settings.app_version = up["app_version"].as<std::string>(settings.app_version);
        }

        // Logging
        if (yaml["logging"]) {
            settings.log_level = yaml["logging"]["level"].as<std::string>(settings.log_level);
            settings.log_file = yaml["logging"]["file"].as<std::string>(settings.log_file);
        }

    } catch (const YAML::Exception& e) {
        LOG_ERROR("Settings load failed ({}): {}", path.string(), e.what());
        return AppSettings{};
    }

    return settings;
}

bool save_settings(const std::filesystem::path& path, const AppSettings& settings) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "ui" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "theme" << YAML::Value << settings.theme;
    out << YAML::Key << "visible_tabs" << YAML::Value << YAML::BeginMap;
    for (const auto& [tab, visible] : settings.visible_tabs) {
        out << YAML::Key << tab << YAML::Value << visible;
    }
    out << YAML::EndMap << YAML::EndMap;

    out << YAML::Key << "marketplace" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "custom_repos" << YAML::Value << YAML::BeginSeq;
    for (const auto& repo : settings.custom_repos) {
        out << repo;
    }
    out << YAML::EndSeq << YAML::EndMap;

    out << YAML::Key << "spicetify" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "config_path" << YAML::Value << settings.spicetify_config;
    out << YAML::EndMap;

    out << YAML::Key << "github" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "api_host" << YAML::Value << settings.api_host;
    out << YAML::Key << "user_agent" << YAML::Value << settings.user_agent;
    out << YAML::Key << "encrypted_token" << YAML::Value << settings.encrypted_token;
    out << YAML::EndMap;

    out << YAML::Key << "rate_limit" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "capacity" << YAML::Value << settings.rate_limit_capacity;
    out << YAML::Key << "window_seconds" << YAML::Value << settings.rate_limit_window_seconds;
    out << YAML::EndMap;

    out << YAML::Key << "updates" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "cli_repo" << YAML::Value << settings.cli_repo;
    out << YAML::Key << "app_repo" << YAML::Value << settings.app_repo;
    out << YAML::Key << "app_version" << YAML::Value << settings.app_version;
    out << YAML::EndMap;

    out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << settings.log_level;
    out << YAML::Key << "file" << YAML::Value << settings.log_file;
    out << YAML::EndMap;

    out << YAML::EndMap;

    if (!out.good()) {
        LOG_ERROR("Settings serialization failed: {}", out.GetLastError());
        return false;
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream file(path, std::ios::trunc);
    file << out.c_str() << '\n';
    file.close();
    if (!file) {
        LOG_ERROR("Cannot write settings to {}", path.string());
        return false;
    }

    LOG_DEBUG("Settings saved to {}", path.string());
    return true;
}

bool add_custom_repo(AppSettings& settings, std::string_view url) {
    if (url.empty()) return false;
    auto& repos = settings.custom_repos;
    if (std::find(repos.begin(), repos.end(), url) != repos.end()) {
        return false;
    }
    repos.emplace_back(url);
    return true;
}

bool remove_custom_repo(AppSettings& settings, std::string_view url) {
    auto& repos = settings.custom_repos;
    auto it = std::find(repos.begin(), repos.end(), url);
    if (it == repos.end()) {
        return false;
    }
    repos.erase(it);
    return true;
}

network::RestClientConfig to_rest_config(const AppSettings& settings) {
    network::RestClientConfig config;
    config.user_agent = settings.user_agent;
    config.rate_limit_capacity = settings.rate_limit_capacity;
    config.rate_limit_window = Seconds{settings.rate_limit_window_seconds};
    return config;
}

utils::LogConfig to_log_config(const AppSettings& settings) {
    utils::LogConfig config;
    config.level = utils::parse_log_level(settings.log_level);
    config.log_file = settings.log_file;
    return config;
}

}  // namespace spicedeck::app
