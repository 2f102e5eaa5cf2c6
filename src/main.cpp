// ============================================================================
// SPICEDECK - Command Line Front-end
// ============================================================================
// Marketplace browsing, extension install, local inventory, update checks
// and token storage for the spicetify customization tool, over a
// rate-limited GitHub client
//
//   spicedeck [--config FILE] [--password PW] <command> [args]
// ============================================================================

#include "spicedeck/app/inventory.hpp"
#include "spicedeck/app/settings.hpp"
#include "spicedeck/github/marketplace.hpp"
#include "spicedeck/github/update_checker.hpp"
#include "spicedeck/network/rest_client.hpp"
#include "spicedeck/security/token_vault.hpp"
#include "spicedeck/utils/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace spicedeck;

namespace {

void print_usage() {
    std::cout <<
        "Usage: spicedeck [--config FILE] [--password PW] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  search [query]                      List marketplace extensions\n"
        "  install <name> [extensions_dir]     Download an extension\n"
        "  list-extensions [query] [--sort name|date]\n"
        "                                      List installed extensions\n"
        "  list-themes                         List installed themes\n"
        "  list-apps                           List installed custom apps\n"
        "  config-path [file]                  Show or set the spicetify config.ini\n"
        "  check-updates <cli_version_output>  Compare installed versions with releases\n"
        "  set-token <token> <password>        Encrypt and store a GitHub token\n"
        "  clear-token                         Forget the stored token\n"
        "  repo list | add <url> | remove <url>\n";
}

struct CommandLine {
    std::filesystem::path config_path = "config/spicedeck.yaml";
    std::optional<std::string> password;
    std::string sort = "name";
    std::vector<std::string> args;
};

CommandLine parse_args(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            cmd.config_path = argv[++i];
        } else if (arg == "--password" && i + 1 < argc) {
            cmd.password = argv[++i];
        } else if (arg == "--sort" && i + 1 < argc) {
            cmd.sort = argv[++i];
        } else {
            cmd.args.push_back(std::move(arg));
        }
    }
    return cmd;
}

// ============================================================================
// Session: settings plus the shared GitHub client
// ============================================================================

class Session {
public:
    Session(std::filesystem::path config_path, app::AppSettings settings,
            const std::optional<std::string>& password)
        : config_path_(std::move(config_path))
        , settings_(std::move(settings))
        , client_(app::to_rest_config(settings_)) {

        if (!settings_.encrypted_token.empty()) {
            if (!password) {
                LOG_WARN("A GitHub token is stored; pass --password to use it");
            } else if (auto token = security::TokenVault::decrypt(settings_.encrypted_token, *password)) {
                client_.set_token(*token);
                LOG_INFO("Using stored GitHub token");
            } else {
                LOG_ERROR("Failed to decrypt the stored GitHub token");
            }
        }
    }

    int search(const std::string& query) {
        github::MarketplaceClient marketplace(client_, settings_.custom_repos);
        auto results = marketplace.search(query);
        if (!results) {
            std::cerr << "Error: " << marketplace.last_error() << "\n";
            return 1;
        }
        for (const auto& entry : *results) {
            std::cout << entry.name << "\t" << entry.download_url << "\n";
        }
        report_budget();
        return 0;
    }

    int install(const std::string& name, std::filesystem::path dir) {
        if (dir.empty()) {
            auto found = layout();
            if (!found) {
                return 1;
            }
            dir = found->extensions_dir;
        }

        github::MarketplaceClient marketplace(client_, settings_.custom_repos);
        auto results = marketplace.search(name);
        if (!results) {
            std::cerr << "Error: " << marketplace.last_error() << "\n";
            return 1;
        }

        auto it = std::find_if(results->begin(), results->end(),
                               [&](const github::MarketplaceEntry& e) { return e.name == name; });
        if (it == results->end()) {
            std::cerr << "No extension named '" << name << "' in the marketplace\n";
            return 1;
        }

        if (!marketplace.install(*it, dir)) {
            std::cerr << "Error: " << marketplace.last_error() << "\n";
            return 1;
        }
        std::cout << "Extension '" << name << "' installed successfully.\n";
        return 0;
    }

    int list_extensions(const std::string& query, const std::string& sort_name) {
        auto sort = app::parse_extension_sort(sort_name);
        if (!sort) {
            std::cerr << "Unknown sort '" << sort_name << "', use name or date\n";
            return 1;
        }
        auto found = layout();
        if (!found) {
            return 1;
        }
        for (const auto& ext : app::list_extensions(found->extensions_dir, query, *sort)) {
            std::cout << ext.name << "\t" << fmt::format("{:.2f} KB", ext.size_kb()) << "\t"
                      << app::format_modified(ext.modified) << "\n";
        }
        return 0;
    }

    int list_themes() {
        auto found = layout();
        if (!found) {
            return 1;
        }
        for (const auto& theme : app::list_themes(*found)) {
            std::cout << theme << "\n";
        }
        return 0;
    }

    int list_apps() {
        auto found = layout();
        if (!found) {
            return 1;
        }
        for (const auto& name : app::list_custom_apps(*found)) {
            std::cout << name << "\n";
        }
        return 0;
    }

    int config_path(const std::optional<std::string>& path) {
        if (!path) {
            auto found = layout();
            if (!found) {
                return 1;
            }
            std::cout << found->config_file.string() << "\n";
            return 0;
        }
        std::error_code ec;
        if (!std::filesystem::is_regular_file(*path, ec)) {
            std::cerr << "No config.ini at " << *path << "\n";
            return 1;
        }
        settings_.spicetify_config = std::filesystem::absolute(*path, ec).string();
        return app::save_settings(config_path_, settings_) ? 0 : 1;
    }

    int check_updates(const std::string& cli_version_output) {
        github::UpdateChecker checker(client_, settings_.api_host);
        int status = 0;

        const auto cli_version = github::parse_cli_version(cli_version_output);
        if (auto notice = checker.check(Component::CliTool, cli_version, settings_.cli_repo)) {
            std::cout << notice->message() << "\n";
        } else {
            std::cerr << "Update check failed: " << checker.last_error() << "\n";
            status = 1;
        }

        if (auto notice = checker.check(Component::Manager, settings_.app_version, settings_.app_repo)) {
            std::cout << notice->message() << "\n";
        } else {
            std::cerr << "Update check failed: " << checker.last_error() << "\n";
            status = 1;
        }
        return status;
    }

    int set_token(const std::string& token, const std::string& password) {
        if (password.empty()) {
            std::cerr << "You must enter a password to encrypt the token.\n";
            return 1;
        }
        settings_.encrypted_token = security::TokenVault::encrypt(token, password);
        if (!app::save_settings(config_path_, settings_)) {
            return 1;
        }
        std::cout << "GitHub token saved and encrypted successfully.\n";
        return 0;
    }

    int clear_token() {
        settings_.encrypted_token.clear();
        return app::save_settings(config_path_, settings_) ? 0 : 1;
    }

    int repo(const std::vector<std::string>& args) {
        const std::string action = args.size() > 1 ? args[1] : "list";
        if (action == "list") {
            std::cout << github::kDefaultExtensionsRepo << "\n";
            for (const auto& repo : settings_.custom_repos) {
                std::cout << repo << "\n";
            }
            return 0;
        }
        if (args.size() < 3) {
            print_usage();
            return 1;
        }

        bool changed = false;
        if (action == "add") {
            changed = app::add_custom_repo(settings_, args[2]);
        } else if (action == "remove") {
            changed = app::remove_custom_repo(settings_, args[2]);
        } else {
            print_usage();
            return 1;
        }
        if (!changed) {
            std::cerr << "Repository list unchanged\n";
            return 1;
        }
        return app::save_settings(config_path_, settings_) ? 0 : 1;
    }

private:
    std::optional<app::SpicetifyLayout> layout() {
        auto config = app::find_config_path(app::home_directory().value_or(std::filesystem::path{}),
                                            settings_.spicetify_config);
        if (!config) {
            std::cerr << "Config.ini not found. Set it with: spicedeck config-path <file>\n";
            return std::nullopt;
        }
        return app::layout_for(*config);
    }

    void report_budget() {
        if (auto* limiter = client_.rate_limiter()) {
            LOG_DEBUG("Local budget: {}/{} calls left, GitHub reports {}",
                      limiter->remaining(), limiter->capacity(), client_.get_rate_limit_remaining());
        }
    }

    std::filesystem::path config_path_;
    app::AppSettings settings_;
    network::RestClient client_;
};

}  // namespace

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[]) {
    auto cmd = parse_args(argc, argv);
    if (cmd.args.empty() || cmd.args[0] == "help" || cmd.args[0] == "--help") {
        print_usage();
        return cmd.args.empty() ? 1 : 0;
    }

    try {
        auto settings = app::load_settings(cmd.config_path);
        utils::Logger::initialize(app::to_log_config(settings));
        LOG_DEBUG("Settings loaded from {}", cmd.config_path.string());

        Session session(cmd.config_path, std::move(settings), cmd.password);

        const auto& command = cmd.args[0];
        int status = 1;
        if (command == "search") {
            status = session.search(cmd.args.size() > 1 ? cmd.args[1] : "");
        } else if (command == "install" && cmd.args.size() >= 2) {
            status = session.install(cmd.args[1], cmd.args.size() > 2 ? cmd.args[2] : "");
        } else if (command == "list-extensions") {
            status = session.list_extensions(cmd.args.size() > 1 ? cmd.args[1] : "", cmd.sort);
        } else if (command == "list-themes") {
            status = session.list_themes();
        } else if (command == "list-apps") {
            status = session.list_apps();
        } else if (command == "config-path") {
            status = session.config_path(cmd.args.size() > 1 ? std::optional<std::string>(cmd.args[1])
                                                             : std::nullopt);
        } else if (command == "check-updates" && cmd.args.size() >= 2) {
            status = session.check_updates(cmd.args[1]);
        } else if (command == "set-token" && cmd.args.size() >= 3) {
            status = session.set_token(cmd.args[1], cmd.args[2]);
        } else if (command == "clear-token") {
            status = session.clear_token();
        } else if (command == "repo") {
            status = session.repo(cmd.args);
        } else {
            print_usage();
        }

        utils::Logger::shutdown();
        return status;

    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] Invalid configuration: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[CRITICAL] Unhandled exception: " << e.what() << "\n";
        return 1;
    }
}
