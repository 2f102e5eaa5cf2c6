// ============================================================================
// SPICEDECK - Local Inventory Implementation
// ============================================================================

#include "spicedeck/app/inventory.hpp"
#include "spicedeck/github/marketplace.hpp"
#include "spicedeck/utils/logger.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <system_error>

namespace spicedeck::app {

namespace fs = std::filesystem;

static std::string to_lower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// ============================================================================
// Config Discovery
// ============================================================================

SpicetifyLayout layout_for(const fs::path& config_file) {
    const auto root = config_file.parent_path();
    SpicetifyLayout layout;
    layout.config_file = config_file;
    layout.extensions_dir = root / "Extensions";
    layout.themes_dir = root / "Themes";
    layout.custom_apps_dir = root / "CustomApps";
    return layout;
}

std::vector<fs::path> config_candidates(const fs::path& home) {
    return {
        home / ".spicetify" / "config.ini",
        home / ".config" / "spicetify" / "config.ini",
        home / "AppData" / "Roaming" / "spicetify" / "config.ini",
    };
}

std::optional<fs::path> home_directory() {
    for (const char* name : {"HOME", "USERPROFILE"}) {
        const char* value = std::getenv(name);
        if (value && *value) {
            return fs::path(value);
        }
    }
    return std::nullopt;
}

std::optional<fs::path> find_config_path(const fs::path& home, const fs::path& configured) {
    std::error_code ec;
    if (!configured.empty()) {
        if (fs::is_regular_file(configured, ec)) {
            return configured;
        }
        LOG_WARN("Configured config.ini {} does not exist, searching defaults", configured.string());
    }

    if (home.empty()) {
        return std::nullopt;
    }
    for (const auto& candidate : config_candidates(home)) {
        if (fs::is_regular_file(candidate, ec)) {
            LOG_DEBUG("Found config.ini at {}", candidate.string());
            return candidate;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Listings
// ============================================================================

std::optional<ExtensionSort> parse_extension_sort(std::string_view name) {
    const auto lowered = to_lower(name);
    if (lowered == "name") return ExtensionSort::Name;
    if (lowered == "date") return ExtensionSort::DateModified;
    return std::nullopt;
}

std::vector<InstalledExtension> list_extensions(const fs::path& dir, std::string_view query,
                                                ExtensionSort sort) {
    std::vector<InstalledExtension> out;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        LOG_DEBUG("No extensions folder at {}", dir.string());
        return out;
    }

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry.path().extension() != ".js") {
            continue;
        }
        auto name = entry.path().filename().string();
        if (!github::matches_query(name, query)) {
            continue;
        }

        InstalledExtension ext;
        ext.name = std::move(name);
        ext.size_bytes = entry.file_size(entry_ec);
        if (!entry_ec) {
            ext.modified = entry.last_write_time(entry_ec);
        }
        if (entry_ec) {
            LOG_WARN("Cannot stat {}: {}", entry.path().string(), entry_ec.message());
            continue;
        }
        out.push_back(std::move(ext));
    }
    if (ec) {
        LOG_WARN("Listing {} stopped early: {}", dir.string(), ec.message());
    }

    std::sort(out.begin(), out.end(), [](const InstalledExtension& a, const InstalledExtension& b) {
        return to_lower(a.name) < to_lower(b.name);
    });
    if (sort == ExtensionSort::DateModified) {
        std::stable_sort(out.begin(), out.end(),
                         [](const InstalledExtension& a, const InstalledExtension& b) {
                             return a.modified > b.modified;
                         });
    }
    return out;
}

std::vector<std::string> list_subdirectories(const fs::path& dir) {
    std::vector<std::string> out;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        LOG_DEBUG("No folder at {}", dir.string());
        return out;
    }

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::error_code entry_ec;
        if (entry.is_directory(entry_ec)) {
            out.push_back(entry.path().filename().string());
        }
    }
    if (ec) {
        LOG_WARN("Listing {} stopped early: {}", dir.string(), ec.message());
    }

    std::sort(out.begin(), out.end());
    return out;
}

std::string format_modified(fs::file_time_type time) {
    const auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        time - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return fmt::format("{:%Y-%m-%d %H:%M:%S}",
                       fmt::localtime(std::chrono::system_clock::to_time_t(system_time)));
}

}  // namespace spicedeck::app
