#pragma once
// ============================================================================
// SPICEDECK - Local Inventory
// ============================================================================
// Finds the CLI tool's config.ini and lists what is installed next to it:
// extension scripts, themes and custom apps
// ============================================================================

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spicedeck::app {

/// Folders the CLI tool keeps beside its config.ini
struct SpicetifyLayout {
    std::filesystem::path config_file;
    std::filesystem::path extensions_dir;   // <config dir>/Extensions
    std::filesystem::path themes_dir;       // <config dir>/Themes
    std::filesystem::path custom_apps_dir;  // <config dir>/CustomApps
};

[[nodiscard]] SpicetifyLayout layout_for(const std::filesystem::path& config_file);

/// Usual config.ini locations under a home directory, in search order
[[nodiscard]] std::vector<std::filesystem::path> config_candidates(const std::filesystem::path& home);

/// $HOME, or %USERPROFILE% on Windows; nullopt when neither is set
[[nodiscard]] std::optional<std::filesystem::path> home_directory();

/// A configured path wins when it names an existing file. Otherwise the first
/// existing candidate under `home` is returned.
[[nodiscard]] std::optional<std::filesystem::path>
find_config_path(const std::filesystem::path& home, const std::filesystem::path& configured = {});

// ============================================================================
// Installed Items
// ============================================================================

struct InstalledExtension {
    std::string name;                         // File name, e.g. "shuffle+.js"
    std::uintmax_t size_bytes = 0;
    std::filesystem::file_time_type modified;

    [[nodiscard]] double size_kb() const { return static_cast<double>(size_bytes) / 1024.0; }
};

enum class ExtensionSort {
    Name,           // Case-insensitive, A to Z
    DateModified    // Newest first
};

/// "name" or "date"; nullopt for anything else
[[nodiscard]] std::optional<ExtensionSort> parse_extension_sort(std::string_view name);

/// `.js` files in `dir` whose name contains `query` (case-insensitive).
/// A missing directory yields an empty list.
[[nodiscard]] std::vector<InstalledExtension>
list_extensions(const std::filesystem::path& dir, std::string_view query = {},
                ExtensionSort sort = ExtensionSort::Name);

/// Names of the subdirectories of `dir`, sorted; files are ignored
[[nodiscard]] std::vector<std::string> list_subdirectories(const std::filesystem::path& dir);

[[nodiscard]] inline std::vector<std::string> list_themes(const SpicetifyLayout& layout) {
    return list_subdirectories(layout.themes_dir);
}

[[nodiscard]] inline std::vector<std::string> list_custom_apps(const SpicetifyLayout& layout) {
    return list_subdirectories(layout.custom_apps_dir);
}

/// "2024-05-01 13:45:10" in local time
[[nodiscard]] std::string format_modified(std::filesystem::file_time_type time);

}  // namespace spicedeck::app
