#pragma once
// ============================================================================
// SPICEDECK - Extension Marketplace
// ============================================================================
// Lists extension scripts published in GitHub repositories (contents API)
// and downloads them into the local extensions folder
// ============================================================================

#include "spicedeck/network/rest_client.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spicedeck::github {

/// Community extension listing queried before any custom repository
inline constexpr std::string_view kDefaultExtensionsRepo =
    "https://api.github.com/repos/spicetify/spicetify-extensions/contents/Extensions";

struct MarketplaceEntry {
    std::string name;          // File name, e.g. "fullAppDisplay.js"
    std::string download_url;  // Raw file URL
    std::string source;        // Contents API URL it was listed from
};

/// Parse a contents API listing. Keeps `.js` files only; directories and
/// entries without a download URL are skipped. Returns nullopt on malformed JSON.
[[nodiscard]] std::optional<std::vector<MarketplaceEntry>>
parse_listing(std::string_view json, std::string_view source);

/// Case-insensitive substring match; an empty query matches everything
[[nodiscard]] bool matches_query(std::string_view name, std::string_view query);

class MarketplaceClient {
public:
    MarketplaceClient(network::IRestClient& client, std::vector<std::string> custom_repos = {});

    /// Query every repository in order. A failed repository aborts the search.
    [[nodiscard]] std::optional<std::vector<MarketplaceEntry>> search(std::string_view query);

    /// Download an entry into `extensions_dir`, creating the folder if needed
    [[nodiscard]] bool install(const MarketplaceEntry& entry,
                               const std::filesystem::path& extensions_dir);

    [[nodiscard]] const std::vector<std::string>& repositories() const noexcept { return repositories_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }

private:
    network::IRestClient& client_;
    std::vector<std::string> repositories_;
    std::string last_error_;
};

}  // namespace spicedeck::github
