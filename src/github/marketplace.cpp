// ============================================================================
// SPICEDECK - Extension Marketplace Implementation
// ============================================================================

#include "spicedeck/github/marketplace.hpp"
#include "spicedeck/utils/logger.hpp"

#include <simdjson.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace spicedeck::github {

// ============================================================================
// Listing Helpers
// ============================================================================

static std::string lowercase(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static bool has_js_extension(std::string_view name) {
    constexpr std::string_view ext = ".js";
    return name.size() > ext.size() && name.substr(name.size() - ext.size()) == ext;
}

bool matches_query(std::string_view name, std::string_view query) {
    if (query.empty()) return true;
    return lowercase(name).find(lowercase(query)) != std::string::npos;
}

std::optional<std::vector<MarketplaceEntry>>
parse_listing(std::string_view json, std::string_view source) {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(json);

    simdjson::ondemand::document doc;
    if (parser.iterate(padded).get(doc)) {
        return std::nullopt;
    }

    simdjson::ondemand::array items;
    if (doc.get_array().get(items)) {
        return std::nullopt;
    }

    std::vector<MarketplaceEntry> entries;
    for (auto item : items) {
        simdjson::ondemand::object obj;
        if (item.get_object().get(obj)) {
            return std::nullopt;
        }

        std::string_view name;
        if (obj.find_field_unordered("name").get_string().get(name)) {
            continue;
        }
        if (!has_js_extension(name)) {
            continue;
        }
        MarketplaceEntry entry;
        entry.name = std::string(name);

        // Directories carry a null download_url
        std::string_view download_url;
        if (obj.find_field_unordered("download_url").get_string().get(download_url)) {
            continue;
        }
        entry.download_url = std::string(download_url);
        entry.source = std::string(source);
        entries.push_back(std::move(entry));
    }

    return entries;
}

// ============================================================================
// MarketplaceClient
// ============================================================================

MarketplaceClient::MarketplaceClient(network::IRestClient& client,
                                     std::vector<std::string> custom_repos)
    : client_(client) {
    repositories_.emplace_back(kDefaultExtensionsRepo);
    for (auto& repo : custom_repos) {
        if (std::find(repositories_.begin(), repositories_.end(), repo) == repositories_.end()) {
            repositories_.push_back(std::move(repo));
        }
    }
}

std::optional<std::vector<MarketplaceEntry>> MarketplaceClient::search(std::string_view query) {
    SCOPED_TIMER("marketplace search");
    last_error_.clear();

    std::vector<MarketplaceEntry> results;
    for (const auto& repo : repositories_) {
        auto response = client_.get(repo);
        if (response.status_code != 200) {
            last_error_ = "Failed to fetch extensions from " + repo + ": " + response.status_line();
            LOG_ERROR("{}", last_error_);
            return std::nullopt;
        }

        auto listing = parse_listing(response.body, repo);
        if (!listing) {
            last_error_ = "Malformed extension listing from " + repo;
            LOG_ERROR("{}", last_error_);
            return std::nullopt;
        }

        for (auto& entry : *listing) {
            if (matches_query(entry.name, query)) {
                results.push_back(std::move(entry));
            }
        }
    }

    LOG_INFO("Marketplace search '{}' matched {} extension(s) across {} repositories",
             query, results.size(), repositories_.size());
    return results;
}

bool MarketplaceClient::install(const MarketplaceEntry& entry,
                                const std::filesystem::path& extensions_dir) {
    last_error_.clear();

    const std::filesystem::path file_name(entry.name);
    if (entry.name.empty() || file_name.filename() != file_name ||
        entry.name == "." || entry.name == "..") {
        last_error_ = "Refusing to install extension with unsafe name '" + entry.name + "'";
        LOG_ERROR("{}", last_error_);
        return false;
    }

    auto response = client_.get(entry.download_url);
    if (response.status_code != 200) {
        last_error_ = "Failed to download extension " + entry.name + ": " + response.status_line();
        LOG_ERROR("{}", last_error_);
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(extensions_dir, ec);
    if (ec) {
        last_error_ = "Cannot create " + extensions_dir.string() + ": " + ec.message();
        LOG_ERROR("{}", last_error_);
        return false;
    }

    const auto target = extensions_dir / file_name;
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    out.write(response.body.data(), static_cast<std::streamsize>(response.body.size()));
    out.close();
    if (!out) {
        last_error_ = "Failed to write " + target.string();
        LOG_ERROR("{}", last_error_);
        return false;
    }

    LOG_INFO("Installed extension {} ({} bytes) into {}", entry.name, response.body.size(),
             extensions_dir.string());
    return true;
}

}  // namespace spicedeck::github
