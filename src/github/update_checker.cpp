// ============================================================================
// SPICEDECK - Update Checker Implementation
// ============================================================================

#include "spicedeck/github/update_checker.hpp"
#include "spicedeck/utils/logger.hpp"

#include <simdjson.h>

#include <cctype>
#include <regex>

namespace spicedeck::github {

static std::string_view trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

std::string normalize_version(std::string_view tag) {
    auto value = trim(tag);
    while (!value.empty() && value.front() == 'v') value.remove_prefix(1);
    while (!value.empty() && value.back() == 'v') value.remove_suffix(1);
    return std::string(value);
}

std::string parse_cli_version(std::string_view output) {
    static const std::regex version_re(R"(v?(\d+\.\d+\.\d+))");

    const std::string text(output);
    std::smatch match;
    if (std::regex_search(text, match, version_re)) {
        return match[1].str();
    }

    auto fallback = normalize_version(output);
    return fallback.empty() ? "0.0.0" : fallback;
}

std::optional<ReleaseInfo> parse_release(std::string_view json) {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(json);

    simdjson::ondemand::document doc;
    if (parser.iterate(padded).get(doc)) {
        return std::nullopt;
    }

    simdjson::ondemand::object obj;
    if (doc.get_object().get(obj)) {
        return std::nullopt;
    }

    ReleaseInfo info;
    std::string_view tag;
    if (obj.find_field_unordered("tag_name").get_string().get(tag)) {
        return std::nullopt;
    }
    info.tag = std::string(tag);
    info.version = normalize_version(tag);

    std::string_view html_url;
    if (!obj.find_field_unordered("html_url").get_string().get(html_url)) {
        info.html_url = std::string(html_url);
    }
    return info;
}

std::string UpdateNotice::message() const {
    if (!update_available) {
        return "You have the latest version of " + std::string(to_string(component)) +
               " (" + current_version + ").";
    }
    return "A new version of " + std::string(to_string(component)) + " is available (" +
           latest_version + ", installed " + current_version + "): " + url;
}

// ============================================================================
// UpdateChecker
// ============================================================================

UpdateChecker::UpdateChecker(network::IRestClient& client, std::string api_host)
    : client_(client), api_host_(std::move(api_host)) {}

std::optional<ReleaseInfo> UpdateChecker::fetch_latest_release(std::string_view repo) {
    last_error_.clear();

    const std::string url = "https://" + api_host_ + "/repos/" + std::string(repo) + "/releases/latest";
    auto response = client_.get(url);
    if (!response.is_success()) {
        last_error_ = "Could not check for updates of " + std::string(repo) + ": " +
                      response.status_line();
        LOG_WARN("{}", last_error_);
        return std::nullopt;
    }

    auto release = parse_release(response.body);
    if (!release) {
        last_error_ = "Release payload for " + std::string(repo) + " has no tag_name";
        LOG_WARN("{}", last_error_);
        return std::nullopt;
    }
    return release;
}

std::optional<UpdateNotice> UpdateChecker::check(Component component,
                                                 std::string_view current_version,
                                                 std::string_view repo) {
    auto release = fetch_latest_release(repo);
    if (!release) {
        return std::nullopt;
    }

    UpdateNotice notice;
    notice.component = component;
    notice.current_version = normalize_version(current_version);
    notice.latest_version = release->version;
    notice.url = release->html_url;
    notice.update_available = notice.current_version != notice.latest_version;

    LOG_INFO("{}: installed {}, latest {}", to_string(component),
             notice.current_version, notice.latest_version);
    return notice;
}

}  // namespace spicedeck::github
