/**
 * @file source_classifier.cpp
 * @brief Implementation of source_classifier
 */

#include "kcenon/orchestrator/core/source_classifier.h"

#include <algorithm>
#include <cctype>

namespace kcenon::orchestrator {

namespace {

auto to_lower(std::string_view s) -> std::string {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

auto starts_with(std::string_view s, std::string_view prefix) -> bool {
    return s.substr(0, prefix.size()) == prefix;
}

auto ends_with(std::string_view s, std::string_view suffix) -> bool {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

/**
 * Host of an absolute URL, without user-info or port. Empty if absent.
 */
auto host_of(std::string_view url) -> std::string {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return {};
    }
    auto rest = url.substr(scheme_end + 3);
    auto authority = rest.substr(0, rest.find_first_of("/?#"));
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }
    auto colon = authority.find(':');
    if (colon != std::string_view::npos) {
        authority = authority.substr(0, colon);
    }
    return to_lower(authority);
}

/**
 * Path of a URL without query or fragment, lowercased.
 */
auto path_of(std::string_view url) -> std::string {
    auto cut = url.find_first_of("?#");
    return to_lower(url.substr(0, cut));
}

}  // namespace

source_classifier::source_classifier()
    : video_hosts_{"youtube.com", "youtu.be", "vimeo.com", "dailymotion.com",
                   "twitch.tv", "tiktok.com", "instagram.com", "twitter.com",
                   "x.com", "facebook.com", "soundcloud.com", "bilibili.com"} {}

source_classifier::source_classifier(std::vector<std::string> video_hosts)
    : video_hosts_(std::move(video_hosts)) {
    for (auto& host : video_hosts_) {
        host = to_lower(host);
    }
}

void source_classifier::add_video_host(std::string host) {
    host = to_lower(host);
    if (std::find(video_hosts_.begin(), video_hosts_.end(), host) == video_hosts_.end()) {
        video_hosts_.push_back(std::move(host));
    }
}

auto source_classifier::is_video_host(std::string_view host) const -> bool {
    return std::any_of(video_hosts_.begin(), video_hosts_.end(),
        [host](const std::string& known) {
            if (host == known) {
                return true;
            }
            // Subdomains such as www. or m.
            return host.size() > known.size() &&
                   ends_with(host, known) &&
                   host[host.size() - known.size() - 1] == '.';
        });
}

auto source_classifier::classify(std::string_view link) const -> result<task_source> {
    auto trimmed = trim(link);
    if (trimmed.empty()) {
        return unexpected{error{error_code::invalid_source, "empty link"}};
    }

    std::string lower = to_lower(trimmed);
    std::string original(trimmed);

    if (starts_with(lower, "magnet:")) {
        return task_source{torrent_source{original, {}}};
    }
    if (starts_with(lower, "tg://") || starts_with(lower, "chat:")) {
        return task_source{chat_file_source{original}};
    }

    bool is_http = starts_with(lower, "http://") || starts_with(lower, "https://");
    bool is_ftp = starts_with(lower, "ftp://");

    if (ends_with(path_of(lower), ".torrent")) {
        if (is_http || is_ftp || lower.find("://") == std::string::npos) {
            return task_source{torrent_source{original, {}}};
        }
    }

    if (!is_http && !is_ftp) {
        return unexpected{error{error_code::invalid_source,
            "unsupported link scheme: " + std::string(trimmed.substr(0, trimmed.find(':')))}};
    }

    auto host = host_of(lower);
    if (host.empty()) {
        return unexpected{error{error_code::invalid_source, "link has no host"}};
    }

    if (is_http && is_video_host(host)) {
        return task_source{video_site_source{original, "best"}};
    }
    return task_source{direct_link_source{original, {}}};
}

auto source_classifier::validate(const task_source& source) -> result<void> {
    const auto& locator = locator_of(source);
    if (trim(locator).empty()) {
        return unexpected{error{error_code::invalid_source,
            std::string("empty locator for ") + to_string(kind_of(source)) + " source"}};
    }

    auto lower = to_lower(locator);
    switch (kind_of(source)) {
        case source_kind::direct_link:
            if (!starts_with(lower, "http://") && !starts_with(lower, "https://") &&
                !starts_with(lower, "ftp://")) {
                return unexpected{error{error_code::invalid_source,
                    "direct link must be http, https or ftp"}};
            }
            if (host_of(lower).empty()) {
                return unexpected{error{error_code::invalid_source, "link has no host"}};
            }
            break;
        case source_kind::torrent:
            if (!starts_with(lower, "magnet:") && !ends_with(path_of(lower), ".torrent")) {
                return unexpected{error{error_code::invalid_source,
                    "torrent source must be a magnet URI or .torrent file"}};
            }
            break;
        case source_kind::video_site:
            if (!starts_with(lower, "http://") && !starts_with(lower, "https://")) {
                return unexpected{error{error_code::invalid_source,
                    "video site source must be an http(s) URL"}};
            }
            break;
        case source_kind::chat_file:
            if (!starts_with(lower, "tg://") && !starts_with(lower, "chat:")) {
                return unexpected{error{error_code::invalid_source,
                    "chat file reference must use tg:// or chat:"}};
            }
            break;
    }
    return {};
}

}  // namespace kcenon::orchestrator
