/**
 * @file source_classifier.h
 * @brief Classification of raw user links into task sources
 */

#ifndef KCENON_ORCHESTRATOR_CORE_SOURCE_CLASSIFIER_H
#define KCENON_ORCHESTRATOR_CORE_SOURCE_CLASSIFIER_H

#include <string>
#include <string_view>
#include <vector>

#include "kcenon/orchestrator/core/task_types.h"
#include "kcenon/orchestrator/core/types.h"

namespace kcenon::orchestrator {

/**
 * @brief Maps a raw link to the source variant that can service it
 *
 * Rules, first match wins:
 * - `magnet:` URIs and locations ending in `.torrent` -> torrent_source
 * - `tg://` and `chat:` references -> chat_file_source
 * - http(s) URLs whose host is a known video site -> video_site_source
 * - remaining http, https and ftp URLs -> direct_link_source
 * - anything else -> invalid_source
 *
 * @code
 * source_classifier classifier;
 * auto src = classifier.classify("magnet:?xt=urn:btih:...");
 * @endcode
 */
class source_classifier {
public:
    source_classifier();
    explicit source_classifier(std::vector<std::string> video_hosts);

    [[nodiscard]] auto classify(std::string_view link) const -> result<task_source>;

    /**
     * @brief Add a host (and its subdomains) treated as a video site
     */
    void add_video_host(std::string host);

    [[nodiscard]] auto video_hosts() const -> const std::vector<std::string>& {
        return video_hosts_;
    }

    /**
     * @brief Check that a source carries a usable locator for its kind
     */
    [[nodiscard]] static auto validate(const task_source& source) -> result<void>;

private:
    [[nodiscard]] auto is_video_host(std::string_view host) const -> bool;

    std::vector<std::string> video_hosts_;
};

}  // namespace kcenon::orchestrator

#endif  // KCENON_ORCHESTRATOR_CORE_SOURCE_CLASSIFIER_H
