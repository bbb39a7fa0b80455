/**
 * @file task_types.h
 * @brief Task record, sources and destinations
 */

#ifndef KCENON_ORCHESTRATOR_CORE_TASK_TYPES_H
#define KCENON_ORCHESTRATOR_CORE_TASK_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "kcenon/orchestrator/core/error_codes.h"
#include "kcenon/orchestrator/core/task_state.h"
#include "kcenon/orchestrator/core/types.h"

namespace kcenon::orchestrator {

// ============================================================================
// Sources
// ============================================================================

/**
 * @brief Plain HTTP(S)/FTP link
 */
struct direct_link_source {
    std::string url;
    std::string file_name;  ///< Optional name override, empty to use the server's

    [[nodiscard]] auto operator==(const direct_link_source&) const -> bool = default;
};

/**
 * @brief Magnet URI or .torrent location
 */
struct torrent_source {
    std::string uri;
    std::vector<std::size_t> selected_files;  ///< Empty selects every file

    [[nodiscard]] auto operator==(const torrent_source&) const -> bool = default;
};

/**
 * @brief Page URL on a video hosting site
 */
struct video_site_source {
    std::string url;
    std::string format = "best";

    [[nodiscard]] auto operator==(const video_site_source&) const -> bool = default;
};

/**
 * @brief File attached to a chat message (tg://... or chat:<chat>/<message>)
 */
struct chat_file_source {
    std::string reference;

    [[nodiscard]] auto operator==(const chat_file_source&) const -> bool = default;
};

using task_source = std::variant<direct_link_source,
                                 torrent_source,
                                 video_site_source,
                                 chat_file_source>;

enum class source_kind {
    direct_link,
    torrent,
    video_site,
    chat_file
};

[[nodiscard]] constexpr auto to_string(source_kind kind) noexcept -> const char* {
    switch (kind) {
        case source_kind::direct_link: return "direct_link";
        case source_kind::torrent: return "torrent";
        case source_kind::video_site: return "video_site";
        case source_kind::chat_file: return "chat_file";
        default: return "unknown";
    }
}

[[nodiscard]] auto source_kind_from_string(std::string_view name) -> std::optional<source_kind>;
[[nodiscard]] auto kind_of(const task_source& source) -> source_kind;

/**
 * @brief Primary locator of a source (URL, URI or chat reference)
 */
[[nodiscard]] auto locator_of(const task_source& source) -> const std::string&;

// ============================================================================
// Destinations
// ============================================================================

/**
 * @brief Folder on a cloud drive
 */
struct cloud_drive_destination {
    std::string folder_id;
    bool shared_drive = false;

    [[nodiscard]] auto operator==(const cloud_drive_destination&) const -> bool = default;
};

/**
 * @brief Remote of a storage sync tool, as `remote:path`
 */
struct remote_storage_destination {
    std::string remote;
    std::string path;

    [[nodiscard]] auto operator==(const remote_storage_destination&) const -> bool = default;
};

/**
 * @brief Delivery back into a chat
 */
struct chat_delivery_destination {
    std::string chat_id;
    bool as_document = true;

    [[nodiscard]] auto operator==(const chat_delivery_destination&) const -> bool = default;
};

using task_destination = std::variant<cloud_drive_destination,
                                      remote_storage_destination,
                                      chat_delivery_destination>;

enum class destination_kind {
    cloud_drive,
    remote_storage,
    chat_delivery
};

[[nodiscard]] constexpr auto to_string(destination_kind kind) noexcept -> const char* {
    switch (kind) {
        case destination_kind::cloud_drive: return "cloud_drive";
        case destination_kind::remote_storage: return "remote_storage";
        case destination_kind::chat_delivery: return "chat_delivery";
        default: return "unknown";
    }
}

[[nodiscard]] auto destination_kind_from_string(std::string_view name)
    -> std::optional<destination_kind>;
[[nodiscard]] auto kind_of(const task_destination& destination) -> destination_kind;

/**
 * @brief Human readable target (`drive:<folder>`, `remote:path`, `chat:<id>`)
 */
[[nodiscard]] auto describe(const task_destination& destination) -> std::string;

// ============================================================================
// Task record
// ============================================================================

/**
 * @brief Admission priority class
 */
enum class task_priority {
    normal,
    elevated  ///< Sudo/admin requests, dequeued ahead of normal entries
};

[[nodiscard]] constexpr auto to_string(task_priority priority) noexcept -> const char* {
    switch (priority) {
        case task_priority::normal: return "normal";
        case task_priority::elevated: return "elevated";
        default: return "unknown";
    }
}

/**
 * @brief Advisory progress of the current stage
 */
struct transfer_progress {
    uint64_t transferred_bytes = 0;
    std::optional<uint64_t> total_bytes;
    double rate = 0.0;  ///< Bytes per second
    std::optional<std::chrono::milliseconds> eta;

    [[nodiscard]] auto completion_percentage() const noexcept -> std::optional<double> {
        if (!total_bytes || *total_bytes == 0) {
            return std::nullopt;
        }
        return static_cast<double>(transferred_bytes) /
               static_cast<double>(*total_bytes) * 100.0;
    }
};

/**
 * @brief Snapshot of one orchestrated transfer pipeline
 *
 * One source, one or more destinations. Instances handed out by the
 * scheduler are copies; mutating them has no effect on the task.
 */
struct task_record {
    task_id id;
    std::string owner_id;
    task_priority priority = task_priority::normal;

    task_source source;
    std::vector<task_destination> destinations;
    std::size_t destination_index = 0;

    task_state state = task_state::queued;
    transfer_progress progress;

    uint32_t retry_count = 0;
    uint32_t max_retries = 0;

    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;

    std::optional<task_error> error;
    std::optional<std::size_t> queue_position;

    std::filesystem::path downloaded_path;
    std::vector<std::string> upload_results;

    [[nodiscard]] auto is_terminal() const noexcept -> bool { return is_terminal_state(state); }
    [[nodiscard]] auto download_complete() const noexcept -> bool {
        return !downloaded_path.empty();
    }
};

/**
 * @brief Order records for listings
 *
 * Active tasks by start time, then queued tasks by queue position (tasks
 * waiting out a retry backoff after those, by creation time), then
 * terminal tasks by finish time. Ties fall back to task id.
 */
void sort_for_listing(std::vector<task_record>& records);

}  // namespace kcenon::orchestrator

#endif  // KCENON_ORCHESTRATOR_CORE_TASK_TYPES_H
