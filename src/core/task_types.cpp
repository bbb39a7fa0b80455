/**
 * @file task_types.cpp
 * @brief Helpers for task sources, destinations and records
 */

#include "kcenon/orchestrator/core/task_types.h"

#include <algorithm>
#include <tuple>
#include <type_traits>

namespace kcenon::orchestrator {

auto source_kind_from_string(std::string_view name) -> std::optional<source_kind> {
    for (auto kind : {source_kind::direct_link, source_kind::torrent,
                      source_kind::video_site, source_kind::chat_file}) {
        if (name == to_string(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

auto kind_of(const task_source& source) -> source_kind {
    // Alternative order matches source_kind
    return static_cast<source_kind>(source.index());
}

auto locator_of(const task_source& source) -> const std::string& {
    return std::visit(
        [](const auto& s) -> const std::string& {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, torrent_source>) {
                return s.uri;
            } else if constexpr (std::is_same_v<T, chat_file_source>) {
                return s.reference;
            } else {
                return s.url;
            }
        },
        source);
}

auto destination_kind_from_string(std::string_view name)
    -> std::optional<destination_kind> {
    for (auto kind : {destination_kind::cloud_drive, destination_kind::remote_storage,
                      destination_kind::chat_delivery}) {
        if (name == to_string(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

auto kind_of(const task_destination& destination) -> destination_kind {
    return static_cast<destination_kind>(destination.index());
}

auto describe(const task_destination& destination) -> std::string {
    return std::visit(
        [](const auto& d) -> std::string {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, cloud_drive_destination>) {
                return (d.shared_drive ? "shared-drive:" : "drive:") + d.folder_id;
            } else if constexpr (std::is_same_v<T, remote_storage_destination>) {
                return d.remote + ":" + d.path;
            } else {
                return "chat:" + d.chat_id;
            }
        },
        destination);
}

void sort_for_listing(std::vector<task_record>& records) {
    auto group = [](const task_record& r) -> int {
        if (is_active_state(r.state)) return 0;
        if (r.state == task_state::queued) return 1;
        return 2;
    };

    auto epoch = std::chrono::system_clock::time_point{};
    auto key = [&](const task_record& r) {
        int g = group(r);
        std::size_t position = 0;
        auto when = epoch;
        if (g == 0) {
            when = r.started_at.value_or(r.created_at);
        } else if (g == 1) {
            // Entries without a position are backing off before re-entering the queue
            position = r.queue_position.value_or(static_cast<std::size_t>(-1));
            when = r.created_at;
        } else {
            when = r.finished_at.value_or(r.created_at);
        }
        return std::make_tuple(g, position, when, r.id.value);
    };

    std::stable_sort(records.begin(), records.end(),
        [&](const task_record& a, const task_record& b) { return key(a) < key(b); });
}

}  // namespace kcenon::orchestrator
