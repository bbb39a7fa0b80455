/**
 * @file task_journal.cpp
 * @brief Implementation of task_journal
 */

#include "kcenon/orchestrator/persistence/task_journal.h"

#include <algorithm>
#include <fstream>
#include <mutex>
#include <sstream>
#include <type_traits>

#include "core/json_format.h"
#include "kcenon/orchestrator/core/logging.h"

namespace kcenon::orchestrator {

namespace {

using detail::flat_json_object;
using detail::flat_json_writer;

auto time_point_to_ms(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

auto ms_to_time_point(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(ms)));
}

auto join_indices(const std::vector<std::size_t>& indices) -> std::string {
    std::string joined;
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) {
            joined += ',';
        }
        joined += std::to_string(indices[i]);
    }
    return joined;
}

auto split_indices(const std::string& text) -> std::optional<std::vector<std::size_t>> {
    std::vector<std::size_t> indices;
    if (text.empty()) {
        return indices;
    }
    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (item.empty() ||
            !std::all_of(item.begin(), item.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            return std::nullopt;
        }
        indices.push_back(static_cast<std::size_t>(std::stoull(item)));
    }
    return indices;
}

auto corrupted(const std::string& field) -> unexpected {
    return unexpected{error{error_code::journal_corrupted,
        "missing or malformed field: " + field}};
}

void write_source(flat_json_writer& out, const task_source& source) {
    out.add("source_kind", to_string(kind_of(source)));
    out.add("source_locator", locator_of(source));
    std::visit([&out](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, direct_link_source>) {
            out.add("source_option", s.file_name);
        } else if constexpr (std::is_same_v<T, torrent_source>) {
            out.add("source_option", join_indices(s.selected_files));
        } else if constexpr (std::is_same_v<T, video_site_source>) {
            out.add("source_option", s.format);
        } else {
            out.add("source_option", "");
        }
    }, source);
}

auto read_source(const flat_json_object& in) -> result<task_source> {
    auto kind_name = in.get_string("source_kind");
    auto kind = kind_name ? source_kind_from_string(*kind_name) : std::nullopt;
    auto locator = in.get_string("source_locator");
    if (!kind) {
        return corrupted("source_kind");
    }
    if (!locator) {
        return corrupted("source_locator");
    }
    auto option = in.get_string("source_option").value_or("");

    switch (*kind) {
        case source_kind::direct_link:
            return task_source{direct_link_source{*locator, option}};
        case source_kind::torrent: {
            auto selected = split_indices(option);
            if (!selected) {
                return corrupted("source_option");
            }
            return task_source{torrent_source{*locator, std::move(*selected)}};
        }
        case source_kind::video_site:
            return task_source{video_site_source{*locator, option.empty() ? "best" : option}};
        case source_kind::chat_file:
            return task_source{chat_file_source{*locator}};
        default:
            return corrupted("source_kind");
    }
}

void write_destination(flat_json_writer& out, std::size_t index,
                       const task_destination& destination) {
    auto prefix = "destination_" + std::to_string(index) + "_";
    out.add(prefix + "kind", to_string(kind_of(destination)));
    std::visit([&out, &prefix](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, cloud_drive_destination>) {
            out.add(prefix + "target", d.folder_id);
            out.add(prefix + "option", "");
            out.add(prefix + "flag", d.shared_drive);
        } else if constexpr (std::is_same_v<T, remote_storage_destination>) {
            out.add(prefix + "target", d.remote);
            out.add(prefix + "option", d.path);
            out.add(prefix + "flag", false);
        } else {
            out.add(prefix + "target", d.chat_id);
            out.add(prefix + "option", "");
            out.add(prefix + "flag", d.as_document);
        }
    }, destination);
}

auto read_destination(const flat_json_object& in, std::size_t index)
    -> result<task_destination> {
    auto prefix = "destination_" + std::to_string(index) + "_";
    auto kind_name = in.get_string(prefix + "kind");
    auto kind = kind_name ? destination_kind_from_string(*kind_name) : std::nullopt;
    auto target = in.get_string(prefix + "target");
    if (!kind) {
        return corrupted(prefix + "kind");
    }
    if (!target) {
        return corrupted(prefix + "target");
    }
    auto option = in.get_string(prefix + "option").value_or("");
    auto flag = in.get_bool(prefix + "flag").value_or(false);

    switch (*kind) {
        case destination_kind::cloud_drive:
            return task_destination{cloud_drive_destination{*target, flag}};
        case destination_kind::remote_storage:
            return task_destination{remote_storage_destination{*target, option}};
        case destination_kind::chat_delivery:
            return task_destination{chat_delivery_destination{*target, flag}};
        default:
            return corrupted(prefix + "kind");
    }
}

auto record_path(const std::filesystem::path& dir, const task_id& id) -> std::filesystem::path {
    return dir / (id.to_string() + ".json");
}

}  // namespace

// ============================================================================
// Serialization
// ============================================================================

auto to_journal_json(const task_record& record) -> std::string {
    flat_json_writer out;
    out.add("id", record.id.value)
       .add("owner_id", record.owner_id)
       .add("priority", to_string(record.priority))
       .add("state", to_string(record.state));

    write_source(out, record.source);

    out.add("destination_count", static_cast<uint64_t>(record.destinations.size()));
    for (std::size_t i = 0; i < record.destinations.size(); ++i) {
        write_destination(out, i, record.destinations[i]);
    }
    out.add("destination_index", static_cast<uint64_t>(record.destination_index));

    out.add("progress_transferred", record.progress.transferred_bytes);
    if (record.progress.total_bytes) {
        out.add("progress_total", *record.progress.total_bytes);
    } else {
        out.add_null("progress_total");
    }

    out.add("retry_count", static_cast<uint64_t>(record.retry_count))
       .add("max_retries", static_cast<uint64_t>(record.max_retries))
       .add("created_at", time_point_to_ms(record.created_at));

    if (record.started_at) {
        out.add("started_at", time_point_to_ms(*record.started_at));
    } else {
        out.add_null("started_at");
    }
    if (record.finished_at) {
        out.add("finished_at", time_point_to_ms(*record.finished_at));
    } else {
        out.add_null("finished_at");
    }

    if (record.error) {
        out.add("error_kind", to_string(record.error->kind));
        out.add("error_message", record.error->message);
    } else {
        out.add_null("error_kind");
        out.add_null("error_message");
    }

    out.add("downloaded_path", record.downloaded_path.string());
    out.add("upload_result_count", static_cast<uint64_t>(record.upload_results.size()));
    for (std::size_t i = 0; i < record.upload_results.size(); ++i) {
        out.add("upload_result_" + std::to_string(i), record.upload_results[i]);
    }

    return out.str();
}

auto from_journal_json(std::string_view text) -> result<task_record> {
    auto parsed = detail::parse_flat_json(text);
    if (!parsed) {
        return unexpected{parsed.error()};
    }
    const auto& in = parsed.value();

    task_record record;

    auto id = in.get_uint("id");
    if (!id || *id == 0) {
        return corrupted("id");
    }
    record.id = task_id{*id};

    auto owner = in.get_string("owner_id");
    if (!owner) {
        return corrupted("owner_id");
    }
    record.owner_id = std::move(*owner);

    record.priority = in.get_string("priority").value_or("normal") == "elevated"
                          ? task_priority::elevated
                          : task_priority::normal;

    auto state_name = in.get_string("state");
    auto state = state_name ? task_state_from_string(*state_name) : std::nullopt;
    if (!state) {
        return corrupted("state");
    }
    record.state = *state;

    auto source = read_source(in);
    if (!source) {
        return unexpected{source.error()};
    }
    record.source = std::move(source.value());

    auto count = in.get_uint("destination_count");
    if (!count || *count == 0) {
        return corrupted("destination_count");
    }
    for (std::size_t i = 0; i < *count; ++i) {
        auto destination = read_destination(in, i);
        if (!destination) {
            return unexpected{destination.error()};
        }
        record.destinations.push_back(std::move(destination.value()));
    }
    record.destination_index =
        static_cast<std::size_t>(in.get_uint("destination_index").value_or(0));
    if (record.destination_index > record.destinations.size()) {
        return corrupted("destination_index");
    }

    record.progress.transferred_bytes = in.get_uint("progress_transferred").value_or(0);
    record.progress.total_bytes = in.get_uint("progress_total");

    record.retry_count = static_cast<uint32_t>(in.get_uint("retry_count").value_or(0));
    record.max_retries = static_cast<uint32_t>(in.get_uint("max_retries").value_or(0));

    auto created = in.get_int("created_at");
    if (!created) {
        return corrupted("created_at");
    }
    record.created_at = ms_to_time_point(*created);
    if (auto started = in.get_int("started_at")) {
        record.started_at = ms_to_time_point(*started);
    }
    if (auto finished = in.get_int("finished_at")) {
        record.finished_at = ms_to_time_point(*finished);
    }

    if (auto kind_name = in.get_string("error_kind")) {
        auto kind = transfer_error_kind_from_string(*kind_name);
        if (!kind) {
            return corrupted("error_kind");
        }
        record.error = task_error{*kind, in.get_string("error_message").value_or("")};
    }

    record.downloaded_path = in.get_string("downloaded_path").value_or("");
    auto results = in.get_uint("upload_result_count").value_or(0);
    for (std::size_t i = 0; i < results; ++i) {
        auto locator = in.get_string("upload_result_" + std::to_string(i));
        if (!locator) {
            return corrupted("upload_result_" + std::to_string(i));
        }
        record.upload_results.push_back(std::move(*locator));
    }

    return record;
}

// ============================================================================
// task_journal
// ============================================================================

struct task_journal::impl {
    explicit impl(std::filesystem::path dir) : directory(std::move(dir)) {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            ORCH_LOG_ERROR(log_category::journal,
                "Failed to create journal directory " + directory.string() + ": " + ec.message());
        }
    }

    std::filesystem::path directory;
    std::mutex mutex;

    auto read_file(const std::filesystem::path& path) -> result<task_record> {
        std::ifstream file(path);
        if (!file) {
            return unexpected{error{error_code::journal_io_error,
                "failed to open journal record " + path.string()}};
        }
        std::ostringstream oss;
        oss << file.rdbuf();
        return from_journal_json(oss.str());
    }
};

task_journal::task_journal(std::filesystem::path directory)
    : impl_(std::make_unique<impl>(std::move(directory))) {}

task_journal::~task_journal() = default;

auto task_journal::save(const task_record& record) -> result<void> {
    std::lock_guard lock(impl_->mutex);

    auto path = record_path(impl_->directory, record.id);
    auto staging = path;
    staging += ".tmp";

    {
        std::ofstream file(staging, std::ios::trunc);
        if (!file) {
            ORCH_LOG_ERROR(log_category::journal,
                "Failed to open journal record for writing: " + staging.string());
            return unexpected{error{error_code::journal_io_error,
                "failed to open journal record for writing"}};
        }
        file << to_journal_json(record);
        file.flush();
        if (!file) {
            ORCH_LOG_ERROR(log_category::journal,
                "Failed to write journal record: " + staging.string());
            return unexpected{error{error_code::journal_io_error,
                "failed to write journal record"}};
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, path, ec);
    if (ec) {
        ORCH_LOG_ERROR(log_category::journal,
            "Failed to commit journal record " + path.string() + ": " + ec.message());
        return unexpected{error{error_code::journal_io_error,
            "failed to commit journal record: " + ec.message()}};
    }

    ORCH_LOG_TRACE(log_category::journal,
        "Journaled task " + record.id.to_string() + " (" + to_string(record.state) + ")");
    return {};
}

auto task_journal::load(const task_id& id) -> result<task_record> {
    std::lock_guard lock(impl_->mutex);

    auto path = record_path(impl_->directory, id);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return unexpected{error{error_code::task_not_found,
            "no journal record for task " + id.to_string()}};
    }

    auto loaded = impl_->read_file(path);
    if (!loaded) {
        ORCH_LOG_ERROR(log_category::journal,
            "Failed to read journal record " + path.string() + ": " + loaded.error().message);
        return loaded;
    }
    if (loaded.value().id != id) {
        return unexpected{error{error_code::journal_corrupted,
            "journal record id does not match file name"}};
    }
    return loaded;
}

auto task_journal::remove(const task_id& id) -> result<void> {
    std::lock_guard lock(impl_->mutex);

    auto path = record_path(impl_->directory, id);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        ORCH_LOG_ERROR(log_category::journal,
            "Failed to delete journal record " + path.string() + " (" + ec.message() + ")");
        return unexpected{error{error_code::journal_io_error,
            "failed to delete journal record: " + ec.message()}};
    }
    ORCH_LOG_TRACE(log_category::journal, "Removed journal record of task " + id.to_string());
    return {};
}

auto task_journal::load_all() -> std::vector<task_record> {
    std::lock_guard lock(impl_->mutex);

    std::vector<task_record> records;
    std::error_code ec;
    if (!std::filesystem::exists(impl_->directory, ec)) {
        return records;
    }

    for (const auto& entry : std::filesystem::directory_iterator(impl_->directory, ec)) {
        if (entry.path().extension() != ".json") {
            continue;
        }
        auto loaded = impl_->read_file(entry.path());
        if (!loaded) {
            ORCH_LOG_WARN(log_category::journal,
                "Skipping journal record " + entry.path().filename().string() + ": " +
                loaded.error().message);
            continue;
        }
        records.push_back(std::move(loaded.value()));
    }
    if (ec) {
        ORCH_LOG_ERROR(log_category::journal,
            "Failed to scan journal directory " + impl_->directory.string() + ": " + ec.message());
    }

    std::sort(records.begin(), records.end(),
              [](const task_record& a, const task_record& b) { return a.id < b.id; });

    ORCH_LOG_DEBUG(log_category::journal,
        "Loaded " + std::to_string(records.size()) + " journal records");
    return records;
}

auto task_journal::directory() const -> const std::filesystem::path& {
    return impl_->directory;
}

}  // namespace kcenon::orchestrator
