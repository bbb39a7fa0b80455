/**
 * @file task_journal.h
 * @brief On-disk journal of task records for crash recovery
 *
 * Each task is stored as `<directory>/<id>.json`, a flat JSON object
 * holding every field of task_record except the transient queue position.
 * The scheduler rewrites a record after each state change and removes it
 * on eviction.
 */

#ifndef KCENON_ORCHESTRATOR_PERSISTENCE_TASK_JOURNAL_H
#define KCENON_ORCHESTRATOR_PERSISTENCE_TASK_JOURNAL_H

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/orchestrator/core/task_types.h"
#include "kcenon/orchestrator/core/types.h"

namespace kcenon::orchestrator {

/**
 * @brief Serialize a record to the journal's JSON form
 */
[[nodiscard]] auto to_journal_json(const task_record& record) -> std::string;

/**
 * @brief Parse a record from the journal's JSON form
 *
 * Returns journal_corrupted when a required field is missing or malformed.
 */
[[nodiscard]] auto from_journal_json(std::string_view text) -> result<task_record>;

/**
 * @brief Directory-backed store of task records
 *
 * Thread-safe. Writes go to a temporary file that is renamed over the
 * previous record, so a crash leaves either the old or the new record.
 *
 * @code
 * task_journal journal("/var/lib/orchestrator/journal");
 * journal.save(record);
 * for (auto& restored : journal.load_all()) { ... }
 * @endcode
 */
class task_journal {
public:
    explicit task_journal(std::filesystem::path directory);
    ~task_journal();

    task_journal(const task_journal&) = delete;
    auto operator=(const task_journal&) -> task_journal& = delete;

    [[nodiscard]] auto save(const task_record& record) -> result<void>;

    [[nodiscard]] auto load(const task_id& id) -> result<task_record>;

    /**
     * @brief Delete the record of a task; a missing record is not an error
     */
    [[nodiscard]] auto remove(const task_id& id) -> result<void>;

    /**
     * @brief Every readable record, ordered by id
     *
     * Corrupted files are logged and skipped.
     */
    [[nodiscard]] auto load_all() -> std::vector<task_record>;

    [[nodiscard]] auto directory() const -> const std::filesystem::path&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::orchestrator

#endif  // KCENON_ORCHESTRATOR_PERSISTENCE_TASK_JOURNAL_H
