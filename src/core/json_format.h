/**
 * @file json_format.h
 * @brief Minimal JSON helpers shared by the logger and the task journal
 *
 * Only flat objects are supported: string, number, boolean and null
 * members. Nested data is flattened into prefixed keys by the caller.
 */

#ifndef KCENON_ORCHESTRATOR_CORE_JSON_FORMAT_H
#define KCENON_ORCHESTRATOR_CORE_JSON_FORMAT_H

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "kcenon/orchestrator/core/types.h"

namespace kcenon::orchestrator::detail {

[[nodiscard]] auto escape_json_string(std::string_view input) -> std::string;

/**
 * @brief Parsed flat JSON object
 *
 * String members are stored unescaped; other members keep their literal
 * text. A null member is stored with no value.
 */
class flat_json_object {
public:
    [[nodiscard]] auto has(const std::string& key) const -> bool;
    [[nodiscard]] auto is_null(const std::string& key) const -> bool;

    [[nodiscard]] auto get_string(const std::string& key) const -> std::optional<std::string>;
    [[nodiscard]] auto get_uint(const std::string& key) const -> std::optional<uint64_t>;
    [[nodiscard]] auto get_int(const std::string& key) const -> std::optional<int64_t>;
    [[nodiscard]] auto get_double(const std::string& key) const -> std::optional<double>;
    [[nodiscard]] auto get_bool(const std::string& key) const -> std::optional<bool>;

    void set(std::string key, std::optional<std::string> value) {
        members_[std::move(key)] = std::move(value);
    }

    [[nodiscard]] auto size() const -> std::size_t { return members_.size(); }

private:
    std::unordered_map<std::string, std::optional<std::string>> members_;
};

/**
 * @brief Parse a flat JSON object
 *
 * Returns journal_corrupted for malformed text or nested values.
 */
[[nodiscard]] auto parse_flat_json(std::string_view text) -> result<flat_json_object>;

/**
 * @brief Incremental writer for flat JSON objects, one member per line
 */
class flat_json_writer {
public:
    auto add(std::string_view key, std::string_view value) -> flat_json_writer&;
    auto add(std::string_view key, const char* value) -> flat_json_writer& {
        return add(key, std::string_view(value));
    }
    auto add(std::string_view key, const std::string& value) -> flat_json_writer& {
        return add(key, std::string_view(value));
    }
    auto add(std::string_view key, uint64_t value) -> flat_json_writer&;
    auto add(std::string_view key, int64_t value) -> flat_json_writer&;
    auto add(std::string_view key, double value) -> flat_json_writer&;
    auto add(std::string_view key, bool value) -> flat_json_writer&;
    auto add_null(std::string_view key) -> flat_json_writer&;

    [[nodiscard]] auto str(bool pretty = true) const -> std::string;

private:
    auto add_raw(std::string_view key, std::string raw) -> flat_json_writer&;

    std::vector<std::pair<std::string, std::string>> members_;
};

}  // namespace kcenon::orchestrator::detail

#endif  // KCENON_ORCHESTRATOR_CORE_JSON_FORMAT_H
