// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "kcenon/orchestrator/config/feature_flags.h"

#if ORCHESTRATOR_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::orchestrator {

/**
 * @brief Log categories for the orchestrator
 */
struct log_category {
    static constexpr std::string_view scheduler = "orchestrator.scheduler";
    static constexpr std::string_view gate = "orchestrator.gate";
    static constexpr std::string_view engine = "orchestrator.engine";
    static constexpr std::string_view events = "orchestrator.events";
    static constexpr std::string_view status = "orchestrator.status";
    static constexpr std::string_view journal = "orchestrator.journal";
    static constexpr std::string_view pool = "orchestrator.pool";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

[[nodiscard]] auto log_level_to_string(log_level level) -> std::string_view;

/**
 * @brief Configuration for sensitive information masking
 *
 * Links submitted by users routinely embed credentials (user:pass@host,
 * signed query strings, bot tokens), and work paths reveal account names.
 */
struct masking_config {
    bool mask_urls = false;
    bool mask_paths = false;
    char mask_char = '*';
    size_t visible_chars = 4;

    static auto all_masked() -> masking_config { return {true, true, '*', 4}; }
    static auto none() -> masking_config { return {false, false, '*', 4}; }
};

/**
 * @brief Masks credentials in URLs and directory parts of paths
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    /**
     * @brief Mask every URL and path found in free text
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string;

    /**
     * @brief Mask a single URL
     *
     * The user-info component is replaced entirely and the query string
     * keeps only its parameter names:
     * `https://u:p@host/f?sig=abc` becomes `https://***@host/f?sig=***`.
     */
    [[nodiscard]] auto mask_url(const std::string& url) const -> std::string;

    /**
     * @brief Mask the directory part of a path, keeping the file name
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string;

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }
    void set_config(masking_config config) { config_ = config; }

private:
    masking_config config_;
};

/**
 * @brief Structured log context for a task
 */
struct task_log_context {
    std::string task_id;
    std::string owner_id;
    std::optional<std::string> state;
    std::optional<std::string> engine;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> total_bytes;
    std::optional<std::size_t> destination_index;
    std::optional<uint32_t> retry_count;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string { return to_json_with_masking(nullptr); }
    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string;
};

/**
 * @brief One log record as handed to JSON consumers
 */
struct log_record {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<task_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string;
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide orchestrator logger
 *
 * Forwards to kcenon::logger when built with logger_system, otherwise
 * writes to stderr. A custom callback, when set, receives every record
 * that passes the level filter, before masking.
 */
class orchestrator_logger {
public:
    using log_callback = std::function<void(
        log_level, std::string_view, std::string_view, const task_log_context*)>;
    using json_log_callback = std::function<void(const log_record&, const std::string&)>;

    orchestrator_logger() = default;
    ~orchestrator_logger() = default;

    orchestrator_logger(const orchestrator_logger&) = delete;
    auto operator=(const orchestrator_logger&) -> orchestrator_logger& = delete;

    /**
     * @brief Initialize the backend; repeated calls are no-ops
     */
    void initialize();
    void shutdown();
    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level);
    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format);
    [[nodiscard]] auto get_output_format() const -> log_output_format;

    void set_masking_config(masking_config config);
    [[nodiscard]] auto get_masking_config() const -> masking_config;
    void enable_masking(bool enable = true) {
        set_masking_config(enable ? masking_config::all_masked() : masking_config::none());
    }

    void set_callback(log_callback callback);
    void set_json_callback(json_log_callback callback);

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const task_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0);

    void flush();

private:
    void emit(log_level level, const std::string& line);

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};

    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;

#if ORCHESTRATOR_USE_LOGGER_SYSTEM
    std::unique_ptr<kcenon::logger::logger> logger_;
#endif
};

/**
 * @brief Global logger instance
 */
auto get_logger() -> orchestrator_logger&;

#define ORCH_LOG(level, category, message) \
    kcenon::orchestrator::get_logger().log(level, category, message, nullptr, __FILE__, __LINE__)

#define ORCH_LOG_CTX(level, category, message, context) \
    kcenon::orchestrator::get_logger().log(level, category, message, &context, __FILE__, __LINE__)

#define ORCH_LOG_TRACE(category, message) \
    ORCH_LOG(kcenon::orchestrator::log_level::trace, category, message)
#define ORCH_LOG_DEBUG(category, message) \
    ORCH_LOG(kcenon::orchestrator::log_level::debug, category, message)
#define ORCH_LOG_INFO(category, message) \
    ORCH_LOG(kcenon::orchestrator::log_level::info, category, message)
#define ORCH_LOG_WARN(category, message) \
    ORCH_LOG(kcenon::orchestrator::log_level::warn, category, message)
#define ORCH_LOG_ERROR(category, message) \
    ORCH_LOG(kcenon::orchestrator::log_level::error, category, message)
#define ORCH_LOG_FATAL(category, message) \
    ORCH_LOG(kcenon::orchestrator::log_level::fatal, category, message)

#define ORCH_LOG_DEBUG_CTX(category, message, ctx) \
    ORCH_LOG_CTX(kcenon::orchestrator::log_level::debug, category, message, ctx)
#define ORCH_LOG_INFO_CTX(category, message, ctx) \
    ORCH_LOG_CTX(kcenon::orchestrator::log_level::info, category, message, ctx)
#define ORCH_LOG_WARN_CTX(category, message, ctx) \
    ORCH_LOG_CTX(kcenon::orchestrator::log_level::warn, category, message, ctx)
#define ORCH_LOG_ERROR_CTX(category, message, ctx) \
    ORCH_LOG_CTX(kcenon::orchestrator::log_level::error, category, message, ctx)

}  // namespace kcenon::orchestrator
