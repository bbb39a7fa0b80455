// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#include "kcenon/orchestrator/core/logging.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>

#include "json_format.h"

namespace kcenon::orchestrator {

namespace {

auto format_timestamp(bool utc) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_val = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#if defined(_WIN32)
    if (utc) gmtime_s(&tm_buf, &time_t_val); else localtime_s(&tm_buf, &time_t_val);
#else
    if (utc) gmtime_r(&time_t_val, &tm_buf); else localtime_r(&time_t_val, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    if (utc) {
        oss << 'Z';
    }
    return oss.str();
}

void output_to_stderr(const std::string& msg) {
    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << msg << "\n";
}

#if ORCHESTRATOR_USE_LOGGER_SYSTEM
auto to_logger_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace: return kcenon::logger::log_level::trace;
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info: return kcenon::logger::log_level::info;
        case log_level::warn: return kcenon::logger::log_level::warning;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::fatal: return kcenon::logger::log_level::critical;
        default: return kcenon::logger::log_level::info;
    }
}
#endif

}  // namespace

auto log_level_to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// sensitive_info_masker
// ============================================================================

auto sensitive_info_masker::mask(const std::string& input) const -> std::string {
    if (!config_.mask_urls && !config_.mask_paths) {
        return input;
    }

    static const std::regex token_pattern(
        R"([a-zA-Z][a-zA-Z0-9+.-]*://[^\s"']+|(?:/[a-zA-Z0-9._-]+){2,})");

    std::string result;
    std::sregex_iterator it(input.begin(), input.end(), token_pattern);
    std::sregex_iterator end;

    std::size_t last_pos = 0;
    for (; it != end; ++it) {
        auto pos = static_cast<std::size_t>(it->position());
        result += input.substr(last_pos, pos - last_pos);
        auto token = it->str();
        if (token.find("://") != std::string::npos) {
            result += mask_url(token);
        } else {
            result += mask_path(token);
        }
        last_pos = pos + static_cast<std::size_t>(it->length());
    }
    result += input.substr(last_pos);
    return result;
}

auto sensitive_info_masker::mask_url(const std::string& url) const -> std::string {
    if (!config_.mask_urls || url.empty()) {
        return url;
    }

    const std::string stars(3, config_.mask_char);
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return url;
    }

    auto authority_start = scheme_end + 3;
    auto authority_end = url.find_first_of("/?#", authority_start);
    if (authority_end == std::string::npos) {
        authority_end = url.size();
    }

    std::string out = url.substr(0, authority_start);
    auto authority = url.substr(authority_start, authority_end - authority_start);
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        out += stars + "@" + authority.substr(at + 1);
    } else {
        out += authority;
    }

    auto query_start = url.find('?', authority_end);
    auto fragment_start = url.find('#', authority_end);
    auto path_end = std::min(query_start, fragment_start);
    out += url.substr(authority_end, (path_end == std::string::npos ? url.size() : path_end) -
                                         authority_end);

    if (query_start != std::string::npos) {
        auto query_end = fragment_start == std::string::npos ? url.size() : fragment_start;
        auto query = url.substr(query_start + 1, query_end - query_start - 1);
        out += "?";
        std::size_t begin = 0;
        bool first = true;
        while (!query.empty() && begin <= query.size()) {
            auto amp = query.find('&', begin);
            auto param = query.substr(begin, amp == std::string::npos ? std::string::npos
                                                                      : amp - begin);
            if (!first) out += "&";
            first = false;
            auto eq = param.find('=');
            out += (eq == std::string::npos ? param : param.substr(0, eq)) + "=" + stars;
            if (amp == std::string::npos) break;
            begin = amp + 1;
        }
    }
    // Fragment is dropped
    return out;
}

auto sensitive_info_masker::mask_path(const std::string& path) const -> std::string {
    if (!config_.mask_paths || path.empty()) {
        return path;
    }

    auto last_sep = path.find_last_of("/\\");
    if (last_sep == std::string::npos) {
        return path;
    }

    std::string filename = path.substr(last_sep + 1);
    if (filename.size() > config_.visible_chars * 2) {
        auto dot = filename.find_last_of('.');
        auto ext = (dot != std::string::npos && dot > 0) ? filename.substr(dot) : "";
        auto stem = filename.substr(0, filename.size() - ext.size());
        if (stem.size() > config_.visible_chars) {
            filename = stem.substr(0, config_.visible_chars) +
                       std::string(stem.size() - config_.visible_chars, config_.mask_char) +
                       ext;
        }
    }
    return std::string(3, config_.mask_char) + "/" + filename;
}

// ============================================================================
// task_log_context / log_record
// ============================================================================

auto task_log_context::to_json_with_masking(const sensitive_info_masker* masker) const
    -> std::string {
    detail::flat_json_writer writer;
    if (!task_id.empty()) writer.add("task_id", task_id);
    if (!owner_id.empty()) writer.add("owner_id", owner_id);
    if (state) writer.add("state", *state);
    if (engine) writer.add("engine", *engine);
    if (bytes_transferred) writer.add("bytes_transferred", *bytes_transferred);
    if (total_bytes) writer.add("total_bytes", *total_bytes);
    if (destination_index) {
        writer.add("destination_index", static_cast<uint64_t>(*destination_index));
    }
    if (retry_count) writer.add("retry_count", static_cast<uint64_t>(*retry_count));
    if (duration_ms) writer.add("duration_ms", *duration_ms);
    if (error_message) {
        writer.add("error_message", masker ? masker->mask(*error_message) : *error_message);
    }
    return writer.str(false);
}

auto log_record::to_json_with_masking(const sensitive_info_masker* masker) const
    -> std::string {
    detail::flat_json_writer writer;
    writer.add("timestamp", timestamp)
          .add("level", log_level_to_string(level))
          .add("category", category)
          .add("message", masker ? masker->mask(message) : message);

    std::string json = writer.str(false);
    if (context) {
        auto ctx = context->to_json_with_masking(masker);
        if (ctx.size() > 2) {
            json.pop_back();
            json += "," + ctx.substr(1);
        }
    }
    if (source_file) {
        detail::flat_json_writer source;
        source.add("source_file", *source_file);
        if (source_line) source.add("source_line", static_cast<int64_t>(*source_line));
        auto src = source.str(false);
        json.pop_back();
        json += "," + src.substr(1);
    }
    return json;
}

// ============================================================================
// orchestrator_logger
// ============================================================================

void orchestrator_logger::initialize() {
    bool expected = false;
    if (!initialized_.compare_exchange_strong(expected, true)) {
        return;
    }

#if ORCHESTRATOR_USE_LOGGER_SYSTEM
    auto built = kcenon::logger::logger_builder()
        .with_async(true)
        .with_min_level(to_logger_level(min_level_.load()))
        .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
        .build();

    if (built) {
        logger_ = std::move(built.value());
    }
#endif
}

void orchestrator_logger::shutdown() {
#if ORCHESTRATOR_USE_LOGGER_SYSTEM
    if (logger_) {
        logger_->flush();
        logger_->stop();
        logger_.reset();
    }
#endif
    initialized_ = false;
}

void orchestrator_logger::set_level(log_level level) {
    min_level_.store(level);
#if ORCHESTRATOR_USE_LOGGER_SYSTEM
    if (logger_) {
        logger_->set_min_level(to_logger_level(level));
    }
#endif
}

void orchestrator_logger::set_output_format(log_output_format format) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    output_format_ = format;
}

auto orchestrator_logger::get_output_format() const -> log_output_format {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return output_format_;
}

void orchestrator_logger::set_masking_config(masking_config config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    masker_.set_config(config);
}

auto orchestrator_logger::get_masking_config() const -> masking_config {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return masker_.get_config();
}

void orchestrator_logger::set_callback(log_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

void orchestrator_logger::set_json_callback(json_log_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    json_callback_ = std::move(callback);
}

void orchestrator_logger::log(log_level level,
                              std::string_view category,
                              std::string_view message,
                              const task_log_context* context,
                              const char* file,
                              int line) {
    if (!is_enabled(level)) return;

    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (callback_) {
            callback_(level, category, message, context);
        }
    }

    log_output_format format;
    sensitive_info_masker masker;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        format = output_format_;
        masker = masker_;
    }

    if (format == log_output_format::json) {
        log_record record;
        record.timestamp = format_timestamp(true);
        record.level = level;
        record.category = std::string(category);
        record.message = std::string(message);
        if (context) record.context = *context;
        if (file) record.source_file = file;
        if (line > 0) record.source_line = line;

        auto json = record.to_json_with_masking(&masker);
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(record, json);
            }
        }
        emit(level, json);
        return;
    }

    std::ostringstream oss;
#if !ORCHESTRATOR_USE_LOGGER_SYSTEM
    oss << format_timestamp(false) << " [" << log_level_to_string(level) << "] ";
#endif
    oss << "[" << category << "] " << masker.mask(std::string(message));
    if (context) {
        oss << " " << context->to_json_with_masking(&masker);
    }
    emit(level, oss.str());
}

void orchestrator_logger::emit([[maybe_unused]] log_level level, const std::string& line) {
#if ORCHESTRATOR_USE_LOGGER_SYSTEM
    if (logger_) {
        logger_->log(to_logger_level(level), line);
        return;
    }
#endif
    output_to_stderr(line);
}

void orchestrator_logger::flush() {
#if ORCHESTRATOR_USE_LOGGER_SYSTEM
    if (logger_) {
        logger_->flush();
    }
#endif
}

auto get_logger() -> orchestrator_logger& {
    static orchestrator_logger instance;
    return instance;
}

}  // namespace kcenon::orchestrator
