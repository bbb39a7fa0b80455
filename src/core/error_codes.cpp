/**
 * @file error_codes.cpp
 * @brief Failure kind parsing
 */

#include "kcenon/orchestrator/core/error_codes.h"

namespace kcenon::orchestrator {

auto transfer_error_kind_from_string(std::string_view name)
    -> std::optional<transfer_error_kind> {
    for (auto kind : {transfer_error_kind::network_error,
                      transfer_error_kind::timeout,
                      transfer_error_kind::rate_limited,
                      transfer_error_kind::engine_busy,
                      transfer_error_kind::invalid_source,
                      transfer_error_kind::permission_denied,
                      transfer_error_kind::quota_exceeded,
                      transfer_error_kind::unsupported_format,
                      transfer_error_kind::not_found,
                      transfer_error_kind::storage_error,
                      transfer_error_kind::post_processing_failed,
                      transfer_error_kind::engine_unavailable,
                      transfer_error_kind::cancel_timeout,
                      transfer_error_kind::interrupted_by_restart,
                      transfer_error_kind::internal}) {
        if (name == to_string(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

}  // namespace kcenon::orchestrator
