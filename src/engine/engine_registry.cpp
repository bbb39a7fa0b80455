/**
 * @file engine_registry.cpp
 * @brief Implementation of engine_registry
 */

#include "kcenon/orchestrator/engine/engine_registry.h"

#include <map>
#include <mutex>
#include <shared_mutex>

#include "kcenon/orchestrator/core/logging.h"

namespace kcenon::orchestrator {

struct engine_registry::impl {
    mutable std::shared_mutex mutex;
    std::map<source_kind, std::shared_ptr<transfer_engine>> downloads;
    std::map<destination_kind, std::shared_ptr<transfer_engine>> uploads;
};

engine_registry::engine_registry() : impl_(std::make_unique<impl>()) {}

engine_registry::~engine_registry() = default;

auto engine_registry::register_download(source_kind kind,
                                        std::shared_ptr<transfer_engine> engine)
    -> result<void> {
    if (!engine) {
        return unexpected{error{error_code::invalid_configuration,
            std::string("null download engine for ") + to_string(kind)}};
    }

    std::unique_lock lock(impl_->mutex);
    auto [it, inserted] = impl_->downloads.insert_or_assign(kind, engine);
    ORCH_LOG_INFO(log_category::engine,
        std::string(inserted ? "Registered" : "Replaced") + " download engine '" +
        it->second->name() + "' for " + to_string(kind));
    return {};
}

auto engine_registry::register_upload(destination_kind kind,
                                      std::shared_ptr<transfer_engine> engine)
    -> result<void> {
    if (!engine) {
        return unexpected{error{error_code::invalid_configuration,
            std::string("null upload engine for ") + to_string(kind)}};
    }

    std::unique_lock lock(impl_->mutex);
    auto [it, inserted] = impl_->uploads.insert_or_assign(kind, engine);
    ORCH_LOG_INFO(log_category::engine,
        std::string(inserted ? "Registered" : "Replaced") + " upload engine '" +
        it->second->name() + "' for " + to_string(kind));
    return {};
}

auto engine_registry::unregister_download(source_kind kind) -> bool {
    std::unique_lock lock(impl_->mutex);
    return impl_->downloads.erase(kind) > 0;
}

auto engine_registry::unregister_upload(destination_kind kind) -> bool {
    std::unique_lock lock(impl_->mutex);
    return impl_->uploads.erase(kind) > 0;
}

auto engine_registry::download_engine(source_kind kind) const
    -> std::shared_ptr<transfer_engine> {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->downloads.find(kind);
    return it != impl_->downloads.end() ? it->second : nullptr;
}

auto engine_registry::upload_engine(destination_kind kind) const
    -> std::shared_ptr<transfer_engine> {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->uploads.find(kind);
    return it != impl_->uploads.end() ? it->second : nullptr;
}

auto engine_registry::check_pipeline(const task_source& source,
                                     const std::vector<task_destination>& destinations) const
    -> result<void> {
    std::shared_lock lock(impl_->mutex);

    auto skind = kind_of(source);
    if (impl_->downloads.find(skind) == impl_->downloads.end()) {
        return unexpected{error{error_code::engine_unavailable,
            std::string("no download engine for ") + to_string(skind)}};
    }

    for (const auto& destination : destinations) {
        auto dkind = kind_of(destination);
        if (impl_->uploads.find(dkind) == impl_->uploads.end()) {
            return unexpected{error{error_code::engine_unavailable,
                std::string("no upload engine for ") + to_string(dkind)}};
        }
    }
    return {};
}

auto engine_registry::download_kinds() const -> std::vector<source_kind> {
    std::shared_lock lock(impl_->mutex);
    std::vector<source_kind> kinds;
    for (const auto& [kind, engine] : impl_->downloads) {
        kinds.push_back(kind);
    }
    return kinds;
}

auto engine_registry::upload_kinds() const -> std::vector<destination_kind> {
    std::shared_lock lock(impl_->mutex);
    std::vector<destination_kind> kinds;
    for (const auto& [kind, engine] : impl_->uploads) {
        kinds.push_back(kind);
    }
    return kinds;
}

}  // namespace kcenon::orchestrator
