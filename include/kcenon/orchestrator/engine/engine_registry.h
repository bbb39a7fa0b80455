/**
 * @file engine_registry.h
 * @brief Tag-based lookup of transfer engines
 */

#ifndef KCENON_ORCHESTRATOR_ENGINE_ENGINE_REGISTRY_H
#define KCENON_ORCHESTRATOR_ENGINE_ENGINE_REGISTRY_H

#include <memory>
#include <vector>

#include "kcenon/orchestrator/core/task_types.h"
#include "kcenon/orchestrator/core/types.h"
#include "kcenon/orchestrator/engine/transfer_engine.h"

namespace kcenon::orchestrator {

/**
 * @brief Maps source and destination kinds to the engine servicing them
 *
 * One engine per kind; registering again replaces the previous engine
 * for transfers started afterwards. Thread-safe.
 *
 * @code
 * engine_registry registry;
 * registry.register_download(source_kind::direct_link, http_engine);
 * registry.register_upload(destination_kind::cloud_drive, drive_engine);
 * @endcode
 */
class engine_registry {
public:
    engine_registry();
    ~engine_registry();

    engine_registry(const engine_registry&) = delete;
    auto operator=(const engine_registry&) -> engine_registry& = delete;

    [[nodiscard]] auto register_download(source_kind kind,
                                         std::shared_ptr<transfer_engine> engine)
        -> result<void>;
    [[nodiscard]] auto register_upload(destination_kind kind,
                                       std::shared_ptr<transfer_engine> engine)
        -> result<void>;

    auto unregister_download(source_kind kind) -> bool;
    auto unregister_upload(destination_kind kind) -> bool;

    [[nodiscard]] auto download_engine(source_kind kind) const
        -> std::shared_ptr<transfer_engine>;
    [[nodiscard]] auto upload_engine(destination_kind kind) const
        -> std::shared_ptr<transfer_engine>;

    /**
     * @brief Check that every stage of a pipeline has an engine
     *
     * Returns engine_unavailable naming the first missing kind.
     */
    [[nodiscard]] auto check_pipeline(const task_source& source,
                                      const std::vector<task_destination>& destinations) const
        -> result<void>;

    [[nodiscard]] auto download_kinds() const -> std::vector<source_kind>;
    [[nodiscard]] auto upload_kinds() const -> std::vector<destination_kind>;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::orchestrator

#endif  // KCENON_ORCHESTRATOR_ENGINE_ENGINE_REGISTRY_H
