/**
 * @file orchestrator.h
 * @brief Main header for the transfer orchestrator library
 * @version 0.1.0
 *
 * Include this header to access the scheduler, the engine interfaces and
 * the status and event surfaces.
 *
 * @code
 * #include <kcenon/orchestrator/orchestrator.h>
 *
 * using namespace kcenon::orchestrator;
 *
 * auto sched = scheduler::builder()
 *     .with_download_engine(source_kind::direct_link, http_engine)
 *     .with_upload_engine(destination_kind::cloud_drive, drive_engine)
 *     .build();
 *
 * status_tracker tracker(sched.value().events());
 * @endcode
 */

#ifndef KCENON_ORCHESTRATOR_ORCHESTRATOR_H
#define KCENON_ORCHESTRATOR_ORCHESTRATOR_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/orchestrator/core/types.h"
#include "kcenon/orchestrator/core/error_codes.h"
#include "kcenon/orchestrator/core/task_state.h"
#include "kcenon/orchestrator/core/task_types.h"
#include "kcenon/orchestrator/core/source_classifier.h"

// Engines
#include "kcenon/orchestrator/engine/transfer_engine.h"
#include "kcenon/orchestrator/engine/post_processor.h"
#include "kcenon/orchestrator/engine/engine_registry.h"

// Scheduling
#include "kcenon/orchestrator/gate/concurrency_gate.h"
#include "kcenon/orchestrator/scheduler/scheduler_types.h"
#include "kcenon/orchestrator/scheduler/scheduler.h"

// Status and events
#include "kcenon/orchestrator/events/lifecycle_event.h"
#include "kcenon/orchestrator/events/event_bus.h"
#include "kcenon/orchestrator/status/status_tracker.h"
#include "kcenon/orchestrator/persistence/task_journal.h"

// Adapters
#include "kcenon/orchestrator/adapters/thread_pool_adapter.h"

namespace kcenon::orchestrator {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::orchestrator

#endif  // KCENON_ORCHESTRATOR_ORCHESTRATOR_H
