/**
 * @file post_processor.h
 * @brief Optional steps run between download and upload
 */

#ifndef KCENON_ORCHESTRATOR_ENGINE_POST_PROCESSOR_H
#define KCENON_ORCHESTRATOR_ENGINE_POST_PROCESSOR_H

#include <filesystem>
#include <string>

#include "kcenon/orchestrator/core/task_types.h"
#include "kcenon/orchestrator/core/types.h"

namespace kcenon::orchestrator {

/**
 * @brief One post-processing step (archive extraction, renaming, splitting)
 *
 * Steps run in configuration order on the worker pool. Each receives the
 * output path of the previous step and returns its own output path. A
 * failing step fails the task with post_processing_failed; there is no
 * retry of post-processing. A std::exception thrown from process() counts
 * as a failing step; process() must not throw any other type.
 */
class post_processor {
public:
    virtual ~post_processor() = default;

    [[nodiscard]] virtual auto name() const -> std::string = 0;

    [[nodiscard]] virtual auto process(const task_record& task,
                                       const std::filesystem::path& input)
        -> result<std::filesystem::path> = 0;
};

}  // namespace kcenon::orchestrator

#endif  // KCENON_ORCHESTRATOR_ENGINE_POST_PROCESSOR_H
