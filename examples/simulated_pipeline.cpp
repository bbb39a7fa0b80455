/**
 * @file simulated_pipeline.cpp
 * @brief Scheduler walkthrough with simulated engines
 *
 * This example demonstrates:
 * - Registering download and upload engines with the scheduler builder
 * - Per-owner and global concurrency limits
 * - Following progress through the event bus and the status tracker
 * - Cancelling a task and acknowledging finished ones
 */

#include <kcenon/orchestrator/orchestrator.h>
#include <kcenon/orchestrator/core/logging.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::orchestrator;

namespace {

/**
 * @brief Engine that "transfers" a fixed number of bytes in timed steps
 *
 * Every transfer runs on its own thread and reports progress ten times.
 * A cancel request is honoured between steps.
 */
class simulated_engine : public transfer_engine {
public:
    simulated_engine(std::string name, uint64_t bytes, std::chrono::milliseconds step)
        : name_(std::move(name)), bytes_(bytes), step_(step) {}

    ~simulated_engine() override {
        std::vector<std::thread> workers;
        {
            std::lock_guard lock(mutex_);
            workers.swap(workers_);
        }
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    [[nodiscard]] auto name() const -> std::string override { return name_; }

    [[nodiscard]] auto start(const transfer_request& request, engine_event_sink sink)
        -> result<engine_handle> override {
        std::lock_guard lock(mutex_);
        engine_handle handle{next_handle_++};
        auto flag = std::make_shared<std::atomic<bool>>(false);
        cancel_flags_[handle.value] = flag;

        auto result_locator = request.direction == transfer_direction::download
                                  ? (request.work_dir / "payload.bin").string()
                                  : name_ + "://" + std::to_string(request.task.value);

        workers_.emplace_back([this, sink, flag, result_locator]() {
            constexpr int steps = 10;
            for (int i = 1; i <= steps; ++i) {
                std::this_thread::sleep_for(step_);
                if (flag->load()) {
                    sink(canceled_event{});
                    return;
                }
                progress_event progress;
                progress.transferred_bytes = bytes_ * static_cast<uint64_t>(i) / steps;
                progress.total_bytes = bytes_;
                progress.rate = static_cast<double>(bytes_ / steps) * 1000.0 /
                                static_cast<double>(step_.count());
                sink(progress);
            }
            sink(succeeded_event{result_locator});
        });
        return handle;
    }

    [[nodiscard]] auto cancel(engine_handle handle) -> result<void> override {
        std::lock_guard lock(mutex_);
        auto it = cancel_flags_.find(handle.value);
        if (it == cancel_flags_.end()) {
            return unexpected{error{error_code::task_not_found, "unknown handle"}};
        }
        it->second->store(true);
        return {};
    }

private:
    std::string name_;
    uint64_t bytes_;
    std::chrono::milliseconds step_;

    std::mutex mutex_;
    uint64_t next_handle_ = 1;
    std::map<uint64_t, std::shared_ptr<std::atomic<bool>>> cancel_flags_;
    std::vector<std::thread> workers_;
};

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

void print_table(const status_tracker& tracker) {
    std::cout << std::left << std::setw(6) << "ID" << std::setw(8) << "Owner"
              << std::setw(18) << "State" << std::setw(10) << "Progress" << "Detail"
              << std::endl;
    for (const auto& entry : tracker.list()) {
        const auto& task = entry.snapshot;
        std::string progress = "-";
        if (auto pct = task.progress.completion_percentage()) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(0) << *pct << "%";
            progress = oss.str();
        } else if (task.queue_position) {
            progress = "#" + std::to_string(*task.queue_position);
        }

        std::string detail = locator_of(task.source);
        if (task.error) {
            detail = std::string(to_string(task.error->kind)) + ": " + task.error->message;
        }
        std::cout << std::left << std::setw(6) << task.id.value << std::setw(8)
                  << task.owner_id << std::setw(18) << to_string(task.state)
                  << std::setw(10) << progress << detail << std::endl;
    }
    std::cout << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::size_t global_limit = 2;
    if (argc > 1) {
        global_limit = static_cast<std::size_t>(std::strtoul(argv[1], nullptr, 10));
    }

    get_logger().set_level(log_level::warn);

    auto downloads = std::make_shared<simulated_engine>("http", 8 * 1024 * 1024,
                                                        std::chrono::milliseconds(50));
    auto uploads = std::make_shared<simulated_engine>("drive", 8 * 1024 * 1024,
                                                      std::chrono::milliseconds(30));

    auto built = scheduler::builder()
                     .with_global_limit(global_limit)
                     .with_per_owner_limit(1)
                     .with_work_root(std::filesystem::temp_directory_path() /
                                     "orchestrator_example")
                     .with_download_engine(source_kind::direct_link, downloads)
                     .with_upload_engine(destination_kind::cloud_drive, uploads)
                     .build();
    if (!built) {
        std::cerr << "Failed to build scheduler: " << built.error().message << std::endl;
        return 1;
    }
    auto& sched = built.value();

    status_tracker tracker(sched.events());

    event_filter terminal_only;
    terminal_only.types = {lifecycle_event_type::completed, lifecycle_event_type::failed,
                           lifecycle_event_type::canceled};
    sched.events().subscribe(
        [](const lifecycle_event& event) {
            std::cout << "[event] task " << event.snapshot.id.value << " "
                      << to_string(event.type) << std::endl;
        },
        terminal_only);

    if (auto started = sched.start(); !started) {
        std::cerr << "Failed to start scheduler: " << started.error().message << std::endl;
        return 1;
    }

    std::cout << "========================================" << std::endl;
    std::cout << "   Simulated Transfer Pipeline" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Global limit: " << global_limit << ", per-owner limit: 1" << std::endl;
    std::cout << std::endl;

    std::vector<task_id> ids;
    const std::vector<std::string> owners = {"alice", "alice", "bob", "carol", "bob"};
    for (std::size_t i = 0; i < owners.size(); ++i) {
        auto id = sched.submit_link("https://files.example.com/archive-" + std::to_string(i) +
                                        ".zip",
                                    {cloud_drive_destination{"backup"}}, owners[i]);
        if (!id) {
            std::cerr << "Submit failed: " << id.error().message << std::endl;
            continue;
        }
        ids.push_back(id.value());
    }

    auto rejected = sched.submit_link("not a link", {cloud_drive_destination{"backup"}}, "dave");
    if (!rejected) {
        std::cout << "Rejected submission: " << to_string(rejected.error().code) << std::endl;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    print_table(tracker);

    if (ids.size() > 1) {
        std::cout << "Cancelling task " << ids[1].value << std::endl;
        if (auto canceled = sched.cancel(ids[1]); !canceled) {
            std::cerr << "Cancel failed: " << canceled.error().message << std::endl;
        }
    }

    uint64_t delivered = 0;
    for (const auto& id : ids) {
        auto record = sched.wait_for(id, std::chrono::seconds(30));
        if (!record) {
            std::cerr << "Task " << id.value << ": " << record.error().message << std::endl;
            continue;
        }
        if (record.value().state == task_state::completed) {
            delivered += record.value().progress.transferred_bytes;
        }
    }

    std::cout << std::endl;
    print_table(tracker);

    auto stats = sched.statistics();
    std::cout << "Completed: " << stats.completed << ", canceled: " << stats.canceled
              << ", failed: " << stats.failed << ", rejected: " << stats.rejected
              << std::endl;
    std::cout << "Uploaded: " << format_bytes(delivered) << std::endl;

    for (const auto& id : ids) {
        if (auto acked = sched.acknowledge(id); !acked) {
            std::cerr << "Acknowledge failed: " << acked.error().message << std::endl;
        }
    }

    if (auto stopped = sched.shutdown(); !stopped) {
        std::cerr << "Shutdown failed: " << stopped.error().message << std::endl;
        return 1;
    }
    return 0;
}
