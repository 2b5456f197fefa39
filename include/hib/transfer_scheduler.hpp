#pragma once

#include "hib/constants.hpp"
#include "hib/provider.hpp"
#include "hib/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace hib {

class ManifestStore;
class MetricsExporter;

struct SchedulerOptions {
    size_t width = constants::DEFAULT_TRANSFER_WIDTH;         // W
    uint32_t max_attempts = constants::DEFAULT_MAX_ATTEMPTS;  // R, total attempts per task
    std::chrono::milliseconds backoff_initial{constants::DEFAULT_BACKOFF_INITIAL_MS};
    std::chrono::milliseconds backoff_ceiling{constants::DEFAULT_BACKOFF_CEILING_MS};
    std::chrono::milliseconds task_timeout{constants::DEFAULT_TIMEOUT_SECONDS * 1000};
    bool verbose = false;
};

/// Per-task retry state machine:
/// Pending -> Attempting -> {Success | RetryPending | Failed},
/// RetryPending -> Attempting.
enum class TaskState { Pending, Attempting, RetryPending, Success, Failed };

const char* task_state_name(TaskState state);

struct TaskResult {
    TransferTask task;
    TaskState state = TaskState::Pending;
    uint32_t attempts = 0;
    TransferError error;  // terminal error when Failed
    uint64_t bytes = 0;
    std::string fingerprint;
    std::string url;  // upload: public URL reported by the backend
};

/// Bounded worker pool that executes transfer tasks against one provider.
///
/// Tasks are dispatched in vector order to at most `width` workers. Only
/// RateLimited and Transient failures are retried, with exponential backoff
/// capped at the ceiling. Every terminal state is written to the manifest
/// before the task is retired.
class TransferScheduler {
public:
    TransferScheduler(const SchedulerOptions& options, ManifestStore& manifest,
                      MetricsExporter* metrics = nullptr);

    /// Runs until every dispatched task is terminal. Cancellation stops
    /// dispatch; tasks already dispatched (including those in backoff) run
    /// to completion. Results cover dispatched tasks only, ordered by
    /// TransferTask::index. Throws ManifestError if the manifest becomes
    /// unusable. Any other exception escaping a task stops dispatch and is
    /// rethrown here after the workers have joined.
    ///
    /// `on_dispatched`, if set, is called once when the last task has been
    /// handed to a worker (or dispatch was cancelled).
    std::vector<TaskResult> run(std::vector<TransferTask> tasks, Provider& provider,
                                const CancellationToken& cancel,
                                const std::function<void()>& on_dispatched = {});

    size_t in_flight() const { return in_flight_.load(); }
    size_t peak_in_flight() const { return peak_in_flight_.load(); }

    /// Delay before attempt `attempt + 1`, given `attempt` attempts so far:
    /// initial * 2^(attempt-1), raised to the backend's retry-after hint,
    /// and never above the ceiling.
    static std::chrono::milliseconds backoff_delay(const SchedulerOptions& options, uint32_t attempt,
                                                   std::chrono::milliseconds retry_after);

    const SchedulerOptions& options() const { return options_; }

private:
    TaskResult execute(TransferTask task, Provider& provider);
    TransferError attempt(TaskResult& result, Provider& provider);
    TransferError attempt_backup(TaskResult& result, Provider& provider, Deadline deadline);
    TransferError attempt_upload(TaskResult& result, Provider& provider, Deadline deadline);
    void record_outcome(TaskResult& result);

    SchedulerOptions options_;
    ManifestStore& manifest_;
    MetricsExporter* metrics_;

    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> peak_in_flight_{0};
};

}  // namespace hib
