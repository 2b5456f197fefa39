#include "hib/transfer_scheduler.hpp"
#include "hib/fingerprint.hpp"
#include "hib/log.hpp"
#include "hib/manifest_store.hpp"
#include "hib/metrics.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace hib {

const char* task_state_name(TaskState state) {
    switch (state) {
        case TaskState::Pending: return "pending";
        case TaskState::Attempting: return "attempting";
        case TaskState::RetryPending: return "retry-pending";
        case TaskState::Success: return "success";
        case TaskState::Failed: return "failed";
    }
    return "unknown";
}

namespace {

// Keeps the in-flight counters and gauge balanced around one attempt.
class InFlightGuard {
public:
    InFlightGuard(std::atomic<size_t>& counter, std::atomic<size_t>& peak, MetricsExporter* metrics)
        : counter_(counter), metrics_(metrics) {
        size_t now = counter_.fetch_add(1) + 1;
        size_t prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {
        }
        if (metrics_) metrics_->in_flight().Increment();
    }
    ~InFlightGuard() {
        counter_.fetch_sub(1);
        if (metrics_) metrics_->in_flight().Decrement();
    }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<size_t>& counter_;
    MetricsExporter* metrics_;
};

std::filesystem::path temp_path_for(const std::filesystem::path& destination, size_t index) {
    auto tmp = destination;
    tmp += ".tmp." + std::to_string(index) + "." +
           std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    return tmp;
}

}  // namespace

TransferScheduler::TransferScheduler(const SchedulerOptions& options, ManifestStore& manifest,
                                     MetricsExporter* metrics)
    : options_(options), manifest_(manifest), metrics_(metrics) {
    if (options_.width == 0) options_.width = 1;
    if (options_.max_attempts == 0) options_.max_attempts = 1;
}

std::chrono::milliseconds TransferScheduler::backoff_delay(const SchedulerOptions& options,
                                                           uint32_t attempt,
                                                           std::chrono::milliseconds retry_after) {
    auto delay = options.backoff_initial;
    for (uint32_t i = 1; i < attempt && delay < options.backoff_ceiling; ++i) {
        delay *= 2;
    }
    delay = std::max(delay, retry_after);
    return std::min(delay, options.backoff_ceiling);
}

std::vector<TaskResult> TransferScheduler::run(std::vector<TransferTask> tasks, Provider& provider,
                                               const CancellationToken& cancel,
                                               const std::function<void()>& on_dispatched) {
    std::vector<std::optional<TaskResult>> slots(tasks.size());
    std::mutex dispatch_mutex;
    size_t next = 0;
    bool dispatch_done = false;
    bool stop = false;
    std::exception_ptr fatal;

    auto notify_dispatched = [&]() {
        // caller holds dispatch_mutex
        if (!dispatch_done) {
            dispatch_done = true;
            if (on_dispatched) on_dispatched();
        }
    };

    auto worker = [&]() {
        while (true) {
            size_t idx;
            {
                std::lock_guard<std::mutex> lock(dispatch_mutex);
                if (stop || cancel.cancelled() || next >= tasks.size()) {
                    notify_dispatched();
                    return;
                }
                idx = next++;
                if (next == tasks.size()) notify_dispatched();
            }

            try {
                slots[idx] = execute(std::move(tasks[idx]), provider);
            } catch (...) {
                // stops dispatch; rethrown from run() once every worker has joined
                std::lock_guard<std::mutex> lock(dispatch_mutex);
                if (!fatal) fatal = std::current_exception();
                stop = true;
                return;
            }
        }
    };

    size_t width = std::min(options_.width, std::max<size_t>(tasks.size(), 1));
    std::vector<std::thread> workers;
    workers.reserve(width);
    for (size_t i = 0; i < width; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (fatal) std::rethrow_exception(fatal);

    std::vector<TaskResult> results;
    results.reserve(slots.size());
    for (auto& slot : slots) {
        if (slot) results.push_back(std::move(*slot));
    }
    std::sort(results.begin(), results.end(), [](const TaskResult& a, const TaskResult& b) {
        return a.task.index < b.task.index;
    });
    return results;
}

TaskResult TransferScheduler::execute(TransferTask task, Provider& provider) {
    TaskResult result;
    result.task = std::move(task);
    result.state = TaskState::Pending;

    while (true) {
        result.state = TaskState::Attempting;
        result.attempts++;
        result.task.attempts = result.attempts;
        if (options_.verbose) {
            log_debug("%s %s/%s attempt %u", direction_name(result.task.direction),
                      result.task.provider.c_str(), result.task.object.key.c_str(), result.attempts);
        }

        TransferError err;
        {
            InFlightGuard guard(in_flight_, peak_in_flight_, metrics_);
            std::optional<ScopedTimer> timer;
            if (metrics_) timer.emplace(metrics_->transfer_duration());
            err = attempt(result, provider);
        }

        if (!err) {
            result.state = TaskState::Success;
            result.error = {};
            break;
        }

        result.error = err;
        if (!is_retryable(err.kind) || result.attempts >= options_.max_attempts) {
            result.state = TaskState::Failed;
            break;
        }

        result.state = TaskState::RetryPending;
        auto delay = backoff_delay(options_, result.attempts, err.retry_after);
        log_warn("%s/%s: %s (%s), retrying in %lldms (attempt %u of %u)",
                 result.task.provider.c_str(), result.task.object.key.c_str(),
                 err.message.c_str(), error_kind_name(err.kind),
                 static_cast<long long>(delay.count()), result.attempts, options_.max_attempts);
        if (metrics_) metrics_->retries_total().Increment();
        std::this_thread::sleep_for(delay);
    }

    record_outcome(result);

    if (metrics_) {
        metrics_->transfers(result.task.direction,
                            result.state == TaskState::Success ? Outcome::Success : Outcome::Failed)
            .Increment();
        if (result.state == TaskState::Success) {
            metrics_->transfer_bytes(result.task.direction).Increment(static_cast<double>(result.bytes));
        }
    }

    if (result.state == TaskState::Failed) {
        log_error("%s %s/%s failed after %u attempt(s): %s (%s)",
                  direction_name(result.task.direction), result.task.provider.c_str(),
                  result.task.object.key.c_str(), result.attempts, result.error.message.c_str(),
                  error_kind_name(result.error.kind));
    } else if (options_.verbose) {
        log_debug("%s %s/%s done (%lu bytes)", direction_name(result.task.direction),
                  result.task.provider.c_str(), result.task.object.key.c_str(),
                  static_cast<unsigned long>(result.bytes));
    }
    return result;
}

TransferError TransferScheduler::attempt(TaskResult& result, Provider& provider) {
    auto start = std::chrono::steady_clock::now();
    Deadline deadline = start + options_.task_timeout;

    TransferError err;
    try {
        err = result.task.direction == Direction::Backup
            ? attempt_backup(result, provider, deadline)
            : attempt_upload(result, provider, deadline);
    } catch (const ManifestError&) {
        throw;
    } catch (const std::filesystem::filesystem_error& e) {
        err = {ErrorKind::LocalIOError, e.what(), {}};
    } catch (const std::exception& e) {
        err = {ErrorKind::Rejected, std::string("Unexpected error: ") + e.what(), {}};
    }
    if (err) return err;

    // Providers honor the deadline cooperatively; an attempt that overran
    // it is a timeout even if it eventually produced data.
    if (std::chrono::steady_clock::now() - start > options_.task_timeout) {
        return {ErrorKind::Transient, "Task timed out after " +
                std::to_string(options_.task_timeout.count()) + "ms", {}};
    }
    return {};
}

TransferError TransferScheduler::attempt_backup(TaskResult& result, Provider& provider,
                                                Deadline deadline) {
    const auto& task = result.task;
    auto fetched = provider.fetch(task.object, deadline);
    if (!fetched.success) {
        if (!fetched.error) fetched.error = {ErrorKind::Transient, "Fetch failed", {}};
        return fetched.error;
    }
    if (std::chrono::steady_clock::now() > deadline) {
        return {ErrorKind::Transient, "Task timed out after " +
                std::to_string(options_.task_timeout.count()) + "ms", {}};
    }

    std::error_code ec;
    std::filesystem::create_directories(task.destination.parent_path(), ec);
    if (ec) {
        return {ErrorKind::LocalIOError, "Cannot create " + task.destination.parent_path().string() +
                ": " + ec.message(), {}};
    }

    // Write to temp file then rename; an existing file is only replaced by
    // a complete one.
    auto tmp = temp_path_for(task.destination, task.index);
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return {ErrorKind::LocalIOError, "Cannot create " + tmp.string(), {}};
        }
        file.write(reinterpret_cast<const char*>(fetched.data.data()),
                   static_cast<std::streamsize>(fetched.data.size()));
        file.close();
        if (!file) {
            std::filesystem::remove(tmp, ec);
            return {ErrorKind::LocalIOError, "Failed to write " + tmp.string(), {}};
        }
    }

    std::filesystem::rename(tmp, task.destination, ec);
    if (ec) {
        std::error_code rm_ec;
        std::filesystem::remove(tmp, rm_ec);
        return {ErrorKind::LocalIOError, "Failed to rename into " + task.destination.string() +
                ": " + ec.message(), {}};
    }

    // Fingerprint what is on disk, not what was received
    auto fp = fingerprint_file(task.destination);
    if (!fp) {
        return {ErrorKind::LocalIOError, "Cannot fingerprint " + task.destination.string(), {}};
    }
    result.fingerprint = fp->digest;
    result.bytes = fp->size;
    return {};
}

TransferError TransferScheduler::attempt_upload(TaskResult& result, Provider& provider,
                                                Deadline deadline) {
    auto& task = result.task;
    if (task.source_fingerprint.empty()) {
        auto fp = fingerprint_file(task.source);
        if (!fp) return {ErrorKind::LocalIOError, "Cannot read " + task.source.string(), {}};
        task.source_fingerprint = fp->digest;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(task.source, ec);
    if (ec) return {ErrorKind::LocalIOError, "Cannot stat " + task.source.string() + ": " + ec.message(), {}};

    auto pushed = provider.push(task.source, task.object.key, deadline);
    if (!pushed.success) {
        if (!pushed.error) pushed.error = {ErrorKind::Transient, "Push failed", {}};
        return pushed.error;
    }

    result.fingerprint = task.source_fingerprint;
    result.bytes = size;
    result.url = pushed.url;
    return {};
}

void TransferScheduler::record_outcome(TaskResult& result) {
    const auto& task = result.task;
    auto now = now_epoch();
    auto local_path = task.direction == Direction::Backup ? task.destination : task.source;

    LocalRecord rec;
    if (result.state == TaskState::Success) {
        rec.provider = task.provider;
        rec.remote_key = task.object.key;
        rec.local_path = local_path;
        rec.fingerprint = result.fingerprint;
        rec.size = result.bytes;
        rec.last_success = now;
        rec.outcome = Outcome::Success;
        rec.message = result.url;
    } else {
        // A failed attempt keeps what the last success established
        auto existing = manifest_.lookup(task.provider, task.object.key);
        if (existing) {
            rec = std::move(*existing);
        } else {
            rec.provider = task.provider;
            rec.remote_key = task.object.key;
            rec.local_path = local_path;
        }
        rec.outcome = Outcome::Failed;
        rec.error_kind = result.error.kind;
        rec.message = result.error.message;
    }
    rec.updated_at = now;
    rec.retry_count = result.attempts > 0 ? result.attempts - 1 : 0;
    rec.direction = task.direction;

    auto err = manifest_.record(rec);
    if (!err.empty()) {
        log_error("Cannot record %s/%s: %s", task.provider.c_str(), task.object.key.c_str(), err.c_str());
        result.state = TaskState::Failed;
        result.error = {ErrorKind::LocalIOError, "Manifest write failed: " + err, {}};
    }
}

}  // namespace hib
