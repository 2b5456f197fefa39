#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hib {

/// Classification of every failure a transfer, listing or store access can
/// produce. RateLimited and Transient are the only retry-eligible kinds.
enum class ErrorKind {
    None,
    CapabilityUnsupported,  // provider invoked outside its declared scope
    AuthFailed,             // permanent, surfaced immediately
    NotFound,               // permanent, recorded as failed
    RateLimited,            // retry-eligible
    Transient,              // retry-eligible (network, 5xx, timeout)
    Rejected,               // permanent request rejection (400/409/422, bad reply)
    LocalIOError,           // fatal to the task, not the run
    ManifestCorruption,     // fatal to the run
};

const char* error_kind_name(ErrorKind kind);
std::optional<ErrorKind> error_kind_from_name(const std::string& name);

inline bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::RateLimited || kind == ErrorKind::Transient;
}

enum class Outcome { Success, Failed, Skipped };

const char* outcome_name(Outcome outcome);
std::optional<Outcome> outcome_from_name(const std::string& name);

enum class Direction { Backup, Upload };

const char* direction_name(Direction direction);
std::optional<Direction> direction_from_name(const std::string& name);

/// Error value carried by provider results and task outcomes.
struct TransferError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::chrono::milliseconds retry_after{0};  // backend hint, 0 if absent

    explicit operator bool() const { return kind != ErrorKind::None; }
};

/// Snapshot of one remote object at listing time.
struct RemoteObject {
    std::string key;  // provider-scoped identity
    uint64_t size = 0;
    std::optional<std::chrono::system_clock::time_point> last_modified;
    std::optional<std::string> content_hash;  // ETag, blob sha, image hash
    std::string url;                          // direct download URL, if any
    std::map<std::string, std::string> attributes;  // backend handles (delete hash, sha)
};

/// One manifest row per (provider, remote key).
struct LocalRecord {
    std::string provider;
    std::string remote_key;
    std::filesystem::path local_path;
    std::string fingerprint;   // hex sha256, empty if never transferred
    uint64_t size = 0;
    int64_t last_success = 0;  // epoch seconds of the last successful transfer
    int64_t updated_at = 0;    // epoch seconds of the last attempt
    Outcome outcome = Outcome::Failed;
    uint32_t retry_count = 0;
    ErrorKind error_kind = ErrorKind::None;
    std::string message;
    Direction direction = Direction::Backup;
};

/// Unit of work handed to the scheduler. Never persisted.
struct TransferTask {
    size_t index = 0;  // position in listing order
    std::string provider;
    Direction direction = Direction::Backup;
    RemoteObject object;                 // backup: what to fetch; upload: destination key
    std::filesystem::path destination;   // backup only
    std::filesystem::path source;        // upload only
    std::string source_fingerprint;      // upload only, computed during diff
    uint32_t attempts = 0;
};

struct TaskFailure {
    std::string provider;
    std::string key;
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

/// A provider segment that could not be run at all (config error, missing
/// capability, listing failure).
struct ProviderAbort {
    std::string provider;
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

/// Aggregate result of one orchestrator invocation.
struct RunSummary {
    Direction direction = Direction::Backup;
    std::vector<std::string> providers;
    uint64_t listed = 0;
    uint64_t attempted = 0;
    uint64_t succeeded = 0;
    uint64_t skipped = 0;
    uint64_t failed = 0;
    uint64_t retries = 0;
    uint64_t bytes_transferred = 0;
    bool cancelled = false;
    std::vector<TaskFailure> failures;
    std::vector<ProviderAbort> aborted;

    /// Concatenate another provider's summary into this one.
    void append(const RunSummary& other);

    bool ok() const { return failed == 0 && aborted.empty(); }
};

/// Thrown when the manifest cannot be trusted (ManifestCorruption). This is
/// the only error that escapes a run.
class ManifestError : public std::runtime_error {
public:
    explicit ManifestError(const std::string& what) : std::runtime_error(what) {}
};

/// Cooperative cancellation flag shared between the caller and a run.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

int64_t now_epoch();
int64_t to_epoch(std::chrono::system_clock::time_point tp);

}  // namespace hib
