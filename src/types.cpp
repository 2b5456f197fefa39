#include "hib/types.hpp"

namespace hib {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::CapabilityUnsupported: return "CapabilityUnsupported";
        case ErrorKind::AuthFailed: return "AuthFailed";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::RateLimited: return "RateLimited";
        case ErrorKind::Transient: return "Transient";
        case ErrorKind::Rejected: return "Rejected";
        case ErrorKind::LocalIOError: return "LocalIOError";
        case ErrorKind::ManifestCorruption: return "ManifestCorruption";
    }
    return "none";
}

std::optional<ErrorKind> error_kind_from_name(const std::string& name) {
    static const ErrorKind all[] = {
        ErrorKind::None, ErrorKind::CapabilityUnsupported, ErrorKind::AuthFailed,
        ErrorKind::NotFound, ErrorKind::RateLimited, ErrorKind::Transient,
        ErrorKind::Rejected, ErrorKind::LocalIOError, ErrorKind::ManifestCorruption,
    };
    for (auto kind : all) {
        if (name == error_kind_name(kind)) return kind;
    }
    return std::nullopt;
}

const char* outcome_name(Outcome outcome) {
    switch (outcome) {
        case Outcome::Success: return "success";
        case Outcome::Failed: return "failed";
        case Outcome::Skipped: return "skipped";
    }
    return "failed";
}

std::optional<Outcome> outcome_from_name(const std::string& name) {
    if (name == "success") return Outcome::Success;
    if (name == "failed") return Outcome::Failed;
    if (name == "skipped") return Outcome::Skipped;
    return std::nullopt;
}

const char* direction_name(Direction direction) {
    return direction == Direction::Upload ? "upload" : "backup";
}

std::optional<Direction> direction_from_name(const std::string& name) {
    if (name == "backup") return Direction::Backup;
    if (name == "upload") return Direction::Upload;
    return std::nullopt;
}

void RunSummary::append(const RunSummary& other) {
    providers.insert(providers.end(), other.providers.begin(), other.providers.end());
    listed += other.listed;
    attempted += other.attempted;
    succeeded += other.succeeded;
    skipped += other.skipped;
    failed += other.failed;
    retries += other.retries;
    bytes_transferred += other.bytes_transferred;
    cancelled = cancelled || other.cancelled;
    failures.insert(failures.end(), other.failures.begin(), other.failures.end());
    aborted.insert(aborted.end(), other.aborted.begin(), other.aborted.end());
}

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

int64_t to_epoch(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

}  // namespace hib
