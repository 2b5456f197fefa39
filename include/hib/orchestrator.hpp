#pragma once

#include "hib/config.hpp"
#include "hib/provider.hpp"
#include "hib/transfer_scheduler.hpp"
#include "hib/types.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hib {

class ManifestStore;
class MetricsExporter;

namespace net {
class HttpClient;
}

/// Per-provider run phases. Listing may repeat across cursors; Done is
/// reached exactly once per provider segment.
enum class OrchestratorState { Idle, Listing, Diffing, Scheduling, Draining, Summarizing, Done };

const char* orchestrator_state_name(OrchestratorState state);

struct BackupOptions {
    std::optional<std::filesystem::path> output_dir;  // overrides AppConfig::output_dir
    size_t limit = 0;                                 // per provider, 0 = unlimited
    std::string prefix;
    std::optional<bool> skip_existing;                // overrides AppConfig::skip_existing
};

struct UploadOptions {
    std::string remote_prefix;
    std::string pattern;  // fnmatch glob on the relative path or file name
    size_t limit = 0;
    std::optional<bool> skip_existing;
};

struct VerifyReport {
    uint64_t checked = 0;
    uint64_t ok = 0;
    std::vector<LocalRecord> missing;
    std::vector<LocalRecord> mismatched;

    bool clean() const { return missing.empty() && mismatched.empty(); }
};

/// Skip-existing decision for a backup candidate: the last transfer
/// succeeded, its file is still present, and the remote object has not been
/// modified since.
bool should_skip_backup(const std::optional<LocalRecord>& record, const RemoteObject& object);

/// Skip-existing decision for an upload: the last upload of this key
/// succeeded with identical content.
bool should_skip_upload(const std::optional<LocalRecord>& record, const std::string& fingerprint);

/// Map a remote key onto a safe relative path.
std::filesystem::path sanitize_key_path(const std::string& key);

/// Hands out backup destinations under one root. Paths already recorded in
/// the manifest are reserved for their keys, so a key never lands on a file
/// that another key's record points at, in this run or a later one.
class DestinationAllocator {
public:
    explicit DestinationAllocator(std::filesystem::path root) : root_(std::move(root)) {}

    /// Claim `path` for `key`. The first claim on a path wins.
    void reserve(const std::string& key, const std::filesystem::path& path);

    /// The key's own reserved path when it lies under the root, otherwise a
    /// fresh path that nothing else holds.
    std::filesystem::path allocate(const std::string& key);

private:
    bool claim(const std::string& key, const std::filesystem::path& path);

    std::filesystem::path root_;
    std::map<std::string, std::string> owners_;  // path -> key
    std::map<std::string, std::filesystem::path> reserved_;  // key -> path
};

/// Top-level driver: list, diff against the manifest, schedule, summarize.
/// Providers in multi-provider runs execute sequentially.
class Orchestrator {
public:
    using ProviderResolver = std::function<std::unique_ptr<Provider>(const ProviderConfig&)>;
    using StateObserver = std::function<void(const std::string& provider, OrchestratorState state)>;

    Orchestrator(const AppConfig& config, ManifestStore& manifest,
                 std::shared_ptr<net::HttpClient> http, MetricsExporter* metrics = nullptr);

    /// Replace how configured providers are instantiated.
    void set_resolver(ProviderResolver resolver) { resolver_ = std::move(resolver); }
    void set_observer(StateObserver observer) { observer_ = std::move(observer); }

    /// Back up one configured provider by name.
    RunSummary backup(const std::string& name, const BackupOptions& options,
                      const CancellationToken& cancel);

    /// Back up every enabled provider in configuration order.
    RunSummary backup_all(const BackupOptions& options, const CancellationToken& cancel);

    /// Back up from an already constructed provider.
    RunSummary backup(Provider& provider, const BackupOptions& options,
                      const CancellationToken& cancel);

    /// Upload one file. `remote_key` defaults to the file name.
    RunSummary upload_file(const std::string& name, const std::filesystem::path& file,
                           const std::string& remote_key, const UploadOptions& options,
                           const CancellationToken& cancel);

    /// Upload every image under `dir` (recursive).
    RunSummary upload_directory(const std::string& name, const std::filesystem::path& dir,
                                const UploadOptions& options, const CancellationToken& cancel);

    RunSummary upload(Provider& provider, const std::vector<std::filesystem::path>& files,
                      const std::filesystem::path& base_dir, const std::string& explicit_key,
                      const UploadOptions& options, const CancellationToken& cancel);

    DeleteResult remove(const std::string& name, const std::string& key);

    /// Configuration state, plus a connectivity probe when `probe` is set
    /// and the configuration validates. Never throws for provider problems.
    ProviderInfo describe(const std::string& name, bool probe);

    /// describe(name, false) for every configured provider.
    std::vector<ProviderInfo> list_providers();

    /// Re-fingerprint every successful record's local file.
    VerifyReport verify();

    SchedulerOptions scheduler_options() const;

private:
    std::unique_ptr<Provider> resolve(const std::string& name, ProviderAbort& abort);
    void notify(const std::string& provider, OrchestratorState state);
    RunSummary summarize(const std::string& provider, Direction direction,
                         const std::vector<TaskResult>& results, RunSummary summary);

    const AppConfig& config_;
    ManifestStore& manifest_;
    std::shared_ptr<net::HttpClient> http_;
    MetricsExporter* metrics_;
    ProviderResolver resolver_;
    StateObserver observer_;
};

}  // namespace hib
