#include "hib/orchestrator.hpp"
#include "hib/constants.hpp"
#include "hib/fingerprint.hpp"
#include "hib/log.hpp"
#include "hib/manifest_store.hpp"
#include "hib/metrics.hpp"

#include <algorithm>
#include <fnmatch.h>
#include <stdexcept>
#include <unordered_set>

namespace hib {

const char* orchestrator_state_name(OrchestratorState state) {
    switch (state) {
        case OrchestratorState::Idle: return "idle";
        case OrchestratorState::Listing: return "listing";
        case OrchestratorState::Diffing: return "diffing";
        case OrchestratorState::Scheduling: return "scheduling";
        case OrchestratorState::Draining: return "draining";
        case OrchestratorState::Summarizing: return "summarizing";
        case OrchestratorState::Done: return "done";
    }
    return "unknown";
}

// --- skip policy ---

bool should_skip_backup(const std::optional<LocalRecord>& record, const RemoteObject& object) {
    if (!record || record->outcome != Outcome::Success) return false;
    if (record->direction != Direction::Backup) return false;
    std::error_code ec;
    if (record->local_path.empty() || !std::filesystem::exists(record->local_path, ec)) return false;
    if (!object.last_modified) return true;
    return record->last_success >= to_epoch(*object.last_modified);
}

bool should_skip_upload(const std::optional<LocalRecord>& record, const std::string& fingerprint) {
    if (!record || record->outcome != Outcome::Success) return false;
    if (record->direction != Direction::Upload) return false;
    return !fingerprint.empty() && record->fingerprint == fingerprint;
}

// --- destination layout ---

namespace {

std::string sanitize_component(const std::string& part) {
    std::string out;
    out.reserve(part.size());
    for (unsigned char c : part) {
        if (c < 0x20 || c == 0x7f || c == '<' || c == '>' || c == ':' || c == '"' ||
            c == '\\' || c == '|' || c == '?' || c == '*') {
            out += '_';
        } else {
            out += static_cast<char>(c);
        }
    }
    if (out.size() > constants::MAX_PATH_COMPONENT) {
        auto dot = out.rfind('.');
        std::string ext = (dot != std::string::npos && out.size() - dot <= 16) ? out.substr(dot) : "";
        out = out.substr(0, constants::MAX_PATH_COMPONENT - ext.size()) + ext;
    }
    return out;
}

std::filesystem::path with_suffix(const std::filesystem::path& path, const std::string& suffix) {
    auto stem = path.stem().string();
    auto ext = path.extension().string();
    auto name = stem + suffix + ext;
    if (name.size() > constants::MAX_PATH_COMPONENT) {
        stem = stem.substr(0, constants::MAX_PATH_COMPONENT - suffix.size() - ext.size());
        name = stem + suffix + ext;
    }
    return path.parent_path() / name;
}

}  // namespace

std::filesystem::path sanitize_key_path(const std::string& key) {
    std::filesystem::path out;
    size_t start = 0;
    while (start <= key.size()) {
        size_t slash = key.find('/', start);
        if (slash == std::string::npos) slash = key.size();
        std::string part = key.substr(start, slash - start);
        start = slash + 1;
        if (part.empty() || part == "." || part == "..") continue;
        out /= sanitize_component(part);
    }
    if (out.empty()) out = "_";
    return out;
}

bool DestinationAllocator::claim(const std::string& key, const std::filesystem::path& path) {
    auto [it, inserted] = owners_.emplace(path.lexically_normal().string(), key);
    return inserted || it->second == key;
}

void DestinationAllocator::reserve(const std::string& key, const std::filesystem::path& path) {
    if (path.empty() || !claim(key, path)) return;
    reserved_.emplace(key, path);
}

std::filesystem::path DestinationAllocator::allocate(const std::string& key) {
    auto own = reserved_.find(key);
    if (own != reserved_.end()) {
        auto rel = own->second.lexically_normal().lexically_relative(root_.lexically_normal());
        if (!rel.empty() && *rel.begin() != "..") return own->second;
    }

    auto path = root_ / sanitize_key_path(key);
    if (claim(key, path)) return path;

    auto tag = "-" + sha256_hex(key).substr(0, 8);
    auto hashed = with_suffix(path, tag);
    for (int n = 2; !claim(key, hashed); ++n) {
        hashed = with_suffix(path, tag + "-" + std::to_string(n));
    }
    return hashed;
}

// --- Orchestrator ---

Orchestrator::Orchestrator(const AppConfig& config, ManifestStore& manifest,
                           std::shared_ptr<net::HttpClient> http, MetricsExporter* metrics)
    : config_(config), manifest_(manifest), http_(std::move(http)), metrics_(metrics) {
    resolver_ = [this](const ProviderConfig& pc) { return ProviderFactory::create(pc, http_); };
}

SchedulerOptions Orchestrator::scheduler_options() const {
    SchedulerOptions opts;
    opts.width = config_.max_concurrent_transfers;
    opts.max_attempts = config_.retry_count;
    opts.backoff_initial = std::chrono::milliseconds(config_.backoff_initial_ms);
    opts.backoff_ceiling = std::chrono::milliseconds(config_.backoff_ceiling_ms);
    opts.task_timeout = std::chrono::seconds(config_.timeout_secs);
    opts.verbose = config_.verbose;
    return opts;
}

void Orchestrator::notify(const std::string& provider, OrchestratorState state) {
    if (config_.verbose) log_debug("%s: %s", provider.c_str(), orchestrator_state_name(state));
    if (observer_) observer_(provider, state);
}

std::unique_ptr<Provider> Orchestrator::resolve(const std::string& name, ProviderAbort& abort) {
    abort.provider = name;
    const auto* pc = config_.find_provider(name);
    if (!pc) {
        abort.kind = ErrorKind::Rejected;
        abort.message = "provider is not configured";
        return nullptr;
    }
    if (!pc->enabled) {
        abort.kind = ErrorKind::Rejected;
        abort.message = "provider is disabled";
        return nullptr;
    }
    auto err = pc->validate();
    if (!err.empty()) {
        abort.kind = ErrorKind::Rejected;
        abort.message = "configuration: " + err;
        return nullptr;
    }
    try {
        auto provider = resolver_(*pc);
        if (!provider) {
            abort.kind = ErrorKind::Rejected;
            abort.message = "provider could not be created";
        }
        return provider;
    } catch (const std::runtime_error& e) {
        abort.kind = ErrorKind::Rejected;
        abort.message = e.what();
        return nullptr;
    }
}

RunSummary Orchestrator::summarize(const std::string& provider, Direction direction,
                                   const std::vector<TaskResult>& results, RunSummary summary) {
    notify(provider, OrchestratorState::Summarizing);
    summary.direction = direction;
    summary.attempted += results.size();
    for (const auto& r : results) {
        summary.retries += r.attempts > 0 ? r.attempts - 1 : 0;
        if (r.state == TaskState::Success) {
            summary.succeeded++;
            summary.bytes_transferred += r.bytes;
        } else {
            summary.failed++;
            summary.failures.push_back({provider, r.task.object.key, r.error.kind, r.error.message});
        }
    }
    notify(provider, OrchestratorState::Done);
    return summary;
}

RunSummary Orchestrator::backup(const std::string& name, const BackupOptions& options,
                                const CancellationToken& cancel) {
    ProviderAbort abort;
    auto provider = resolve(name, abort);
    if (!provider) {
        log_error("%s: %s", name.c_str(), abort.message.c_str());
        RunSummary summary;
        summary.direction = Direction::Backup;
        summary.providers.push_back(name);
        summary.aborted.push_back(abort);
        return summary;
    }
    return backup(*provider, options, cancel);
}

RunSummary Orchestrator::backup_all(const BackupOptions& options, const CancellationToken& cancel) {
    RunSummary total;
    total.direction = Direction::Backup;
    for (const auto& pc : config_.providers) {
        if (!pc.enabled) continue;
        if (cancel.cancelled()) {
            total.cancelled = true;
            break;
        }
        log_info("Backing up %s", pc.name.c_str());
        total.append(backup(pc.name, options, cancel));
    }
    return total;
}

RunSummary Orchestrator::backup(Provider& provider, const BackupOptions& options,
                                const CancellationToken& cancel) {
    const std::string& name = provider.name();
    RunSummary summary;
    summary.direction = Direction::Backup;
    summary.providers.push_back(name);
    notify(name, OrchestratorState::Idle);

    auto caps = provider.capabilities();
    if (!caps.has_all({Capability::List, Capability::Fetch})) {
        summary.aborted.push_back({name, ErrorKind::CapabilityUnsupported,
                                   "backup requires list and fetch (provider supports: " +
                                   caps.to_string() + ")"});
        log_error("%s: %s", name.c_str(), summary.aborted.back().message.c_str());
        notify(name, OrchestratorState::Done);
        return summary;
    }

    // Listing, re-entered per cursor
    std::vector<RemoteObject> candidates;
    Cursor cursor;
    while (true) {
        notify(name, OrchestratorState::Listing);
        if (cancel.cancelled()) break;
        auto page = provider.list(options.prefix, cursor);
        if (!page.success) {
            summary.aborted.push_back({name, page.error.kind, "listing failed: " + page.error.message});
            log_error("%s: listing failed: %s (%s)", name.c_str(), page.error.message.c_str(),
                      error_kind_name(page.error.kind));
            notify(name, OrchestratorState::Done);
            return summary;
        }
        for (auto& obj : page.objects) {
            if (options.limit > 0 && candidates.size() >= options.limit) break;
            candidates.push_back(std::move(obj));
        }
        bool limit_hit = options.limit > 0 && candidates.size() >= options.limit;
        if (limit_hit || !page.next_cursor) break;
        if (*page.next_cursor == cursor) {
            summary.aborted.push_back({name, ErrorKind::Rejected, "listing cursor did not advance"});
            notify(name, OrchestratorState::Done);
            return summary;
        }
        cursor = *page.next_cursor;
    }
    summary.listed = candidates.size();

    // Diffing
    notify(name, OrchestratorState::Diffing);
    bool skip_existing = options.skip_existing.value_or(config_.skip_existing);
    auto root = options.output_dir.value_or(config_.output_dir) / sanitize_key_path(name);
    DestinationAllocator destinations(root);
    for (const auto& rec : manifest_.history(name, 0)) {
        if (rec.direction == Direction::Backup) destinations.reserve(rec.remote_key, rec.local_path);
    }
    std::unordered_set<std::string> seen_keys;
    std::vector<TransferTask> tasks;
    for (auto& obj : candidates) {
        if (!seen_keys.insert(obj.key).second) {
            if (config_.verbose) log_debug("%s: duplicate listing entry %s", name.c_str(), obj.key.c_str());
            continue;
        }
        auto record = manifest_.lookup(name, obj.key);
        if (skip_existing && should_skip_backup(record, obj)) {
            summary.skipped++;
            if (metrics_) metrics_->skipped_total().Increment();
            if (metrics_) metrics_->transfers(Direction::Backup, Outcome::Skipped).Increment();
            auto err = manifest_.record_skip(name, obj.key, Direction::Backup, obj.size);
            if (!err.empty()) log_warn("%s: %s", name.c_str(), err.c_str());
            continue;
        }

        TransferTask task;
        task.index = tasks.size();
        task.provider = name;
        task.direction = Direction::Backup;
        task.destination = destinations.allocate(obj.key);
        task.object = std::move(obj);
        tasks.push_back(std::move(task));
    }

    // Scheduling and Draining
    notify(name, OrchestratorState::Scheduling);
    TransferScheduler scheduler(scheduler_options(), manifest_, metrics_);
    auto results = scheduler.run(std::move(tasks), provider, cancel,
                                 [&]() { notify(name, OrchestratorState::Draining); });
    summary.cancelled = cancel.cancelled();

    return summarize(name, Direction::Backup, results, std::move(summary));
}

RunSummary Orchestrator::upload_file(const std::string& name, const std::filesystem::path& file,
                                     const std::string& remote_key, const UploadOptions& options,
                                     const CancellationToken& cancel) {
    ProviderAbort abort;
    auto provider = resolve(name, abort);
    if (!provider) {
        log_error("%s: %s", name.c_str(), abort.message.c_str());
        RunSummary summary;
        summary.direction = Direction::Upload;
        summary.providers.push_back(name);
        summary.aborted.push_back(abort);
        return summary;
    }
    return upload(*provider, {file}, file.parent_path(), remote_key, options, cancel);
}

RunSummary Orchestrator::upload_directory(const std::string& name, const std::filesystem::path& dir,
                                          const UploadOptions& options,
                                          const CancellationToken& cancel) {
    RunSummary summary;
    summary.direction = Direction::Upload;
    summary.providers.push_back(name);

    ProviderAbort abort;
    auto provider = resolve(name, abort);
    if (!provider) {
        log_error("%s: %s", name.c_str(), abort.message.c_str());
        summary.aborted.push_back(abort);
        return summary;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        summary.aborted.push_back({name, ErrorKind::LocalIOError, "not a directory: " + dir.string()});
        return summary;
    }

    std::vector<std::filesystem::path> files;
    auto it = std::filesystem::recursive_directory_iterator(
        dir, std::filesystem::directory_options::skip_permission_denied, ec);
    for (auto end = std::filesystem::recursive_directory_iterator(); !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        auto rel = it->path().lexically_relative(dir).generic_string();
        if (!is_image_key(rel)) continue;
        if (!options.pattern.empty() &&
            fnmatch(options.pattern.c_str(), rel.c_str(), 0) != 0 &&
            fnmatch(options.pattern.c_str(), it->path().filename().c_str(), 0) != 0) {
            continue;
        }
        files.push_back(it->path());
    }
    if (ec) {
        summary.aborted.push_back({name, ErrorKind::LocalIOError,
                                   "cannot scan " + dir.string() + ": " + ec.message()});
        return summary;
    }
    std::sort(files.begin(), files.end());
    return upload(*provider, files, dir, {}, options, cancel);
}

RunSummary Orchestrator::upload(Provider& provider, const std::vector<std::filesystem::path>& files,
                                const std::filesystem::path& base_dir, const std::string& explicit_key,
                                const UploadOptions& options, const CancellationToken& cancel) {
    const std::string& name = provider.name();
    RunSummary summary;
    summary.direction = Direction::Upload;
    summary.providers.push_back(name);
    notify(name, OrchestratorState::Idle);

    if (!provider.capabilities().has(Capability::Push)) {
        summary.aborted.push_back({name, ErrorKind::CapabilityUnsupported,
                                   "upload requires push (provider supports: " +
                                   provider.capabilities().to_string() + ")"});
        log_error("%s: %s", name.c_str(), summary.aborted.back().message.c_str());
        notify(name, OrchestratorState::Done);
        return summary;
    }

    // Listing: the local candidate set
    notify(name, OrchestratorState::Listing);
    std::vector<std::filesystem::path> candidates;
    for (const auto& f : files) {
        if (options.limit > 0 && candidates.size() >= options.limit) break;
        candidates.push_back(f);
    }
    summary.listed = candidates.size();

    // Diffing
    notify(name, OrchestratorState::Diffing);
    bool skip_existing = options.skip_existing.value_or(config_.skip_existing);
    std::unordered_set<std::string> seen_keys;
    std::vector<TransferTask> tasks;
    for (const auto& file : candidates) {
        std::string key = explicit_key;
        if (key.empty()) {
            auto rel = file.lexically_relative(base_dir);
            key = options.remote_prefix + (rel.empty() ? file.filename() : rel).generic_string();
        }
        if (!seen_keys.insert(key).second) continue;

        TransferTask task;
        task.index = tasks.size();
        task.provider = name;
        task.direction = Direction::Upload;
        task.source = file;
        task.object.key = key;
        if (auto fp = fingerprint_file(file)) task.source_fingerprint = fp->digest;

        if (skip_existing && should_skip_upload(manifest_.lookup(name, key), task.source_fingerprint)) {
            summary.skipped++;
            if (metrics_) metrics_->skipped_total().Increment();
            if (metrics_) metrics_->transfers(Direction::Upload, Outcome::Skipped).Increment();
            std::error_code ec;
            auto size = std::filesystem::file_size(file, ec);
            auto err = manifest_.record_skip(name, key, Direction::Upload, ec ? 0 : size);
            if (!err.empty()) log_warn("%s: %s", name.c_str(), err.c_str());
            continue;
        }
        tasks.push_back(std::move(task));
    }

    notify(name, OrchestratorState::Scheduling);
    TransferScheduler scheduler(scheduler_options(), manifest_, metrics_);
    auto results = scheduler.run(std::move(tasks), provider, cancel,
                                 [&]() { notify(name, OrchestratorState::Draining); });
    summary.cancelled = cancel.cancelled();

    for (const auto& r : results) {
        if (r.state == TaskState::Success && !r.url.empty()) {
            log_info("Uploaded %s -> %s", r.task.source.c_str(), r.url.c_str());
        }
    }
    return summarize(name, Direction::Upload, results, std::move(summary));
}

DeleteResult Orchestrator::remove(const std::string& name, const std::string& key) {
    DeleteResult result;
    ProviderAbort abort;
    auto provider = resolve(name, abort);
    if (!provider) {
        result.error = {abort.kind, abort.message, {}};
        return result;
    }
    if (!provider->capabilities().has(Capability::Delete)) {
        result.error = {ErrorKind::CapabilityUnsupported, name + " does not support delete", {}};
        return result;
    }
    return provider->remove(key);
}

ProviderInfo Orchestrator::describe(const std::string& name, bool probe) {
    ProviderInfo info;
    info.name = name;
    const auto* pc = config_.find_provider(name);
    if (!pc) {
        info.config_error = "provider is not configured";
        return info;
    }
    info.enabled = pc->enabled;
    auto kind = provider_kind_from_name(pc->effective_type());
    if (kind) {
        info.kind = *kind;
        info.capabilities = find_registration(*kind)->capabilities;
    }
    info.config_error = pc->validate();
    if (!info.config_error.empty() || !probe) return info;

    try {
        auto provider = resolver_(*pc);
        if (!provider) {
            info.config_error = "provider could not be created";
            return info;
        }
        if (!provider->capabilities().has(Capability::Describe)) {
            info.detail = "provider does not support describe";
            return info;
        }
        auto probed = provider->describe(true);
        probed.enabled = pc->enabled;
        return probed;
    } catch (const std::runtime_error& e) {
        info.config_error = e.what();
        return info;
    }
}

std::vector<ProviderInfo> Orchestrator::list_providers() {
    std::vector<ProviderInfo> out;
    for (const auto& pc : config_.providers) {
        out.push_back(describe(pc.name, false));
    }
    return out;
}

VerifyReport Orchestrator::verify() {
    VerifyReport report;
    for (auto& rec : manifest_.all_records()) {
        if (rec.outcome != Outcome::Success || rec.fingerprint.empty()) continue;
        report.checked++;
        std::error_code ec;
        if (!std::filesystem::exists(rec.local_path, ec)) {
            report.missing.push_back(std::move(rec));
            continue;
        }
        auto fp = fingerprint_file(rec.local_path);
        if (!fp || fp->digest != rec.fingerprint) {
            report.mismatched.push_back(std::move(rec));
            continue;
        }
        report.ok++;
    }
    return report;
}

}  // namespace hib
