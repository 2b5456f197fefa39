#include "hib/config.hpp"
#include "hib/log.hpp"
#include "hib/manifest_store.hpp"
#include "hib/metrics.hpp"
#include "hib/net/http.hpp"
#include "hib/orchestrator.hpp"
#include "hib/provider.hpp"

#include <atomic>
#include <chrono>
#include <cinttypes>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_MANIFEST = 2;

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

void install_signal_handlers() {
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

/// Forwards the signal flag into a run's cancellation token, outside signal
/// context. Only transfer commands install the handlers; everything else
/// keeps the default SIGINT behavior.
class SignalWatcher {
public:
    explicit SignalWatcher(hib::CancellationToken& token) : token_(token) {
        install_signal_handlers();
        thread_ = std::thread([this] {
            while (!done_.load()) {
                if (g_shutdown_requested) {
                    hib::log_warn("Interrupted, finishing in-flight transfers...");
                    token_.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        });
    }
    ~SignalWatcher() {
        done_.store(true);
        thread_.join();
    }

private:
    hib::CancellationToken& token_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

void format_timestamp(int64_t ts, char* buf, size_t buf_size) {
    if (ts <= 0) {
        snprintf(buf, buf_size, "-");
        return;
    }
    time_t t = static_cast<time_t>(ts);
    struct tm tm_val;
    gmtime_r(&t, &tm_val);
    strftime(buf, buf_size, "%Y-%m-%dT%H:%M:%SZ", &tm_val);
}

void print_usage() {
    fprintf(stderr,
        "Usage: hib [--config <path>] [--verbose] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  init [--force]                  Write a starter configuration file\n"
        "  list                            Configured providers and capabilities\n"
        "  test <provider>                 Probe connectivity\n"
        "  info <provider>                 Provider details\n"
        "  backup <provider|all>           Download a provider's images\n"
        "  backup-all                      Same as 'backup all'\n"
        "  upload <provider> <file>        Upload one image\n"
        "  upload-all <provider> <dir>     Upload every image under a directory\n"
        "  delete <provider> <key>         Delete a remote image\n"
        "  history                         Recent transfer records\n"
        "  stats                           Operation totals\n"
        "  duplicates                      Records sharing identical content\n"
        "  cleanup                         Drop records whose local file is gone\n"
        "  verify                          Re-check recorded files against fingerprints\n"
        "\n"
        "Options:\n"
        "  --config <path>                 Config file (default: $HIB_CONFIG or\n"
        "                                  ~/.config/hib/config.json)\n"
        "  --verbose                       Debug output\n"
        "  --output <dir>                  backup: destination root\n"
        "  --limit <N>                     backup/upload-all/history: max items\n"
        "  --prefix <p>                    backup: remote key prefix\n"
        "  --skip-existing                 backup/upload: skip unchanged items (default)\n"
        "  --no-skip-existing              backup/upload: transfer everything\n"
        "  --remote-path <key>             upload: remote key (default: file name)\n"
        "  --remote-prefix <p>             upload-all: prefix for remote keys\n"
        "  --pattern <glob>                upload-all: file filter\n"
        "  --provider <name>               history/cleanup: restrict to one provider\n"
        "  --dry-run                       cleanup: report only\n"
        "  --force                         init: overwrite an existing file\n"
        "  --help                          Show this help\n"
    );
}

struct CliArgs {
    std::string config_path;
    bool verbose = false;
    std::string command;
    std::vector<std::string> positional;

    std::optional<std::string> output;
    size_t limit = 0;
    std::string prefix;
    std::optional<bool> skip_existing;
    std::string remote_path;
    std::string remote_prefix;
    std::string pattern;
    std::optional<std::string> provider;
    bool dry_run = false;
    bool force = false;
};

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const char* v = nullptr;

        if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(EXIT_OK);
        } else if (arg == "--config") {
            if (!(v = next_arg(i, "--config"))) return std::nullopt;
            args.config_path = v;
        } else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        } else if (arg == "--output") {
            if (!(v = next_arg(i, "--output"))) return std::nullopt;
            args.output = v;
        } else if (arg == "--limit") {
            if (!(v = next_arg(i, "--limit"))) return std::nullopt;
            char* end = nullptr;
            args.limit = strtoull(v, &end, 10);
            if (!end || *end != '\0') {
                std::cerr << "Error: --limit expects a number\n";
                return std::nullopt;
            }
        } else if (arg == "--prefix") {
            if (!(v = next_arg(i, "--prefix"))) return std::nullopt;
            args.prefix = v;
        } else if (arg == "--skip-existing") {
            args.skip_existing = true;
        } else if (arg == "--no-skip-existing") {
            args.skip_existing = false;
        } else if (arg == "--remote-path") {
            if (!(v = next_arg(i, "--remote-path"))) return std::nullopt;
            args.remote_path = v;
        } else if (arg == "--remote-prefix") {
            if (!(v = next_arg(i, "--remote-prefix"))) return std::nullopt;
            args.remote_prefix = v;
        } else if (arg == "--pattern") {
            if (!(v = next_arg(i, "--pattern"))) return std::nullopt;
            args.pattern = v;
        } else if (arg == "--provider") {
            if (!(v = next_arg(i, "--provider"))) return std::nullopt;
            args.provider = v;
        } else if (arg == "--dry-run") {
            args.dry_run = true;
        } else if (arg == "--force") {
            args.force = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }

    if (args.command.empty()) {
        print_usage();
        return std::nullopt;
    }
    return args;
}

bool need_positional(const CliArgs& args, size_t n, const char* usage) {
    if (args.positional.size() == n) return true;
    std::cerr << "Usage: hib " << usage << "\n";
    return false;
}

void print_summary(const hib::RunSummary& s) {
    printf("\n%s summary (%zu provider%s)%s\n", s.direction == hib::Direction::Backup ? "Backup" : "Upload",
           s.providers.size(), s.providers.size() == 1 ? "" : "s", s.cancelled ? " [cancelled]" : "");
    printf("  listed:      %" PRIu64 "\n", s.listed);
    printf("  attempted:   %" PRIu64 "\n", s.attempted);
    printf("  succeeded:   %" PRIu64 "\n", s.succeeded);
    printf("  skipped:     %" PRIu64 "\n", s.skipped);
    printf("  failed:      %" PRIu64 "\n", s.failed);
    printf("  retries:     %" PRIu64 "\n", s.retries);
    printf("  bytes:       %" PRIu64 "\n", s.bytes_transferred);
    for (const auto& a : s.aborted) {
        printf("  aborted %s: %s (%s)\n", a.provider.c_str(), a.message.c_str(),
               hib::error_kind_name(a.kind));
    }
    for (const auto& f : s.failures) {
        printf("  failed %s/%s: %s (%s)\n", f.provider.c_str(), f.key.c_str(), f.message.c_str(),
               hib::error_kind_name(f.kind));
    }
}

void print_record(const hib::LocalRecord& r) {
    char time_buf[64];
    format_timestamp(r.updated_at, time_buf, sizeof(time_buf));
    printf("%s\t%s\t%s\t%s\t%s\t%" PRIu64 "\t%s", time_buf, r.provider.c_str(),
           hib::direction_name(r.direction), hib::outcome_name(r.outcome), r.remote_key.c_str(),
           r.size, r.local_path.c_str());
    if (r.outcome == hib::Outcome::Failed) {
        printf("\t%s: %s", hib::error_kind_name(r.error_kind), r.message.c_str());
    }
    printf("\n");
}

void print_provider_info(const hib::ProviderInfo& info, const hib::ProviderConfig* pc) {
    printf("%s\n", info.name.c_str());
    printf("  type:         %s\n", pc ? pc->effective_type().c_str() : hib::provider_kind_name(info.kind));
    printf("  enabled:      %s\n", info.enabled ? "yes" : "no");
    printf("  capabilities: %s\n", info.capabilities.to_string().c_str());
    if (pc) {
        for (const auto& [k, v] : pc->params) {
            printf("  %-13s %s\n", (k + ":").c_str(),
                   hib::is_secret_param(k) ? hib::mask_secret(v).c_str() : v.c_str());
        }
    }
    if (!info.config_error.empty()) {
        printf("  config error: %s\n", info.config_error.c_str());
    }
}

int cmd_init(const CliArgs& args, const std::filesystem::path& config_path) {
    std::error_code ec;
    if (std::filesystem::exists(config_path, ec) && !args.force) {
        std::cerr << "Configuration already exists: " << config_path.string()
                  << " (use --force to overwrite)\n";
        return EXIT_FAILED;
    }
    std::filesystem::create_directories(config_path.parent_path(), ec);
    if (!hib::AppConfig::example().save_json(config_path)) {
        return EXIT_FAILED;
    }
    printf("Wrote %s\n", config_path.c_str());
    printf("Edit it to add credentials, then enable providers with \"enabled\": true\n");
    return EXIT_OK;
}

int run(const CliArgs& args, const hib::AppConfig& config) {
    const std::string& cmd = args.command;

    auto manifest = std::make_unique<hib::ManifestStore>(config.manifest_path());

    hib::net::HttpClientConfig http_config;
    http_config.verbose = config.verbose;
    auto http = std::make_shared<hib::net::HttpClient>(http_config);

    std::unique_ptr<hib::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<hib::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs));
        metrics->start();
    }

    hib::Orchestrator orchestrator(config, *manifest, http, metrics.get());
    hib::CancellationToken cancel;
    int rc = EXIT_OK;

    if (cmd == "list") {
        printf("%-16s %-8s %-8s %s\n", "NAME", "TYPE", "ENABLED", "CAPABILITIES");
        for (const auto& info : orchestrator.list_providers()) {
            const auto* pc = config.find_provider(info.name);
            printf("%-16s %-8s %-8s %s%s\n", info.name.c_str(),
                   pc ? pc->effective_type().c_str() : "?", info.enabled ? "yes" : "no",
                   info.capabilities.to_string().c_str(),
                   info.config_error.empty() ? "" : ("  [" + info.config_error + "]").c_str());
        }
    } else if (cmd == "test") {
        if (!need_positional(args, 1, "test <provider>")) return EXIT_FAILED;
        auto info = orchestrator.describe(args.positional[0], true);
        if (!info.config_error.empty()) {
            printf("%s: configuration error: %s\n", info.name.c_str(), info.config_error.c_str());
            rc = EXIT_FAILED;
        } else if (!info.reachable) {
            printf("%s: unreachable: %s\n", info.name.c_str(), info.detail.c_str());
            rc = EXIT_FAILED;
        } else {
            printf("%s: ok\n", info.name.c_str());
        }
    } else if (cmd == "info") {
        if (!need_positional(args, 1, "info <provider>")) return EXIT_FAILED;
        auto info = orchestrator.describe(args.positional[0], true);
        print_provider_info(info, config.find_provider(info.name));
        if (info.config_error.empty()) {
            printf("  reachable:    %s\n", info.reachable ? "yes" : "no");
            if (!info.detail.empty()) printf("  detail:       %s\n", info.detail.c_str());
            if (info.image_count) printf("  images:       %" PRIu64 "\n", *info.image_count);
        } else {
            rc = EXIT_FAILED;
        }
    } else if (cmd == "backup" || cmd == "backup-all") {
        std::string target = cmd == "backup-all" ? "all" : "";
        if (target.empty()) {
            if (!need_positional(args, 1, "backup <provider|all>")) return EXIT_FAILED;
            target = args.positional[0];
        }
        hib::BackupOptions opts;
        if (args.output) opts.output_dir = hib::expand_home(*args.output);
        opts.limit = args.limit;
        opts.prefix = args.prefix;
        opts.skip_existing = args.skip_existing;

        SignalWatcher watcher(cancel);
        auto summary = target == "all" ? orchestrator.backup_all(opts, cancel)
                                       : orchestrator.backup(target, opts, cancel);
        print_summary(summary);
        if (!summary.ok()) rc = EXIT_FAILED;
    } else if (cmd == "upload") {
        if (!need_positional(args, 2, "upload <provider> <file> [--remote-path <key>]")) return EXIT_FAILED;
        std::filesystem::path file = hib::expand_home(args.positional[1]);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file, ec)) {
            std::cerr << "Error: not a file: " << file.string() << "\n";
            return EXIT_FAILED;
        }
        hib::UploadOptions opts;
        opts.skip_existing = args.skip_existing;
        std::string key = args.remote_path.empty() ? file.filename().string() : args.remote_path;

        SignalWatcher watcher(cancel);
        auto summary = orchestrator.upload_file(args.positional[0], file, key, opts, cancel);
        print_summary(summary);
        if (!summary.ok()) rc = EXIT_FAILED;
    } else if (cmd == "upload-all") {
        if (!need_positional(args, 2, "upload-all <provider> <dir>")) return EXIT_FAILED;
        hib::UploadOptions opts;
        opts.remote_prefix = args.remote_prefix;
        opts.pattern = args.pattern;
        opts.limit = args.limit;
        opts.skip_existing = args.skip_existing;

        SignalWatcher watcher(cancel);
        auto summary = orchestrator.upload_directory(args.positional[0],
                                                     hib::expand_home(args.positional[1]), opts, cancel);
        print_summary(summary);
        if (!summary.ok()) rc = EXIT_FAILED;
    } else if (cmd == "delete") {
        if (!need_positional(args, 2, "delete <provider> <key>")) return EXIT_FAILED;
        auto result = orchestrator.remove(args.positional[0], args.positional[1]);
        if (result.success) {
            printf("Deleted %s from %s\n", args.positional[1].c_str(), args.positional[0].c_str());
        } else {
            std::cerr << "Delete failed: " << result.error.message << " ("
                      << hib::error_kind_name(result.error.kind) << ")\n";
            rc = EXIT_FAILED;
        }
    } else if (cmd == "history") {
        auto records = manifest->history(args.provider, args.limit ? args.limit : 20);
        for (const auto& r : records) print_record(r);
        if (records.empty()) printf("No history\n");
    } else if (cmd == "stats") {
        auto st = manifest->stats();
        char time_buf[64];
        format_timestamp(st.last_operation, time_buf, sizeof(time_buf));
        printf("manifest:        %s\n", manifest->path().c_str());
        printf("records:         %" PRIu64 "\n", st.records);
        printf("providers:       %" PRIu64 "\n", st.providers);
        printf("operations:      %" PRIu64 "\n", st.operations);
        printf("last operation:  %s\n", time_buf);
        printf("backups:         %" PRIu64 " ok, %" PRIu64 " failed, %" PRIu64 " skipped, %" PRIu64 " bytes\n",
               st.backups.success, st.backups.failed, st.backups.skipped, st.backups.bytes);
        printf("uploads:         %" PRIu64 " ok, %" PRIu64 " failed, %" PRIu64 " skipped, %" PRIu64 " bytes\n",
               st.uploads.success, st.uploads.failed, st.uploads.skipped, st.uploads.bytes);
    } else if (cmd == "duplicates") {
        auto groups = manifest->find_duplicates();
        for (const auto& group : groups) {
            printf("%s (%" PRIu64 " bytes)\n", group.front().fingerprint.c_str(), group.front().size);
            for (const auto& r : group) {
                printf("  %s:%s  %s\n", r.provider.c_str(), r.remote_key.c_str(), r.local_path.c_str());
            }
        }
        printf("%zu duplicate group%s\n", groups.size(), groups.size() == 1 ? "" : "s");
    } else if (cmd == "cleanup") {
        auto provider = args.provider;
        auto removed = manifest->cleanup(
            [&provider](const hib::LocalRecord& r) { return !provider || r.provider == *provider; },
            args.dry_run);
        for (const auto& r : removed) {
            printf("%s %s:%s (%s)\n", args.dry_run ? "would remove" : "removed", r.provider.c_str(),
                   r.remote_key.c_str(), r.local_path.c_str());
        }
        printf("%zu orphan record%s\n", removed.size(), removed.size() == 1 ? "" : "s");
    } else if (cmd == "verify") {
        auto report = orchestrator.verify();
        for (const auto& r : report.missing) {
            printf("missing    %s:%s  %s\n", r.provider.c_str(), r.remote_key.c_str(), r.local_path.c_str());
        }
        for (const auto& r : report.mismatched) {
            printf("mismatch   %s:%s  %s\n", r.provider.c_str(), r.remote_key.c_str(), r.local_path.c_str());
        }
        printf("checked %" PRIu64 ", ok %" PRIu64 ", missing %zu, mismatched %zu\n", report.checked,
               report.ok, report.missing.size(), report.mismatched.size());
        if (!report.clean()) rc = EXIT_FAILED;
    } else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        rc = EXIT_FAILED;
    }

    if (metrics) metrics->stop();
    return rc;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args_opt = parse_args(argc, argv);
    if (!args_opt) {
        return EXIT_FAILED;
    }
    const auto& args = *args_opt;

    std::filesystem::path config_path =
        args.config_path.empty() ? hib::AppConfig::default_config_path() : hib::expand_home(args.config_path);

    if (args.command == "init") {
        return cmd_init(args, config_path);
    }

    hib::AppConfig config;
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        std::cerr << "No configuration at " << config_path.string() << " (run 'hib init')\n";
        return EXIT_FAILED;
    }
    if (!config.load_json(config_path)) {
        return EXIT_FAILED;
    }
    if (args.verbose) config.verbose = true;
    config.apply_env_overrides();
    config.apply_defaults();

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return EXIT_FAILED;
    }

    try {
        return run(args, config);
    } catch (const hib::ManifestError& e) {
        hib::log_error("Manifest error: %s", e.what());
        return EXIT_MANIFEST;
    }
}
