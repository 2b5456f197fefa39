#pragma once

#include "hib/constants.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hib {

/// Configuration for one named provider instance.
struct ProviderConfig {
    std::string name;  // key under "providers"
    std::string type;  // registry type name, defaults to `name`
    bool enabled = true;
    std::map<std::string, std::string> params;  // passed to ProviderFactory

    /// Registry type this entry resolves to.
    const std::string& effective_type() const { return type.empty() ? name : type; }

    /// Validate the type and required params for it.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Global settings plus the provider table. Passed explicitly into the
/// orchestrator; nothing here is read from global state after loading.
struct AppConfig {
    std::filesystem::path output_dir;  // backup destination root
    std::filesystem::path state_dir;   // holds manifest.db

    size_t max_concurrent_transfers = constants::DEFAULT_TRANSFER_WIDTH;
    uint32_t timeout_secs = constants::DEFAULT_TIMEOUT_SECONDS;  // per-task
    uint32_t retry_count = constants::DEFAULT_MAX_ATTEMPTS;  // total attempts per task
    uint32_t backoff_initial_ms = constants::DEFAULT_BACKOFF_INITIAL_MS;
    uint32_t backoff_ceiling_ms = constants::DEFAULT_BACKOFF_CEILING_MS;
    bool skip_existing = true;
    bool verbose = false;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    std::vector<ProviderConfig> providers;  // config file order

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Write the configuration as JSON (tmp + rename).
    bool save_json(const std::filesystem::path& path) const;

    /// Fill empty credential params from well-known environment variables.
    void apply_env_overrides();

    /// Resolve `~` and fill empty directories.
    void apply_defaults();

    /// Validate global settings. Per-provider problems are reported by
    /// ProviderConfig::validate at describe time instead.
    std::string validate() const;

    const ProviderConfig* find_provider(const std::string& name) const;

    /// Manifest database location inside state_dir.
    std::filesystem::path manifest_path() const;

    /// A starter configuration for `hib init`.
    static AppConfig example();

    /// $HIB_CONFIG, then $XDG_CONFIG_HOME/hib/config.json, then
    /// ~/.config/hib/config.json.
    static std::filesystem::path default_config_path();
};

/// True for param names holding credentials.
bool is_secret_param(const std::string& key);

/// "abcd****" style masking for display.
std::string mask_secret(const std::string& value);

/// Expand a leading "~/" using $HOME.
std::filesystem::path expand_home(const std::filesystem::path& path);

}  // namespace hib
