#include "hib/config.hpp"
#include "hib/constants.hpp"
#include "hib/provider.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace hib {

// --- ProviderConfig ---

std::string ProviderConfig::validate() const {
    if (name.empty()) return "provider name is required";
    return ProviderFactory::validate(*this);
}

// --- helpers ---

bool is_secret_param(const std::string& key) {
    return key.find("secret") != std::string::npos ||
           key.find("token") != std::string::npos ||
           key.find("password") != std::string::npos ||
           key == "access_key_id" || key == "client_id";
}

std::string mask_secret(const std::string& value) {
    if (value.empty()) return "";
    if (value.size() <= 8) return "****";
    return value.substr(0, 4) + "****";
}

std::filesystem::path expand_home(const std::filesystem::path& path) {
    auto s = path.string();
    if (s == "~" || s.compare(0, 2, "~/") == 0) {
        const char* home = std::getenv("HOME");
        if (!home || !*home) return path;
        return std::filesystem::path(home) / s.substr(s.size() > 1 ? 2 : 1);
    }
    return path;
}

// --- AppConfig ---

namespace {

// Environment variables consulted for each provider type's secret params.
struct EnvOverride {
    const char* type;
    const char* param;
    const char* env;
};

constexpr EnvOverride ENV_OVERRIDES[] = {
    {"github", "token", "GITHUB_TOKEN"},
    {"smms", "api_token", "SMMS_API_TOKEN"},
    {"sms", "api_token", "SMMS_API_TOKEN"},
    {"imgur", "client_id", "IMGUR_CLIENT_ID"},
    {"imgur", "access_token", "IMGUR_ACCESS_TOKEN"},
    {"oss", "access_key_id", "OSS_ACCESS_KEY_ID"},
    {"oss", "access_key_secret", "OSS_ACCESS_KEY_SECRET"},
    {"cos", "secret_id", "COS_SECRET_ID"},
    {"cos", "secret_key", "COS_SECRET_KEY"},
};

// Params are strings; tolerate numbers and bools in the file.
std::string param_to_string(const nlohmann::json& val) {
    if (val.is_string()) return val.get<std::string>();
    if (val.is_boolean()) return val.get<bool>() ? "true" : "false";
    return val.dump();
}

ProviderConfig* find_mutable(std::vector<ProviderConfig>& providers, const std::string& name) {
    for (auto& p : providers) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

}  // namespace

bool AppConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("output_dir")) output_dir = j["output_dir"].get<std::string>();
        if (j.contains("state_dir")) state_dir = j["state_dir"].get<std::string>();
        if (j.contains("max_concurrent_transfers"))
            max_concurrent_transfers = j["max_concurrent_transfers"].get<size_t>();
        if (j.contains("timeout")) timeout_secs = j["timeout"].get<uint32_t>();
        if (j.contains("retry_count")) retry_count = j["retry_count"].get<uint32_t>();
        if (j.contains("backoff_initial_ms")) backoff_initial_ms = j["backoff_initial_ms"].get<uint32_t>();
        if (j.contains("backoff_ceiling_ms")) backoff_ceiling_ms = j["backoff_ceiling_ms"].get<uint32_t>();
        if (j.contains("skip_existing")) skip_existing = j["skip_existing"].get<bool>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("providers") && j["providers"].is_object()) {
            for (auto& [name, jp] : j["providers"].items()) {
                if (!jp.is_object()) {
                    std::cerr << "Error: provider '" << name << "' must be an object\n";
                    return false;
                }
                ProviderConfig* pc = find_mutable(providers, name);
                if (!pc) {
                    providers.push_back(ProviderConfig{});
                    pc = &providers.back();
                    pc->name = name;
                }
                for (auto& [key, val] : jp.items()) {
                    if (key == "type") {
                        pc->type = val.get<std::string>();
                    } else if (key == "enabled") {
                        pc->enabled = val.get<bool>();
                    } else if (key == "params" && val.is_object()) {
                        for (auto& [pk, pv] : val.items()) {
                            pc->params[pk] = param_to_string(pv);
                        }
                    } else {
                        pc->params[key] = param_to_string(val);
                    }
                }
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

bool AppConfig::save_json(const std::filesystem::path& path) const {
    nlohmann::json j;
    j["output_dir"] = output_dir.string();
    j["state_dir"] = state_dir.string();
    j["max_concurrent_transfers"] = max_concurrent_transfers;
    j["timeout"] = timeout_secs;
    j["retry_count"] = retry_count;
    j["backoff_initial_ms"] = backoff_initial_ms;
    j["backoff_ceiling_ms"] = backoff_ceiling_ms;
    j["skip_existing"] = skip_existing;
    j["verbose"] = verbose;
    j["metrics_file"] = metrics_file.string();

    auto jproviders = nlohmann::json::object();
    for (const auto& p : providers) {
        nlohmann::json jp;
        if (!p.type.empty() && p.type != p.name) jp["type"] = p.type;
        jp["enabled"] = p.enabled;
        for (const auto& [key, val] : p.params) jp[key] = val;
        jproviders[p.name] = jp;
    }
    j["providers"] = jproviders;

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            std::cerr << "Error: cannot create " << path.parent_path() << ": " << ec.message() << "\n";
            return false;
        }
    }

    auto tmp_path = path.string() + ".tmp";
    {
        std::ofstream ofs(tmp_path);
        if (!ofs) {
            std::cerr << "Error: cannot write config file: " << tmp_path << "\n";
            return false;
        }
        ofs << j.dump(2) << "\n";
        if (!ofs) {
            std::cerr << "Error: write failed: " << tmp_path << "\n";
            std::filesystem::remove(tmp_path, ec);
            return false;
        }
    }
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::cerr << "Error: cannot rename config file: " << ec.message() << "\n";
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    return true;
}

void AppConfig::apply_env_overrides() {
    for (auto& p : providers) {
        for (const auto& ov : ENV_OVERRIDES) {
            if (p.effective_type() != ov.type) continue;
            auto it = p.params.find(ov.param);
            if (it != p.params.end() && !it->second.empty()) continue;
            if (const char* v = std::getenv(ov.env)) {
                if (*v) p.params[ov.param] = v;
            }
        }
    }
}

void AppConfig::apply_defaults() {
    if (output_dir.empty()) output_dir = constants::DEFAULT_OUTPUT_DIR;
    output_dir = expand_home(output_dir);

    if (state_dir.empty()) {
        if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
            state_dir = std::filesystem::path(xdg) / constants::CONFIG_DIR_NAME;
        } else {
            state_dir = expand_home("~/.local/share") / constants::CONFIG_DIR_NAME;
        }
    }
    state_dir = expand_home(state_dir);
    if (!metrics_file.empty()) metrics_file = expand_home(metrics_file);

    for (auto& p : providers) {
        if (p.type.empty()) p.type = p.name;
        auto it = p.params.find("path");
        if (it != p.params.end() && p.effective_type() == "local") {
            it->second = expand_home(it->second).string();
        }
    }
}

std::string AppConfig::validate() const {
    if (output_dir.empty()) return "output_dir is required";
    if (state_dir.empty()) return "state_dir is required";
    if (max_concurrent_transfers == 0) return "max_concurrent_transfers must be >= 1";
    if (retry_count == 0) return "retry_count must be >= 1";
    if (timeout_secs == 0) return "timeout must be > 0";
    if (backoff_ceiling_ms < backoff_initial_ms) return "backoff_ceiling_ms must be >= backoff_initial_ms";
    for (size_t i = 0; i < providers.size(); ++i) {
        if (providers[i].name.empty()) return "provider name must not be empty";
        for (size_t k = i + 1; k < providers.size(); ++k) {
            if (providers[i].name == providers[k].name)
                return "duplicate provider name: " + providers[i].name;
        }
    }
    return {};
}

const ProviderConfig* AppConfig::find_provider(const std::string& name) const {
    for (const auto& p : providers) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

std::filesystem::path AppConfig::manifest_path() const {
    return state_dir / constants::MANIFEST_FILE_NAME;
}

AppConfig AppConfig::example() {
    AppConfig config;
    config.output_dir = constants::DEFAULT_OUTPUT_DIR;

    auto add = [&](const std::string& name, std::map<std::string, std::string> params) {
        ProviderConfig pc;
        pc.name = name;
        pc.type = name;
        pc.enabled = false;
        pc.params = std::move(params);
        config.providers.push_back(std::move(pc));
    };
    add("oss", {{"bucket", ""}, {"region", "cn-hangzhou"}, {"access_key_id", ""},
                {"access_key_secret", ""}, {"prefix", ""}});
    add("cos", {{"bucket", ""}, {"region", "ap-guangzhou"}, {"secret_id", ""},
                {"secret_key", ""}, {"prefix", ""}});
    add("smms", {{"api_token", ""}});
    add("imgur", {{"client_id", ""}, {"access_token", ""}});
    add("github", {{"token", ""}, {"owner", ""}, {"repo", ""}, {"path", ""}, {"branch", "main"}});
    return config;
}

std::filesystem::path AppConfig::default_config_path() {
    if (const char* env = std::getenv("HIB_CONFIG"); env && *env) {
        return env;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / constants::CONFIG_DIR_NAME / constants::CONFIG_FILE_NAME;
    }
    return expand_home("~/.config") / constants::CONFIG_DIR_NAME / constants::CONFIG_FILE_NAME;
}

}  // namespace hib
