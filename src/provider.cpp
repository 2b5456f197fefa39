#include "hib/provider.hpp"
#include "hib/config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace hib {

// --- capabilities ---

const char* capability_name(Capability c) {
    switch (c) {
        case Capability::List: return "list";
        case Capability::Fetch: return "fetch";
        case Capability::Push: return "push";
        case Capability::Delete: return "delete";
        case Capability::Describe: return "describe";
    }
    return "unknown";
}

std::string CapabilitySet::to_string() const {
    static constexpr Capability ALL[] = {
        Capability::List, Capability::Fetch, Capability::Push,
        Capability::Delete, Capability::Describe,
    };
    std::string out;
    for (auto c : ALL) {
        if (!has(c)) continue;
        if (!out.empty()) out += ",";
        out += capability_name(c);
    }
    return out;
}

std::chrono::milliseconds remaining(Deadline deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds(1));
}

// --- Provider defaults ---

TransferError Provider::unsupported(Capability c, const std::string& provider) {
    TransferError err;
    err.kind = ErrorKind::CapabilityUnsupported;
    err.message = provider + " does not support " + capability_name(c);
    return err;
}

ListPage Provider::list(const std::string&, const Cursor&) {
    ListPage page;
    page.error = unsupported(Capability::List, name());
    return page;
}

FetchResult Provider::fetch(const RemoteObject&, Deadline) {
    FetchResult result;
    result.error = unsupported(Capability::Fetch, name());
    return result;
}

PushResult Provider::push(const std::filesystem::path&, const std::string&, Deadline) {
    PushResult result;
    result.error = unsupported(Capability::Push, name());
    return result;
}

DeleteResult Provider::remove(const std::string&) {
    DeleteResult result;
    result.error = unsupported(Capability::Delete, name());
    return result;
}

ProviderInfo Provider::describe(bool) {
    ProviderInfo info;
    info.name = name();
    info.kind = kind();
    info.enabled = true;
    info.capabilities = capabilities();
    info.detail = unsupported(Capability::Describe, name()).message;
    return info;
}

// --- registry ---

namespace {

constexpr CapabilitySet FULL_CAPABILITIES{
    Capability::List, Capability::Fetch, Capability::Push,
    Capability::Delete, Capability::Describe,
};

const std::array<ProviderRegistration, 6> REGISTRY = {{
    {ProviderKind::Local, "local", FULL_CAPABILITIES,
     &ProviderFactory::validate_local, &ProviderFactory::create_local},
    {ProviderKind::OSS, "oss", FULL_CAPABILITIES,
     &ProviderFactory::validate_oss, &ProviderFactory::create_oss},
    {ProviderKind::COS, "cos", FULL_CAPABILITIES,
     &ProviderFactory::validate_cos, &ProviderFactory::create_cos},
    {ProviderKind::SMMS, "smms", FULL_CAPABILITIES,
     &ProviderFactory::validate_smms, &ProviderFactory::create_smms},
    {ProviderKind::Imgur, "imgur", FULL_CAPABILITIES,
     &ProviderFactory::validate_imgur, &ProviderFactory::create_imgur},
    {ProviderKind::GitHub, "github", FULL_CAPABILITIES,
     &ProviderFactory::validate_github, &ProviderFactory::create_github},
}};

}  // namespace

std::span<const ProviderRegistration> provider_registry() {
    return REGISTRY;
}

const ProviderRegistration* find_registration(ProviderKind kind) {
    for (const auto& reg : REGISTRY) {
        if (reg.kind == kind) return &reg;
    }
    return nullptr;
}

std::optional<ProviderKind> provider_kind_from_name(const std::string& type_name) {
    std::string lower = type_name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "sms") lower = "smms";
    for (const auto& reg : REGISTRY) {
        if (lower == reg.type_name) return reg.kind;
    }
    return std::nullopt;
}

const char* provider_kind_name(ProviderKind kind) {
    if (const auto* reg = find_registration(kind)) return reg->type_name;
    return "unknown";
}

// --- ProviderFactory ---

std::string ProviderFactory::validate(const ProviderConfig& config) {
    auto kind = provider_kind_from_name(config.effective_type());
    if (!kind) return "unknown provider type: " + config.effective_type();
    const auto* reg = find_registration(*kind);
    return reg->validate(config.params);
}

std::unique_ptr<Provider> ProviderFactory::create(const ProviderConfig& config,
                                                  std::shared_ptr<net::HttpClient> http) {
    auto kind = provider_kind_from_name(config.effective_type());
    if (!kind) {
        throw std::runtime_error("Unknown provider type: " + config.effective_type());
    }
    const auto* reg = find_registration(*kind);
    auto err = reg->validate(config.params);
    if (!err.empty()) {
        throw std::runtime_error(config.name + ": " + err);
    }
    return reg->create(config.name, config.params, std::move(http));
}

// --- image keys ---

namespace {

std::string lower_extension(const std::string& key) {
    auto slash = key.rfind('/');
    auto dot = key.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "";
    std::string ext = key.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

struct ImageType {
    const char* ext;
    const char* mime;
};

constexpr ImageType IMAGE_TYPES[] = {
    {".jpg", "image/jpeg"},  {".jpeg", "image/jpeg"}, {".png", "image/png"},
    {".gif", "image/gif"},   {".bmp", "image/bmp"},   {".webp", "image/webp"},
    {".svg", "image/svg+xml"}, {".tiff", "image/tiff"}, {".ico", "image/x-icon"},
};

}  // namespace

bool is_image_key(const std::string& key) {
    auto ext = lower_extension(key);
    if (ext.empty()) return false;
    for (const auto& t : IMAGE_TYPES) {
        if (ext == t.ext) return true;
    }
    return false;
}

std::string image_content_type(const std::string& key) {
    auto ext = lower_extension(key);
    for (const auto& t : IMAGE_TYPES) {
        if (ext == t.ext) return t.mime;
    }
    return "application/octet-stream";
}

}  // namespace hib
