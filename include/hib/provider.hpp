#pragma once

#include "hib/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace hib {

struct ProviderConfig;

namespace net {
class HttpClient;
}

/// The five operations a provider may support.
enum class Capability : uint8_t {
    List = 1 << 0,
    Fetch = 1 << 1,
    Push = 1 << 2,
    Delete = 1 << 3,
    Describe = 1 << 4,
};

/// Bitmask of Capability values.
class CapabilitySet {
public:
    constexpr CapabilitySet() = default;
    constexpr CapabilitySet(std::initializer_list<Capability> caps) {
        for (auto c : caps) bits_ |= static_cast<uint8_t>(c);
    }

    constexpr bool has(Capability c) const { return (bits_ & static_cast<uint8_t>(c)) != 0; }
    constexpr bool has_all(CapabilitySet other) const { return (bits_ & other.bits_) == other.bits_; }
    constexpr uint8_t bits() const { return bits_; }

    /// "list,fetch,push" style rendering.
    std::string to_string() const;

private:
    uint8_t bits_ = 0;
};

const char* capability_name(Capability c);

/// Closed set of supported backends.
enum class ProviderKind { Local, OSS, COS, SMMS, Imgur, GitHub };

/// Absolute point by which a single provider call must finish.
using Deadline = std::chrono::steady_clock::time_point;

/// Remaining time until the deadline, floored at one millisecond.
std::chrono::milliseconds remaining(Deadline deadline);

/// Opaque pagination cursor. An empty optional from List means "end".
using Cursor = std::string;

struct ListPage {
    bool success = false;
    std::vector<RemoteObject> objects;
    std::optional<Cursor> next_cursor;
    TransferError error;
};

struct FetchResult {
    bool success = false;
    std::vector<uint8_t> data;
    TransferError error;
};

struct PushResult {
    bool success = false;
    RemoteObject object;
    std::string url;  // public URL reported by the backend, if any
    TransferError error;
};

struct DeleteResult {
    bool success = false;
    TransferError error;
};

struct ProviderInfo {
    std::string name;
    ProviderKind kind = ProviderKind::Local;
    bool enabled = false;
    CapabilitySet capabilities;
    bool reachable = false;
    std::string config_error;             // non-empty when validation failed
    std::string detail;                   // probe failure detail
    std::optional<uint64_t> image_count;  // when the backend reports it cheaply
};

/// A hosting backend. Each variant declares its capabilities; calling an
/// operation outside them returns CapabilityUnsupported.
///
/// Implementations must be safe to call from several scheduler workers at
/// once.
class Provider {
public:
    virtual ~Provider() = default;

    virtual const std::string& name() const = 0;
    virtual ProviderKind kind() const = 0;
    virtual CapabilitySet capabilities() const = 0;

    /// One page of image objects under `prefix`, starting at `cursor`
    /// (empty cursor = first page). Repeating a call with the same cursor
    /// yields the same page barring concurrent remote changes.
    virtual ListPage list(const std::string& prefix, const Cursor& cursor);

    virtual FetchResult fetch(const RemoteObject& object, Deadline deadline);

    virtual PushResult push(const std::filesystem::path& local_path,
                            const std::string& dest_key, Deadline deadline);

    virtual DeleteResult remove(const std::string& key);

    /// Reports configuration state and, when `probe` is set and the
    /// configuration is valid, whether the backend answers.
    virtual ProviderInfo describe(bool probe);

protected:
    static TransferError unsupported(Capability c, const std::string& provider);
};

/// Registration table entry for a provider kind.
struct ProviderRegistration {
    ProviderKind kind;
    const char* type_name;
    CapabilitySet capabilities;
    std::string (*validate)(const std::map<std::string, std::string>& params);
    std::unique_ptr<Provider> (*create)(const std::string& name,
                                        const std::map<std::string, std::string>& params,
                                        std::shared_ptr<net::HttpClient> http);
};

/// All registered kinds, in declaration order.
std::span<const ProviderRegistration> provider_registry();

const ProviderRegistration* find_registration(ProviderKind kind);
std::optional<ProviderKind> provider_kind_from_name(const std::string& type_name);
const char* provider_kind_name(ProviderKind kind);

/// Builds providers from configuration through the registration table.
class ProviderFactory {
public:
    /// Throws std::runtime_error for an unknown type or invalid params.
    static std::unique_ptr<Provider> create(const ProviderConfig& config,
                                            std::shared_ptr<net::HttpClient> http);

    /// Validation without construction. Returns an error or empty string.
    static std::string validate(const ProviderConfig& config);

    // Per-kind validators and constructors, defined beside each implementation
    using Params = std::map<std::string, std::string>;
    static std::string validate_local(const Params& params);
    static std::string validate_oss(const Params& params);
    static std::string validate_cos(const Params& params);
    static std::string validate_smms(const Params& params);
    static std::string validate_imgur(const Params& params);
    static std::string validate_github(const Params& params);

    static std::unique_ptr<Provider> create_local(const std::string& name,
                                                  const std::map<std::string, std::string>& params,
                                                  std::shared_ptr<net::HttpClient> http);
    static std::unique_ptr<Provider> create_oss(const std::string& name,
                                                const std::map<std::string, std::string>& params,
                                                std::shared_ptr<net::HttpClient> http);
    static std::unique_ptr<Provider> create_cos(const std::string& name,
                                                const std::map<std::string, std::string>& params,
                                                std::shared_ptr<net::HttpClient> http);
    static std::unique_ptr<Provider> create_smms(const std::string& name,
                                                 const std::map<std::string, std::string>& params,
                                                 std::shared_ptr<net::HttpClient> http);
    static std::unique_ptr<Provider> create_imgur(const std::string& name,
                                                  const std::map<std::string, std::string>& params,
                                                  std::shared_ptr<net::HttpClient> http);
    static std::unique_ptr<Provider> create_github(const std::string& name,
                                                   const std::map<std::string, std::string>& params,
                                                   std::shared_ptr<net::HttpClient> http);
};

/// True when the key ends in a recognized image extension.
bool is_image_key(const std::string& key);

/// Guess a MIME type from the key's extension.
std::string image_content_type(const std::string& key);

}  // namespace hib
