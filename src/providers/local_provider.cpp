#include "hib/provider.hpp"
#include "hib/constants.hpp"
#include "providers/common.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <mutex>

namespace hib {

using providers::param_or;

namespace {

/// A directory tree treated as a remote image store. Keys are paths
/// relative to the root with '/' separators.
class LocalProvider : public Provider {
public:
    LocalProvider(const std::string& name, const std::filesystem::path& root,
                  const std::string& prefix)
        : name_(name), root_(std::filesystem::absolute(root)), prefix_(prefix) {}

    const std::string& name() const override { return name_; }
    ProviderKind kind() const override { return ProviderKind::Local; }
    CapabilitySet capabilities() const override {
        return find_registration(ProviderKind::Local)->capabilities;
    }

    ListPage list(const std::string& prefix, const Cursor& cursor) override {
        ListPage page;
        std::string full_prefix = prefix_ + prefix;

        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        // A fresh listing (or a different prefix) rescans; continuation pages
        // come from the same sorted snapshot so cursors stay stable.
        if (cursor.empty() || !snapshot_valid_ || snapshot_prefix_ != full_prefix) {
            std::error_code ec;
            auto keys = scan(full_prefix, ec);
            if (ec) {
                page.error = {ErrorKind::Transient, "Cannot scan " + root_.string() + ": " + ec.message(), {}};
                return page;
            }
            snapshot_ = std::move(keys);
            snapshot_prefix_ = full_prefix;
            snapshot_valid_ = true;
        }

        auto it = cursor.empty() ? snapshot_.begin()
                                 : std::upper_bound(snapshot_.begin(), snapshot_.end(), cursor);
        for (; it != snapshot_.end() && page.objects.size() < constants::DEFAULT_LIST_PAGE_SIZE; ++it) {
            std::error_code ec;
            auto path = root_ / *it;
            auto size = std::filesystem::file_size(path, ec);
            if (ec) continue;  // removed since the scan

            RemoteObject obj;
            obj.key = *it;
            obj.size = size;
            auto ftime = std::filesystem::last_write_time(path, ec);
            if (!ec) {
                obj.last_modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                    std::chrono::file_clock::to_sys(ftime));
            }
            page.objects.push_back(std::move(obj));
        }
        if (it != snapshot_.end() && !page.objects.empty()) {
            page.next_cursor = page.objects.back().key;
        }
        page.success = true;
        return page;
    }

    FetchResult fetch(const RemoteObject& object, Deadline) override {
        FetchResult result;
        auto path = key_to_path(object.key);
        if (!path) {
            result.error = {ErrorKind::Rejected, "Invalid key: " + object.key, {}};
            return result;
        }

        std::ifstream file(*path, std::ios::binary | std::ios::ate);
        if (!file) {
            result.error = {ErrorKind::NotFound, "Object not found: " + object.key, {}};
            return result;
        }

        auto tellg_val = file.tellg();
        if (tellg_val < 0) {
            result.error = {ErrorKind::Transient, "Cannot determine file size: " + object.key, {}};
            return result;
        }
        result.data.resize(static_cast<size_t>(tellg_val));
        file.seekg(0);
        file.read(reinterpret_cast<char*>(result.data.data()), tellg_val);
        if (!file) {
            result.data.clear();
            result.error = {ErrorKind::Transient, "Failed to read file: " + object.key, {}};
            return result;
        }

        result.success = true;
        return result;
    }

    PushResult push(const std::filesystem::path& local_path,
                    const std::string& dest_key, Deadline) override {
        PushResult result;
        auto path = key_to_path(prefix_ + dest_key);
        if (!path) {
            result.error = {ErrorKind::Rejected, "Invalid key: " + dest_key, {}};
            return result;
        }

        std::error_code ec;
        std::filesystem::create_directories(path->parent_path(), ec);
        if (ec) {
            result.error = {ErrorKind::Rejected, "Failed to create directory: " + ec.message(), {}};
            return result;
        }

        // Write to temp file then rename (atomic)
        auto temp_path = path->string() + ".tmp." +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        std::filesystem::copy_file(local_path, temp_path,
            std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            std::error_code rm_ec;
            std::filesystem::remove(temp_path, rm_ec);
            result.error = {ErrorKind::LocalIOError, "Failed to copy file: " + ec.message(), {}};
            return result;
        }
        std::filesystem::rename(temp_path, *path, ec);
        if (ec) {
            std::error_code rm_ec;
            std::filesystem::remove(temp_path, rm_ec);
            result.error = {ErrorKind::Rejected, "Failed to rename file: " + ec.message(), {}};
            return result;
        }

        result.object.key = prefix_ + dest_key;
        result.object.size = std::filesystem::file_size(*path, ec);
        result.object.last_modified = std::chrono::system_clock::now();
        result.url = "file://" + path->string();
        result.success = true;
        return result;
    }

    DeleteResult remove(const std::string& key) override {
        DeleteResult result;
        auto path = key_to_path(key);
        if (!path) {
            result.error = {ErrorKind::Rejected, "Invalid key: " + key, {}};
            return result;
        }
        std::error_code ec;
        bool removed = std::filesystem::remove(*path, ec);
        if (ec) {
            result.error = {ErrorKind::Rejected, "Failed to remove: " + ec.message(), {}};
            return result;
        }
        if (!removed) {
            result.error = {ErrorKind::NotFound, "Object not found: " + key, {}};
            return result;
        }
        result.success = true;
        return result;
    }

    ProviderInfo describe(bool probe) override {
        ProviderInfo info;
        info.name = name_;
        info.kind = ProviderKind::Local;
        info.enabled = true;
        info.capabilities = capabilities();
        if (!probe) return info;

        std::error_code ec;
        info.reachable = std::filesystem::is_directory(root_, ec);
        if (!info.reachable) {
            info.detail = "not a directory: " + root_.string();
            return info;
        }
        auto keys = scan(prefix_, ec);
        if (ec) {
            info.reachable = false;
            info.detail = ec.message();
        } else {
            info.image_count = keys.size();
        }
        return info;
    }

private:
    std::vector<std::string> scan(const std::string& prefix, std::error_code& ec) const {
        std::vector<std::string> keys;
        auto it = std::filesystem::recursive_directory_iterator(
            root_, std::filesystem::directory_options::skip_permission_denied, ec);
        if (ec) return keys;
        for (auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
            if (ec) return keys;
            if (!it->is_regular_file(ec)) continue;
            auto key = it->path().lexically_relative(root_).generic_string();
            if (key.find(".tmp.") != std::string::npos) continue;  // in-progress push
            if (!is_image_key(key)) continue;
            if (!prefix.empty() && key.compare(0, prefix.size(), prefix) != 0) continue;
            keys.push_back(std::move(key));
        }
        std::sort(keys.begin(), keys.end());
        return keys;
    }

    std::optional<std::filesystem::path> key_to_path(const std::string& key) const {
        std::filesystem::path rel(key);
        if (key.empty() || rel.is_absolute()) return std::nullopt;
        for (const auto& part : rel) {
            if (part == "..") return std::nullopt;
        }
        return root_ / rel;
    }

    std::string name_;
    std::filesystem::path root_;
    std::string prefix_;

    std::mutex snapshot_mutex_;
    std::vector<std::string> snapshot_;
    std::string snapshot_prefix_;
    bool snapshot_valid_ = false;
};

}  // namespace

std::string ProviderFactory::validate_local(const Params& params) {
    auto path = param_or(params, "path");
    if (path.empty()) return "local provider requires 'path'";
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec))
        return "local provider path does not exist: " + path;
    return {};
}

std::unique_ptr<Provider> ProviderFactory::create_local(const std::string& name,
                                                        const Params& params,
                                                        std::shared_ptr<net::HttpClient>) {
    return std::make_unique<LocalProvider>(name, param_or(params, "path"), param_or(params, "prefix"));
}

}  // namespace hib
