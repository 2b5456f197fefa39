#include "hib/provider.hpp"
#include "hib/net/http.hpp"
#include "hib/secure_string.hpp"
#include "providers/common.hpp"

#include <nlohmann/json.hpp>

namespace hib {

using providers::param_or;

namespace {

constexpr const char* SMMS_API_BASE = "https://sm.ms/api/v2";
constexpr size_t SMMS_PAGE_SIZE = 100;

/// sm.ms v2. Keys are the image's storage path without the leading slash;
/// deletion needs the image hash, kept in attributes["hash"].
class SmmsProvider : public Provider {
public:
    SmmsProvider(const std::string& name, const std::string& api_base,
                 SecureString token, std::shared_ptr<net::HttpClient> http)
        : name_(name), api_base_(api_base), token_(std::move(token)), http_(std::move(http)) {}

    const std::string& name() const override { return name_; }
    ProviderKind kind() const override { return ProviderKind::SMMS; }
    CapabilitySet capabilities() const override {
        return find_registration(ProviderKind::SMMS)->capabilities;
    }

    ListPage list(const std::string& prefix, const Cursor& cursor) override {
        ListPage page;
        int page_no = 1;
        if (!cursor.empty()) {
            try {
                page_no = std::stoi(cursor);
            } catch (const std::exception&) {
                page.error = {ErrorKind::Rejected, "Invalid cursor: " + cursor, {}};
                return page;
            }
        }

        auto request = authorized(net::HttpRequest::get(
            api_base_ + "/upload_history?page=" + std::to_string(page_no)));
        auto response = http_->execute(request);
        nlohmann::json body;
        if (auto err = parse_reply(response, body)) {
            page.error = err;
            return page;
        }

        const auto& data = body.contains("data") && body["data"].is_array()
            ? body["data"] : nlohmann::json::array();
        for (const auto& img : data) {
            RemoteObject obj;
            obj.key = img.value("path", "");
            if (!obj.key.empty() && obj.key.front() == '/') obj.key.erase(0, 1);
            if (obj.key.empty()) obj.key = img.value("storename", img.value("filename", ""));
            if (!is_image_key(obj.key)) continue;
            if (!prefix.empty() && obj.key.compare(0, prefix.size(), prefix) != 0) continue;

            if (img.contains("size") && img["size"].is_number()) obj.size = img["size"].get<uint64_t>();
            if (img.contains("created_at")) {
                const auto& created = img["created_at"];
                if (created.is_number()) {
                    obj.last_modified = std::chrono::system_clock::from_time_t(created.get<time_t>());
                } else if (created.is_string()) {
                    obj.last_modified = providers::parse_timestamp(created.get<std::string>());
                }
            }
            obj.url = img.value("url", "");
            auto hash = img.value("hash", "");
            if (!hash.empty()) {
                obj.content_hash = hash;
                obj.attributes["hash"] = hash;
            }
            page.objects.push_back(std::move(obj));
        }

        int current = body.value("CurrentPage", page_no);
        int total = body.value("TotalPages", 0);
        bool more = total > 0 ? current < total : data.size() >= SMMS_PAGE_SIZE;
        if (more) page.next_cursor = std::to_string(current + 1);
        page.success = true;
        return page;
    }

    FetchResult fetch(const RemoteObject& object, Deadline deadline) override {
        FetchResult result;
        if (object.url.empty()) {
            result.error = {ErrorKind::NotFound, "No download URL for " + object.key, {}};
            return result;
        }
        auto request = net::HttpRequest::get(object.url);
        providers::apply_deadline(request, deadline);
        auto response = http_->execute(request);
        if (auto err = net::classify_response(response)) {
            result.error = err;
            return result;
        }
        result.data = std::move(response.body);
        result.success = true;
        return result;
    }

    PushResult push(const std::filesystem::path& local_path,
                    const std::string& dest_key, Deadline deadline) override {
        PushResult result;
        auto data = providers::read_local_file(local_path);
        if (!data) {
            result.error = providers::local_read_error(local_path);
            return result;
        }

        auto size = data->size();
        net::MultipartForm form;
        form.add_field("format", "json");
        form.add_file("smfile", providers::key_basename(dest_key), *data, image_content_type(dest_key));
        auto request = net::HttpRequest::post(api_base_ + "/upload", std::string{});
        form.apply(request);
        authorized(request);
        providers::apply_deadline(request, deadline);

        auto response = http_->execute(request);
        nlohmann::json body;
        auto err = parse_reply(response, body);
        if (err && body.is_object() && body.value("code", "") == "image_repeated" &&
            body.contains("images") && body["images"].is_string()) {
            // Already hosted; sm.ms reports the existing URL instead of data
            result.url = body["images"].get<std::string>();
            result.object.key = dest_key;
            result.object.size = size;
            result.object.url = result.url;
            result.success = true;
            return result;
        }
        if (err) {
            result.error = err;
            return result;
        }

        const auto& d = body["data"];
        result.object.key = d.value("path", dest_key);
        if (!result.object.key.empty() && result.object.key.front() == '/') result.object.key.erase(0, 1);
        result.object.size = size;
        result.object.last_modified = std::chrono::system_clock::now();
        result.url = d.value("url", "");
        result.object.url = result.url;
        auto hash = d.value("hash", "");
        if (!hash.empty()) result.object.attributes["hash"] = hash;
        result.success = true;
        return result;
    }

    /// `key` is either the image hash or a listed key, which is resolved
    /// to its hash through the upload history.
    DeleteResult remove(const std::string& key) override {
        DeleteResult result;
        std::string hash = key;
        if (key.find('/') != std::string::npos || key.find('.') != std::string::npos) {
            auto found = find_hash(key, result.error);
            if (!found) return result;
            hash = *found;
        }

        auto request = authorized(net::HttpRequest::get(
            api_base_ + "/delete/" + net::url_encode(hash) + "?format=json"));
        auto response = http_->execute(request);
        nlohmann::json body;
        if (auto err = parse_reply(response, body)) {
            result.error = err;
            return result;
        }
        result.success = true;
        return result;
    }

    ProviderInfo describe(bool probe) override {
        ProviderInfo info;
        info.name = name_;
        info.kind = ProviderKind::SMMS;
        info.enabled = true;
        info.capabilities = capabilities();
        if (!probe) return info;

        auto request = authorized(net::HttpRequest::post(api_base_ + "/profile", std::string{}));
        auto response = http_->execute(request);
        nlohmann::json body;
        if (auto err = parse_reply(response, body)) {
            info.detail = err.message;
            return info;
        }
        info.reachable = true;
        if (body.contains("data") && body["data"].is_object()) {
            const auto& d = body["data"];
            if (d.contains("disk_usage_raw") && d["disk_usage_raw"].is_object() &&
                d["disk_usage_raw"].contains("upload_count") &&
                d["disk_usage_raw"]["upload_count"].is_number()) {
                info.image_count = d["disk_usage_raw"]["upload_count"].get<uint64_t>();
            }
        }
        return info;
    }

private:
    std::optional<std::string> find_hash(const std::string& key, TransferError& err) {
        Cursor cursor;
        while (true) {
            auto page = list("", cursor);
            if (!page.success) {
                err = page.error;
                return std::nullopt;
            }
            for (const auto& obj : page.objects) {
                auto it = obj.attributes.find("hash");
                if (obj.key == key && it != obj.attributes.end()) return it->second;
            }
            if (!page.next_cursor) break;
            cursor = *page.next_cursor;
        }
        err = {ErrorKind::NotFound, "No uploaded image with key " + key, {}};
        return std::nullopt;
    }

    net::HttpRequest& authorized(net::HttpRequest& request) const {
        request.headers.set("Authorization", token_.str());
        return request;
    }
    net::HttpRequest authorized(net::HttpRequest&& request) const {
        request.headers.set("Authorization", token_.str());
        return std::move(request);
    }

    // sm.ms answers 200 with {"success": false, "code": ...} for most
    // failures, so the JSON envelope is classified as well as the status.
    static TransferError parse_reply(const net::HttpResponse& response, nlohmann::json& body) {
        if (auto err = net::classify_response(response)) return err;
        body = nlohmann::json::parse(response.body_string(), nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            return providers::bad_reply("sm.ms returned non-JSON body");
        }
        if (body.value("success", false)) return {};

        std::string code = body.value("code", "");
        std::string message = body.value("message", code);
        if (code == "unauthorized" || code == "invalid_token") {
            return {ErrorKind::AuthFailed, message, {}};
        }
        if (code == "flood") {
            return {ErrorKind::RateLimited, message, {}};
        }
        if (code == "image_not_found" || code == "delete_failed") {
            return {ErrorKind::NotFound, message, {}};
        }
        return {ErrorKind::Rejected, message.empty() ? "sm.ms request failed" : message, {}};
    }

    std::string name_;
    std::string api_base_;
    SecureString token_;
    std::shared_ptr<net::HttpClient> http_;
};

}  // namespace

std::string ProviderFactory::validate_smms(const Params& params) {
    return providers::require_params(params, "smms", {"api_token"});
}

std::unique_ptr<Provider> ProviderFactory::create_smms(const std::string& name,
                                                       const Params& params,
                                                       std::shared_ptr<net::HttpClient> http) {
    return std::make_unique<SmmsProvider>(name, param_or(params, "api_base", SMMS_API_BASE),
                                          SecureString(param_or(params, "api_token")),
                                          std::move(http));
}

}  // namespace hib
