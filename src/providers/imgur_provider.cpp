#include "hib/provider.hpp"
#include "hib/net/http.hpp"
#include "hib/secure_string.hpp"
#include "providers/common.hpp"

#include <nlohmann/json.hpp>

namespace hib {

using providers::param_or;

namespace {

constexpr const char* IMGUR_API_BASE = "https://api.imgur.com/3";

/// Imgur v3. Keys are "<id><ext>"; the account listing pages are 0-based
/// and hold up to 50 images each.
class ImgurProvider : public Provider {
public:
    ImgurProvider(const std::string& name, const std::string& api_base,
                  SecureString client_id, SecureString access_token,
                  std::shared_ptr<net::HttpClient> http)
        : name_(name)
        , api_base_(api_base)
        , client_id_(std::move(client_id))
        , access_token_(std::move(access_token))
        , http_(std::move(http)) {}

    const std::string& name() const override { return name_; }
    ProviderKind kind() const override { return ProviderKind::Imgur; }
    CapabilitySet capabilities() const override {
        return find_registration(ProviderKind::Imgur)->capabilities;
    }

    ListPage list(const std::string& prefix, const Cursor& cursor) override {
        ListPage page;
        if (access_token_.empty()) {
            page.error = missing_token("list");
            return page;
        }
        int page_no = 0;
        if (!cursor.empty()) {
            try {
                page_no = std::stoi(cursor);
            } catch (const std::exception&) {
                page.error = {ErrorKind::Rejected, "Invalid cursor: " + cursor, {}};
                return page;
            }
        }

        auto request = net::HttpRequest::get(api_base_ + "/account/me/images/" + std::to_string(page_no));
        authorize(request);
        auto response = http_->execute(request);
        nlohmann::json body;
        if (auto err = parse_reply(response, body)) {
            page.error = err;
            return page;
        }
        if (!body.contains("data") || !body["data"].is_array()) {
            page.error = providers::bad_reply("imgur listing without data array");
            return page;
        }

        const auto& data = body["data"];
        for (const auto& img : data) {
            auto obj = to_remote_object(img);
            if (!is_image_key(obj.key)) continue;
            if (!prefix.empty() && obj.key.compare(0, prefix.size(), prefix) != 0) continue;
            page.objects.push_back(std::move(obj));
        }
        if (!data.empty()) page.next_cursor = std::to_string(page_no + 1);
        page.success = true;
        return page;
    }

    FetchResult fetch(const RemoteObject& object, Deadline deadline) override {
        FetchResult result;
        std::string url = object.url;
        if (url.empty()) url = "https://i.imgur.com/" + object.key;
        auto request = net::HttpRequest::get(url);
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
        form.add_field("type", "file");
        form.add_field("name", providers::key_basename(dest_key));
        form.add_field("title", dest_key);
        form.add_file("image", providers::key_basename(dest_key), *data, image_content_type(dest_key));
        auto request = net::HttpRequest::post(api_base_ + "/image", std::string{});
        form.apply(request);
        authorize(request);
        providers::apply_deadline(request, deadline);

        auto response = http_->execute(request);
        nlohmann::json body;
        if (auto err = parse_reply(response, body)) {
            result.error = err;
            return result;
        }
        if (!body.contains("data") || !body["data"].is_object()) {
            result.error = providers::bad_reply("imgur upload without data");
            return result;
        }

        result.object = to_remote_object(body["data"]);
        result.object.size = size;
        result.object.last_modified = std::chrono::system_clock::now();
        result.url = result.object.url;
        result.success = true;
        return result;
    }

    /// Accepts "<id><ext>", a bare id, or an anonymous upload's deletehash.
    DeleteResult remove(const std::string& key) override {
        DeleteResult result;
        std::string id = key;
        auto dot = id.rfind('.');
        if (dot != std::string::npos) id.erase(dot);

        auto request = net::HttpRequest::del(api_base_ + "/image/" + net::url_encode(id));
        authorize(request);
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
        info.kind = ProviderKind::Imgur;
        info.enabled = true;
        info.capabilities = capabilities();
        if (!probe) return info;

        // The image count needs a user token; client-only configs probe credits
        std::string url = access_token_.empty() ? api_base_ + "/credits"
                                                : api_base_ + "/account/me/images/count";
        auto request = net::HttpRequest::get(url);
        authorize(request);
        auto response = http_->execute(request);
        nlohmann::json body;
        if (auto err = parse_reply(response, body)) {
            info.detail = err.message;
            return info;
        }
        info.reachable = true;
        if (!access_token_.empty() && body.contains("data") && body["data"].is_number()) {
            info.image_count = body["data"].get<uint64_t>();
        }
        return info;
    }

private:
    RemoteObject to_remote_object(const nlohmann::json& img) const {
        RemoteObject obj;
        std::string id = img.value("id", "");
        obj.url = img.value("link", "");
        std::string ext;
        auto dot = obj.url.rfind('.');
        auto slash = obj.url.rfind('/');
        if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
            ext = obj.url.substr(dot);
        }
        obj.key = id + ext;
        if (img.contains("size") && img["size"].is_number()) obj.size = img["size"].get<uint64_t>();
        if (img.contains("datetime") && img["datetime"].is_number()) {
            obj.last_modified = std::chrono::system_clock::from_time_t(img["datetime"].get<time_t>());
        }
        obj.attributes["id"] = id;
        auto deletehash = img.value("deletehash", "");
        if (!deletehash.empty()) obj.attributes["deletehash"] = deletehash;
        return obj;
    }

    void authorize(net::HttpRequest& request) const {
        if (!access_token_.empty()) {
            request.headers.set_bearer_token(access_token_.str());
        } else {
            request.headers.set("Authorization", "Client-ID " + client_id_.str());
        }
    }

    TransferError missing_token(const char* op) const {
        return {ErrorKind::AuthFailed, name_ + ": " + op + " requires 'access_token'", {}};
    }

    // Imgur wraps every reply as {"data": ..., "success": bool, "status": int}
    static TransferError parse_reply(const net::HttpResponse& response, nlohmann::json& body) {
        auto err = net::classify_response(response);
        body = nlohmann::json::parse(response.body_string(), nullptr, false);
        if (err) {
            if (body.is_object() && body.contains("data") && body["data"].is_object() &&
                body["data"].contains("error") && body["data"]["error"].is_string()) {
                err.message += ": " + body["data"]["error"].get<std::string>();
            }
            return err;
        }
        if (body.is_discarded() || !body.is_object()) {
            return providers::bad_reply("imgur returned non-JSON body");
        }
        if (!body.value("success", true)) {
            return {ErrorKind::Rejected, "imgur request failed", {}};
        }
        return {};
    }

    std::string name_;
    std::string api_base_;
    SecureString client_id_;
    SecureString access_token_;
    std::shared_ptr<net::HttpClient> http_;
};

}  // namespace

std::string ProviderFactory::validate_imgur(const Params& params) {
    return providers::require_params(params, "imgur", {"client_id"});
}

std::unique_ptr<Provider> ProviderFactory::create_imgur(const std::string& name,
                                                        const Params& params,
                                                        std::shared_ptr<net::HttpClient> http) {
    return std::make_unique<ImgurProvider>(name, param_or(params, "api_base", IMGUR_API_BASE),
                                           SecureString(param_or(params, "client_id")),
                                           SecureString(param_or(params, "access_token")),
                                           std::move(http));
}

}  // namespace hib
