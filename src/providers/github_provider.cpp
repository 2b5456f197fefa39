#include "hib/provider.hpp"
#include "hib/net/http.hpp"
#include "hib/secure_string.hpp"
#include "providers/common.hpp"

#include <nlohmann/json.hpp>

namespace hib {

using providers::param_or;

namespace {

constexpr const char* GITHUB_API_BASE = "https://api.github.com";

/// A repository used as an image store. Keys are repository paths. The
/// recursive tree listing arrives in one response, so List yields a single
/// page.
class GitHubProvider : public Provider {
public:
    struct Config {
        std::string api_base = GITHUB_API_BASE;
        std::string owner;
        std::string repo;
        std::string branch = "main";
        std::string path;  // directory prefix inside the repository
        SecureString token;
    };

    GitHubProvider(const std::string& name, Config config, std::shared_ptr<net::HttpClient> http)
        : name_(name), config_(std::move(config)), http_(std::move(http)) {
        if (!config_.path.empty() && config_.path.back() != '/') config_.path += '/';
        while (!config_.path.empty() && config_.path.front() == '/') config_.path.erase(0, 1);
    }

    const std::string& name() const override { return name_; }
    ProviderKind kind() const override { return ProviderKind::GitHub; }
    CapabilitySet capabilities() const override {
        return find_registration(ProviderKind::GitHub)->capabilities;
    }

    ListPage list(const std::string& prefix, const Cursor&) override {
        ListPage page;
        auto request = api_request(net::HttpMethod::GET,
            repo_url() + "/git/trees/" + net::url_encode(config_.branch) + "?recursive=1");
        auto response = http_->execute(request);
        if (auto err = classify(response)) {
            page.error = err;
            return page;
        }

        auto body = nlohmann::json::parse(response.body_string(), nullptr, false);
        if (body.is_discarded() || !body.contains("tree") || !body["tree"].is_array()) {
            page.error = providers::bad_reply("git tree without entries");
            return page;
        }

        std::string full_prefix = config_.path + prefix;
        for (const auto& entry : body["tree"]) {
            if (entry.value("type", "") != "blob") continue;
            RemoteObject obj;
            obj.key = entry.value("path", "");
            if (!is_image_key(obj.key)) continue;
            if (!full_prefix.empty() && obj.key.compare(0, full_prefix.size(), full_prefix) != 0) continue;

            if (entry.contains("size") && entry["size"].is_number()) obj.size = entry["size"].get<uint64_t>();
            auto sha = entry.value("sha", "");
            if (!sha.empty()) {
                obj.content_hash = sha;
                obj.attributes["sha"] = sha;
            }
            obj.url = "https://raw.githubusercontent.com/" + config_.owner + "/" + config_.repo + "/" +
                      config_.branch + "/" + net::url_encode_path(obj.key);
            page.objects.push_back(std::move(obj));
        }
        page.success = true;
        return page;
    }

    FetchResult fetch(const RemoteObject& object, Deadline deadline) override {
        FetchResult result;
        auto request = api_request(net::HttpMethod::GET, contents_url(object.key) +
                                   "?ref=" + net::url_encode(config_.branch));
        request.headers.set("Accept", "application/vnd.github.raw");
        providers::apply_deadline(request, deadline);
        auto response = http_->execute(request);
        if (auto err = classify(response)) {
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

        std::string key = config_.path + dest_key;
        TransferError lookup_err;
        auto existing_sha = current_sha(key, lookup_err);
        if (lookup_err) {
            result.error = lookup_err;
            return result;
        }

        nlohmann::json payload;
        payload["message"] = "Upload " + key;
        payload["content"] = net::base64_encode(*data);
        payload["branch"] = config_.branch;
        if (existing_sha) payload["sha"] = *existing_sha;

        auto request = api_request(net::HttpMethod::PUT, contents_url(key));
        auto json = payload.dump();
        request.body.assign(json.begin(), json.end());
        request.headers.set_content_type("application/json");
        providers::apply_deadline(request, deadline);

        auto response = http_->execute(request);
        if (auto err = classify(response)) {
            result.error = err;
            return result;
        }

        auto body = nlohmann::json::parse(response.body_string(), nullptr, false);
        result.object.key = key;
        result.object.size = data->size();
        result.object.last_modified = std::chrono::system_clock::now();
        if (!body.is_discarded() && body.contains("content") && body["content"].is_object()) {
            const auto& content = body["content"];
            auto sha = content.value("sha", "");
            if (!sha.empty()) {
                result.object.content_hash = sha;
                result.object.attributes["sha"] = sha;
            }
            result.url = content.value("download_url", "");
        }
        result.object.url = result.url;
        result.success = true;
        return result;
    }

    DeleteResult remove(const std::string& key) override {
        DeleteResult result;
        TransferError lookup_err;
        auto sha = current_sha(key, lookup_err);
        if (lookup_err) {
            result.error = lookup_err;
            return result;
        }
        if (!sha) {
            result.error = {ErrorKind::NotFound, "No such path: " + key, {}};
            return result;
        }

        nlohmann::json payload;
        payload["message"] = "Delete " + key;
        payload["sha"] = *sha;
        payload["branch"] = config_.branch;

        auto request = api_request(net::HttpMethod::DELETE, contents_url(key));
        auto json = payload.dump();
        request.body.assign(json.begin(), json.end());
        request.headers.set_content_type("application/json");

        auto response = http_->execute(request);
        if (auto err = classify(response)) {
            result.error = err;
            return result;
        }
        result.success = true;
        return result;
    }

    ProviderInfo describe(bool probe) override {
        ProviderInfo info;
        info.name = name_;
        info.kind = ProviderKind::GitHub;
        info.enabled = true;
        info.capabilities = capabilities();
        if (!probe) return info;

        auto response = http_->execute(api_request(net::HttpMethod::GET, repo_url()));
        if (auto err = classify(response)) {
            info.detail = err.message;
            return info;
        }
        info.reachable = true;
        return info;
    }

private:
    std::string repo_url() const {
        return config_.api_base + "/repos/" + net::url_encode(config_.owner) + "/" +
               net::url_encode(config_.repo);
    }

    std::string contents_url(const std::string& key) const {
        return repo_url() + "/contents/" + net::url_encode_path(key);
    }

    net::HttpRequest api_request(net::HttpMethod method, const std::string& url) const {
        net::HttpRequest request;
        request.method = method;
        request.url = url;
        request.headers.set("Authorization", "token " + config_.token.str());
        request.headers.set("Accept", "application/vnd.github.v3+json");
        return request;
    }

    // Blob sha of `key` on the branch, nullopt when the path does not exist.
    std::optional<std::string> current_sha(const std::string& key, TransferError& err) const {
        auto response = http_->execute(api_request(net::HttpMethod::GET,
            contents_url(key) + "?ref=" + net::url_encode(config_.branch)));
        auto classified = classify(response);
        if (classified.kind == ErrorKind::NotFound) return std::nullopt;
        if (classified) {
            err = classified;
            return std::nullopt;
        }
        auto body = nlohmann::json::parse(response.body_string(), nullptr, false);
        if (body.is_discarded() || !body.is_object() || !body.contains("sha") || !body["sha"].is_string()) {
            err = providers::bad_reply("contents entry without sha");
            return std::nullopt;
        }
        return body["sha"].get<std::string>();
    }

    // GitHub reports an exhausted rate limit as 403 with a zero remaining
    // count; that is a rate limit, not an auth failure.
    static TransferError classify(const net::HttpResponse& response) {
        auto err = net::classify_response(response);
        if (err.kind == ErrorKind::AuthFailed && response.status_code == 403 &&
            response.headers.get("x-ratelimit-remaining").value_or("") == "0") {
            err.kind = ErrorKind::RateLimited;
            auto reset = response.headers.get("x-ratelimit-reset");
            if (reset) {
                try {
                    auto wait = std::stoll(*reset) - now_epoch();
                    if (wait > 0) err.retry_after = std::chrono::seconds(wait);
                } catch (const std::exception&) {
                    // no usable hint; scheduler backoff applies
                }
            }
        }
        return err;
    }

    std::string name_;
    Config config_;
    std::shared_ptr<net::HttpClient> http_;
};

}  // namespace

std::string ProviderFactory::validate_github(const Params& params) {
    return providers::require_params(params, "github", {"token", "owner", "repo"});
}

std::unique_ptr<Provider> ProviderFactory::create_github(const std::string& name,
                                                         const Params& params,
                                                         std::shared_ptr<net::HttpClient> http) {
    GitHubProvider::Config config;
    config.api_base = param_or(params, "api_base", GITHUB_API_BASE);
    config.owner = param_or(params, "owner");
    config.repo = param_or(params, "repo");
    config.branch = param_or(params, "branch", "main");
    config.path = param_or(params, "path");
    config.token = SecureString(param_or(params, "token"));
    return std::make_unique<GitHubProvider>(name, std::move(config), std::move(http));
}

}  // namespace hib
