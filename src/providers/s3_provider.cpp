#include "hib/provider.hpp"
#include "hib/constants.hpp"
#include "hib/net/http.hpp"
#include "hib/secure_string.hpp"
#include "providers/common.hpp"

#include <string>
#include <utility>
#include <vector>

namespace hib {

using providers::param_or;

namespace {

// ListObjectsV2 replies are flat enough that tag scanning is all that is
// needed; no attributes, namespaces or CDATA are expected.
namespace xml {

// Bodies of every <tag>...</tag>, in document order.
std::vector<std::string> find_elements(const std::string& doc, const std::string& tag) {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    std::vector<std::string> out;
    for (size_t at = doc.find(open); at != std::string::npos; at = doc.find(open, at)) {
        size_t body = at + open.size();
        size_t stop = doc.find(close, body);
        if (stop == std::string::npos) break;
        out.push_back(doc.substr(body, stop - body));
        at = stop + close.size();
    }
    return out;
}

// Body of the first <tag>, or "" when absent.
std::string get_element(const std::string& doc, const std::string& tag) {
    auto found = find_elements(doc, tag);
    return found.empty() ? std::string() : found.front();
}

std::string decode_entities(const std::string& text) {
    static const std::pair<const char*, char> ENTITIES[] = {
        {"&lt;", '<'}, {"&gt;", '>'}, {"&amp;", '&'}, {"&quot;", '"'}, {"&apos;", '\''},
    };
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        bool replaced = false;
        if (text[i] == '&') {
            for (const auto& [name, ch] : ENTITIES) {
                size_t len = std::char_traits<char>::length(name);
                if (text.compare(i, len, name) == 0) {
                    out += ch;
                    i += len;
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) out += text[i++];
    }
    return out;
}

}  // namespace xml

// Alibaba OSS and Tencent COS through their S3-compatible APIs.
class S3CompatibleProvider : public Provider {
public:
    struct Config {
        ProviderKind kind = ProviderKind::OSS;
        std::string bucket;
        std::string region;
        std::string endpoint;  // scheme + host, bucket already in the host
        std::string prefix;    // key prefix applied to listings and pushes
        SecureString access_key;
        SecureString secret_key;
    };

    S3CompatibleProvider(const std::string& name, Config config,
                         std::shared_ptr<net::HttpClient> http)
        : name_(name)
        , config_(std::move(config))
        , signer_(config_.access_key.str(), config_.secret_key.str(), signing_region(config_), "s3")
        , http_(std::move(http)) {}

    const std::string& name() const override { return name_; }
    ProviderKind kind() const override { return config_.kind; }
    CapabilitySet capabilities() const override {
        return find_registration(config_.kind)->capabilities;
    }

    ListPage list(const std::string& prefix, const Cursor& cursor) override {
        ListPage page;
        auto response = list_request(config_.prefix + prefix, cursor, constants::DEFAULT_LIST_PAGE_SIZE);
        if (auto err = net::classify_response(response)) {
            page.error = err;
            return page;
        }

        std::string xml_str = response.body_string();
        if (xml_str.find("ListBucketResult") == std::string::npos) {
            page.error = providers::bad_reply("missing ListBucketResult");
            return page;
        }

        for (const auto& content : xml::find_elements(xml_str, "Contents")) {
            RemoteObject obj;
            obj.key = xml::decode_entities(xml::get_element(content, "Key"));
            if (!is_image_key(obj.key)) continue;

            std::string size_text = xml::get_element(content, "Size");
            if (!size_text.empty()) {
                try {
                    obj.size = std::stoull(size_text);
                } catch (const std::exception&) {
                    page.error = providers::bad_reply("Size '" + size_text + "'");
                    return page;
                }
            }
            obj.last_modified = providers::parse_timestamp(xml::get_element(content, "LastModified"));

            auto etag = xml::decode_entities(xml::get_element(content, "ETag"));
            if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
                etag = etag.substr(1, etag.size() - 2);
            }
            if (!etag.empty()) obj.content_hash = etag;
            obj.url = build_url(obj.key);
            page.objects.push_back(std::move(obj));
        }

        if (xml::get_element(xml_str, "IsTruncated") == "true") {
            auto token = xml::decode_entities(xml::get_element(xml_str, "NextContinuationToken"));
            if (token.empty()) {
                page.error = providers::bad_reply("truncated listing without continuation token");
                page.objects.clear();
                return page;
            }
            page.next_cursor = token;
        }
        page.success = true;
        return page;
    }

    FetchResult fetch(const RemoteObject& object, Deadline deadline) override {
        FetchResult result;
        auto request = net::HttpRequest::get(build_url(object.key));
        providers::apply_deadline(request, deadline);

        auto response = send(request);
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

        std::string key = config_.prefix + dest_key;
        auto size = data->size();
        auto request = net::HttpRequest::put(build_url(key), std::move(*data));
        request.headers.set_content_type(image_content_type(key));
        providers::apply_deadline(request, deadline);

        auto response = send(request);
        if (auto err = net::classify_response(response)) {
            result.error = err;
            return result;
        }

        result.object.key = key;
        result.object.size = size;
        result.object.last_modified = std::chrono::system_clock::now();
        auto etag = response.headers.get("ETag").value_or("");
        if (etag.size() >= 2 && etag.front() == '"') etag = etag.substr(1, etag.size() - 2);
        if (!etag.empty()) result.object.content_hash = etag;
        result.url = build_url(key);
        result.object.url = result.url;
        result.success = true;
        return result;
    }

    DeleteResult remove(const std::string& key) override {
        DeleteResult result;
        auto request = net::HttpRequest::del(build_url(key));
        auto response = send(request);
        if (auto err = net::classify_response(response)) {
            result.error = err;
            return result;
        }
        result.success = true;
        return result;
    }

    ProviderInfo describe(bool probe) override {
        ProviderInfo info;
        info.name = name_;
        info.kind = config_.kind;
        info.enabled = true;
        info.capabilities = capabilities();
        if (!probe) return info;

        auto response = list_request(config_.prefix, {}, 1);
        auto err = net::classify_response(response);
        info.reachable = !err;
        if (err) info.detail = err.message;
        return info;
    }

private:
    static std::string signing_region(const Config& config) {
        // OSS signs with the "oss-<region>" form of the region id
        if (config.kind == ProviderKind::OSS && config.region.compare(0, 4, "oss-") != 0) {
            return "oss-" + config.region;
        }
        return config.region;
    }

    net::HttpResponse list_request(const std::string& prefix, const Cursor& cursor,
                                   size_t max_keys) const {
        std::string url = config_.endpoint + "/?list-type=2&max-keys=" + std::to_string(max_keys);
        if (!prefix.empty()) url += "&prefix=" + net::url_encode(prefix);
        if (!cursor.empty()) url += "&continuation-token=" + net::url_encode(cursor);

        auto request = net::HttpRequest::get(url);
        return send(request);
    }

    net::HttpResponse send(net::HttpRequest& request) const {
        if (!signer_.sign(request)) {
            net::HttpResponse response;
            response.error = "cannot sign request for " + request.url;
            return response;
        }
        return http_->execute(request);
    }

    std::string build_url(const std::string& key) const {
        return config_.endpoint + "/" + net::url_encode_path(key);
    }

    std::string name_;
    Config config_;
    net::AwsSigV4Signer signer_;
    std::shared_ptr<net::HttpClient> http_;
};

std::string normalize_endpoint(std::string endpoint, const std::string& bucket) {
    if (endpoint.compare(0, 8, "https://") != 0 && endpoint.compare(0, 7, "http://") != 0) {
        endpoint = "https://" + endpoint;
    }
    while (!endpoint.empty() && endpoint.back() == '/') endpoint.pop_back();
    // Virtual-hosted style: prepend the bucket unless already present
    auto scheme_end = endpoint.find("://") + 3;
    if (endpoint.compare(scheme_end, bucket.size() + 1, bucket + ".") != 0) {
        endpoint.insert(scheme_end, bucket + ".");
    }
    return endpoint;
}

}  // namespace

// --- OSS ---

std::string ProviderFactory::validate_oss(const Params& params) {
    auto err = providers::require_params(params, "oss", {"bucket", "access_key_id", "access_key_secret"});
    if (!err.empty()) return err;
    if (param_or(params, "endpoint").empty() && param_or(params, "region").empty())
        return "oss provider requires 'endpoint' or 'region'";
    return {};
}

std::unique_ptr<Provider> ProviderFactory::create_oss(const std::string& name,
                                                      const Params& params,
                                                      std::shared_ptr<net::HttpClient> http) {
    S3CompatibleProvider::Config config;
    config.kind = ProviderKind::OSS;
    config.bucket = param_or(params, "bucket");
    config.region = param_or(params, "region");
    auto endpoint = param_or(params, "endpoint");
    if (config.region.empty()) {
        // oss-cn-hangzhou.aliyuncs.com -> cn-hangzhou
        auto host = endpoint.substr(endpoint.find("://") == std::string::npos ? 0 : endpoint.find("://") + 3);
        auto pos = host.find("oss-");
        auto dot = host.find('.', pos);
        if (pos != std::string::npos && dot != std::string::npos) {
            config.region = host.substr(pos + 4, dot - pos - 4);
        }
    }
    if (endpoint.empty()) {
        endpoint = "oss-" + config.region + ".aliyuncs.com";
    }
    config.endpoint = normalize_endpoint(endpoint, config.bucket);
    config.prefix = param_or(params, "prefix");
    config.access_key = SecureString(param_or(params, "access_key_id"));
    config.secret_key = SecureString(param_or(params, "access_key_secret"));
    return std::make_unique<S3CompatibleProvider>(name, std::move(config), std::move(http));
}

// --- COS ---

std::string ProviderFactory::validate_cos(const Params& params) {
    return providers::require_params(params, "cos", {"bucket", "secret_id", "secret_key", "region"});
}

std::unique_ptr<Provider> ProviderFactory::create_cos(const std::string& name,
                                                      const Params& params,
                                                      std::shared_ptr<net::HttpClient> http) {
    S3CompatibleProvider::Config config;
    config.kind = ProviderKind::COS;
    config.bucket = param_or(params, "bucket");
    config.region = param_or(params, "region");
    config.endpoint = normalize_endpoint(
        param_or(params, "endpoint", "cos." + config.region + ".myqcloud.com"), config.bucket);
    config.prefix = param_or(params, "prefix");
    config.access_key = SecureString(param_or(params, "secret_id"));
    config.secret_key = SecureString(param_or(params, "secret_key"));
    return std::make_unique<S3CompatibleProvider>(name, std::move(config), std::move(http));
}

}  // namespace hib
